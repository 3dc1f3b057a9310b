#include "client/server_refresher.hpp"

#include "registry/server_filters.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <future>
#include <unordered_set>

namespace odal {

namespace {
constexpr const char *kNoServersFromMaster = "No servers returned from master server";
constexpr const char *kNoValidServers = "No valid servers found. All servers timed out or returned invalid responses.";
} // namespace

ServerRefresher::Options ServerRefresher::OptionsFromConfig(const ClientConfig &config) {
    Options options;
    options.masters = config.masters;
    options.masterTimeout = std::chrono::milliseconds(config.masterTimeoutMs);
    options.pingTimeout = std::chrono::milliseconds(config.pingTimeoutMs);
    options.fanOut.concurrencyLimit = static_cast<std::size_t>(config.concurrency);
    options.fanOut.progressInterval = static_cast<std::size_t>(config.progressInterval);
    options.fanOut.queryTimeout = std::chrono::milliseconds(config.queryTimeoutMs);
    options.autoRefresh = config.autoRefresh;
    options.autoRefreshInterval = std::chrono::minutes(config.refreshIntervalMinutes);
    options.visibility = config.filters;
    options.notifications = config.notifications;
    return options;
}

ServerRefresher::ServerRefresher(DiscoveryClient &client, ServerRegistry &registry, Options options)
    : client(client), registry(registry), options(std::move(options)), scheduler(client, this->options.fanOut) {}

ServerRefresher::~ServerRefresher() {
    stopWorker();
}

void ServerRefresher::setNotificationSink(NotificationSink *sink) {
    std::lock_guard<std::mutex> lock(activityMutex);
    notificationSink = sink;
}

void ServerRefresher::stopWorker() {
    cancelSource.cancel();
    if (worker.joinable()) {
        worker.join();
    }
}

void ServerRefresher::requestRefresh() {
    stopWorker();

    {
        std::lock_guard<std::mutex> lock(stateMutex);
        cancelSource.reset();
        refreshing.store(true);
    }
    worker = std::thread(&ServerRefresher::workerProc, this, cancelSource.getToken());
}

void ServerRefresher::cancelRefresh() {
    stopWorker();
}

void ServerRefresher::update(std::chrono::steady_clock::time_point now) {
    if (!options.autoRefresh) {
        return;
    }
    if (!nextAutoRefresh) {
        nextAutoRefresh = now + options.autoRefreshInterval;
        return;
    }
    if (now < *nextAutoRefresh) {
        return;
    }
    nextAutoRefresh = now + options.autoRefreshInterval;
    if (isRefreshing()) {
        spdlog::debug("ServerRefresher: Skipping auto-refresh; refresh still running");
        return;
    }
    spdlog::debug("ServerRefresher: Auto-refresh");
    requestRefresh();
}

bool ServerRefresher::waitForRefresh(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stateMutex);
    return refreshDone.wait_for(lock, timeout, [&]() { return !refreshing.load(); });
}

bool ServerRefresher::isRefreshing() const {
    return refreshing.load();
}

std::size_t ServerRefresher::getGeneration() const {
    return generation.load();
}

ActivityReport ServerRefresher::getLastActivity() const {
    std::lock_guard<std::mutex> lock(activityMutex);
    return lastActivity;
}

void ServerRefresher::finishRefresh() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        refreshing.store(false);
    }
    refreshDone.notify_all();
}

std::vector<ServerAddress> ServerRefresher::queryMasters(const CancellationToken &cancel, std::string &errorOut) {
    std::vector<ServerAddress> addresses;
    std::unordered_set<std::string> seen;
    bool anyMasterAnswered = false;

    for (const auto &master : options.masters) {
        if (cancel.isCancellationRequested()) {
            break;
        }
        try {
            auto listed = client.queryMasterServer(master, options.masterTimeout, cancel).get();
            anyMasterAnswered = true;
            for (auto &address : listed) {
                if (seen.insert(address.key()).second) {
                    addresses.push_back(std::move(address));
                }
            }
        } catch (const QueryError &e) {
            if (e.kind() != QueryErrorKind::Cancelled) {
                errorOut = e.what();
            }
        }
    }

    if (anyMasterAnswered && addresses.empty()) {
        errorOut = kNoServersFromMaster;
    } else if (!anyMasterAnswered && errorOut.empty()) {
        errorOut = options.masters.empty() ? "No master server configured" : "Failed to query master server";
    }
    return addresses;
}

void ServerRefresher::publishBatch(const std::vector<ServerInfo> &servers) {
    {
        std::lock_guard<std::mutex> lock(activityMutex);
        const auto visible = ApplyVisibilityFilter(servers, options.visibility);
        lastActivity = detector.detect(visible);
        for (const auto &message : lastActivity.messages) {
            spdlog::info("ServerRefresher: {}", message);
        }

        const auto &settings = options.notifications;
        if (notificationSink && settings.enabled && settings.serverActivity) {
            if (auto notification = BuildActivityNotification(lastActivity)) {
                notificationSink->notify(notification->title, notification->body,
                                         notification->flash && settings.flash);
            }
        }
    }

    registry.setServers(servers);
}

void ServerRefresher::pingServers(const std::vector<ServerInfo> &servers, const CancellationToken &cancel) {
    const std::size_t window = std::max<std::size_t>(1, options.fanOut.concurrencyLimit);

    for (std::size_t start = 0; start < servers.size() && !cancel.isCancellationRequested(); start += window) {
        const std::size_t end = std::min(servers.size(), start + window);
        std::vector<std::future<int>> pings;
        pings.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) {
            pings.push_back(client.pingGameServer(servers[i].address, options.pingTimeout, cancel));
        }

        for (std::size_t i = start; i < end; ++i) {
            try {
                const int pingMs = pings[i - start].get();
                registry.updateServerPing(servers[i].address, pingMs);
            } catch (const QueryError &e) {
                spdlog::debug("ServerRefresher: Ping failed: {}", e.what());
            }
        }
    }
}

void ServerRefresher::workerProc(CancellationToken cancel) {
    registry.clearError();
    registry.setLoading(true);

    std::string error;
    auto addresses = queryMasters(cancel, error);
    if (cancel.isCancellationRequested()) {
        registry.setLoading(false);
        finishRefresh();
        return;
    }
    if (addresses.empty()) {
        spdlog::warn("ServerRefresher: {}", error);
        registry.setError(error);
        finishRefresh();
        return;
    }

    spdlog::info("ServerRefresher: Querying {} server(s)", addresses.size());
    auto pending = scheduler.queryAll(std::move(addresses),
        [this](const std::vector<ServerInfo> &servers, FanOutScheduler::BatchPhase) {
            if (!servers.empty()) {
                publishBatch(servers);
            }
        },
        cancel);

    const auto results = pending.get();
    if (cancel.isCancellationRequested()) {
        spdlog::debug("ServerRefresher: Refresh cancelled");
        registry.setLoading(false);
        finishRefresh();
        return;
    }

    std::vector<ServerInfo> responded;
    for (const auto &slot : results) {
        if (slot) {
            responded.push_back(*slot);
        }
    }

    if (responded.empty()) {
        spdlog::warn("ServerRefresher: {}", kNoValidServers);
        registry.setError(kNoValidServers);
        finishRefresh();
        return;
    }

    spdlog::info("ServerRefresher: {} of {} server(s) responded", responded.size(), results.size());
    generation++;

    if (options.pingAfterQuery) {
        pingServers(responded, cancel);
    }
    finishRefresh();
}

} // namespace odal
