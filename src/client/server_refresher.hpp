#pragma once

#include "client/config_client.hpp"
#include "common/cancellation.hpp"
#include "match/collaborators.hpp"
#include "query/discovery_client.hpp"
#include "query/fan_out_scheduler.hpp"
#include "registry/activity_detector.hpp"
#include "registry/server_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace odal {

// Runs a full refresh on a worker thread: master list, bounded fan-out with
// progressive registry updates and activity detection, then a ping pass.
// A new request cancels and replaces the one in flight.
class ServerRefresher {
public:
    struct Options {
        std::vector<ServerAddress> masters;
        std::chrono::milliseconds masterTimeout{10000};
        std::chrono::milliseconds pingTimeout{5000};
        FanOutScheduler::Options fanOut;
        bool pingAfterQuery = true;
        bool autoRefresh = false;
        std::chrono::minutes autoRefreshInterval{5};
        VisibilityFilter visibility;
        NotificationSettings notifications;
    };

    static Options OptionsFromConfig(const ClientConfig &config);

    ServerRefresher(DiscoveryClient &client, ServerRegistry &registry, Options options);
    ~ServerRefresher();

    ServerRefresher(const ServerRefresher &) = delete;
    ServerRefresher &operator=(const ServerRefresher &) = delete;

    void setNotificationSink(NotificationSink *sink);

    void requestRefresh();
    void cancelRefresh();
    // Starts a refresh when the auto-refresh interval has elapsed.
    void update(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
    // True when the current refresh finished within the timeout.
    bool waitForRefresh(std::chrono::milliseconds timeout);

    bool isRefreshing() const;
    std::size_t getGeneration() const;
    ActivityReport getLastActivity() const;

private:
    void stopWorker();
    void workerProc(CancellationToken cancel);
    std::vector<ServerAddress> queryMasters(const CancellationToken &cancel, std::string &errorOut);
    void publishBatch(const std::vector<ServerInfo> &servers);
    void pingServers(const std::vector<ServerInfo> &servers, const CancellationToken &cancel);
    void finishRefresh();

    DiscoveryClient &client;
    ServerRegistry &registry;
    Options options;
    FanOutScheduler scheduler;

    mutable std::mutex activityMutex;
    ActivityDetector detector;
    ActivityReport lastActivity;
    NotificationSink *notificationSink = nullptr;

    mutable std::mutex stateMutex;
    std::condition_variable refreshDone;
    CancellationSource cancelSource;
    std::thread worker;
    std::atomic<bool> refreshing{false};
    std::atomic<std::size_t> generation{0};
    std::optional<std::chrono::steady_clock::time_point> nextAutoRefresh;
};

} // namespace odal
