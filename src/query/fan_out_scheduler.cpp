#include "query/fan_out_scheduler.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <memory>
#include <mutex>

namespace odal {

namespace {
class Batch : public std::enable_shared_from_this<Batch> {
public:
    Batch(GameServerQuerier &querier,
          FanOutScheduler::Options options,
          std::vector<ServerAddress> addresses,
          FanOutScheduler::BatchCallback onBatch,
          CancellationToken cancel)
        : querier(querier),
          options(options),
          addresses(std::move(addresses)),
          onBatch(std::move(onBatch)),
          cancel(std::move(cancel)) {
        results.resize(this->addresses.size());
    }

    std::future<FanOutScheduler::Results> getFuture() {
        return promise.get_future();
    }

    void pump();

private:
    void dispatch(std::size_t index);
    void settle(std::size_t index, GameServerOutcome outcome);
    void finishIfDone();
    std::vector<ServerInfo> respondedLocked() const;
    void deliver(std::unique_lock<std::mutex> &stateLock,
                 std::vector<ServerInfo> servers,
                 FanOutScheduler::BatchPhase phase);

    GameServerQuerier &querier;
    FanOutScheduler::Options options;
    std::vector<ServerAddress> addresses;
    FanOutScheduler::BatchCallback onBatch;
    CancellationToken cancel;

    std::mutex mutex;
    std::mutex callbackMutex;
    FanOutScheduler::Results results;
    std::size_t nextIndex = 0;
    std::size_t inFlight = 0;
    std::size_t completed = 0;
    bool pumping = false;
    bool pumpRequested = false;
    bool finished = false;
    std::promise<FanOutScheduler::Results> promise;
};

void Batch::pump() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (pumping) {
            pumpRequested = true;
            return;
        }
        pumping = true;
    }

    while (true) {
        std::optional<std::size_t> next;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!cancel.isCancellationRequested() && nextIndex < addresses.size() && inFlight < options.concurrencyLimit) {
                next = nextIndex++;
                ++inFlight;
            } else if (pumpRequested) {
                pumpRequested = false;
                continue;
            } else {
                pumping = false;
                break;
            }
        }
        dispatch(*next);
    }

    finishIfDone();
}

void Batch::dispatch(std::size_t index) {
    auto self = shared_from_this();
    querier.queryGameServerAsync(addresses[index], options.singleQueries, options.queryTimeout, cancel,
        [self, index](GameServerOutcome outcome) {
            self->settle(index, std::move(outcome));
        });
}

std::vector<ServerInfo> Batch::respondedLocked() const {
    std::vector<ServerInfo> servers;
    for (const auto &slot : results) {
        if (slot) {
            servers.push_back(*slot);
        }
    }
    return servers;
}

void Batch::deliver(std::unique_lock<std::mutex> &stateLock,
                    std::vector<ServerInfo> servers,
                    FanOutScheduler::BatchPhase phase) {
    std::lock_guard<std::mutex> callbackLock(callbackMutex);
    stateLock.unlock();
    onBatch(servers, phase);
}

void Batch::settle(std::size_t index, GameServerOutcome outcome) {
    {
        std::unique_lock<std::mutex> lock(mutex);
        --inFlight;
        ++completed;

        if (outcome.reply && outcome.reply->server.responded) {
            ServerInfo server = std::move(outcome.reply->server);
            server.ping = outcome.reply->pongMs;
            results[index] = std::move(server);
        }

        const bool progressDue = onBatch
            && options.progressInterval > 0
            && completed % options.progressInterval == 0
            && completed < addresses.size()
            && !cancel.isCancellationRequested();
        if (progressDue) {
            auto servers = respondedLocked();
            if (!servers.empty()) {
                deliver(lock, std::move(servers), FanOutScheduler::BatchPhase::Progress);
            }
        }
    }

    pump();
}

void Batch::finishIfDone() {
    std::unique_lock<std::mutex> lock(mutex);
    if (finished || inFlight > 0) {
        return;
    }

    const bool cancelled = cancel.isCancellationRequested();
    if (!cancelled && nextIndex < addresses.size()) {
        return;
    }

    finished = true;
    FanOutScheduler::Results snapshot = results;
    if (cancelled) {
        spdlog::debug("FanOutScheduler: Batch cancelled after {}/{} queries", completed, addresses.size());
    } else if (onBatch) {
        deliver(lock, respondedLocked(), FanOutScheduler::BatchPhase::Final);
    }
    if (lock.owns_lock()) {
        lock.unlock();
    }
    promise.set_value(std::move(snapshot));
}
} // namespace

FanOutScheduler::FanOutScheduler(GameServerQuerier &querier)
    : FanOutScheduler(querier, Options{}) {}

FanOutScheduler::FanOutScheduler(GameServerQuerier &querier, Options options)
    : querier(querier), options(options) {
    this->options.concurrencyLimit = std::max<std::size_t>(1, this->options.concurrencyLimit);
}

std::future<FanOutScheduler::Results> FanOutScheduler::queryAll(std::vector<ServerAddress> addresses,
                                                                BatchCallback onBatch,
                                                                CancellationToken cancel) {
    auto batch = std::make_shared<Batch>(querier, options, std::move(addresses), std::move(onBatch), std::move(cancel));
    auto future = batch->getFuture();
    batch->pump();
    return future;
}

} // namespace odal
