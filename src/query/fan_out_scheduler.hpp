#pragma once

#include "common/cancellation.hpp"
#include "query/game_server_querier.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <optional>
#include <vector>

namespace odal {

// Queries a list of game servers with at most concurrencyLimit requests in
// flight. Slot i of the result belongs to addresses[i] and is empty when that
// server failed, timed out, sent garbage or was never dispatched.
class FanOutScheduler {
public:
    struct Options {
        std::size_t concurrencyLimit = 10;
        std::size_t progressInterval = 5;
        std::chrono::milliseconds queryTimeout{10000};
        // Report raw round trips as ping (single-query divisor).
        bool singleQueries = false;
    };

    enum class BatchPhase {
        Progress,
        Final
    };

    // Receives the responded servers collected so far. Calls are serialized.
    using BatchCallback = std::function<void(const std::vector<ServerInfo> &servers, BatchPhase phase)>;
    using Results = std::vector<std::optional<ServerInfo>>;

    explicit FanOutScheduler(GameServerQuerier &querier);
    FanOutScheduler(GameServerQuerier &querier, Options options);

    // Cancelling stops further dispatch and aborts in-flight queries; the
    // future then resolves with whatever had settled and no Final callback
    // is made.
    std::future<Results> queryAll(std::vector<ServerAddress> addresses,
                                  BatchCallback onBatch = {},
                                  CancellationToken cancel = {});

    const Options &getOptions() const {
        return options;
    }

private:
    GameServerQuerier &querier;
    Options options;
};

} // namespace odal
