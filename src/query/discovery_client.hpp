#pragma once

#include "net/query_reactor.hpp"
#include "query/game_server_querier.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <vector>

namespace odal {

constexpr std::chrono::milliseconds kMasterQueryTimeout{10000};
constexpr std::chrono::milliseconds kGameServerQueryTimeout{10000};
constexpr std::chrono::milliseconds kPingTimeout{5000};

// Request/response queries against the master list and individual game
// servers. Every call uses its own socket and settles exactly once; failures
// reach the caller as a QueryError stored in the future.
class DiscoveryClient : public GameServerQuerier {
public:
    struct Options {
        // Elapsed time is divided by these (rounding up) to report ping.
        int pingDivisorBatch = 2;
        int pingDivisorSingle = 1;
        uint32_t clientVersion = CLIENT_VERSION;
    };

    DiscoveryClient();
    explicit DiscoveryClient(Options options);
    DiscoveryClient(std::shared_ptr<net::QueryReactor> reactor, Options options);

    std::future<std::vector<ServerAddress>> queryMasterServer(const ServerAddress &master,
                                                              std::chrono::milliseconds timeout = kMasterQueryTimeout,
                                                              CancellationToken cancel = {});

    std::future<GameServerReply> queryGameServer(const ServerAddress &address,
                                                 bool single = false,
                                                 std::chrono::milliseconds timeout = kGameServerQueryTimeout,
                                                 CancellationToken cancel = {});

    std::future<int> pingGameServer(const ServerAddress &address,
                                    std::chrono::milliseconds timeout = kPingTimeout,
                                    CancellationToken cancel = {});

    void queryGameServerAsync(const ServerAddress &address,
                              bool single,
                              std::chrono::milliseconds timeout,
                              const CancellationToken &cancel,
                              Completion done) override;

    int pongFromElapsed(std::chrono::steady_clock::duration elapsed, bool single) const;

    const Options &getOptions() const {
        return options;
    }

private:
    std::shared_ptr<net::QueryReactor> reactor;
    Options options;
};

} // namespace odal
