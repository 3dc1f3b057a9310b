#pragma once

#include "common/cancellation.hpp"
#include "protocol/odalpapi.hpp"
#include "protocol/packet_codec.hpp"
#include "protocol/query_error.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace odal {

struct GameServerReply {
    ServerInfo server;
    int pongMs = 0;
    // Set when the datagram arrived but could not be decoded.
    std::optional<codec::DecodeFailure> failure;
};

// Exactly one of reply / error is set.
struct GameServerOutcome {
    std::optional<GameServerReply> reply;
    std::optional<QueryError> error;
};

class GameServerQuerier {
public:
    using Completion = std::function<void(GameServerOutcome)>;

    virtual ~GameServerQuerier() = default;

    virtual void queryGameServerAsync(const ServerAddress &address,
                                      bool single,
                                      std::chrono::milliseconds timeout,
                                      const CancellationToken &cancel,
                                      Completion done) = 0;
};

} // namespace odal
