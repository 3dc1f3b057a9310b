#include "query/discovery_client.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace odal {

namespace {
QueryError errorFromCompletion(const net::QueryReactor::Completion &completion,
                               const char *what,
                               const ServerAddress &address) {
    const std::string target = address.key();
    switch (completion.outcome) {
        case net::QueryReactor::Outcome::Timeout:
            return QueryError(QueryErrorKind::Timeout, std::string(what) + " timeout for " + target);
        case net::QueryReactor::Outcome::NotFound:
            return QueryError(QueryErrorKind::NotFound, std::string(what) + " found nothing at " + target + ": " + completion.error);
        case net::QueryReactor::Outcome::Cancelled:
            return QueryError(QueryErrorKind::Cancelled, std::string(what) + " cancelled for " + target);
        case net::QueryReactor::Outcome::TransportError:
        case net::QueryReactor::Outcome::Received:
            break;
    }
    return QueryError(QueryErrorKind::TransportError, std::string(what) + " error for " + target + ": " + completion.error);
}

int pongFrom(std::chrono::steady_clock::duration elapsed, long long divisor) {
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    return static_cast<int>((elapsedMs + divisor - 1) / divisor);
}

template <typename T>
void rejectWith(std::promise<T> &promise, const QueryError &error) {
    promise.set_exception(std::make_exception_ptr(error));
}
} // namespace

DiscoveryClient::DiscoveryClient()
    : DiscoveryClient(Options{}) {}

DiscoveryClient::DiscoveryClient(Options options)
    : DiscoveryClient(std::make_shared<net::QueryReactor>(), options) {}

DiscoveryClient::DiscoveryClient(std::shared_ptr<net::QueryReactor> reactor, Options options)
    : reactor(std::move(reactor)), options(options) {
    this->options.pingDivisorBatch = std::max(1, this->options.pingDivisorBatch);
    this->options.pingDivisorSingle = std::max(1, this->options.pingDivisorSingle);
}

int DiscoveryClient::pongFromElapsed(std::chrono::steady_clock::duration elapsed, bool single) const {
    return pongFrom(elapsed, single ? options.pingDivisorSingle : options.pingDivisorBatch);
}

std::future<std::vector<ServerAddress>> DiscoveryClient::queryMasterServer(const ServerAddress &master,
                                                                           std::chrono::milliseconds timeout,
                                                                           CancellationToken cancel) {
    auto promise = std::make_shared<std::promise<std::vector<ServerAddress>>>();
    auto future = promise->get_future();

    net::QueryReactor::Exchange exchange;
    exchange.target = master;
    exchange.request = codec::EncodeChallenge(ChallengeKind::Master);
    exchange.timeout = timeout;
    exchange.cancel = std::move(cancel);
    exchange.callback = [promise, master](net::QueryReactor::Completion completion) {
        if (completion.outcome != net::QueryReactor::Outcome::Received) {
            const QueryError error = errorFromCompletion(completion, "Master query", master);
            spdlog::warn("DiscoveryClient: {}", error.what());
            rejectWith(*promise, error);
            return;
        }

        codec::DecodeFailure failure;
        auto addresses = codec::DecodeMasterResponse(completion.payload, &failure);
        if (addresses.empty() && !failure.message.empty()) {
            spdlog::warn("DiscoveryClient: {} from {}", failure.message, master.key());
            rejectWith(*promise, QueryError(failure.kind, failure.message));
            return;
        }

        spdlog::debug("DiscoveryClient: Master {} listed {} server(s)", master.key(), addresses.size());
        promise->set_value(std::move(addresses));
    };

    reactor->submit(std::move(exchange));
    return future;
}

void DiscoveryClient::queryGameServerAsync(const ServerAddress &address,
                                           bool single,
                                           std::chrono::milliseconds timeout,
                                           const CancellationToken &cancel,
                                           Completion done) {
    net::QueryReactor::Exchange exchange;
    exchange.target = address;
    exchange.request = codec::EncodeChallenge(ChallengeKind::Server);
    exchange.timeout = timeout;
    exchange.cancel = cancel;
    const long long divisor = single ? options.pingDivisorSingle : options.pingDivisorBatch;
    const uint32_t clientVersion = options.clientVersion;
    exchange.callback = [address, divisor, clientVersion, done = std::move(done)](net::QueryReactor::Completion completion) {
        GameServerOutcome outcome;
        if (completion.outcome != net::QueryReactor::Outcome::Received) {
            outcome.error = errorFromCompletion(completion, "Server query", address);
            spdlog::debug("DiscoveryClient: {}", outcome.error->what());
            done(std::move(outcome));
            return;
        }

        GameServerReply reply;
        codec::DecodeFailure failure;
        reply.server = codec::DecodeGameServerResponse(completion.payload, address, &failure, clientVersion);
        reply.pongMs = pongFrom(completion.elapsed, divisor);
        if (!reply.server.responded) {
            spdlog::debug("DiscoveryClient: {}", failure.message);
            reply.failure = std::move(failure);
        }
        outcome.reply = std::move(reply);
        done(std::move(outcome));
    };

    reactor->submit(std::move(exchange));
}

std::future<GameServerReply> DiscoveryClient::queryGameServer(const ServerAddress &address,
                                                              bool single,
                                                              std::chrono::milliseconds timeout,
                                                              CancellationToken cancel) {
    auto promise = std::make_shared<std::promise<GameServerReply>>();
    auto future = promise->get_future();

    queryGameServerAsync(address, single, timeout, cancel, [promise](GameServerOutcome outcome) {
        if (outcome.reply) {
            promise->set_value(std::move(*outcome.reply));
        } else if (outcome.error) {
            rejectWith(*promise, *outcome.error);
        } else {
            rejectWith(*promise, QueryError(QueryErrorKind::TransportError, "Server query produced no result"));
        }
    });
    return future;
}

std::future<int> DiscoveryClient::pingGameServer(const ServerAddress &address,
                                                 std::chrono::milliseconds timeout,
                                                 CancellationToken cancel) {
    auto promise = std::make_shared<std::promise<int>>();
    auto future = promise->get_future();

    net::QueryReactor::Exchange exchange;
    exchange.target = address;
    exchange.request = codec::EncodeChallenge(ChallengeKind::Ping);
    exchange.timeout = timeout;
    exchange.cancel = std::move(cancel);
    exchange.callback = [promise, address](net::QueryReactor::Completion completion) {
        if (completion.outcome != net::QueryReactor::Outcome::Received) {
            const QueryError error = errorFromCompletion(completion, "Ping", address);
            spdlog::debug("DiscoveryClient: {}", error.what());
            rejectWith(*promise, error);
            return;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(completion.elapsed);
        promise->set_value(static_cast<int>(elapsed.count()));
    };

    reactor->submit(std::move(exchange));
    return future;
}

} // namespace odal
