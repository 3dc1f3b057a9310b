#pragma once

#include "common/cancellation.hpp"
#include "net/udp_socket.hpp"
#include "protocol/odalpapi.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace odal::net {

// One worker thread multiplexing every outstanding request/response exchange
// with poll(). Each exchange owns its socket; the first datagram, the timeout,
// a socket error or cancellation settles it, the socket is closed, and the
// callback runs once on the worker thread with no reactor lock held.
class QueryReactor {
public:
    enum class Outcome {
        Received,
        Timeout,
        TransportError,
        NotFound,
        Cancelled
    };

    struct Completion {
        Outcome outcome = Outcome::Timeout;
        std::vector<uint8_t> payload;
        std::chrono::steady_clock::duration elapsed{};
        std::string error;
    };

    using Callback = std::function<void(Completion)>;

    struct Exchange {
        ServerAddress target;
        std::vector<uint8_t> request;
        std::chrono::milliseconds timeout{10000};
        CancellationToken cancel;
        Callback callback;
    };

    QueryReactor();
    ~QueryReactor();

    QueryReactor(const QueryReactor &) = delete;
    QueryReactor &operator=(const QueryReactor &) = delete;

    void submit(Exchange exchange);
    // Settles everything still pending as Cancelled and joins the worker.
    // Must not be called from a completion callback.
    void shutdown();

    std::size_t openSocketCount() const;

private:
    struct Pending {
        uint64_t id = 0;
        Exchange exchange;
        UdpSocket socket;
        std::chrono::steady_clock::time_point sentAt;
        std::chrono::steady_clock::time_point deadline;
        bool settledEarly = false;
        Completion early;
    };

    void wakeWorker();
    void workerProc();

    mutable std::mutex mutex;
    std::vector<std::unique_ptr<Pending>> pending;
    uint64_t nextId = 1;
    bool stopRequested = false;
    int wakePipe[2] = {-1, -1};
    std::thread worker;
};

} // namespace odal::net
