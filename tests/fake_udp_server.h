#pragma once

#include "protocol/odalpapi.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <thread>
#include <vector>

// Loopback UDP responder for exercising the real query path.
class FakeUdpServer {
public:
    using Responder = std::function<std::optional<std::vector<uint8_t>>(const std::vector<uint8_t> &request)>;

    explicit FakeUdpServer(Responder responder);
    ~FakeUdpServer();

    FakeUdpServer(const FakeUdpServer &) = delete;
    FakeUdpServer &operator=(const FakeUdpServer &) = delete;

    odal::ServerAddress address() const {
        return odal::ServerAddress{"127.0.0.1", boundPort};
    }
    int requestCount() const {
        return requests.load();
    }

private:
    void serve();

    Responder responder;
    int socketFd = -1;
    uint16_t boundPort = 0;
    std::atomic<bool> running{true};
    std::atomic<int> requests{0};
    std::thread thread;
};

// Reserves a loopback port with nothing listening on it.
uint16_t UnusedLoopbackPort();
