#pragma once

#include "protocol/odalpapi.hpp"

#include <netinet/in.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace odal::net {

// IPv4 only. Numeric addresses skip the resolver.
std::optional<sockaddr_in> ResolveIPv4(const ServerAddress &address, std::string *error = nullptr);

// Non-blocking UDP socket connected to a single peer. Closed exactly once,
// either explicitly or by the destructor.
class UdpSocket {
public:
    enum class ReceiveStatus {
        Received,
        WouldBlock,
        Refused,
        Failed
    };

    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;
    UdpSocket(UdpSocket &&other) noexcept;
    UdpSocket &operator=(UdpSocket &&other) noexcept;

    bool open(const sockaddr_in &peer, std::string *error = nullptr);
    bool send(std::span<const uint8_t> payload, std::string *error = nullptr);
    ReceiveStatus receive(std::vector<uint8_t> &payload, std::string *error = nullptr);
    void close();

    bool isOpen() const {
        return socketFd >= 0;
    }
    int fd() const {
        return socketFd;
    }

private:
    int socketFd = -1;
};

} // namespace odal::net
