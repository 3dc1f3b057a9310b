#include "net/udp_socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace odal::net {

namespace {
constexpr std::size_t kMaxDatagramSize = 65536;

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        flags = 0;
    }
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void closeSocketHandle(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

void setError(std::string *error, const std::string &what) {
    if (error) {
        *error = what + ": " + std::strerror(errno);
    }
}
} // namespace

std::optional<sockaddr_in> ResolveIPv4(const ServerAddress &address, std::string *error) {
    sockaddr_in resolved{};
    resolved.sin_family = AF_INET;
    resolved.sin_port = htons(address.port);

    if (inet_pton(AF_INET, address.ip.c_str(), &resolved.sin_addr) == 1) {
        return resolved;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *result = nullptr;
    const int status = getaddrinfo(address.ip.c_str(), nullptr, &hints, &result);
    if (status != 0 || !result) {
        if (error) {
            *error = "Unable to resolve " + address.ip + ": " + gai_strerror(status);
        }
        if (result) {
            freeaddrinfo(result);
        }
        return std::nullopt;
    }

    resolved.sin_addr = reinterpret_cast<const sockaddr_in *>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return resolved;
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket &&other) noexcept : socketFd(other.socketFd) {
    other.socketFd = -1;
}

UdpSocket &UdpSocket::operator=(UdpSocket &&other) noexcept {
    if (this != &other) {
        close();
        socketFd = other.socketFd;
        other.socketFd = -1;
    }
    return *this;
}

bool UdpSocket::open(const sockaddr_in &peer, std::string *error) {
    close();

    socketFd = static_cast<int>(socket(AF_INET, SOCK_DGRAM, 0));
    if (socketFd < 0) {
        setError(error, "socket");
        return false;
    }

    setNonBlocking(socketFd);

    // Connecting lets the kernel report ICMP port-unreachable as ECONNREFUSED.
    if (connect(socketFd, reinterpret_cast<const sockaddr *>(&peer), sizeof(peer)) < 0) {
        setError(error, "connect");
        close();
        return false;
    }
    return true;
}

bool UdpSocket::send(std::span<const uint8_t> payload, std::string *error) {
    if (socketFd < 0) {
        if (error) {
            *error = "send on closed socket";
        }
        return false;
    }

    const ssize_t sent = ::send(socketFd, payload.data(), payload.size(), 0);
    if (sent < 0 || static_cast<std::size_t>(sent) != payload.size()) {
        setError(error, "send");
        return false;
    }
    return true;
}

UdpSocket::ReceiveStatus UdpSocket::receive(std::vector<uint8_t> &payload, std::string *error) {
    if (socketFd < 0) {
        if (error) {
            *error = "receive on closed socket";
        }
        return ReceiveStatus::Failed;
    }

    payload.resize(kMaxDatagramSize);
    const ssize_t received = recv(socketFd, payload.data(), payload.size(), 0);
    if (received < 0) {
        payload.clear();
        if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) {
            return ReceiveStatus::WouldBlock;
        }
        setError(error, "recv");
        if (errno == ECONNREFUSED) {
            return ReceiveStatus::Refused;
        }
        return ReceiveStatus::Failed;
    }

    payload.resize(static_cast<std::size_t>(received));
    return ReceiveStatus::Received;
}

void UdpSocket::close() {
    closeSocketHandle(socketFd);
    socketFd = -1;
}

} // namespace odal::net
