#include "fake_udp_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <stdexcept>

namespace {
int bindLoopback(uint16_t &portOut) {
    const int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        throw std::runtime_error("socket() failed");
    }
    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    local.sin_port = 0;
    if (bind(fd, reinterpret_cast<sockaddr *>(&local), sizeof(local)) < 0) {
        close(fd);
        throw std::runtime_error("bind() failed");
    }
    socklen_t length = sizeof(local);
    getsockname(fd, reinterpret_cast<sockaddr *>(&local), &length);
    portOut = ntohs(local.sin_port);
    return fd;
}
} // namespace

FakeUdpServer::FakeUdpServer(Responder responder)
    : responder(std::move(responder)) {
    socketFd = bindLoopback(boundPort);
    thread = std::thread(&FakeUdpServer::serve, this);
}

FakeUdpServer::~FakeUdpServer() {
    running = false;
    if (thread.joinable()) {
        thread.join();
    }
    close(socketFd);
}

void FakeUdpServer::serve() {
    std::vector<uint8_t> buffer(8192);
    while (running) {
        pollfd pfd{socketFd, POLLIN, 0};
        if (poll(&pfd, 1, 20) <= 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        sockaddr_in peer{};
        socklen_t peerLength = sizeof(peer);
        const ssize_t received = recvfrom(socketFd, buffer.data(), buffer.size(), 0,
                                          reinterpret_cast<sockaddr *>(&peer), &peerLength);
        if (received < 0) {
            continue;
        }
        ++requests;

        const std::vector<uint8_t> request(buffer.begin(), buffer.begin() + received);
        if (auto reply = responder(request)) {
            sendto(socketFd, reply->data(), reply->size(), 0, reinterpret_cast<sockaddr *>(&peer), peerLength);
        }
    }
}

uint16_t UnusedLoopbackPort() {
    uint16_t port = 0;
    const int fd = bindLoopback(port);
    close(fd);
    return port;
}
