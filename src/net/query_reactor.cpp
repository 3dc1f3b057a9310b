#include "net/query_reactor.hpp"

#include "spdlog/spdlog.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <unordered_map>

namespace odal::net {

namespace {
constexpr auto kMaxPollSlice = std::chrono::milliseconds(50);

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        flags = 0;
    }
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

QueryReactor::Completion makeFailure(QueryReactor::Outcome outcome, std::string error) {
    QueryReactor::Completion completion;
    completion.outcome = outcome;
    completion.error = std::move(error);
    return completion;
}
} // namespace

QueryReactor::QueryReactor() {
    if (pipe(wakePipe) < 0) {
        spdlog::warn("QueryReactor: Failed to create wake pipe; falling back to polling");
        wakePipe[0] = -1;
        wakePipe[1] = -1;
    } else {
        setNonBlocking(wakePipe[0]);
        setNonBlocking(wakePipe[1]);
    }
}

QueryReactor::~QueryReactor() {
    shutdown();
    for (int &fd : wakePipe) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

void QueryReactor::submit(Exchange exchange) {
    auto entry = std::make_unique<Pending>();
    entry->exchange = std::move(exchange);

    std::string error;
    const auto peer = ResolveIPv4(entry->exchange.target, &error);
    if (!peer) {
        entry->settledEarly = true;
        entry->early = makeFailure(Outcome::NotFound, error);
    } else if (!entry->socket.open(*peer, &error) || !entry->socket.send(entry->exchange.request, &error)) {
        entry->settledEarly = true;
        entry->early = makeFailure(Outcome::TransportError, error);
        entry->socket.close();
    }

    entry->sentAt = std::chrono::steady_clock::now();
    entry->deadline = entry->sentAt + entry->exchange.timeout;

    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!stopRequested) {
            entry->id = nextId++;
            pending.push_back(std::move(entry));
            if (!worker.joinable()) {
                worker = std::thread(&QueryReactor::workerProc, this);
            }
        }
    }

    if (entry) {
        entry->socket.close();
        if (entry->exchange.callback) {
            entry->exchange.callback(makeFailure(Outcome::Cancelled, "reactor is shut down"));
        }
        return;
    }

    wakeWorker();
}

void QueryReactor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = true;
    }
    wakeWorker();
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
}

std::size_t QueryReactor::openSocketCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return static_cast<std::size_t>(std::count_if(pending.begin(), pending.end(), [](const auto &entry) {
        return entry->socket.isOpen();
    }));
}

void QueryReactor::wakeWorker() {
    if (wakePipe[1] < 0) {
        return;
    }
    const char byte = 1;
    if (write(wakePipe[1], &byte, 1) < 0) {
        // Pipe full means a wake-up is already queued.
        return;
    }
}

void QueryReactor::workerProc() {
    std::vector<pollfd> fds;
    std::vector<uint64_t> ids;

    while (true) {
        fds.clear();
        ids.clear();
        auto waitFor = kMaxPollSlice;
        bool stopping = false;
        bool anyPending = false;

        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = stopRequested;
            anyPending = !pending.empty();
            const auto now = std::chrono::steady_clock::now();
            for (const auto &entry : pending) {
                if (entry->settledEarly) {
                    waitFor = std::chrono::milliseconds(0);
                    continue;
                }
                if (entry->socket.isOpen()) {
                    fds.push_back(pollfd{entry->socket.fd(), POLLIN, 0});
                    ids.push_back(entry->id);
                }
                const auto untilDeadline = std::chrono::duration_cast<std::chrono::milliseconds>(entry->deadline - now);
                waitFor = std::max(std::chrono::milliseconds(0), std::min(waitFor, untilDeadline));
            }
        }

        if (stopping) {
            waitFor = std::chrono::milliseconds(0);
        }

        const std::size_t socketCount = fds.size();
        if (wakePipe[0] >= 0) {
            fds.push_back(pollfd{wakePipe[0], POLLIN, 0});
        }

        int timeoutMs = static_cast<int>(waitFor.count());
        if (!anyPending && !stopping && wakePipe[0] >= 0) {
            timeoutMs = -1;
        }

        const int ready = poll(fds.data(), static_cast<nfds_t>(fds.size()), timeoutMs);
        if (ready < 0 && errno != EINTR) {
            spdlog::warn("QueryReactor: poll failed: {}", std::strerror(errno));
        }

        if (wakePipe[0] >= 0 && (fds.back().revents & POLLIN)) {
            char drain[64];
            while (read(wakePipe[0], drain, sizeof(drain)) > 0) {
            }
        }

        std::unordered_map<uint64_t, short> events;
        for (std::size_t i = 0; i < socketCount; ++i) {
            if (fds[i].revents != 0) {
                events.emplace(ids[i], fds[i].revents);
            }
        }

        std::vector<std::pair<Callback, Completion>> settled;
        bool idle = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            const auto now = std::chrono::steady_clock::now();

            for (auto it = pending.begin(); it != pending.end();) {
                Pending &entry = **it;
                std::optional<Completion> completion;

                if (entry.settledEarly) {
                    completion = std::move(entry.early);
                } else if (stopRequested || entry.exchange.cancel.isCancellationRequested()) {
                    completion = makeFailure(Outcome::Cancelled, "cancelled");
                } else if (auto event = events.find(entry.id); event != events.end()) {
                    std::string error;
                    std::vector<uint8_t> payload;
                    switch (entry.socket.receive(payload, &error)) {
                        case UdpSocket::ReceiveStatus::Received:
                            completion = Completion{Outcome::Received, std::move(payload), now - entry.sentAt, {}};
                            break;
                        case UdpSocket::ReceiveStatus::Refused:
                            completion = makeFailure(Outcome::NotFound, error);
                            break;
                        case UdpSocket::ReceiveStatus::Failed:
                            completion = makeFailure(Outcome::TransportError, error);
                            break;
                        case UdpSocket::ReceiveStatus::WouldBlock:
                            break;
                    }
                }

                if (!completion && now >= entry.deadline) {
                    completion = makeFailure(Outcome::Timeout, "no response within "
                        + std::to_string(entry.exchange.timeout.count()) + "ms");
                }

                if (!completion) {
                    ++it;
                    continue;
                }

                if (completion->outcome != Outcome::Received) {
                    completion->elapsed = now - entry.sentAt;
                }
                entry.socket.close();
                settled.emplace_back(std::move(entry.exchange.callback), std::move(*completion));
                it = pending.erase(it);
            }

            idle = stopRequested && pending.empty();
        }

        for (auto &[callback, completion] : settled) {
            if (callback) {
                callback(std::move(completion));
            }
        }

        if (idle) {
            return;
        }
    }
}

} // namespace odal::net
