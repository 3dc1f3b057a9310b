#pragma once

#include "protocol/odalpapi.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace odal {

// Canonical store of known servers. Readers get immutable snapshots; every
// write publishes a new snapshot, so a reader never sees a half-applied update.
class ServerRegistry {
public:
    using Snapshot = std::shared_ptr<const std::vector<ServerInfo>>;
    using Clock = std::chrono::system_clock;

    ServerRegistry();

    // Replace the master-list servers wholesale. Clears loading and error.
    void setServers(std::vector<ServerInfo> servers);
    // Replace the LAN servers wholesale. Clears loading and error.
    void setLocalServers(std::vector<ServerInfo> servers);
    // Patch ping on the matching entry in both lists; unknown addresses are ignored.
    void updateServerPing(const ServerAddress &address, int pingMs);

    void setLoading(bool loading);
    void setError(const std::string &message);
    void clearError();
    void reset();

    Snapshot getServers() const;
    Snapshot getLocalServers() const;
    std::optional<ServerInfo> findServer(const ServerAddress &address) const;

    bool isLoading() const;
    std::optional<std::string> getError() const;
    std::optional<Clock::time_point> getLastUpdated() const;
    std::optional<Clock::time_point> getLocalLastUpdated() const;

    std::size_t serverCount() const;
    std::size_t localServerCount() const;
    std::size_t playerCount() const;
    std::size_t getGeneration() const;

private:
    static std::vector<ServerInfo> dedupeByAddress(std::vector<ServerInfo> servers);
    static Snapshot withPing(const Snapshot &snapshot, const std::string &key, int pingMs);

    mutable std::mutex mutex;
    Snapshot servers;
    Snapshot localServers;
    bool loading = false;
    std::optional<std::string> error;
    std::optional<Clock::time_point> lastUpdated;
    std::optional<Clock::time_point> localLastUpdated;
    std::atomic<std::size_t> generation{0};
};

} // namespace odal
