#include "registry/server_registry.hpp"

#include <unordered_map>

namespace odal {

namespace {
const ServerRegistry::Snapshot &emptySnapshot() {
    static const ServerRegistry::Snapshot empty = std::make_shared<const std::vector<ServerInfo>>();
    return empty;
}
} // namespace

ServerRegistry::ServerRegistry()
    : servers(emptySnapshot()), localServers(emptySnapshot()) {}

std::vector<ServerInfo> ServerRegistry::dedupeByAddress(std::vector<ServerInfo> input) {
    std::vector<ServerInfo> unique;
    unique.reserve(input.size());
    std::unordered_map<std::string, std::size_t> indexByKey;

    for (auto &server : input) {
        const std::string key = server.address.key();
        if (auto it = indexByKey.find(key); it != indexByKey.end()) {
            unique[it->second] = std::move(server);
            continue;
        }
        indexByKey.emplace(key, unique.size());
        unique.push_back(std::move(server));
    }
    return unique;
}

ServerRegistry::Snapshot ServerRegistry::withPing(const Snapshot &snapshot, const std::string &key, int pingMs) {
    for (std::size_t i = 0; i < snapshot->size(); ++i) {
        if ((*snapshot)[i].address.key() != key) {
            continue;
        }
        auto patched = std::make_shared<std::vector<ServerInfo>>(*snapshot);
        (*patched)[i].ping = pingMs;
        return patched;
    }
    return snapshot;
}

void ServerRegistry::setServers(std::vector<ServerInfo> newServers) {
    auto snapshot = std::make_shared<const std::vector<ServerInfo>>(dedupeByAddress(std::move(newServers)));
    std::lock_guard<std::mutex> lock(mutex);
    servers = std::move(snapshot);
    lastUpdated = Clock::now();
    loading = false;
    error.reset();
    generation++;
}

void ServerRegistry::setLocalServers(std::vector<ServerInfo> newServers) {
    auto snapshot = std::make_shared<const std::vector<ServerInfo>>(dedupeByAddress(std::move(newServers)));
    std::lock_guard<std::mutex> lock(mutex);
    localServers = std::move(snapshot);
    localLastUpdated = Clock::now();
    loading = false;
    error.reset();
    generation++;
}

void ServerRegistry::updateServerPing(const ServerAddress &address, int pingMs) {
    const std::string key = address.key();
    std::lock_guard<std::mutex> lock(mutex);
    auto patchedServers = withPing(servers, key, pingMs);
    auto patchedLocal = withPing(localServers, key, pingMs);
    if (patchedServers == servers && patchedLocal == localServers) {
        return;
    }
    servers = std::move(patchedServers);
    localServers = std::move(patchedLocal);
    generation++;
}

void ServerRegistry::setLoading(bool value) {
    std::lock_guard<std::mutex> lock(mutex);
    loading = value;
}

void ServerRegistry::setError(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex);
    error = message;
    loading = false;
}

void ServerRegistry::clearError() {
    std::lock_guard<std::mutex> lock(mutex);
    error.reset();
}

void ServerRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex);
    servers = emptySnapshot();
    localServers = emptySnapshot();
    loading = false;
    error.reset();
    lastUpdated.reset();
    localLastUpdated.reset();
    generation++;
}

ServerRegistry::Snapshot ServerRegistry::getServers() const {
    std::lock_guard<std::mutex> lock(mutex);
    return servers;
}

ServerRegistry::Snapshot ServerRegistry::getLocalServers() const {
    std::lock_guard<std::mutex> lock(mutex);
    return localServers;
}

std::optional<ServerInfo> ServerRegistry::findServer(const ServerAddress &address) const {
    const Snapshot primary = getServers();
    for (const auto &server : *primary) {
        if (server.address == address) {
            return server;
        }
    }
    const Snapshot local = getLocalServers();
    for (const auto &server : *local) {
        if (server.address == address) {
            return server;
        }
    }
    return std::nullopt;
}

bool ServerRegistry::isLoading() const {
    std::lock_guard<std::mutex> lock(mutex);
    return loading;
}

std::optional<std::string> ServerRegistry::getError() const {
    std::lock_guard<std::mutex> lock(mutex);
    return error;
}

std::optional<ServerRegistry::Clock::time_point> ServerRegistry::getLastUpdated() const {
    std::lock_guard<std::mutex> lock(mutex);
    return lastUpdated;
}

std::optional<ServerRegistry::Clock::time_point> ServerRegistry::getLocalLastUpdated() const {
    std::lock_guard<std::mutex> lock(mutex);
    return localLastUpdated;
}

std::size_t ServerRegistry::serverCount() const {
    return getServers()->size();
}

std::size_t ServerRegistry::localServerCount() const {
    return getLocalServers()->size();
}

std::size_t ServerRegistry::playerCount() const {
    const Snapshot snapshot = getServers();
    std::size_t total = 0;
    for (const auto &server : *snapshot) {
        total += server.players.size();
    }
    return total;
}

std::size_t ServerRegistry::getGeneration() const {
    return generation.load();
}

} // namespace odal
