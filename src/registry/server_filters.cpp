#include "registry/server_filters.hpp"

namespace odal {

bool IsVersionCompatible(const ServerInfo &server, const std::optional<VersionTriple> &clientVersion) {
    if (!clientVersion) {
        return true;
    }
    if (server.versionMajor != clientVersion->major) {
        return false;
    }
    return server.versionMinor <= clientVersion->minor;
}

bool VisibilityFilter::accepts(const ServerInfo &server) const {
    if (byVersion && !IsVersionCompatible(server, clientVersion)) {
        return false;
    }
    if (hideEmpty && server.players.empty()) {
        return false;
    }
    if (maxPing > 0 && server.ping && *server.ping > maxPing) {
        return false;
    }
    return true;
}

std::vector<ServerInfo> ApplyVisibilityFilter(const std::vector<ServerInfo> &servers, const VisibilityFilter &filter) {
    std::vector<ServerInfo> visible;
    visible.reserve(servers.size());
    for (const auto &server : servers) {
        if (filter.accepts(server)) {
            visible.push_back(server);
        }
    }
    return visible;
}

} // namespace odal
