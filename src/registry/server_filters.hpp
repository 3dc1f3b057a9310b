#pragma once

#include "protocol/odalpapi.hpp"

#include <optional>
#include <vector>

namespace odal {

struct VisibilityFilter {
    bool hideEmpty = false;
    // 0 disables the ping ceiling.
    int maxPing = 0;
    bool byVersion = false;
    std::optional<VersionTriple> clientVersion;

    bool accepts(const ServerInfo &server) const;
};

// Same major, server minor not newer than ours. Unknown client version accepts everything.
bool IsVersionCompatible(const ServerInfo &server, const std::optional<VersionTriple> &clientVersion);

std::vector<ServerInfo> ApplyVisibilityFilter(const std::vector<ServerInfo> &servers, const VisibilityFilter &filter);

} // namespace odal
