#pragma once

#include "common/json.hpp"
#include "match/match_criteria.hpp"
#include "protocol/odalpapi.hpp"
#include "query/local_discovery.hpp"
#include "registry/server_filters.hpp"

#include <optional>
#include <string>
#include <vector>

namespace odal {

struct NotificationSettings {
    bool enabled = true;
    bool serverActivity = true;
    bool flash = true;
};

struct ClientConfig {
    std::vector<ServerAddress> masters;
    int masterTimeoutMs = 10000;
    int queryTimeoutMs = 10000;
    int pingTimeoutMs = 5000;
    int concurrency = 10;
    int progressInterval = 5;
    int pingDivisorBatch = 2;
    int pingDivisorSingle = 1;

    bool autoRefresh = true;
    int refreshIntervalMinutes = 5;

    VisibilityFilter filters;

    LocalDiscovery::Options localDiscovery;

    QuickMatchCriteria quickMatch;
    NotificationSettings notifications;

    // Bundled defaults merged with the optional user file (user keys win).
    static ClientConfig Load(const std::string &defaultsPath, const std::string &userPath = {});
    static ClientConfig FromJson(const json::Value &root);
};

// "0.9" or "0.9.1"; nullopt when the text is not a version.
std::optional<VersionTriple> ParseVersionString(const std::string &text);

} // namespace odal
