#pragma once

#include "common/json.hpp"
#include "protocol/odalpapi.hpp"

#include <set>

namespace odal {

struct QuickMatchCriteria {
    int maxPing = 100;
    int minPlayers = 1;
    int maxPlayers = 32;
    bool avoidEmpty = true;
    bool avoidFull = true;
    // Empty accepts every game type.
    std::set<GameType> preferredGameTypes = {
        GameType::Cooperative,
        GameType::Deathmatch,
        GameType::TeamDeathmatch,
        GameType::CaptureTheFlag,
    };
    // 0 monitors until stopped.
    int monitoringTimeoutMinutes = 15;
    bool autoStartMonitoring = true;
};

// Missing keys keep their defaults; unusable values are logged and ignored.
QuickMatchCriteria ParseQuickMatchCriteria(const json::Value &node);

} // namespace odal
