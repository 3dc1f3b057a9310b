#include "match/match_criteria.hpp"

#include "common/config_helpers.hpp"
#include "spdlog/spdlog.h"

#include <utility>

namespace odal {

QuickMatchCriteria ParseQuickMatchCriteria(const json::Value &node) {
    QuickMatchCriteria criteria;
    if (node.is_null()) {
        return criteria;
    }
    if (!node.is_object()) {
        spdlog::warn("QuickMatchCriteria: 'quickMatch' must be an object");
        return criteria;
    }

    criteria.maxPing = config::ReadIntConfig(node, {"maxPing"}, criteria.maxPing);
    criteria.minPlayers = config::ReadIntConfig(node, {"minPlayers"}, criteria.minPlayers);
    criteria.maxPlayers = config::ReadIntConfig(node, {"maxPlayers"}, criteria.maxPlayers);
    criteria.avoidEmpty = config::ReadBoolConfig(node, {"avoidEmpty"}, criteria.avoidEmpty);
    criteria.avoidFull = config::ReadBoolConfig(node, {"avoidFull"}, criteria.avoidFull);
    criteria.monitoringTimeoutMinutes = config::ReadIntConfig(node, {"monitoringTimeoutMinutes"},
                                                              criteria.monitoringTimeoutMinutes);
    criteria.autoStartMonitoring = config::ReadBoolConfig(node, {"autoStartMonitoring"}, criteria.autoStartMonitoring);

    if (criteria.minPlayers > criteria.maxPlayers) {
        spdlog::warn("QuickMatchCriteria: minPlayers {} exceeds maxPlayers {}; swapping",
                     criteria.minPlayers, criteria.maxPlayers);
        std::swap(criteria.minPlayers, criteria.maxPlayers);
    }

    if (auto it = node.find("preferredGameTypes"); it != node.end()) {
        if (!it->is_array()) {
            spdlog::warn("QuickMatchCriteria: 'preferredGameTypes' must be an array");
        } else {
            criteria.preferredGameTypes.clear();
            for (const auto &entry : *it) {
                if (entry.is_number_unsigned()) {
                    criteria.preferredGameTypes.insert(static_cast<GameType>(entry.get<uint32_t>()));
                } else if (entry.is_string()) {
                    if (auto type = ParseGameType(entry.get<std::string>())) {
                        criteria.preferredGameTypes.insert(*type);
                    } else {
                        spdlog::warn("QuickMatchCriteria: Unknown game type '{}'", entry.get<std::string>());
                    }
                } else {
                    spdlog::warn("QuickMatchCriteria: Skipping preferredGameTypes entry {}", entry.dump());
                }
            }
        }
    }

    return criteria;
}

} // namespace odal
