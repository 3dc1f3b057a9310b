#pragma once

#include "protocol/odalpapi.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace odal {

struct ActivityReport {
    std::vector<std::string> messages;
    // A known server's player count changed.
    bool activityDetected = false;
};

struct ActivityNotification {
    std::string title;
    std::string body;
    bool flash = false;
};

// Remembers the player count per server across refresh cycles and describes
// what changed since the previous cycle.
class ActivityDetector {
public:
    ActivityReport detect(const std::vector<ServerInfo> &servers);
    void reset();

    std::size_t trackedServerCount() const {
        return previousSnapshot.size();
    }

private:
    std::unordered_map<std::string, int> previousSnapshot;
};

constexpr std::size_t kNotificationPreviewLines = 3;

std::optional<ActivityNotification> BuildActivityNotification(const ActivityReport &report);

} // namespace odal
