#include "registry/activity_detector.hpp"

#include <cstdlib>

namespace odal {

ActivityReport ActivityDetector::detect(const std::vector<ServerInfo> &servers) {
    ActivityReport report;

    for (const auto &server : servers) {
        const std::string key = server.address.key();
        const int currentPlayers = server.totalClients();

        auto it = previousSnapshot.find(key);
        if (it == previousSnapshot.end()) {
            if (currentPlayers > 0) {
                report.messages.push_back("New server: " + server.displayName() + " ("
                                          + std::to_string(currentPlayers) + " players)");
            }
            previousSnapshot.emplace(key, currentPlayers);
            continue;
        }

        if (it->second != currentPlayers) {
            report.activityDetected = true;
            const int change = currentPlayers - it->second;
            report.messages.push_back(server.displayName() + ": " + std::to_string(std::abs(change))
                                      + " player(s) " + (change > 0 ? "joined" : "left"));
        }
        it->second = currentPlayers;
    }

    return report;
}

void ActivityDetector::reset() {
    previousSnapshot.clear();
}

std::optional<ActivityNotification> BuildActivityNotification(const ActivityReport &report) {
    if (report.messages.empty()) {
        return std::nullopt;
    }

    ActivityNotification notification;
    const std::size_t count = report.messages.size();
    notification.title = count == 1 ? "Server Activity" : "Server Activity (" + std::to_string(count) + ")";

    for (std::size_t i = 0; i < count && i < kNotificationPreviewLines; ++i) {
        if (i > 0) {
            notification.body += '\n';
        }
        notification.body += report.messages[i];
    }
    if (count > kNotificationPreviewLines) {
        notification.body += "\n... and " + std::to_string(count - kNotificationPreviewLines) + " more";
    }

    notification.flash = true;
    return notification;
}

} // namespace odal
