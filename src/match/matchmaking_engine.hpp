#pragma once

#include "match/collaborators.hpp"
#include "match/match_criteria.hpp"
#include "registry/server_registry.hpp"

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace odal {

enum class MatchState {
    Idle,
    Searching,
    Found,
    NoMatch,
    Monitoring
};

const char *MatchStateName(MatchState state);

struct MatchResult {
    std::optional<ServerInfo> server;
    // Set when server is empty.
    std::string reason;
};

// First wad not belonging to the engine, lowercased, extension stripped.
std::optional<std::string> PrimaryIwadName(const ServerInfo &server);

MatchResult FindBestMatch(const std::vector<ServerInfo> &servers,
                          const QuickMatchCriteria &criteria,
                          const std::set<std::string> &availableIwads,
                          const std::optional<VersionTriple> &clientVersion = std::nullopt);

// Quick Match against the live registry, plus the polled monitoring loop
// that keeps looking until a match appears or the timeout passes.
class MatchmakingEngine {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::seconds kMonitorInterval{30};

    MatchmakingEngine(const ServerRegistry &registry, const IwadInventory &iwads);
    MatchmakingEngine(const ServerRegistry &registry, const IwadInventory &iwads, QuickMatchCriteria criteria);

    void setCriteria(QuickMatchCriteria criteria);
    const QuickMatchCriteria &getCriteria() const {
        return criteria;
    }
    void setClientVersion(std::optional<VersionTriple> version);
    void setNotificationSink(NotificationSink *sink);
    void setConnectSink(ConnectSink *sink);

    MatchResult findBestMatch() const;

    MatchResult quickMatch(Clock::time_point now = Clock::now());
    void startMonitoring(Clock::time_point now = Clock::now());
    // Drops any found match and returns to Idle.
    void stopMonitoring();
    // Runs a monitoring check when one is due.
    void update(Clock::time_point now = Clock::now());
    // Hands the found server to the connect sink.
    bool acceptMatch();

    MatchState getState() const {
        return state;
    }
    bool isMonitoring() const {
        return state == MatchState::Monitoring;
    }
    const std::optional<ServerInfo> &getMatchFound() const {
        return matchFound;
    }
    const std::string &getLastReason() const {
        return lastReason;
    }
    std::optional<Clock::time_point> getMonitoringStartTime() const {
        return monitoringStart;
    }

private:
    void checkForMatch(Clock::time_point now);
    void notifyMatch(const ServerInfo &server);

    const ServerRegistry &registry;
    const IwadInventory &iwads;
    QuickMatchCriteria criteria;
    std::optional<VersionTriple> clientVersion;
    NotificationSink *notificationSink = nullptr;
    ConnectSink *connectSink = nullptr;

    MatchState state = MatchState::Idle;
    std::optional<ServerInfo> matchFound;
    std::string lastReason;
    std::optional<Clock::time_point> monitoringStart;
    std::optional<Clock::time_point> nextCheck;
};

} // namespace odal
