#include "match/matchmaking_engine.hpp"

#include "registry/server_filters.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>

namespace odal {

namespace {
constexpr const char *kEngineWadMarker = "odamex";
constexpr int kPlayerScoreCap = 8;
constexpr int kUnknownPing = 999;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::set<std::string> lowercased(const std::set<std::string> &names) {
    std::set<std::string> result;
    for (const auto &name : names) {
        result.insert(toLower(name));
    }
    return result;
}

bool hasAddress(const ServerInfo &server) {
    return !server.address.ip.empty() && server.address.port != 0;
}

// No non-engine wad means there is nothing to check against the inventory.
bool hasRequiredIwad(const ServerInfo &server, const std::set<std::string> &availableIwads) {
    const auto iwad = PrimaryIwadName(server);
    return !iwad || availableIwads.count(*iwad) > 0;
}

bool hasMatchingIwad(const ServerInfo &server, const std::set<std::string> &availableIwads) {
    const auto iwad = PrimaryIwadName(server);
    return iwad && availableIwads.count(*iwad) > 0;
}

bool isCandidate(const ServerInfo &server,
                 const QuickMatchCriteria &criteria,
                 const std::set<std::string> &availableIwads,
                 const std::optional<VersionTriple> &clientVersion) {
    if (!server.responded || !hasAddress(server)) {
        return false;
    }
    if (server.ping && *server.ping > criteria.maxPing) {
        return false;
    }

    const int totalClients = server.totalClients();
    const int activePlayers = server.activePlayers();

    if (totalClients >= server.maxClients) {
        return false;
    }
    if (criteria.avoidEmpty && totalClients == 0) {
        return false;
    }
    if (criteria.avoidFull && activePlayers >= server.maxPlayers) {
        return false;
    }
    if (activePlayers < criteria.minPlayers || activePlayers > criteria.maxPlayers) {
        return false;
    }
    if (!criteria.preferredGameTypes.empty() && criteria.preferredGameTypes.count(server.gameType) == 0) {
        return false;
    }
    if (!hasRequiredIwad(server, availableIwads)) {
        return false;
    }
    if (server.hasPassword()) {
        return false;
    }
    return IsVersionCompatible(server, clientVersion);
}

double scoreOf(const ServerInfo &server) {
    const int players = std::min(server.activePlayers(), kPlayerScoreCap);
    return players * 10.0 - server.ping.value_or(kUnknownPing) / 10.0;
}

std::string noMatchReason(const std::vector<const ServerInfo *> &servers,
                          const QuickMatchCriteria &criteria,
                          const std::set<std::string> &availableIwads) {
    if (servers.empty()) {
        return "No servers are currently available.";
    }

    const auto any = [&](auto predicate) {
        return std::any_of(servers.begin(), servers.end(), [&](const ServerInfo *server) {
            return predicate(*server);
        });
    };

    if (!any([](const ServerInfo &server) { return !server.players.empty(); })) {
        return "No servers have active players right now.";
    }
    if (!any([&](const ServerInfo &server) { return hasMatchingIwad(server, availableIwads); })) {
        return "No servers match your installed IWADs.";
    }
    if (!any([](const ServerInfo &server) { return !server.hasPassword(); })) {
        return "All active servers are password-protected.";
    }
    if (!any([&](const ServerInfo &server) { return !server.ping || *server.ping <= criteria.maxPing; })) {
        return "No servers with ping under " + std::to_string(criteria.maxPing) + "ms.";
    }
    return "No servers match your criteria. Try browsing all servers.";
}
} // namespace

const char *MatchStateName(MatchState state) {
    switch (state) {
        case MatchState::Idle:
            return "idle";
        case MatchState::Searching:
            return "searching";
        case MatchState::Found:
            return "found";
        case MatchState::NoMatch:
            return "no-match";
        case MatchState::Monitoring:
            return "monitoring";
    }
    return "unknown";
}

std::optional<std::string> PrimaryIwadName(const ServerInfo &server) {
    for (const auto &wad : server.wads) {
        std::string name = toLower(wad.name);
        if (name.find(kEngineWadMarker) != std::string::npos) {
            continue;
        }
        if (const auto dot = name.rfind('.'); dot != std::string::npos && dot > 0) {
            name.erase(dot);
        }
        return name;
    }
    return std::nullopt;
}

MatchResult FindBestMatch(const std::vector<ServerInfo> &servers,
                          const QuickMatchCriteria &criteria,
                          const std::set<std::string> &availableIwads,
                          const std::optional<VersionTriple> &clientVersion) {
    const std::set<std::string> iwads = lowercased(availableIwads);

    const ServerInfo *best = nullptr;
    double bestScore = 0.0;
    std::vector<const ServerInfo *> responded;
    responded.reserve(servers.size());

    for (const auto &server : servers) {
        if (!server.responded) {
            continue;
        }
        responded.push_back(&server);
        if (!isCandidate(server, criteria, iwads, clientVersion)) {
            continue;
        }
        const double score = scoreOf(server);
        if (!best || score > bestScore) {
            best = &server;
            bestScore = score;
        }
    }

    MatchResult result;
    if (best) {
        result.server = *best;
    } else {
        result.reason = noMatchReason(responded, criteria, iwads);
    }
    return result;
}

MatchmakingEngine::MatchmakingEngine(const ServerRegistry &registry, const IwadInventory &iwads)
    : MatchmakingEngine(registry, iwads, QuickMatchCriteria{}) {}

MatchmakingEngine::MatchmakingEngine(const ServerRegistry &registry,
                                     const IwadInventory &iwads,
                                     QuickMatchCriteria criteria)
    : registry(registry), iwads(iwads), criteria(std::move(criteria)) {}

void MatchmakingEngine::setCriteria(QuickMatchCriteria newCriteria) {
    criteria = std::move(newCriteria);
}

void MatchmakingEngine::setClientVersion(std::optional<VersionTriple> version) {
    clientVersion = version;
}

void MatchmakingEngine::setNotificationSink(NotificationSink *sink) {
    notificationSink = sink;
}

void MatchmakingEngine::setConnectSink(ConnectSink *sink) {
    connectSink = sink;
}

MatchResult MatchmakingEngine::findBestMatch() const {
    const auto servers = registry.getServers();
    return FindBestMatch(*servers, criteria, iwads.availableGameIds(), clientVersion);
}

MatchResult MatchmakingEngine::quickMatch(Clock::time_point now) {
    if (state == MatchState::Monitoring) {
        stopMonitoring();
    }

    state = MatchState::Searching;
    matchFound.reset();

    MatchResult result = findBestMatch();
    if (result.server) {
        spdlog::info("MatchmakingEngine: Quick Match picked {} ({})",
                     result.server->displayName(), result.server->address.key());
        state = MatchState::Found;
        matchFound = result.server;
        lastReason.clear();
        return result;
    }

    spdlog::info("MatchmakingEngine: No match: {}", result.reason);
    state = MatchState::NoMatch;
    lastReason = result.reason;
    if (criteria.autoStartMonitoring) {
        startMonitoring(now);
    }
    return result;
}

void MatchmakingEngine::startMonitoring(Clock::time_point now) {
    if (state == MatchState::Monitoring) {
        return;
    }

    state = MatchState::Monitoring;
    monitoringStart = now;
    matchFound.reset();
    spdlog::info("MatchmakingEngine: Monitoring for a match (timeout {} min)", criteria.monitoringTimeoutMinutes);

    checkForMatch(now);
}

void MatchmakingEngine::stopMonitoring() {
    nextCheck.reset();
    monitoringStart.reset();
    matchFound.reset();
    if (state == MatchState::Monitoring || state == MatchState::Found) {
        spdlog::debug("MatchmakingEngine: Monitoring stopped");
        state = MatchState::Idle;
    }
}

void MatchmakingEngine::update(Clock::time_point now) {
    if (state != MatchState::Monitoring || !nextCheck || now < *nextCheck) {
        return;
    }
    checkForMatch(now);
}

void MatchmakingEngine::checkForMatch(Clock::time_point now) {
    if (criteria.monitoringTimeoutMinutes > 0 && monitoringStart) {
        const auto timeout = std::chrono::minutes(criteria.monitoringTimeoutMinutes);
        if (now - *monitoringStart > timeout) {
            spdlog::info("MatchmakingEngine: Monitoring timed out after {} min", criteria.monitoringTimeoutMinutes);
            stopMonitoring();
            return;
        }
    }

    MatchResult result = findBestMatch();
    if (!result.server) {
        lastReason = result.reason;
        nextCheck = now + kMonitorInterval;
        return;
    }

    nextCheck.reset();
    monitoringStart.reset();
    state = MatchState::Found;
    matchFound = result.server;
    lastReason.clear();
    spdlog::info("MatchmakingEngine: Match found while monitoring: {}", matchFound->displayName());
    notifyMatch(*matchFound);
}

void MatchmakingEngine::notifyMatch(const ServerInfo &server) {
    if (!notificationSink) {
        return;
    }
    std::string body = server.displayName() + " (" + std::to_string(server.activePlayers()) + " players";
    if (server.ping) {
        body += ", " + std::to_string(*server.ping) + "ms";
    }
    body += ")";
    notificationSink->notify("Match Found", body, true);
}

bool MatchmakingEngine::acceptMatch() {
    if (state != MatchState::Found || !matchFound) {
        return false;
    }
    if (!connectSink) {
        spdlog::warn("MatchmakingEngine: No connect handler for {}", matchFound->address.key());
        return false;
    }
    connectSink->connect(*matchFound);
    state = MatchState::Idle;
    matchFound.reset();
    return true;
}

} // namespace odal
