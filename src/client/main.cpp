#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"
#include "client/cli_options.hpp"
#include "client/config_client.hpp"
#include "client/server_refresher.hpp"
#include "match/matchmaking_engine.hpp"
#include "query/discovery_client.hpp"
#include "query/local_discovery.hpp"
#include "registry/server_registry.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

constexpr auto kLoopTick = std::chrono::milliseconds(250);

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

class ConsoleNotificationSink : public odal::NotificationSink {
public:
    void notify(const std::string &title, const std::string &body, bool flashRequested) override {
        std::cout << (flashRequested ? "** " : "") << title << "\n" << body << std::endl;
    }
};

class ConsoleConnectSink : public odal::ConnectSink {
public:
    void connect(const odal::ServerInfo &server) override {
        std::cout << "connect " << server.address.key() << std::endl;
    }
};

void PrintServerTable(const std::vector<odal::ServerInfo> &servers) {
    std::cout << fmt::format("{:<22} {:>5} {:>7} {:<18} {:<10} {}\n", "ADDRESS", "PING", "PLAYERS", "MODE", "MAP", "NAME");
    for (const auto &server : servers) {
        const std::string ping = server.ping ? std::to_string(*server.ping) : "-";
        const std::string players = std::to_string(server.activePlayers()) + "/" + std::to_string(server.maxPlayers);
        std::cout << fmt::format("{:<22} {:>5} {:>7} {:<18} {:<10} {}\n",
                                 server.address.key(), ping, players,
                                 odal::GameTypeName(server.gameType),
                                 server.currentMap.value_or("-"), server.displayName());
    }
    std::cout << servers.size() << " server(s)" << std::endl;
}

void PrintServerDetails(const odal::ServerInfo &server) {
    std::cout << server.displayName() << " (" << server.address.key() << ")\n";
    std::cout << "  version   " << server.versionMajor << "." << server.versionMinor << "." << server.versionPatch;
    if (!server.versionRevision.empty()) {
        std::cout << " " << server.versionRevision;
    }
    std::cout << "\n  mode      " << odal::GameTypeName(server.gameType) << "\n";
    std::cout << "  map       " << server.currentMap.value_or("-") << "\n";
    std::cout << "  players   " << server.activePlayers() << "/" << server.maxPlayers
              << " (" << server.totalClients() << "/" << server.maxClients << " clients)\n";
    if (server.ping) {
        std::cout << "  ping      " << *server.ping << "ms\n";
    }
    if (server.hasPassword()) {
        std::cout << "  password  required\n";
    }
    for (const auto &wad : server.wads) {
        std::cout << "  wad       " << wad.name << " " << wad.hash << "\n";
    }
    for (const auto &team : server.teams) {
        std::cout << "  team      " << team.name << " score " << team.score << "\n";
    }
    for (const auto &player : server.players) {
        std::cout << "  player    " << player.name << " frags " << player.frags << " ping " << player.ping
                  << (player.spectator ? " (spectating)" : "") << "\n";
    }
    std::cout << std::flush;
}

std::optional<odal::ServerAddress> ParseAddressArgument(const std::string &text, uint16_t defaultPort) {
    std::string error;
    auto address = odal::ParseServerAddress(text, defaultPort, &error);
    if (!address) {
        spdlog::error("{}", error);
    }
    return address;
}

std::set<std::string> LowercaseIds(const std::vector<std::string> &ids) {
    std::set<std::string> result;
    for (std::string id : ids) {
        std::transform(id.begin(), id.end(), id.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        result.insert(id);
    }
    return result;
}

bool WaitForRefresh(odal::ServerRefresher &refresher) {
    while (g_running) {
        if (refresher.waitForRefresh(kLoopTick)) {
            return true;
        }
    }
    refresher.cancelRefresh();
    return false;
}

} // namespace

spdlog::level::level_enum ParseLogLevel(const std::string &level) {
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn") {
        return spdlog::level::warn;
    }
    if (level == "err") {
        return spdlog::level::err;
    }
    if (level == "critical") {
        return spdlog::level::critical;
    }
    if (level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

void ConfigureLogging(spdlog::level::level_enum level, bool includeTimestamp) {
    if (includeTimestamp) {
        spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    } else {
        spdlog::set_pattern("[%^%l%$] %v");
    }
    spdlog::set_level(level);
}

int main(int argc, char *argv[]) {
    ConfigureLogging(spdlog::level::info, false);

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    const odal::CliOptions cliOptions = odal::ParseCliOptions(argc, argv);
    spdlog::level::level_enum logLevel = spdlog::level::info;
    if (cliOptions.verbose) {
        logLevel = spdlog::level::trace;
    } else if (cliOptions.logLevelExplicit) {
        logLevel = ParseLogLevel(cliOptions.logLevel);
    }
    ConfigureLogging(logLevel, cliOptions.timestampLogging);

    odal::ClientConfig config = odal::ClientConfig::Load(cliOptions.configPath, cliOptions.userConfigPath);
    if (!cliOptions.master.empty()) {
        auto master = ParseAddressArgument(cliOptions.master, odal::DEFAULT_MASTER_PORT);
        if (!master) {
            return 1;
        }
        config.masters = {*master};
    }

    odal::DiscoveryClient::Options clientOptions;
    clientOptions.pingDivisorBatch = config.pingDivisorBatch;
    clientOptions.pingDivisorSingle = config.pingDivisorSingle;
    odal::DiscoveryClient client(clientOptions);
    odal::ServerRegistry registry;
    int exitCode = 0;

    if (!cliOptions.ping.empty()) {
        auto address = ParseAddressArgument(cliOptions.ping, 0);
        if (!address) {
            return 1;
        }
        try {
            const int pingMs = client.pingGameServer(*address, std::chrono::milliseconds(config.pingTimeoutMs)).get();
            std::cout << address->key() << " " << pingMs << "ms" << std::endl;
        } catch (const odal::QueryError &e) {
            spdlog::error("{}", e.what());
            exitCode = 1;
        }
    }

    if (!cliOptions.server.empty()) {
        auto address = ParseAddressArgument(cliOptions.server, 0);
        if (!address) {
            return 1;
        }
        try {
            auto reply = client.queryGameServer(*address, true, std::chrono::milliseconds(config.queryTimeoutMs)).get();
            if (!reply.server.responded) {
                spdlog::error("{}", reply.failure ? reply.failure->message : "Server sent an unreadable response");
                exitCode = 1;
            } else {
                reply.server.ping = reply.pongMs;
                PrintServerDetails(reply.server);
            }
        } catch (const odal::QueryError &e) {
            spdlog::error("{}", e.what());
            exitCode = 1;
        }
    }

    if (cliOptions.lan) {
        odal::LocalDiscovery lan(client, registry, config.localDiscovery);
        lan.startScan();
        while (g_running && lan.isScanning()) {
            std::this_thread::sleep_for(kLoopTick);
        }
        if (!g_running) {
            lan.cancelScan();
        }
        lan.waitForScan();
        PrintServerTable(*registry.getLocalServers());
    }

    if (!cliOptions.masterRequested && !cliOptions.quickMatch && !cliOptions.watch) {
        return exitCode;
    }

    ConsoleNotificationSink notificationSink;
    ConsoleConnectSink connectSink;
    auto refresherOptions = odal::ServerRefresher::OptionsFromConfig(config);
    if (cliOptions.watch || cliOptions.monitor) {
        refresherOptions.autoRefresh = true;
    }
    odal::ServerRefresher refresher(client, registry, refresherOptions);
    if (cliOptions.watch) {
        refresher.setNotificationSink(&notificationSink);
    }

    refresher.requestRefresh();
    if (!WaitForRefresh(refresher)) {
        return exitCode;
    }
    if (auto error = registry.getError()) {
        spdlog::error("{}", *error);
        exitCode = 1;
    }

    if (cliOptions.masterRequested) {
        PrintServerTable(*registry.getServers());
    }

    if (cliOptions.quickMatch) {
        odal::StaticIwadInventory inventory(LowercaseIds(cliOptions.iwads));
        odal::QuickMatchCriteria criteria = config.quickMatch;
        criteria.autoStartMonitoring = cliOptions.monitor;
        odal::MatchmakingEngine engine(registry, inventory, criteria);
        engine.setClientVersion(config.filters.clientVersion);
        engine.setNotificationSink(&notificationSink);
        engine.setConnectSink(&connectSink);

        auto result = engine.quickMatch();
        if (result.server) {
            PrintServerDetails(*result.server);
            engine.acceptMatch();
        } else {
            std::cout << result.reason << std::endl;
        }

        while (g_running && engine.isMonitoring()) {
            refresher.update();
            engine.update();
            std::this_thread::sleep_for(kLoopTick);
        }

        if (engine.getState() == odal::MatchState::Found) {
            engine.acceptMatch();
        } else if (!result.server) {
            exitCode = 1;
        }
    }

    if (cliOptions.watch) {
        odal::LocalDiscovery lan(client, registry, config.localDiscovery);
        if (config.localDiscovery.autoScan) {
            spdlog::info("Rescanning the local network every {}s",
                         config.localDiscovery.rescanInterval.count());
        }
        while (g_running) {
            refresher.update();
            lan.update();
            std::this_thread::sleep_for(kLoopTick);
        }
        lan.cancelScan();
    }

    return exitCode;
}
