#include "client/cli_options.hpp"

#include "cxxopts.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace odal {

namespace {

bool IsValidLogLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return level == "trace" ||
           level == "debug" ||
           level == "info" ||
           level == "warn" ||
           level == "error" ||
           level == "err" ||
           level == "critical" ||
           level == "off";
}

std::string NormalizeLogLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (level == "error") {
        return "err";
    }
    return level;
}

} // namespace

CliOptions ParseCliOptions(int argc, char *argv[]) {
    cxxopts::Options options("odal-query", "Query Odamex master and game servers");
    options.add_options()
        ("m,master", "Query a master server (host[:port]) and every server it lists",
         cxxopts::value<std::string>()->implicit_value(""));
    options.add_options()
        ("s,server", "Query a single game server (ip:port)", cxxopts::value<std::string>());
    options.add_options()
        ("ping", "Ping a game server (ip:port)", cxxopts::value<std::string>());
    options.add_options()
        ("lan", "Scan the local network for servers");
    options.add_options()
        ("q,quick-match", "Refresh, then pick the best server for Quick Match");
    options.add_options()
        ("monitor", "Keep monitoring for a Quick Match until one appears or the timeout passes");
    options.add_options()
        ("watch", "Keep refreshing and report player activity");
    options.add_options()
        ("iwad", "Installed IWAD game id (repeatable, e.g. doom2)", cxxopts::value<std::vector<std::string>>());
    options.add_options()
        ("c,config", "Defaults config file path", cxxopts::value<std::string>()->default_value("data/config.json"));
    options.add_options()
        ("u,user-config", "User config file path", cxxopts::value<std::string>());
    options.add_options()
        ("v,verbose", "Enable verbose logging (alias for --log-level trace)")
        ("L,log-level", "Logging level (trace, debug, info, warn, err, critical, off)", cxxopts::value<std::string>());
    options.add_options()
        ("T,timestamp-logging", "Enable timestamped logging output");
    options.add_options()
        ("h,help", "Show help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    CliOptions parsed;
    parsed.master = result.count("master") ? result["master"].as<std::string>() : std::string();
    parsed.masterRequested = result.count("master") > 0;
    parsed.server = result.count("server") ? result["server"].as<std::string>() : std::string();
    parsed.ping = result.count("ping") ? result["ping"].as<std::string>() : std::string();
    parsed.iwads = result.count("iwad") ? result["iwad"].as<std::vector<std::string>>() : std::vector<std::string>();
    parsed.configPath = result["config"].as<std::string>();
    parsed.userConfigPath = result.count("user-config") ? result["user-config"].as<std::string>() : std::string();
    parsed.lan = result.count("lan") > 0;
    parsed.quickMatch = result.count("quick-match") > 0;
    parsed.monitor = result.count("monitor") > 0;
    parsed.watch = result.count("watch") > 0;
    parsed.verbose = result.count("verbose") > 0;
    parsed.logLevel = result.count("log-level") ? result["log-level"].as<std::string>() : std::string();
    parsed.logLevelExplicit = result.count("log-level") > 0;
    parsed.timestampLogging = result.count("timestamp-logging") > 0;
    if (parsed.logLevelExplicit && !IsValidLogLevel(parsed.logLevel)) {
        std::cerr << "Error: invalid --log-level value '" << parsed.logLevel << "'.\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }
    if (parsed.logLevelExplicit) {
        parsed.logLevel = NormalizeLogLevel(parsed.logLevel);
    }
    if (parsed.monitor) {
        parsed.quickMatch = true;
    }

    const bool anyAction = parsed.masterRequested || !parsed.server.empty() || !parsed.ping.empty()
        || parsed.lan || parsed.quickMatch || parsed.watch;
    if (!anyAction) {
        std::cerr << "Error: nothing to do.\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }

    return parsed;
}

} // namespace odal
