#include "client/config_client.hpp"

#include "common/config_helpers.hpp"
#include "common/config_store.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <sstream>

namespace odal {

namespace {

void appendMaster(ClientConfig &config, const std::string &text) {
    std::string error;
    if (auto address = ParseServerAddress(text, DEFAULT_MASTER_PORT, &error)) {
        if (std::find(config.masters.begin(), config.masters.end(), *address) == config.masters.end()) {
            config.masters.push_back(*address);
        }
    } else {
        spdlog::warn("ClientConfig::Load: Ignoring master '{}': {}", text, error);
    }
}

void parseMasters(ClientConfig &config, const json::Value &root) {
    if (auto master = config::ConfigValueString(root, "network.master")) {
        appendMaster(config, *master);
    }

    if (const auto *masters = config::ResolveConfigPath(root, "network.masters")) {
        if (!masters->is_array()) {
            spdlog::warn("ClientConfig::Load: 'network.masters' must be an array");
        } else {
            for (const auto &entry : *masters) {
                if (entry.is_string()) {
                    appendMaster(config, entry.get<std::string>());
                }
            }
        }
    }

    if (config.masters.empty()) {
        config.masters.push_back(ServerAddress{DEFAULT_MASTER_HOST, DEFAULT_MASTER_PORT});
    }
}

void parseFilters(ClientConfig &config, const json::Value &root) {
    config.filters.hideEmpty = config::ReadBoolConfig(root, {"filters.hideEmpty"}, false);
    config.filters.maxPing = config::ReadIntConfig(root, {"filters.maxPing"}, 0);
    config.filters.byVersion = config::ReadBoolConfig(root, {"filters.byVersion"}, false);

    if (auto versionText = config::ConfigValueString(root, "filters.clientVersion")) {
        if (auto version = ParseVersionString(*versionText)) {
            config.filters.clientVersion = version;
        } else {
            spdlog::warn("ClientConfig::Load: 'filters.clientVersion' is not a version: {}", *versionText);
        }
    }
}

void parseLocalDiscovery(ClientConfig &config, const json::Value &root) {
    auto &options = config.localDiscovery;
    options.autoScan = config::ReadBoolConfig(root, {"localDiscovery.enabled"}, options.autoScan);
    options.portStart = config::ReadUInt16Config(root, {"localDiscovery.portStart"}, options.portStart);
    options.portEnd = config::ReadUInt16Config(root, {"localDiscovery.portEnd"}, options.portEnd);
    if (options.portEnd < options.portStart) {
        spdlog::warn("ClientConfig::Load: localDiscovery port range {}-{} is empty; using {}",
                     options.portStart, options.portEnd, options.portStart);
        options.portEnd = options.portStart;
    }
    options.scanTimeout = std::chrono::milliseconds(
        config::ReadIntConfig(root, {"localDiscovery.timeoutMs"}, static_cast<int>(options.scanTimeout.count()), 1));
    options.maxConcurrent = static_cast<std::size_t>(
        config::ReadIntConfig(root, {"localDiscovery.maxConcurrent"}, static_cast<int>(options.maxConcurrent), 1));
    options.rescanInterval = std::chrono::seconds(
        config::ReadIntConfig(root, {"localDiscovery.refreshSeconds"}, static_cast<int>(options.rescanInterval.count()), 1));
}

} // namespace

std::optional<VersionTriple> ParseVersionString(const std::string &text) {
    std::istringstream stream(text);
    VersionTriple version;
    char dot = 0;
    if (!(stream >> version.major >> dot >> version.minor) || dot != '.') {
        return std::nullopt;
    }
    if (stream >> dot) {
        if (dot != '.' || !(stream >> version.patch)) {
            return std::nullopt;
        }
    }
    return version;
}

ClientConfig ClientConfig::FromJson(const json::Value &root) {
    ClientConfig config;
    if (!root.is_object()) {
        spdlog::warn("ClientConfig::Load: Configuration root is not a JSON object");
        parseMasters(config, json::Object());
        return config;
    }

    parseMasters(config, root);
    config.masterTimeoutMs = config::ReadIntConfig(root, {"network.masterTimeoutMs", "network.queryTimeoutMs"}, config.masterTimeoutMs, 1);
    config.queryTimeoutMs = config::ReadIntConfig(root, {"network.queryTimeoutMs"}, config.queryTimeoutMs, 1);
    config.pingTimeoutMs = config::ReadIntConfig(root, {"network.pingTimeoutMs"}, config.pingTimeoutMs, 1);
    config.concurrency = config::ReadIntConfig(root, {"network.concurrency"}, config.concurrency, 1);
    config.progressInterval = config::ReadIntConfig(root, {"network.progressInterval"}, config.progressInterval);
    config.pingDivisorBatch = config::ReadIntConfig(root, {"network.pingDivisor.batch"}, config.pingDivisorBatch, 1);
    config.pingDivisorSingle = config::ReadIntConfig(root, {"network.pingDivisor.single"}, config.pingDivisorSingle, 1);

    config.autoRefresh = config::ReadBoolConfig(root, {"refresh.autoRefresh"}, config.autoRefresh);
    config.refreshIntervalMinutes = config::ReadIntConfig(root, {"refresh.intervalMinutes"}, config.refreshIntervalMinutes, 1);

    parseFilters(config, root);
    parseLocalDiscovery(config, root);

    if (auto it = root.find("quickMatch"); it != root.end()) {
        config.quickMatch = ParseQuickMatchCriteria(*it);
    }

    config.notifications.enabled = config::ReadBoolConfig(root, {"notifications.enabled"}, config.notifications.enabled);
    config.notifications.serverActivity = config::ReadBoolConfig(root, {"notifications.serverActivity"},
                                                                 config.notifications.serverActivity);
    config.notifications.flash = config::ReadBoolConfig(root, {"notifications.flash"}, config.notifications.flash);

    return config;
}

ClientConfig ClientConfig::Load(const std::string &defaultsPath, const std::string &userPath) {
    json::Value merged = json::Object();

    if (!defaultsPath.empty()) {
        if (auto defaults = config::LoadJsonFile(defaultsPath, "client defaults", spdlog::level::warn)) {
            if (!defaults->is_object()) {
                spdlog::warn("ClientConfig::Load: {} is not a JSON object", defaultsPath);
            } else {
                config::MergeJsonObjects(merged, *defaults);
            }
        }
    }

    if (!userPath.empty()) {
        if (auto user = config::LoadJsonFile(userPath, "user config", spdlog::level::debug)) {
            if (!user->is_object()) {
                spdlog::warn("ClientConfig::Load: User config at {} is not a JSON object", userPath);
            } else {
                config::MergeJsonObjects(merged, *user);
            }
        }
    }

    return FromJson(merged);
}

} // namespace odal
