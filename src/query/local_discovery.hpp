#pragma once

#include "common/cancellation.hpp"
#include "query/fan_out_scheduler.hpp"
#include "registry/server_registry.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace odal {

// Finds servers on the local network by querying every host of each private
// IPv4 subnet the machine is attached to over a small port range.
class LocalDiscovery {
public:
    struct NetworkInterface {
        std::string name;
        std::string address;
        int prefixLength = 24;
    };

    struct Options {
        uint16_t portStart = 10666;
        uint16_t portEnd = 10675;
        std::chrono::milliseconds scanTimeout{200};
        std::size_t maxConcurrent = 50;
        // Periodic rescans driven by update().
        bool autoScan = false;
        std::chrono::seconds rescanInterval{60};
        // Scanned when startScan() gets no networks; empty means the machine's own.
        std::vector<NetworkInterface> networks;
    };

    LocalDiscovery(GameServerQuerier &querier, ServerRegistry &registry);
    LocalDiscovery(GameServerQuerier &querier, ServerRegistry &registry, Options options);
    ~LocalDiscovery();

    LocalDiscovery(const LocalDiscovery &) = delete;
    LocalDiscovery &operator=(const LocalDiscovery &) = delete;

    static bool IsPrivateIPv4(const std::string &address);
    static std::vector<NetworkInterface> GetLocalNetworks();
    // /24 covers .1-.254; /16 covers the x.y.0.* and x.y.1.* ranges only.
    static std::vector<std::string> HostsForNetwork(const NetworkInterface &network);
    static std::vector<ServerAddress> BuildScanTargets(const std::vector<NetworkInterface> &networks,
                                                       uint16_t portStart,
                                                       uint16_t portEnd);

    // Scans the given networks, or the machine's own when empty. Results
    // replace the registry's LAN list once the scan finishes uncancelled.
    void startScan(std::vector<NetworkInterface> networks = {});
    void cancelScan();
    // With autoScan on, scans on the first call and then once per rescan interval.
    void update(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
    bool isScanning() const;
    // Blocks until the running scan (if any) settles; returns the servers found.
    std::vector<ServerInfo> waitForScan();

    const Options &getOptions() const {
        return options;
    }

private:
    ServerRegistry &registry;
    Options options;
    FanOutScheduler scheduler;
    CancellationSource cancelSource;
    std::shared_future<FanOutScheduler::Results> pending;
    std::optional<std::chrono::steady_clock::time_point> nextScan;
};

} // namespace odal
