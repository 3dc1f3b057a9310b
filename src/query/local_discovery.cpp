#include "query/local_discovery.hpp"

#include "spdlog/spdlog.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <array>
#include <bitset>

namespace odal {

namespace {
FanOutScheduler::Options schedulerOptions(const LocalDiscovery::Options &options) {
    FanOutScheduler::Options result;
    result.concurrencyLimit = options.maxConcurrent;
    result.progressInterval = 0;
    result.queryTimeout = options.scanTimeout;
    result.singleQueries = true;
    return result;
}

std::optional<std::array<unsigned, 4>> splitOctets(const std::string &address) {
    in_addr parsed{};
    if (inet_pton(AF_INET, address.c_str(), &parsed) != 1) {
        return std::nullopt;
    }
    const uint32_t value = ntohl(parsed.s_addr);
    return std::array<unsigned, 4>{(value >> 24) & 0xFF, (value >> 16) & 0xFF, (value >> 8) & 0xFF, value & 0xFF};
}
} // namespace

LocalDiscovery::LocalDiscovery(GameServerQuerier &querier, ServerRegistry &registry)
    : LocalDiscovery(querier, registry, Options{}) {}

LocalDiscovery::LocalDiscovery(GameServerQuerier &querier, ServerRegistry &registry, Options options)
    : registry(registry), options(options), scheduler(querier, schedulerOptions(options)) {}

LocalDiscovery::~LocalDiscovery() {
    cancelScan();
    if (pending.valid()) {
        pending.wait();
    }
}

bool LocalDiscovery::IsPrivateIPv4(const std::string &address) {
    const auto octets = splitOctets(address);
    if (!octets) {
        return false;
    }
    const auto &parts = *octets;
    if (parts[0] == 10) {
        return true;
    }
    if (parts[0] == 172 && parts[1] >= 16 && parts[1] <= 31) {
        return true;
    }
    if (parts[0] == 192 && parts[1] == 168) {
        return true;
    }
    return parts[0] == 169 && parts[1] == 254;
}

std::vector<LocalDiscovery::NetworkInterface> LocalDiscovery::GetLocalNetworks() {
    std::vector<NetworkInterface> networks;

    ifaddrs *interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        spdlog::warn("LocalDiscovery: Unable to enumerate network interfaces");
        return networks;
    }

    for (ifaddrs *entry = interfaces; entry; entry = entry->ifa_next) {
        if (!entry->ifa_addr || entry->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (entry->ifa_flags & IFF_LOOPBACK) {
            continue;
        }

        char buffer[INET_ADDRSTRLEN] = {0};
        const auto *address = reinterpret_cast<const sockaddr_in *>(entry->ifa_addr);
        inet_ntop(AF_INET, &address->sin_addr, buffer, sizeof(buffer));
        std::string text(buffer);
        if (!IsPrivateIPv4(text)) {
            continue;
        }

        NetworkInterface network;
        network.name = entry->ifa_name ? entry->ifa_name : "";
        network.address = text;
        if (entry->ifa_netmask) {
            const auto *mask = reinterpret_cast<const sockaddr_in *>(entry->ifa_netmask);
            network.prefixLength = static_cast<int>(std::bitset<32>(ntohl(mask->sin_addr.s_addr)).count());
        }
        networks.push_back(std::move(network));
    }

    freeifaddrs(interfaces);
    return networks;
}

std::vector<std::string> LocalDiscovery::HostsForNetwork(const NetworkInterface &network) {
    std::vector<std::string> hosts;
    const auto octets = splitOctets(network.address);
    if (!octets) {
        spdlog::warn("LocalDiscovery: Ignoring malformed interface address '{}'", network.address);
        return hosts;
    }
    const auto &parts = *octets;

    if (network.prefixLength == 24) {
        const std::string base = std::to_string(parts[0]) + "." + std::to_string(parts[1]) + "." + std::to_string(parts[2]) + ".";
        for (int host = 1; host < 255; ++host) {
            hosts.push_back(base + std::to_string(host));
        }
    } else if (network.prefixLength == 16) {
        const std::string base = std::to_string(parts[0]) + "." + std::to_string(parts[1]) + ".";
        for (int subnet = 0; subnet < 2; ++subnet) {
            for (int host = 1; host < 255; ++host) {
                hosts.push_back(base + std::to_string(subnet) + "." + std::to_string(host));
            }
        }
    } else {
        spdlog::warn("LocalDiscovery: Unsupported prefix /{} on {}, only /24 and /16 are scanned",
                     network.prefixLength, network.name.empty() ? network.address : network.name);
    }

    return hosts;
}

std::vector<ServerAddress> LocalDiscovery::BuildScanTargets(const std::vector<NetworkInterface> &networks,
                                                            uint16_t portStart,
                                                            uint16_t portEnd) {
    std::vector<ServerAddress> targets;
    if (portEnd < portStart) {
        return targets;
    }

    for (const auto &network : networks) {
        for (const auto &host : HostsForNetwork(network)) {
            for (uint32_t port = portStart; port <= portEnd; ++port) {
                targets.push_back(ServerAddress{host, static_cast<uint16_t>(port)});
            }
        }
    }
    return targets;
}

void LocalDiscovery::startScan(std::vector<NetworkInterface> networks) {
    if (isScanning()) {
        spdlog::debug("LocalDiscovery: Scan already running");
        return;
    }

    if (networks.empty()) {
        networks = options.networks.empty() ? GetLocalNetworks() : options.networks;
    }
    if (networks.empty()) {
        spdlog::info("LocalDiscovery: No private IPv4 networks found");
    }

    auto targets = BuildScanTargets(networks, options.portStart, options.portEnd);
    spdlog::info("LocalDiscovery: Scanning {} endpoint(s) on {} network(s)", targets.size(), networks.size());

    cancelSource.reset();
    ServerRegistry &target = registry;
    pending = scheduler.queryAll(std::move(targets),
        [&target](const std::vector<ServerInfo> &servers, FanOutScheduler::BatchPhase phase) {
            if (phase != FanOutScheduler::BatchPhase::Final) {
                return;
            }
            for (const auto &server : servers) {
                spdlog::info("LocalDiscovery: Found {} at {}", server.displayName(), server.address.key());
            }
            target.setLocalServers(servers);
        },
        cancelSource.getToken()).share();
}

void LocalDiscovery::cancelScan() {
    cancelSource.cancel();
}

void LocalDiscovery::update(std::chrono::steady_clock::time_point now) {
    if (!options.autoScan) {
        return;
    }
    if (nextScan && now < *nextScan) {
        return;
    }
    nextScan = now + options.rescanInterval;
    if (isScanning()) {
        spdlog::debug("LocalDiscovery: Skipping rescan; previous scan still running");
        return;
    }
    startScan();
}

bool LocalDiscovery::isScanning() const {
    return pending.valid() && pending.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

std::vector<ServerInfo> LocalDiscovery::waitForScan() {
    std::vector<ServerInfo> servers;
    if (!pending.valid()) {
        return servers;
    }
    for (const auto &slot : pending.get()) {
        if (slot) {
            servers.push_back(*slot);
        }
    }
    return servers;
}

} // namespace odal
