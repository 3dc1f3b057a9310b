#include "serverregistrytest.h"

#include "registry/server_filters.hpp"
#include "registry/server_registry.hpp"

using namespace odal;

namespace {
ServerInfo makeServer(const std::string &ip, uint16_t port, int players = 0, std::optional<int> ping = std::nullopt) {
    ServerInfo server;
    server.address = ServerAddress{ip, port};
    server.name = "Server " + ip;
    server.responded = true;
    server.versionMajor = 0;
    server.versionMinor = 9;
    server.ping = ping;
    for (int i = 0; i < players; ++i) {
        Player player;
        player.name = "player" + std::to_string(i);
        server.players.push_back(player);
    }
    return server;
}
} // namespace

void ServerRegistryTest::test_setServersClearsLoadingAndError() {
    ServerRegistry registry;
    QVERIFY(!registry.getLastUpdated());
    registry.setLoading(true);
    registry.setError("No servers returned from master server");
    QVERIFY(!registry.isLoading());
    QCOMPARE(registry.getError().value_or(""), std::string("No servers returned from master server"));

    registry.setLoading(true);
    const std::size_t before = registry.getGeneration();
    registry.setServers({makeServer("1.1.1.1", 10666)});

    QVERIFY(!registry.isLoading());
    QVERIFY(!registry.getError());
    QVERIFY(registry.getLastUpdated());
    QVERIFY(registry.getGeneration() > before);

    registry.setError("boom");
    registry.setLocalServers({makeServer("192.168.1.5", 10666)});
    QVERIFY(!registry.getError());
    QVERIFY(registry.getLocalLastUpdated());
}

void ServerRegistryTest::test_setServersDedupesByAddress() {
    ServerRegistry registry;
    auto first = makeServer("1.1.1.1", 10666, 1);
    auto duplicate = makeServer("1.1.1.1", 10666, 4);
    registry.setServers({first, makeServer("1.1.1.1", 10667), duplicate});

    const auto servers = registry.getServers();
    QCOMPARE(servers->size(), static_cast<std::size_t>(2));
    QCOMPARE((*servers)[0].totalClients(), 4);
}

void ServerRegistryTest::test_snapshotsAreImmutable() {
    ServerRegistry registry;
    registry.setServers({makeServer("1.1.1.1", 10666, 0, 80)});
    const auto before = registry.getServers();

    registry.updateServerPing(ServerAddress{"1.1.1.1", 10666}, 20);
    const auto after = registry.getServers();

    QVERIFY(before != after);
    QCOMPARE((*before)[0].ping.value_or(-1), 80);
    QCOMPARE((*after)[0].ping.value_or(-1), 20);
}

void ServerRegistryTest::test_updateServerPingPatchesBothLists() {
    ServerRegistry registry;
    const ServerAddress shared{"192.168.1.20", 10666};
    registry.setServers({makeServer(shared.ip, shared.port), makeServer("2.2.2.2", 10666, 0, 99)});
    registry.setLocalServers({makeServer(shared.ip, shared.port)});

    registry.updateServerPing(shared, 33);

    QCOMPARE((*registry.getServers())[0].ping.value_or(-1), 33);
    QCOMPARE((*registry.getServers())[1].ping.value_or(-1), 99);
    QCOMPARE((*registry.getLocalServers())[0].ping.value_or(-1), 33);
}

void ServerRegistryTest::test_updateServerPingUnknownAddress() {
    ServerRegistry registry;
    registry.setServers({makeServer("1.1.1.1", 10666, 0, 50)});
    const auto before = registry.getServers();
    const std::size_t generation = registry.getGeneration();

    registry.updateServerPing(ServerAddress{"9.9.9.9", 10666}, 10);

    QVERIFY(registry.getServers() == before);
    QCOMPARE(registry.getGeneration(), generation);
    QVERIFY(!registry.findServer(ServerAddress{"9.9.9.9", 10666}));
}

void ServerRegistryTest::test_findServerAndCounts() {
    ServerRegistry registry;
    registry.setServers({makeServer("1.1.1.1", 10666, 3), makeServer("2.2.2.2", 10666, 2)});
    registry.setLocalServers({makeServer("192.168.0.9", 10667, 1)});

    QCOMPARE(registry.serverCount(), static_cast<std::size_t>(2));
    QCOMPARE(registry.localServerCount(), static_cast<std::size_t>(1));
    QCOMPARE(registry.playerCount(), static_cast<std::size_t>(5));

    const auto local = registry.findServer(ServerAddress{"192.168.0.9", 10667});
    QVERIFY(local);
    QCOMPARE(local->totalClients(), 1);
}

void ServerRegistryTest::test_reset() {
    ServerRegistry registry;
    registry.setServers({makeServer("1.1.1.1", 10666)});
    registry.setLocalServers({makeServer("192.168.0.9", 10667)});
    registry.reset();

    QCOMPARE(registry.serverCount(), static_cast<std::size_t>(0));
    QCOMPARE(registry.localServerCount(), static_cast<std::size_t>(0));
    QVERIFY(!registry.getLastUpdated());
    QVERIFY(!registry.getError());
}

void ServerRegistryTest::test_visibilityFilter() {
    std::vector<ServerInfo> servers = {
        makeServer("1.1.1.1", 10666, 0, 20),
        makeServer("2.2.2.2", 10666, 3, 250),
        makeServer("3.3.3.3", 10666, 2, 40),
        makeServer("4.4.4.4", 10666, 1),
    };

    VisibilityFilter none;
    QCOMPARE(ApplyVisibilityFilter(servers, none).size(), static_cast<std::size_t>(4));

    VisibilityFilter filter;
    filter.hideEmpty = true;
    filter.maxPing = 100;
    const auto visible = ApplyVisibilityFilter(servers, filter);
    QCOMPARE(visible.size(), static_cast<std::size_t>(2));
    QCOMPARE(visible[0].address.ip, std::string("3.3.3.3"));
    // Unknown ping passes the ceiling.
    QCOMPARE(visible[1].address.ip, std::string("4.4.4.4"));
}

void ServerRegistryTest::test_versionCompatibility() {
    const VersionTriple client{0, 9, 0};
    ServerInfo server = makeServer("1.1.1.1", 10666);

    QVERIFY(IsVersionCompatible(server, client));
    server.versionMinor = 8;
    QVERIFY(IsVersionCompatible(server, client));
    server.versionMinor = 10;
    QVERIFY(!IsVersionCompatible(server, client));
    server.versionMajor = 1;
    server.versionMinor = 0;
    QVERIFY(!IsVersionCompatible(server, client));
    QVERIFY(IsVersionCompatible(server, std::nullopt));

    VisibilityFilter filter;
    filter.byVersion = true;
    filter.clientVersion = client;
    QVERIFY(!filter.accepts(server));
}
