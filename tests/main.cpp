#include "activitydetectortest.h"
#include "configtest.h"
#include "discoveryclienttest.h"
#include "fanoutschedulertest.h"
#include "localdiscoverytest.h"
#include "matchmakingenginetest.h"
#include "packetcodectest.h"
#include "serverregistrytest.h"
#include "odal/odal.h"
#include "spdlog/spdlog.h"
#include <QCoreApplication>

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    spdlog::set_level(spdlog::level::off);

    int result = 0;

    {
        PacketCodecTest packetCodecTest;
        result |= QTest::qExec(&packetCodecTest, argc, argv);
    }

    {
        ServerRegistryTest serverRegistryTest;
        result |= QTest::qExec(&serverRegistryTest, argc, argv);
    }

    {
        ActivityDetectorTest activityDetectorTest;
        result |= QTest::qExec(&activityDetectorTest, argc, argv);
    }

    {
        FanOutSchedulerTest fanOutSchedulerTest;
        result |= QTest::qExec(&fanOutSchedulerTest, argc, argv);
    }

    {
        MatchmakingEngineTest matchmakingEngineTest;
        result |= QTest::qExec(&matchmakingEngineTest, argc, argv);
    }

    {
        ConfigTest configTest;
        result |= QTest::qExec(&configTest, argc, argv);
    }

    {
        LocalDiscoveryTest localDiscoveryTest;
        result |= QTest::qExec(&localDiscoveryTest, argc, argv);
    }

    {
        DiscoveryClientTest discoveryClientTest;
        result |= QTest::qExec(&discoveryClientTest, argc, argv);
    }

    {
        ServerRefresherTest serverRefresherTest;
        result |= QTest::qExec(&serverRefresherTest, argc, argv);
    }

    return result;
}
