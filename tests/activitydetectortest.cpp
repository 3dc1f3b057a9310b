#include "activitydetectortest.h"

#include "registry/activity_detector.hpp"

using namespace odal;

namespace {
ServerInfo withPlayers(const std::string &ip, int count, std::optional<std::string> name = std::string("Arena")) {
    ServerInfo server;
    server.address = ServerAddress{ip, 10666};
    server.name = std::move(name);
    server.responded = true;
    server.players.resize(static_cast<std::size_t>(count));
    return server;
}
} // namespace

void ActivityDetectorTest::test_playersJoined() {
    ActivityDetector detector;
    const auto first = detector.detect({withPlayers("1.1.1.1", 2)});
    QVERIFY(!first.activityDetected);
    QCOMPARE(first.messages.size(), static_cast<std::size_t>(1));
    QCOMPARE(first.messages[0], std::string("New server: Arena (2 players)"));

    const auto second = detector.detect({withPlayers("1.1.1.1", 5)});
    QVERIFY(second.activityDetected);
    QCOMPARE(second.messages.size(), static_cast<std::size_t>(1));
    QCOMPARE(second.messages[0], std::string("Arena: 3 player(s) joined"));
}

void ActivityDetectorTest::test_repeatSnapshotIsQuiet() {
    ActivityDetector detector;
    const std::vector<ServerInfo> servers = {withPlayers("1.1.1.1", 2), withPlayers("2.2.2.2", 0)};
    detector.detect(servers);

    const auto repeat = detector.detect(servers);
    QVERIFY(!repeat.activityDetected);
    QVERIFY(repeat.messages.empty());
    QVERIFY(!BuildActivityNotification(repeat));
}

void ActivityDetectorTest::test_newServers() {
    ActivityDetector detector;
    detector.detect({withPlayers("1.1.1.1", 1)});

    // Empty newcomers are tracked silently.
    const auto report = detector.detect({withPlayers("1.1.1.1", 1), withPlayers("3.3.3.3", 0, std::string("Quiet"))});
    QVERIFY(report.messages.empty());
    QCOMPARE(detector.trackedServerCount(), static_cast<std::size_t>(2));

    const auto later = detector.detect({withPlayers("3.3.3.3", 4, std::string("Quiet"))});
    QVERIFY(later.activityDetected);
    QCOMPARE(later.messages[0], std::string("Quiet: 4 player(s) joined"));
}

void ActivityDetectorTest::test_playersLeftUsesAddressWhenUnnamed() {
    ActivityDetector detector;
    detector.detect({withPlayers("4.4.4.4", 6, std::nullopt)});
    const auto report = detector.detect({withPlayers("4.4.4.4", 1, std::nullopt)});
    QCOMPARE(report.messages.size(), static_cast<std::size_t>(1));
    QCOMPARE(report.messages[0], std::string("4.4.4.4:10666: 5 player(s) left"));
}

void ActivityDetectorTest::test_notificationPreview() {
    ActivityReport single;
    single.messages = {"Arena: 1 player(s) joined"};
    const auto one = BuildActivityNotification(single);
    QVERIFY(one);
    QCOMPARE(one->title, std::string("Server Activity"));
    QCOMPARE(one->body, std::string("Arena: 1 player(s) joined"));
    QVERIFY(one->flash);

    ActivityReport many;
    many.messages = {"a", "b", "c", "d", "e"};
    const auto five = BuildActivityNotification(many);
    QVERIFY(five);
    QCOMPARE(five->title, std::string("Server Activity (5)"));
    QCOMPARE(five->body, std::string("a\nb\nc\n... and 2 more"));
}

void ActivityDetectorTest::test_reset() {
    ActivityDetector detector;
    detector.detect({withPlayers("1.1.1.1", 3)});
    detector.reset();
    QCOMPARE(detector.trackedServerCount(), static_cast<std::size_t>(0));

    const auto report = detector.detect({withPlayers("1.1.1.1", 3)});
    QVERIFY(!report.activityDetected);
    QCOMPARE(report.messages[0], std::string("New server: Arena (3 players)"));
}
