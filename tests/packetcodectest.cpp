#include "packetcodectest.h"

#include "packet_builder.h"
#include "protocol/byte_reader.hpp"
#include "protocol/packet_codec.hpp"

#include <random>

using namespace odal;

namespace {
const ServerAddress kServer{"10.0.0.5", 10666};

ServerInfo decode(const std::vector<uint8_t> &bytes, codec::DecodeFailure *failure = nullptr) {
    return codec::DecodeGameServerResponse(bytes, kServer, failure);
}
} // namespace

void PacketCodecTest::test_encodeChallenge() {
    const std::vector<uint8_t> master{0xA3, 0xDB, 0x0B, 0x00};
    QCOMPARE(codec::EncodeChallenge(ChallengeKind::Master), master);

    const std::vector<uint8_t> server{0x02, 0x10, 0x01, 0xAD};
    QCOMPARE(codec::EncodeChallenge(ChallengeKind::Server), server);

    const std::vector<uint8_t> version{0x01, 0x10, 0x01, 0xAD};
    QCOMPARE(codec::EncodeChallenge(ChallengeKind::ServerVersion), version);

    const std::vector<uint8_t> ping{0x01, 0x00, 0x00, 0x00};
    QCOMPARE(codec::EncodeChallenge(ChallengeKind::Ping), ping);
}

void PacketCodecTest::test_byteReader_overrun() {
    const std::vector<uint8_t> bytes{0x34, 0x12, 0xFF};
    ByteReader reader(bytes);
    QCOMPARE(reader.readU16(), static_cast<uint16_t>(0x1234));
    QCOMPARE(reader.remaining(), static_cast<std::size_t>(1));

    bool threw = false;
    try {
        reader.readU32();
    } catch (const ReadOverrun &) {
        threw = true;
    }
    QVERIFY(threw);
    QCOMPARE(reader.position(), static_cast<std::size_t>(2));
    QCOMPARE(reader.readU8(), static_cast<uint8_t>(0xFF));
    QVERIFY(reader.atEnd());
}

void PacketCodecTest::test_byteReader_unterminatedString() {
    const std::vector<uint8_t> bytes{'a', 'b', 0, 'c', 'd'};
    ByteReader reader(bytes);
    QCOMPARE(reader.readString(), std::string("ab"));
    QCOMPARE(reader.readString(), std::string("cd"));
    QVERIFY(reader.atEnd());

    // An exhausted buffer reads as an empty string.
    QCOMPARE(reader.readString(), std::string());
    QCOMPARE(reader.position(), bytes.size());

    const std::vector<uint8_t> none;
    ByteReader empty(none);
    QCOMPARE(empty.readString(), std::string());

    const std::vector<uint8_t> hex{3, 0x0A, 0xBC, 0x01};
    ByteReader hexReader(hex);
    QCOMPARE(hexReader.readHexString(), std::string("0abc01"));
}

void PacketCodecTest::test_masterResponse_counts() {
    for (int count : {0, 1, 5, 255}) {
        std::vector<ServerAddress> servers;
        for (int i = 0; i < count; ++i) {
            servers.push_back(ServerAddress{"192.168." + std::to_string(i / 200) + "." + std::to_string(i % 200 + 1),
                                            static_cast<uint16_t>(10666 + i)});
        }

        codec::DecodeFailure failure;
        const auto decoded = codec::DecodeMasterResponse(BuildMasterResponse(servers), &failure);
        QCOMPARE(decoded.size(), servers.size());
        QVERIFY(failure.message.empty());
        for (std::size_t i = 0; i < servers.size(); ++i) {
            QCOMPARE(decoded[i].ip, servers[i].ip);
            QCOMPARE(decoded[i].port, servers[i].port);
        }
    }
}

void PacketCodecTest::test_masterResponse_partialRecord() {
    auto bytes = BuildMasterResponse({{"1.2.3.4", 10666}, {"5.6.7.8", 10667}});
    bytes.push_back(9);
    bytes.push_back(9);
    bytes.push_back(9);
    bytes.push_back(9);
    bytes.push_back(0x2A);

    const auto decoded = codec::DecodeMasterResponse(bytes);
    QCOMPARE(decoded.size(), static_cast<std::size_t>(2));
    QCOMPARE(decoded[1].key(), std::string("5.6.7.8:10667"));
}

void PacketCodecTest::test_masterResponse_shortHeader() {
    const std::vector<uint8_t> bytes{0xA3, 0xDB, 0x0B};
    codec::DecodeFailure failure;
    const auto decoded = codec::DecodeMasterResponse(bytes, &failure);
    QVERIFY(decoded.empty());
    QVERIFY(failure.kind == QueryErrorKind::MalformedResponse);
    QVERIFY(!failure.message.empty());
}

void PacketCodecTest::test_gameServer_fullDeathmatch() {
    FakeServer fake;
    fake.hostname = "Frag Fest";
    fake.maxClients = 12;
    fake.maxPlayers = 8;
    fake.passwordHash = {0xDE, 0xAD};
    fake.patches = {"dwango5.deh"};
    fake.players = {MakePlayer("alice"), MakePlayer("bob", true)};
    fake.extraCvars = {{"sv_scorelimit", CvarKind::Word, 50, {}}};

    codec::DecodeFailure failure;
    const ServerInfo server = decode(BuildServerResponse(fake), &failure);
    QVERIFY2(server.responded, failure.message.c_str());
    QCOMPARE(server.displayName(), std::string("Frag Fest"));
    QCOMPARE(server.currentMap.value_or(""), std::string("MAP01"));
    QVERIFY(server.gameType == GameType::Deathmatch);
    QCOMPARE(server.versionMajor, 0u);
    QCOMPARE(server.versionMinor, 9u);
    QCOMPARE(server.versionPatch, 4u);
    QCOMPARE(server.versionProtocol, PROTOCOL_VERSION);
    QCOMPARE(server.versionRealProtocol, 65u);
    QCOMPARE(server.versionRevision, std::string("git-1234"));
    QCOMPARE(server.processingTime, 12u);
    QCOMPARE(server.maxClients, 12);
    QCOMPARE(server.maxPlayers, 8);
    QCOMPARE(server.scoreLimit.value_or(-1), 50);
    QVERIFY(server.hasPassword());
    QCOMPARE(server.passwordHash, std::string("dead"));
    QCOMPARE(server.patches.size(), static_cast<std::size_t>(1));
    QCOMPARE(server.wads.size(), static_cast<std::size_t>(2));
    QCOMPARE(server.wads[1].name, std::string("DOOM2.WAD"));
    QCOMPARE(server.wads[1].hash, std::string("0102"));
    QVERIFY(server.teams.empty());
    QCOMPARE(server.totalClients(), 2);
    QCOMPARE(server.activePlayers(), 1);
    QCOMPARE(server.players[0].name, std::string("alice"));
    QCOMPARE(server.players[0].ping, static_cast<uint16_t>(42));
    QCOMPARE(server.players[0].frags, static_cast<uint16_t>(3));
    QVERIFY(server.players[1].spectator);
    QVERIFY(!server.timeLeft);
    QVERIFY(!server.ping);
}

void PacketCodecTest::test_gameServer_teamGame() {
    FakeServer fake;
    fake.gameType = GameType::CaptureTheFlag;
    fake.teams = {{"Blue", 0x0000FF, 3}, {"Red", 0xFF0000, 1}};
    fake.players = {MakePlayer("alice", false, 0), MakePlayer("bob", false, 1)};

    const ServerInfo server = decode(BuildServerResponse(fake));
    QVERIFY(server.responded);
    QCOMPARE(server.teams.size(), static_cast<std::size_t>(2));
    QCOMPARE(server.teams[0].name, std::string("Blue"));
    QCOMPARE(server.teams[0].score, static_cast<uint16_t>(3));
    QCOMPARE(server.players.size(), static_cast<std::size_t>(2));
    QCOMPARE(server.players[1].team, static_cast<uint8_t>(1));
    QCOMPARE(server.players[1].name, std::string("bob"));
    QCOMPARE(server.players[1].deaths, static_cast<uint16_t>(1));

    // Cooperative carries neither a team table nor per-player team bytes.
    FakeServer coop;
    coop.gameType = GameType::Cooperative;
    coop.players = {MakePlayer("carol"), MakePlayer("dave")};
    const ServerInfo coopServer = decode(BuildServerResponse(coop));
    QVERIFY(coopServer.responded);
    QVERIFY(coopServer.teams.empty());
    QCOMPARE(coopServer.players.size(), static_cast<std::size_t>(2));
    QCOMPARE(coopServer.players[1].name, std::string("dave"));
    QCOMPARE(coopServer.players[1].ping, static_cast<uint16_t>(42));
}

void PacketCodecTest::test_gameServer_timeLeftOnlyWithTimeLimit() {
    FakeServer fake;
    fake.timeLimit = "20";
    fake.timeLeft = 600;
    fake.players = {MakePlayer("alice")};

    const ServerInfo server = decode(BuildServerResponse(fake));
    QVERIFY(server.responded);
    QCOMPARE(server.timeLimit.value_or(0.0), 20.0);
    QCOMPARE(server.timeLeft.value_or(-1), 600);
    QCOMPARE(server.players[0].name, std::string("alice"));

    fake.timeLimit = "0";
    const ServerInfo untimed = decode(BuildServerResponse(fake));
    QVERIFY(untimed.responded);
    QVERIFY(!untimed.timeLeft);
}

void PacketCodecTest::test_gameServer_headerRejection() {
    const uint32_t valid = 0xAD032000;
    const std::vector<uint32_t> headers = {
        (valid & ~0xF000u) | 0x1000u,     // qrId 1
        (valid & ~0xF0000u) | 0x40000u,   // application 4
        (valid & ~0xFFF00000u) | 0xAD100000u, // tag id
    };

    for (uint32_t header : headers) {
        FakeServer fake;
        fake.header = header;
        codec::DecodeFailure failure;
        const ServerInfo server = decode(BuildServerResponse(fake), &failure);
        QVERIFY(!server.responded);
        QVERIFY(failure.kind == QueryErrorKind::MalformedResponse);
        QCOMPARE(failure.message, std::string("Invalid response from 10.0.0.5:10666"));
        QVERIFY(!failure.removeServer);
    }
}

void PacketCodecTest::test_gameServer_versionGate() {
    FakeServer older;
    older.version = MakeVersion(0, 8, 9);
    codec::DecodeFailure failure;
    const ServerInfo rejected = decode(BuildServerResponse(older), &failure);
    QVERIFY(!rejected.responded);
    QVERIFY(failure.kind == QueryErrorKind::UnsupportedVersion);
    QVERIFY(failure.removeServer);
    QCOMPARE(failure.message, std::string("Server 10.0.0.5:10666 is version 0.8.9 which is not supported"));

    FakeServer same;
    same.version = CLIENT_VERSION;
    QVERIFY(decode(BuildServerResponse(same)).responded);

    FakeServer newer;
    newer.version = MakeVersion(1, 0, 0);
    QVERIFY(decode(BuildServerResponse(newer)).responded);
}

void PacketCodecTest::test_gameServer_zeroVersion() {
    FakeServer fake;
    fake.version = 0;
    codec::DecodeFailure failure;
    const ServerInfo server = decode(BuildServerResponse(fake), &failure);
    QVERIFY(!server.responded);
    QVERIFY(failure.kind == QueryErrorKind::MalformedResponse);
    QCOMPARE(failure.message, std::string("Version issue"));
}

void PacketCodecTest::test_gameServer_cvarKinds() {
    FakeServer fake;
    fake.extraCvars = {
        {"sv_allowjump", CvarKind::Bool, 0, {}},
        {"g_lives", CvarKind::Int, 3, {}},
        {"g_sides", CvarKind::Word, 2, {}},
        {"sv_motd", CvarKind::String, 0, "welcome"},
    };

    const ServerInfo server = decode(BuildServerResponse(fake));
    QVERIFY(server.responded);
    QCOMPARE(server.lives.value_or(-1), 3);
    QCOMPARE(server.sides.value_or(-1), 2);
    QCOMPARE(server.cvars.size(), static_cast<std::size_t>(9));

    const auto &jump = server.cvars[5];
    QCOMPARE(jump.name, std::string("sv_allowjump"));
    QVERIFY(std::get<bool>(jump.value));

    const auto &motd = server.cvars[8];
    QCOMPARE(std::get<std::string>(motd.value), std::string("welcome"));

    const auto &timeLimit = server.cvars[4];
    QVERIFY(timeLimit.kind == CvarKind::Float);
    QCOMPARE(timeLimit.text, std::string("0"));
}

void PacketCodecTest::test_gameServer_truncatedNeverThrows() {
    FakeServer fake;
    fake.gameType = GameType::TeamDeathmatch;
    fake.teams = {{"Blue", 1, 0}, {"Red", 2, 0}};
    fake.players = {MakePlayer("alice", false, 0), MakePlayer("bob", false, 1)};
    const auto full = BuildServerResponse(fake);

    for (std::size_t length = 0; length < full.size(); ++length) {
        const std::vector<uint8_t> prefix(full.begin(), full.begin() + length);
        codec::DecodeFailure failure;
        bool threw = false;
        ServerInfo server;
        try {
            server = decode(prefix, &failure);
        } catch (const std::exception &) {
            threw = true;
        }
        QVERIFY(!threw);
        QVERIFY(!server.responded);
        QVERIFY(failure.kind == QueryErrorKind::MalformedResponse);
    }

    QVERIFY(decode(full).responded);
}

void PacketCodecTest::test_gameServer_randomNeverThrows() {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> size(0, 512);

    for (int round = 0; round < 500; ++round) {
        std::vector<uint8_t> bytes(static_cast<std::size_t>(size(rng)));
        for (auto &b : bytes) {
            b = static_cast<uint8_t>(byte(rng));
        }
        // Half the rounds carry a valid header so decoding gets past the tag check.
        if (round % 2 == 0 && bytes.size() >= 12) {
            const auto header = PacketBuilder().u32(0xAD032000).u32(CLIENT_VERSION).u32(PROTOCOL_VERSION).bytes();
            std::copy(header.begin(), header.end(), bytes.begin());
        }

        bool threw = false;
        try {
            codec::DecodeFailure failure;
            decode(bytes, &failure);
            codec::DecodeMasterResponse(bytes, &failure);
        } catch (const std::exception &) {
            threw = true;
        }
        QVERIFY(!threw);
    }
}

void PacketCodecTest::test_responseTag_packetType() {
    codec::ResponseTag tag = codec::SplitResponseTag(0xAD032000);
    QCOMPARE(tag.tagId, TAG_ID);
    QCOMPARE(tag.application, 3u);
    QCOMPARE(tag.qrId, 2u);
    QVERIFY(codec::IsValidServerResponseTag(tag));

    tag.packetType = 2;
    QVERIFY(!codec::IsValidServerResponseTag(tag));
}
