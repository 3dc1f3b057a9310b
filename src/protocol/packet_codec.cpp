#include "protocol/packet_codec.hpp"

#include "protocol/byte_reader.hpp"

#include <cstdlib>
#include <exception>

namespace odal::codec {

namespace {
constexpr std::size_t kMasterHeaderSize = 6;
constexpr std::size_t kMasterRecordSize = 6;

void setFailure(DecodeFailure *failureOut, QueryErrorKind kind, std::string message, bool removeServer) {
    if (!failureOut) {
        return;
    }
    failureOut->kind = kind;
    failureOut->message = std::move(message);
    failureOut->removeServer = removeServer;
}

double parseLeadingFloat(const std::string &text) {
    const char *begin = text.c_str();
    char *end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin) {
        return 0.0;
    }
    return value;
}

Cvar readCvar(ByteReader &reader) {
    Cvar cvar;
    cvar.name = reader.readString();
    cvar.kind = static_cast<CvarKind>(reader.readU8());

    switch (cvar.kind) {
        case CvarKind::Bool:
            cvar.value.emplace<bool>(true);
            break;
        case CvarKind::Byte:
            cvar.value.emplace<uint8_t>(reader.readU8());
            break;
        case CvarKind::Word:
            cvar.value.emplace<uint16_t>(reader.readU16());
            break;
        case CvarKind::Int:
            cvar.value.emplace<uint32_t>(reader.readU32());
            break;
        case CvarKind::Float:
            cvar.text = reader.readString();
            cvar.value.emplace<double>(parseLeadingFloat(cvar.text));
            break;
        case CvarKind::String:
            cvar.value.emplace<std::string>(reader.readString());
            break;
        default:
            break;
    }
    return cvar;
}

std::string cvarText(const Cvar &cvar) {
    if (const auto *text = std::get_if<std::string>(&cvar.value)) {
        return *text;
    }
    return cvar.text;
}

void applyKnownCvar(ServerInfo &server, const Cvar &cvar) {
    const auto number = cvar.asUnsigned();
    if (cvar.name == "sv_hostname") {
        server.name = cvarText(cvar);
    } else if (cvar.name == "sv_maxplayers") {
        server.maxPlayers = static_cast<int>(number.value_or(0));
    } else if (cvar.name == "sv_maxclients") {
        server.maxClients = static_cast<int>(number.value_or(0));
    } else if (cvar.name == "sv_gametype") {
        server.gameType = static_cast<GameType>(number.value_or(0));
    } else if (cvar.name == "sv_scorelimit") {
        server.scoreLimit = static_cast<int>(number.value_or(0));
    } else if (cvar.name == "sv_timelimit") {
        server.timeLimit = parseLeadingFloat(cvarText(cvar));
    } else if (cvar.name == "g_lives") {
        server.lives = static_cast<int>(number.value_or(0));
    } else if (cvar.name == "g_sides") {
        server.sides = static_cast<int>(number.value_or(0));
    }
}

void decodeBody(ByteReader &reader, ServerInfo &server, uint32_t clientVersion) {
    const ResponseTag tag = SplitResponseTag(reader.readU32());
    if (!IsValidServerResponseTag(tag)) {
        throw QueryError(QueryErrorKind::MalformedResponse, "Invalid response from " + server.address.key());
    }

    const uint32_t serverVersion = reader.readU32();
    const uint32_t protocolVersion = reader.readU32();
    if (serverVersion == 0) {
        throw QueryError(QueryErrorKind::MalformedResponse, "Version issue");
    }

    const VersionTriple version = DecodeVersion(serverVersion);
    const VersionTriple client = DecodeVersion(clientVersion);
    server.versionMajor = version.major;
    server.versionMinor = version.minor;
    server.versionPatch = version.patch;
    server.versionProtocol = protocolVersion;

    if (version.major < client.major || (version.major == client.major && version.minor < client.minor)) {
        throw QueryError(QueryErrorKind::UnsupportedVersion,
                         "Server " + server.address.key() + " is version " + std::to_string(version.major) + "."
                             + std::to_string(version.minor) + "." + std::to_string(version.patch)
                             + " which is not supported",
                         true);
    }

    server.processingTime = reader.readU32();
    server.versionRealProtocol = reader.readU32();
    server.versionRevision = reader.readString();

    const uint8_t cvarCount = reader.readU8();
    server.cvars.reserve(cvarCount);
    for (uint8_t i = 0; i < cvarCount; ++i) {
        Cvar cvar = readCvar(reader);
        applyKnownCvar(server, cvar);
        server.cvars.push_back(std::move(cvar));
    }

    server.passwordHash = reader.readHexString();
    server.currentMap = reader.readString();

    if (server.timeLimit && *server.timeLimit > 0.0) {
        server.timeLeft = reader.readU16();
    }

    const bool teamGame = IsTeamGame(server.gameType);
    if (teamGame) {
        const uint8_t teamCount = reader.readU8();
        for (uint8_t i = 0; i < teamCount; ++i) {
            Team team;
            team.name = reader.readString();
            team.color = reader.readU32();
            team.score = reader.readU16();
            server.teams.push_back(std::move(team));
        }
    }

    const uint8_t patchCount = reader.readU8();
    for (uint8_t i = 0; i < patchCount; ++i) {
        server.patches.push_back(reader.readString());
    }

    const uint8_t wadCount = reader.readU8();
    for (uint8_t i = 0; i < wadCount; ++i) {
        Wad wad;
        wad.name = reader.readString();
        wad.hash = reader.readHexString();
        server.wads.push_back(std::move(wad));
    }

    const uint8_t playerCount = reader.readU8();
    for (uint8_t i = 0; i < playerCount; ++i) {
        Player player;
        player.name = reader.readString();
        player.color = reader.readU32();
        if (teamGame) {
            player.team = reader.readU8();
        }
        player.ping = reader.readU16();
        player.time = reader.readU16();
        player.spectator = reader.readU8() > 0;
        player.frags = reader.readU16();
        player.kills = reader.readU16();
        player.deaths = reader.readU16();
        server.players.push_back(std::move(player));
    }
}
} // namespace

uint32_t ChallengeValue(ChallengeKind kind) {
    switch (kind) {
        case ChallengeKind::Master:
            return MASTER_CHALLENGE;
        case ChallengeKind::Server:
            return SERVER_CHALLENGE;
        case ChallengeKind::ServerVersion:
            return SERVER_VERSION_CHALLENGE;
        case ChallengeKind::Ping:
            return PING_CHALLENGE;
    }
    return PING_CHALLENGE;
}

std::vector<uint8_t> EncodeChallenge(ChallengeKind kind) {
    const uint32_t value = ChallengeValue(kind);
    return {
        static_cast<uint8_t>(value & 0xFF),
        static_cast<uint8_t>((value >> 8) & 0xFF),
        static_cast<uint8_t>((value >> 16) & 0xFF),
        static_cast<uint8_t>((value >> 24) & 0xFF),
    };
}

ResponseTag SplitResponseTag(uint32_t header) {
    ResponseTag tag;
    tag.tagId = (header >> 20) & 0x0FFF;
    tag.application = (header >> 16) & 0x0F;
    tag.qrId = (header >> 12) & 0x0F;
    tag.packetType = header & 0xFFFF0FFF;
    return tag;
}

bool IsValidServerResponseTag(const ResponseTag &tag) {
    return tag.tagId == TAG_ID && tag.qrId == 2 && tag.application == 3 && tag.packetType != 2;
}

std::vector<ServerAddress> DecodeMasterResponse(std::span<const uint8_t> buffer, DecodeFailure *failureOut) {
    std::vector<ServerAddress> addresses;
    if (buffer.size() < kMasterHeaderSize) {
        setFailure(failureOut, QueryErrorKind::MalformedResponse,
                   "Master response too short (" + std::to_string(buffer.size()) + " bytes)", false);
        return addresses;
    }

    ByteReader reader(buffer);
    reader.skip(4);
    const uint16_t declaredCount = reader.readU16();
    addresses.reserve(declaredCount);

    while (reader.remaining() >= kMasterRecordSize) {
        const uint8_t a = reader.readU8();
        const uint8_t b = reader.readU8();
        const uint8_t c = reader.readU8();
        const uint8_t d = reader.readU8();
        ServerAddress address;
        address.ip = std::to_string(a) + "." + std::to_string(b) + "." + std::to_string(c) + "." + std::to_string(d);
        address.port = reader.readU16();
        addresses.push_back(std::move(address));
    }

    return addresses;
}

ServerInfo DecodeGameServerResponse(std::span<const uint8_t> buffer,
                                    const ServerAddress &address,
                                    DecodeFailure *failureOut,
                                    uint32_t clientVersion) {
    ServerInfo server;
    server.address = address;

    try {
        ByteReader reader(buffer);
        decodeBody(reader, server, clientVersion);
        server.responded = true;
    } catch (const QueryError &rejection) {
        setFailure(failureOut, rejection.kind(), rejection.what(), rejection.removeServer());
    } catch (const ReadOverrun &overrun) {
        setFailure(failureOut, QueryErrorKind::MalformedResponse,
                   "Truncated response from " + address.key() + ": " + overrun.what(), false);
    } catch (const std::exception &e) {
        setFailure(failureOut, QueryErrorKind::MalformedResponse,
                   "Failed to decode response from " + address.key() + ": " + e.what(), false);
    }

    return server;
}

} // namespace odal::codec
