#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace odal {

constexpr uint32_t MASTER_CHALLENGE = 777123;
constexpr uint32_t SERVER_CHALLENGE = 0xAD011002;
constexpr uint32_t SERVER_VERSION_CHALLENGE = 0xAD011001;
constexpr uint32_t PING_CHALLENGE = 1;

constexpr uint32_t TAG_ID = 0xAD0;
constexpr uint32_t PROTOCOL_VERSION = 9;

constexpr uint16_t DEFAULT_MASTER_PORT = 15000;
constexpr const char *DEFAULT_MASTER_HOST = "master1.odamex.net";

// Packed as major * 256 + minor * 10 + patch.
constexpr uint32_t MakeVersion(uint32_t major, uint32_t minor, uint32_t patch) {
    return major * 256 + minor * 10 + patch;
}

constexpr uint32_t CLIENT_VERSION = MakeVersion(0, PROTOCOL_VERSION, 0);

struct VersionTriple {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t patch = 0;
};

constexpr VersionTriple DecodeVersion(uint32_t packed) {
    return VersionTriple{packed / 256, (packed % 256) / 10, (packed % 256) % 10};
}

enum class ChallengeKind {
    Master,
    Server,
    ServerVersion,
    Ping
};

// Wire values outside the named range are kept as-is.
enum class GameType : uint32_t {
    Cooperative = 0,
    Deathmatch = 1,
    TeamDeathmatch = 2,
    CaptureTheFlag = 3,
    Horde = 4
};

const char *GameTypeName(GameType type);
std::optional<GameType> ParseGameType(std::string_view text);

inline bool IsTeamGame(GameType type) {
    return type == GameType::TeamDeathmatch || type == GameType::CaptureTheFlag;
}

enum class CvarKind : uint8_t {
    None = 0,
    Bool,
    Byte,
    Word,
    Int,
    Float,
    String,
    Max = 255
};

struct Cvar {
    using Payload = std::variant<std::monostate, bool, uint8_t, uint16_t, uint32_t, double, std::string>;

    std::string name;
    CvarKind kind = CvarKind::None;
    Payload value;
    // Float cvars keep the text they were sent as.
    std::string text;

    std::optional<uint32_t> asUnsigned() const;
};

struct Team {
    std::string name;
    uint32_t color = 0;
    uint16_t score = 0;
};

struct Player {
    std::string name;
    uint32_t color = 0;
    uint16_t kills = 0;
    uint16_t deaths = 0;
    uint16_t frags = 0;
    uint16_t ping = 0;
    uint16_t time = 0;
    uint8_t team = 0;
    bool spectator = false;
};

struct Wad {
    std::string name;
    std::string hash;
};

struct ServerAddress {
    std::string ip;
    uint16_t port = 0;

    std::string key() const;

    bool operator==(const ServerAddress &other) const {
        return ip == other.ip && port == other.port;
    }
    bool operator!=(const ServerAddress &other) const {
        return !(*this == other);
    }
};

std::string MakeAddressKey(const std::string &ip, uint16_t port);

// Accepts "host" or "host:port"; host is a dotted quad or a hostname.
std::optional<ServerAddress> ParseServerAddress(std::string_view text,
                                                uint16_t defaultPort = 0,
                                                std::string *error = nullptr);

struct ServerInfo {
    ServerAddress address;
    std::optional<std::string> name;
    std::optional<std::string> currentMap;
    GameType gameType = GameType::Cooperative;

    uint32_t versionMajor = 0;
    uint32_t versionMinor = 0;
    uint32_t versionPatch = 0;
    uint32_t versionProtocol = 0;
    uint32_t versionRealProtocol = 0;
    std::string versionRevision;
    uint32_t processingTime = 0;

    int maxClients = 0;
    int maxPlayers = 0;
    std::optional<int> scoreLimit;
    std::optional<double> timeLimit;
    std::optional<int> timeLeft;
    std::optional<int> lives;
    std::optional<int> sides;

    std::string passwordHash;
    std::vector<std::string> patches;
    std::vector<Cvar> cvars;
    std::vector<Team> teams;
    std::vector<Wad> wads;
    std::vector<Player> players;

    std::optional<int> ping;
    bool responded = false;

    int totalClients() const;
    int activePlayers() const;
    bool hasPassword() const {
        return !passwordHash.empty();
    }
    // sv_hostname when present, otherwise the address key.
    std::string displayName() const;
};

} // namespace odal
