#include "packet_builder.h"

#include <arpa/inet.h>

PacketBuilder &PacketBuilder::u8(uint8_t value) {
    data.push_back(value);
    return *this;
}

PacketBuilder &PacketBuilder::u16(uint16_t value) {
    data.push_back(static_cast<uint8_t>(value & 0xFF));
    data.push_back(static_cast<uint8_t>(value >> 8));
    return *this;
}

PacketBuilder &PacketBuilder::u32(uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        data.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
    return *this;
}

PacketBuilder &PacketBuilder::str(const std::string &value) {
    data.insert(data.end(), value.begin(), value.end());
    data.push_back(0);
    return *this;
}

PacketBuilder &PacketBuilder::hex(const std::vector<uint8_t> &bytes) {
    data.push_back(static_cast<uint8_t>(bytes.size()));
    data.insert(data.end(), bytes.begin(), bytes.end());
    return *this;
}

odal::Player MakePlayer(const std::string &name, bool spectator, uint8_t team) {
    odal::Player player;
    player.name = name;
    player.color = 0x00FF00;
    player.kills = 3;
    player.deaths = 1;
    player.frags = 3;
    player.ping = 42;
    player.time = 120;
    player.team = team;
    player.spectator = spectator;
    return player;
}

std::vector<uint8_t> BuildServerResponse(const FakeServer &server) {
    PacketBuilder packet;
    packet.u32(server.header).u32(server.version).u32(server.protocol);
    packet.u32(server.processingTime).u32(server.realProtocol).str(server.revision);

    std::vector<FakeCvar> cvars = {
        {"sv_hostname", odal::CvarKind::String, 0, server.hostname},
        {"sv_gametype", odal::CvarKind::Byte, static_cast<uint32_t>(server.gameType), {}},
        {"sv_maxclients", odal::CvarKind::Byte, server.maxClients, {}},
        {"sv_maxplayers", odal::CvarKind::Byte, server.maxPlayers, {}},
        {"sv_timelimit", odal::CvarKind::Float, 0, server.timeLimit},
    };
    cvars.insert(cvars.end(), server.extraCvars.begin(), server.extraCvars.end());

    packet.u8(static_cast<uint8_t>(cvars.size()));
    for (const auto &cvar : cvars) {
        packet.str(cvar.name).u8(static_cast<uint8_t>(cvar.kind));
        switch (cvar.kind) {
            case odal::CvarKind::Byte:
                packet.u8(static_cast<uint8_t>(cvar.number));
                break;
            case odal::CvarKind::Word:
                packet.u16(static_cast<uint16_t>(cvar.number));
                break;
            case odal::CvarKind::Int:
                packet.u32(cvar.number);
                break;
            case odal::CvarKind::Float:
            case odal::CvarKind::String:
                packet.str(cvar.text);
                break;
            default:
                break;
        }
    }

    packet.hex(server.passwordHash);
    packet.str(server.map);

    if (std::stod(server.timeLimit) > 0.0) {
        packet.u16(server.timeLeft);
    }

    const bool teamGame = odal::IsTeamGame(server.gameType);
    if (teamGame) {
        packet.u8(static_cast<uint8_t>(server.teams.size()));
        for (const auto &team : server.teams) {
            packet.str(team.name).u32(team.color).u16(team.score);
        }
    }

    packet.u8(static_cast<uint8_t>(server.patches.size()));
    for (const auto &patch : server.patches) {
        packet.str(patch);
    }

    packet.u8(static_cast<uint8_t>(server.wads.size()));
    for (const auto &[name, hash] : server.wads) {
        packet.str(name).hex(hash);
    }

    packet.u8(static_cast<uint8_t>(server.players.size()));
    for (const auto &player : server.players) {
        packet.str(player.name).u32(player.color);
        if (teamGame) {
            packet.u8(player.team);
        }
        packet.u16(player.ping).u16(player.time).u8(player.spectator ? 1 : 0);
        packet.u16(player.frags).u16(player.kills).u16(player.deaths);
    }

    return packet.bytes();
}

std::vector<uint8_t> BuildMasterResponse(const std::vector<odal::ServerAddress> &servers) {
    PacketBuilder packet;
    packet.u32(odal::MASTER_CHALLENGE).u16(static_cast<uint16_t>(servers.size()));
    for (const auto &server : servers) {
        in_addr address{};
        inet_pton(AF_INET, server.ip.c_str(), &address);
        const uint32_t hostOrder = ntohl(address.s_addr);
        packet.u8(static_cast<uint8_t>(hostOrder >> 24))
            .u8(static_cast<uint8_t>(hostOrder >> 16))
            .u8(static_cast<uint8_t>(hostOrder >> 8))
            .u8(static_cast<uint8_t>(hostOrder));
        packet.u16(server.port);
    }
    return packet.bytes();
}
