#include "protocol/odalpapi.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace odal {

namespace {
std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}

bool isDottedQuad(std::string_view host) {
    int octets = 0;
    std::size_t position = 0;
    while (position <= host.size()) {
        const std::size_t dot = host.find('.', position);
        const std::string_view part = host.substr(position, dot == std::string_view::npos ? std::string_view::npos : dot - position);
        if (part.empty() || part.size() > 3) {
            return false;
        }
        unsigned value = 0;
        const auto [end, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc() || end != part.data() + part.size() || value > 255) {
            return false;
        }
        ++octets;
        if (dot == std::string_view::npos) {
            break;
        }
        position = dot + 1;
    }
    return octets == 4;
}

bool isHostname(std::string_view host) {
    if (host.empty() || host.size() > 253 || host.front() == '.' || host.back() == '.') {
        return false;
    }
    return std::all_of(host.begin(), host.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '-' || ch == '.';
    });
}

bool allDigitsAndDots(std::string_view host) {
    return std::all_of(host.begin(), host.end(), [](unsigned char ch) {
        return std::isdigit(ch) || ch == '.';
    });
}

void setError(std::string *error, std::string message) {
    if (error) {
        *error = std::move(message);
    }
}
} // namespace

const char *GameTypeName(GameType type) {
    switch (type) {
        case GameType::Cooperative:
            return "Cooperative";
        case GameType::Deathmatch:
            return "Deathmatch";
        case GameType::TeamDeathmatch:
            return "Team Deathmatch";
        case GameType::CaptureTheFlag:
            return "Capture The Flag";
        case GameType::Horde:
            return "Horde";
    }
    return "Unknown";
}

std::optional<GameType> ParseGameType(std::string_view text) {
    const std::string lowered = toLower(text);
    if (lowered == "coop" || lowered == "cooperative") {
        return GameType::Cooperative;
    }
    if (lowered == "dm" || lowered == "deathmatch") {
        return GameType::Deathmatch;
    }
    if (lowered == "tdm" || lowered == "teamdeathmatch" || lowered == "team deathmatch") {
        return GameType::TeamDeathmatch;
    }
    if (lowered == "ctf" || lowered == "capturetheflag" || lowered == "capture the flag") {
        return GameType::CaptureTheFlag;
    }
    if (lowered == "horde") {
        return GameType::Horde;
    }
    return std::nullopt;
}

std::optional<uint32_t> Cvar::asUnsigned() const {
    switch (kind) {
        case CvarKind::Byte:
            if (const auto *byte = std::get_if<uint8_t>(&value)) {
                return *byte;
            }
            break;
        case CvarKind::Word:
            if (const auto *word = std::get_if<uint16_t>(&value)) {
                return *word;
            }
            break;
        case CvarKind::Int:
            if (const auto *integer = std::get_if<uint32_t>(&value)) {
                return *integer;
            }
            break;
        case CvarKind::Bool:
            return 1;
        default:
            break;
    }
    return std::nullopt;
}

std::string MakeAddressKey(const std::string &ip, uint16_t port) {
    return ip + ":" + std::to_string(port);
}

std::string ServerAddress::key() const {
    return MakeAddressKey(ip, port);
}

std::optional<ServerAddress> ParseServerAddress(std::string_view text, uint16_t defaultPort, std::string *error) {
    if (text.empty()) {
        setError(error, "Address is empty");
        return std::nullopt;
    }

    std::string_view host = text;
    uint16_t port = defaultPort;

    if (const auto colon = text.rfind(':'); colon != std::string_view::npos) {
        host = text.substr(0, colon);
        const std::string_view portText = text.substr(colon + 1);
        unsigned value = 0;
        const auto [end, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), value);
        if (portText.empty() || ec != std::errc() || end != portText.data() + portText.size()
            || value == 0 || value > 65535) {
            setError(error, "Invalid port in '" + std::string(text) + "'");
            return std::nullopt;
        }
        port = static_cast<uint16_t>(value);
    }

    if (port == 0) {
        setError(error, "Missing port in '" + std::string(text) + "'");
        return std::nullopt;
    }

    if (allDigitsAndDots(host) ? !isDottedQuad(host) : !isHostname(host)) {
        setError(error, "Invalid host in '" + std::string(text) + "'");
        return std::nullopt;
    }

    return ServerAddress{std::string(host), port};
}

int ServerInfo::totalClients() const {
    return static_cast<int>(players.size());
}

int ServerInfo::activePlayers() const {
    return static_cast<int>(std::count_if(players.begin(), players.end(),
                                          [](const Player &player) { return !player.spectator; }));
}

std::string ServerInfo::displayName() const {
    if (name && !name->empty()) {
        return *name;
    }
    return address.key();
}

} // namespace odal
