#pragma once

#include "protocol/odalpapi.hpp"
#include "protocol/query_error.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace odal::codec {

struct DecodeFailure {
    QueryErrorKind kind = QueryErrorKind::MalformedResponse;
    std::string message;
    bool removeServer = false;
};

struct ResponseTag {
    uint32_t tagId = 0;
    uint32_t application = 0;
    uint32_t qrId = 0;
    uint32_t packetType = 0;
};

uint32_t ChallengeValue(ChallengeKind kind);
std::vector<uint8_t> EncodeChallenge(ChallengeKind kind);

ResponseTag SplitResponseTag(uint32_t header);
bool IsValidServerResponseTag(const ResponseTag &tag);

// Header fields are skipped; records run until the buffer is exhausted and a
// trailing partial record is dropped. A buffer too short for the header
// yields an empty list and a failure.
std::vector<ServerAddress> DecodeMasterResponse(std::span<const uint8_t> buffer,
                                                DecodeFailure *failureOut = nullptr);

// Never throws. On any rejection or truncation the returned record has
// responded == false and failureOut (when given) says why.
ServerInfo DecodeGameServerResponse(std::span<const uint8_t> buffer,
                                    const ServerAddress &address,
                                    DecodeFailure *failureOut = nullptr,
                                    uint32_t clientVersion = CLIENT_VERSION);

} // namespace odal::codec
