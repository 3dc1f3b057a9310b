#include "protocol/query_error.hpp"

namespace odal {

const char *QueryErrorKindName(QueryErrorKind kind) {
    switch (kind) {
        case QueryErrorKind::Timeout:
            return "timeout";
        case QueryErrorKind::MalformedResponse:
            return "malformed response";
        case QueryErrorKind::UnsupportedVersion:
            return "unsupported version";
        case QueryErrorKind::TransportError:
            return "transport error";
        case QueryErrorKind::NotFound:
            return "not found";
        case QueryErrorKind::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

QueryError::QueryError(QueryErrorKind kind, const std::string &message, bool removeServer)
    : std::runtime_error(message), errorKind(kind), remove(removeServer) {}

} // namespace odal
