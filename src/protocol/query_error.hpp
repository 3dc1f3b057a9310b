#pragma once

#include <stdexcept>
#include <string>

namespace odal {

enum class QueryErrorKind {
    Timeout,
    MalformedResponse,
    UnsupportedVersion,
    TransportError,
    NotFound,
    Cancelled
};

const char *QueryErrorKindName(QueryErrorKind kind);

class QueryError : public std::runtime_error {
public:
    QueryError(QueryErrorKind kind, const std::string &message, bool removeServer = false);

    QueryErrorKind kind() const noexcept {
        return errorKind;
    }

    // The server should be dropped from the list rather than retried.
    bool removeServer() const noexcept {
        return remove;
    }

private:
    QueryErrorKind errorKind;
    bool remove;
};

} // namespace odal
