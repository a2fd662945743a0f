#pragma once

#include <stdexcept>
#include <string>

namespace cassette {

enum class ErrorKind {
    SnapshotNotFound,
    SnapshotExhausted,
    CallMismatch,
    ParseError,
    PersistenceError,
    InvalidState
};

inline const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::SnapshotNotFound:
        return "SnapshotNotFound";
    case ErrorKind::SnapshotExhausted:
        return "SnapshotExhausted";
    case ErrorKind::CallMismatch:
        return "CallMismatch";
    case ErrorKind::ParseError:
        return "ParseError";
    case ErrorKind::PersistenceError:
        return "PersistenceError";
    case ErrorKind::InvalidState:
        return "InvalidState";
    }
    return "Unknown";
}

// Failure of the record/replay machinery itself. Always fatal for the scenario.
class HarnessError : public std::runtime_error {
public:
    HarnessError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const
    {
        return m_kind;
    }

private:
    ErrorKind m_kind;
};

// Failure reported by the wrapped client, live or replayed from a snapshot.
// statusCode is the HTTP status, or 0 when the request never got a response.
class UpstreamError : public std::runtime_error {
public:
    explicit UpstreamError(const std::string &message, int statusCode = 0)
        : std::runtime_error(message)
        , m_statusCode(statusCode)
    {
    }

    int statusCode() const
    {
        return m_statusCode;
    }

private:
    int m_statusCode;
};

} // namespace cassette
