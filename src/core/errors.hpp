#pragma once

#include <stdexcept>
#include <string>

// Failure classes that end a connection attempt.
enum class ErrorKind {
    ConnectTimeout,
    ConnectionRefused,
    AuthExhausted,
    TrustMismatch,
    TrustDeclined,
    ListenerBindFailure,
    Protocol,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConnectTimeout:      return "connect timeout";
    case ErrorKind::ConnectionRefused:   return "connection refused";
    case ErrorKind::AuthExhausted:       return "authentication failed";
    case ErrorKind::TrustMismatch:       return "host key mismatch";
    case ErrorKind::TrustDeclined:       return "host key declined";
    case ErrorKind::ListenerBindFailure: return "listener bind failure";
    case ErrorKind::Protocol:            return "ssh error";
    }
    return "error";
}

// Only transport-level connect failures are worth another attempt.
inline bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::ConnectTimeout || kind == ErrorKind::ConnectionRefused;
}

class SessionError : public std::runtime_error {
public:
    SessionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    bool retryable() const { return is_retryable(kind_); }

private:
    ErrorKind kind_;
};
