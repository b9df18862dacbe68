#pragma once

#include <exception>
#include <string>
#include <utility>

namespace rtufetch {

enum class ErrorCode {
    InvalidInput,     // Empty station set, start after end, malformed date
    InvalidState,     // Request not allowed in the session's current state
    ConnectionFailed, // Authentication failure or unreachable host
    TransferFailed,   // Single file could not be retrieved
    IOError,          // Local filesystem error
    ConfigError,      // Configuration file missing or invalid
    UnknownServer     // No server configured under the given id
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput:     return "InvalidInput";
        case ErrorCode::InvalidState:     return "InvalidState";
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::TransferFailed:   return "TransferFailed";
        case ErrorCode::IOError:          return "IOError";
        case ErrorCode::ConfigError:      return "ConfigError";
        case ErrorCode::UnknownServer:    return "UnknownServer";
        default:                          return "Unknown";
    }
}

class FetchError : public std::exception {
public:
    FetchError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        buildWhat();
    }

    FetchError(ErrorCode code, std::string context, std::string message)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        buildWhat();
    }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& context() const noexcept { return context_; }

private:
    void buildWhat() {
        what_ = std::string("[rtufetch::") + errorCodeToString(code_) + "] " + message_;
        if (!context_.empty()) {
            what_ += " (" + context_ + ")";
        }
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string what_;
};

} // namespace rtufetch
