#pragma once

#include <expected>
#include <string>

namespace livelink {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    CONNECTION                  = 1,   // see ConnectionErrorReason
    UNSUPPORTED_SERVER          = 10,
    UNEXPECTED_CONNECTION_STATE = 12,  // torn down engine or coordinator, never retried
    NEGOTIATION                 = 13,  // SDP round trip failed, next reconnect is a full restart
    PUBLISH_DATA                = 14,
    SIGNAL_RECONNECT            = 15,  // any other failure inside a reconnect attempt
    TRACK_PUBLISH               = 16,
};

enum class ConnectionErrorReason {
    NONE,
    NOT_ALLOWED,
    SERVER_UNREACHABLE,
    INTERNAL_ERROR,
    CANCELLED,
    LEAVE_REQUEST,
    TIMEOUT,
};

const char* error_code_name(ErrorCode code);
const char* connection_error_reason_name(ConnectionErrorReason reason);

struct Error {
    ErrorCode code = ErrorCode::CONNECTION;
    ConnectionErrorReason reason = ConnectionErrorReason::NONE;
    std::string message;
    int status = 0;  // HTTP status for errors from the validation request

    static Error connection(std::string message,
                            ConnectionErrorReason reason = ConnectionErrorReason::NONE,
                            int status = 0) {
        return Error{ErrorCode::CONNECTION, reason, std::move(message), status};
    }

    static Error unexpected_state(std::string message) {
        return Error{ErrorCode::UNEXPECTED_CONNECTION_STATE, ConnectionErrorReason::NONE,
                     std::move(message), 0};
    }

    static Error negotiation(std::string message) {
        return Error{ErrorCode::NEGOTIATION, ConnectionErrorReason::NONE, std::move(message), 0};
    }

    static Error signal_reconnect(std::string message = "could not reconnect signal") {
        return Error{ErrorCode::SIGNAL_RECONNECT, ConnectionErrorReason::NONE, std::move(message), 0};
    }

    static Error publish_data(std::string message) {
        return Error{ErrorCode::PUBLISH_DATA, ConnectionErrorReason::NONE, std::move(message), 0};
    }

    static Error track_publish(std::string message) {
        return Error{ErrorCode::TRACK_PUBLISH, ConnectionErrorReason::NONE, std::move(message), 0};
    }

    bool is(ErrorCode c) const { return code == c; }
    bool is(ConnectionErrorReason r) const { return code == ErrorCode::CONNECTION && reason == r; }

    // "CONNECTION/NOT_ALLOWED (401): <message>"
    std::string describe() const;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

} // namespace livelink
