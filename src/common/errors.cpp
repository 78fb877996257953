#include "common/errors.hpp"

namespace livelink {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECTION:                  return "CONNECTION";
        case ErrorCode::UNSUPPORTED_SERVER:          return "UNSUPPORTED_SERVER";
        case ErrorCode::UNEXPECTED_CONNECTION_STATE: return "UNEXPECTED_CONNECTION_STATE";
        case ErrorCode::NEGOTIATION:                 return "NEGOTIATION";
        case ErrorCode::PUBLISH_DATA:                return "PUBLISH_DATA";
        case ErrorCode::SIGNAL_RECONNECT:            return "SIGNAL_RECONNECT";
        case ErrorCode::TRACK_PUBLISH:               return "TRACK_PUBLISH";
        default:                                     return "UNKNOWN";
    }
}

const char* connection_error_reason_name(ConnectionErrorReason reason) {
    switch (reason) {
        case ConnectionErrorReason::NONE:               return "NONE";
        case ConnectionErrorReason::NOT_ALLOWED:        return "NOT_ALLOWED";
        case ConnectionErrorReason::SERVER_UNREACHABLE: return "SERVER_UNREACHABLE";
        case ConnectionErrorReason::INTERNAL_ERROR:     return "INTERNAL_ERROR";
        case ConnectionErrorReason::CANCELLED:          return "CANCELLED";
        case ConnectionErrorReason::LEAVE_REQUEST:      return "LEAVE_REQUEST";
        case ConnectionErrorReason::TIMEOUT:            return "TIMEOUT";
        default:                                        return "UNKNOWN";
    }
}

std::string Error::describe() const {
    std::string out = error_code_name(code);
    if (code == ErrorCode::CONNECTION && reason != ConnectionErrorReason::NONE) {
        out += '/';
        out += connection_error_reason_name(reason);
    }
    if (status != 0) {
        out += " (" + std::to_string(status) + ")";
    }
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace livelink
