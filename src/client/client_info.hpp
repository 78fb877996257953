#pragma once

#include "common/url_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace livelink::client {

inline constexpr const char* kSdkName = "cpp";
inline constexpr const char* kSdkVersion = "1.0.0";
inline constexpr int32_t kProtocolVersion = 12;

// Client identification sent with every signal connection
struct ClientInfo {
    std::string sdk = kSdkName;
    std::string version = kSdkVersion;
    int32_t protocol = kProtocolVersion;
    std::string os;
    std::string os_version;
    std::string device_model;

    // Filled from uname() and compile-time platform macros
    static ClientInfo current();
};

// Per-connection options that end up in the /rtc query string
struct ConnectionParams {
    bool auto_subscribe = true;
    bool adaptive_stream = false;
    bool reconnect = false;
    std::optional<std::string> sid;           // only sent with reconnect
    std::optional<int> reconnect_reason;      // proto::ReconnectReason value
    std::optional<std::string> network;       // wifi, wired, cellular
};

QueryParams make_connection_params(const std::string& token, const ClientInfo& info,
                                   const ConnectionParams& params);

} // namespace livelink::client
