#pragma once

#include "common/logger.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <unordered_map>
#include <vector>

namespace livelink {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Client Configuration
// ============================================================================

struct IceServerConfig {
    std::vector<std::string> urls;  // stun:host:port, turn:host:port?transport=udp
    std::string username;
    std::string credential;
};

struct ClientConfig {
    // Session server, ws(s):// or http(s)://
    std::string url;
    std::string token;

    // Connect options
    bool auto_subscribe = true;
    bool adaptive_stream = false;
    uint32_t max_retries = 1;  // extra join attempts when the server is unreachable
    std::chrono::milliseconds websocket_timeout{15000};
    std::chrono::milliseconds peer_connection_timeout{15000};
    bool use_json = false;  // JSON signaling instead of binary protobuf
    std::chrono::milliseconds signal_latency{0};  // simulated, for testing only

    // RTC
    std::vector<IceServerConfig> ice_servers;
    bool force_relay = false;

    // Reconnect (empty delays = built-in table)
    std::vector<std::chrono::milliseconds> reconnect_delays;
    std::chrono::milliseconds reconnect_jitter{1000};

    // Multi-region failover for cloud deployments
    bool region_failover = true;

    // Logging
    std::string log_level = "info";
    std::string log_file;
    std::unordered_map<std::string, std::string> module_log_levels;

    LogConfig log_config() const;

    // Load from JSON file
    static std::expected<ClientConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<ClientConfig, ConfigError> parse(const std::string& json_content);

    // Required fields present and URL scheme usable
    std::expected<void, ConfigError> validate() const;
};

} // namespace livelink
