#include "common/config.hpp"
#include "common/logger.hpp"
#include <boost/json.hpp>
#include <fstream>
#include <sstream>

namespace json = boost::json;

// Safe JSON field accessors with defaults
namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

int64_t jint(const json::object& obj, std::string_view key, int64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_int64()) return it->value().as_int64();
        if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

const json::array* jarray(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_array())
        return &it->value().as_array();
    return nullptr;
}

bool has_scheme(const std::string& url, std::string_view scheme) {
    return url.size() > scheme.size() + 3 &&
           url.compare(0, scheme.size(), scheme) == 0 &&
           url.compare(scheme.size(), 3, "://") == 0;
}

}  // anonymous namespace

namespace livelink {

namespace {
auto& log() { return Logger::get("common.config"); }
}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

LogConfig ClientConfig::log_config() const {
    LogConfig cfg;
    cfg.global_level = log_level_from_string(log_level);
    if (!log_file.empty()) {
        cfg.file_enabled = true;
        cfg.file_path = log_file;
    }
    for (const auto& [module, level] : module_log_levels) {
        cfg.module_levels[module] = log_level_from_string(level);
    }
    return cfg;
}

std::expected<ClientConfig, ConfigError> ClientConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<ClientConfig, ConfigError> ClientConfig::parse(const std::string& json_content) {
    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            log().error("Config root must be an object");
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        auto& root = jv.as_object();

        ClientConfig config;

        // server section
        if (auto* server = jsection(root, "server")) {
            config.url = jstr(*server, "url");
            config.token = jstr(*server, "token");
        }

        // connect section
        if (auto* connect = jsection(root, "connect")) {
            config.auto_subscribe = jbool(*connect, "auto_subscribe", config.auto_subscribe);
            config.adaptive_stream = jbool(*connect, "adaptive_stream", config.adaptive_stream);
            config.use_json = jbool(*connect, "use_json", config.use_json);

            auto retries = jint(*connect, "max_retries", config.max_retries);
            if (retries < 0) {
                log().error("connect.max_retries must not be negative");
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.max_retries = static_cast<uint32_t>(retries);

            if (auto v = jint(*connect, "websocket_timeout_ms"); v > 0)
                config.websocket_timeout = std::chrono::milliseconds(v);
            if (auto v = jint(*connect, "peer_connection_timeout_ms"); v > 0)
                config.peer_connection_timeout = std::chrono::milliseconds(v);
            if (auto v = jint(*connect, "signal_latency_ms"); v > 0)
                config.signal_latency = std::chrono::milliseconds(v);
        }

        // rtc section
        if (auto* rtc = jsection(root, "rtc")) {
            if (auto* servers = jarray(*rtc, "ice_servers")) {
                for (const auto& item : *servers) {
                    if (!item.is_object()) continue;
                    const auto& obj = item.as_object();

                    IceServerConfig server;
                    if (auto* urls = jarray(obj, "urls")) {
                        for (const auto& u : *urls) {
                            if (u.is_string()) server.urls.emplace_back(u.as_string());
                        }
                    } else if (auto single = jstr(obj, "urls"); !single.empty()) {
                        server.urls.push_back(single);
                    }
                    server.username = jstr(obj, "username");
                    server.credential = jstr(obj, "credential");

                    if (!server.urls.empty()) config.ice_servers.push_back(std::move(server));
                }
            }

            auto policy = jstr(*rtc, "ice_transport_policy", "all");
            if (policy == "relay") {
                config.force_relay = true;
            } else if (policy != "all") {
                log().error("Unknown rtc.ice_transport_policy: {}", policy);
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
        }

        // reconnect section
        if (auto* reconnect = jsection(root, "reconnect")) {
            if (auto* delays = jarray(*reconnect, "delays_ms")) {
                for (const auto& d : *delays) {
                    if (d.is_int64() && d.as_int64() >= 0) {
                        config.reconnect_delays.emplace_back(d.as_int64());
                    } else if (d.is_uint64()) {
                        config.reconnect_delays.emplace_back(static_cast<int64_t>(d.as_uint64()));
                    } else {
                        log().error("reconnect.delays_ms must hold non-negative integers");
                        return std::unexpected(ConfigError::INVALID_VALUE);
                    }
                }
            }
            if (auto v = jint(*reconnect, "jitter_ms", -1); v >= 0)
                config.reconnect_jitter = std::chrono::milliseconds(v);
        }

        // region section
        if (auto* region = jsection(root, "region")) {
            config.region_failover = jbool(*region, "enabled", config.region_failover);
        }

        // log section
        if (auto* log_sec = jsection(root, "log")) {
            config.log_level = jstr(*log_sec, "level", config.log_level);
            config.log_file = jstr(*log_sec, "file", config.log_file);
            if (auto* modules = jsection(*log_sec, "modules")) {
                for (const auto& [key, value] : *modules) {
                    if (value.is_string())
                        config.module_log_levels[std::string(key)] = std::string(value.as_string());
                }
            }
        }

        return config;

    } catch (const boost::system::system_error& e) {
        log().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        log().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
}

std::expected<void, ConfigError> ClientConfig::validate() const {
    if (url.empty() || token.empty()) {
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    if (!has_scheme(url, "ws") && !has_scheme(url, "wss") &&
        !has_scheme(url, "http") && !has_scheme(url, "https")) {
        log().error("Unsupported server url scheme: {}", url);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    return {};
}

} // namespace livelink
