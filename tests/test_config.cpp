#include <gtest/gtest.h>
#include "common/config.hpp"
#include "common/logger.hpp"

#include <cstdio>
#include <fstream>

using namespace livelink;
using namespace std::chrono_literals;

TEST(ClientConfig, Defaults) {
    auto config = ClientConfig::parse("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->auto_subscribe);
    EXPECT_FALSE(config->adaptive_stream);
    EXPECT_EQ(config->max_retries, 1u);
    EXPECT_EQ(config->websocket_timeout, 15000ms);
    EXPECT_EQ(config->peer_connection_timeout, 15000ms);
    EXPECT_FALSE(config->force_relay);
    EXPECT_TRUE(config->reconnect_delays.empty());
    EXPECT_TRUE(config->region_failover);
    EXPECT_EQ(config->log_level, "info");
}

TEST(ClientConfig, ParsesAllSections) {
    auto config = ClientConfig::parse(R"({
        "server": {"url": "wss://media.example.com", "token": "abc"},
        "connect": {
            "auto_subscribe": false,
            "adaptive_stream": true,
            "use_json": true,
            "max_retries": 3,
            "websocket_timeout_ms": 5000,
            "peer_connection_timeout_ms": 8000,
            "signal_latency_ms": 20
        },
        "rtc": {
            "ice_servers": [
                {"urls": ["stun:stun.example.com:3478"]},
                {"urls": "turn:turn.example.com:3478", "username": "u", "credential": "p"},
                {"username": "no-urls"}
            ],
            "ice_transport_policy": "relay"
        },
        "reconnect": {"delays_ms": [0, 500, 1000], "jitter_ms": 0},
        "region": {"enabled": false},
        "log": {"level": "debug", "file": "/tmp/livelink.log", "modules": {"client.signal": "trace"}}
    })");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->url, "wss://media.example.com");
    EXPECT_EQ(config->token, "abc");
    EXPECT_FALSE(config->auto_subscribe);
    EXPECT_TRUE(config->adaptive_stream);
    EXPECT_TRUE(config->use_json);
    EXPECT_EQ(config->max_retries, 3u);
    EXPECT_EQ(config->websocket_timeout, 5000ms);
    EXPECT_EQ(config->peer_connection_timeout, 8000ms);
    EXPECT_EQ(config->signal_latency, 20ms);

    ASSERT_EQ(config->ice_servers.size(), 2u);
    EXPECT_EQ(config->ice_servers[0].urls[0], "stun:stun.example.com:3478");
    EXPECT_EQ(config->ice_servers[1].urls[0], "turn:turn.example.com:3478");
    EXPECT_EQ(config->ice_servers[1].credential, "p");
    EXPECT_TRUE(config->force_relay);

    EXPECT_EQ(config->reconnect_delays, (std::vector<std::chrono::milliseconds>{0ms, 500ms, 1000ms}));
    EXPECT_EQ(config->reconnect_jitter, 0ms);
    EXPECT_FALSE(config->region_failover);

    auto log = config->log_config();
    EXPECT_EQ(log.global_level, LogLevel::DEBUG);
    EXPECT_TRUE(log.file_enabled);
    EXPECT_EQ(log.file_path, "/tmp/livelink.log");
    EXPECT_EQ(log.module_levels.at("client.signal"), LogLevel::TRACE);
}

TEST(ClientConfig, RejectsUnknownTransportPolicy) {
    auto config = ClientConfig::parse(R"({"rtc": {"ice_transport_policy": "tcp"}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::INVALID_VALUE);
}

TEST(ClientConfig, RejectsNegativeValues) {
    auto retries = ClientConfig::parse(R"({"connect": {"max_retries": -1}})");
    ASSERT_FALSE(retries.has_value());
    EXPECT_EQ(retries.error(), ConfigError::INVALID_VALUE);

    auto delays = ClientConfig::parse(R"({"reconnect": {"delays_ms": [100, -5]}})");
    ASSERT_FALSE(delays.has_value());
    EXPECT_EQ(delays.error(), ConfigError::INVALID_VALUE);
}

TEST(ClientConfig, ParseErrors) {
    EXPECT_EQ(ClientConfig::parse("{not json").error(), ConfigError::PARSE_ERROR);
    EXPECT_EQ(ClientConfig::parse("[1, 2]").error(), ConfigError::PARSE_ERROR);
}

TEST(ClientConfig, LoadFromFile) {
    EXPECT_EQ(ClientConfig::load("/nonexistent/livelink.json").error(), ConfigError::FILE_NOT_FOUND);

    std::string path = ::testing::TempDir() + "livelink_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"server": {"url": "https://example.com", "token": "t"}})";
    }
    auto config = ClientConfig::load(path);
    std::remove(path.c_str());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->url, "https://example.com");
}

TEST(ClientConfig, Validate) {
    ClientConfig config;
    EXPECT_EQ(config.validate().error(), ConfigError::MISSING_REQUIRED);

    config.url = "wss://example.com";
    EXPECT_EQ(config.validate().error(), ConfigError::MISSING_REQUIRED);

    config.token = "t";
    EXPECT_TRUE(config.validate().has_value());

    config.url = "http://example.com";
    EXPECT_TRUE(config.validate().has_value());

    config.url = "ftp://example.com";
    EXPECT_EQ(config.validate().error(), ConfigError::INVALID_VALUE);

    config.url = "example.com";
    EXPECT_EQ(config.validate().error(), ConfigError::INVALID_VALUE);
}

TEST(ClientConfig, ErrorMessages) {
    EXPECT_EQ(config_error_message(ConfigError::FILE_NOT_FOUND), "Configuration file not found");
    EXPECT_EQ(config_error_message(ConfigError::MISSING_REQUIRED), "Missing required configuration");
}

// ============================================================================
// Logging
// ============================================================================

TEST(Logging, LevelNames) {
    EXPECT_EQ(log_level_from_string("WARNING"), LogLevel::WARN);
    EXPECT_EQ(log_level_from_string("critical"), LogLevel::FATAL);
    EXPECT_EQ(log_level_from_string("trace"), LogLevel::TRACE);
    EXPECT_EQ(log_level_to_string(LogLevel::ERROR), "error");
}

TEST(Logging, ModuleLevelsFollowParent) {
    auto& manager = LogManager::instance();
    auto& child = Logger::get("test.parent.child");

    manager.set_module_level("test.parent", LogLevel::ERROR);
    EXPECT_EQ(child.get_level(), LogLevel::ERROR);

    manager.set_module_level("test.parent.child", LogLevel::DEBUG);
    EXPECT_EQ(child.get_level(), LogLevel::DEBUG);

    manager.clear_module_level("test.parent.child");
    manager.clear_module_level("test.parent");
    EXPECT_EQ(child.get_level(), manager.get_global_level());
    EXPECT_FALSE(manager.get_module_level("test.parent").has_value());
}
