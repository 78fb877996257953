#include "client/client_info.hpp"
#include "client/region_provider.hpp"
#include "client/rtc_peer_transport.hpp"
#include "client/session_engine.hpp"
#include "client/signal_socket.hpp"
#include "common/config.hpp"
#include "common/http_client.hpp"
#include "common/logger.hpp"
#include "common/retry.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace livelink;
using namespace livelink::client;

namespace {

auto& log() { return Logger::get("client.main"); }

void print_usage(const char* program) {
    std::cout << "LiveLink Client\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Config file (default: client.json)\n"
              << "  -u, --url <url>       Session server URL (overrides config)\n"
              << "  -t, --token <token>   Access token (overrides config)\n"
              << "  -l, --log-level <l>   Log level: trace/debug/info/warn/error\n"
              << "  -h, --help            Show help\n\n"
              << "Examples:\n"
              << "  " << program << " -c client.json\n"
              << "  " << program << " -u wss://media.example.com -t <TOKEN>\n"
              << std::endl;
}

EngineOptions make_engine_options(const ClientConfig& config) {
    EngineOptions options;
    options.signal.auto_subscribe = config.auto_subscribe;
    options.signal.adaptive_stream = config.adaptive_stream;
    options.signal.websocket_timeout = config.websocket_timeout;
    options.peer_connection_timeout = config.peer_connection_timeout;
    options.max_retries = config.max_retries;

    for (const auto& s : config.ice_servers) {
        IceServer server;
        server.urls = s.urls;
        server.username = s.username;
        server.credential = s.credential;
        options.rtc_config.ice_servers.push_back(std::move(server));
    }
    if (config.force_relay) {
        options.rtc_config.ice_transport_policy = IceTransportPolicy::RELAY;
    }
    return options;
}

std::shared_ptr<ReconnectPolicy> make_reconnect_policy(const ClientConfig& config) {
    if (config.reconnect_delays.empty()) {
        return std::make_shared<DefaultReconnectPolicy>(DefaultReconnectPolicy::default_delays(),
                                                        config.reconnect_jitter);
    }
    return std::make_shared<FixedReconnectPolicy>(config.reconnect_delays);
}

// Log engine lifecycle; handles stay alive for the whole run
SubscriptionList watch_engine(SessionEngine& engine) {
    SubscriptionList subs;
    auto& bus = engine.events();

    subs.push_back(bus.subscribe<engine_events::Connected>([](const engine_events::Connected& ev) {
        log().info("connected to room '{}' ({} other participants)", ev.join.room().name(),
                   ev.join.other_participants_size());
    }));
    subs.push_back(bus.subscribe<engine_events::Disconnected>([](const engine_events::Disconnected& ev) {
        if (ev.reason) {
            log().warn("disconnected: {}", proto::DisconnectReason_Name(*ev.reason));
        } else {
            log().warn("disconnected");
        }
    }));
    subs.push_back(bus.subscribe<engine_events::Resuming>([](const engine_events::Resuming&) {
        log().info("resuming connection");
    }));
    subs.push_back(bus.subscribe<engine_events::Resumed>([](const engine_events::Resumed&) {
        log().info("connection resumed");
    }));
    subs.push_back(bus.subscribe<engine_events::Restarting>([](const engine_events::Restarting&) {
        log().info("restarting connection");
    }));
    subs.push_back(bus.subscribe<engine_events::Restarted>([](const engine_events::Restarted&) {
        log().info("connection restarted");
    }));
    subs.push_back(bus.subscribe<engine_events::Offline>([](const engine_events::Offline&) {
        log().warn("network appears to be offline");
    }));
    subs.push_back(bus.subscribe<engine_events::ParticipantUpdate>(
        [](const engine_events::ParticipantUpdate& ev) {
            for (const auto& p : ev.participants) {
                log().info("participant {} ({}) state {}", p.identity(), p.sid(),
                           proto::ParticipantInfo_State_Name(p.state()));
            }
        }));
    subs.push_back(bus.subscribe<engine_events::DataPacketReceived>(
        [](const engine_events::DataPacketReceived& ev) {
            log().info("{} data from {}: {} bytes", data_packet_kind_name(ev.kind),
                       ev.packet.participant_identity(), ev.packet.payload().size());
        }));
    subs.push_back(bus.subscribe<engine_events::TokenRefreshed>([](const engine_events::TokenRefreshed&) {
        log().debug("access token refreshed");
    }));
    return subs;
}

asio::awaitable<void> run_session(std::shared_ptr<SessionEngine> engine, ClientConfig config,
                                  asio::io_context& ioc) {
    auto joined = co_await engine->join(config.url, config.token);
    if (!joined) {
        log().error("could not join: {}", joined.error().describe());
        ioc.stop();
        co_return;
    }
    log().info("joined as {} ({}), server {} region {}", joined->participant().identity(),
               joined->participant().sid(), joined->server_version(), joined->server_region());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path = "client.json";
    std::optional<std::string> url;
    std::optional<std::string> token;
    std::optional<std::string> log_level;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-u" || arg == "--url") && i + 1 < argc) {
            url = argv[++i];
        } else if ((arg == "-t" || arg == "--token") && i + 1 < argc) {
            token = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // A missing file is fine when url and token come from the command line
    ClientConfig config;
    auto loaded = ClientConfig::load(config_path);
    if (loaded) {
        config = std::move(*loaded);
    } else if (loaded.error() != ConfigError::FILE_NOT_FOUND || !url || !token) {
        std::cerr << "Error: " << config_error_message(loaded.error()) << " (" << config_path << ")\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (url) config.url = *url;
    if (token) config.token = *token;
    if (log_level) config.log_level = *log_level;

    auto log_config = config.log_config();
    log_config.apply_env();
    LogManager::instance().init(log_config);

    if (auto valid = config.validate(); !valid) {
        log().error("invalid configuration: {}", config_error_message(valid.error()));
        return 1;
    }

    auto info = ClientInfo::current();
    log().info("LiveLink client starting, sdk {} {}, protocol {}", info.sdk, info.version, info.protocol);

    try {
        asio::io_context ioc;
        auto ex = ioc.get_executor();

        EngineDependencies deps;
        deps.sockets = std::make_shared<BeastSignalSocketFactory>(ex);
        deps.http = std::make_shared<BeastHttpClient>(ex);
        deps.transports = std::make_shared<RtcPeerTransportFactory>(ex);
        deps.reconnect_policy = make_reconnect_policy(config);
        deps.signal_settings.use_json = config.use_json;
        deps.signal_settings.signal_latency = config.signal_latency;

        auto engine = std::make_shared<SessionEngine>(ex, make_engine_options(config), std::move(deps));
        if (config.region_failover) {
            engine->set_region_url_provider(
                std::make_shared<RegionUrlProvider>(config.url, config.token, std::make_shared<BeastHttpClient>(ex)));
        }

        auto subs = watch_engine(*engine);

        // Closing the engine lets the io_context run out of work
        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](boost::system::error_code ec, int signal_number) {
            if (ec) return;
            log().info("Received signal {}, shutting down...", signal_number);
            asio::co_spawn(ioc, [engine]() -> asio::awaitable<void> {
                co_await engine->client().send_leave();
                co_await engine->close();
            }, asio::detached);
        });

        auto closing = engine->events().subscribe<engine_events::Closing>(
            [&signals](const engine_events::Closing&) {
                boost::system::error_code ignored;
                signals.cancel(ignored);
            });

        asio::co_spawn(ioc, run_session(engine, config, ioc), asio::detached);
        ioc.run();

        log().info("client stopped");
        LogManager::instance().shutdown();
        return 0;
    } catch (const std::exception& e) {
        log().fatal("Fatal error: {}", e.what());
        LogManager::instance().shutdown();
        return 1;
    }
}
