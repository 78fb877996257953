#pragma once

#include "client/connection_state.hpp"
#include "client/engine_events.hpp"
#include "client/peer_transport.hpp"
#include "client/region_provider.hpp"
#include "client/signal_client.hpp"
#include "client/transport_coordinator.hpp"
#include "common/async_event.hpp"
#include "common/async_mutex.hpp"
#include "common/cancel_signal.hpp"
#include "common/errors.hpp"
#include "common/event_bus.hpp"
#include "common/http_client.hpp"
#include "common/retry.hpp"

#include "livelink_rtc.pb.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace livelink::client {

namespace asio = boost::asio;

struct EngineOptions {
    SignalOptions signal;
    std::chrono::milliseconds peer_connection_timeout{15000};

    // Join attempts on SERVER_UNREACHABLE, first attempt included
    uint32_t max_retries = 1;

    // How long add_track waits for the server to acknowledge a cid
    std::chrono::milliseconds publish_timeout{10000};

    // Fallback ICE configuration when the server sends none
    PeerTransportConfig rtc_config;
};

struct EngineDependencies {
    std::shared_ptr<SignalSocketFactory> sockets;
    std::shared_ptr<HttpClient> http;
    std::shared_ptr<PeerTransportFactory> transports;
    std::shared_ptr<ReconnectPolicy> reconnect_policy;
    SignalClientSettings signal_settings;
};

/// Drives one media session: signal join, transport setup, data channels,
/// publish correlation, and recovery through resume or full restart.
///
/// Create with std::make_shared. All work runs on the given executor.
class SessionEngine : public std::enable_shared_from_this<SessionEngine> {
public:
    static constexpr const char* kLossyChannel = "_lossy";
    static constexpr const char* kReliableChannel = "_reliable";
    static constexpr size_t kBufferedAmountLowThreshold = 64 * 1024;
    static constexpr std::chrono::milliseconds kMinReconnectWait{2000};
    static constexpr std::chrono::milliseconds kDataChannelPollInterval{50};

    SessionEngine(asio::any_io_executor ex, EngineOptions options, EngineDependencies deps);
    ~SessionEngine();

    SessionEngine(const SessionEngine&) = delete;
    SessionEngine& operator=(const SessionEngine&) = delete;

    EventBus& events() { return events_; }
    SignalClient& client() { return *client_; }
    TransportCoordinator* transports() { return coordinator_.get(); }

    SessionPhase phase() const { return phase_; }
    bool is_closed() const { return closed_; }
    bool full_reconnect_on_next() const { return full_reconnect_on_next_; }
    uint32_t reconnect_attempts() const { return reconnect_attempts_; }
    bool attempting_reconnect() const { return attempting_reconnect_; }
    bool reconnect_scheduled() const { return reconnect_scheduled_; }
    const std::optional<proto::JoinResponse>& latest_join_response() const { return latest_join_; }
    const std::string& token() const { return token_; }

    void set_region_url_provider(std::shared_ptr<RegionUrlProvider> provider) {
        region_provider_ = std::move(provider);
    }

    asio::awaitable<Result<proto::JoinResponse>> join(const std::string& url, const std::string& token,
                                                      CancelSignalPtr cancel = nullptr);

    // Serialized and idempotent
    asio::awaitable<void> close();

    // Requires the publisher and runs one offer/answer round
    asio::awaitable<VoidResult> negotiate();

    // ------------------------------------------------------------------------
    // Publishing
    // ------------------------------------------------------------------------

    /// Send an add-track request and wait for the server to acknowledge the cid.
    asio::awaitable<Result<proto::TrackInfo>> add_track(proto::AddTrackRequest request);

    /// Abandon a pending publication. Returns false when cid is not pending.
    bool remove_track(const std::string& cid);

    size_t pending_publish_count() const { return pending_publishes_.size(); }

    // ------------------------------------------------------------------------
    // Data
    // ------------------------------------------------------------------------
    asio::awaitable<VoidResult> send_data_packet(proto::DataPacket packet, DataPacketKind kind);

    // nullopt when the channel for kind does not exist
    std::optional<bool> is_buffer_status_low(DataPacketKind kind) const;

    // ------------------------------------------------------------------------
    // Recovery
    // ------------------------------------------------------------------------
    // retry_reason describes the failure handed to the reconnect policy
    void handle_disconnect(const std::string& source, proto::ReconnectReason reason = proto::RR_UNKNOWN,
                           std::optional<std::string> retry_reason = std::nullopt);

    // Skip the pending backoff delay
    void handle_network_online();

private:
    struct PendingPublish {
        explicit PendingPublish(asio::any_io_executor ex) : done(std::move(ex)) {}

        void finish(Result<proto::TrackInfo> r) {
            if (result) return;
            result = std::move(r);
            done.set();
        }

        AsyncEvent done;
        std::optional<Result<proto::TrackInfo>> result;
    };

    asio::awaitable<Result<proto::JoinResponse>> do_join(std::string url, std::string token,
                                                         CancelSignalPtr cancel);

    void setup_signal_subscriptions();
    void configure(const proto::JoinResponse& join);
    PeerTransportConfig make_rtc_config(const google::protobuf::RepeatedPtrField<proto::ICEServer>& servers,
                                        const proto::ClientConfiguration& client_config) const;

    void on_transport_state(TransportState state, TransportState publisher, TransportState subscriber);

    // Signal event handlers
    void on_signal_answer(const signal_events::Answer& ev);
    void on_signal_offer(const signal_events::Offer& ev);
    void on_signal_trickle(const signal_events::Trickle& ev);
    void on_signal_leave(const signal_events::Leave& ev);
    void on_track_published(const signal_events::LocalTrackPublished& ev);
    void on_token_refresh(const signal_events::TokenRefresh& ev);

    // Reconnection
    void schedule_reconnect(std::chrono::milliseconds delay, proto::ReconnectReason reason);
    void clear_reconnect_timeout();
    void clear_pending_reconnect();
    std::optional<std::chrono::milliseconds> next_retry_delay(const ReconnectContext& context);

    asio::awaitable<void> attempt_reconnect(proto::ReconnectReason reason);
    asio::awaitable<VoidResult> restart_connection(std::optional<std::string> region_url = std::nullopt);
    asio::awaitable<VoidResult> restart_once(const std::optional<std::string>& region_url);
    asio::awaitable<VoidResult> resume_connection(proto::ReconnectReason reason);
    asio::awaitable<VoidResult> wait_for_pc_reconnected();

    asio::awaitable<void> cleanup_peer_connections();
    asio::awaitable<void> cleanup_client();

    // Data channels
    void create_data_channels();
    void close_data_channels();
    void handle_subscriber_data_channel(std::shared_ptr<DataChannel> channel);
    DataChannelCallbacks make_data_channel_callbacks(DataPacketKind kind, bool publisher_side);
    asio::awaitable<void> handle_data_message(std::string data);
    std::shared_ptr<DataChannel> data_channel_for_kind(DataPacketKind kind, bool subscriber = false) const;
    void update_and_emit_buffer_status(DataPacketKind kind);
    asio::awaitable<VoidResult> ensure_data_transport_connected(DataPacketKind kind, bool subscriber);

    asio::awaitable<void> run_negotiation();
    void reject_pending_publishes(const Error& error);

    void spawn(asio::awaitable<void> task, const char* what);

    asio::any_io_executor ex_;
    EngineOptions options_;
    EngineDependencies deps_;

    std::shared_ptr<SignalClient> client_;
    std::shared_ptr<TransportCoordinator> coordinator_;
    std::shared_ptr<RegionUrlProvider> region_provider_;
    EventBus events_;
    SubscriptionList signal_subs_;

    std::string url_;
    std::string token_;
    std::string participant_sid_;
    std::optional<proto::JoinResponse> latest_join_;
    std::optional<proto::ClientConfiguration> client_configuration_;
    bool subscriber_primary_ = false;

    SessionPhase phase_ = SessionPhase::NEW;
    // True until the first successful join, and again after close()
    bool closed_ = true;
    CancelSignalPtr close_signal_ = CancelSignal::create();
    AsyncEvent closed_event_;

    bool full_reconnect_on_next_ = false;
    bool attempting_reconnect_ = false;
    uint32_t reconnect_attempts_ = 0;
    uint32_t join_attempts_ = 0;
    std::chrono::steady_clock::time_point reconnect_start_{};

    asio::steady_timer reconnect_timer_;
    bool reconnect_scheduled_ = false;
    uint64_t reconnect_generation_ = 0;
    proto::ReconnectReason scheduled_reason_ = proto::RR_UNKNOWN;

    std::map<std::string, std::shared_ptr<PendingPublish>> pending_publishes_;

    std::shared_ptr<DataChannel> lossy_dc_;
    std::shared_ptr<DataChannel> reliable_dc_;
    std::shared_ptr<DataChannel> lossy_dc_sub_;
    std::shared_ptr<DataChannel> reliable_dc_sub_;
    std::map<DataPacketKind, bool> buffer_status_;
    AsyncEvent data_channel_event_;

    AsyncMutex close_lock_;
    AsyncMutex data_lock_;
};

} // namespace livelink::client
