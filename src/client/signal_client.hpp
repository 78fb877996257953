#pragma once

#include "client/client_info.hpp"
#include "client/connection_state.hpp"
#include "client/peer_transport.hpp"
#include "client/signal_socket.hpp"
#include "common/async_event.hpp"
#include "common/async_mutex.hpp"
#include "common/cancel_signal.hpp"
#include "common/errors.hpp"
#include "common/event_bus.hpp"
#include "common/http_client.hpp"

#include "livelink_rtc.pb.h"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace livelink::client {

namespace asio = boost::asio;

// ============================================================================
// Signal events - server messages after the channel is established
// ============================================================================
namespace signal_events {

struct Answer : TypedEvent<Answer> {
    SessionDescription description;
};

struct Offer : TypedEvent<Offer> {
    SessionDescription description;
};

struct Trickle : TypedEvent<Trickle> {
    IceCandidate candidate;
    SignalTarget target = SignalTarget::PUBLISHER;
};

struct ParticipantUpdate : TypedEvent<ParticipantUpdate> {
    std::vector<proto::ParticipantInfo> participants;
};

struct LocalTrackPublished : TypedEvent<LocalTrackPublished> {
    proto::TrackPublishedResponse response;
};

struct SpeakersChanged : TypedEvent<SpeakersChanged> {
    std::vector<proto::SpeakerInfo> speakers;
};

struct Leave : TypedEvent<Leave> {
    proto::LeaveRequest leave;
};

struct RemoteMute : TypedEvent<RemoteMute> {
    std::string track_sid;
    bool muted = false;
};

struct RoomUpdate : TypedEvent<RoomUpdate> {
    proto::Room room;
};

struct ConnectionQuality : TypedEvent<ConnectionQuality> {
    proto::ConnectionQualityUpdate update;
};

struct StreamStateUpdate : TypedEvent<StreamStateUpdate> {
    proto::StreamStateUpdate update;
};

struct SubscribedQualityUpdate : TypedEvent<SubscribedQualityUpdate> {
    proto::SubscribedQualityUpdate update;
};

struct SubscriptionPermissionUpdate : TypedEvent<SubscriptionPermissionUpdate> {
    proto::SubscriptionPermissionUpdate update;
};

struct TokenRefresh : TypedEvent<TokenRefresh> {
    std::string token;
};

struct LocalTrackUnpublished : TypedEvent<LocalTrackUnpublished> {
    proto::TrackUnpublishedResponse response;
};

struct SubscriptionError : TypedEvent<SubscriptionError> {
    proto::SubscriptionResponse response;
};

// Legacy keepalive reply
struct Pong : TypedEvent<Pong> {
    int64_t timestamp = 0;
};

struct PongResp : TypedEvent<PongResp> {
    int64_t rtt = 0;
    proto::Pong pong;
};

// Channel lost after it was established (remote close, ping timeout)
struct SignalClosed : TypedEvent<SignalClosed> {
    std::string reason;
};

} // namespace signal_events

// ============================================================================
// SignalClient
// ============================================================================

struct SignalOptions {
    bool auto_subscribe = true;
    bool adaptive_stream = false;
    std::chrono::milliseconds websocket_timeout{15000};
    std::optional<std::string> network;
};

struct SignalClientSettings {
    bool use_json = false;
    std::chrono::milliseconds signal_latency{0};  // simulated, applied both ways
};

/// Client side of the signaling protocol.
///
/// One connect attempt at a time. While RECONNECTING, requests that are not
/// part of the reconnection handshake are queued and replayed in order by
/// set_reconnected(). Create with std::make_shared: detached work keeps the
/// client alive and socket handlers hold it weakly.
class SignalClient : public std::enable_shared_from_this<SignalClient> {
public:
    static constexpr std::chrono::milliseconds kCloseGrace{250};

    SignalClient(asio::any_io_executor ex,
                 std::shared_ptr<SignalSocketFactory> sockets,
                 std::shared_ptr<HttpClient> http,
                 SignalClientSettings settings = {});
    ~SignalClient();

    SignalClient(const SignalClient&) = delete;
    SignalClient& operator=(const SignalClient&) = delete;

    EventBus& events() { return events_; }

    SignalConnectionState state() const { return state_; }
    bool is_connected() const { return state_ == SignalConnectionState::CONNECTED; }
    bool is_disconnected() const {
        return state_ == SignalConnectionState::DISCONNECTING || state_ == SignalConnectionState::DISCONNECTED;
    }
    bool is_establishing_connection() const {
        return state_ == SignalConnectionState::CONNECTING || state_ == SignalConnectionState::RECONNECTING;
    }

    int64_t rtt() const { return rtt_; }
    size_t queued_request_count() const { return queued_requests_.size(); }

    asio::awaitable<Result<proto::JoinResponse>> join(const std::string& url, const std::string& token,
                                                      const SignalOptions& options,
                                                      CancelSignalPtr cancel = nullptr);

    asio::awaitable<Result<std::optional<proto::ReconnectResponse>>> reconnect(
        const std::string& url, const std::string& token,
        std::optional<std::string> sid = std::nullopt,
        std::optional<proto::ReconnectReason> reason = std::nullopt);

    asio::awaitable<void> close(bool update_state = true);

    // Fire-and-forget; see send_request for ordering
    void send(proto::SignalRequest request);

    asio::awaitable<void> send_request(proto::SignalRequest request, bool from_queue = false);

    // Replays requests queued while reconnecting, in order
    void set_reconnected();

    // ------------------------------------------------------------------------
    // Request helpers
    // ------------------------------------------------------------------------
    void send_offer(const SessionDescription& offer);
    void send_answer(const SessionDescription& answer);
    void send_ice_candidate(const IceCandidate& candidate, SignalTarget target);
    void send_mute_track(const std::string& track_sid, bool muted);
    void send_add_track(const proto::AddTrackRequest& request);
    void send_update_local_metadata(const std::string& metadata, const std::string& name);
    void send_update_track_settings(const proto::UpdateTrackSettings& settings);
    void send_update_subscription(const proto::UpdateSubscription& subscription);
    void send_sync_state(const proto::SyncState& sync);
    void send_update_video_layers(const std::string& track_sid, const std::vector<proto::VideoLayer>& layers);
    void send_update_subscription_permissions(bool all_participants,
                                              const std::vector<proto::TrackPermission>& permissions);
    void send_simulate_scenario(const proto::SimulateScenario& scenario);
    void send_ping();
    asio::awaitable<void> send_leave();

    // Kinds that are never queued during reconnection
    static bool can_pass_through_queue(const proto::SignalRequest& request);

private:
    struct QueuedRequest {
        uint64_t ordinal = 0;
        std::function<asio::awaitable<void>()> producer;
    };

    // One join/reconnect in flight; the first finish() wins
    struct ConnectAttempt {
        explicit ConnectAttempt(asio::any_io_executor ex) : done(std::move(ex)) {}

        void finish(Result<std::optional<proto::SignalResponse>> r) {
            if (result) return;
            result = std::move(r);
            done.set();
        }

        AsyncEvent done;
        std::optional<Result<std::optional<proto::SignalResponse>>> result;
        bool reconnect = false;
    };

    // Connection state and stored options change only once connection_lock_ is held
    asio::awaitable<Result<std::optional<proto::SignalResponse>>> connect(
        const std::string& url, const std::string& token, const ConnectionParams& params,
        SignalOptions options, CancelSignalPtr cancel);

    void install_handlers(const std::shared_ptr<ConnectAttempt>& attempt, const std::string& rtc_url,
                          const QueryParams& query, bool reconnect);

    void on_socket_message(const std::shared_ptr<ConnectAttempt>& attempt, std::string data,
                           bool is_text, bool reconnect);
    void on_socket_error(const std::shared_ptr<ConnectAttempt>& attempt, const std::string& error,
                         const std::string& rtc_url, const QueryParams& query);
    void on_socket_close(const std::shared_ptr<ConnectAttempt>& attempt, uint16_t code,
                         const std::string& reason);

    asio::awaitable<void> validate(std::shared_ptr<ConnectAttempt> attempt, std::string url);
    asio::awaitable<void> handle_on_close(std::string reason);
    asio::awaitable<void> deliver_delayed(proto::SignalResponse response);
    asio::awaitable<void> run_queued(std::function<asio::awaitable<void>()> producer);

    void handle_signal_response(const proto::SignalResponse& response);

    std::optional<proto::SignalResponse> decode(const std::string& data, bool is_text) const;

    // Keepalive
    void start_ping_interval();
    void clear_ping_interval();
    void schedule_ping(uint64_t generation);
    void reset_ping_timeout();
    void clear_ping_timeout();

    // Detached coroutine; escaped exceptions are logged with `what`
    void spawn(asio::awaitable<void> task, const char* what);

    asio::any_io_executor ex_;
    std::shared_ptr<SignalSocketFactory> socket_factory_;
    std::shared_ptr<HttpClient> http_;
    SignalClientSettings settings_;

    std::shared_ptr<SignalSocket> ws_;
    SignalConnectionState state_ = SignalConnectionState::DISCONNECTED;
    std::optional<SignalOptions> options_;
    EventBus events_;

    AsyncMutex connection_lock_;
    AsyncMutex close_lock_;
    AsyncMutex request_queue_lock_;

    std::deque<QueuedRequest> queued_requests_;
    uint64_t next_ordinal_ = 0;

    int32_t ping_timeout_s_ = 0;
    int32_t ping_interval_s_ = 0;
    int64_t rtt_ = 0;
    asio::steady_timer ping_timeout_timer_;
    asio::steady_timer ping_interval_timer_;
    uint64_t ping_generation_ = 0;
    uint64_t ping_timeout_generation_ = 0;
};

} // namespace livelink::client
