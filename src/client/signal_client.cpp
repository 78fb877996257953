#include "client/signal_client.hpp"
#include "common/logger.hpp"
#include "common/url_utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <google/protobuf/util/json_util.h>

#include <exception>

namespace livelink::client {

namespace {

auto& log() { return Logger::get("client.signal"); }

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

SessionDescription from_proto(const proto::SessionDescription& sd) {
    return SessionDescription{sd.type(), sd.sdp()};
}

void to_proto(const SessionDescription& sd, proto::SessionDescription* out) {
    out->set_type(sd.type);
    out->set_sdp(sd.sdp);
}

// Name of the populated `message` oneof field, "none" when unset
std::string message_kind(const google::protobuf::Message& msg) {
    const auto* oneof = msg.GetDescriptor()->FindOneofByName("message");
    if (!oneof) return "none";
    const auto* field = msg.GetReflection()->GetOneofFieldDescriptor(msg, oneof);
    return field ? field->name() : "none";
}

}  // anonymous namespace

SignalClient::SignalClient(asio::any_io_executor ex,
                           std::shared_ptr<SignalSocketFactory> sockets,
                           std::shared_ptr<HttpClient> http,
                           SignalClientSettings settings)
    : ex_(std::move(ex))
    , socket_factory_(std::move(sockets))
    , http_(std::move(http))
    , settings_(settings)
    , connection_lock_(ex_)
    , close_lock_(ex_)
    , request_queue_lock_(ex_)
    , ping_timeout_timer_(ex_)
    , ping_interval_timer_(ex_)
{
}

SignalClient::~SignalClient() {
    ping_timeout_timer_.cancel();
    ping_interval_timer_.cancel();
    if (ws_) {
        ws_->set_handlers({});
        ws_->close();
    }
}

void SignalClient::spawn(asio::awaitable<void> task, const char* what) {
    asio::co_spawn(
        ex_,
        [self = shared_from_this(), t = std::move(task)]() mutable { return std::move(t); },
        [what](std::exception_ptr e) {
            if (!e) return;
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                log().error("{} failed: {}", what, ex.what());
            }
        });
}

// ============================================================================
// Connect / reconnect
// ============================================================================

asio::awaitable<Result<proto::JoinResponse>> SignalClient::join(const std::string& url,
                                                                const std::string& token,
                                                                const SignalOptions& options,
                                                                CancelSignalPtr cancel) {
    auto self = shared_from_this();

    ConnectionParams params;
    params.auto_subscribe = options.auto_subscribe;
    params.adaptive_stream = options.adaptive_stream;
    params.network = options.network;

    auto result = co_await connect(url, token, params, options, std::move(cancel));
    if (!result) {
        co_return std::unexpected(result.error());
    }
    if (!*result || !(*result)->has_join()) {
        co_return std::unexpected(Error::connection("did not receive join response"));
    }
    co_return (*result)->join();
}

asio::awaitable<Result<std::optional<proto::ReconnectResponse>>> SignalClient::reconnect(
    const std::string& url, const std::string& token,
    std::optional<std::string> sid, std::optional<proto::ReconnectReason> reason) {
    auto self = shared_from_this();

    if (!options_) {
        log().warn("attempted to reconnect without signal options being set, ignoring");
        co_return std::optional<proto::ReconnectResponse>{};
    }

    ConnectionParams params;
    params.auto_subscribe = options_->auto_subscribe;
    params.adaptive_stream = options_->adaptive_stream;
    params.network = options_->network;
    params.reconnect = true;
    params.sid = std::move(sid);
    if (reason) params.reconnect_reason = static_cast<int>(*reason);

    auto result = co_await connect(url, token, params, *options_, nullptr);
    if (!result) {
        co_return std::unexpected(result.error());
    }
    if (*result && (*result)->has_reconnect()) {
        co_return std::optional<proto::ReconnectResponse>((*result)->reconnect());
    }
    co_return std::optional<proto::ReconnectResponse>{};
}

asio::awaitable<Result<std::optional<proto::SignalResponse>>> SignalClient::connect(
    const std::string& url, const std::string& token, const ConnectionParams& params,
    SignalOptions options, CancelSignalPtr cancel) {
    auto self = shared_from_this();

    auto ws_url = to_websocket_url(url);
    if (!ws_url) {
        co_return std::unexpected(ws_url.error());
    }
    auto rtc_url = append_url_path(*ws_url, "rtc");
    auto query = make_connection_params(token, ClientInfo::current(), params);

    auto guard = co_await connection_lock_.lock();

    if (is_cancelled(cancel)) {
        co_await close();
        co_return std::unexpected(Error::connection("room connection has been cancelled (signal)",
                                                    ConnectionErrorReason::CANCELLED));
    }

    if (params.reconnect) {
        state_ = SignalConnectionState::RECONNECTING;
        clear_ping_interval();
    } else {
        // A full reconnect starts a fresh sequence even when currently connected
        state_ = SignalConnectionState::CONNECTING;
        options_ = options;
    }
    auto timeout = options.websocket_timeout;

    auto attempt = std::make_shared<ConnectAttempt>(ex_);
    attempt->reconnect = params.reconnect;

    SubscriptionHandle cancel_sub;
    if (cancel) {
        cancel_sub = cancel->on_cancel([attempt] {
            attempt->finish(std::unexpected(Error::connection("room connection has been cancelled (signal)",
                                                              ConnectionErrorReason::CANCELLED)));
        });
    }

    log().debug("connecting to {} (reconnect: {})", rtc_url, params.reconnect);
    if (ws_) {
        co_await close(false);
    }

    ws_ = socket_factory_->create();
    install_handlers(attempt, rtc_url, query, params.reconnect);
    ws_->open(with_query(rtc_url, query));

    co_await attempt->done.wait_for(timeout);
    cancel_sub.unsubscribe();

    attempt->finish(std::unexpected(Error::connection("room connection has timed out (signal)",
                                                      ConnectionErrorReason::TIMEOUT)));

    auto result = std::move(*attempt->result);
    if (!result) {
        log().warn("signal connection failed: {}", result.error().describe());
        co_await close();
    }
    co_return result;
}

void SignalClient::install_handlers(const std::shared_ptr<ConnectAttempt>& attempt,
                                    const std::string& rtc_url, const QueryParams& query,
                                    bool reconnect) {
    std::weak_ptr<SignalClient> weak = weak_from_this();

    SignalSocketHandlers handlers;
    handlers.on_open = [] {
        log().debug("websocket open");
    };
    handlers.on_message = [weak, attempt, reconnect](std::string data, bool is_text) {
        if (auto self = weak.lock()) {
            self->on_socket_message(attempt, std::move(data), is_text, reconnect);
        }
    };
    handlers.on_error = [weak, attempt, rtc_url, query](const std::string& error) {
        if (auto self = weak.lock()) {
            self->on_socket_error(attempt, error, rtc_url, query);
        }
    };
    handlers.on_close = [weak, attempt](uint16_t code, const std::string& reason) {
        if (auto self = weak.lock()) {
            self->on_socket_close(attempt, code, reason);
        }
    };
    ws_->set_handlers(std::move(handlers));
}

void SignalClient::on_socket_message(const std::shared_ptr<ConnectAttempt>& attempt, std::string data,
                                     bool is_text, bool reconnect) {
    auto resp = decode(data, is_text);
    if (!resp) return;

    // Not connected until a join response arrives
    if (state_ != SignalConnectionState::CONNECTED) {
        bool should_process = false;

        if (resp->has_join()) {
            state_ = SignalConnectionState::CONNECTED;
            ping_timeout_s_ = resp->join().ping_timeout();
            ping_interval_s_ = resp->join().ping_interval();
            if (ping_timeout_s_ > 0) {
                log().debug("ping config: timeout {}s, interval {}s", ping_timeout_s_, ping_interval_s_);
                start_ping_interval();
            }
            attempt->finish(std::optional<proto::SignalResponse>(std::move(*resp)));
        } else if (state_ == SignalConnectionState::RECONNECTING && !resp->has_leave()) {
            // Any message while reconnecting proves the signal is back
            state_ = SignalConnectionState::CONNECTED;
            start_ping_interval();
            if (resp->has_reconnect()) {
                attempt->finish(std::optional<proto::SignalResponse>(*resp));
            } else {
                log().debug("declaring signal reconnected without reconnect response received");
                attempt->finish(std::optional<proto::SignalResponse>{});
                should_process = true;
            }
        } else if (is_establishing_connection() && resp->has_leave()) {
            attempt->finish(std::unexpected(Error::connection(
                "Received leave request while trying to (re)connect", ConnectionErrorReason::LEAVE_REQUEST)));
        } else if (!reconnect) {
            attempt->finish(std::unexpected(Error::connection(
                fmt::format("did not receive join response, got {} instead", message_kind(*resp)))));
        }

        if (!should_process) return;
    }

    if (settings_.signal_latency.count() > 0) {
        spawn(deliver_delayed(std::move(*resp)), "delayed signal response");
        return;
    }
    handle_signal_response(*resp);
}

void SignalClient::on_socket_error(const std::shared_ptr<ConnectAttempt>& attempt, const std::string& error,
                                   const std::string& rtc_url, const QueryParams& query) {
    if (state_ != SignalConnectionState::CONNECTED) {
        state_ = SignalConnectionState::DISCONNECTED;
        log().debug("websocket error before connected: {}", error);

        auto http_url = to_http_url(rtc_url);
        if (!http_url) {
            attempt->finish(std::unexpected(Error::connection("server was not reachable",
                                                              ConnectionErrorReason::SERVER_UNREACHABLE)));
            return;
        }
        auto validate_url = append_url_path(*http_url, "validate") + "?" + encode_query(query);
        spawn(validate(attempt, std::move(validate_url)), "signal validation");
        return;
    }
    log().error("websocket error: {}", error);
}

void SignalClient::on_socket_close(const std::shared_ptr<ConnectAttempt>& attempt, uint16_t code,
                                   const std::string& reason) {
    if (is_establishing_connection()) {
        attempt->finish(std::unexpected(Error::connection("Websocket got closed during a (re)connection attempt")));
    }
    log().warn("websocket closed, code: {}, reason: '{}', state: {}", code, reason,
               signal_connection_state_name(state_));
    spawn(handle_on_close(reason), "signal close");
}

asio::awaitable<void> SignalClient::validate(std::shared_ptr<ConnectAttempt> attempt, std::string url) {
    auto resp = co_await http_->get(url);
    if (!resp) {
        log().debug("validation request failed: {}", resp.error().message);
        attempt->finish(std::unexpected(Error::connection("server was not reachable",
                                                          ConnectionErrorReason::SERVER_UNREACHABLE)));
        co_return;
    }
    if (resp->status >= 400 && resp->status < 500) {
        attempt->finish(std::unexpected(Error::connection(resp->body, ConnectionErrorReason::NOT_ALLOWED,
                                                          resp->status)));
    } else {
        attempt->finish(std::unexpected(Error::connection("Internal error", ConnectionErrorReason::INTERNAL_ERROR,
                                                          resp->status)));
    }
}

asio::awaitable<void> SignalClient::handle_on_close(std::string reason) {
    if (state_ == SignalConnectionState::DISCONNECTED) {
        co_return;
    }
    co_await close();
    log().debug("websocket connection closed: {}", reason);
    signal_events::SignalClosed ev;
    ev.reason = std::move(reason);
    events_.publish(ev);
}

asio::awaitable<void> SignalClient::close(bool update_state) {
    auto self = shared_from_this();
    auto guard = co_await close_lock_.lock();

    if (update_state) {
        state_ = SignalConnectionState::DISCONNECTING;
    }

    if (ws_) {
        auto ws = ws_;

        // Only the close notification matters from here on
        auto closed = std::make_shared<AsyncEvent>(ex_);
        SignalSocketHandlers handlers;
        handlers.on_close = [closed](uint16_t, const std::string&) { closed->set(); };
        ws->set_handlers(std::move(handlers));

        auto ready = ws->ready_state();
        if (ready == SocketReadyState::CONNECTING || ready == SocketReadyState::OPEN) {
            ws->close();
            co_await closed->wait_for(kCloseGrace);
        }
        if (ws_ == ws) {
            ws_.reset();
        }
    }

    if (update_state) {
        state_ = SignalConnectionState::DISCONNECTED;
    }
    clear_ping_interval();
}

// ============================================================================
// Requests
// ============================================================================

bool SignalClient::can_pass_through_queue(const proto::SignalRequest& request) {
    switch (request.message_case()) {
        case proto::SignalRequest::kOffer:
        case proto::SignalRequest::kAnswer:
        case proto::SignalRequest::kTrickle:
        case proto::SignalRequest::kSimulate:
        case proto::SignalRequest::kLeave:
        case proto::SignalRequest::kSyncState:
            return true;
        default:
            return false;
    }
}

void SignalClient::send(proto::SignalRequest request) {
    spawn(send_request(std::move(request)), "signal request");
}

asio::awaitable<void> SignalClient::send_request(proto::SignalRequest request, bool from_queue) {
    auto self = shared_from_this();

    // Hold everything but the reconnection handshake until set_reconnected()
    bool can_queue = !from_queue && !can_pass_through_queue(request);
    if (can_queue && state_ == SignalConnectionState::RECONNECTING) {
        QueuedRequest queued;
        queued.ordinal = next_ordinal_++;
        queued.producer = [self, request]() { return self->send_request(request, true); };
        log().debug("queueing {} request #{} while reconnecting", message_kind(request), queued.ordinal);
        queued_requests_.push_back(std::move(queued));
        co_return;
    }

    // Replays queued earlier go out first
    if (!from_queue) {
        auto flush = co_await request_queue_lock_.lock();
    }

    if (settings_.signal_latency.count() > 0) {
        asio::steady_timer timer(ex_, settings_.signal_latency);
        co_await timer.async_wait(asio::use_awaitable);
    }

    if (!ws_ || ws_->ready_state() != SocketReadyState::OPEN) {
        log().error("cannot send signal request before connected, type: {}", message_kind(request));
        co_return;
    }

    std::string payload;
    if (settings_.use_json) {
        auto status = google::protobuf::util::MessageToJsonString(request, &payload);
        if (!status.ok()) {
            log().error("error sending signal message: {}", status.ToString());
            co_return;
        }
    } else if (!request.SerializeToString(&payload)) {
        log().error("error sending signal message: could not serialize {}", message_kind(request));
        co_return;
    }
    ws_->send(std::move(payload), settings_.use_json);
}

void SignalClient::set_reconnected() {
    while (!queued_requests_.empty()) {
        auto queued = std::move(queued_requests_.front());
        queued_requests_.pop_front();
        spawn(run_queued(std::move(queued.producer)), "queued signal request");
    }
}

asio::awaitable<void> SignalClient::run_queued(std::function<asio::awaitable<void>()> producer) {
    auto guard = co_await request_queue_lock_.lock();
    co_await producer();
}

void SignalClient::send_offer(const SessionDescription& offer) {
    log().debug("sending offer");
    proto::SignalRequest req;
    to_proto(offer, req.mutable_offer());
    send(std::move(req));
}

void SignalClient::send_answer(const SessionDescription& answer) {
    log().debug("sending answer");
    proto::SignalRequest req;
    to_proto(answer, req.mutable_answer());
    send(std::move(req));
}

void SignalClient::send_ice_candidate(const IceCandidate& candidate, SignalTarget target) {
    log().trace("sending {} ice candidate: {}", signal_target_name(target), candidate.candidate);
    proto::SignalRequest req;
    auto* trickle = req.mutable_trickle();
    trickle->set_candidate_init(candidate_to_json(candidate));
    trickle->set_target(static_cast<proto::SignalTarget>(target));
    send(std::move(req));
}

void SignalClient::send_mute_track(const std::string& track_sid, bool muted) {
    proto::SignalRequest req;
    req.mutable_mute()->set_sid(track_sid);
    req.mutable_mute()->set_muted(muted);
    send(std::move(req));
}

void SignalClient::send_add_track(const proto::AddTrackRequest& request) {
    proto::SignalRequest req;
    *req.mutable_add_track() = request;
    send(std::move(req));
}

void SignalClient::send_update_local_metadata(const std::string& metadata, const std::string& name) {
    proto::SignalRequest req;
    req.mutable_update_metadata()->set_metadata(metadata);
    req.mutable_update_metadata()->set_name(name);
    send(std::move(req));
}

void SignalClient::send_update_track_settings(const proto::UpdateTrackSettings& settings) {
    proto::SignalRequest req;
    *req.mutable_track_setting() = settings;
    send(std::move(req));
}

void SignalClient::send_update_subscription(const proto::UpdateSubscription& subscription) {
    proto::SignalRequest req;
    *req.mutable_subscription() = subscription;
    send(std::move(req));
}

void SignalClient::send_sync_state(const proto::SyncState& sync) {
    proto::SignalRequest req;
    *req.mutable_sync_state() = sync;
    send(std::move(req));
}

void SignalClient::send_update_video_layers(const std::string& track_sid,
                                            const std::vector<proto::VideoLayer>& layers) {
    proto::SignalRequest req;
    auto* update = req.mutable_update_layers();
    update->set_track_sid(track_sid);
    for (const auto& layer : layers) {
        *update->add_layers() = layer;
    }
    send(std::move(req));
}

void SignalClient::send_update_subscription_permissions(bool all_participants,
                                                        const std::vector<proto::TrackPermission>& permissions) {
    proto::SignalRequest req;
    auto* perm = req.mutable_subscription_permission();
    perm->set_all_participants(all_participants);
    for (const auto& p : permissions) {
        *perm->add_track_permissions() = p;
    }
    send(std::move(req));
}

void SignalClient::send_simulate_scenario(const proto::SimulateScenario& scenario) {
    proto::SignalRequest req;
    *req.mutable_simulate() = scenario;
    send(std::move(req));
}

void SignalClient::send_ping() {
    auto now = now_ms();

    proto::SignalRequest legacy;
    legacy.set_ping(now);
    send(std::move(legacy));

    proto::SignalRequest req;
    req.mutable_ping_req()->set_timestamp(now);
    req.mutable_ping_req()->set_rtt(rtt_);
    send(std::move(req));
}

asio::awaitable<void> SignalClient::send_leave() {
    proto::SignalRequest req;
    req.mutable_leave()->set_can_reconnect(false);
    req.mutable_leave()->set_reason(proto::CLIENT_INITIATED);
    co_await send_request(std::move(req));
}

// ============================================================================
// Responses
// ============================================================================

std::optional<proto::SignalResponse> SignalClient::decode(const std::string& data, bool is_text) const {
    proto::SignalResponse resp;
    if (is_text) {
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;
        auto status = google::protobuf::util::JsonStringToMessage(data, &resp, options);
        if (!status.ok()) {
            log().error("could not decode websocket message: {}", status.ToString());
            return std::nullopt;
        }
        return resp;
    }
    if (!resp.ParseFromString(data)) {
        log().error("could not decode websocket message: {} bytes", data.size());
        return std::nullopt;
    }
    return resp;
}

asio::awaitable<void> SignalClient::deliver_delayed(proto::SignalResponse response) {
    asio::steady_timer timer(ex_, settings_.signal_latency);
    co_await timer.async_wait(asio::use_awaitable);
    handle_signal_response(response);
}

void SignalClient::handle_signal_response(const proto::SignalResponse& res) {
    bool ping_handled = false;

    switch (res.message_case()) {
        case proto::SignalResponse::kAnswer: {
            signal_events::Answer ev;
            ev.description = from_proto(res.answer());
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kOffer: {
            signal_events::Offer ev;
            ev.description = from_proto(res.offer());
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kTrickle: {
            auto candidate = candidate_from_json(res.trickle().candidate_init());
            if (!candidate) {
                log().warn("could not parse trickle candidate: {}", res.trickle().candidate_init());
                break;
            }
            signal_events::Trickle ev;
            ev.candidate = std::move(*candidate);
            ev.target = static_cast<SignalTarget>(res.trickle().target());
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kUpdate: {
            signal_events::ParticipantUpdate ev;
            ev.participants.assign(res.update().participants().begin(), res.update().participants().end());
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kTrackPublished: {
            signal_events::LocalTrackPublished ev;
            ev.response = res.track_published();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kSpeakersChanged: {
            signal_events::SpeakersChanged ev;
            ev.speakers.assign(res.speakers_changed().speakers().begin(), res.speakers_changed().speakers().end());
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kLeave: {
            signal_events::Leave ev;
            ev.leave = res.leave();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kMute: {
            signal_events::RemoteMute ev;
            ev.track_sid = res.mute().sid();
            ev.muted = res.mute().muted();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kRoomUpdate:
            if (res.room_update().has_room()) {
                signal_events::RoomUpdate ev;
                ev.room = res.room_update().room();
                events_.publish(ev);
            }
            break;

        case proto::SignalResponse::kConnectionQuality: {
            signal_events::ConnectionQuality ev;
            ev.update = res.connection_quality();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kStreamStateUpdate: {
            signal_events::StreamStateUpdate ev;
            ev.update = res.stream_state_update();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kSubscribedQualityUpdate: {
            signal_events::SubscribedQualityUpdate ev;
            ev.update = res.subscribed_quality_update();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kSubscriptionPermissionUpdate: {
            signal_events::SubscriptionPermissionUpdate ev;
            ev.update = res.subscription_permission_update();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kRefreshToken: {
            signal_events::TokenRefresh ev;
            ev.token = res.refresh_token();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kTrackUnpublished: {
            signal_events::LocalTrackUnpublished ev;
            ev.response = res.track_unpublished();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kSubscriptionResponse: {
            signal_events::SubscriptionError ev;
            ev.response = res.subscription_response();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kPong: {
            signal_events::Pong ev;
            ev.timestamp = res.pong();
            events_.publish(ev);
            break;
        }

        case proto::SignalResponse::kPongResp: {
            rtt_ = now_ms() - res.pong_resp().last_ping_timestamp();
            reset_ping_timeout();
            ping_handled = true;
            signal_events::PongResp ev;
            ev.rtt = rtt_;
            ev.pong = res.pong_resp();
            events_.publish(ev);
            break;
        }

        default:
            log().debug("unsupported message: {}", message_kind(res));
            break;
    }

    if (!ping_handled) {
        reset_ping_timeout();
    }
}

// ============================================================================
// Keepalive
// ============================================================================

void SignalClient::start_ping_interval() {
    clear_ping_interval();
    reset_ping_timeout();
    if (ping_interval_s_ <= 0) {
        log().warn("ping interval duration not set");
        return;
    }
    log().debug("start ping interval");
    schedule_ping(ping_generation_);
}

void SignalClient::schedule_ping(uint64_t generation) {
    ping_interval_timer_.expires_after(std::chrono::seconds(ping_interval_s_));
    std::weak_ptr<SignalClient> weak = weak_from_this();
    ping_interval_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || generation != self->ping_generation_) return;
        self->send_ping();
        self->schedule_ping(generation);
    });
}

void SignalClient::clear_ping_interval() {
    clear_ping_timeout();
    ++ping_generation_;
    ping_interval_timer_.cancel();
}

void SignalClient::reset_ping_timeout() {
    clear_ping_timeout();
    if (ping_timeout_s_ <= 0) {
        log().trace("ping timeout duration not set");
        return;
    }

    auto generation = ping_timeout_generation_;
    ping_timeout_timer_.expires_after(std::chrono::seconds(ping_timeout_s_));
    std::weak_ptr<SignalClient> weak = weak_from_this();
    ping_timeout_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || generation != self->ping_timeout_generation_) return;
        log().warn("ping timeout triggered, no pong for {}s", self->ping_timeout_s_);
        self->spawn(self->handle_on_close("ping timeout"), "ping timeout close");
    });
}

void SignalClient::clear_ping_timeout() {
    ++ping_timeout_generation_;
    ping_timeout_timer_.cancel();
}

} // namespace livelink::client
