#include "client/session_engine.hpp"
#include "common/logger.hpp"

#include <boost/asio/co_spawn.hpp>

#include <algorithm>
#include <exception>

namespace livelink::client {

namespace {

auto& log() { return Logger::get("client.engine"); }

// Source tag for a server leave that allows reconnecting
constexpr const char* kLeaveReconnect = "leave-reconnect";

}  // anonymous namespace

SessionEngine::SessionEngine(asio::any_io_executor ex, EngineOptions options, EngineDependencies deps)
    : ex_(std::move(ex))
    , options_(std::move(options))
    , deps_(std::move(deps))
    , closed_event_(ex_)
    , reconnect_timer_(ex_)
    , data_channel_event_(ex_)
    , close_lock_(ex_)
    , data_lock_(ex_)
{
    if (!deps_.reconnect_policy) {
        deps_.reconnect_policy = std::make_shared<DefaultReconnectPolicy>();
    }
    client_ = std::make_shared<SignalClient>(ex_, deps_.sockets, deps_.http, deps_.signal_settings);
    buffer_status_[DataPacketKind::LOSSY] = true;
    buffer_status_[DataPacketKind::RELIABLE] = true;
}

SessionEngine::~SessionEngine() {
    reconnect_timer_.cancel();
    signal_subs_.clear();
    if (coordinator_) {
        coordinator_->set_callbacks({});
        coordinator_->close();
    }
    close_data_channels();
}

void SessionEngine::spawn(asio::awaitable<void> task, const char* what) {
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
// Join / close
// ============================================================================

asio::awaitable<Result<proto::JoinResponse>> SessionEngine::join(const std::string& url, const std::string& token,
                                                                 CancelSignalPtr cancel) {
    auto self = shared_from_this();

    if (attempting_reconnect_) {
        co_return std::unexpected(Error::unexpected_state("cannot join while a reconnect is in progress"));
    }

    // Rejoining after close() starts from a fresh lifecycle
    if (close_signal_->cancelled()) {
        close_signal_ = CancelSignal::create();
        closed_event_.reset();
        phase_ = SessionPhase::NEW;
    }

    co_return co_await do_join(url, token, std::move(cancel));
}

asio::awaitable<Result<proto::JoinResponse>> SessionEngine::do_join(std::string url, std::string token,
                                                                    CancelSignalPtr cancel) {
    url_ = std::move(url);
    token_ = std::move(token);
    join_attempts_ = 0;
    setup_signal_subscriptions();

    for (;;) {
        ++join_attempts_;
        auto res = co_await client_->join(url_, token_, options_.signal, cancel);
        if (!res) {
            if (res.error().is(ConnectionErrorReason::SERVER_UNREACHABLE)) {
                log().warn("couldn't connect to server, attempt {} of {}", join_attempts_, options_.max_retries);
                if (join_attempts_ < options_.max_retries) {
                    continue;
                }
            }
            co_return std::unexpected(res.error());
        }

        if (close_signal_->cancelled()) {
            co_return std::unexpected(Error::unexpected_state("engine closed during join"));
        }

        closed_ = false;
        latest_join_ = *res;
        subscriber_primary_ = res->subscriber_primary();
        if (!coordinator_) {
            configure(*res);
        }

        if (!subscriber_primary_ || res->fast_publish()) {
            spawn(run_negotiation(), "initial negotiation");
        }
        client_configuration_ = res->client_configuration();

        log().info("joined room '{}' as {} (server {}, region {})", res->room().name(),
                   res->participant().identity(), res->server_version(), res->server_region());
        co_return *res;
    }
}

asio::awaitable<void> SessionEngine::close() {
    auto self = shared_from_this();
    auto guard = co_await close_lock_.lock();

    if (closed_) {
        co_return;
    }

    closed_ = true;
    phase_ = SessionPhase::CLOSED;
    events_.publish(engine_events::Closing{});

    close_signal_->cancel();
    closed_event_.set();
    clear_pending_reconnect();
    reject_pending_publishes(Error::unexpected_state("engine closed"));

    co_await cleanup_peer_connections();
    co_await cleanup_client();
    log().debug("engine closed");
}

asio::awaitable<void> SessionEngine::cleanup_peer_connections() {
    if (coordinator_) {
        auto coordinator = std::move(coordinator_);
        coordinator_.reset();
        coordinator->set_callbacks({});
        coordinator->close();
    }
    close_data_channels();
    buffer_status_[DataPacketKind::LOSSY] = true;
    buffer_status_[DataPacketKind::RELIABLE] = true;
    data_channel_event_.notify();
    co_return;
}

asio::awaitable<void> SessionEngine::cleanup_client() {
    signal_subs_.clear();
    co_await client_->close();
}

// ============================================================================
// Signal wiring
// ============================================================================

void SessionEngine::setup_signal_subscriptions() {
    signal_subs_.clear();
    auto& bus = client_->events();

    signal_subs_.push_back(bus.subscribe<signal_events::Answer>(
        [this](const signal_events::Answer& ev) { on_signal_answer(ev); }));
    signal_subs_.push_back(bus.subscribe<signal_events::Offer>(
        [this](const signal_events::Offer& ev) { on_signal_offer(ev); }));
    signal_subs_.push_back(bus.subscribe<signal_events::Trickle>(
        [this](const signal_events::Trickle& ev) { on_signal_trickle(ev); }));
    signal_subs_.push_back(bus.subscribe<signal_events::Leave>(
        [this](const signal_events::Leave& ev) { on_signal_leave(ev); }));
    signal_subs_.push_back(bus.subscribe<signal_events::LocalTrackPublished>(
        [this](const signal_events::LocalTrackPublished& ev) { on_track_published(ev); }));
    signal_subs_.push_back(bus.subscribe<signal_events::TokenRefresh>(
        [this](const signal_events::TokenRefresh& ev) { on_token_refresh(ev); }));
    signal_subs_.push_back(bus.subscribe<signal_events::SignalClosed>(
        [this](const signal_events::SignalClosed& ev) {
            handle_disconnect("signal", proto::RR_SIGNAL_DISCONNECTED, ev.reason);
        }));

    // Pass-through notifications
    signal_subs_.push_back(bus.subscribe<signal_events::ParticipantUpdate>(
        [this](const signal_events::ParticipantUpdate& ev) {
            engine_events::ParticipantUpdate out;
            out.participants = ev.participants;
            events_.publish(out);
        }));
    signal_subs_.push_back(bus.subscribe<signal_events::RoomUpdate>(
        [this](const signal_events::RoomUpdate& ev) {
            engine_events::RoomUpdate out;
            out.room = ev.room;
            events_.publish(out);
        }));
    signal_subs_.push_back(bus.subscribe<signal_events::SpeakersChanged>(
        [this](const signal_events::SpeakersChanged& ev) {
            engine_events::SpeakersChanged out;
            out.speakers = ev.speakers;
            events_.publish(out);
        }));
    signal_subs_.push_back(bus.subscribe<signal_events::StreamStateUpdate>(
        [this](const signal_events::StreamStateUpdate& ev) {
            engine_events::StreamStateChanged out;
            out.update = ev.update;
            events_.publish(out);
        }));
    signal_subs_.push_back(bus.subscribe<signal_events::ConnectionQuality>(
        [this](const signal_events::ConnectionQuality& ev) {
            engine_events::ConnectionQualityUpdate out;
            out.update = ev.update;
            events_.publish(out);
        }));
    signal_subs_.push_back(bus.subscribe<signal_events::SubscriptionError>(
        [this](const signal_events::SubscriptionError& ev) {
            engine_events::SubscriptionError out;
            out.response = ev.response;
            events_.publish(out);
        }));
    signal_subs_.push_back(bus.subscribe<signal_events::SubscriptionPermissionUpdate>(
        [this](const signal_events::SubscriptionPermissionUpdate& ev) {
            engine_events::SubscriptionPermissionUpdate out;
            out.update = ev.update;
            events_.publish(out);
        }));
    signal_subs_.push_back(bus.subscribe<signal_events::SubscribedQualityUpdate>(
        [this](const signal_events::SubscribedQualityUpdate& ev) {
            engine_events::SubscribedQualityUpdate out;
            out.update = ev.update;
            events_.publish(out);
        }));
    signal_subs_.push_back(bus.subscribe<signal_events::LocalTrackUnpublished>(
        [this](const signal_events::LocalTrackUnpublished& ev) {
            engine_events::LocalTrackUnpublished out;
            out.response = ev.response;
            events_.publish(out);
        }));
    signal_subs_.push_back(bus.subscribe<signal_events::RemoteMute>(
        [this](const signal_events::RemoteMute& ev) {
            engine_events::RemoteMute out;
            out.track_sid = ev.track_sid;
            out.muted = ev.muted;
            events_.publish(out);
        }));
}

void SessionEngine::on_signal_answer(const signal_events::Answer& ev) {
    if (!coordinator_) return;
    if (auto r = coordinator_->set_publisher_answer(ev.description); !r) {
        log().error("could not apply publisher answer: {}", r.error().describe());
    }
}

void SessionEngine::on_signal_offer(const signal_events::Offer& ev) {
    if (!coordinator_) return;
    auto answer = coordinator_->create_subscriber_answer_from_offer(ev.description);
    if (!answer) {
        log().error("could not answer subscriber offer: {}", answer.error().describe());
        return;
    }
    client_->send_answer(*answer);
}

void SessionEngine::on_signal_trickle(const signal_events::Trickle& ev) {
    if (!coordinator_) return;
    log().trace("got {} ICE candidate from peer", signal_target_name(ev.target));
    if (auto r = coordinator_->add_ice_candidate(ev.candidate, ev.target); !r) {
        log().warn("could not add {} candidate: {}", signal_target_name(ev.target), r.error().describe());
    }
}

void SessionEngine::on_signal_leave(const signal_events::Leave& ev) {
    if (ev.leave.can_reconnect()) {
        full_reconnect_on_next_ = true;
        // Reconnect right away instead of waiting for the next attempt
        handle_disconnect(kLeaveReconnect);
        return;
    }

    engine_events::Disconnected out;
    out.reason = ev.leave.reason();
    events_.publish(out);
    spawn(close(), "close after leave");
}

void SessionEngine::on_track_published(const signal_events::LocalTrackPublished& ev) {
    const auto& cid = ev.response.cid();
    auto it = pending_publishes_.find(cid);
    if (it == pending_publishes_.end()) {
        log().error("missing track for published cid {}", cid);
        return;
    }
    auto pending = it->second;
    pending_publishes_.erase(it);
    pending->finish(ev.response.track());
}

void SessionEngine::on_token_refresh(const signal_events::TokenRefresh& ev) {
    token_ = ev.token;
    if (region_provider_) {
        region_provider_->update_token(token_);
    }
    engine_events::TokenRefreshed out;
    out.token = ev.token;
    events_.publish(out);
}

// ============================================================================
// Transports
// ============================================================================

PeerTransportConfig SessionEngine::make_rtc_config(
    const google::protobuf::RepeatedPtrField<proto::ICEServer>& servers,
    const proto::ClientConfiguration& client_config) const {
    PeerTransportConfig config = options_.rtc_config;

    if (!servers.empty()) {
        config.ice_servers.clear();
        for (const auto& s : servers) {
            IceServer server;
            server.urls.assign(s.urls().begin(), s.urls().end());
            server.username = s.username();
            server.credential = s.credential();
            config.ice_servers.push_back(std::move(server));
        }
    }

    if (client_config.force_relay() == proto::ENABLED) {
        config.ice_transport_policy = IceTransportPolicy::RELAY;
    }
    return config;
}

void SessionEngine::configure(const proto::JoinResponse& join) {
    if (coordinator_ && coordinator_->state() != TransportState::NEW) {
        return;
    }
    if (coordinator_) {
        coordinator_->set_callbacks({});
        coordinator_->close();
    }

    participant_sid_ = join.participant().sid();
    auto config = make_rtc_config(join.ice_servers(), join.client_configuration());
    coordinator_ = std::make_shared<TransportCoordinator>(ex_, *deps_.transports, config,
                                                          join.subscriber_primary(),
                                                          options_.peer_connection_timeout);

    TransportCoordinatorCallbacks cb;
    cb.on_ice_candidate = [this](const IceCandidate& candidate, SignalTarget target) {
        client_->send_ice_candidate(candidate, target);
    };
    cb.on_publisher_offer = [this](const SessionDescription& offer) {
        client_->send_offer(offer);
    };
    cb.on_data_channel = [this](std::shared_ptr<DataChannel> channel) {
        handle_subscriber_data_channel(std::move(channel));
    };
    cb.on_track = [this](const std::string& mid) {
        engine_events::MediaTrackAdded ev;
        ev.mid = mid;
        events_.publish(ev);
    };
    cb.on_state_change = [this](TransportState state, TransportState publisher, TransportState subscriber) {
        on_transport_state(state, publisher, subscriber);
    };
    coordinator_->set_callbacks(std::move(cb));

    engine_events::TransportsCreated created;
    created.publisher = &coordinator_->publisher();
    created.subscriber = &coordinator_->subscriber();
    events_.publish(created);

    create_data_channels();
}

void SessionEngine::on_transport_state(TransportState state, TransportState /*publisher*/, TransportState subscriber) {
    log().debug("primary transport state changed: {}", transport_state_name(state));

    if (state == TransportState::CONNECTED) {
        bool should_emit = phase_ == SessionPhase::NEW;
        phase_ = SessionPhase::CONNECTED;
        if (should_emit && latest_join_) {
            engine_events::Connected ev;
            ev.join = *latest_join_;
            events_.publish(ev);
        }
    } else if (state == TransportState::FAILED) {
        if (phase_ == SessionPhase::CONNECTED) {
            phase_ = SessionPhase::DISCONNECTED;
            handle_disconnect("peerconnection failed",
                              subscriber == TransportState::FAILED ? proto::RR_SUBSCRIBER_FAILED
                                                                   : proto::RR_PUBLISHER_FAILED);
        }
    }

    // Signal and transports both gone: most likely the network dropped
    bool signal_severed = client_->is_disconnected() ||
                          client_->state() == SignalConnectionState::RECONNECTING;
    bool pc_severed = state == TransportState::FAILED || state == TransportState::CLOSING ||
                      state == TransportState::CLOSED;
    if (signal_severed && pc_severed && !closed_) {
        events_.publish(engine_events::Offline{});
    }

    data_channel_event_.notify();
}

asio::awaitable<VoidResult> SessionEngine::negotiate() {
    auto self = shared_from_this();

    if (!coordinator_) {
        co_return std::unexpected(Error::negotiation("PC manager is closed"));
    }
    auto coordinator = coordinator_;
    coordinator->require_publisher();

    auto result = co_await coordinator->negotiate(close_signal_);
    if (!result) {
        if (result.error().is(ErrorCode::NEGOTIATION)) {
            full_reconnect_on_next_ = true;
        }
        handle_disconnect("negotiation", proto::RR_UNKNOWN, result.error().describe());
    }
    co_return result;
}

asio::awaitable<void> SessionEngine::run_negotiation() {
    auto result = co_await negotiate();
    if (!result) {
        log().warn("negotiation failed: {}", result.error().describe());
    }
}

// ============================================================================
// Publishing
// ============================================================================

asio::awaitable<Result<proto::TrackInfo>> SessionEngine::add_track(proto::AddTrackRequest request) {
    auto self = shared_from_this();

    if (closed_) {
        co_return std::unexpected(Error::unexpected_state("cannot publish on a closed engine"));
    }

    const std::string cid = request.cid();
    if (pending_publishes_.count(cid)) {
        co_return std::unexpected(Error::track_publish("a track with the same ID has already been published"));
    }

    auto pending = std::make_shared<PendingPublish>(ex_);
    pending_publishes_[cid] = pending;
    client_->send_add_track(request);

    co_await pending->done.wait_for(options_.publish_timeout);
    pending->finish(std::unexpected(
        Error::track_publish("publication of local track timed out, no response from server")));

    if (auto it = pending_publishes_.find(cid); it != pending_publishes_.end() && it->second == pending) {
        pending_publishes_.erase(it);
    }
    co_return std::move(*pending->result);
}

bool SessionEngine::remove_track(const std::string& cid) {
    auto it = pending_publishes_.find(cid);
    if (it == pending_publishes_.end()) {
        return false;
    }
    auto pending = it->second;
    pending_publishes_.erase(it);
    pending->finish(std::unexpected(Error::track_publish("Cancelled publication by calling unpublish")));
    return true;
}

void SessionEngine::reject_pending_publishes(const Error& error) {
    auto pending = std::move(pending_publishes_);
    pending_publishes_.clear();
    for (auto& [cid, p] : pending) {
        p->finish(std::unexpected(error));
    }
}

// ============================================================================
// Data channels
// ============================================================================

DataChannelCallbacks SessionEngine::make_data_channel_callbacks(DataPacketKind kind, bool publisher_side) {
    std::weak_ptr<SessionEngine> weak = weak_from_this();

    DataChannelCallbacks cb;
    cb.on_message = [weak](std::string data, bool binary) {
        auto self = weak.lock();
        if (!self) return;
        if (!binary) {
            log().error("unsupported data type: text message of {} bytes", data.size());
            return;
        }
        self->spawn(self->handle_data_message(std::move(data)), "data message");
    };
    cb.on_open = [weak] {
        if (auto self = weak.lock()) self->data_channel_event_.notify();
    };
    cb.on_close = [weak] {
        if (auto self = weak.lock()) self->data_channel_event_.notify();
    };
    if (publisher_side) {
        cb.on_buffered_amount_low = [weak, kind] {
            if (auto self = weak.lock()) self->update_and_emit_buffer_status(kind);
        };
    }
    return cb;
}

void SessionEngine::create_data_channels() {
    if (!coordinator_) return;

    // Recreating: detach the old channels first
    if (lossy_dc_) lossy_dc_->set_callbacks({});
    if (reliable_dc_) reliable_dc_->set_callbacks({});

    DataChannelInit lossy_init;
    lossy_init.ordered = true;
    lossy_init.max_retransmits = 0;
    lossy_dc_ = coordinator_->create_publisher_data_channel(kLossyChannel, lossy_init);

    DataChannelInit reliable_init;
    reliable_init.ordered = true;
    reliable_dc_ = coordinator_->create_publisher_data_channel(kReliableChannel, reliable_init);

    // Messages may also arrive on the publisher channels
    if (lossy_dc_) {
        lossy_dc_->set_buffered_amount_low_threshold(kBufferedAmountLowThreshold);
        lossy_dc_->set_callbacks(make_data_channel_callbacks(DataPacketKind::LOSSY, true));
    }
    if (reliable_dc_) {
        reliable_dc_->set_buffered_amount_low_threshold(kBufferedAmountLowThreshold);
        reliable_dc_->set_callbacks(make_data_channel_callbacks(DataPacketKind::RELIABLE, true));
    }
}

void SessionEngine::close_data_channels() {
    for (auto* dc : {&lossy_dc_, &reliable_dc_, &lossy_dc_sub_, &reliable_dc_sub_}) {
        if (*dc) {
            (*dc)->set_callbacks({});
            (*dc)->close();
            dc->reset();
        }
    }
}

void SessionEngine::handle_subscriber_data_channel(std::shared_ptr<DataChannel> channel) {
    if (!channel) return;

    auto label = channel->label();
    DataPacketKind kind;
    if (label == kReliableChannel) {
        reliable_dc_sub_ = channel;
        kind = DataPacketKind::RELIABLE;
    } else if (label == kLossyChannel) {
        lossy_dc_sub_ = channel;
        kind = DataPacketKind::LOSSY;
    } else {
        return;
    }

    log().debug("on data channel {}, {}", channel->id() ? static_cast<int>(*channel->id()) : -1, label);
    channel->set_callbacks(make_data_channel_callbacks(kind, false));
}

asio::awaitable<void> SessionEngine::handle_data_message(std::string data) {
    // Preserve arrival order
    auto guard = co_await data_lock_.lock();

    proto::DataPacket packet;
    if (!packet.ParseFromString(data)) {
        log().error("could not decode data packet of {} bytes", data.size());
        co_return;
    }

    if (packet.has_speaker()) {
        engine_events::ActiveSpeakersUpdate ev;
        ev.speakers.assign(packet.speaker().speakers().begin(), packet.speaker().speakers().end());
        events_.publish(ev);
    } else if (packet.has_user()) {
        engine_events::DataPacketReceived ev;
        ev.packet = packet.user();
        ev.kind = static_cast<DataPacketKind>(packet.kind());
        events_.publish(ev);
    }
}

std::shared_ptr<DataChannel> SessionEngine::data_channel_for_kind(DataPacketKind kind, bool subscriber) const {
    if (kind == DataPacketKind::LOSSY) {
        return subscriber ? lossy_dc_sub_ : lossy_dc_;
    }
    return subscriber ? reliable_dc_sub_ : reliable_dc_;
}

std::optional<bool> SessionEngine::is_buffer_status_low(DataPacketKind kind) const {
    auto dc = data_channel_for_kind(kind);
    if (!dc) return std::nullopt;
    return dc->buffered_amount() <= dc->buffered_amount_low_threshold();
}

void SessionEngine::update_and_emit_buffer_status(DataPacketKind kind) {
    auto status = is_buffer_status_low(kind);
    if (!status || buffer_status_[kind] == *status) {
        return;
    }
    buffer_status_[kind] = *status;

    engine_events::DataChannelBufferStatusChanged ev;
    ev.is_low = *status;
    ev.kind = kind;
    events_.publish(ev);
}

asio::awaitable<VoidResult> SessionEngine::send_data_packet(proto::DataPacket packet, DataPacketKind kind) {
    auto self = shared_from_this();

    std::string msg;
    if (!packet.SerializeToString(&msg)) {
        co_return std::unexpected(Error::publish_data("could not encode data packet"));
    }

    auto ready = co_await ensure_data_transport_connected(kind, false);
    if (!ready) {
        co_return ready;
    }

    if (auto dc = data_channel_for_kind(kind)) {
        if (!dc->send(msg)) {
            co_return std::unexpected(Error::publish_data(
                fmt::format("could not send on {} data channel", data_packet_kind_name(kind))));
        }
    }
    update_and_emit_buffer_status(kind);
    co_return VoidResult{};
}

asio::awaitable<VoidResult> SessionEngine::ensure_data_transport_connected(DataPacketKind kind, bool subscriber) {
    if (!coordinator_) {
        co_return std::unexpected(Error::unexpected_state("PC manager is closed"));
    }

    auto coordinator = coordinator_;
    TransportLink& transport = subscriber ? coordinator->subscriber() : coordinator->publisher();
    const char* name = subscriber ? "Subscriber" : "Publisher";

    if (!subscriber) {
        coordinator->require_publisher();
    }
    if (!subscriber && !transport.is_ice_connected() && transport.ice_state() != IceConnectionState::CHECKING) {
        spawn(run_negotiation(), "data channel negotiation");
    }

    if (auto ch = data_channel_for_kind(kind, subscriber); ch && ch->ready_state() == DataChannelState::OPEN) {
        co_return VoidResult{};
    }

    auto deadline = std::chrono::steady_clock::now() + options_.peer_connection_timeout;
    for (auto now = std::chrono::steady_clock::now(); now < deadline; now = std::chrono::steady_clock::now()) {
        if (closed_ || coordinator != coordinator_) {
            co_return std::unexpected(Error::unexpected_state("PC manager is closed"));
        }
        auto ch = data_channel_for_kind(kind, subscriber);
        if (transport.is_ice_connected() && ch && ch->ready_state() == DataChannelState::OPEN) {
            co_return VoidResult{};
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        co_await data_channel_event_.wait_for(std::min(remaining, kDataChannelPollInterval));
    }

    co_return std::unexpected(Error::connection(fmt::format("could not establish {} connection, state: {}", name,
                                                            ice_connection_state_name(transport.ice_state()))));
}

// ============================================================================
// Reconnection
// ============================================================================

std::optional<std::chrono::milliseconds> SessionEngine::next_retry_delay(const ReconnectContext& context) {
    try {
        return deps_.reconnect_policy->next_retry_delay(context);
    } catch (const std::exception& e) {
        log().warn("encountered error in reconnect policy: {}", e.what());
    }
    // Policy failure means give up
    return std::nullopt;
}

void SessionEngine::handle_disconnect(const std::string& source, proto::ReconnectReason reason,
                                      std::optional<std::string> retry_reason) {
    if (closed_) {
        return;
    }
    log().warn("{} disconnected", source);

    auto now = std::chrono::steady_clock::now();
    if (reconnect_attempts_ == 0) {
        // Only the first failure of a burst starts the clock
        reconnect_start_ = now;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - reconnect_start_);

    ReconnectContext context;
    context.retry_count = reconnect_attempts_;
    context.elapsed = elapsed;
    context.retry_reason = std::move(retry_reason);
    context.server_url = url_;
    auto delay = next_retry_delay(context);

    if (!delay) {
        log().warn("could not recover connection after {} attempts, {}ms. giving up",
                   reconnect_attempts_, elapsed.count());
        events_.publish(engine_events::Disconnected{});
        spawn(close(), "close after giving up");
        return;
    }
    if (source == kLeaveReconnect) {
        delay = std::chrono::milliseconds(0);
    }

    log().debug("reconnecting in {}ms", delay->count());
    clear_reconnect_timeout();
    if (region_provider_ && !token_.empty()) {
        // The token may have been refreshed since the provider was made
        region_provider_->update_token(token_);
    }
    schedule_reconnect(*delay, reason);
}

void SessionEngine::schedule_reconnect(std::chrono::milliseconds delay, proto::ReconnectReason reason) {
    reconnect_scheduled_ = true;
    scheduled_reason_ = reason;
    auto generation = ++reconnect_generation_;

    reconnect_timer_.expires_after(delay);
    std::weak_ptr<SessionEngine> weak = weak_from_this();
    reconnect_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || generation != self->reconnect_generation_) return;
        self->reconnect_scheduled_ = false;
        self->spawn(self->attempt_reconnect(self->scheduled_reason_), "reconnect attempt");
    });
}

void SessionEngine::clear_reconnect_timeout() {
    ++reconnect_generation_;
    reconnect_timer_.cancel();
    reconnect_scheduled_ = false;
}

void SessionEngine::clear_pending_reconnect() {
    clear_reconnect_timeout();
    reconnect_attempts_ = 0;
}

void SessionEngine::handle_network_online() {
    if (reconnect_scheduled_ || client_->state() == SignalConnectionState::RECONNECTING) {
        log().info("network back online, reconnecting now");
        clear_reconnect_timeout();
        spawn(attempt_reconnect(proto::RR_SIGNAL_DISCONNECTED), "network online reconnect");
    }
}

asio::awaitable<void> SessionEngine::attempt_reconnect(proto::ReconnectReason reason) {
    auto self = shared_from_this();

    if (closed_) {
        co_return;
    }
    if (attempting_reconnect_) {
        log().warn("already attempting reconnect, returning early");
        co_return;
    }

    // Transports that never connected cannot be resumed
    bool resume_disabled = client_configuration_ &&
                           client_configuration_->resume_connection() == proto::DISABLED;
    if (resume_disabled || !coordinator_ || coordinator_->state() == TransportState::NEW) {
        full_reconnect_on_next_ = true;
    }

    attempting_reconnect_ = true;
    VoidResult result;
    if (full_reconnect_on_next_) {
        result = co_await restart_connection();
    } else {
        result = co_await resume_connection(reason);
    }
    attempting_reconnect_ = false;

    if (result) {
        clear_pending_reconnect();
        full_reconnect_on_next_ = false;
        co_return;
    }

    ++reconnect_attempts_;
    if (result.error().is(ErrorCode::UNEXPECTED_CONNECTION_STATE)) {
        log().info("received unrecoverable error: {}", result.error().describe());
        if (!closed_) {
            events_.publish(engine_events::Disconnected{});
            co_await close();
        }
        co_return;
    }

    log().warn("reconnect attempt {} failed: {}", reconnect_attempts_, result.error().describe());
    full_reconnect_on_next_ = true;
    handle_disconnect("reconnect", proto::RR_UNKNOWN, result.error().describe());
}

asio::awaitable<VoidResult> SessionEngine::restart_connection(std::optional<std::string> region_url) {
    auto result = co_await restart_once(region_url);
    if (result) {
        co_return result;
    }

    if (region_provider_ && !closed_) {
        auto next = co_await region_provider_->next_best_region_url(close_signal_);
        if (next && *next) {
            log().info("retrying restart with region url {}", **next);
            co_return co_await restart_connection(**next);
        }
        if (!next) {
            log().warn("could not look up next region: {}", next.error().describe());
        }
        region_provider_->reset_attempts();
    }
    co_return result;
}

asio::awaitable<VoidResult> SessionEngine::restart_once(const std::optional<std::string>& region_url) {
    if (url_.empty() || token_.empty()) {
        co_return std::unexpected(Error::unexpected_state("could not reconnect, url or token not saved"));
    }

    log().info("reconnecting, attempt: {}", reconnect_attempts_);
    events_.publish(engine_events::Restarting{});

    if (!client_->is_disconnected()) {
        co_await client_->send_leave();
    }
    co_await cleanup_peer_connections();
    co_await cleanup_client();

    auto joined = co_await do_join(region_url.value_or(url_), token_, close_signal_);
    if (!joined) {
        if (joined.error().is(ConnectionErrorReason::NOT_ALLOWED)) {
            co_return std::unexpected(Error::unexpected_state("could not reconnect, token might be expired"));
        }
        if (joined.error().is(ErrorCode::UNEXPECTED_CONNECTION_STATE)) {
            co_return std::unexpected(joined.error());
        }
        co_return std::unexpected(Error::signal_reconnect(joined.error().message));
    }

    client_->set_reconnected();
    engine_events::SignalRestarted signal_restarted;
    signal_restarted.join = *joined;
    events_.publish(signal_restarted);

    if (auto pc = co_await wait_for_pc_reconnected(); !pc) {
        co_return pc;
    }

    if (client_->state() != SignalConnectionState::CONNECTED) {
        co_return std::unexpected(Error::signal_reconnect("Signal connection got severed during reconnect"));
    }

    if (region_provider_) {
        region_provider_->reset_attempts();
    }
    events_.publish(engine_events::Restarted{});
    co_return VoidResult{};
}

asio::awaitable<VoidResult> SessionEngine::resume_connection(proto::ReconnectReason reason) {
    if (url_.empty() || token_.empty()) {
        co_return std::unexpected(Error::unexpected_state("could not reconnect, url or token not saved"));
    }
    if (!coordinator_) {
        co_return std::unexpected(Error::unexpected_state("publisher and subscriber connections unset"));
    }

    log().info("resuming signal connection, attempt {}", reconnect_attempts_);
    events_.publish(engine_events::Resuming{});

    setup_signal_subscriptions();
    auto res = co_await client_->reconnect(url_, token_, participant_sid_, reason);
    if (!res) {
        log().error("signal reconnect failed: {}", res.error().describe());
        if (res.error().is(ConnectionErrorReason::NOT_ALLOWED)) {
            co_return std::unexpected(Error::unexpected_state("could not reconnect, token might be expired"));
        }
        if (res.error().is(ConnectionErrorReason::LEAVE_REQUEST)) {
            co_return std::unexpected(res.error());
        }
        co_return std::unexpected(Error::signal_reconnect(res.error().message));
    }
    events_.publish(engine_events::SignalResumed{});

    if (!coordinator_) {
        co_return std::unexpected(Error::unexpected_state("publisher and subscriber connections unset"));
    }

    if (*res) {
        auto config = make_rtc_config((*res)->ice_servers(), (*res)->client_configuration());
        if (auto r = coordinator_->update_configuration(config, false); !r) {
            log().warn("could not update transport configuration: {}", r.error().describe());
        }
    } else {
        log().warn("did not receive reconnect response");
    }

    if (auto r = coordinator_->trigger_ice_restart(); !r) {
        co_return std::unexpected(r.error());
    }

    if (auto pc = co_await wait_for_pc_reconnected(); !pc) {
        co_return pc;
    }

    if (client_->state() != SignalConnectionState::CONNECTED) {
        co_return std::unexpected(Error::signal_reconnect("Signal connection got severed during reconnect"));
    }
    client_->set_reconnected();

    // Recreate publisher channels that lost their stream id
    if (reliable_dc_ && reliable_dc_->ready_state() == DataChannelState::OPEN && !reliable_dc_->id()) {
        create_data_channels();
    }

    events_.publish(engine_events::Resumed{});
    co_return VoidResult{};
}

asio::awaitable<VoidResult> SessionEngine::wait_for_pc_reconnected() {
    phase_ = SessionPhase::RECONNECTING;
    log().debug("waiting for peer connection to reconnect");

    co_await closed_event_.wait_for(kMinReconnectWait);

    VoidResult result;
    if (closed_ || !coordinator_) {
        result = std::unexpected(Error::unexpected_state("PC manager is closed"));
    } else {
        auto coordinator = coordinator_;
        result = co_await coordinator->ensure_connected(nullptr, options_.peer_connection_timeout);
    }

    if (!result) {
        phase_ = SessionPhase::DISCONNECTED;
        co_return std::unexpected(Error::connection("could not establish PC connection, " + result.error().message));
    }
    phase_ = SessionPhase::CONNECTED;
    co_return VoidResult{};
}

} // namespace livelink::client
