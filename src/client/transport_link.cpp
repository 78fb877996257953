#include "client/transport_link.hpp"
#include "common/logger.hpp"

namespace livelink::client {

namespace {

auto& log() { return Logger::get("client.link"); }

}  // anonymous namespace

TransportLink::TransportLink(asio::any_io_executor ex, std::unique_ptr<PeerTransport> transport,
                             SignalTarget role)
    : ex_(std::move(ex))
    , transport_(std::move(transport))
    , role_(role)
    , debounce_timer_(ex_)
{
    PeerTransportCallbacks cb;
    cb.on_ice_candidate = [this](const IceCandidate& candidate) {
        if (callbacks_.on_ice_candidate) callbacks_.on_ice_candidate(candidate);
    };
    cb.on_ice_connection_state = [this](IceConnectionState state) {
        log().debug("{} ICE state: {}", signal_target_name(role_), ice_connection_state_name(state));
        update_state();
    };
    cb.on_connection_state = [this](PeerConnectionState state) {
        log().debug("{} connection state: {}", signal_target_name(role_), peer_connection_state_name(state));
        update_state();
    };
    cb.on_signaling_state = [this](SignalingState state) {
        log().trace("{} signaling state: {}", signal_target_name(role_), signaling_state_name(state));
        update_state();
    };
    cb.on_data_channel = [this](std::shared_ptr<DataChannel> channel) {
        if (callbacks_.on_data_channel) callbacks_.on_data_channel(std::move(channel));
    };
    cb.on_track = [this](const std::string& mid) {
        if (callbacks_.on_track) callbacks_.on_track(mid);
    };
    transport_->set_callbacks(std::move(cb));
}

TransportLink::~TransportLink() {
    *alive_ = false;
    debounce_timer_.cancel();
    transport_->set_callbacks({});
    if (!closed_) {
        transport_->close();
    }
}

void TransportLink::negotiate(std::function<void(const Error&)> on_error) {
    negotiate_error_handler_ = std::move(on_error);

    // Each call pushes the deadline back
    debounce_timer_.expires_after(kNegotiateDebounce);
    std::weak_ptr<bool> alive = alive_;
    debounce_timer_.async_wait([this, alive](const boost::system::error_code& ec) {
        if (ec) return;
        auto token = alive.lock();
        if (!token || !*token) return;

        if (callbacks_.on_negotiation_started) callbacks_.on_negotiation_started();

        auto result = create_and_send_offer();
        if (!result) {
            auto handler = std::move(negotiate_error_handler_);
            negotiate_error_handler_ = nullptr;
            if (handler) {
                handler(result.error());
            } else {
                log().error("{} negotiation failed: {}", signal_target_name(role_), result.error().describe());
            }
        }
    });
}

VoidResult TransportLink::create_and_send_offer(const OfferOptions& options) {
    if (!callbacks_.on_offer) {
        return {};
    }

    if (options.ice_restart) {
        log().debug("{} restarting ICE", signal_target_name(role_));
        restarting_ice_ = true;
    }

    if (!closed_ && transport_->signaling_state() == SignalingState::HAVE_LOCAL_OFFER) {
        auto current = transport_->remote_description();
        if (options.ice_restart && current) {
            // Roll back to stable by re-applying the last answer
            auto result = transport_->set_remote_description(*current);
            if (!result) {
                return std::unexpected(Error::negotiation(result.error().message));
            }
        } else {
            renegotiate_ = true;
            return {};
        }
    } else if (closed_ || transport_->signaling_state() == SignalingState::CLOSED) {
        log().warn("could not create offer with closed {} transport", signal_target_name(role_));
        return {};
    }

    log().debug("{} starting to negotiate", signal_target_name(role_));
    auto offer = transport_->create_offer(options);
    if (!offer) {
        return std::unexpected(Error::negotiation(offer.error().message));
    }

    callbacks_.on_offer(*offer);
    return {};
}

VoidResult TransportLink::set_remote_description(const SessionDescription& description) {
    if (closed_) {
        return std::unexpected(Error::unexpected_state("transport closed, cannot set remote description"));
    }

    auto result = transport_->set_remote_description(description);
    if (!result) {
        return std::unexpected(Error::negotiation(result.error().message));
    }

    for (const auto& candidate : pending_candidates_) {
        if (auto added = transport_->add_ice_candidate(candidate); !added) {
            log().warn("{} could not add buffered candidate: {}", signal_target_name(role_),
                       added.error().message);
        }
    }
    pending_candidates_.clear();
    restarting_ice_ = false;

    if (renegotiate_) {
        renegotiate_ = false;
        return create_and_send_offer();
    }
    if (description.is_answer()) {
        if (callbacks_.on_negotiation_complete) callbacks_.on_negotiation_complete();
    }
    return {};
}

Result<SessionDescription> TransportLink::create_and_set_answer() {
    if (closed_) {
        return std::unexpected(Error::unexpected_state("transport closed, cannot create answer"));
    }
    auto answer = transport_->create_answer();
    if (!answer) {
        return std::unexpected(Error::negotiation(answer.error().message));
    }
    return answer;
}

VoidResult TransportLink::add_ice_candidate(const IceCandidate& candidate) {
    if (closed_) {
        return std::unexpected(Error::unexpected_state("transport closed, cannot add candidate"));
    }
    if (transport_->remote_description() && !restarting_ice_) {
        return transport_->add_ice_candidate(candidate);
    }
    pending_candidates_.push_back(candidate);
    return {};
}

VoidResult TransportLink::set_configuration(const PeerTransportConfig& config) {
    if (closed_) {
        return std::unexpected(Error::unexpected_state("transport closed, cannot configure"));
    }
    return transport_->set_configuration(config);
}

void TransportLink::close() {
    if (closed_ || closing_) return;

    closing_ = true;
    update_state();

    debounce_timer_.cancel();
    negotiate_error_handler_ = nullptr;
    transport_->close();
    pending_candidates_.clear();

    closed_ = true;
    closing_ = false;
    update_state();
}

bool TransportLink::is_ice_connected() const {
    auto state = ice_state();
    return state == IceConnectionState::CONNECTED || state == IceConnectionState::COMPLETED;
}

IceConnectionState TransportLink::ice_state() const {
    return closed_ ? IceConnectionState::CLOSED : transport_->ice_connection_state();
}

PeerConnectionState TransportLink::connection_state() const {
    return closed_ ? PeerConnectionState::CLOSED : transport_->connection_state();
}

SignalingState TransportLink::signaling_state() const {
    return closed_ ? SignalingState::CLOSED : transport_->signaling_state();
}

std::optional<std::string> TransportLink::connected_address() const {
    if (closed_) return std::nullopt;
    return transport_->remote_address();
}

std::shared_ptr<DataChannel> TransportLink::create_data_channel(const std::string& label,
                                                                const DataChannelInit& init) {
    if (closed_) return nullptr;
    return transport_->create_data_channel(label, init);
}

TransportState TransportLink::compute_state() const {
    if (closed_) return TransportState::CLOSED;
    if (closing_) return TransportState::CLOSING;

    switch (transport_->connection_state()) {
        case PeerConnectionState::FAILED:
            return TransportState::FAILED;
        case PeerConnectionState::CONNECTED:
            return TransportState::CONNECTED;
        case PeerConnectionState::CONNECTING:
        case PeerConnectionState::DISCONNECTED:
            return TransportState::CONNECTING;
        case PeerConnectionState::CLOSED:
            return TransportState::CLOSED;
        case PeerConnectionState::NEW:
            break;
    }

    if (transport_->ice_connection_state() == IceConnectionState::CHECKING) {
        return TransportState::CONNECTING;
    }
    return TransportState::NEW;
}

void TransportLink::update_state() {
    auto next = compute_state();
    if (next == state_) return;

    log().debug("{} transport {} -> {}", signal_target_name(role_),
                transport_state_name(state_), transport_state_name(next));
    state_ = next;
    if (callbacks_.on_state_change) callbacks_.on_state_change(next);
}

} // namespace livelink::client
