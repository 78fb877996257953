#include "client/transport_coordinator.hpp"
#include "common/logger.hpp"

#include <algorithm>

namespace livelink::client {

namespace {

auto& log() { return Logger::get("client.transports"); }

}  // anonymous namespace

TransportState reduce_transport_states(const std::vector<TransportState>& states) {
    auto any = [&](TransportState s) {
        return std::any_of(states.begin(), states.end(), [s](TransportState x) { return x == s; });
    };
    auto all = [&](TransportState s) {
        return std::all_of(states.begin(), states.end(), [s](TransportState x) { return x == s; });
    };

    if (all(TransportState::CONNECTED)) return TransportState::CONNECTED;
    if (any(TransportState::FAILED)) return TransportState::FAILED;
    if (any(TransportState::CONNECTING)) return TransportState::CONNECTING;
    if (all(TransportState::CLOSED)) return TransportState::CLOSED;
    // Some but not all closed
    if (any(TransportState::CLOSED) || any(TransportState::CLOSING)) return TransportState::CLOSING;
    if (all(TransportState::NEW)) return TransportState::NEW;
    // Mix of NEW and CONNECTED
    return TransportState::CONNECTING;
}

TransportCoordinator::TransportCoordinator(asio::any_io_executor ex,
                                           PeerTransportFactory& factory,
                                           const PeerTransportConfig& config,
                                           bool subscriber_primary,
                                           std::chrono::milliseconds peer_connection_timeout)
    : ex_(std::move(ex))
    , needs_subscriber_(subscriber_primary)
    , peer_connection_timeout_(peer_connection_timeout)
    , connection_lock_(ex_)
    , state_event_(ex_)
    , negotiation_event_(ex_)
{
    publisher_ = std::make_unique<TransportLink>(ex_, factory.create(config), SignalTarget::PUBLISHER);
    subscriber_ = std::make_unique<TransportLink>(ex_, factory.create(config), SignalTarget::SUBSCRIBER);
    wire_publisher();
    wire_subscriber();
    update_state();
}

TransportCoordinator::~TransportCoordinator() {
    publisher_->set_callbacks({});
    subscriber_->set_callbacks({});
}

void TransportCoordinator::wire_publisher() {
    TransportLinkCallbacks cb;
    cb.on_ice_candidate = [this](const IceCandidate& candidate) {
        if (callbacks_.on_ice_candidate) callbacks_.on_ice_candidate(candidate, SignalTarget::PUBLISHER);
    };
    cb.on_offer = [this](const SessionDescription& offer) {
        if (callbacks_.on_publisher_offer) callbacks_.on_publisher_offer(offer);
    };
    cb.on_state_change = [this](TransportState) { update_state(); };
    cb.on_negotiation_started = [this] { on_negotiation_started(); };
    cb.on_negotiation_complete = [this] { on_negotiation_complete(); };
    publisher_->set_callbacks(std::move(cb));
}

void TransportCoordinator::wire_subscriber() {
    TransportLinkCallbacks cb;
    cb.on_ice_candidate = [this](const IceCandidate& candidate) {
        if (callbacks_.on_ice_candidate) callbacks_.on_ice_candidate(candidate, SignalTarget::SUBSCRIBER);
    };
    cb.on_state_change = [this](TransportState) { update_state(); };
    cb.on_data_channel = [this](std::shared_ptr<DataChannel> channel) {
        if (callbacks_.on_data_channel) callbacks_.on_data_channel(std::move(channel));
    };
    cb.on_track = [this](const std::string& mid) {
        if (callbacks_.on_track) callbacks_.on_track(mid);
    };
    subscriber_->set_callbacks(std::move(cb));
}

void TransportCoordinator::require_publisher(bool required) {
    needs_publisher_ = required;
    update_state();
}

void TransportCoordinator::require_subscriber(bool required) {
    needs_subscriber_ = required;
    update_state();
}

void TransportCoordinator::update_state() {
    std::vector<TransportState> states;
    if (needs_publisher_) states.push_back(publisher_->state());
    if (needs_subscriber_) states.push_back(subscriber_->state());

    auto next = reduce_transport_states(states);
    state_event_.notify();
    if (next == state_) return;

    log().debug("transports {} -> {} (publisher: {}, subscriber: {})",
                transport_state_name(state_), transport_state_name(next),
                transport_state_name(publisher_->state()), transport_state_name(subscriber_->state()));
    state_ = next;
    if (callbacks_.on_state_change) {
        callbacks_.on_state_change(state_, publisher_->state(), subscriber_->state());
    }
}

VoidResult TransportCoordinator::create_and_send_publisher_offer(const OfferOptions& options) {
    return publisher_->create_and_send_offer(options);
}

VoidResult TransportCoordinator::set_publisher_answer(const SessionDescription& answer) {
    return publisher_->set_remote_description(answer);
}

Result<SessionDescription> TransportCoordinator::create_subscriber_answer_from_offer(const SessionDescription& offer) {
    log().debug("received server offer, restarting ICE: {}", subscriber_->restarting_ice());
    if (auto result = subscriber_->set_remote_description(offer); !result) {
        return std::unexpected(result.error());
    }
    return subscriber_->create_and_set_answer();
}

VoidResult TransportCoordinator::add_ice_candidate(const IceCandidate& candidate, SignalTarget target) {
    if (target == SignalTarget::PUBLISHER) {
        return publisher_->add_ice_candidate(candidate);
    }
    return subscriber_->add_ice_candidate(candidate);
}

VoidResult TransportCoordinator::update_configuration(const PeerTransportConfig& config, bool ice_restart) {
    if (auto r = publisher_->set_configuration(config); !r) return r;
    if (auto r = subscriber_->set_configuration(config); !r) return r;
    if (ice_restart) {
        return trigger_ice_restart();
    }
    return {};
}

VoidResult TransportCoordinator::trigger_ice_restart() {
    subscriber_->set_restarting_ice(true);
    if (needs_publisher_) {
        OfferOptions options;
        options.ice_restart = true;
        return publisher_->create_and_send_offer(options);
    }
    return {};
}

asio::awaitable<VoidResult> TransportCoordinator::ensure_connected(CancelSignalPtr cancel,
                                                                   std::chrono::milliseconds timeout) {
    auto self = shared_from_this();
    auto guard = co_await connection_lock_.lock();

    if (closed_) {
        co_return std::unexpected(Error::unexpected_state("transports are closed"));
    }

    if (needs_publisher_) {
        auto pub = publisher_->state();
        if (pub != TransportState::CONNECTED && pub != TransportState::CONNECTING) {
            log().debug("negotiation required, starting negotiate");
            publisher_->negotiate();
        }
    }

    bool aborted = false;
    SubscriptionHandle cancel_sub;
    if (cancel) {
        cancel_sub = cancel->on_cancel([this, &aborted] {
            aborted = true;
            state_event_.notify();
        });
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (state_ != TransportState::CONNECTED) {
        if (aborted) {
            co_return std::unexpected(Error::connection("room connection has been cancelled",
                                                        ConnectionErrorReason::CANCELLED));
        }
        if (closed_) {
            co_return std::unexpected(Error::unexpected_state("transports closed while connecting"));
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            co_return std::unexpected(Error::connection("could not establish pc connection",
                                                        ConnectionErrorReason::TIMEOUT));
        }
        co_await state_event_.wait_for(deadline - now);
    }
    co_return VoidResult{};
}

void TransportCoordinator::on_negotiation_started() {
    for (auto& w : negotiation_waiters_) {
        if (!w->aborted) w->started = true;
    }
    negotiation_event_.notify();
}

void TransportCoordinator::on_negotiation_complete() {
    for (auto& w : negotiation_waiters_) {
        if (w->started && !w->aborted) w->completed = true;
    }
    negotiation_event_.notify();
}

asio::awaitable<VoidResult> TransportCoordinator::negotiate(CancelSignalPtr cancel) {
    auto self = shared_from_this();

    if (closed_) {
        co_return std::unexpected(Error::unexpected_state("transports are closed"));
    }

    auto waiter = std::make_shared<NegotiationWaiter>();
    negotiation_waiters_.push_back(waiter);
    auto it = std::prev(negotiation_waiters_.end());

    SubscriptionHandle cancel_sub;
    if (cancel) {
        cancel_sub = cancel->on_cancel([this, waiter] {
            waiter->aborted = true;
            negotiation_event_.notify();
        });
    }

    std::weak_ptr<NegotiationWaiter> weak = waiter;
    std::weak_ptr<TransportCoordinator> weak_self = self;
    publisher_->negotiate([weak, weak_self](const Error& e) {
        auto w = weak.lock();
        auto s = weak_self.lock();
        if (!w || !s) return;
        w->error = e;
        s->negotiation_event_.notify();
    });

    VoidResult result;
    auto deadline = std::chrono::steady_clock::now() + peer_connection_timeout_;
    for (;;) {
        if (waiter->completed) {
            break;
        }
        if (waiter->error) {
            result = std::unexpected(Error::negotiation(waiter->error->message));
            break;
        }
        if (waiter->aborted) {
            result = std::unexpected(Error::negotiation("negotiation aborted"));
            break;
        }
        if (closed_) {
            result = std::unexpected(Error::unexpected_state("transports closed during negotiation"));
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result = std::unexpected(Error::negotiation("negotiation timed out"));
            break;
        }
        co_await negotiation_event_.wait_for(deadline - now);
    }

    negotiation_waiters_.erase(it);
    co_return result;
}

std::shared_ptr<DataChannel> TransportCoordinator::create_publisher_data_channel(const std::string& label,
                                                                                 const DataChannelInit& init) {
    return publisher_->create_data_channel(label, init);
}

std::optional<std::string> TransportCoordinator::connected_address(std::optional<SignalTarget> target) const {
    if (target) {
        return *target == SignalTarget::PUBLISHER ? publisher_->connected_address()
                                                  : subscriber_->connected_address();
    }
    if (needs_publisher_) return publisher_->connected_address();
    return subscriber_->connected_address();
}

void TransportCoordinator::close() {
    if (closed_) return;
    closed_ = true;

    publisher_->close();
    subscriber_->close();
    update_state();
    negotiation_event_.notify();
}

} // namespace livelink::client
