#pragma once

#include "client/connection_state.hpp"
#include "client/peer_transport.hpp"
#include "client/transport_link.hpp"
#include "common/async_event.hpp"
#include "common/async_mutex.hpp"
#include "common/cancel_signal.hpp"
#include "common/errors.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace livelink::client {

namespace asio = boost::asio;

struct TransportCoordinatorCallbacks {
    // Aggregate state, then the publisher and subscriber states behind it
    std::function<void(TransportState state, TransportState publisher, TransportState subscriber)> on_state_change;
    std::function<void(const IceCandidate&, SignalTarget)> on_ice_candidate;
    std::function<void(const SessionDescription&)> on_publisher_offer;
    std::function<void(std::shared_ptr<DataChannel>)> on_data_channel;
    std::function<void(const std::string& mid)> on_track;
};

// Reduction rules, first match wins:
//   all CONNECTED -> CONNECTED (an empty set included)
//   any FAILED -> FAILED
//   any CONNECTING -> CONNECTING
//   all CLOSED -> CLOSED
//   any CLOSED or CLOSING -> CLOSING
//   all NEW -> NEW
//   otherwise CONNECTING
TransportState reduce_transport_states(const std::vector<TransportState>& states);

/// Owns the publisher and subscriber TransportLinks and reduces their states
/// over the required subset.
///
/// The subscriber is required from the start when the server marks it
/// primary; the publisher becomes required on first publish or data send.
class TransportCoordinator : public std::enable_shared_from_this<TransportCoordinator> {
public:
    TransportCoordinator(asio::any_io_executor ex,
                         PeerTransportFactory& factory,
                         const PeerTransportConfig& config,
                         bool subscriber_primary,
                         std::chrono::milliseconds peer_connection_timeout);
    ~TransportCoordinator();

    TransportCoordinator(const TransportCoordinator&) = delete;
    TransportCoordinator& operator=(const TransportCoordinator&) = delete;

    void set_callbacks(TransportCoordinatorCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    TransportLink& publisher() { return *publisher_; }
    TransportLink& subscriber() { return *subscriber_; }

    TransportState state() const { return state_; }
    bool is_closed() const { return closed_; }

    bool needs_publisher() const { return needs_publisher_; }
    bool needs_subscriber() const { return needs_subscriber_; }
    void require_publisher(bool required = true);
    void require_subscriber(bool required = true);

    std::chrono::milliseconds peer_connection_timeout() const { return peer_connection_timeout_; }
    void set_peer_connection_timeout(std::chrono::milliseconds timeout) { peer_connection_timeout_ = timeout; }

    VoidResult create_and_send_publisher_offer(const OfferOptions& options = {});
    VoidResult set_publisher_answer(const SessionDescription& answer);
    Result<SessionDescription> create_subscriber_answer_from_offer(const SessionDescription& offer);

    VoidResult add_ice_candidate(const IceCandidate& candidate, SignalTarget target);

    VoidResult update_configuration(const PeerTransportConfig& config, bool ice_restart);

    // Marks the subscriber as restarting and re-offers the publisher when it is required
    VoidResult trigger_ice_restart();

    /// Wait until every required transport is CONNECTED.
    /// Kicks a publisher negotiation first when the publisher is required but idle.
    /// Callers are serialized.
    asio::awaitable<VoidResult> ensure_connected(CancelSignalPtr cancel, std::chrono::milliseconds timeout);

    /// Run one publisher negotiation and wait for the answer to be applied.
    /// Bounded by the peer connection timeout.
    asio::awaitable<VoidResult> negotiate(CancelSignalPtr cancel);

    std::shared_ptr<DataChannel> create_publisher_data_channel(const std::string& label,
                                                               const DataChannelInit& init);

    // Without a target: the publisher when it is required, else the subscriber
    std::optional<std::string> connected_address(std::optional<SignalTarget> target = std::nullopt) const;

    void close();

private:
    struct NegotiationWaiter {
        bool started = false;
        bool completed = false;
        bool aborted = false;
        std::optional<Error> error;
    };

    void wire_publisher();
    void wire_subscriber();
    void update_state();
    void on_negotiation_started();
    void on_negotiation_complete();

    asio::any_io_executor ex_;
    std::unique_ptr<TransportLink> publisher_;
    std::unique_ptr<TransportLink> subscriber_;
    TransportCoordinatorCallbacks callbacks_;

    bool needs_publisher_ = false;
    bool needs_subscriber_ = false;
    bool closed_ = false;
    std::chrono::milliseconds peer_connection_timeout_;

    TransportState state_ = TransportState::NEW;

    AsyncMutex connection_lock_;
    AsyncEvent state_event_;
    AsyncEvent negotiation_event_;
    std::list<std::shared_ptr<NegotiationWaiter>> negotiation_waiters_;
};

} // namespace livelink::client
