#pragma once

#include "client/connection_state.hpp"
#include "client/peer_transport.hpp"
#include "common/errors.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace livelink::client {

namespace asio = boost::asio;

struct TransportLinkCallbacks {
    std::function<void(const IceCandidate&)> on_ice_candidate;
    std::function<void(const SessionDescription&)> on_offer;
    std::function<void(TransportState)> on_state_change;
    std::function<void(std::shared_ptr<DataChannel>)> on_data_channel;
    std::function<void(const std::string& mid)> on_track;
    std::function<void()> on_negotiation_started;
    std::function<void()> on_negotiation_complete;
};

/// Owns one PeerTransport, publisher or subscriber side.
///
/// Remote candidates are buffered until a remote description is applied and
/// while an ICE restart is in progress. Native ICE, connection and signaling
/// states are reduced to one TransportState, reported on change.
class TransportLink {
public:
    static constexpr std::chrono::milliseconds kNegotiateDebounce{100};

    TransportLink(asio::any_io_executor ex, std::unique_ptr<PeerTransport> transport, SignalTarget role);
    ~TransportLink();

    TransportLink(const TransportLink&) = delete;
    TransportLink& operator=(const TransportLink&) = delete;

    void set_callbacks(TransportLinkCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    SignalTarget role() const { return role_; }

    // Debounced: emits on_negotiation_started, then creates and sends an offer.
    // on_error receives offer failures; without it they are logged.
    void negotiate(std::function<void(const Error&)> on_error = {});

    VoidResult create_and_send_offer(const OfferOptions& options = {});

    VoidResult set_remote_description(const SessionDescription& description);

    // Subscriber role: answer to the remote offer just applied
    Result<SessionDescription> create_and_set_answer();

    VoidResult add_ice_candidate(const IceCandidate& candidate);

    VoidResult set_configuration(const PeerTransportConfig& config);

    void close();
    bool is_closed() const { return closed_; }

    TransportState state() const { return state_; }
    bool is_ice_connected() const;
    IceConnectionState ice_state() const;
    PeerConnectionState connection_state() const;
    SignalingState signaling_state() const;

    std::optional<std::string> connected_address() const;

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label, const DataChannelInit& init);

    bool restarting_ice() const { return restarting_ice_; }
    void set_restarting_ice(bool restarting) { restarting_ice_ = restarting; }

    bool renegotiate_pending() const { return renegotiate_; }
    size_t pending_candidate_count() const { return pending_candidates_.size(); }

private:
    TransportState compute_state() const;
    void update_state();

    asio::any_io_executor ex_;
    std::unique_ptr<PeerTransport> transport_;
    SignalTarget role_;
    TransportLinkCallbacks callbacks_;

    asio::steady_timer debounce_timer_;
    std::function<void(const Error&)> negotiate_error_handler_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    std::vector<IceCandidate> pending_candidates_;
    bool restarting_ice_ = false;
    bool renegotiate_ = false;
    bool closing_ = false;
    bool closed_ = false;

    TransportState state_ = TransportState::NEW;
};

} // namespace livelink::client
