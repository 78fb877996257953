#pragma once

#include "common/errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace livelink::client {

// ============================================================================
// Transport Types
// ============================================================================

// Which side of the session a transport serves
enum class SignalTarget : uint8_t {
    PUBLISHER = 0,
    SUBSCRIBER = 1,
};

const char* signal_target_name(SignalTarget target);

struct IceServer {
    std::vector<std::string> urls;
    std::string username;
    std::string credential;

    bool operator==(const IceServer&) const = default;
};

enum class IceTransportPolicy : uint8_t {
    ALL,
    RELAY,
};

struct PeerTransportConfig {
    std::vector<IceServer> ice_servers;
    IceTransportPolicy ice_transport_policy = IceTransportPolicy::ALL;

    bool operator==(const PeerTransportConfig&) const = default;
};

struct SessionDescription {
    std::string type;  // "offer" or "answer"
    std::string sdp;

    bool is_offer() const { return type == "offer"; }
    bool is_answer() const { return type == "answer"; }
};

struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    std::optional<int> sdp_mline_index;
    std::string username_fragment;
};

// {"candidate","sdpMid","sdpMLineIndex","usernameFragment"}, as carried by trickle
std::string candidate_to_json(const IceCandidate& candidate);
std::optional<IceCandidate> candidate_from_json(std::string_view json);

enum class IceConnectionState : uint8_t {
    NEW,
    CHECKING,
    CONNECTED,
    COMPLETED,
    FAILED,
    DISCONNECTED,
    CLOSED,
};

enum class PeerConnectionState : uint8_t {
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED,
};

enum class SignalingState : uint8_t {
    STABLE,
    HAVE_LOCAL_OFFER,
    HAVE_REMOTE_OFFER,
    HAVE_LOCAL_PRANSWER,
    HAVE_REMOTE_PRANSWER,
    CLOSED,
};

const char* ice_connection_state_name(IceConnectionState state);
const char* peer_connection_state_name(PeerConnectionState state);
const char* signaling_state_name(SignalingState state);

// ============================================================================
// DataChannel
// ============================================================================

enum class DataChannelState : uint8_t {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED,
};

struct DataChannelInit {
    bool ordered = true;
    std::optional<uint16_t> max_retransmits;  // 0 = best effort
    std::optional<uint16_t> id;
    bool negotiated = false;
};

struct DataChannelCallbacks {
    std::function<void()> on_open;
    std::function<void()> on_close;
    std::function<void(std::string data, bool binary)> on_message;
    std::function<void()> on_buffered_amount_low;
};

class DataChannel {
public:
    virtual ~DataChannel() = default;

    virtual std::string label() const = 0;

    // Stream id; unset until negotiation assigns one
    virtual std::optional<uint16_t> id() const = 0;

    virtual DataChannelState ready_state() const = 0;
    virtual size_t buffered_amount() const = 0;
    virtual size_t buffered_amount_low_threshold() const = 0;
    virtual void set_buffered_amount_low_threshold(size_t bytes) = 0;

    // Binary send; false when the channel is not open
    virtual bool send(const std::string& data) = 0;

    virtual void close() = 0;

    // Callbacks are invoked on the owning executor
    virtual void set_callbacks(DataChannelCallbacks callbacks) = 0;
};

// ============================================================================
// PeerTransport
// ============================================================================

struct PeerTransportCallbacks {
    std::function<void(const IceCandidate&)> on_ice_candidate;
    std::function<void(IceConnectionState)> on_ice_connection_state;
    std::function<void(PeerConnectionState)> on_connection_state;
    std::function<void(SignalingState)> on_signaling_state;
    std::function<void(std::shared_ptr<DataChannel>)> on_data_channel;
    std::function<void(const std::string& mid)> on_track;
};

struct OfferOptions {
    bool ice_restart = false;
};

/// One native peer connection.
///
/// Offer and answer creation also apply the result as local description.
/// Every callback is delivered on the owning executor, never re-entrantly
/// from inside a method call.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    virtual void set_callbacks(PeerTransportCallbacks callbacks) = 0;

    virtual Result<SessionDescription> create_offer(const OfferOptions& options) = 0;
    virtual Result<SessionDescription> create_answer() = 0;
    virtual VoidResult set_remote_description(const SessionDescription& description) = 0;
    virtual VoidResult add_ice_candidate(const IceCandidate& candidate) = 0;

    virtual std::optional<SessionDescription> local_description() const = 0;
    virtual std::optional<SessionDescription> remote_description() const = 0;

    virtual SignalingState signaling_state() const = 0;
    virtual IceConnectionState ice_connection_state() const = 0;
    virtual PeerConnectionState connection_state() const = 0;

    virtual VoidResult set_configuration(const PeerTransportConfig& config) = 0;

    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label,
                                                             const DataChannelInit& init) = 0;

    // "ip:port" of the selected remote candidate
    virtual std::optional<std::string> remote_address() const = 0;

    virtual void close() = 0;
};

class PeerTransportFactory {
public:
    virtual ~PeerTransportFactory() = default;
    virtual std::unique_ptr<PeerTransport> create(const PeerTransportConfig& config) = 0;
};

} // namespace livelink::client
