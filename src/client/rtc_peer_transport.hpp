#pragma once

#include "client/peer_transport.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <map>
#include <memory>

namespace rtc {
class PeerConnection;
class DataChannel;
}

namespace livelink::client {

namespace asio = boost::asio;

// ============================================================================
// RtcDataChannel
// ============================================================================

class RtcDataChannel : public DataChannel {
public:
    RtcDataChannel(asio::any_io_executor ex, std::shared_ptr<rtc::DataChannel> channel);
    ~RtcDataChannel() override;

    std::string label() const override;
    std::optional<uint16_t> id() const override;
    DataChannelState ready_state() const override;
    size_t buffered_amount() const override;
    size_t buffered_amount_low_threshold() const override { return low_threshold_; }
    void set_buffered_amount_low_threshold(size_t bytes) override;
    bool send(const std::string& data) override;
    void close() override;
    void set_callbacks(DataChannelCallbacks callbacks) override;

private:
    struct Shared {
        DataChannelCallbacks callbacks;
        bool detached = false;
    };

    asio::any_io_executor ex_;
    std::shared_ptr<rtc::DataChannel> channel_;
    std::shared_ptr<Shared> shared_;
    size_t low_threshold_ = 0;
    bool closing_ = false;
};

// ============================================================================
// RtcPeerTransport
// ============================================================================

/// PeerTransport over libdatachannel.
///
/// libdatachannel fires callbacks on its own threads; each one is posted to
/// the executor and dropped there once the transport is closed or destroyed.
/// A live rtc::PeerConnection cannot be reconfigured: set_configuration()
/// logs a differing configuration and leaves configuration() as the one the
/// connection was built with. New ICE servers take effect on the next full
/// reconnect, which creates fresh transports.
class RtcPeerTransport : public PeerTransport {
public:
    RtcPeerTransport(asio::any_io_executor ex, const PeerTransportConfig& config);
    ~RtcPeerTransport() override;

    RtcPeerTransport(const RtcPeerTransport&) = delete;
    RtcPeerTransport& operator=(const RtcPeerTransport&) = delete;

    void set_callbacks(PeerTransportCallbacks callbacks) override;

    Result<SessionDescription> create_offer(const OfferOptions& options) override;
    Result<SessionDescription> create_answer() override;
    VoidResult set_remote_description(const SessionDescription& description) override;
    VoidResult add_ice_candidate(const IceCandidate& candidate) override;

    std::optional<SessionDescription> local_description() const override;
    std::optional<SessionDescription> remote_description() const override;

    SignalingState signaling_state() const override;
    IceConnectionState ice_connection_state() const override;
    PeerConnectionState connection_state() const override;

    VoidResult set_configuration(const PeerTransportConfig& config) override;

    std::shared_ptr<DataChannel> create_data_channel(const std::string& label,
                                                     const DataChannelInit& init) override;

    std::optional<std::string> remote_address() const override;

    void close() override;

    const PeerTransportConfig& configuration() const { return config_; }

private:
    struct Shared {
        PeerTransportCallbacks callbacks;
        std::map<std::string, int> mid_index;  // from the last local description
        bool closed = false;
    };

    void install_native_callbacks();
    void update_mid_index();

    asio::any_io_executor ex_;
    PeerTransportConfig config_;
    std::shared_ptr<Shared> shared_;
    std::unique_ptr<rtc::PeerConnection> pc_;
};

class RtcPeerTransportFactory : public PeerTransportFactory {
public:
    explicit RtcPeerTransportFactory(asio::any_io_executor ex) : ex_(std::move(ex)) {}

    std::unique_ptr<PeerTransport> create(const PeerTransportConfig& config) override {
        return std::make_unique<RtcPeerTransport>(ex_, config);
    }

private:
    asio::any_io_executor ex_;
};

} // namespace livelink::client
