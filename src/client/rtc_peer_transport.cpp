#include "client/rtc_peer_transport.hpp"
#include "common/logger.hpp"

#include <rtc/rtc.hpp>

#include <boost/asio/post.hpp>
#include <openssl/rand.h>

#include <variant>

namespace livelink::client {

namespace {

auto& log() { return Logger::get("client.rtc"); }

rtc::Configuration to_rtc_configuration(const PeerTransportConfig& config) {
    rtc::Configuration out;
    for (const auto& server : config.ice_servers) {
        for (const auto& url : server.urls) {
            try {
                rtc::IceServer ice(url);
                if (!server.username.empty()) {
                    ice.username = server.username;
                    ice.password = server.credential;
                }
                out.iceServers.push_back(std::move(ice));
            } catch (const std::exception& e) {
                log().warn("Skipping ICE server {}: {}", url, e.what());
            }
        }
    }
    out.iceTransportPolicy = config.ice_transport_policy == IceTransportPolicy::RELAY
                                 ? rtc::TransportPolicy::Relay
                                 : rtc::TransportPolicy::All;
    // Offers and answers are produced only when the transport link asks
    out.disableAutoNegotiation = true;
    return out;
}

IceConnectionState from_rtc(rtc::PeerConnection::IceState state) {
    switch (state) {
        case rtc::PeerConnection::IceState::New:          return IceConnectionState::NEW;
        case rtc::PeerConnection::IceState::Checking:     return IceConnectionState::CHECKING;
        case rtc::PeerConnection::IceState::Connected:    return IceConnectionState::CONNECTED;
        case rtc::PeerConnection::IceState::Completed:    return IceConnectionState::COMPLETED;
        case rtc::PeerConnection::IceState::Failed:       return IceConnectionState::FAILED;
        case rtc::PeerConnection::IceState::Disconnected: return IceConnectionState::DISCONNECTED;
        case rtc::PeerConnection::IceState::Closed:       return IceConnectionState::CLOSED;
        default:                                          return IceConnectionState::NEW;
    }
}

PeerConnectionState from_rtc(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New:          return PeerConnectionState::NEW;
        case rtc::PeerConnection::State::Connecting:   return PeerConnectionState::CONNECTING;
        case rtc::PeerConnection::State::Connected:    return PeerConnectionState::CONNECTED;
        case rtc::PeerConnection::State::Disconnected: return PeerConnectionState::DISCONNECTED;
        case rtc::PeerConnection::State::Failed:       return PeerConnectionState::FAILED;
        case rtc::PeerConnection::State::Closed:       return PeerConnectionState::CLOSED;
        default:                                       return PeerConnectionState::NEW;
    }
}

SignalingState from_rtc(rtc::PeerConnection::SignalingState state) {
    switch (state) {
        case rtc::PeerConnection::SignalingState::Stable:             return SignalingState::STABLE;
        case rtc::PeerConnection::SignalingState::HaveLocalOffer:     return SignalingState::HAVE_LOCAL_OFFER;
        case rtc::PeerConnection::SignalingState::HaveRemoteOffer:    return SignalingState::HAVE_REMOTE_OFFER;
        case rtc::PeerConnection::SignalingState::HaveLocalPranswer:  return SignalingState::HAVE_LOCAL_PRANSWER;
        case rtc::PeerConnection::SignalingState::HaveRemotePranswer: return SignalingState::HAVE_REMOTE_PRANSWER;
        default:                                                      return SignalingState::STABLE;
    }
}

SessionDescription from_rtc(const rtc::Description& description) {
    return SessionDescription{description.typeString(), std::string(description)};
}

// Hex token for ICE credentials
std::string random_ice_token(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes * 2);
    for (auto b : buf) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0f]);
    }
    return out;
}

}  // anonymous namespace

// ============================================================================
// RtcDataChannel
// ============================================================================

RtcDataChannel::RtcDataChannel(asio::any_io_executor ex, std::shared_ptr<rtc::DataChannel> channel)
    : ex_(std::move(ex))
    , channel_(std::move(channel))
    , shared_(std::make_shared<Shared>())
{
    std::weak_ptr<Shared> weak = shared_;
    auto ex_copy = ex_;

    // Posts fn onto the executor, dropping it if the wrapper is gone
    auto deliver = [weak, ex_copy](auto fn) {
        asio::post(ex_copy, [weak, fn = std::move(fn)]() mutable {
            auto shared = weak.lock();
            if (!shared || shared->detached) return;
            fn(*shared);
        });
    };

    channel_->onOpen([deliver] {
        deliver([](Shared& s) { if (s.callbacks.on_open) s.callbacks.on_open(); });
    });
    channel_->onClosed([deliver] {
        deliver([](Shared& s) { if (s.callbacks.on_close) s.callbacks.on_close(); });
    });
    channel_->onBufferedAmountLow([deliver] {
        deliver([](Shared& s) {
            if (s.callbacks.on_buffered_amount_low) s.callbacks.on_buffered_amount_low();
        });
    });
    channel_->onMessage([deliver](rtc::message_variant message) {
        std::string data;
        bool binary = false;
        if (auto* bin = std::get_if<rtc::binary>(&message)) {
            data.assign(reinterpret_cast<const char*>(bin->data()), bin->size());
            binary = true;
        } else {
            data = std::get<rtc::string>(std::move(message));
        }
        deliver([data = std::move(data), binary](Shared& s) mutable {
            if (s.callbacks.on_message) s.callbacks.on_message(std::move(data), binary);
        });
    });
}

RtcDataChannel::~RtcDataChannel() {
    shared_->detached = true;
    channel_->resetCallbacks();
}

std::string RtcDataChannel::label() const {
    return channel_->label();
}

std::optional<uint16_t> RtcDataChannel::id() const {
    return channel_->id();
}

DataChannelState RtcDataChannel::ready_state() const {
    if (channel_->isOpen()) return closing_ ? DataChannelState::CLOSING : DataChannelState::OPEN;
    if (channel_->isClosed()) return DataChannelState::CLOSED;
    return closing_ ? DataChannelState::CLOSING : DataChannelState::CONNECTING;
}

size_t RtcDataChannel::buffered_amount() const {
    return channel_->bufferedAmount();
}

void RtcDataChannel::set_buffered_amount_low_threshold(size_t bytes) {
    low_threshold_ = bytes;
    channel_->setBufferedAmountLowThreshold(bytes);
}

bool RtcDataChannel::send(const std::string& data) {
    try {
        return channel_->send(reinterpret_cast<const std::byte*>(data.data()), data.size());
    } catch (const std::exception& e) {
        log().warn("data channel {} send failed: {}", channel_->label(), e.what());
        return false;
    }
}

void RtcDataChannel::close() {
    closing_ = true;
    channel_->close();
}

void RtcDataChannel::set_callbacks(DataChannelCallbacks callbacks) {
    shared_->callbacks = std::move(callbacks);
}

// ============================================================================
// RtcPeerTransport
// ============================================================================

RtcPeerTransport::RtcPeerTransport(asio::any_io_executor ex, const PeerTransportConfig& config)
    : ex_(std::move(ex))
    , config_(config)
    , shared_(std::make_shared<Shared>())
    , pc_(std::make_unique<rtc::PeerConnection>(to_rtc_configuration(config)))
{
    install_native_callbacks();
}

RtcPeerTransport::~RtcPeerTransport() {
    close();
}

void RtcPeerTransport::install_native_callbacks() {
    std::weak_ptr<Shared> weak = shared_;
    auto ex = ex_;

    auto deliver = [weak, ex](auto fn) {
        asio::post(ex, [weak, fn = std::move(fn)]() mutable {
            auto shared = weak.lock();
            if (!shared || shared->closed) return;
            fn(*shared);
        });
    };

    pc_->onLocalCandidate([deliver](rtc::Candidate candidate) {
        IceCandidate c;
        c.candidate = candidate.candidate();
        c.sdp_mid = candidate.mid();
        deliver([c = std::move(c)](Shared& s) mutable {
            if (auto it = s.mid_index.find(c.sdp_mid); it != s.mid_index.end()) {
                c.sdp_mline_index = it->second;
            }
            if (s.callbacks.on_ice_candidate) s.callbacks.on_ice_candidate(c);
        });
    });

    pc_->onIceStateChange([deliver](rtc::PeerConnection::IceState state) {
        deliver([state = from_rtc(state)](Shared& s) {
            if (s.callbacks.on_ice_connection_state) s.callbacks.on_ice_connection_state(state);
        });
    });

    pc_->onStateChange([deliver](rtc::PeerConnection::State state) {
        deliver([state = from_rtc(state)](Shared& s) {
            if (s.callbacks.on_connection_state) s.callbacks.on_connection_state(state);
        });
    });

    pc_->onSignalingStateChange([deliver](rtc::PeerConnection::SignalingState state) {
        deliver([state = from_rtc(state)](Shared& s) {
            if (s.callbacks.on_signaling_state) s.callbacks.on_signaling_state(state);
        });
    });

    pc_->onDataChannel([deliver, ex](std::shared_ptr<rtc::DataChannel> channel) {
        deliver([channel = std::move(channel), ex](Shared& s) mutable {
            auto wrapped = std::make_shared<RtcDataChannel>(ex, std::move(channel));
            if (s.callbacks.on_data_channel) s.callbacks.on_data_channel(std::move(wrapped));
        });
    });

    pc_->onTrack([deliver](std::shared_ptr<rtc::Track> track) {
        deliver([mid = track->mid()](Shared& s) {
            if (s.callbacks.on_track) s.callbacks.on_track(mid);
        });
    });
}

void RtcPeerTransport::update_mid_index() {
    shared_->mid_index.clear();
    auto description = pc_->localDescription();
    if (!description) return;

    for (int i = 0; i < description->mediaCount(); ++i) {
        auto entry = description->media(i);
        std::visit([this, i](auto* media) { shared_->mid_index[media->mid()] = i; }, entry);
    }
}

void RtcPeerTransport::set_callbacks(PeerTransportCallbacks callbacks) {
    shared_->callbacks = std::move(callbacks);
}

Result<SessionDescription> RtcPeerTransport::create_offer(const OfferOptions& options) {
    if (shared_->closed) {
        return std::unexpected(Error::unexpected_state("cannot create offer on a closed transport"));
    }

    try {
        rtc::LocalDescriptionInit init;
        if (options.ice_restart) {
            init.iceUfrag = random_ice_token(4);
            init.icePwd = random_ice_token(12);
        }
        pc_->setLocalDescription(rtc::Description::Type::Offer, init);
    } catch (const std::exception& e) {
        return std::unexpected(Error::negotiation(std::string("failed to create offer: ") + e.what()));
    }

    auto description = pc_->localDescription();
    if (!description) {
        return std::unexpected(Error::negotiation("no local description after creating offer"));
    }
    update_mid_index();
    return from_rtc(*description);
}

Result<SessionDescription> RtcPeerTransport::create_answer() {
    if (shared_->closed) {
        return std::unexpected(Error::unexpected_state("cannot create answer on a closed transport"));
    }

    try {
        pc_->setLocalDescription(rtc::Description::Type::Answer);
    } catch (const std::exception& e) {
        return std::unexpected(Error::negotiation(std::string("failed to create answer: ") + e.what()));
    }

    auto description = pc_->localDescription();
    if (!description) {
        return std::unexpected(Error::negotiation("no local description after creating answer"));
    }
    update_mid_index();
    return from_rtc(*description);
}

VoidResult RtcPeerTransport::set_remote_description(const SessionDescription& description) {
    if (shared_->closed) {
        return std::unexpected(Error::unexpected_state("cannot set remote description on a closed transport"));
    }

    try {
        pc_->setRemoteDescription(rtc::Description(description.sdp, description.type));
    } catch (const std::exception& e) {
        return std::unexpected(Error::negotiation(std::string("failed to set remote ") +
                                                  description.type + ": " + e.what()));
    }
    return {};
}

VoidResult RtcPeerTransport::add_ice_candidate(const IceCandidate& candidate) {
    if (shared_->closed) {
        return std::unexpected(Error::unexpected_state("cannot add candidate on a closed transport"));
    }

    try {
        pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
    } catch (const std::exception& e) {
        return std::unexpected(Error::negotiation(std::string("failed to add ICE candidate: ") + e.what()));
    }
    return {};
}

std::optional<SessionDescription> RtcPeerTransport::local_description() const {
    auto description = pc_->localDescription();
    if (!description) return std::nullopt;
    return from_rtc(*description);
}

std::optional<SessionDescription> RtcPeerTransport::remote_description() const {
    auto description = pc_->remoteDescription();
    if (!description) return std::nullopt;
    return from_rtc(*description);
}

SignalingState RtcPeerTransport::signaling_state() const {
    if (shared_->closed) return SignalingState::CLOSED;
    return from_rtc(pc_->signalingState());
}

IceConnectionState RtcPeerTransport::ice_connection_state() const {
    if (shared_->closed) return IceConnectionState::CLOSED;
    return from_rtc(pc_->iceState());
}

PeerConnectionState RtcPeerTransport::connection_state() const {
    if (shared_->closed) return PeerConnectionState::CLOSED;
    return from_rtc(pc_->state());
}

VoidResult RtcPeerTransport::set_configuration(const PeerTransportConfig& config) {
    if (shared_->closed) {
        return std::unexpected(Error::unexpected_state("cannot configure a closed transport"));
    }
    if (config == config_) return {};

    // rtc::PeerConnection takes its ICE servers at construction only
    log().warn("ICE configuration change not applied to live connection ({} -> {} server(s), relay only: {})",
               config_.ice_servers.size(), config.ice_servers.size(),
               config.ice_transport_policy == IceTransportPolicy::RELAY);
    return {};
}

std::shared_ptr<DataChannel> RtcPeerTransport::create_data_channel(const std::string& label,
                                                                   const DataChannelInit& init) {
    if (shared_->closed) return nullptr;

    rtc::DataChannelInit native;
    native.reliability.unordered = !init.ordered;
    if (init.max_retransmits) {
        native.reliability.maxRetransmits = *init.max_retransmits;
    }
    native.negotiated = init.negotiated;
    native.id = init.id;

    try {
        auto channel = pc_->createDataChannel(label, native);
        return std::make_shared<RtcDataChannel>(ex_, std::move(channel));
    } catch (const std::exception& e) {
        log().error("failed to create data channel {}: {}", label, e.what());
        return nullptr;
    }
}

std::optional<std::string> RtcPeerTransport::remote_address() const {
    if (shared_->closed) return std::nullopt;
    return pc_->remoteAddress();
}

void RtcPeerTransport::close() {
    if (shared_->closed) return;
    shared_->closed = true;
    shared_->callbacks = {};
    pc_->close();
}

} // namespace livelink::client
