#include "client/peer_transport.hpp"

#include <boost/json.hpp>

namespace livelink::client {

namespace json = boost::json;

const char* signal_target_name(SignalTarget target) {
    switch (target) {
        case SignalTarget::PUBLISHER:  return "publisher";
        case SignalTarget::SUBSCRIBER: return "subscriber";
        default:                       return "unknown";
    }
}

const char* ice_connection_state_name(IceConnectionState state) {
    switch (state) {
        case IceConnectionState::NEW:          return "new";
        case IceConnectionState::CHECKING:     return "checking";
        case IceConnectionState::CONNECTED:    return "connected";
        case IceConnectionState::COMPLETED:    return "completed";
        case IceConnectionState::FAILED:       return "failed";
        case IceConnectionState::DISCONNECTED: return "disconnected";
        case IceConnectionState::CLOSED:       return "closed";
        default:                               return "unknown";
    }
}

const char* peer_connection_state_name(PeerConnectionState state) {
    switch (state) {
        case PeerConnectionState::NEW:          return "new";
        case PeerConnectionState::CONNECTING:   return "connecting";
        case PeerConnectionState::CONNECTED:    return "connected";
        case PeerConnectionState::DISCONNECTED: return "disconnected";
        case PeerConnectionState::FAILED:       return "failed";
        case PeerConnectionState::CLOSED:       return "closed";
        default:                                return "unknown";
    }
}

const char* signaling_state_name(SignalingState state) {
    switch (state) {
        case SignalingState::STABLE:               return "stable";
        case SignalingState::HAVE_LOCAL_OFFER:     return "have-local-offer";
        case SignalingState::HAVE_REMOTE_OFFER:    return "have-remote-offer";
        case SignalingState::HAVE_LOCAL_PRANSWER:  return "have-local-pranswer";
        case SignalingState::HAVE_REMOTE_PRANSWER: return "have-remote-pranswer";
        case SignalingState::CLOSED:               return "closed";
        default:                                   return "unknown";
    }
}

std::string candidate_to_json(const IceCandidate& candidate) {
    json::object obj;
    obj["candidate"] = candidate.candidate;
    obj["sdpMid"] = candidate.sdp_mid;
    if (candidate.sdp_mline_index) {
        obj["sdpMLineIndex"] = *candidate.sdp_mline_index;
    } else {
        obj["sdpMLineIndex"] = nullptr;
    }
    if (!candidate.username_fragment.empty()) {
        obj["usernameFragment"] = candidate.username_fragment;
    }
    return json::serialize(obj);
}

std::optional<IceCandidate> candidate_from_json(std::string_view text) {
    boost::system::error_code ec;
    auto value = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec || !value.is_object()) {
        return std::nullopt;
    }

    const auto& obj = value.as_object();
    auto it = obj.find("candidate");
    if (it == obj.end() || !it->value().is_string()) {
        return std::nullopt;
    }

    IceCandidate candidate;
    candidate.candidate = std::string(it->value().as_string());

    if (auto mid = obj.find("sdpMid"); mid != obj.end() && mid->value().is_string()) {
        candidate.sdp_mid = std::string(mid->value().as_string());
    }
    if (auto index = obj.find("sdpMLineIndex"); index != obj.end()) {
        if (index->value().is_int64()) {
            candidate.sdp_mline_index = static_cast<int>(index->value().as_int64());
        } else if (index->value().is_uint64()) {
            candidate.sdp_mline_index = static_cast<int>(index->value().as_uint64());
        }
    }
    if (auto ufrag = obj.find("usernameFragment"); ufrag != obj.end() && ufrag->value().is_string()) {
        candidate.username_fragment = std::string(ufrag->value().as_string());
    }
    return candidate;
}

} // namespace livelink::client
