#include "client/connection_state.hpp"

namespace livelink::client {

const char* signal_connection_state_name(SignalConnectionState state) {
    switch (state) {
        case SignalConnectionState::CONNECTING:    return "CONNECTING";
        case SignalConnectionState::CONNECTED:     return "CONNECTED";
        case SignalConnectionState::RECONNECTING:  return "RECONNECTING";
        case SignalConnectionState::DISCONNECTING: return "DISCONNECTING";
        case SignalConnectionState::DISCONNECTED:  return "DISCONNECTED";
        default:                                   return "UNKNOWN";
    }
}

const char* transport_state_name(TransportState state) {
    switch (state) {
        case TransportState::NEW:        return "NEW";
        case TransportState::CONNECTING: return "CONNECTING";
        case TransportState::CONNECTED:  return "CONNECTED";
        case TransportState::FAILED:     return "FAILED";
        case TransportState::CLOSING:    return "CLOSING";
        case TransportState::CLOSED:     return "CLOSED";
        default:                         return "UNKNOWN";
    }
}

const char* session_phase_name(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::NEW:          return "NEW";
        case SessionPhase::CONNECTED:    return "CONNECTED";
        case SessionPhase::DISCONNECTED: return "DISCONNECTED";
        case SessionPhase::RECONNECTING: return "RECONNECTING";
        case SessionPhase::CLOSED:       return "CLOSED";
        default:                         return "UNKNOWN";
    }
}

const char* data_packet_kind_name(DataPacketKind kind) {
    switch (kind) {
        case DataPacketKind::RELIABLE: return "reliable";
        case DataPacketKind::LOSSY:    return "lossy";
        default:                       return "unknown";
    }
}

} // namespace livelink::client
