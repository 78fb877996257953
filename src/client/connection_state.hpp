#pragma once

#include <cstdint>

namespace livelink::client {

// ============================================================================
// Signal connection state - phase of the message channel to the server
// ============================================================================
enum class SignalConnectionState : uint8_t {
    CONNECTING = 0,
    CONNECTED,
    RECONNECTING,
    DISCONNECTING,
    DISCONNECTED,
};

const char* signal_connection_state_name(SignalConnectionState state);

// ============================================================================
// Transport state - one media transport, or the reduction over the required ones
// ============================================================================
enum class TransportState : uint8_t {
    NEW = 0,
    CONNECTING,
    CONNECTED,
    FAILED,
    CLOSING,
    CLOSED,
};

const char* transport_state_name(TransportState state);

// ============================================================================
// Session phase - coarse engine state seen by the layer above
// ============================================================================
//
//   NEW -> CONNECTED -> [RECONNECTING -> CONNECTED]* -> DISCONNECTED -> CLOSED
//
enum class SessionPhase : uint8_t {
    NEW = 0,
    CONNECTED,
    DISCONNECTED,
    RECONNECTING,
    CLOSED,
};

const char* session_phase_name(SessionPhase phase);

// Data channel kinds; values match proto DataPacket.Kind
enum class DataPacketKind : uint8_t {
    RELIABLE = 0,
    LOSSY = 1,
};

const char* data_packet_kind_name(DataPacketKind kind);

} // namespace livelink::client
