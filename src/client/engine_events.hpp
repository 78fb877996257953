#pragma once

#include "client/connection_state.hpp"
#include "common/event_bus.hpp"

#include "livelink_rtc.pb.h"

#include <optional>
#include <string>
#include <vector>

namespace livelink::client {

class TransportLink;

// ============================================================================
// Engine events - published on SessionEngine::events()
// ============================================================================
namespace engine_events {

// Transports reached CONNECTED for the first time after join
struct Connected : TypedEvent<Connected> {
    proto::JoinResponse join;
};

// Terminal: the engine gave up or the server ended the session
struct Disconnected : TypedEvent<Disconnected> {
    std::optional<proto::DisconnectReason> reason;
};

struct Resuming : TypedEvent<Resuming> {};
struct Resumed : TypedEvent<Resumed> {};
struct Restarting : TypedEvent<Restarting> {};
struct Restarted : TypedEvent<Restarted> {};
struct SignalResumed : TypedEvent<SignalResumed> {};

struct SignalRestarted : TypedEvent<SignalRestarted> {
    proto::JoinResponse join;
};

struct Closing : TypedEvent<Closing> {};

// Both links are owned by the engine's coordinator
struct TransportsCreated : TypedEvent<TransportsCreated> {
    TransportLink* publisher = nullptr;
    TransportLink* subscriber = nullptr;
};

struct MediaTrackAdded : TypedEvent<MediaTrackAdded> {
    std::string mid;
};

struct ActiveSpeakersUpdate : TypedEvent<ActiveSpeakersUpdate> {
    std::vector<proto::SpeakerInfo> speakers;
};

struct DataPacketReceived : TypedEvent<DataPacketReceived> {
    proto::UserPacket packet;
    DataPacketKind kind = DataPacketKind::RELIABLE;
};

struct ParticipantUpdate : TypedEvent<ParticipantUpdate> {
    std::vector<proto::ParticipantInfo> participants;
};

struct RoomUpdate : TypedEvent<RoomUpdate> {
    proto::Room room;
};

struct SpeakersChanged : TypedEvent<SpeakersChanged> {
    std::vector<proto::SpeakerInfo> speakers;
};

struct StreamStateChanged : TypedEvent<StreamStateChanged> {
    proto::StreamStateUpdate update;
};

struct ConnectionQualityUpdate : TypedEvent<ConnectionQualityUpdate> {
    proto::ConnectionQualityUpdate update;
};

struct SubscriptionError : TypedEvent<SubscriptionError> {
    proto::SubscriptionResponse response;
};

struct SubscriptionPermissionUpdate : TypedEvent<SubscriptionPermissionUpdate> {
    proto::SubscriptionPermissionUpdate update;
};

struct SubscribedQualityUpdate : TypedEvent<SubscribedQualityUpdate> {
    proto::SubscribedQualityUpdate update;
};

struct LocalTrackUnpublished : TypedEvent<LocalTrackUnpublished> {
    proto::TrackUnpublishedResponse response;
};

struct RemoteMute : TypedEvent<RemoteMute> {
    std::string track_sid;
    bool muted = false;
};

// Signal and transports are both severed
struct Offline : TypedEvent<Offline> {};

struct DataChannelBufferStatusChanged : TypedEvent<DataChannelBufferStatusChanged> {
    bool is_low = true;
    DataPacketKind kind = DataPacketKind::RELIABLE;
};

struct TokenRefreshed : TypedEvent<TokenRefreshed> {
    std::string token;
};

} // namespace engine_events

} // namespace livelink::client
