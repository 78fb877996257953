#include <gtest/gtest.h>
#include "client/session_engine.hpp"
#include "fakes/fake_http_client.hpp"
#include "fakes/fake_peer_transport.hpp"
#include "fakes/fake_signal_socket.hpp"
#include "fakes/test_utils.hpp"

using namespace livelink;
using namespace livelink::client;
using namespace livelink::fakes;
using namespace std::chrono_literals;

namespace {

size_t count_sent(const std::shared_ptr<FakeSignalSocket>& socket, proto::SignalRequest::MessageCase kind) {
    size_t n = 0;
    for (const auto& req : socket->sent_requests()) {
        if (req.message_case() == kind) ++n;
    }
    return n;
}

proto::SignalResponse answer_response() {
    proto::SignalResponse resp;
    resp.mutable_answer()->set_type("answer");
    resp.mutable_answer()->set_sdp("v=0 server answer");
    return resp;
}

// Hands out delays by retry count and keeps every context it was asked about
struct RecordingPolicy : ReconnectPolicy {
    explicit RecordingPolicy(std::vector<std::chrono::milliseconds> d) : delays(std::move(d)) {}

    std::optional<std::chrono::milliseconds> next_retry_delay(const ReconnectContext& context) override {
        contexts.push_back(context);
        if (context.retry_count >= delays.size()) return std::nullopt;
        return delays[context.retry_count];
    }

    std::vector<std::chrono::milliseconds> delays;
    std::vector<ReconnectContext> contexts;
};

}  // namespace

class SessionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        sockets = std::make_shared<FakeSignalSocketFactory>(ioc.get_executor());
        http = std::make_shared<FakeHttpClient>();
        transports = std::make_shared<FakePeerTransportFactory>();
    }

    void TearDown() override {
        if (engine) run_coro(ioc, engine->close());
        engine.reset();
        drain(ioc);
    }

    static std::shared_ptr<ReconnectPolicy> fixed(std::vector<std::chrono::milliseconds> delays) {
        return std::make_shared<FixedReconnectPolicy>(std::move(delays));
    }

    void make_engine(std::shared_ptr<ReconnectPolicy> policy = fixed({0ms, 0ms, 0ms})) {
        EngineDependencies deps;
        deps.sockets = sockets;
        deps.http = http;
        deps.transports = transports;
        deps.reconnect_policy = std::move(policy);
        engine = std::make_shared<SessionEngine>(ioc.get_executor(), options, std::move(deps));

        subs.push_back(engine->events().subscribe<engine_events::Connected>(
            [this](const engine_events::Connected&) { ++connected; }));
        subs.push_back(engine->events().subscribe<engine_events::Resuming>(
            [this](const engine_events::Resuming&) { ++resuming; }));
        subs.push_back(engine->events().subscribe<engine_events::Resumed>(
            [this](const engine_events::Resumed&) { ++resumed; }));
        subs.push_back(engine->events().subscribe<engine_events::SignalResumed>(
            [this](const engine_events::SignalResumed&) { ++signal_resumed; }));
        subs.push_back(engine->events().subscribe<engine_events::Restarting>(
            [this](const engine_events::Restarting&) { ++restarting; }));
        subs.push_back(engine->events().subscribe<engine_events::SignalRestarted>(
            [this](const engine_events::SignalRestarted&) { ++signal_restarted; }));
        subs.push_back(engine->events().subscribe<engine_events::Restarted>(
            [this](const engine_events::Restarted&) { ++restarted; }));
        subs.push_back(engine->events().subscribe<engine_events::Closing>(
            [this](const engine_events::Closing&) { ++closing; }));
        subs.push_back(engine->events().subscribe<engine_events::Disconnected>(
            [this](const engine_events::Disconnected& ev) {
                ++disconnected;
                disconnect_reason = ev.reason;
            }));
    }

    // Joins as subscriber-primary and connects the subscriber transport
    void connect_session() {
        if (!engine) make_engine();
        sockets->on_open = [](FakeSignalSocket& s) { s.accept_with(make_join_response(true)); };
        auto res = run_coro(ioc, engine->join("wss://example.com", "token-1"));
        ASSERT_TRUE(res.has_value()) << res.error().describe();
        transports->subscriber()->connect();
        ASSERT_TRUE(run_until(ioc, [&] { return connected == 1; }));
    }

    asio::io_context ioc;
    EngineOptions options;
    std::shared_ptr<FakeSignalSocketFactory> sockets;
    std::shared_ptr<FakeHttpClient> http;
    std::shared_ptr<FakePeerTransportFactory> transports;
    std::shared_ptr<SessionEngine> engine;
    SubscriptionList subs;

    int connected = 0;
    int resuming = 0;
    int resumed = 0;
    int signal_resumed = 0;
    int restarting = 0;
    int signal_restarted = 0;
    int restarted = 0;
    int closing = 0;
    int disconnected = 0;
    std::optional<proto::DisconnectReason> disconnect_reason;
};

// ============================================================================
// Join
// ============================================================================

TEST_F(SessionEngineTest, JoinCreatesTransportsAndDataChannels) {
    connect_session();

    EXPECT_FALSE(engine->is_closed());
    EXPECT_EQ(engine->phase(), SessionPhase::CONNECTED);
    ASSERT_NE(engine->transports(), nullptr);
    EXPECT_TRUE(engine->transports()->needs_subscriber());
    EXPECT_FALSE(engine->transports()->needs_publisher());
    ASSERT_TRUE(engine->latest_join_response().has_value());
    EXPECT_EQ(engine->latest_join_response()->room().name(), "test-room");

    auto* pub = transports->publisher();
    auto lossy = pub->channel(SessionEngine::kLossyChannel);
    auto reliable = pub->channel(SessionEngine::kReliableChannel);
    ASSERT_TRUE(lossy && reliable);
    EXPECT_EQ(lossy->init().max_retransmits, std::optional<uint16_t>(0));
    EXPECT_FALSE(reliable->init().max_retransmits.has_value());
    EXPECT_EQ(reliable->buffered_amount_low_threshold(), 65536u);
    EXPECT_EQ(lossy->buffered_amount_low_threshold(), 65536u);

    // Subscriber primary without fast publish: no initial offer
    run_for(ioc, 150ms);
    EXPECT_EQ(pub->offers_created(), 0);
}

TEST_F(SessionEngineTest, PublisherPrimaryNegotiatesOnJoin) {
    make_engine();
    sockets->on_open = [](FakeSignalSocket& s) { s.accept_with(make_join_response(false)); };
    auto res = run_coro(ioc, engine->join("wss://example.com", "token-1"));
    ASSERT_TRUE(res.has_value());

    auto socket = sockets->last();
    ASSERT_TRUE(run_until(ioc, [&] { return count_sent(socket, proto::SignalRequest::kOffer) == 1; }));
    EXPECT_TRUE(engine->transports()->needs_publisher());

    socket->deliver(answer_response());
    ASSERT_TRUE(run_until(ioc, [&] {
        return transports->publisher()->signaling_state() == SignalingState::STABLE;
    }));

    transports->publisher()->connect();
    ASSERT_TRUE(run_until(ioc, [&] { return connected == 1; }));
}

TEST_F(SessionEngineTest, ServerIceServersAndForceRelayApplied) {
    options.rtc_config.ice_servers.push_back(IceServer{{"stun:fallback.example.com"}, "", ""});
    make_engine();

    auto join = make_join_response(true);
    auto* server = join.mutable_join()->add_ice_servers();
    server->add_urls("turn:turn.example.com:3478");
    server->set_username("user");
    server->set_credential("pass");
    join.mutable_join()->mutable_client_configuration()->set_force_relay(proto::ENABLED);

    sockets->on_open = [join](FakeSignalSocket& s) { s.accept_with(join); };
    ASSERT_TRUE(run_coro(ioc, engine->join("wss://example.com", "t")).has_value());

    const auto& config = transports->subscriber()->config();
    ASSERT_EQ(config.ice_servers.size(), 1u);
    EXPECT_EQ(config.ice_servers[0].urls[0], "turn:turn.example.com:3478");
    EXPECT_EQ(config.ice_servers[0].username, "user");
    EXPECT_EQ(config.ice_transport_policy, IceTransportPolicy::RELAY);
}

TEST_F(SessionEngineTest, JoinRetriesUnreachableServer) {
    options.max_retries = 2;
    make_engine();

    int attempt = 0;
    sockets->on_open = [&attempt](FakeSignalSocket& s) {
        if (attempt++ == 0) {
            s.fail("connection refused");
        } else {
            s.accept_with(make_join_response(true));
        }
    };
    auto res = run_coro(ioc, engine->join("wss://example.com", "t"));
    ASSERT_TRUE(res.has_value()) << res.error().describe();
    EXPECT_EQ(sockets->created(), 2u);
}

TEST_F(SessionEngineTest, JoinFailurePropagates) {
    make_engine();
    sockets->on_open = [](FakeSignalSocket& s) { s.fail("connection refused"); };
    auto res = run_coro(ioc, engine->join("wss://example.com", "t"));
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(res.error().is(ConnectionErrorReason::SERVER_UNREACHABLE));
    EXPECT_TRUE(engine->is_closed());
    EXPECT_EQ(sockets->created(), 1u);
}

TEST_F(SessionEngineTest, SubscriberOfferIsAnswered) {
    connect_session();
    auto socket = sockets->last();

    proto::SignalResponse offer;
    offer.mutable_offer()->set_type("offer");
    offer.mutable_offer()->set_sdp("v=0 server offer");
    socket->deliver(offer);

    ASSERT_TRUE(run_until(ioc, [&] { return count_sent(socket, proto::SignalRequest::kAnswer) == 1; }));
}

TEST_F(SessionEngineTest, TrickleReachesTargetTransport) {
    connect_session();

    proto::SignalResponse offer;
    offer.mutable_offer()->set_type("offer");
    offer.mutable_offer()->set_sdp("v=0 server offer");
    sockets->last()->deliver(offer);

    proto::SignalResponse trickle;
    trickle.mutable_trickle()->set_candidate_init(
        R"({"candidate":"candidate:7 1 udp 1 10.0.0.7 7000 typ host","sdpMid":"0","sdpMLineIndex":0})");
    trickle.mutable_trickle()->set_target(proto::SUBSCRIBER);
    sockets->last()->deliver(trickle);

    ASSERT_TRUE(run_until(ioc, [&] { return transports->subscriber()->candidates().size() == 1; }));
    EXPECT_TRUE(transports->publisher()->candidates().empty());
}

TEST_F(SessionEngineTest, TokenRefreshIsStored) {
    connect_session();

    std::string refreshed;
    auto sub = engine->events().subscribe<engine_events::TokenRefreshed>(
        [&](const engine_events::TokenRefreshed& ev) { refreshed = ev.token; });

    proto::SignalResponse resp;
    resp.set_refresh_token("token-2");
    sockets->last()->deliver(resp);
    ASSERT_TRUE(run_until(ioc, [&] { return !refreshed.empty(); }));
    EXPECT_EQ(engine->token(), "token-2");
}

// ============================================================================
// Publishing
// ============================================================================

TEST_F(SessionEngineTest, AddTrackResolvesOnTrackPublished) {
    connect_session();

    proto::AddTrackRequest req;
    req.set_cid("cid-1");
    req.set_name("camera");
    auto pending = start(ioc, engine->add_track(req));

    auto socket = sockets->last();
    ASSERT_TRUE(run_until(ioc, [&] { return count_sent(socket, proto::SignalRequest::kAddTrack) == 1; }));
    EXPECT_EQ(engine->pending_publish_count(), 1u);

    proto::SignalResponse published;
    published.mutable_track_published()->set_cid("cid-1");
    published.mutable_track_published()->mutable_track()->set_sid("TR_1");
    socket->deliver(published);

    ASSERT_TRUE(run_until(ioc, [&] { return pending->done; }));
    ASSERT_TRUE(pending->value->has_value());
    EXPECT_EQ(pending->value->value().sid(), "TR_1");
    EXPECT_EQ(engine->pending_publish_count(), 0u);
}

TEST_F(SessionEngineTest, AddTrackRejectsDuplicateCid) {
    connect_session();

    proto::AddTrackRequest req;
    req.set_cid("cid-1");
    auto first = start(ioc, engine->add_track(req));
    run_for(ioc, 20ms);

    auto second = run_coro(ioc, engine->add_track(req));
    ASSERT_FALSE(second.has_value());
    EXPECT_TRUE(second.error().is(ErrorCode::TRACK_PUBLISH));
    EXPECT_EQ(second.error().message, "a track with the same ID has already been published");

    EXPECT_TRUE(engine->remove_track("cid-1"));
    ASSERT_TRUE(run_until(ioc, [&] { return first->done; }));
}

TEST_F(SessionEngineTest, RemoveTrackCancelsPendingPublish) {
    connect_session();

    proto::AddTrackRequest req;
    req.set_cid("cid-2");
    auto pending = start(ioc, engine->add_track(req));
    run_for(ioc, 20ms);

    EXPECT_TRUE(engine->remove_track("cid-2"));
    EXPECT_FALSE(engine->remove_track("cid-2"));
    ASSERT_TRUE(run_until(ioc, [&] { return pending->done; }));
    ASSERT_FALSE(pending->value->has_value());
    EXPECT_EQ(pending->value->error().message, "Cancelled publication by calling unpublish");
}

TEST_F(SessionEngineTest, CloseRejectsPendingPublishes) {
    connect_session();

    proto::AddTrackRequest req;
    req.set_cid("cid-3");
    auto pending = start(ioc, engine->add_track(req));
    run_for(ioc, 20ms);

    run_coro(ioc, engine->close());
    ASSERT_TRUE(run_until(ioc, [&] { return pending->done; }));
    ASSERT_FALSE(pending->value->has_value());
    EXPECT_TRUE(pending->value->error().is(ErrorCode::UNEXPECTED_CONNECTION_STATE));
}

TEST_F(SessionEngineTest, AddTrackTimesOutWithoutServerAck) {
    options.publish_timeout = 100ms;
    connect_session();

    proto::AddTrackRequest req;
    req.set_cid("cid-slow");
    auto res = run_coro(ioc, engine->add_track(req));
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(res.error().is(ErrorCode::TRACK_PUBLISH));
    EXPECT_EQ(res.error().message, "publication of local track timed out, no response from server");
    EXPECT_EQ(engine->pending_publish_count(), 0u);

    // A late acknowledgement finds nothing to resolve
    proto::SignalResponse published;
    published.mutable_track_published()->set_cid("cid-slow");
    published.mutable_track_published()->mutable_track()->set_sid("TR_late");
    sockets->last()->deliver(published);
    run_for(ioc, 20ms);
    EXPECT_EQ(engine->pending_publish_count(), 0u);
}

TEST_F(SessionEngineTest, AddTrackOnClosedEngineFails) {
    make_engine();
    proto::AddTrackRequest req;
    req.set_cid("cid-4");
    auto res = run_coro(ioc, engine->add_track(req));
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(res.error().is(ErrorCode::UNEXPECTED_CONNECTION_STATE));
}

// ============================================================================
// Data
// ============================================================================

TEST_F(SessionEngineTest, ReceivesUserAndSpeakerPackets) {
    connect_session();

    std::vector<proto::UserPacket> packets;
    std::vector<DataPacketKind> kinds;
    std::vector<std::string> speakers;
    auto s1 = engine->events().subscribe<engine_events::DataPacketReceived>(
        [&](const engine_events::DataPacketReceived& ev) {
            packets.push_back(ev.packet);
            kinds.push_back(ev.kind);
        });
    auto s2 = engine->events().subscribe<engine_events::ActiveSpeakersUpdate>(
        [&](const engine_events::ActiveSpeakersUpdate& ev) {
            for (const auto& s : ev.speakers) speakers.push_back(s.sid());
        });

    auto channel = std::make_shared<FakeDataChannel>(SessionEngine::kReliableChannel, DataChannelInit{}, 2);
    transports->subscriber()->emit_data_channel(channel);
    ASSERT_TRUE(channel->has_callbacks());

    proto::DataPacket user;
    user.set_kind(proto::DataPacket::LOSSY);
    user.mutable_user()->set_participant_sid("PA_remote");
    user.mutable_user()->set_payload("hello");
    proto::DataPacket speaker;
    speaker.mutable_speaker()->add_speakers()->set_sid("PA_speaker");

    channel->receive(user.SerializeAsString());
    channel->receive(speaker.SerializeAsString());
    channel->receive("ignored text", false);
    channel->receive("\xff\xff garbage");

    ASSERT_TRUE(run_until(ioc, [&] { return packets.size() == 1 && speakers.size() == 1; }));
    run_for(ioc, 20ms);
    EXPECT_EQ(packets.size(), 1u);
    EXPECT_EQ(packets[0].payload(), "hello");
    EXPECT_EQ(kinds[0], DataPacketKind::LOSSY);
    EXPECT_EQ(speakers[0], "PA_speaker");
}

TEST_F(SessionEngineTest, UnknownSubscriberChannelIsIgnored) {
    connect_session();
    auto channel = std::make_shared<FakeDataChannel>("custom", DataChannelInit{}, 3);
    transports->subscriber()->emit_data_channel(channel);
    EXPECT_FALSE(channel->has_callbacks());
}

TEST_F(SessionEngineTest, SendDataRequiresPublisherAndWaitsForChannel) {
    connect_session();

    proto::DataPacket packet;
    packet.mutable_user()->set_payload("ping");
    auto pending = start(ioc, engine->send_data_packet(packet, DataPacketKind::RELIABLE));

    auto socket = sockets->last();
    ASSERT_TRUE(run_until(ioc, [&] { return count_sent(socket, proto::SignalRequest::kOffer) == 1; }));
    EXPECT_TRUE(engine->transports()->needs_publisher());
    EXPECT_FALSE(pending->done);

    socket->deliver(answer_response());
    auto* pub = transports->publisher();
    ASSERT_TRUE(run_until(ioc, [&] { return pub->signaling_state() == SignalingState::STABLE; }));
    pub->connect();
    run_for(ioc, 20ms);
    EXPECT_FALSE(pending->done);

    auto reliable = pub->channel(SessionEngine::kReliableChannel);
    reliable->open();
    ASSERT_TRUE(run_until(ioc, [&] { return pending->done; }));
    ASSERT_TRUE(pending->value->has_value()) << pending->value->error().describe();
    ASSERT_EQ(reliable->sent().size(), 1u);

    proto::DataPacket decoded;
    ASSERT_TRUE(decoded.ParseFromString(reliable->sent()[0]));
    EXPECT_EQ(decoded.user().payload(), "ping");
}

TEST_F(SessionEngineTest, SendDataTimesOutWhenPublisherNeverConnects) {
    options.peer_connection_timeout = 400ms;
    connect_session();

    proto::DataPacket packet;
    packet.mutable_user()->set_payload("x");
    auto pending = start(ioc, engine->send_data_packet(packet, DataPacketKind::LOSSY));

    // Answer the offer so the negotiation itself succeeds
    auto socket = sockets->last();
    ASSERT_TRUE(run_until(ioc, [&] { return count_sent(socket, proto::SignalRequest::kOffer) == 1; }));
    socket->deliver(answer_response());

    ASSERT_TRUE(run_until(ioc, [&] { return pending->done; }));
    ASSERT_FALSE(pending->value->has_value());
    EXPECT_EQ(pending->value->error().message, "could not establish Publisher connection, state: new");
}

TEST_F(SessionEngineTest, BufferStatusEvents) {
    connect_session();

    auto* pub = transports->publisher();
    pub->connect();
    auto reliable = pub->channel(SessionEngine::kReliableChannel);
    reliable->open();

    std::vector<bool> statuses;
    auto sub = engine->events().subscribe<engine_events::DataChannelBufferStatusChanged>(
        [&](const engine_events::DataChannelBufferStatusChanged& ev) {
            if (ev.kind == DataPacketKind::RELIABLE) statuses.push_back(ev.is_low);
        });

    EXPECT_EQ(engine->is_buffer_status_low(DataPacketKind::RELIABLE), std::optional<bool>(true));

    reliable->set_buffered_amount(SessionEngine::kBufferedAmountLowThreshold + 1);
    proto::DataPacket packet;
    packet.mutable_user()->set_payload("y");
    auto res = run_coro(ioc, engine->send_data_packet(packet, DataPacketKind::RELIABLE));
    ASSERT_TRUE(res.has_value()) << res.error().describe();
    EXPECT_EQ(engine->is_buffer_status_low(DataPacketKind::RELIABLE), std::optional<bool>(false));

    reliable->drain();
    std::vector<bool> expected{false, true};
    EXPECT_EQ(statuses, expected);
}

// ============================================================================
// Recovery
// ============================================================================

TEST_F(SessionEngineTest, TransportFailureResumes) {
    connect_session();
    sockets->on_open = [](FakeSignalSocket& s) {
        proto::SignalResponse reconnect;
        reconnect.mutable_reconnect()->add_ice_servers()->add_urls("stun:new.example.com");
        s.accept_with(reconnect);
    };

    transports->subscriber()->fail();
    ASSERT_TRUE(run_until(ioc, [&] { return signal_resumed == 1; }));
    EXPECT_EQ(resuming, 1);
    EXPECT_EQ(sockets->created(), 2u);

    const auto& url = sockets->last()->url();
    EXPECT_NE(url.find("reconnect=1"), std::string::npos);
    EXPECT_NE(url.find("sid=PA_local"), std::string::npos);
    EXPECT_NE(url.find("reconnect_reason=3"), std::string::npos);

    EXPECT_EQ(transports->subscriber()->config().ice_servers.size(), 1u);
    EXPECT_TRUE(engine->transports()->subscriber().restarting_ice());

    transports->subscriber()->connect();
    ASSERT_TRUE(run_until(ioc, [&] { return resumed == 1; }, 5000ms));
    EXPECT_EQ(restarting, 0);
    EXPECT_EQ(engine->reconnect_attempts(), 0u);
    EXPECT_EQ(engine->phase(), SessionPhase::CONNECTED);
    EXPECT_EQ(transports->created(), 2u);
}

TEST_F(SessionEngineTest, SignalLossResumes) {
    connect_session();
    sockets->on_open = [](FakeSignalSocket& s) { s.accept_with(proto::SignalResponse{}); };

    sockets->last()->drop();
    ASSERT_TRUE(run_until(ioc, [&] { return resuming == 1 && sockets->created() == 2; }));
    EXPECT_NE(sockets->last()->url().find("reconnect_reason=1"), std::string::npos);
}

TEST_F(SessionEngineTest, FailedResumeEscalatesToRestart) {
    connect_session();

    int attempt = 0;
    sockets->on_open = [&attempt](FakeSignalSocket& s) {
        if (attempt++ == 0) {
            s.fail("connection refused");
        } else {
            s.accept_with(make_join_response(true));
        }
    };

    transports->subscriber()->fail();
    ASSERT_TRUE(run_until(ioc, [&] { return signal_restarted == 1; }));
    EXPECT_EQ(resuming, 1);
    EXPECT_EQ(signal_resumed, 0);
    EXPECT_EQ(restarting, 1);
    EXPECT_EQ(sockets->created(), 3u);
    EXPECT_EQ(sockets->last()->url().find("reconnect=1"), std::string::npos);

    // The restart builds a fresh pair of transports
    ASSERT_EQ(transports->created(), 4u);
    transports->subscriber()->connect();
    ASSERT_TRUE(run_until(ioc, [&] { return restarted == 1; }, 5000ms));
    EXPECT_FALSE(engine->full_reconnect_on_next());
    EXPECT_EQ(engine->reconnect_attempts(), 0u);
}

TEST_F(SessionEngineTest, LeaveWithReconnectRestarts) {
    connect_session();
    sockets->on_open = [](FakeSignalSocket& s) { s.accept_with(make_join_response(true)); };

    proto::SignalResponse leave;
    leave.mutable_leave()->set_can_reconnect(true);
    sockets->last()->deliver(leave);

    ASSERT_TRUE(run_until(ioc, [&] { return signal_restarted == 1; }));
    EXPECT_EQ(resuming, 0);
    EXPECT_EQ(restarting, 1);
    EXPECT_EQ(disconnected, 0);
}

TEST_F(SessionEngineTest, LeaveWithoutReconnectDisconnects) {
    connect_session();

    proto::SignalResponse leave;
    leave.mutable_leave()->set_can_reconnect(false);
    leave.mutable_leave()->set_reason(proto::ROOM_DELETED);
    sockets->last()->deliver(leave);

    ASSERT_TRUE(run_until(ioc, [&] { return engine->is_closed(); }));
    EXPECT_EQ(disconnected, 1);
    ASSERT_TRUE(disconnect_reason.has_value());
    EXPECT_EQ(*disconnect_reason, proto::ROOM_DELETED);
    EXPECT_EQ(closing, 1);
    EXPECT_EQ(engine->phase(), SessionPhase::CLOSED);
}

TEST_F(SessionEngineTest, GivesUpWhenPolicyStops) {
    make_engine(fixed({}));
    connect_session();

    sockets->last()->drop();
    ASSERT_TRUE(run_until(ioc, [&] { return engine->is_closed(); }));
    EXPECT_EQ(disconnected, 1);
    EXPECT_FALSE(disconnect_reason.has_value());
    EXPECT_EQ(resuming, 0);
}

TEST_F(SessionEngineTest, ThrowingPolicyGivesUp) {
    struct ThrowingPolicy : ReconnectPolicy {
        std::optional<std::chrono::milliseconds> next_retry_delay(const ReconnectContext&) override {
            throw std::runtime_error("policy failure");
        }
    };
    make_engine(std::make_shared<ThrowingPolicy>());
    connect_session();

    engine->handle_disconnect("test", proto::RR_UNKNOWN);
    ASSERT_TRUE(run_until(ioc, [&] { return engine->is_closed(); }));
    EXPECT_EQ(disconnected, 1);
}

TEST_F(SessionEngineTest, NetworkOnlineSkipsBackoff) {
    make_engine(fixed({60000ms}));
    connect_session();
    sockets->on_open = [](FakeSignalSocket& s) { s.accept_with(proto::SignalResponse{}); };

    engine->handle_disconnect("test", proto::RR_SIGNAL_DISCONNECTED);
    EXPECT_TRUE(engine->reconnect_scheduled());
    run_for(ioc, 50ms);
    EXPECT_EQ(resuming, 0);

    engine->handle_network_online();
    EXPECT_FALSE(engine->reconnect_scheduled());
    ASSERT_TRUE(run_until(ioc, [&] { return resuming == 1; }));
}

TEST_F(SessionEngineTest, BackoffFollowsPolicyThenGivesUp) {
    auto policy = std::make_shared<RecordingPolicy>(std::vector<std::chrono::milliseconds>{10ms, 20ms});
    make_engine(policy);
    connect_session();
    sockets->on_open = [](FakeSignalSocket& s) { s.fail("connection refused"); };

    sockets->last()->drop();
    ASSERT_TRUE(run_until(ioc, [&] { return engine->is_closed(); }));
    run_for(ioc, 100ms);

    // Resume after 10ms, restart after 20ms, then the policy stops
    ASSERT_EQ(policy->contexts.size(), 3u);
    for (uint32_t i = 0; i < policy->contexts.size(); ++i) {
        EXPECT_EQ(policy->contexts[i].retry_count, i);
        EXPECT_EQ(policy->contexts[i].server_url, "wss://example.com");
    }
    EXPECT_GE(policy->contexts[1].elapsed, 10ms);
    EXPECT_GE(policy->contexts[2].elapsed, policy->contexts[1].elapsed + 20ms);

    EXPECT_EQ(resuming, 1);
    EXPECT_EQ(restarting, 1);
    EXPECT_EQ(disconnected, 1);
    // Initial join, one resume, one restart and no third attempt
    EXPECT_EQ(sockets->created(), 3u);
}

TEST_F(SessionEngineTest, PolicySeesWhyTheLastAttemptFailed) {
    auto policy = std::make_shared<RecordingPolicy>(std::vector<std::chrono::milliseconds>{0ms, 0ms});
    make_engine(policy);
    connect_session();
    sockets->on_open = [](FakeSignalSocket& s) { s.fail("connection refused"); };

    sockets->last()->drop();
    ASSERT_TRUE(run_until(ioc, [&] { return engine->is_closed(); }));

    ASSERT_EQ(policy->contexts.size(), 3u);
    EXPECT_EQ(policy->contexts[0].retry_reason, std::optional<std::string>("connection lost"));
    for (size_t i = 1; i < policy->contexts.size(); ++i) {
        ASSERT_TRUE(policy->contexts[i].retry_reason.has_value());
        EXPECT_NE(policy->contexts[i].retry_reason->find("SIGNAL_RECONNECT"), std::string::npos)
            << *policy->contexts[i].retry_reason;
    }
}

TEST_F(SessionEngineTest, ExplicitDisconnectHasNoRetryReason) {
    auto policy = std::make_shared<RecordingPolicy>(std::vector<std::chrono::milliseconds>{60000ms});
    make_engine(policy);
    connect_session();

    engine->handle_disconnect("test", proto::RR_UNKNOWN);
    ASSERT_EQ(policy->contexts.size(), 1u);
    EXPECT_FALSE(policy->contexts[0].retry_reason.has_value());
}

TEST_F(SessionEngineTest, RestartFailsOverToNextRegion) {
    http->respond("https://test.livekit.cloud/settings/regions", 200,
                  R"({"regions": [
                      {"region": "us", "url": "wss://us.livekit.cloud", "distance": "10"},
                      {"region": "eu", "url": "wss://eu.livekit.cloud", "distance": "90"}
                  ]})");
    make_engine();
    auto regions = std::make_shared<RegionUrlProvider>("wss://test.livekit.cloud", "token-1", http);
    engine->set_region_url_provider(regions);

    sockets->on_open = [](FakeSignalSocket& s) { s.accept_with(make_join_response(true)); };
    auto joined = run_coro(ioc, engine->join("wss://test.livekit.cloud", "token-1"));
    ASSERT_TRUE(joined.has_value()) << joined.error().describe();
    transports->subscriber()->connect();
    ASSERT_TRUE(run_until(ioc, [&] { return connected == 1; }));

    int attempt = 0;
    sockets->on_open = [&attempt](FakeSignalSocket& s) {
        if (attempt++ == 0) {
            s.fail("connection refused");
        } else {
            s.accept_with(make_join_response(true));
        }
    };

    proto::SignalResponse leave;
    leave.mutable_leave()->set_can_reconnect(true);
    sockets->last()->deliver(leave);

    ASSERT_TRUE(run_until(ioc, [&] { return signal_restarted == 1; }));
    EXPECT_EQ(restarting, 2);
    ASSERT_EQ(sockets->created(), 3u);
    EXPECT_EQ(sockets->at(1)->url().rfind("wss://test.livekit.cloud/rtc?", 0), 0u);
    EXPECT_EQ(sockets->last()->url().rfind("wss://us.livekit.cloud/rtc?", 0), 0u);

    transports->subscriber()->connect();
    ASSERT_TRUE(run_until(ioc, [&] { return restarted == 1; }, 5000ms));
    EXPECT_EQ(disconnected, 0);

    // A successful restart hands the nearest region out again
    auto next = run_coro(ioc, regions->next_best_region_url());
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, std::optional<std::string>("wss://us.livekit.cloud"));
}

TEST_F(SessionEngineTest, RestartGetsFullJoinRetryBudget) {
    options.max_retries = 2;
    connect_session();

    int attempt = 0;
    sockets->on_open = [&attempt](FakeSignalSocket& s) {
        if (attempt++ == 0) {
            s.fail("connection refused");
        } else {
            s.accept_with(make_join_response(true));
        }
    };

    proto::SignalResponse leave;
    leave.mutable_leave()->set_can_reconnect(true);
    sockets->last()->deliver(leave);

    // The retry inside the rejoin absorbs the failure, no second restart
    ASSERT_TRUE(run_until(ioc, [&] { return signal_restarted == 1; }));
    EXPECT_EQ(restarting, 1);
    EXPECT_EQ(sockets->created(), 3u);
}

// ============================================================================
// Close
// ============================================================================

TEST_F(SessionEngineTest, CloseBeforeJoinIsNoop) {
    make_engine();
    run_coro(ioc, engine->close());
    EXPECT_EQ(closing, 0);
    EXPECT_TRUE(engine->is_closed());
}

TEST_F(SessionEngineTest, CloseIsIdempotent) {
    connect_session();
    auto socket = sockets->last();

    auto a = start(ioc, engine->close());
    auto b = start(ioc, engine->close());
    ASSERT_TRUE(run_until(ioc, [&] { return a->done && b->done; }));

    EXPECT_EQ(closing, 1);
    EXPECT_TRUE(engine->is_closed());
    EXPECT_EQ(engine->transports(), nullptr);
    EXPECT_TRUE(engine->client().is_disconnected());
    EXPECT_EQ(socket->close_calls(), 1);
}

TEST_F(SessionEngineTest, RejoinAfterClose) {
    connect_session();
    run_coro(ioc, engine->close());

    sockets->on_open = [](FakeSignalSocket& s) { s.accept_with(make_join_response(true)); };
    auto res = run_coro(ioc, engine->join("wss://example.com", "token-1"));
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(engine->is_closed());
    EXPECT_EQ(transports->created(), 4u);

    transports->subscriber()->connect();
    ASSERT_TRUE(run_until(ioc, [&] { return connected == 2; }));
}
