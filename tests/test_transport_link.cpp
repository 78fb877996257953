#include <gtest/gtest.h>
#include "client/transport_link.hpp"
#include "fakes/fake_peer_transport.hpp"
#include "fakes/test_utils.hpp"

using namespace livelink;
using namespace livelink::client;
using namespace livelink::fakes;
using namespace std::chrono_literals;

class TransportLinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto transport = std::make_unique<FakePeerTransport>(PeerTransportConfig{});
        pc = transport.get();
        link = std::make_unique<TransportLink>(ioc.get_executor(), std::move(transport), SignalTarget::PUBLISHER);

        TransportLinkCallbacks cb;
        cb.on_offer = [this](const SessionDescription& offer) { offers.push_back(offer); };
        cb.on_state_change = [this](TransportState state) { states.push_back(state); };
        cb.on_negotiation_started = [this] { ++started; };
        cb.on_negotiation_complete = [this] { ++completed; };
        link->set_callbacks(std::move(cb));
    }

    static IceCandidate candidate(const std::string& n) {
        return IceCandidate{"candidate:" + n + " 1 udp 1 10.0.0.1 5000 typ host", "0", 0, ""};
    }

    asio::io_context ioc;
    FakePeerTransport* pc = nullptr;
    std::unique_ptr<TransportLink> link;
    std::vector<SessionDescription> offers;
    std::vector<TransportState> states;
    int started = 0;
    int completed = 0;
};

TEST_F(TransportLinkTest, NegotiateIsDebounced) {
    link->negotiate();
    link->negotiate();
    link->negotiate();
    run_for(ioc, 50ms);
    EXPECT_EQ(pc->offers_created(), 0);

    run_for(ioc, 150ms);
    EXPECT_EQ(started, 1);
    EXPECT_EQ(pc->offers_created(), 1);
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_TRUE(offers[0].is_offer());
}

TEST_F(TransportLinkTest, NegotiateReportsOfferFailure) {
    pc->fail_offers = true;
    std::optional<Error> failure;
    link->negotiate([&](const Error& e) { failure = e; });
    ASSERT_TRUE(run_until(ioc, [&] { return failure.has_value(); }, 1000ms));
    EXPECT_TRUE(failure->is(ErrorCode::NEGOTIATION));
}

TEST_F(TransportLinkTest, OfferWhileAwaitingAnswerIsDeferred) {
    ASSERT_TRUE(link->create_and_send_offer().has_value());
    ASSERT_TRUE(link->create_and_send_offer().has_value());
    EXPECT_EQ(pc->offers_created(), 1);
    EXPECT_TRUE(link->renegotiate_pending());

    // The answer to the first offer triggers the deferred one
    ASSERT_TRUE(link->set_remote_description({"answer", "v=0 a1"}).has_value());
    EXPECT_EQ(pc->offers_created(), 2);
    EXPECT_FALSE(link->renegotiate_pending());
    EXPECT_EQ(completed, 0);

    ASSERT_TRUE(link->set_remote_description({"answer", "v=0 a2"}).has_value());
    EXPECT_EQ(completed, 1);
    EXPECT_EQ(offers.size(), 2u);
}

TEST_F(TransportLinkTest, IceRestartRollsBackPendingOffer) {
    ASSERT_TRUE(link->create_and_send_offer().has_value());
    ASSERT_TRUE(link->set_remote_description({"answer", "v=0 a1"}).has_value());
    ASSERT_TRUE(link->create_and_send_offer().has_value());
    EXPECT_EQ(pc->signaling_state(), SignalingState::HAVE_LOCAL_OFFER);

    OfferOptions restart;
    restart.ice_restart = true;
    ASSERT_TRUE(link->create_and_send_offer(restart).has_value());
    EXPECT_EQ(pc->offers_created(), 3);
    EXPECT_TRUE(pc->last_offer_ice_restart());
    EXPECT_TRUE(link->restarting_ice());
}

TEST_F(TransportLinkTest, CandidatesBufferedUntilRemoteDescription) {
    ASSERT_TRUE(link->add_ice_candidate(candidate("1")).has_value());
    ASSERT_TRUE(link->add_ice_candidate(candidate("2")).has_value());
    EXPECT_EQ(link->pending_candidate_count(), 2u);
    EXPECT_TRUE(pc->candidates().empty());

    ASSERT_TRUE(link->create_and_send_offer().has_value());
    ASSERT_TRUE(link->set_remote_description({"answer", "v=0 a"}).has_value());
    EXPECT_EQ(link->pending_candidate_count(), 0u);
    ASSERT_EQ(pc->candidates().size(), 2u);
    EXPECT_EQ(pc->candidates()[0].candidate, candidate("1").candidate);

    ASSERT_TRUE(link->add_ice_candidate(candidate("3")).has_value());
    EXPECT_EQ(pc->candidates().size(), 3u);
}

TEST_F(TransportLinkTest, CandidatesBufferedDuringIceRestart) {
    ASSERT_TRUE(link->create_and_send_offer().has_value());
    ASSERT_TRUE(link->set_remote_description({"answer", "v=0 a"}).has_value());

    link->set_restarting_ice(true);
    ASSERT_TRUE(link->add_ice_candidate(candidate("1")).has_value());
    EXPECT_TRUE(pc->candidates().empty());
    EXPECT_EQ(link->pending_candidate_count(), 1u);
}

TEST_F(TransportLinkTest, AnswerWithoutOfferFails) {
    auto result = link->set_remote_description({"answer", "v=0 a"});
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::NEGOTIATION));
}

TEST_F(TransportLinkTest, StateReduction) {
    pc->set_ice_state(IceConnectionState::CHECKING);
    EXPECT_EQ(link->state(), TransportState::CONNECTING);

    pc->set_connection_state(PeerConnectionState::CONNECTED);
    EXPECT_EQ(link->state(), TransportState::CONNECTED);

    pc->set_connection_state(PeerConnectionState::DISCONNECTED);
    EXPECT_EQ(link->state(), TransportState::CONNECTING);

    pc->set_connection_state(PeerConnectionState::FAILED);
    EXPECT_EQ(link->state(), TransportState::FAILED);

    std::vector<TransportState> expected{TransportState::CONNECTING, TransportState::CONNECTED,
                                         TransportState::CONNECTING, TransportState::FAILED};
    EXPECT_EQ(states, expected);
}

TEST_F(TransportLinkTest, CloseIsIdempotent) {
    link->close();
    link->close();
    EXPECT_TRUE(link->is_closed());
    EXPECT_TRUE(pc->closed());
    EXPECT_EQ(link->state(), TransportState::CLOSED);
    EXPECT_EQ(link->ice_state(), IceConnectionState::CLOSED);

    std::vector<TransportState> expected{TransportState::CLOSING, TransportState::CLOSED};
    EXPECT_EQ(states, expected);

    EXPECT_FALSE(link->add_ice_candidate(candidate("1")).has_value());
    EXPECT_FALSE(link->set_remote_description({"offer", "v=0"}).has_value());
    EXPECT_EQ(link->create_data_channel("_reliable", {}), nullptr);
}

TEST_F(TransportLinkTest, SubscriberAnswersRemoteOffer) {
    ASSERT_TRUE(link->set_remote_description({"offer", "v=0 remote"}).has_value());
    auto answer = link->create_and_set_answer();
    ASSERT_TRUE(answer.has_value());
    EXPECT_TRUE(answer->is_answer());
    EXPECT_EQ(pc->signaling_state(), SignalingState::STABLE);
}
