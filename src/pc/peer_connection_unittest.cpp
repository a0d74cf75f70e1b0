#include "pc/peer_connection.hpp"
#include "common/task_queue.hpp"
#include "testing/fake_media_engine.hpp"
#include "testing/queue_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <thread>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace test {
namespace {

class RecordingObserver : public PeerConnection::Observer {
public:
    void OnLocalDescription(const std::string& remote_user_id, SdpType type, const std::string& sdp) override {
        descriptions.emplace_back(type, sdp);
    }
    void OnLocalCandidate(const std::string& remote_user_id, const Candidate& candidate) override {
        candidates.push_back(candidate);
    }
    void OnStateChanged(const std::string& remote_user_id, PeerConnection::State state) override {
        states.push_back(state);
    }

    size_t CountDescriptions(SdpType type) const {
        size_t count = 0;
        for (const auto& [t, sdp] : descriptions) {
            if (t == type) {
                ++count;
            }
        }
        return count;
    }

    std::string LastDescription(SdpType type) const {
        for (auto it = descriptions.rbegin(); it != descriptions.rend(); ++it) {
            if (it->first == type) {
                return it->second;
            }
        }
        return "";
    }

    std::vector<std::pair<SdpType, std::string>> descriptions;
    std::vector<Candidate> candidates;
    std::vector<PeerConnection::State> states;
};

} // namespace

class T(PeerConnectionTest) : public ::testing::Test {
protected:
    T(PeerConnectionTest)()
        : queue_("PeerConnectionTest.queue"),
          engine_u1_("u1", &queue_),
          engine_u2_("u2", &queue_),
          observer_u1_(std::make_shared<RecordingObserver>()),
          observer_u2_(std::make_shared<RecordingObserver>()) {
        engine_u1_.behavior().auto_connect = false;
        engine_u2_.behavior().auto_connect = false;
    }

    ~T(PeerConnectionTest)() override {
        queue_.Sync([this](){
            if (u1_) u1_->Close();
            if (u2_) u2_->Close();
            u1_.reset();
            u2_.reset();
        });
    }

    void CreatePeers(TimeInterval retransmit_interval_ms = 0, int max_retransmits = 15) {
        queue_.Sync([&](){
            u1_ = CreatePeer("u1", "u2", engine_u1_, observer_u1_, retransmit_interval_ms, max_retransmits);
            u2_ = CreatePeer("u2", "u1", engine_u2_, observer_u2_, retransmit_interval_ms, max_retransmits);
        });
    }

    std::shared_ptr<PeerConnection> CreatePeer(const std::string& local,
                                               const std::string& remote,
                                               FakeMediaEngine& engine,
                                               std::shared_ptr<RecordingObserver> observer,
                                               TimeInterval retransmit_interval_ms,
                                               int max_retransmits) {
        PeerConnection::Configuration config;
        config.local_user_id = local;
        config.remote_user_id = remote;
        config.polite = PeerConnection::IsPolite(local, remote);
        config.offer_retransmit_interval_ms = retransmit_interval_ms;
        config.max_offer_retransmits = max_retransmits;
        return PeerConnection::Create(config,
                                      engine.CreateTransport(RtcConfiguration::Default(), remote, &queue_),
                                      &queue_,
                                      observer);
    }

    void Drain() {
        DrainQueues({&queue_});
    }

    // Runs the whole handshake initiated by u1.
    void Negotiate() {
        queue_.Sync([this](){ u1_->StartNegotiation(); });
        Drain();
        auto offer = observer_u1_->LastDescription(SdpType::OFFER);
        queue_.Sync([this, offer](){ u2_->HandleRemoteOffer(offer); });
        Drain();
        auto answer = observer_u2_->LastDescription(SdpType::ANSWER);
        queue_.Sync([this, answer](){ u1_->HandleRemoteAnswer(answer); });
        Drain();
    }

    PeerConnection::State StateOf(const std::shared_ptr<PeerConnection>& peer) {
        return queue_.Sync<PeerConnection::State>([peer](){ return peer->state(); });
    }

    TaskQueue queue_;
    FakeMediaEngine engine_u1_;
    FakeMediaEngine engine_u2_;
    std::shared_ptr<RecordingObserver> observer_u1_;
    std::shared_ptr<RecordingObserver> observer_u2_;
    std::shared_ptr<PeerConnection> u1_;
    std::shared_ptr<PeerConnection> u2_;
};

MY_TEST(PeerConnectionPolitenessTest, SmallerUserIdIsPolite) {
    EXPECT_TRUE(PeerConnection::IsPolite("alice", "bob"));
    EXPECT_FALSE(PeerConnection::IsPolite("bob", "alice"));
}

MY_TEST_F(PeerConnectionTest, CreateRejectsSelfAsRemote) {
    PeerConnection::Configuration config;
    config.local_user_id = "u1";
    config.remote_user_id = "u1";
    EXPECT_THROW(PeerConnection::Create(config, engine_u1_.CreateTransport(RtcConfiguration::Default(), "u1", &queue_), &queue_, observer_u1_),
                 std::invalid_argument);
}

MY_TEST_F(PeerConnectionTest, OfferAnswerExchangeReachesNegotiating) {
    CreatePeers();
    queue_.Sync([this](){ u1_->StartNegotiation(); });
    Drain();
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::LOCAL_OFFER_SENT);
    ASSERT_EQ(observer_u1_->CountDescriptions(SdpType::OFFER), 1u);

    auto offer = observer_u1_->LastDescription(SdpType::OFFER);
    queue_.Sync([this, offer](){ u2_->HandleRemoteOffer(offer); });
    Drain();
    EXPECT_EQ(StateOf(u2_), PeerConnection::State::NEGOTIATING);
    ASSERT_EQ(observer_u2_->CountDescriptions(SdpType::ANSWER), 1u);
    EXPECT_EQ(engine_u2_.transport_for("u1")->remote_description, offer);

    auto answer = observer_u2_->LastDescription(SdpType::ANSWER);
    queue_.Sync([this, answer](){ u1_->HandleRemoteAnswer(answer); });
    Drain();
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::NEGOTIATING);
    EXPECT_EQ(engine_u1_.transport_for("u2")->remote_description, answer);

    EXPECT_EQ(observer_u1_->states,
              std::vector<PeerConnection::State>({PeerConnection::State::LOCAL_OFFER_SENT,
                                                  PeerConnection::State::NEGOTIATING}));
    EXPECT_EQ(observer_u2_->states,
              std::vector<PeerConnection::State>({PeerConnection::State::REMOTE_OFFER_RECEIVED,
                                                  PeerConnection::State::NEGOTIATING}));
}

MY_TEST_F(PeerConnectionTest, TransportConnectedMovesToConnected) {
    CreatePeers();
    Negotiate();
    engine_u1_.SimulateTransportState("u2", MediaTransport::State::CONNECTED);
    Drain();
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::CONNECTED);

    // Losing the path temporarily does not move the connection backwards.
    engine_u1_.SimulateTransportState("u2", MediaTransport::State::DISCONNECTED);
    Drain();
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::CONNECTED);
}

MY_TEST_F(PeerConnectionTest, AutoConnectingTransportsReachConnected) {
    engine_u1_.behavior().auto_connect = true;
    engine_u2_.behavior().auto_connect = true;
    CreatePeers();
    Negotiate();
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::CONNECTED);
    EXPECT_EQ(StateOf(u2_), PeerConnection::State::CONNECTED);
}

MY_TEST_F(PeerConnectionTest, EarlyCandidatesAreFlushedOnceInReceiptOrder) {
    CreatePeers();
    Candidate first("candidate:1 1 udp 2122260223 10.0.0.1 5000 typ host", "0", 0);
    Candidate second("candidate:2 1 udp 2122260223 10.0.0.1 5002 typ host", "0", 0);
    queue_.Sync([&](){
        u2_->HandleRemoteCandidate(first);
        u2_->HandleRemoteCandidate(second);
    });
    Drain();
    EXPECT_EQ(queue_.Sync<size_t>([this](){ return u2_->pending_remote_candidate_count(); }), 2u);
    EXPECT_TRUE(engine_u2_.transport_for("u1")->applied_candidates.empty());

    queue_.Sync([this](){ u1_->StartNegotiation(); });
    Drain();
    auto offer = observer_u1_->LastDescription(SdpType::OFFER);
    queue_.Sync([this, offer](){ u2_->HandleRemoteOffer(offer); });
    Drain();

    EXPECT_EQ(engine_u2_.transport_for("u1")->applied_candidates, std::vector<Candidate>({first, second}));
    EXPECT_EQ(queue_.Sync<size_t>([this](){ return u2_->pending_remote_candidate_count(); }), 0u);

    // A repeated candidate is not applied twice.
    queue_.Sync([&](){ u2_->HandleRemoteCandidate(first); });
    Drain();
    EXPECT_EQ(engine_u2_.transport_for("u1")->applied_candidates.size(), 2u);
}

MY_TEST_F(PeerConnectionTest, CandidatesAfterDescriptionAreAppliedImmediately) {
    CreatePeers();
    Negotiate();
    Candidate candidate("candidate:3 1 udp 2122260223 10.0.0.3 5000 typ host", "0", 0);
    queue_.Sync([&](){ u1_->HandleRemoteCandidate(candidate); });
    EXPECT_EQ(engine_u1_.transport_for("u2")->applied_candidates, std::vector<Candidate>({candidate}));
}

MY_TEST_F(PeerConnectionTest, DuplicateAnswerIsIgnored) {
    CreatePeers();
    Negotiate();
    ASSERT_EQ(StateOf(u1_), PeerConnection::State::NEGOTIATING);
    auto answer = observer_u2_->LastDescription(SdpType::ANSWER);
    queue_.Sync([this, answer](){ u1_->HandleRemoteAnswer(answer); });
    Drain();
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::NEGOTIATING);
    EXPECT_EQ(engine_u1_.transport_for("u2")->remote_descriptions_applied, 1);
    EXPECT_EQ(observer_u1_->states.size(), 2u);
}

MY_TEST_F(PeerConnectionTest, RepeatedOfferResendsTheCachedAnswer) {
    CreatePeers();
    Negotiate();
    auto offer = observer_u1_->LastDescription(SdpType::OFFER);
    queue_.Sync([this, offer](){ u2_->HandleRemoteOffer(offer); });
    Drain();
    EXPECT_EQ(observer_u2_->CountDescriptions(SdpType::ANSWER), 2u);
    EXPECT_EQ(observer_u2_->descriptions[0], observer_u2_->descriptions[1]);
    EXPECT_EQ(engine_u2_.transport_for("u1")->answers_created, 1);
    EXPECT_EQ(engine_u2_.transport_for("u1")->remote_descriptions_applied, 1);
    EXPECT_EQ(StateOf(u2_), PeerConnection::State::NEGOTIATING);

    // A different offer is never applied.
    queue_.Sync([this](){ u2_->HandleRemoteOffer("another offer"); });
    Drain();
    EXPECT_EQ(observer_u2_->CountDescriptions(SdpType::ANSWER), 2u);
    EXPECT_EQ(engine_u2_.transport_for("u1")->remote_descriptions_applied, 1);
}

MY_TEST_F(PeerConnectionTest, GlareIsResolvedByThePolitePeer) {
    CreatePeers();
    queue_.Sync([this](){
        u1_->StartNegotiation();
        u2_->StartNegotiation();
    });
    Drain();
    ASSERT_EQ(StateOf(u1_), PeerConnection::State::LOCAL_OFFER_SENT);
    ASSERT_EQ(StateOf(u2_), PeerConnection::State::LOCAL_OFFER_SENT);

    auto offer_u1 = observer_u1_->LastDescription(SdpType::OFFER);
    auto offer_u2 = observer_u2_->LastDescription(SdpType::OFFER);
    queue_.Sync([&](){
        u2_->HandleRemoteOffer(offer_u1);
        u1_->HandleRemoteOffer(offer_u2);
    });
    Drain();

    // u1 is polite: it rolls back and answers.
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::NEGOTIATING);
    EXPECT_EQ(engine_u1_.transport_for("u2")->answers_created, 1);
    // u2 ignored the colliding offer and still waits for its answer.
    EXPECT_EQ(StateOf(u2_), PeerConnection::State::LOCAL_OFFER_SENT);
    EXPECT_EQ(engine_u2_.transport_for("u1")->remote_descriptions_applied, 0);

    auto answer = observer_u1_->LastDescription(SdpType::ANSWER);
    queue_.Sync([this, answer](){ u2_->HandleRemoteAnswer(answer); });
    Drain();
    EXPECT_EQ(StateOf(u2_), PeerConnection::State::NEGOTIATING);
}

MY_TEST_F(PeerConnectionTest, NegotiationFailureClosesOnlyThatPeer) {
    engine_u2_.behavior().fail_remote_description = true;
    CreatePeers();
    queue_.Sync([this](){ u1_->StartNegotiation(); });
    Drain();
    auto offer = observer_u1_->LastDescription(SdpType::OFFER);
    queue_.Sync([this, offer](){ u2_->HandleRemoteOffer(offer); });
    Drain();
    EXPECT_EQ(StateOf(u2_), PeerConnection::State::CLOSED);
    EXPECT_TRUE(engine_u2_.transport_for("u1")->closed);
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::LOCAL_OFFER_SENT);
}

MY_TEST_F(PeerConnectionTest, FailingCandidateClosesThePeer) {
    engine_u1_.behavior().fail_remote_candidates = true;
    CreatePeers();
    Negotiate();
    queue_.Sync([this](){ u1_->HandleRemoteCandidate(Candidate("candidate:bad", "0", 0)); });
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::CLOSED);
}

MY_TEST_F(PeerConnectionTest, ClosedPeerIgnoresMessages) {
    CreatePeers();
    queue_.Sync([this](){ u1_->StartNegotiation(); });
    Drain();
    queue_.Sync([this](){
        u1_->Close();
        u1_->Close();
    });
    queue_.Sync([this](){
        u1_->HandleRemoteAnswer("answer");
        u1_->HandleRemoteOffer("offer");
        u1_->HandleRemoteCandidate(Candidate("candidate:1", "0", 0));
        u1_->StartNegotiation();
    });
    Drain();
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::CLOSED);
    EXPECT_EQ(observer_u1_->states.back(), PeerConnection::State::CLOSED);
    EXPECT_EQ(std::count(observer_u1_->states.begin(), observer_u1_->states.end(), PeerConnection::State::CLOSED), 1);
    auto record = engine_u1_.transport_for("u2");
    EXPECT_TRUE(record->closed);
    EXPECT_EQ(record->remote_descriptions_applied, 0);
    EXPECT_TRUE(record->applied_candidates.empty());
}

MY_TEST_F(PeerConnectionTest, TransportFailureClosesThePeer) {
    CreatePeers();
    Negotiate();
    engine_u2_.SimulateTransportState("u1", MediaTransport::State::FAILED);
    Drain();
    EXPECT_EQ(StateOf(u2_), PeerConnection::State::CLOSED);
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::NEGOTIATING);
}

MY_TEST_F(PeerConnectionTest, UnansweredOfferIsRetransmittedThenAbandoned) {
    CreatePeers(/*retransmit_interval_ms=*/20, /*max_retransmits=*/3);
    queue_.Sync([this](){ u1_->StartNegotiation(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    Drain();

    EXPECT_EQ(StateOf(u1_), PeerConnection::State::CLOSED);
    // The first offer plus three retransmissions, each with the candidates gathered so far.
    EXPECT_EQ(observer_u1_->CountDescriptions(SdpType::OFFER), 4u);
    EXPECT_EQ(observer_u1_->candidates.size(), 4u);
    EXPECT_EQ(engine_u1_.transport_for("u2")->offers_created, 1);
}

MY_TEST_F(PeerConnectionTest, AnswerStopsRetransmission) {
    CreatePeers(/*retransmit_interval_ms=*/50, /*max_retransmits=*/3);
    Negotiate();
    ASSERT_EQ(StateOf(u1_), PeerConnection::State::NEGOTIATING);
    auto offers_sent = queue_.Sync<size_t>([this](){ return observer_u1_->CountDescriptions(SdpType::OFFER); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    Drain();
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::NEGOTIATING);
    EXPECT_EQ(observer_u1_->CountDescriptions(SdpType::OFFER), offers_sent);
}

MY_TEST_F(PeerConnectionTest, ResponderWithoutOfferGivesUp) {
    CreatePeers(/*retransmit_interval_ms=*/20, /*max_retransmits=*/2);
    queue_.Sync([this](){ u2_->AwaitRemoteOffer(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    Drain();

    EXPECT_EQ(StateOf(u2_), PeerConnection::State::CLOSED);
    EXPECT_TRUE(engine_u2_.transport_for("u1")->closed);
    EXPECT_TRUE(observer_u2_->descriptions.empty());
}

MY_TEST_F(PeerConnectionTest, OfferInTimeKeepsTheResponderOpen) {
    CreatePeers(/*retransmit_interval_ms=*/20, /*max_retransmits=*/2);
    queue_.Sync([this](){ u2_->AwaitRemoteOffer(); });
    Negotiate();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    Drain();

    EXPECT_EQ(StateOf(u2_), PeerConnection::State::NEGOTIATING);
    EXPECT_EQ(StateOf(u1_), PeerConnection::State::NEGOTIATING);
}

MY_TEST_F(PeerConnectionTest, LocalTracksAreAttachedOncePerTrack) {
    CreatePeers();
    auto audio = std::make_shared<MediaTrack>(MediaTrack::Kind::AUDIO, "audio-1");
    auto video = std::make_shared<MediaTrack>(MediaTrack::Kind::VIDEO, "video-1");
    queue_.Sync([&](){
        EXPECT_FALSE(u1_->local_media_attached());
        EXPECT_TRUE(u1_->AddLocalTrack(audio));
        EXPECT_FALSE(u1_->AddLocalTrack(audio));
        EXPECT_TRUE(u1_->AddLocalTrack(video));
        EXPECT_TRUE(u1_->local_media_attached());
    });
    EXPECT_EQ(engine_u1_.transport_for("u2")->added_track_ids, std::vector<std::string>({"audio-1", "video-1"}));
}

MY_TEST_F(PeerConnectionTest, RemoteTracksAreDeliveredOnceTheCallbackIsSet) {
    CreatePeers();
    Negotiate();
    std::vector<std::string> remote_tracks;
    queue_.Sync([&](){
        u1_->OnRemoteMediaTrackReceived([&](std::shared_ptr<MediaTrack> track){
            remote_tracks.push_back(track->track_id());
        });
    });
    EXPECT_EQ(remote_tracks, std::vector<std::string>({"remote-audio-u2"}));
    queue_.Sync([this](){ u1_->OnRemoteMediaTrackReceived(nullptr); });
}

} // namespace test
} // namespace naivecall
