#include "call/call_session.hpp"
#include "common/task_queue.hpp"
#include "signaling/local_broadcast_hub.hpp"
#include "testing/fake_media_engine.hpp"
#include "testing/queue_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace test {
namespace {

class RecordingSessionObserver : public CallSession::Observer {
public:
    void OnSessionEnded(std::shared_ptr<CallSession> session, CallSession::EndReason reason, const std::string& error) override {
        end_reasons.push_back(reason);
    }
    void OnRemoteParticipantConnected(std::shared_ptr<CallSession> session, const std::string& remote_user_id) override {
        connected.push_back(remote_user_id);
    }
    void OnRemoteMediaTrack(std::shared_ptr<CallSession> session,
                            const std::string& remote_user_id,
                            std::shared_ptr<MediaTrack> track) override {
        remote_tracks.emplace_back(remote_user_id, track->track_id());
    }

    std::vector<CallSession::EndReason> end_reasons;
    std::vector<std::string> connected;
    std::vector<std::pair<std::string, std::string>> remote_tracks;
};

bool AllStopped(const std::vector<std::shared_ptr<MediaStream>>& streams) {
    return std::all_of(streams.begin(), streams.end(), [](const std::shared_ptr<MediaStream>& stream){
        return std::all_of(stream->tracks().begin(), stream->tracks().end(), [](const std::shared_ptr<MediaTrack>& track){
            return track->stopped();
        });
    });
}

} // namespace

class T(CallSessionTest) : public ::testing::Test {
protected:
    T(CallSessionTest)()
        : queue_("CallSessionTest.queue"),
          engine_("u1", &queue_),
          observer_(std::make_shared<RecordingSessionObserver>()) {
        config_.local_user_id = "u1";
        config_.offer_retransmit_interval_ms = 30;
    }

    ~T(CallSessionTest)() override {
        queue_.Sync([this](){
            if (session_) {
                session_->End(CallSession::EndReason::LOCAL_HANGUP);
                session_.reset();
            }
        });
        DrainQueues({&queue_});
    }

    void StartSession(signaling::CallType call_type, std::vector<std::string> participants = {"u1", "u2"}) {
        CallSession::Params params;
        params.chat_room_id = "room-1";
        params.call_type = call_type;
        params.role = CallSession::Role::CALLER;
        params.caller_id = "u1";
        params.participants = std::move(participants);
        queue_.Sync([&](){
            session_ = CallSession::Create(config_, params, &engine_, &hub_, nullptr, &queue_, observer_);
            session_->Start();
        });
        DrainQueues({&queue_});
    }

    CallSession::State SessionState() {
        return queue_.Sync<CallSession::State>([this](){ return session_->state(); });
    }

    std::vector<CallSession::EndReason> EndReasons() {
        return queue_.Sync<std::vector<CallSession::EndReason>>([this](){ return observer_->end_reasons; });
    }

protected:
    CallConfiguration config_;
    signaling::LocalBroadcastHub hub_;
    TaskQueue queue_;
    FakeMediaEngine engine_;
    std::shared_ptr<RecordingSessionObserver> observer_;
    std::shared_ptr<CallSession> session_;
};

MY_TEST_F(CallSessionTest, CreateRejectsACallWithoutRemoteParticipants) {
    CallSession::Params params;
    params.chat_room_id = "room-1";
    params.caller_id = "u1";
    params.participants = {"u1"};
    EXPECT_THROW(CallSession::Create(config_, params, &engine_, &hub_, nullptr, &queue_, observer_), std::invalid_argument);
}

MY_TEST_F(CallSessionTest, JoinsTheCallChannelAndOffersToEveryParticipant) {
    StartSession(signaling::CallType::VIDEO, {"u1", "u2", "u3"});

    EXPECT_EQ(SessionState(), CallSession::State::ACTIVE);
    EXPECT_EQ(hub_.subscriber_count("call-room-1"), 1u);
    queue_.Sync([this](){
        EXPECT_EQ(session_->registry().size(), 2u);
        for (const auto& remote_user_id : {"u2", "u3"}) {
            auto record = engine_.transport_for(remote_user_id);
            ASSERT_NE(record, nullptr);
            EXPECT_EQ(record->offers_created, 1);
            EXPECT_EQ(record->added_track_ids.size(), 2u);
            EXPECT_EQ(session_->registry().Find(remote_user_id)->state(), PeerConnection::State::LOCAL_OFFER_SENT);
        }
    });
}

MY_TEST_F(CallSessionTest, MediaFailureEndsTheSessionBeforeJoining) {
    engine_.behavior().fail_user_media = true;
    StartSession(signaling::CallType::VOICE);

    EXPECT_EQ(SessionState(), CallSession::State::ENDED);
    EXPECT_THAT(EndReasons(), ElementsAre(CallSession::EndReason::MEDIA_FAILURE));
    EXPECT_EQ(hub_.subscriber_count("call-room-1"), 0u);
    EXPECT_EQ(engine_.transport_count(), 0u);
}

MY_TEST_F(CallSessionTest, IncompleteMediaIsReleased) {
    engine_.behavior().drop_video = true;
    StartSession(signaling::CallType::VIDEO);

    EXPECT_THAT(EndReasons(), ElementsAre(CallSession::EndReason::MEDIA_FAILURE));
    queue_.Sync([this](){
        ASSERT_EQ(engine_.streams().size(), 1u);
        EXPECT_TRUE(AllStopped(engine_.streams()));
    });
    EXPECT_EQ(hub_.subscriber_count("call-room-1"), 0u);
}

MY_TEST_F(CallSessionTest, MediaArrivingAfterHangupIsReleased) {
    engine_.behavior().hold_user_media = true;
    StartSession(signaling::CallType::VIDEO);
    EXPECT_EQ(SessionState(), CallSession::State::ACQUIRING_MEDIA);

    queue_.Sync([this](){
        session_->End(CallSession::EndReason::LOCAL_HANGUP);
        engine_.ResolvePendingUserMedia();
    });
    DrainQueues({&queue_});

    queue_.Sync([this](){
        ASSERT_EQ(engine_.streams().size(), 1u);
        EXPECT_TRUE(AllStopped(engine_.streams()));
        EXPECT_EQ(session_->local_stream(), nullptr);
    });
    EXPECT_EQ(engine_.transport_count(), 0u);
    EXPECT_EQ(hub_.subscriber_count("call-room-1"), 0u);
    EXPECT_THAT(EndReasons(), ElementsAre(CallSession::EndReason::LOCAL_HANGUP));
}

MY_TEST_F(CallSessionTest, TeardownContinuesWhenCallEndedCannotBeSent) {
    StartSession(signaling::CallType::VOICE, {"u1", "u2", "u3"});
    ASSERT_EQ(SessionState(), CallSession::State::ACTIVE);
    hub_.set_send_filter([](const std::string& name, const std::string& event, const std::string& payload){
        return event != signaling::kCallEndedEvent;
    });

    queue_.Sync([this](){ session_->End(CallSession::EndReason::LOCAL_HANGUP); });
    DrainQueues({&queue_});

    queue_.Sync([this](){
        EXPECT_TRUE(session_->registry().AllClosed());
        EXPECT_TRUE(engine_.transport_for("u2")->closed);
        EXPECT_TRUE(engine_.transport_for("u3")->closed);
        EXPECT_TRUE(AllStopped(engine_.streams()));
    });
    EXPECT_EQ(hub_.subscriber_count("call-room-1"), 0u);
    EXPECT_THAT(EndReasons(), ElementsAre(CallSession::EndReason::LOCAL_HANGUP));
}

MY_TEST_F(CallSessionTest, EndingTwiceReportsOnce) {
    StartSession(signaling::CallType::VOICE);
    queue_.Sync([this](){
        session_->End(CallSession::EndReason::LOCAL_HANGUP);
        session_->End(CallSession::EndReason::REMOTE_HANGUP);
    });
    DrainQueues({&queue_});
    EXPECT_THAT(EndReasons(), ElementsAre(CallSession::EndReason::LOCAL_HANGUP));
}

MY_TEST_F(CallSessionTest, TogglesFlipTheLocalTracks) {
    StartSession(signaling::CallType::VIDEO);
    queue_.Sync([this](){
        auto stream = session_->local_stream();
        ASSERT_NE(stream, nullptr);
        EXPECT_FALSE(session_->muted());
        EXPECT_FALSE(session_->video_off());

        EXPECT_TRUE(session_->ToggleMute());
        EXPECT_FALSE(stream->audio_tracks().front()->enabled());
        EXPECT_FALSE(session_->ToggleMute());
        EXPECT_TRUE(stream->audio_tracks().front()->enabled());

        EXPECT_TRUE(session_->ToggleVideo());
        EXPECT_FALSE(stream->video_tracks().front()->enabled());
    });
}

MY_TEST_F(CallSessionTest, VoiceCallHasNoVideoToToggle) {
    StartSession(signaling::CallType::VOICE);
    queue_.Sync([this](){
        EXPECT_TRUE(session_->video_off());
        EXPECT_TRUE(session_->ToggleVideo());
    });
}

MY_TEST_F(CallSessionTest, RemoteHangupOfTheLastPeerEndsTheSession) {
    TaskQueue callee_queue("CallSessionTest.callee");
    FakeMediaEngine callee_engine("u2", &callee_queue);
    auto callee_observer = std::make_shared<RecordingSessionObserver>();
    CallConfiguration callee_config = config_;
    callee_config.local_user_id = "u2";
    std::shared_ptr<CallSession> callee;

    CallSession::Params params;
    params.chat_room_id = "room-1";
    params.call_type = signaling::CallType::VOICE;
    params.role = CallSession::Role::CALLEE;
    params.caller_id = "u1";
    params.participants = {"u1", "u2"};
    callee_queue.Sync([&](){
        callee = CallSession::Create(callee_config, params, &callee_engine, &hub_, nullptr, &callee_queue, callee_observer);
        callee->Start();
    });
    StartSession(signaling::CallType::VOICE);

    EXPECT_TRUE(WaitUntil([&](){
        return queue_.Sync<bool>([this](){ return !observer_->connected.empty(); }) &&
               callee_queue.Sync<bool>([&](){ return !callee_observer->connected.empty(); });
    }));
    queue_.Sync([this](){
        EXPECT_THAT(observer_->connected, ElementsAre("u2"));
        EXPECT_THAT(observer_->remote_tracks, Contains(std::make_pair(std::string("u2"), std::string("remote-audio-u2"))));
    });

    callee_queue.Sync([&](){ callee->End(CallSession::EndReason::LOCAL_HANGUP); });
    EXPECT_TRUE(WaitUntil([this](){ return !EndReasons().empty(); }));
    EXPECT_THAT(EndReasons(), ElementsAre(CallSession::EndReason::REMOTE_HANGUP));
    EXPECT_EQ(SessionState(), CallSession::State::ENDED);

    DrainQueues({&queue_, &callee_queue});
    callee_queue.Sync([&](){
        EXPECT_THAT(callee_observer->end_reasons, ElementsAre(CallSession::EndReason::LOCAL_HANGUP));
        callee.reset();
    });
}

} // namespace test
} // namespace naivecall
