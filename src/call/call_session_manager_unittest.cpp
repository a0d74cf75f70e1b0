#include "call/call_session_manager.hpp"
#include "signaling/local_broadcast_hub.hpp"
#include "testing/queue_helpers.hpp"
#include "testing/test_device.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace test {

class T(CallSessionManagerTest) : public ::testing::Test {
protected:
    std::unique_ptr<TestDevice> AddDevice(const std::string& user_id,
                                          TimeInterval offer_retransmit_interval_ms = 30,
                                          int max_offer_retransmits = 100) {
        return std::make_unique<TestDevice>(&hub_, user_id, offer_retransmit_interval_ms, max_offer_retransmits);
    }

    // Waits for the invite to `room` and accepts it.
    bool Accept(TestDevice& device, const std::string& room) {
        if (!WaitUntil([&](){ return HasPendingInvite(device, room); })) {
            return false;
        }
        for (const auto& invite : device.manager().pending_invites()) {
            if (invite.chat_room_id == room) {
                return device.manager().AcceptIncoming(invite);
            }
        }
        return false;
    }

    bool HasPendingInvite(TestDevice& device, const std::string& room) {
        for (const auto& invite : device.manager().pending_invites()) {
            if (invite.chat_room_id == room) {
                return true;
            }
        }
        return false;
    }

    bool ReachedNegotiation(TestDevice& device, const std::string& remote_user_id) {
        auto state = device.PeerState(remote_user_id);
        return state && (*state == PeerConnection::State::NEGOTIATING || *state == PeerConnection::State::CONNECTED);
    }

    static bool AllStopped(FakeMediaEngine& engine) {
        for (const auto& stream : engine.streams()) {
            for (const auto& track : stream->tracks()) {
                if (!track->stopped()) {
                    return false;
                }
            }
        }
        return true;
    }

protected:
    signaling::LocalBroadcastHub hub_;
};

MY_TEST_F(CallSessionManagerTest, OneToOneCallConnectsAndEndsOnBothSides) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2"}, signaling::CallType::VIDEO));
    ASSERT_TRUE(Accept(*u2, "room-1"));

    auto invite = u2->last_invite();
    EXPECT_EQ(invite.from, "u1");
    EXPECT_EQ(invite.to, "u2");
    EXPECT_EQ(invite.call_type, signaling::CallType::VIDEO);
    EXPECT_THAT(invite.participants, UnorderedElementsAre("u1", "u2"));

    EXPECT_TRUE(WaitUntil([&](){ return u1->IsConnectedTo("u2") && u2->IsConnectedTo("u1"); }));
    EXPECT_TRUE(u1->Read<bool>([](const RecordingCallObserver& o){
        return !o.remote_tracks.empty() && o.remote_tracks.front().first == "u2";
    }));

    u1->manager().EndCall();
    EXPECT_FALSE(u1->manager().in_call());
    EXPECT_TRUE(WaitUntil([&](){ return u1->HasEnded("room-1") && u2->HasEnded("room-1"); }));
    EXPECT_FALSE(u2->manager().in_call());

    u1->queue().Sync([&](){ EXPECT_TRUE(AllStopped(u1->engine())); });
    u2->queue().Sync([&](){ EXPECT_TRUE(AllStopped(u2->engine())); });
    EXPECT_EQ(hub_.subscriber_count("call-room-1"), 0u);
}

MY_TEST_F(CallSessionManagerTest, UnansweredCalleeDoesNotBlockTheOthers) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");
    auto u3 = AddDevice("u3");

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2", "u3"}, signaling::CallType::VIDEO));
    ASSERT_TRUE(Accept(*u2, "room-1"));
    EXPECT_TRUE(WaitUntil([&](){ return HasPendingInvite(*u3, "room-1"); }));

    EXPECT_TRUE(WaitUntil([&](){ return ReachedNegotiation(*u1, "u2") && ReachedNegotiation(*u2, "u1"); }));
    EXPECT_EQ(u1->PeerState("u3"), PeerConnection::State::LOCAL_OFFER_SENT);
    EXPECT_TRUE(u1->manager().in_call());
}

MY_TEST_F(CallSessionManagerTest, GroupCallConnectsEveryPair) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");
    auto u3 = AddDevice("u3");

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2", "u3"}, signaling::CallType::VIDEO));
    ASSERT_TRUE(Accept(*u2, "room-1"));
    ASSERT_TRUE(Accept(*u3, "room-1"));

    EXPECT_TRUE(WaitUntil([&](){
        return u1->IsConnectedTo("u2") && u1->IsConnectedTo("u3") &&
               u2->IsConnectedTo("u1") && u2->IsConnectedTo("u3") &&
               u3->IsConnectedTo("u1") && u3->IsConnectedTo("u2");
    }));

    // Between two callees only the greater id offers.
    EXPECT_EQ(u2->queue().Sync<int>([&](){ return u2->engine().transport_for("u3")->offers_created; }), 0);
    EXPECT_GE(u3->queue().Sync<int>([&](){ return u3->engine().transport_for("u2")->offers_created; }), 1);
}

MY_TEST_F(CallSessionManagerTest, GroupCallContinuesUntilEveryoneLeft) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");
    auto u3 = AddDevice("u3");

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2", "u3"}, signaling::CallType::VOICE));
    ASSERT_TRUE(Accept(*u2, "room-1"));
    ASSERT_TRUE(Accept(*u3, "room-1"));
    ASSERT_TRUE(WaitUntil([&](){ return u1->IsConnectedTo("u2") && u1->IsConnectedTo("u3"); }));

    u2->manager().EndCall();
    EXPECT_TRUE(WaitUntil([&](){ return u1->PeerState("u2") == PeerConnection::State::CLOSED; }));
    EXPECT_TRUE(u1->manager().in_call());
    EXPECT_TRUE(u3->manager().in_call());

    u3->manager().EndCall();
    EXPECT_TRUE(WaitUntil([&](){ return u1->HasEnded("room-1"); }));
    EXPECT_FALSE(u1->manager().in_call());
}

MY_TEST_F(CallSessionManagerTest, CallerHangupCancelsThePendingInvite) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2"}, signaling::CallType::VOICE));
    ASSERT_TRUE(WaitUntil([&](){ return HasPendingInvite(*u2, "room-1"); }));
    auto invite = u2->last_invite();

    u1->manager().EndCall();
    EXPECT_TRUE(WaitUntil([&](){
        return u2->Read<bool>([](const RecordingCallObserver& o){ return !o.cancellations.empty(); });
    }));
    EXPECT_TRUE(u2->manager().pending_invites().empty());
    EXPECT_FALSE(u2->manager().AcceptIncoming(invite));
    EXPECT_FALSE(u2->manager().in_call());
    EXPECT_EQ(u2->engine().user_media_requests(), 0);
}

MY_TEST_F(CallSessionManagerTest, DeclineIsLocalOnly) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2"}, signaling::CallType::VOICE));
    ASSERT_TRUE(WaitUntil([&](){ return HasPendingInvite(*u2, "room-1"); }));
    auto invite = u2->last_invite();

    u2->manager().DeclineIncoming(invite);
    EXPECT_TRUE(u2->manager().pending_invites().empty());
    EXPECT_FALSE(u2->manager().AcceptIncoming(invite));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_TRUE(u1->manager().in_call());
    EXPECT_FALSE(u1->HasEnded("room-1"));
    EXPECT_EQ(u1->PeerState("u2"), PeerConnection::State::LOCAL_OFFER_SENT);
}

MY_TEST_F(CallSessionManagerTest, LateCancellationAfterAcceptIsIgnored) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");
    auto u3 = AddDevice("u3");

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2", "u3"}, signaling::CallType::VOICE));
    ASSERT_TRUE(Accept(*u2, "room-1"));
    ASSERT_TRUE(WaitUntil([&](){ return HasPendingInvite(*u3, "room-1"); }));
    ASSERT_TRUE(WaitUntil([&](){ return ReachedNegotiation(*u2, "u1"); }));

    // u2 accepted and negotiates before the cancellation arrives.
    signaling::CallCancelled late_cancel;
    late_cancel.from = "u1";
    late_cancel.to = "u2";
    late_cancel.chat_room_id = "room-1";
    u2->queue().Sync([&](){
        static_cast<signaling::InvitationDispatcher::Observer&>(u2->manager()).OnInviteCancelled(late_cancel);
    });

    EXPECT_TRUE(u2->manager().in_call());
    EXPECT_TRUE(u2->Read<bool>([](const RecordingCallObserver& o){ return o.cancellations.empty(); }));
    EXPECT_TRUE(ReachedNegotiation(*u2, "u1"));
}

MY_TEST_F(CallSessionManagerTest, CancellationBeforeNegotiationEndsTheAcceptedCall) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");
    u2->queue().Sync([&](){ u2->engine().behavior().hold_user_media = true; });

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2"}, signaling::CallType::VIDEO));
    ASSERT_TRUE(Accept(*u2, "room-1"));
    ASSERT_TRUE(u2->queue().Sync<bool>([&](){ return u2->engine().has_pending_user_media(); }));

    // u2 has not joined the call channel yet, only the cancellation reaches it.
    u1->manager().EndCall();
    EXPECT_TRUE(WaitUntil([&](){ return u2->HasEnded("room-1"); }));
    EXPECT_FALSE(u2->manager().in_call());
    EXPECT_TRUE(u2->Read<bool>([](const RecordingCallObserver& o){ return o.cancellations.size() == 1; }));

    u2->queue().Sync([&](){ u2->engine().ResolvePendingUserMedia(); });
    DrainQueues({&u2->queue()});
    u2->queue().Sync([&](){
        ASSERT_EQ(u2->engine().streams().size(), 1u);
        EXPECT_TRUE(AllStopped(u2->engine()));
        EXPECT_EQ(u2->engine().transport_count(), 0u);
    });
    EXPECT_EQ(hub_.subscriber_count("call-room-1"), 0u);
}

MY_TEST_F(CallSessionManagerTest, CalleeLeavesWhenTheCallerHangsUpOnAGroupWithASilentMember) {
    // Offers are given up on after 30ms * 10 retransmissions.
    auto u1 = AddDevice("u1", 30, 10);
    auto u2 = AddDevice("u2", 30, 10);
    auto u3 = AddDevice("u3", 30, 10);

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2", "u3"}, signaling::CallType::VOICE));
    ASSERT_TRUE(Accept(*u2, "room-1"));
    ASSERT_TRUE(WaitUntil([&](){ return u1->IsConnectedTo("u2") && u2->IsConnectedTo("u1"); }));

    u1->manager().EndCall();
    EXPECT_TRUE(WaitUntil([&](){ return u2->HasEnded("room-1"); }));
    EXPECT_FALSE(u2->manager().in_call());
    u2->queue().Sync([&](){
        EXPECT_TRUE(AllStopped(u2->engine()));
        EXPECT_TRUE(u2->engine().transport_for("u1")->closed);
        EXPECT_TRUE(u2->engine().transport_for("u3")->closed);
    });
    EXPECT_EQ(hub_.subscriber_count("call-room-1"), 0u);
    // u3 never answered, its invite is withdrawn.
    EXPECT_TRUE(WaitUntil([&](){
        return u3->Read<bool>([](const RecordingCallObserver& o){ return !o.cancellations.empty(); });
    }));
    EXPECT_FALSE(HasPendingInvite(*u3, "room-1"));
}

MY_TEST_F(CallSessionManagerTest, InvitesWithTextTimestampsAreDedupedByTheirText) {
    auto u2 = AddDevice("u2");
    TaskQueue sender_queue("CallSessionManagerTest.sender");
    auto sender = hub_.CreateChannel("call-invites", &sender_queue);
    sender_queue.Sync([&](){ sender->Subscribe([](boost::system::error_code ec){ EXPECT_FALSE(ec); }); });
    DrainQueues({&sender_queue});

    auto invite_payload = [](const std::string& timestamp){
        return R"({"chatRoomId": "room-1", "callType": "voice", "from": "u1", "to": "u2",
                   "participants": ["u1", "u2"], "timestamp": ")" + timestamp + R"("})";
    };
    sender_queue.Sync([&](){
        sender->Send(signaling::kIncomingCallEvent, invite_payload("2026-10-18T09:30:00.000Z"));
        sender->Send(signaling::kIncomingCallEvent, invite_payload("2026-10-18T09:30:00.000Z"));
        sender->Send(signaling::kIncomingCallEvent, invite_payload("2026-10-18T09:31:00.000Z"));
    });

    EXPECT_TRUE(WaitUntil([&](){ return u2->invite_count() == 2u; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(u2->invite_count(), 2u);
    EXPECT_EQ(u2->last_invite().timestamp_text, "2026-10-18T09:31:00.000Z");

    sender_queue.Sync([&](){ sender->Unsubscribe(); });
    DrainQueues({&sender_queue});
}

MY_TEST_F(CallSessionManagerTest, SecondCallIsRejectedWhileInCall) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2"}, signaling::CallType::VOICE));
    EXPECT_FALSE(u1->manager().StartCall("room-2", {"u2"}, signaling::CallType::VOICE));
    EXPECT_EQ(u1->manager().active_session()->chat_room_id(), "room-1");
}

MY_TEST_F(CallSessionManagerTest, InviteForAnotherRoomWaitsWhileInCall) {
    auto u1 = AddDevice("u1");
    auto u2 = AddDevice("u2");
    auto u3 = AddDevice("u3");

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2"}, signaling::CallType::VOICE));
    ASSERT_TRUE(Accept(*u2, "room-1"));
    ASSERT_TRUE(u3->manager().StartCall("room-2", {"u2"}, signaling::CallType::VOICE));

    ASSERT_TRUE(WaitUntil([&](){ return HasPendingInvite(*u2, "room-2"); }));
    auto pending = u2->manager().pending_invites();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_FALSE(u2->manager().AcceptIncoming(pending.front()));
    EXPECT_EQ(u2->manager().active_session()->chat_room_id(), "room-1");
}

MY_TEST_F(CallSessionManagerTest, MediaFailureIsReportedAsFailedCall) {
    auto u1 = AddDevice("u1");
    u1->engine().behavior().fail_user_media = true;

    ASSERT_TRUE(u1->manager().StartCall("room-1", {"u2"}, signaling::CallType::VOICE));
    EXPECT_TRUE(WaitUntil([&](){ return u1->HasFailed("room-1"); }));
    EXPECT_FALSE(u1->manager().in_call());
    EXPECT_EQ(hub_.subscriber_count("call-room-1"), 0u);
}

MY_TEST_F(CallSessionManagerTest, TogglesWithoutACall) {
    auto u1 = AddDevice("u1");
    EXPECT_FALSE(u1->manager().ToggleMute());
    EXPECT_TRUE(u1->manager().ToggleVideo());
}

} // namespace test
} // namespace naivecall
