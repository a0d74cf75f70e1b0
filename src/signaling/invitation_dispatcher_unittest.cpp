#include "signaling/invitation_dispatcher.hpp"
#include "signaling/local_broadcast_hub.hpp"
#include "common/task_queue.hpp"
#include "testing/queue_helpers.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace signaling {
namespace test {

using naivecall::test::DrainQueues;

namespace {

class MockPushNotifier : public PushNotifier {
public:
    MOCK_METHOD(void, 
                Notify, 
                (const std::vector<std::string>& user_ids,
                 const std::string& title,
                 const std::string& body,
                 const std::string& tag),
                (override));
};

class RecordingObserver : public InvitationDispatcher::Observer {
public:
    void OnInvite(const Invite& invite) override { invites.push_back(invite); }
    void OnInviteCancelled(const CallCancelled& call_cancelled) override { cancellations.push_back(call_cancelled); }

    std::vector<Invite> invites;
    std::vector<CallCancelled> cancellations;
};

// One simulated device listening on the invites channel.
struct Device {
    Device(LocalBroadcastHub* hub, const std::string& user_id, std::shared_ptr<PushNotifier> push_notifier)
        : queue("Device." + user_id),
          observer(std::make_shared<RecordingObserver>()) {
        queue.Sync([&](){
            invites_channel = std::make_shared<InvitesChannel>(hub, "call-invites", &queue);
            InvitationDispatcher::Configuration config;
            config.local_user_id = user_id;
            dispatcher = std::make_unique<InvitationDispatcher>(config, invites_channel, push_notifier, observer);
        });
    }

    ~Device() {
        queue.Sync([this](){
            dispatcher.reset();
            invites_channel.reset();
        });
    }

    TaskQueue queue;
    std::shared_ptr<RecordingObserver> observer;
    std::shared_ptr<InvitesChannel> invites_channel;
    std::unique_ptr<InvitationDispatcher> dispatcher;
};

} // namespace

class T(InvitationDispatcherTest) : public ::testing::Test {
protected:
    T(InvitationDispatcherTest)() 
        : push_notifier_(std::make_shared<StrictMock<MockPushNotifier>>()),
          u1_(&hub_, "u1", push_notifier_),
          u2_(&hub_, "u2", nullptr),
          u3_(&hub_, "u3", nullptr) {}

    void StartReceivers() {
        u2_.queue.Sync([this](){ u2_.dispatcher->Start(); });
        u3_.queue.Sync([this](){ u3_.dispatcher->Start(); });
        Drain();
    }

    void Drain() {
        DrainQueues({&u1_.queue, &u2_.queue, &u3_.queue});
    }

    LocalBroadcastHub hub_;
    std::shared_ptr<StrictMock<MockPushNotifier>> push_notifier_;
    Device u1_;
    Device u2_;
    Device u3_;
};

MY_TEST_F(InvitationDispatcherTest, EachRecipientGetsItsOwnInviteAndAPush) {
    StartReceivers();
    EXPECT_CALL(*push_notifier_, Notify(ElementsAre("u2", "u3"), "Incoming video call", "Tap to answer", "chat-room-1"))
        .Times(1);

    u1_.queue.Sync([this](){
        u1_.dispatcher->SendInvite({"u2", "u3"}, "room-1", CallType::VIDEO, {"u1", "u2", "u3"});
    });
    Drain();

    ASSERT_EQ(u2_.observer->invites.size(), 1u);
    const auto& invite = u2_.observer->invites[0];
    EXPECT_EQ(invite.from, "u1");
    EXPECT_EQ(invite.to, "u2");
    EXPECT_EQ(invite.chat_room_id, "room-1");
    EXPECT_EQ(invite.call_type, CallType::VIDEO);
    EXPECT_EQ(invite.participants, std::vector<std::string>({"u1", "u2", "u3"}));
    EXPECT_GT(invite.timestamp, 0);

    ASSERT_EQ(u3_.observer->invites.size(), 1u);
    EXPECT_EQ(u3_.observer->invites[0].to, "u3");
    EXPECT_TRUE(u1_.observer->invites.empty());
}

MY_TEST_F(InvitationDispatcherTest, VoiceCallUsesTheVoiceTitle) {
    StartReceivers();
    EXPECT_CALL(*push_notifier_, Notify(ElementsAre("u2"), "Incoming voice call", "Tap to answer", "chat-room-2"))
        .Times(1);
    u1_.queue.Sync([this](){
        u1_.dispatcher->SendInvite({"u2"}, "room-2", CallType::VOICE, {"u1", "u2"});
    });
    Drain();
    ASSERT_EQ(u2_.observer->invites.size(), 1u);
    EXPECT_TRUE(u3_.observer->invites.empty());
}

MY_TEST_F(InvitationDispatcherTest, FailingRecipientDoesNotStopTheOthers) {
    StartReceivers();
    hub_.set_send_filter([](const std::string& channel_name, const std::string& event, const std::string& payload){
        return payload.find("\"to\":\"u2\"") == std::string::npos;
    });
    EXPECT_CALL(*push_notifier_, Notify(ElementsAre("u2", "u3"), _, _, _)).Times(1);

    u1_.queue.Sync([this](){
        u1_.dispatcher->SendInvite({"u2", "u3"}, "room-1", CallType::VOICE, {"u1", "u2", "u3"});
    });
    Drain();

    EXPECT_TRUE(u2_.observer->invites.empty());
    EXPECT_EQ(u3_.observer->invites.size(), 1u);
}

MY_TEST_F(InvitationDispatcherTest, PushFailureIsNotFatal) {
    StartReceivers();
    EXPECT_CALL(*push_notifier_, Notify(_, _, _, _))
        .WillOnce(Throw(std::runtime_error("push service unavailable")));
    u1_.queue.Sync([this](){
        u1_.dispatcher->SendInvite({"u2"}, "room-1", CallType::VOICE, {"u1", "u2"});
    });
    Drain();
    EXPECT_EQ(u2_.observer->invites.size(), 1u);
}

MY_TEST_F(InvitationDispatcherTest, InvitesChannelIsSubscribedOnceOnFirstUse) {
    EXPECT_EQ(hub_.subscriber_count("call-invites"), 0u);
    EXPECT_CALL(*push_notifier_, Notify(_, _, _, _)).Times(2);
    u1_.queue.Sync([this](){
        u1_.dispatcher->SendInvite({"u2"}, "room-1", CallType::VOICE, {"u1", "u2"});
        u1_.dispatcher->SendInvite({"u3"}, "room-1", CallType::VOICE, {"u1", "u3"});
    });
    Drain();
    EXPECT_EQ(hub_.subscriber_count("call-invites"), 1u);
    EXPECT_TRUE(u1_.queue.Sync<bool>([this](){ return u1_.invites_channel->is_ready(); }));
    // Nobody else was listening.
    EXPECT_TRUE(u2_.observer->invites.empty());
}

MY_TEST_F(InvitationDispatcherTest, CancellationReachesTheRecipient) {
    StartReceivers();
    u1_.queue.Sync([this](){
        u1_.dispatcher->SendCancel({"u3"}, "room-1");
    });
    Drain();
    ASSERT_EQ(u3_.observer->cancellations.size(), 1u);
    EXPECT_EQ(u3_.observer->cancellations[0].from, "u1");
    EXPECT_EQ(u3_.observer->cancellations[0].chat_room_id, "room-1");
    EXPECT_TRUE(u2_.observer->cancellations.empty());
}

MY_TEST_F(InvitationDispatcherTest, ClosedChannelDropsInvitesButStillPushes) {
    EXPECT_CALL(*push_notifier_, Notify(ElementsAre("u2"), _, _, _)).Times(1);
    u1_.queue.Sync([this](){
        u1_.invites_channel->Close();
        u1_.dispatcher->SendInvite({"u2"}, "room-1", CallType::VOICE, {"u1", "u2"});
    });
    Drain();
    EXPECT_TRUE(u2_.observer->invites.empty());
}

} // namespace test
} // namespace signaling
} // namespace naivecall
