#include "signaling/call_channel.hpp"
#include "signaling/local_broadcast_hub.hpp"
#include "common/task_queue.hpp"
#include "testing/queue_helpers.hpp"

#include <gtest/gtest.h>

#include <vector>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace signaling {
namespace test {

using naivecall::test::DrainQueues;

namespace {

class RecordingObserver : public CallChannel::Observer {
public:
    void OnRemoteOffer(const Offer& offer) override { offers.push_back(offer); }
    void OnRemoteAnswer(const Answer& answer) override { answers.push_back(answer); }
    void OnRemoteCandidate(const IceCandidate& candidate) override { candidates.push_back(candidate); }
    void OnRemoteCallEnded(const CallEnded& call_ended) override { ended.push_back(call_ended); }

    std::vector<Offer> offers;
    std::vector<Answer> answers;
    std::vector<IceCandidate> candidates;
    std::vector<CallEnded> ended;
};

} // namespace

class T(CallChannelTest) : public ::testing::Test {
protected:
    T(CallChannelTest)() 
        : queue_u1_("CallChannelTest.u1"),
          queue_u2_("CallChannelTest.u2"),
          queue_u3_("CallChannelTest.u3"),
          observer_u2_(std::make_shared<RecordingObserver>()),
          observer_u3_(std::make_shared<RecordingObserver>()) {
        const auto name = CallChannel::ChannelName("call-", "room-1");
        u1_ = std::make_unique<CallChannel>(hub_.CreateChannel(name, &queue_u1_), "room-1", "u1", std::weak_ptr<CallChannel::Observer>());
        u2_ = std::make_unique<CallChannel>(hub_.CreateChannel(name, &queue_u2_), "room-1", "u2", observer_u2_);
        u3_ = std::make_unique<CallChannel>(hub_.CreateChannel(name, &queue_u3_), "room-1", "u3", observer_u3_);
        queue_u1_.Sync([this](){ u1_->Subscribe(nullptr); });
        queue_u2_.Sync([this](){ u2_->Subscribe(nullptr); });
        queue_u3_.Sync([this](){ u3_->Subscribe(nullptr); });
        Drain();
    }

    ~T(CallChannelTest)() override {
        queue_u1_.Sync([this](){ u1_.reset(); });
        queue_u2_.Sync([this](){ u2_.reset(); });
        queue_u3_.Sync([this](){ u3_.reset(); });
    }

    void Drain() {
        DrainQueues({&queue_u1_, &queue_u2_, &queue_u3_});
    }

    LocalBroadcastHub hub_;
    TaskQueue queue_u1_;
    TaskQueue queue_u2_;
    TaskQueue queue_u3_;
    std::shared_ptr<RecordingObserver> observer_u2_;
    std::shared_ptr<RecordingObserver> observer_u3_;
    std::unique_ptr<CallChannel> u1_;
    std::unique_ptr<CallChannel> u2_;
    std::unique_ptr<CallChannel> u3_;
};

MY_TEST_F(CallChannelTest, ChannelName) {
    EXPECT_EQ(CallChannel::ChannelName("call-", "abc"), "call-abc");
}

MY_TEST_F(CallChannelTest, OnlyAddresseeReceivesDirectedMessages) {
    queue_u1_.Sync([this](){
        u1_->SendOffer("u2", "offer-for-u2");
        u1_->SendCandidate("u3", Candidate("candidate:1", "0"));
    });
    Drain();

    ASSERT_EQ(observer_u2_->offers.size(), 1u);
    EXPECT_EQ(observer_u2_->offers[0].from, "u1");
    EXPECT_EQ(observer_u2_->offers[0].sdp, "offer-for-u2");
    EXPECT_TRUE(observer_u2_->candidates.empty());

    EXPECT_TRUE(observer_u3_->offers.empty());
    ASSERT_EQ(observer_u3_->candidates.size(), 1u);
    EXPECT_EQ(observer_u3_->candidates[0].candidate.sdp, "candidate:1");
}

MY_TEST_F(CallChannelTest, CallEndedReachesEveryone) {
    queue_u1_.Sync([this](){
        u1_->SendCallEnded();
    });
    Drain();
    ASSERT_EQ(observer_u2_->ended.size(), 1u);
    ASSERT_EQ(observer_u3_->ended.size(), 1u);
    EXPECT_EQ(observer_u3_->ended[0].from, "u1");
}

MY_TEST_F(CallChannelTest, ForeignChatRoomIsDropped) {
    // Someone publishing another room's payload on this channel.
    auto rogue = hub_.CreateChannel(CallChannel::ChannelName("call-", "room-1"), &queue_u1_);
    queue_u1_.Sync([&](){ rogue->Subscribe(nullptr); });
    Drain();
    queue_u1_.Sync([&](){
        rogue->Send(kOfferEvent, Serialize(Offer{"u1", "u2", "room-2", "sdp"}));
        rogue->Send(kAnswerEvent, "garbage");
    });
    Drain();
    EXPECT_TRUE(observer_u2_->offers.empty());
    EXPECT_TRUE(observer_u2_->answers.empty());
    queue_u1_.Sync([&](){ rogue->Unsubscribe(); });
}

MY_TEST_F(CallChannelTest, NothingIsDeliveredAfterUnsubscribe) {
    queue_u2_.Sync([this](){ 
        u2_->Unsubscribe(); 
        u2_->Unsubscribe(); 
    });
    queue_u1_.Sync([this](){
        u1_->SendAnswer("u2", "answer");
    });
    Drain();
    EXPECT_TRUE(observer_u2_->answers.empty());
}

} // namespace test
} // namespace signaling
} // namespace naivecall
