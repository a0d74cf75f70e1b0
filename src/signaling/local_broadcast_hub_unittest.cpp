#include "signaling/local_broadcast_hub.hpp"
#include "common/task_queue.hpp"
#include "testing/queue_helpers.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace signaling {
namespace test {

using naivecall::test::DrainQueues;

class T(LocalBroadcastHubTest) : public ::testing::Test {
protected:
    T(LocalBroadcastHubTest)() 
        : queue_a_("LocalBroadcastHubTest.a"),
          queue_b_("LocalBroadcastHubTest.b") {}

    void SubscribeSync(std::shared_ptr<BroadcastChannel> channel, TaskQueue* task_queue) {
        boost::system::error_code result = boost::asio::error::would_block;
        task_queue->Sync([&](){
            channel->Subscribe([&result](boost::system::error_code ec){
                result = ec;
            });
        });
        DrainQueues({&queue_a_, &queue_b_});
        EXPECT_FALSE(result);
    }

    LocalBroadcastHub hub_;
    TaskQueue queue_a_;
    TaskQueue queue_b_;
};

MY_TEST_F(LocalBroadcastHubTest, DeliversToSubscribersButNotSender) {
    auto sender = hub_.CreateChannel("call-room", &queue_a_);
    auto receiver = hub_.CreateChannel("call-room", &queue_b_);

    std::vector<std::string> sender_received;
    std::vector<std::string> receiver_received;
    queue_a_.Sync([&](){
        sender->On("offer", [&](const std::string& payload){ sender_received.push_back(payload); });
    });
    queue_b_.Sync([&](){
        receiver->On("offer", [&](const std::string& payload){ receiver_received.push_back(payload); });
        receiver->On("answer", [&](const std::string& payload){ receiver_received.push_back("answer:" + payload); });
    });
    SubscribeSync(sender, &queue_a_);
    SubscribeSync(receiver, &queue_b_);
    EXPECT_EQ(hub_.subscriber_count("call-room"), 2u);

    queue_a_.Sync([&](){
        sender->Send("offer", "p1");
        sender->Send("offer", "p2");
    });
    DrainQueues({&queue_a_, &queue_b_});

    EXPECT_TRUE(sender_received.empty());
    ASSERT_EQ(receiver_received.size(), 2u);
    EXPECT_EQ(receiver_received[0], "p1");
    EXPECT_EQ(receiver_received[1], "p2");
}

MY_TEST_F(LocalBroadcastHubTest, MessagesBeforeAcknowledgementAreLost) {
    auto sender = hub_.CreateChannel("call-room", &queue_a_);
    auto late = hub_.CreateChannel("call-room", &queue_b_);
    std::vector<std::string> received;
    queue_b_.Sync([&](){
        late->On("offer", [&](const std::string& payload){ received.push_back(payload); });
    });
    SubscribeSync(sender, &queue_a_);

    queue_a_.Sync([&](){
        sender->Send("offer", "early");
    });
    DrainQueues({&queue_a_, &queue_b_});
    SubscribeSync(late, &queue_b_);
    queue_a_.Sync([&](){
        sender->Send("offer", "late");
    });
    DrainQueues({&queue_a_, &queue_b_});

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], "late");
}

MY_TEST_F(LocalBroadcastHubTest, SendOnUnsubscribedChannelThrows) {
    auto channel = hub_.CreateChannel("call-room", &queue_a_);
    EXPECT_THROW(channel->Send("offer", "{}"), std::runtime_error);
}

MY_TEST_F(LocalBroadcastHubTest, SendFilterFailsThePublish) {
    auto channel = hub_.CreateChannel("call-invites", &queue_a_);
    SubscribeSync(channel, &queue_a_);
    hub_.set_send_filter([](const std::string&, const std::string&, const std::string& payload){
        return payload != "reject";
    });
    EXPECT_THROW(channel->Send("incoming-call", "reject"), std::runtime_error);
    EXPECT_NO_THROW(channel->Send("incoming-call", "accept"));
}

MY_TEST_F(LocalBroadcastHubTest, UnsubscribeIsIdempotent) {
    auto channel = hub_.CreateChannel("call-room", &queue_a_);
    // Never subscribed
    EXPECT_NO_THROW(channel->Unsubscribe());
    EXPECT_NO_THROW(channel->Unsubscribe());
    EXPECT_FALSE(channel->is_subscribed());

    auto other = hub_.CreateChannel("call-room", &queue_a_);
    SubscribeSync(other, &queue_a_);
    EXPECT_EQ(hub_.subscriber_count("call-room"), 1u);
    other->Unsubscribe();
    other->Unsubscribe();
    EXPECT_EQ(hub_.subscriber_count("call-room"), 0u);
}

MY_TEST_F(LocalBroadcastHubTest, UnsubscribeBeforeAcknowledgement) {
    auto channel = hub_.CreateChannel("call-room", &queue_a_);
    boost::system::error_code result;
    queue_a_.Sync([&](){
        channel->Subscribe([&result](boost::system::error_code ec){
            result = ec;
        });
        channel->Unsubscribe();
    });
    DrainQueues({&queue_a_});
    EXPECT_EQ(result, boost::asio::error::operation_aborted);
    EXPECT_EQ(hub_.subscriber_count("call-room"), 0u);
}

} // namespace test
} // namespace signaling
} // namespace naivecall
