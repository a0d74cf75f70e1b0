#include "signaling/signaling_message.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace signaling {
namespace test {

MY_TEST(SignalingMessageTest, InviteWireFormat) {
    Invite invite;
    invite.from = "u1";
    invite.to = "u2";
    invite.chat_room_id = "room-1";
    invite.call_type = CallType::VIDEO;
    invite.participants = {"u1", "u2", "u3"};
    invite.timestamp = 1700000000000;

    SignalingMessage message = invite;
    EXPECT_EQ(EventName(message), "incoming-call");

    auto json_message = ToJson(message);
    EXPECT_EQ(json_message["chatRoomId"], "room-1");
    EXPECT_EQ(json_message["callType"], "video");
    EXPECT_EQ(json_message["from"], "u1");
    EXPECT_EQ(json_message["to"], "u2");
    EXPECT_EQ(json_message["participants"].size(), 3u);
    EXPECT_EQ(json_message["timestamp"], 1700000000000);
}

MY_TEST(SignalingMessageTest, ParseInviteWithStringTimestamp) {
    const std::string numeric = R"({"chatRoomId": "room-1", "callType": "voice", "from": "u1", "to": "u2",
                                    "timestamp": "1700000000000"})";
    auto message = Parse(kIncomingCallEvent, numeric);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(std::get<Invite>(*message).timestamp, 1700000000000);
    EXPECT_TRUE(std::get<Invite>(*message).timestamp_text.empty());

    const std::string iso = R"({"chatRoomId": "room-1", "callType": "voice", "from": "u1", "to": "u2",
                                "timestamp": "2026-10-18T09:30:00.000Z"})";
    message = Parse(kIncomingCallEvent, iso);
    ASSERT_TRUE(message.has_value());
    const auto& invite = std::get<Invite>(*message);
    EXPECT_EQ(invite.timestamp, 0);
    EXPECT_EQ(invite.timestamp_text, "2026-10-18T09:30:00.000Z");
    EXPECT_EQ(ToJson(invite)["timestamp"], "2026-10-18T09:30:00.000Z");
}

MY_TEST(SignalingMessageTest, ParseBrowserShapedOffer) {
    const std::string payload = R"({
        "offer": {"type": "offer", "sdp": "v=0 remote-offer"},
        "from": "u2",
        "to": "u1",
        "chatRoomId": "room-1"
    })";
    auto message = Parse(kOfferEvent, payload);
    ASSERT_TRUE(message.has_value());
    ASSERT_TRUE(std::holds_alternative<Offer>(*message));
    const auto& offer = std::get<Offer>(*message);
    EXPECT_EQ(offer.sdp, "v=0 remote-offer");
    EXPECT_EQ(Sender(*message), "u2");
    EXPECT_EQ(Recipient(*message).value(), "u1");
    EXPECT_EQ(ChatRoomId(*message), "room-1");
}

MY_TEST(SignalingMessageTest, ParseBrowserShapedCandidate) {
    const std::string payload = R"({
        "candidate": {"candidate": "candidate:1 1 UDP 2122252543 10.0.0.2 50000 typ host", 
                      "sdpMid": "0", 
                      "sdpMLineIndex": 0},
        "from": "u2",
        "to": "u1",
        "chatRoomId": "room-1"
    })";
    auto message = Parse(kIceCandidateEvent, payload);
    ASSERT_TRUE(message.has_value());
    const auto& ice = std::get<IceCandidate>(*message);
    EXPECT_EQ(ice.candidate.mid, "0");
    EXPECT_EQ(ice.candidate.mline_index, 0);
    EXPECT_EQ(ice.candidate.sdp, "candidate:1 1 UDP 2122252543 10.0.0.2 50000 typ host");
}

MY_TEST(SignalingMessageTest, CallEndedHasNoRecipient) {
    SignalingMessage message = CallEnded{"u1", "room-1"};
    EXPECT_EQ(EventName(message), "call-ended");
    EXPECT_FALSE(Recipient(message).has_value());

    auto parsed = Parse(kCallEndedEvent, Serialize(message));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::get<CallEnded>(*parsed).from, "u1");
}

MY_TEST(SignalingMessageTest, AnswerWithMismatchedTypeIsDropped) {
    const std::string payload = R"({
        "answer": {"type": "offer", "sdp": "v=0"},
        "from": "u2", "to": "u1", "chatRoomId": "room-1"
    })";
    EXPECT_FALSE(Parse(kAnswerEvent, payload).has_value());
}

MY_TEST(SignalingMessageTest, MalformedPayloadsAreDropped) {
    EXPECT_FALSE(Parse(kOfferEvent, "not json").has_value());
    EXPECT_FALSE(Parse(kOfferEvent, "[1, 2]").has_value());
    EXPECT_FALSE(Parse(kOfferEvent, R"({"from": "u2", "to": "u1", "chatRoomId": "r"})").has_value());
    EXPECT_FALSE(Parse(kCallCancelledEvent, R"({"from": "", "to": "u1", "chatRoomId": "r"})").has_value());
    EXPECT_FALSE(Parse(kIncomingCallEvent, R"({"from": "u1", "to": "u2", "chatRoomId": "r", "callType": "fax"})").has_value());
}

MY_TEST(SignalingMessageTest, UnknownEventIsDropped) {
    EXPECT_FALSE(Parse("presence", R"({"from": "u1"})").has_value());
}

} // namespace test
} // namespace signaling
} // namespace naivecall
