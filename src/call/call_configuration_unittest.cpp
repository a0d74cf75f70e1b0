#include "call/call_configuration.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace test {

MY_TEST(CallConfigurationTest, Defaults) {
    CallConfiguration config;
    EXPECT_EQ(config.invites_channel_name, "call-invites");
    EXPECT_EQ(config.call_channel_prefix, "call-");
    EXPECT_EQ(config.offer_retransmit_interval_ms, 2000);
    EXPECT_EQ(config.max_offer_retransmits, 15);
    EXPECT_EQ(config.push_tag_prefix, "chat-");
    ASSERT_EQ(config.rtc_config.ice_servers.size(), 2u);
    EXPECT_EQ(config.rtc_config.ice_servers[0].host_name(), "stun.l.google.com");
    // A local user id is mandatory.
    EXPECT_THROW(config.Validate(), std::invalid_argument);
    config.local_user_id = "u1";
    EXPECT_NO_THROW(config.Validate());
}

MY_TEST(CallConfigurationTest, ParseOverridesOnlyPresentKeys) {
    auto config = CallConfiguration::Parse(R"({
        "local_user_id": "alice",
        "ice_servers": ["stun:stun.example.org:3478", "turn:bob:secret@turn.example.org:3478"],
        "offer_retransmit_interval_ms": 500,
        "push": { "body": "Swipe to answer" },
        "log_level": "debug"
    })");
    EXPECT_EQ(config.local_user_id, "alice");
    ASSERT_EQ(config.rtc_config.ice_servers.size(), 2u);
    EXPECT_EQ(config.rtc_config.ice_servers[1].type(), IceServer::Type::TURN);
    EXPECT_EQ(config.rtc_config.ice_servers[1].username(), "bob");
    EXPECT_EQ(config.offer_retransmit_interval_ms, 500);
    EXPECT_EQ(config.max_offer_retransmits, 15);
    EXPECT_EQ(config.push_body, "Swipe to answer");
    EXPECT_EQ(config.video_call_title, "Incoming video call");
    EXPECT_EQ(config.log_level, logging::Level::DEBUG);
}

MY_TEST(CallConfigurationTest, InvalidInputIsRejected) {
    EXPECT_THROW(CallConfiguration::Parse("{not json"), std::invalid_argument);
    EXPECT_THROW(CallConfiguration::Parse("[]"), std::invalid_argument);
    EXPECT_THROW(CallConfiguration::Parse(R"({"local_user_id": 42})"), std::invalid_argument);
    EXPECT_THROW(CallConfiguration::Parse(R"({"local_user_id": "a", "ice_servers": ["ftp://x"]})"), std::invalid_argument);
    EXPECT_THROW(CallConfiguration::Parse(R"({"local_user_id": "a", "log_level": "loud"})"), std::invalid_argument);
    EXPECT_THROW(CallConfiguration::Parse(R"({"local_user_id": "a", "max_offer_retransmits": -1})"), std::invalid_argument);
    EXPECT_THROW(CallConfiguration::Parse(R"({"local_user_id": "a", "invites_channel": ""})"), std::invalid_argument);
}

} // namespace test
} // namespace naivecall
