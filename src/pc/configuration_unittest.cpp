#include "pc/configuration.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace naivecall {
namespace test {

MY_TEST(IceServerTest, CreateFromStunURL) {
    const std::string url = "stun:stun.l.google.com:19302";
    IceServer ice_server(url);

    EXPECT_EQ(ice_server.host_name(), "stun.l.google.com");
    EXPECT_EQ(ice_server.port(), 19302);
    EXPECT_EQ(ice_server.type(), IceServer::Type::STUN);
}

MY_TEST(IceServerTest, CreateFromTurnURL) {
    const std::string url = "turn:192.158.29.39:3478?transport=udp";
    IceServer ice_server(url);

    EXPECT_EQ(ice_server.host_name(), "192.158.29.39");
    EXPECT_EQ(ice_server.port(), 3478);
    EXPECT_EQ(ice_server.type(), IceServer::Type::TURN);
    EXPECT_EQ(ice_server.relay_type(), IceServer::RelayType::TURN_UDP);
}

MY_TEST(IceServerTest, CreateFromTurnURLWithCredentials) {
    IceServer ice_server("turn:alice:secret@turn.example.org?transport=tcp");

    EXPECT_EQ(ice_server.username(), "alice");
    EXPECT_EQ(ice_server.password(), "secret");
    EXPECT_EQ(ice_server.port(), 3478);
    EXPECT_EQ(ice_server.relay_type(), IceServer::RelayType::TURN_TCP);
}

MY_TEST(IceServerTest, TurnsDefaultsToTlsPort) {
    IceServer ice_server("turns:turn.example.org");

    EXPECT_EQ(ice_server.type(), IceServer::Type::TURN);
    EXPECT_EQ(ice_server.relay_type(), IceServer::RelayType::TURN_TLS);
    EXPECT_EQ(ice_server.port(), 5349);
}

MY_TEST(IceServerTest, RejectsUnknownScheme) {
    EXPECT_THROW(IceServer("http:example.org:80"), std::invalid_argument);
}

MY_TEST(IceServerTest, RejectsInvalidPort) {
    EXPECT_THROW(IceServer("stun:stun.example.org:port"), std::invalid_argument);
}

MY_TEST(IceServerTest, RejectsUnsupportedTransport) {
    EXPECT_THROW(IceServer("turn:turn.example.org?transport=sctp"), std::invalid_argument);
}

MY_TEST(IceServerTest, RejectsMissingHost) {
    EXPECT_THROW(IceServer("stun::3478"), std::invalid_argument);
    EXPECT_THROW(IceServer("stun.example.org"), std::invalid_argument);
}

MY_TEST(IceServerTest, TurnToStringKeepsTransport) {
    IceServer ice_server("turn:alice:secret@turn.example.org:3479?transport=tcp");
    EXPECT_EQ(std::string(ice_server), "turn:turn.example.org:3479?transport=tcp");
}

MY_TEST(IceServerTest, ToString) {
    IceServer ice_server("stun:stun.l.google.com:19302");
    EXPECT_EQ(std::string(ice_server), "stun:stun.l.google.com:19302");
}

MY_TEST(RtcConfigurationTest, DefaultIceServers) {
    auto config = RtcConfiguration::Default();
    ASSERT_EQ(config.ice_servers.size(), 2u);
    EXPECT_EQ(config.ice_servers[0].host_name(), "stun.l.google.com");
    EXPECT_EQ(config.ice_servers[1].host_name(), "stun1.l.google.com");
}

} // namespace test
} // namespace naivecall
