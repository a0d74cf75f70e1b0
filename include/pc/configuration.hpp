#ifndef _PC_CONFIGURATION_H_
#define _PC_CONFIGURATION_H_

#include "base/defines.hpp"

#include <string>
#include <vector>

namespace naivecall {

// IceServer
struct NAIVECALL_CPP_EXPORT IceServer {
    enum class Type { STUN, TURN };
    enum class RelayType { TURN_UDP, TURN_TCP, TURN_TLS };

    // eg: stun:stun.l.google.com:19302
    // eg: turn:user:password@192.158.29.39:3478?transport=udp
    IceServer(const std::string& url);

    // STUN
    IceServer(std::string host_name, uint16_t port);

    // TURN
    IceServer(std::string host_name, uint16_t port, std::string username, std::string password, RelayType relay_type = RelayType::TURN_UDP);

    std::string host_name() const { return host_name_; }
    uint16_t port() const { return port_; }
    Type type() const { return type_; }
    RelayType relay_type() const { return relay_type_; }
    std::string username() const { return username_; }
    std::string password() const { return password_; }

    void set_username(std::string username) { username_ = std::move(username); }
    void set_password(std::string password) { password_ = std::move(password); }

    operator std::string() const;

private:
    std::string host_name_;
    uint16_t port_;
    Type type_;
    std::string username_;
    std::string password_;
    RelayType relay_type_ = RelayType::TURN_UDP;
};

// RtcConfiguration handed to the media engine for every peer transport.
struct NAIVECALL_CPP_EXPORT RtcConfiguration {
    std::vector<IceServer> ice_servers;

    static RtcConfiguration Default();
};

} // namespace naivecall

#endif
