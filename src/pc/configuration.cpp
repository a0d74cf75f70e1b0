#include "pc/configuration.hpp"

#include <sstream>
#include <stdexcept>

namespace naivecall {
namespace {

uint16_t ParsePort(const std::string& service) {
    size_t pos = 0;
    unsigned long port = 0;
    try {
        port = std::stoul(service, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid ICE server port: " + service);
    }
    if (pos != service.size() || port == 0 || port > 65535) {
        throw std::invalid_argument("Invalid ICE server port: " + service);
    }
    return static_cast<uint16_t>(port);
}

} // namespace

IceServer::IceServer(const std::string& url) : relay_type_(RelayType::TURN_UDP) {
    const size_t scheme_end = url.find(':');
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("Invalid Ice server url: " + url);
    }
    const std::string scheme = url.substr(0, scheme_end);
    if (scheme == "stun" || scheme == "STUN") {
        type_ = Type::STUN;
    } else if (scheme == "turn" || scheme == "TURN") {
        type_ = Type::TURN;
    } else if (scheme == "turns" || scheme == "TURNS") {
        type_ = Type::TURN;
        relay_type_ = RelayType::TURN_TLS;
    } else {
        throw std::invalid_argument("Unknown Ice Server protocol: " + scheme);
    }

    std::string rest = url.substr(scheme_end + 1);
    const size_t query_pos = rest.find('?');
    if (query_pos != std::string::npos) {
        const std::string query = rest.substr(query_pos + 1);
        rest.erase(query_pos);
        if (query == "transport=udp") {
            relay_type_ = RelayType::TURN_UDP;
        } else if (query == "transport=tcp") {
            relay_type_ = RelayType::TURN_TCP;
        } else {
            throw std::invalid_argument("Unsupported Ice server transport: " + query);
        }
    }

    // user:password@host:port
    const size_t at_pos = rest.rfind('@');
    if (at_pos != std::string::npos) {
        const std::string credentials = rest.substr(0, at_pos);
        rest.erase(0, at_pos + 1);
        const size_t colon = credentials.find(':');
        username_ = credentials.substr(0, colon);
        if (colon != std::string::npos) {
            password_ = credentials.substr(colon + 1);
        }
    }

    const size_t port_pos = rest.find(':');
    host_name_ = rest.substr(0, port_pos);
    if (host_name_.empty()) {
        throw std::invalid_argument("Invalid Ice server url: " + url);
    }
    if (port_pos != std::string::npos) {
        port_ = ParsePort(rest.substr(port_pos + 1));
    } else {
        port_ = relay_type_ == RelayType::TURN_TLS ? 5349 : 3478;
    }
}

IceServer::IceServer(std::string host_name, uint16_t port) 
    : host_name_(std::move(host_name)), port_(port), type_(Type::STUN) {}

IceServer::IceServer(std::string host_name, uint16_t port, std::string username, std::string password, RelayType relay_type) 
    : host_name_(std::move(host_name)), 
      port_(port), 
      type_(Type::TURN), 
      username_(std::move(username)), 
      password_(std::move(password)), 
      relay_type_(relay_type) {}

IceServer::operator std::string() const {
    std::ostringstream oss;
    if (type_ == Type::STUN) {
        oss << "stun:";
    } else {
        oss << (relay_type_ == RelayType::TURN_TLS ? "turns:" : "turn:");
    }
    oss << host_name_ << ":" << port_;
    if (type_ == Type::TURN && relay_type_ != RelayType::TURN_TLS) {
        oss << (relay_type_ == RelayType::TURN_TCP ? "?transport=tcp" : "?transport=udp");
    }
    return oss.str();
}

RtcConfiguration RtcConfiguration::Default() {
    RtcConfiguration config;
    config.ice_servers.emplace_back("stun:stun.l.google.com:19302");
    config.ice_servers.emplace_back("stun:stun1.l.google.com:19302");
    return config;
}

} // namespace naivecall
