#include "call/call_configuration.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace naivecall {
namespace {

using json = nlohmann::json;

template<typename T>
void ReadIfPresent(const json& json_object, const char* key, T& value) {
    auto it = json_object.find(key);
    if (it != json_object.end() && !it->is_null()) {
        value = it->get<T>();
    }
}

} // namespace

void CallConfiguration::Validate() const {
    if (local_user_id.empty()) {
        throw std::invalid_argument("Local user id is required.");
    }
    if (invites_channel_name.empty()) {
        throw std::invalid_argument("Invites channel name must not be empty.");
    }
    if (call_channel_prefix.empty()) {
        throw std::invalid_argument("Call channel prefix must not be empty.");
    }
    if (call_channel_prefix == invites_channel_name) {
        throw std::invalid_argument("Call channel prefix collides with the invites channel.");
    }
    if (offer_retransmit_interval_ms < 0) {
        throw std::invalid_argument("Offer retransmission interval must not be negative.");
    }
    if (max_offer_retransmits < 0) {
        throw std::invalid_argument("Max offer retransmissions must not be negative.");
    }
}

CallConfiguration CallConfiguration::FromJson(const json& json_config) {
    if (!json_config.is_object()) {
        throw std::invalid_argument("Call configuration must be a JSON object.");
    }
    CallConfiguration config;
    try {
        ReadIfPresent(json_config, "local_user_id", config.local_user_id);
        ReadIfPresent(json_config, "invites_channel", config.invites_channel_name);
        ReadIfPresent(json_config, "call_channel_prefix", config.call_channel_prefix);
        ReadIfPresent(json_config, "offer_retransmit_interval_ms", config.offer_retransmit_interval_ms);
        ReadIfPresent(json_config, "max_offer_retransmits", config.max_offer_retransmits);

        auto ice_servers = json_config.find("ice_servers");
        if (ice_servers != json_config.end()) {
            config.rtc_config.ice_servers.clear();
            for (const auto& url : *ice_servers) {
                config.rtc_config.ice_servers.emplace_back(url.get<std::string>());
            }
        }

        auto push = json_config.find("push");
        if (push != json_config.end() && push->is_object()) {
            ReadIfPresent(*push, "voice_title", config.voice_call_title);
            ReadIfPresent(*push, "video_title", config.video_call_title);
            ReadIfPresent(*push, "body", config.push_body);
            ReadIfPresent(*push, "tag_prefix", config.push_tag_prefix);
        }

        auto log_level = json_config.find("log_level");
        if (log_level != json_config.end()) {
            config.log_level = logging::LevelFromString(log_level->get<std::string>());
        }
    } catch (const json::exception& exp) {
        throw std::invalid_argument(std::string("Malformed call configuration: ") + exp.what());
    }
    config.Validate();
    PLOG_DEBUG << "Call configuration for " << config.local_user_id << " with " 
               << config.rtc_config.ice_servers.size() << " ICE servers";
    return config;
}

CallConfiguration CallConfiguration::Parse(const std::string& json_text) {
    json json_config;
    try {
        json_config = json::parse(json_text);
    } catch (const json::parse_error& exp) {
        throw std::invalid_argument(std::string("Invalid call configuration JSON: ") + exp.what());
    }
    return FromJson(json_config);
}

} // namespace naivecall
