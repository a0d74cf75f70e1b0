#ifndef _CALL_CALL_CONFIGURATION_H_
#define _CALL_CALL_CONFIGURATION_H_

#include "base/defines.hpp"
#include "common/logger.hpp"
#include "pc/configuration.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace naivecall {

// CallConfiguration
struct NAIVECALL_CPP_EXPORT CallConfiguration {
    std::string local_user_id;

    std::string invites_channel_name = "call-invites";
    // The channel of a call is named `call_channel_prefix` + chat room id.
    std::string call_channel_prefix = "call-";

    RtcConfiguration rtc_config = RtcConfiguration::Default();

    // 0 disables offer retransmission.
    TimeInterval offer_retransmit_interval_ms = 2000;
    int max_offer_retransmits = 15;

    // Push notification
    std::string voice_call_title = "Incoming voice call";
    std::string video_call_title = "Incoming video call";
    std::string push_body = "Tap to answer";
    std::string push_tag_prefix = "chat-";

    logging::Level log_level = logging::Level::INFO;

    // Throws std::invalid_argument.
    void Validate() const;

    // Absent keys keep their defaults. Throws std::invalid_argument on 
    // malformed or invalid input.
    static CallConfiguration FromJson(const nlohmann::json& json_config);
    static CallConfiguration Parse(const std::string& json_text);
};

} // namespace naivecall

#endif
