#include "signaling/signaling_message.hpp"

#include <plog/Log.h>

#include <stdexcept>
#include <string>

namespace naivecall {
namespace signaling {

using json = nlohmann::json;

namespace {

std::string RequireString(const json& json_message, const char* key) {
    auto it = json_message.find(key);
    if (it == json_message.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("Missing string field: ") + key);
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        throw std::invalid_argument(std::string("Empty field: ") + key);
    }
    return value;
}

std::string ParseSdp(const json& json_message, const char* key, const char* expected_type) {
    auto it = json_message.find(key);
    if (it == json_message.end()) {
        throw std::invalid_argument(std::string("Missing description: ") + key);
    }
    // Accept a bare sdp string as well as the {type, sdp} object browsers send.
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("Invalid description: ") + key);
    }
    if (it->contains("type") && (*it)["type"] != expected_type) {
        throw std::invalid_argument(std::string("Unexpected description type in ") + key);
    }
    return RequireString(*it, "sdp");
}

Candidate ParseCandidate(const json& json_message) {
    auto it = json_message.find("candidate");
    if (it == json_message.end() || !it->is_object()) {
        throw std::invalid_argument("Missing candidate");
    }
    Candidate candidate;
    candidate.sdp = RequireString(*it, "candidate");
    if (it->contains("sdpMid") && (*it)["sdpMid"].is_string()) {
        candidate.mid = (*it)["sdpMid"].get<std::string>();
    }
    if (it->contains("sdpMLineIndex") && (*it)["sdpMLineIndex"].is_number_integer()) {
        candidate.mline_index = (*it)["sdpMLineIndex"].get<int>();
    }
    return candidate;
}

void ParseTimestamp(const json& json_timestamp, Invite& invite) {
    if (json_timestamp.is_number()) {
        invite.timestamp = json_timestamp.get<int64_t>();
    } else if (json_timestamp.is_string()) {
        const auto text = json_timestamp.get<std::string>();
        size_t pos = 0;
        try {
            invite.timestamp = std::stoll(text, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
        if (pos == 0 || pos != text.size()) {
            invite.timestamp = 0;
            invite.timestamp_text = text;
        }
    } else if (!json_timestamp.is_null()) {
        throw std::invalid_argument("Invalid timestamp");
    }
}

} // namespace

std::string ToString(CallType call_type) {
    switch (call_type) {
    case CallType::VOICE:
        return "voice";
    case CallType::VIDEO:
        return "video";
    default:
        return "unknown";
    }
}

std::optional<CallType> CallTypeFromString(const std::string& str) {
    if (str == "voice") {
        return CallType::VOICE;
    } else if (str == "video") {
        return CallType::VIDEO;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& out, CallType call_type) {
    out << ToString(call_type);
    return out;
}

std::string EventName(const SignalingMessage& message) {
    return std::visit(overloaded {
        [](const Invite&) { return std::string(kIncomingCallEvent); },
        [](const CallCancelled&) { return std::string(kCallCancelledEvent); },
        [](const Offer&) { return std::string(kOfferEvent); },
        [](const Answer&) { return std::string(kAnswerEvent); },
        [](const IceCandidate&) { return std::string(kIceCandidateEvent); },
        [](const CallEnded&) { return std::string(kCallEndedEvent); }
    }, message);
}

const std::string& Sender(const SignalingMessage& message) {
    return std::visit([](const auto& msg) -> const std::string& {
        return msg.from;
    }, message);
}

std::optional<std::string> Recipient(const SignalingMessage& message) {
    return std::visit(overloaded {
        [](const CallEnded&) -> std::optional<std::string> { return std::nullopt; },
        [](const auto& msg) -> std::optional<std::string> { return msg.to; }
    }, message);
}

const std::string& ChatRoomId(const SignalingMessage& message) {
    return std::visit([](const auto& msg) -> const std::string& {
        return msg.chat_room_id;
    }, message);
}

json ToJson(const SignalingMessage& message) {
    return std::visit(overloaded {
        [](const Invite& invite) {
            json json_invite {
                {"chatRoomId", invite.chat_room_id},
                {"callType", ToString(invite.call_type)},
                {"from", invite.from},
                {"to", invite.to},
                {"participants", invite.participants}
            };
            if (invite.timestamp_text.empty()) {
                json_invite["timestamp"] = invite.timestamp;
            } else {
                json_invite["timestamp"] = invite.timestamp_text;
            }
            return json_invite;
        },
        [](const CallCancelled& cancelled) {
            return json {
                {"chatRoomId", cancelled.chat_room_id},
                {"from", cancelled.from},
                {"to", cancelled.to}
            };
        },
        [](const Offer& offer) {
            return json {
                {"offer", {{"type", "offer"}, {"sdp", offer.sdp}}},
                {"from", offer.from},
                {"to", offer.to},
                {"chatRoomId", offer.chat_room_id}
            };
        },
        [](const Answer& answer) {
            return json {
                {"answer", {{"type", "answer"}, {"sdp", answer.sdp}}},
                {"from", answer.from},
                {"to", answer.to},
                {"chatRoomId", answer.chat_room_id}
            };
        },
        [](const IceCandidate& ice) {
            return json {
                {"candidate", {{"candidate", ice.candidate.sdp},
                               {"sdpMid", ice.candidate.mid},
                               {"sdpMLineIndex", ice.candidate.mline_index}}},
                {"from", ice.from},
                {"to", ice.to},
                {"chatRoomId", ice.chat_room_id}
            };
        },
        [](const CallEnded& ended) {
            return json {
                {"from", ended.from},
                {"chatRoomId", ended.chat_room_id}
            };
        }
    }, message);
}

std::string Serialize(const SignalingMessage& message) {
    return ToJson(message).dump();
}

std::optional<SignalingMessage> Parse(const std::string& event, const std::string& payload) {
    try {
        auto json_message = json::parse(payload);
        if (!json_message.is_object()) {
            throw std::invalid_argument("Payload is not an object");
        }
        if (event == kIncomingCallEvent) {
            Invite invite;
            invite.chat_room_id = RequireString(json_message, "chatRoomId");
            invite.from = RequireString(json_message, "from");
            invite.to = RequireString(json_message, "to");
            auto call_type = CallTypeFromString(RequireString(json_message, "callType"));
            if (!call_type) {
                throw std::invalid_argument("Unknown call type");
            }
            invite.call_type = *call_type;
            if (json_message.contains("participants") && json_message["participants"].is_array()) {
                invite.participants = json_message["participants"].get<std::vector<std::string>>();
            }
            if (json_message.contains("timestamp")) {
                ParseTimestamp(json_message["timestamp"], invite);
            }
            return invite;
        } else if (event == kCallCancelledEvent) {
            CallCancelled cancelled;
            cancelled.chat_room_id = RequireString(json_message, "chatRoomId");
            cancelled.from = RequireString(json_message, "from");
            cancelled.to = RequireString(json_message, "to");
            return cancelled;
        } else if (event == kOfferEvent) {
            Offer offer;
            offer.sdp = ParseSdp(json_message, "offer", "offer");
            offer.from = RequireString(json_message, "from");
            offer.to = RequireString(json_message, "to");
            offer.chat_room_id = RequireString(json_message, "chatRoomId");
            return offer;
        } else if (event == kAnswerEvent) {
            Answer answer;
            answer.sdp = ParseSdp(json_message, "answer", "answer");
            answer.from = RequireString(json_message, "from");
            answer.to = RequireString(json_message, "to");
            answer.chat_room_id = RequireString(json_message, "chatRoomId");
            return answer;
        } else if (event == kIceCandidateEvent) {
            IceCandidate ice;
            ice.candidate = ParseCandidate(json_message);
            ice.from = RequireString(json_message, "from");
            ice.to = RequireString(json_message, "to");
            ice.chat_room_id = RequireString(json_message, "chatRoomId");
            return ice;
        } else if (event == kCallEndedEvent) {
            CallEnded ended;
            ended.from = RequireString(json_message, "from");
            ended.chat_room_id = RequireString(json_message, "chatRoomId");
            return ended;
        }
        PLOG_DEBUG << "Ignore unknown signaling event: " << event;
    } catch (const json::exception& exp) {
        PLOG_DEBUG << "Drop malformed " << event << " payload: " << exp.what();
    } catch (const std::invalid_argument& exp) {
        PLOG_DEBUG << "Drop invalid " << event << " payload: " << exp.what();
    }
    return std::nullopt;
}

} // namespace signaling
} // namespace naivecall
