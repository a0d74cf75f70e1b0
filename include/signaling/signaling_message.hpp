#ifndef _SIGNALING_SIGNALING_MESSAGE_H_
#define _SIGNALING_SIGNALING_MESSAGE_H_

#include "base/defines.hpp"
#include "pc/candidate.hpp"

// nlohmann/json
#include <nlohmann/json.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace naivecall {
namespace signaling {

enum class CallType {
    VOICE,
    VIDEO
};

NAIVECALL_CPP_EXPORT std::string ToString(CallType call_type);
NAIVECALL_CPP_EXPORT std::optional<CallType> CallTypeFromString(const std::string& str);
NAIVECALL_CPP_EXPORT std::ostream& operator<<(std::ostream& out, CallType call_type);

// Broadcast event names
constexpr char kIncomingCallEvent[] = "incoming-call";
constexpr char kCallCancelledEvent[] = "call-cancelled";
constexpr char kOfferEvent[] = "offer";
constexpr char kAnswerEvent[] = "answer";
constexpr char kIceCandidateEvent[] = "ice-candidate";
constexpr char kCallEndedEvent[] = "call-ended";

// Sent over the invites channel.
struct NAIVECALL_CPP_EXPORT Invite {
    std::string from;
    std::string to;
    std::string chat_room_id;
    CallType call_type = CallType::VOICE;
    // All participants including the caller.
    std::vector<std::string> participants;
    // Milliseconds since epoch, UTC.
    int64_t timestamp = 0;
    // Non-numeric timestamp as sent, eg an ISO 8601 date.
    std::string timestamp_text;
};

struct NAIVECALL_CPP_EXPORT CallCancelled {
    std::string from;
    std::string to;
    std::string chat_room_id;
};

// Sent over the per-call channel.
struct NAIVECALL_CPP_EXPORT Offer {
    std::string from;
    std::string to;
    std::string chat_room_id;
    std::string sdp;
};

struct NAIVECALL_CPP_EXPORT Answer {
    std::string from;
    std::string to;
    std::string chat_room_id;
    std::string sdp;
};

struct NAIVECALL_CPP_EXPORT IceCandidate {
    std::string from;
    std::string to;
    std::string chat_room_id;
    Candidate candidate;
};

struct NAIVECALL_CPP_EXPORT CallEnded {
    std::string from;
    std::string chat_room_id;
};

using SignalingMessage = std::variant<Invite, CallCancelled, Offer, Answer, IceCandidate, CallEnded>;

NAIVECALL_CPP_EXPORT std::string EventName(const SignalingMessage& message);
NAIVECALL_CPP_EXPORT const std::string& Sender(const SignalingMessage& message);
// CallEnded is addressed to everyone on the call channel.
NAIVECALL_CPP_EXPORT std::optional<std::string> Recipient(const SignalingMessage& message);
NAIVECALL_CPP_EXPORT const std::string& ChatRoomId(const SignalingMessage& message);

NAIVECALL_CPP_EXPORT nlohmann::json ToJson(const SignalingMessage& message);
NAIVECALL_CPP_EXPORT std::string Serialize(const SignalingMessage& message);

// Returns std::nullopt for unknown events and malformed payloads.
NAIVECALL_CPP_EXPORT std::optional<SignalingMessage> Parse(const std::string& event, const std::string& payload);

} // namespace signaling
} // namespace naivecall

#endif
