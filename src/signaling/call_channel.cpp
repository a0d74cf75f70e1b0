#include "signaling/call_channel.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace naivecall {
namespace signaling {

std::string CallChannel::ChannelName(const std::string& prefix, const std::string& chat_room_id) {
    return prefix + chat_room_id;
}

CallChannel::CallChannel(std::shared_ptr<BroadcastChannel> channel, 
                         std::string chat_room_id, 
                         std::string local_user_id,
                         std::weak_ptr<Observer> observer) 
    : channel_(std::move(channel)),
      chat_room_id_(std::move(chat_room_id)),
      local_user_id_(std::move(local_user_id)),
      observer_(std::move(observer)) {
    if (!channel_) {
        throw std::invalid_argument("CallChannel requires a broadcast channel.");
    }
    for (const char* event : {kOfferEvent, kAnswerEvent, kIceCandidateEvent, kCallEndedEvent}) {
        std::string event_name(event);
        channel_->On(event_name, [this, event_name](const std::string& payload){
            OnMessage(event_name, payload);
        });
    }
}

CallChannel::~CallChannel() {
    Unsubscribe();
}

bool CallChannel::is_subscribed() const {
    return channel_->is_subscribed();
}

void CallChannel::Subscribe(BroadcastChannel::SubscribeCallback callback) {
    PLOG_DEBUG << "Subscribing call channel: " << channel_->name();
    channel_->Subscribe(std::move(callback));
}

void CallChannel::Unsubscribe() {
    channel_->Unsubscribe();
}

void CallChannel::SendOffer(const std::string& to, const std::string& sdp) {
    Send(Offer{local_user_id_, to, chat_room_id_, sdp});
}

void CallChannel::SendAnswer(const std::string& to, const std::string& sdp) {
    Send(Answer{local_user_id_, to, chat_room_id_, sdp});
}

void CallChannel::SendCandidate(const std::string& to, const Candidate& candidate) {
    Send(IceCandidate{local_user_id_, to, chat_room_id_, candidate});
}

void CallChannel::SendCallEnded() {
    Send(CallEnded{local_user_id_, chat_room_id_});
}

// Private methods
void CallChannel::Send(const SignalingMessage& message) {
    auto event = EventName(message);
    PLOG_VERBOSE << "Sending " << event << " on " << channel_->name();
    channel_->Send(event, Serialize(message));
}

void CallChannel::OnMessage(const std::string& event, const std::string& payload) {
    auto message = Parse(event, payload);
    if (!message || !IsAcceptable(*message)) {
        return;
    }
    auto observer = observer_.lock();
    if (!observer) {
        return;
    }
    std::visit(overloaded {
        [&observer](const Offer& offer) { observer->OnRemoteOffer(offer); },
        [&observer](const Answer& answer) { observer->OnRemoteAnswer(answer); },
        [&observer](const IceCandidate& candidate) { observer->OnRemoteCandidate(candidate); },
        [&observer](const CallEnded& call_ended) { observer->OnRemoteCallEnded(call_ended); },
        [](const auto& msg) { 
            PLOG_WARNING << "Unexpected message from " << msg.from << " on call channel.";
        }
    }, *message);
}

bool CallChannel::IsAcceptable(const SignalingMessage& message) const {
    if (ChatRoomId(message) != chat_room_id_) {
        PLOG_VERBOSE << "Drop message of chat room: " << ChatRoomId(message);
        return false;
    }
    if (Sender(message) == local_user_id_) {
        return false;
    }
    auto recipient = Recipient(message);
    if (recipient && *recipient != local_user_id_) {
        PLOG_VERBOSE << "Drop message addressed to " << *recipient;
        return false;
    }
    return true;
}

} // namespace signaling
} // namespace naivecall
