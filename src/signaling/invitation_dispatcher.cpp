#include "signaling/invitation_dispatcher.hpp"
#include "common/utils_time.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace naivecall {
namespace signaling {

InvitationDispatcher::InvitationDispatcher(Configuration config,
                                           std::shared_ptr<InvitesChannel> invites_channel,
                                           std::shared_ptr<PushNotifier> push_notifier,
                                           std::weak_ptr<Observer> observer)
    : config_(std::move(config)),
      invites_channel_(std::move(invites_channel)),
      push_notifier_(std::move(push_notifier)) {
    if (!invites_channel_) {
        throw std::invalid_argument("InvitationDispatcher requires an invites channel.");
    }
    const auto local_user_id = config_.local_user_id;
    auto on_message = [local_user_id, observer](const std::string& event, const std::string& payload) {
        auto message = Parse(event, payload);
        if (!message) {
            return;
        }
        if (Sender(*message) == local_user_id || Recipient(*message) != local_user_id) {
            return;
        }
        auto strong_observer = observer.lock();
        if (!strong_observer) {
            return;
        }
        std::visit(overloaded {
            [&](const Invite& invite) { strong_observer->OnInvite(invite); },
            [&](const CallCancelled& call_cancelled) { strong_observer->OnInviteCancelled(call_cancelled); },
            [](const auto& msg) {
                PLOG_WARNING << "Unexpected message from " << msg.from << " on invites channel.";
            }
        }, *message);
    };
    invites_channel_->On(kIncomingCallEvent, [on_message](const std::string& payload){
        on_message(kIncomingCallEvent, payload);
    });
    invites_channel_->On(kCallCancelledEvent, [on_message](const std::string& payload){
        on_message(kCallCancelledEvent, payload);
    });
}

InvitationDispatcher::~InvitationDispatcher() = default;

void InvitationDispatcher::Start() {
    invites_channel_->WhenReady(nullptr);
}

void InvitationDispatcher::SendInvite(const std::vector<std::string>& recipients,
                                      const std::string& chat_room_id,
                                      CallType call_type,
                                      const std::vector<std::string>& participants) {
    const auto timestamp = utils::time::TimeUTCInMillis();
    std::vector<SignalingMessage> invites;
    for (const auto& recipient : recipients) {
        invites.emplace_back(Invite{config_.local_user_id, recipient, chat_room_id, call_type, participants, timestamp});
    }
    PLOG_INFO << "Inviting " << recipients.size() << " users to " << call_type << " call in " << chat_room_id;

    std::weak_ptr<InvitesChannel> weak_channel = invites_channel_;
    auto push_notifier = push_notifier_;
    auto title = call_type == CallType::VIDEO ? config_.video_call_title : config_.voice_call_title;
    auto body = config_.body;
    auto tag = config_.tag_prefix + chat_room_id;
    invites_channel_->WhenReady([weak_channel, invites, push_notifier, recipients, title, body, tag](boost::system::error_code ec){
        if (auto invites_channel = weak_channel.lock()) {
            Publish(*invites_channel, ec, invites);
        }
        if (!push_notifier || recipients.empty()) {
            return;
        }
        try {
            push_notifier->Notify(recipients, title, body, tag);
        } catch (const std::exception& exp) {
            PLOG_WARNING << "Failed to request push notification: " << exp.what();
        }
    });
}

void InvitationDispatcher::SendCancel(const std::vector<std::string>& recipients, const std::string& chat_room_id) {
    std::vector<SignalingMessage> cancellations;
    for (const auto& recipient : recipients) {
        cancellations.emplace_back(CallCancelled{config_.local_user_id, recipient, chat_room_id});
    }
    PLOG_INFO << "Cancelling invitations of " << chat_room_id << " for " << recipients.size() << " users";
    std::weak_ptr<InvitesChannel> weak_channel = invites_channel_;
    invites_channel_->WhenReady([weak_channel, cancellations](boost::system::error_code ec){
        if (auto invites_channel = weak_channel.lock()) {
            Publish(*invites_channel, ec, cancellations);
        }
    });
}

// Private methods
void InvitationDispatcher::Publish(InvitesChannel& invites_channel, 
                                   boost::system::error_code ec, 
                                   const std::vector<SignalingMessage>& messages) {
    if (ec) {
        PLOG_ERROR << "Invites channel is unavailable, " << messages.size() 
                   << " messages dropped: " << ec.message();
        return;
    }
    for (const auto& message : messages) {
        try {
            invites_channel.Send(EventName(message), Serialize(message));
        } catch (const std::exception& exp) {
            PLOG_ERROR << "Failed to send " << EventName(message) << " to " 
                       << Recipient(message).value_or("") << ": " << exp.what();
        }
    }
}

} // namespace signaling
} // namespace naivecall
