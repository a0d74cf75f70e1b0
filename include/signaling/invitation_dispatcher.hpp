#ifndef _SIGNALING_INVITATION_DISPATCHER_H_
#define _SIGNALING_INVITATION_DISPATCHER_H_

#include "base/defines.hpp"
#include "signaling/invites_channel.hpp"
#include "signaling/push_notifier.hpp"
#include "signaling/signaling_message.hpp"

#include <memory>
#include <string>
#include <vector>

namespace naivecall {
namespace signaling {

// InvitationDispatcher
class NAIVECALL_CPP_EXPORT InvitationDispatcher {
public:
    struct Configuration {
        std::string local_user_id;
        std::string voice_call_title = "Incoming voice call";
        std::string video_call_title = "Incoming video call";
        std::string body = "Tap to answer";
        std::string tag_prefix = "chat-";
    };

    // Receives the invitations and cancellations addressed to the local user.
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnInvite(const Invite& invite) = 0;
        virtual void OnInviteCancelled(const CallCancelled& call_cancelled) = 0;
    };
public:
    InvitationDispatcher(Configuration config,
                         std::shared_ptr<InvitesChannel> invites_channel,
                         std::shared_ptr<PushNotifier> push_notifier,
                         std::weak_ptr<Observer> observer);
    ~InvitationDispatcher();

    // Starts listening for invitations.
    void Start();

    // One Invite per recipient, then a push notification to all of them.
    // A failing recipient is logged and skipped.
    void SendInvite(const std::vector<std::string>& recipients,
                    const std::string& chat_room_id,
                    CallType call_type,
                    const std::vector<std::string>& participants);

    void SendCancel(const std::vector<std::string>& recipients, const std::string& chat_room_id);

private:
    DISALLOW_COPY_AND_ASSIGN(InvitationDispatcher);

    static void Publish(InvitesChannel& invites_channel, 
                        boost::system::error_code ec, 
                        const std::vector<SignalingMessage>& messages);

private:
    const Configuration config_;
    std::shared_ptr<InvitesChannel> invites_channel_;
    std::shared_ptr<PushNotifier> push_notifier_;
};

} // namespace signaling
} // namespace naivecall

#endif
