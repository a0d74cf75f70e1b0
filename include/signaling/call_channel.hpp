#ifndef _SIGNALING_CALL_CHANNEL_H_
#define _SIGNALING_CALL_CHANNEL_H_

#include "base/defines.hpp"
#include "signaling/broadcast_transport.hpp"
#include "signaling/signaling_message.hpp"

#include <memory>
#include <string>

namespace naivecall {
namespace signaling {

// The signaling channel of one call, named after its chat room. Only 
// messages of this chat room, sent by another user and addressed to the
// local user (or to everyone) reach the observer. 
class NAIVECALL_CPP_EXPORT CallChannel {
public:
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnRemoteOffer(const Offer& offer) = 0;
        virtual void OnRemoteAnswer(const Answer& answer) = 0;
        virtual void OnRemoteCandidate(const IceCandidate& candidate) = 0;
        virtual void OnRemoteCallEnded(const CallEnded& call_ended) = 0;
    };

    static std::string ChannelName(const std::string& prefix, const std::string& chat_room_id);
public:
    CallChannel(std::shared_ptr<BroadcastChannel> channel, 
                std::string chat_room_id, 
                std::string local_user_id,
                std::weak_ptr<Observer> observer);
    ~CallChannel();

    const std::string& chat_room_id() const { return chat_room_id_; }
    bool is_subscribed() const;

    void Subscribe(BroadcastChannel::SubscribeCallback callback);
    void Unsubscribe();

    // Throw std::runtime_error if the message can not be published.
    void SendOffer(const std::string& to, const std::string& sdp);
    void SendAnswer(const std::string& to, const std::string& sdp);
    void SendCandidate(const std::string& to, const Candidate& candidate);
    void SendCallEnded();

private:
    DISALLOW_COPY_AND_ASSIGN(CallChannel);

    void Send(const SignalingMessage& message);
    void OnMessage(const std::string& event, const std::string& payload);
    bool IsAcceptable(const SignalingMessage& message) const;

private:
    std::shared_ptr<BroadcastChannel> channel_;
    const std::string chat_room_id_;
    const std::string local_user_id_;
    std::weak_ptr<Observer> observer_;
};

} // namespace signaling
} // namespace naivecall

#endif
