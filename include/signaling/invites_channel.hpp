#ifndef _SIGNALING_INVITES_CHANNEL_H_
#define _SIGNALING_INVITES_CHANNEL_H_

#include "base/defines.hpp"
#include "signaling/broadcast_transport.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace naivecall {
namespace signaling {

// The device-wide channel carrying invitations and cancellations. The
// underlying broadcast channel is created and subscribed on first use
// only, and at most once while the subscription holds.
class NAIVECALL_CPP_EXPORT InvitesChannel {
public:
    using ReadyCallback = std::function<void(boost::system::error_code ec)>;
public:
    InvitesChannel(BroadcastTransport* transport, std::string name, TaskQueue* task_queue);
    ~InvitesChannel();

    const std::string& name() const { return name_; }
    bool is_ready() const { return state_ == State::READY; }

    // Handlers may be registered before the channel exists.
    void On(const std::string& event, BroadcastChannel::MessageHandler handler);

    // Subscribes if needed. `callback` runs once the subscription is 
    // acknowledged, on the next turn of the queue if it already is.
    void WhenReady(ReadyCallback callback);

    // Throws std::runtime_error if the channel is not ready or the publish fails.
    void Send(const std::string& event, const std::string& payload);

    void Close();

private:
    DISALLOW_COPY_AND_ASSIGN(InvitesChannel);

    enum class State {
        IDLE,
        SUBSCRIBING,
        READY,
        CLOSED
    };

    void OnSubscribed(boost::system::error_code ec);

private:
    BroadcastTransport* const transport_;
    const std::string name_;
    TaskQueue* const task_queue_;

    State state_ = State::IDLE;
    std::shared_ptr<BroadcastChannel> channel_;
    std::vector<std::pair<std::string, BroadcastChannel::MessageHandler>> handlers_;
    std::vector<ReadyCallback> ready_callbacks_;
    // Invalidates acknowledgements of an abandoned subscription.
    std::shared_ptr<bool> alive_;
};

} // namespace signaling
} // namespace naivecall

#endif
