#ifndef _SIGNALING_BROADCAST_TRANSPORT_H_
#define _SIGNALING_BROADCAST_TRANSPORT_H_

#include "base/defines.hpp"

#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>
#include <string>

namespace naivecall {

class TaskQueue;

namespace signaling {

// A named broadcast channel. Delivery is best-effort: no persistence, no retry
// and nothing is delivered to a subscriber before its subscription was
// acknowledged. Handlers run on the task queue the channel was created with.
class NAIVECALL_CPP_EXPORT BroadcastChannel {
public:
    using MessageHandler = std::function<void(const std::string& payload)>;
    using SubscribeCallback = std::function<void(boost::system::error_code ec)>;
public:
    virtual ~BroadcastChannel() = default;

    virtual const std::string& name() const = 0;

    // More than one handler may be registered for the same event.
    virtual void On(const std::string& event, MessageHandler handler) = 0;
    virtual void Subscribe(SubscribeCallback callback) = 0;
    // Throws std::runtime_error if the message can not be published.
    virtual void Send(const std::string& event, const std::string& payload) = 0;
    // Safe to call more than once, or before the subscription was acknowledged.
    virtual void Unsubscribe() = 0;

    virtual bool is_subscribed() const = 0;
};

// BroadcastTransport
class NAIVECALL_CPP_EXPORT BroadcastTransport {
public:
    virtual ~BroadcastTransport() = default;
    virtual std::shared_ptr<BroadcastChannel> CreateChannel(const std::string& name, TaskQueue* task_queue) = 0;
};

} // namespace signaling
} // namespace naivecall

#endif
