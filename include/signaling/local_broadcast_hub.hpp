#ifndef _SIGNALING_LOCAL_BROADCAST_HUB_H_
#define _SIGNALING_LOCAL_BROADCAST_HUB_H_

#include "base/defines.hpp"
#include "signaling/broadcast_transport.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace naivecall {
namespace signaling {

// An in-process broadcast transport connecting devices which live in the
// same process, each device running on its own task queue. A message is
// never echoed back to the channel that sent it.
class NAIVECALL_CPP_EXPORT LocalBroadcastHub : public BroadcastTransport {
public:
    // Returns false to make the publish fail.
    using SendFilter = std::function<bool(const std::string& channel_name, 
                                          const std::string& event, 
                                          const std::string& payload)>;
public:
    LocalBroadcastHub();
    ~LocalBroadcastHub() override;

    std::shared_ptr<BroadcastChannel> CreateChannel(const std::string& name, TaskQueue* task_queue) override;

    void set_send_filter(SendFilter filter);

    size_t subscriber_count(const std::string& name) const;

private:
    class LocalChannel;
    struct Registry;

    std::shared_ptr<Registry> registry_;
};

} // namespace signaling
} // namespace naivecall

#endif
