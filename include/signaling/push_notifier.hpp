#ifndef _SIGNALING_PUSH_NOTIFIER_H_
#define _SIGNALING_PUSH_NOTIFIER_H_

#include "base/defines.hpp"

#include <string>
#include <vector>

namespace naivecall {
namespace signaling {

// Out-of-band notification service reaching users whose devices are not
// listening on the invites channel. Fire-and-forget.
class NAIVECALL_CPP_EXPORT PushNotifier {
public:
    virtual ~PushNotifier() = default;
    virtual void Notify(const std::vector<std::string>& user_ids,
                        const std::string& title,
                        const std::string& body,
                        const std::string& tag) = 0;
};

} // namespace signaling
} // namespace naivecall

#endif
