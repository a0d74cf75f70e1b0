#ifndef _TESTING_QUEUE_HELPERS_H_
#define _TESTING_QUEUE_HELPERS_H_

#include "common/task_queue.hpp"

#include <chrono>
#include <functional>
#include <initializer_list>
#include <thread>

namespace naivecall {
namespace test {

// Runs every queue until the tasks posted so far, and the tasks those
// tasks post to any of the queues, have executed. Timers are not waited for.
inline void DrainQueues(std::initializer_list<TaskQueue*> task_queues, int rounds = 32) {
    for (int i = 0; i < rounds; ++i) {
        for (auto task_queue : task_queues) {
            task_queue->Sync([](){});
        }
    }
}

// Polls `condition` until it holds or `timeout_ms` elapsed.
inline bool WaitUntil(std::function<bool()> condition, int timeout_ms = 5000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace test
} // namespace naivecall

#endif
