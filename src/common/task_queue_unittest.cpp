#include "common/task_queue.hpp"
#include "common/utils_time.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <vector>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace test {

MY_TEST(TaskQueueTest, SyncPost) {
    TaskQueue task_queue("TaskQueueTest.SyncPost");
    int ret = 1;
    ret = task_queue.Sync<int>([]() {
        return 100;
    });
    EXPECT_EQ(ret, 100);
}

MY_TEST(TaskQueueTest, AsyncPostRunsOnQueue) {
    TaskQueue task_queue("TaskQueueTest.AsyncPostRunsOnQueue");
    std::promise<bool> promise;
    task_queue.Async([&task_queue, &promise](){
        promise.set_value(task_queue.IsCurrent());
    });
    EXPECT_TRUE(promise.get_future().get());
    EXPECT_FALSE(task_queue.IsCurrent());
}

MY_TEST(TaskQueueTest, AsyncFromQueueIsDeferred) {
    TaskQueue task_queue("TaskQueueTest.AsyncFromQueueIsDeferred");
    std::vector<int> order;
    task_queue.Sync([&](){
        task_queue.Async([&](){
            order.push_back(2);
        });
        order.push_back(1);
    });
    task_queue.Sync([](){});
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
}

MY_TEST(TaskQueueTest, AsyncDelayedPost) {
    TaskQueue task_queue("TaskQueueTest.AsyncDelayedPost");
    std::promise<void> promise;
    int64_t start = utils::time::TimeInMillis();
    task_queue.AsyncAfter(200, [&promise](){
        promise.set_value();
    });
    promise.get_future().wait();
    int64_t end = utils::time::TimeInMillis();
    EXPECT_GE(end - start, 200);
}

MY_TEST(TaskQueueTest, MultipleDelayedPostsDoNotCancelEachOther) {
    TaskQueue task_queue("TaskQueueTest.MultipleDelayedPosts");
    std::atomic<int> fired{0};
    std::promise<void> promise;
    task_queue.AsyncAfter(50, [&fired](){
        ++fired;
    });
    task_queue.AsyncAfter(100, [&fired, &promise](){
        ++fired;
        promise.set_value();
    });
    promise.get_future().wait();
    EXPECT_EQ(fired.load(), 2);
}

} // namespace test
} // namespace naivecall
