#ifndef _COMMON_TASK_QUEUE_H_
#define _COMMON_TASK_QUEUE_H_

#include "base/defines.hpp"

#include <boost/asio.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/thread/thread.hpp>

#include <functional>
#include <optional>
#include <string>

namespace naivecall {

// A single-threaded task queue. Tasks posted to the same queue never 
// run concurrently and are executed in FIFO order.
class NAIVECALL_CPP_EXPORT TaskQueue {
public:
    explicit TaskQueue(std::string name = "");
    ~TaskQueue();

    // Blocks the caller until `handler` has run on the queue.
    void Sync(const std::function<void()> handler) const;
    // Queues `handler`, even if the caller is already running on this queue.
    void Async(std::function<void()> handler) const;
    void AsyncAfter(TimeInterval delay_in_ms, std::function<void()> handler);

    template<typename T>
    T Sync(std::function<T(void)> handler) const {
        if (IsCurrent()) {
            return handler();
        }
        std::optional<T> ret;
        boost::unique_lock<boost::mutex> lock(mutex_);
        boost::asio::post(strand_, [this, handler = std::move(handler), &ret](){
            auto value = handler();
            boost::lock_guard<boost::mutex> guard(mutex_);
            ret.emplace(std::move(value));
            cond_.notify_all();
        });
        cond_.wait(lock, [&ret](){ return ret.has_value(); });
        return std::move(*ret);
    }

    bool IsCurrent() const;

    const std::string& name() const { return name_; }

private:
    DISALLOW_COPY_AND_ASSIGN(TaskQueue);

    const std::string name_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    mutable boost::asio::io_context::strand strand_;
    std::unique_ptr<boost::thread> ioc_thread_;

    mutable boost::mutex mutex_;
    mutable boost::condition_variable cond_;
};

} // namespace naivecall

#endif
