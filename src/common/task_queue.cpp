#include "common/task_queue.hpp"

#include <boost/asio/steady_timer.hpp>

#include <plog/Log.h>

#include <chrono>

namespace naivecall {

TaskQueue::TaskQueue(std::string name) 
    : name_(std::move(name)),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      strand_(ioc_) {
    // The thread will start immediately after created
    ioc_thread_.reset(new boost::thread([this](){
        ioc_.run();
    }));
    if (!name_.empty()) {
        PLOG_VERBOSE << "Task queue name: " << name_ << " in thread: " << ioc_thread_->get_id();
    }
}

TaskQueue::~TaskQueue() {
    PLOG_VERBOSE << __FUNCTION__ << " " << name_;

    // Indicate that the work is no longer working, ioc will exit later.
    work_guard_.reset();
    // Tasks queued so far still run, timers still waiting are dropped.
    boost::asio::post(strand_, [this](){
        ioc_.stop();
    });
    // It is considered an error to destroy a C++ thread object while it is
    // still joinable. The calling thread blocks until the io_context exits.
    if (ioc_thread_->joinable()) {
        PLOG_VERBOSE << "Join task queue";
        ioc_thread_->join();
    }
    ioc_thread_.reset();
}

void TaskQueue::Sync(const std::function<void()> handler) const {
    if (IsCurrent()) {
        handler();
        return;
    }
    bool done = false;
    boost::unique_lock<boost::mutex> lock(mutex_);
    boost::asio::post(strand_, [this, &handler, &done](){
        handler();
        boost::lock_guard<boost::mutex> guard(mutex_);
        done = true;
        cond_.notify_all();
    });
    cond_.wait(lock, [&done](){ return done; });
}

void TaskQueue::Async(std::function<void()> handler) const {
    boost::asio::post(strand_, std::move(handler));
}

void TaskQueue::AsyncAfter(TimeInterval delay_in_ms, std::function<void()> handler) {
    // One timer per call, a shared timer would cancel the previous wait.
    auto timer = std::make_shared<boost::asio::steady_timer>(ioc_, std::chrono::milliseconds(delay_in_ms));
    timer->async_wait(boost::asio::bind_executor(strand_, 
        [timer, handler = std::move(handler)](const boost::system::error_code& error){
        if (error == boost::asio::error::operation_aborted) {
            return;
        }
        handler();
    }));
}

bool TaskQueue::IsCurrent() const {
    // NOTE: DO NOT call get_id() in a detached thread, it will return 'Not-any-thread'
    return ioc_thread_->get_id() == boost::this_thread::get_id();    
}

} // namespace naivecall
