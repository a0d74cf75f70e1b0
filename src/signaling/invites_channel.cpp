#include "signaling/invites_channel.hpp"
#include "common/task_queue.hpp"

#include <plog/Log.h>

#include <boost/system/errc.hpp>

#include <stdexcept>

namespace naivecall {
namespace signaling {

InvitesChannel::InvitesChannel(BroadcastTransport* transport, std::string name, TaskQueue* task_queue)
    : transport_(transport),
      name_(std::move(name)),
      task_queue_(task_queue),
      alive_(std::make_shared<bool>(true)) {
    if (!transport_ || !task_queue_) {
        throw std::invalid_argument("InvitesChannel requires a transport and a task queue.");
    }
}

InvitesChannel::~InvitesChannel() {
    Close();
    *alive_ = false;
}

void InvitesChannel::On(const std::string& event, BroadcastChannel::MessageHandler handler) {
    handlers_.emplace_back(event, handler);
    if (channel_) {
        channel_->On(event, std::move(handler));
    }
}

void InvitesChannel::WhenReady(ReadyCallback callback) {
    switch (state_) {
    case State::READY:
        if (callback) {
            task_queue_->Async([callback=std::move(callback)](){
                callback(boost::system::error_code());
            });
        }
        return;
    case State::CLOSED:
        if (callback) {
            task_queue_->Async([callback=std::move(callback)](){
                callback(boost::system::errc::make_error_code(boost::system::errc::not_connected));
            });
        }
        return;
    case State::SUBSCRIBING:
        if (callback) {
            ready_callbacks_.push_back(std::move(callback));
        }
        return;
    case State::IDLE:
    default:
        break;
    }

    if (callback) {
        ready_callbacks_.push_back(std::move(callback));
    }
    state_ = State::SUBSCRIBING;
    if (!channel_) {
        PLOG_DEBUG << "Creating invites channel: " << name_;
        channel_ = transport_->CreateChannel(name_, task_queue_);
        for (const auto& [event, handler] : handlers_) {
            channel_->On(event, handler);
        }
    }
    std::weak_ptr<bool> alive = alive_;
    channel_->Subscribe([this, alive](boost::system::error_code ec){
        auto strong_alive = alive.lock();
        if (!strong_alive || !*strong_alive) {
            return;
        }
        OnSubscribed(ec);
    });
}

void InvitesChannel::Send(const std::string& event, const std::string& payload) {
    if (state_ != State::READY || !channel_) {
        throw std::runtime_error("Invites channel " + name_ + " is not subscribed.");
    }
    channel_->Send(event, payload);
}

void InvitesChannel::Close() {
    if (state_ == State::CLOSED) {
        return;
    }
    state_ = State::CLOSED;
    if (channel_) {
        channel_->Unsubscribe();
    }
    auto callbacks = std::move(ready_callbacks_);
    ready_callbacks_.clear();
    for (auto& callback : callbacks) {
        callback(boost::system::errc::make_error_code(boost::system::errc::operation_canceled));
    }
}

// Private methods
void InvitesChannel::OnSubscribed(boost::system::error_code ec) {
    if (state_ != State::SUBSCRIBING) {
        return;
    }
    if (ec) {
        PLOG_ERROR << "Failed to subscribe invites channel " << name_ << ": " << ec.message();
        // The next use retries.
        state_ = State::IDLE;
    } else {
        PLOG_INFO << "Invites channel " << name_ << " is ready.";
        state_ = State::READY;
    }
    auto callbacks = std::move(ready_callbacks_);
    ready_callbacks_.clear();
    for (auto& callback : callbacks) {
        callback(ec);
    }
}

} // namespace signaling
} // namespace naivecall
