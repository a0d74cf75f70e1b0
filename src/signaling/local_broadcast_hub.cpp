#include "signaling/local_broadcast_hub.hpp"
#include "common/task_queue.hpp"

#include <boost/asio/error.hpp>

#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <utility>

namespace naivecall {
namespace signaling {

// Registry
struct LocalBroadcastHub::Registry {
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::vector<std::weak_ptr<LocalChannel>>> channels;
    SendFilter send_filter = nullptr;

    void Add(const std::string& name, std::weak_ptr<LocalChannel> channel) {
        std::lock_guard<std::mutex> lock(mutex);
        channels[name].push_back(std::move(channel));
    }

    void Remove(const std::string& name, const LocalChannel* channel) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = channels.find(name);
        if (it == channels.end()) {
            return;
        }
        auto& subscribers = it->second;
        subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(), 
            [channel](const std::weak_ptr<LocalChannel>& weak_channel){
                auto locked = weak_channel.lock();
                return !locked || locked.get() == channel;
            }), subscribers.end());
        if (subscribers.empty()) {
            channels.erase(it);
        }
    }

    std::vector<std::shared_ptr<LocalChannel>> Subscribers(const std::string& name) const {
        std::vector<std::shared_ptr<LocalChannel>> subscribers;
        std::lock_guard<std::mutex> lock(mutex);
        auto it = channels.find(name);
        if (it != channels.end()) {
            for (const auto& weak_channel : it->second) {
                if (auto channel = weak_channel.lock()) {
                    subscribers.push_back(std::move(channel));
                }
            }
        }
        return subscribers;
    }

    bool Accept(const std::string& name, const std::string& event, const std::string& payload) const {
        SendFilter filter;
        {
            std::lock_guard<std::mutex> lock(mutex);
            filter = send_filter;
        }
        return !filter || filter(name, event, payload);
    }
};

// LocalChannel
class LocalBroadcastHub::LocalChannel : public BroadcastChannel, 
                                        public std::enable_shared_from_this<LocalChannel> {
public:
    enum class State {
        UNSUBSCRIBED,
        SUBSCRIBING,
        SUBSCRIBED,
        CLOSED
    };
public:
    LocalChannel(std::string name, TaskQueue* task_queue, std::shared_ptr<Registry> registry) 
        : name_(std::move(name)),
          task_queue_(task_queue),
          registry_(std::move(registry)) {}

    ~LocalChannel() override {
        registry_->Remove(name_, this);
    }

    const std::string& name() const override { return name_; }

    bool is_subscribed() const override { return state_ == State::SUBSCRIBED; }

    void On(const std::string& event, MessageHandler handler) override {
        handlers_.emplace_back(event, std::move(handler));
    }

    void Subscribe(SubscribeCallback callback) override {
        State expected = State::UNSUBSCRIBED;
        if (!state_.compare_exchange_strong(expected, State::SUBSCRIBING)) {
            PLOG_WARNING << "Channel " << name_ << " was subscribed already.";
            auto ec = expected == State::SUBSCRIBED ? boost::system::error_code() 
                                                    : boost::system::error_code(boost::asio::error::operation_aborted);
            task_queue_->Async([callback=std::move(callback), ec](){
                if (callback) {
                    callback(ec);
                }
            });
            return;
        }
        // The acknowledgement arrives asynchronously, like a remote server would send it.
        task_queue_->Async([weak_this=weak_from_this(), callback=std::move(callback)](){
            auto shared_this = weak_this.lock();
            if (!shared_this) {
                return;
            }
            State expected = State::SUBSCRIBING;
            if (!shared_this->state_.compare_exchange_strong(expected, State::SUBSCRIBED)) {
                PLOG_DEBUG << "Channel " << shared_this->name_ << " was unsubscribed before acknowledgement.";
                if (callback) {
                    callback(boost::asio::error::operation_aborted);
                }
                return;
            }
            shared_this->registry_->Add(shared_this->name_, weak_this);
            PLOG_VERBOSE << "Channel " << shared_this->name_ << " subscribed.";
            if (callback) {
                callback(boost::system::error_code());
            }
        });
    }

    void Send(const std::string& event, const std::string& payload) override {
        if (state_ != State::SUBSCRIBED) {
            throw std::runtime_error("Channel " + name_ + " is not subscribed.");
        }
        if (!registry_->Accept(name_, event, payload)) {
            throw std::runtime_error("Failed to publish " + event + " on channel " + name_);
        }
        for (auto& subscriber : registry_->Subscribers(name_)) {
            if (subscriber.get() == this) {
                continue;
            }
            subscriber->task_queue_->Async([weak_subscriber=std::weak_ptr<LocalChannel>(subscriber), event, payload](){
                if (auto subscriber = weak_subscriber.lock()) {
                    subscriber->Deliver(event, payload);
                }
            });
        }
    }

    void Unsubscribe() override {
        auto prev_state = state_.exchange(State::CLOSED);
        if (prev_state == State::CLOSED) {
            return;
        }
        registry_->Remove(name_, this);
        PLOG_VERBOSE << "Channel " << name_ << " unsubscribed.";
    }

private:
    void Deliver(const std::string& event, const std::string& payload) {
        if (state_ != State::SUBSCRIBED) {
            return;
        }
        // Handlers may register or unsubscribe while being called.
        auto handlers = handlers_;
        for (auto& [handler_event, handler] : handlers) {
            if (handler_event == event && state_ == State::SUBSCRIBED) {
                handler(payload);
            }
        }
    }

private:
    const std::string name_;
    TaskQueue* const task_queue_;
    std::shared_ptr<Registry> registry_;
    std::atomic<State> state_{State::UNSUBSCRIBED};
    std::vector<std::pair<std::string, MessageHandler>> handlers_;
};

// LocalBroadcastHub
LocalBroadcastHub::LocalBroadcastHub() 
    : registry_(std::make_shared<Registry>()) {}

LocalBroadcastHub::~LocalBroadcastHub() = default;

std::shared_ptr<BroadcastChannel> LocalBroadcastHub::CreateChannel(const std::string& name, TaskQueue* task_queue) {
    if (!task_queue) {
        throw std::invalid_argument("A task queue is required to create channel " + name);
    }
    return std::make_shared<LocalChannel>(name, task_queue, registry_);
}

void LocalBroadcastHub::set_send_filter(SendFilter filter) {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    registry_->send_filter = std::move(filter);
}

size_t LocalBroadcastHub::subscriber_count(const std::string& name) const {
    return registry_->Subscribers(name).size();
}

} // namespace signaling
} // namespace naivecall
