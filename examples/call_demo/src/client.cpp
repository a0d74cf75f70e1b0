#include "client.hpp"

#include <plog/Log.h>

using namespace naivecall;

std::shared_ptr<Client> Client::Create(CallConfiguration config,
                                       signaling::LocalBroadcastHub* hub,
                                       boost::asio::io_context& ioc) {
    return std::shared_ptr<Client>(new Client(std::move(config), hub, ioc));
}

Client::Client(CallConfiguration config,
               signaling::LocalBroadcastHub* hub,
               boost::asio::io_context& ioc)
    : config_(std::move(config)),
      user_id_(config_.local_user_id),
      hub_(hub),
      ioc_(ioc),
      task_queue_("Client." + user_id_),
      media_engine_(user_id_, &task_queue_) {}

Client::~Client() {
    Stop();
}

void Client::Start() {
    manager_ = CallSessionManager::Create(config_, &media_engine_, hub_, nullptr, &task_queue_, weak_from_this());
    manager_->Start();
    // Runs after the subscription acknowledgement of the invites channel.
    task_queue_.Sync([](){});
}

void Client::Stop() {
    if (manager_) {
        manager_->Shutdown();
        manager_.reset();
    }
}

size_t Client::connected_count() const {
    return task_queue_.Sync<size_t>([this](){ return connected_.size(); });
}

// Implements naivecall::CallSessionManager::Observer
void Client::OnIncomingInvite(const signaling::Invite& invite) {
    PLOG_INFO << user_id_ << ": " << invite.from << " is calling in " << invite.chat_room_id;
    // Answered from the main loop, the manager is busy delivering.
    boost::asio::post(ioc_, [weak_this=weak_from_this(), invite](){
        auto strong_this = weak_this.lock();
        if (!strong_this || !strong_this->manager_) {
            return;
        }
        if (!strong_this->manager_->AcceptIncoming(invite)) {
            PLOG_WARNING << strong_this->user_id_ << ": failed to answer " << invite.chat_room_id;
        }
    });
}

void Client::OnInviteCancelled(const signaling::CallCancelled& call_cancelled) {
    PLOG_INFO << user_id_ << ": " << call_cancelled.from << " cancelled " << call_cancelled.chat_room_id;
}

void Client::OnCallFailed(const std::string& chat_room_id, const std::string& error) {
    PLOG_ERROR << user_id_ << ": call " << chat_room_id << " failed: " << error;
    connected_.clear();
}

void Client::OnCallEnded(const std::string& chat_room_id) {
    PLOG_INFO << user_id_ << ": call " << chat_room_id << " ended.";
    connected_.clear();
}

void Client::OnRemoteParticipantConnected(const std::string& remote_user_id) {
    PLOG_INFO << user_id_ << ": connected with " << remote_user_id;
    connected_.insert(remote_user_id);
}

void Client::OnRemoteMediaTrack(const std::string& remote_user_id, std::shared_ptr<MediaTrack> track) {
    PLOG_INFO << user_id_ << ": receiving " << track->kind() << " track " << track->track_id()
              << " from " << remote_user_id;
}
