#include "call/call_session_manager.hpp"
#include "common/task_queue.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>

namespace naivecall {

std::shared_ptr<CallSessionManager> CallSessionManager::Create(CallConfiguration config,
                                                               MediaEngine* media_engine,
                                                               signaling::BroadcastTransport* transport,
                                                               std::shared_ptr<signaling::PushNotifier> push_notifier,
                                                               TaskQueue* task_queue,
                                                               std::weak_ptr<Observer> observer) {
    config.Validate();
    if (!media_engine || !transport || !task_queue) {
        throw std::invalid_argument("CallSessionManager requires a media engine, a broadcast transport and a task queue.");
    }
    auto manager = std::shared_ptr<CallSessionManager>(new CallSessionManager(std::move(config),
                                                                              media_engine,
                                                                              transport,
                                                                              task_queue,
                                                                              std::move(observer)));
    manager->Init(std::move(push_notifier));
    return manager;
}

CallSessionManager::CallSessionManager(CallConfiguration config,
                                       MediaEngine* media_engine,
                                       signaling::BroadcastTransport* transport,
                                       TaskQueue* task_queue,
                                       std::weak_ptr<Observer> observer)
    : config_(std::move(config)),
      media_engine_(media_engine),
      transport_(transport),
      task_queue_(task_queue),
      observer_(std::move(observer)) {}

CallSessionManager::~CallSessionManager() {
    task_queue_->Sync([this](){
        if (active_session_) {
            auto session = std::move(active_session_);
            session->End(CallSession::EndReason::LOCAL_HANGUP);
        }
        dispatcher_.reset();
        if (invites_channel_) {
            invites_channel_->Close();
            invites_channel_.reset();
        }
    });
}

void CallSessionManager::Start() {
    task_queue_->Sync([this](){
        PLOG_INFO << "Listening for calls to " << config_.local_user_id << " on " << config_.invites_channel_name;
        dispatcher_->Start();
    });
}

bool CallSessionManager::StartCall(const std::string& chat_room_id,
                                   const std::vector<std::string>& roster,
                                   signaling::CallType call_type) {
    return task_queue_->Sync<bool>([&](){
        CallSession::Params params;
        params.chat_room_id = chat_room_id;
        params.call_type = call_type;
        params.role = CallSession::Role::CALLER;
        params.caller_id = config_.local_user_id;
        params.participants = roster;
        if (std::find(roster.begin(), roster.end(), config_.local_user_id) == roster.end()) {
            params.participants.insert(params.participants.begin(), config_.local_user_id);
        }
        if (!StartSession(std::move(params))) {
            return false;
        }
        pending_invites_.erase(chat_room_id);
        return true;
    });
}

bool CallSessionManager::AcceptIncoming(const signaling::Invite& invite) {
    return task_queue_->Sync<bool>([&](){
        auto it = pending_invites_.find(invite.chat_room_id);
        if (it == pending_invites_.end() || it->second.from != invite.from) {
            PLOG_WARNING << "Invite from " << invite.from << " to " << invite.chat_room_id << " is no longer pending.";
            return false;
        }
        if (active_session_) {
            PLOG_WARNING << "Refuse to accept " << invite.chat_room_id << " while in call " << active_session_->chat_room_id();
            return false;
        }
        auto pending_invite = it->second;
        CallSession::Params params;
        params.chat_room_id = pending_invite.chat_room_id;
        params.call_type = pending_invite.call_type;
        params.role = CallSession::Role::CALLEE;
        params.caller_id = pending_invite.from;
        params.participants = pending_invite.participants;
        for (const auto& user_id : {pending_invite.from, config_.local_user_id}) {
            if (std::find(params.participants.begin(), params.participants.end(), user_id) == params.participants.end()) {
                params.participants.push_back(user_id);
            }
        }
        if (!StartSession(std::move(params))) {
            return false;
        }
        pending_invites_.erase(pending_invite.chat_room_id);
        return true;
    });
}

void CallSessionManager::DeclineIncoming(const signaling::Invite& invite) {
    task_queue_->Sync([&](){
        auto it = pending_invites_.find(invite.chat_room_id);
        if (it != pending_invites_.end() && it->second.from == invite.from) {
            PLOG_INFO << "Declined call from " << invite.from << " in " << invite.chat_room_id;
            pending_invites_.erase(it);
        }
    });
}

void CallSessionManager::EndCall() {
    task_queue_->Sync([this](){
        if (!active_session_) {
            return;
        }
        auto session = std::move(active_session_);
        active_session_.reset();
        session->End(CallSession::EndReason::LOCAL_HANGUP);
    });
}

bool CallSessionManager::ToggleMute() {
    return task_queue_->Sync<bool>([this](){
        return active_session_ ? active_session_->ToggleMute() : false;
    });
}

bool CallSessionManager::ToggleVideo() {
    return task_queue_->Sync<bool>([this](){
        return active_session_ ? active_session_->ToggleVideo() : true;
    });
}

bool CallSessionManager::in_call() const {
    return task_queue_->Sync<bool>([this](){
        return active_session_ != nullptr;
    });
}

std::shared_ptr<CallSession> CallSessionManager::active_session() const {
    return task_queue_->Sync<std::shared_ptr<CallSession>>([this](){
        return active_session_;
    });
}

std::vector<signaling::Invite> CallSessionManager::pending_invites() const {
    return task_queue_->Sync<std::vector<signaling::Invite>>([this](){
        std::vector<signaling::Invite> invites;
        for (const auto& [chat_room_id, invite] : pending_invites_) {
            invites.push_back(invite);
        }
        return invites;
    });
}

void CallSessionManager::Shutdown() {
    EndCall();
    task_queue_->Sync([this](){
        pending_invites_.clear();
        if (invites_channel_) {
            invites_channel_->Close();
        }
    });
}

// Private methods
void CallSessionManager::Init(std::shared_ptr<signaling::PushNotifier> push_notifier) {
    task_queue_->Sync([this, push_notifier](){
        invites_channel_ = std::make_shared<signaling::InvitesChannel>(transport_, config_.invites_channel_name, task_queue_);
        signaling::InvitationDispatcher::Configuration dispatcher_config;
        dispatcher_config.local_user_id = config_.local_user_id;
        dispatcher_config.voice_call_title = config_.voice_call_title;
        dispatcher_config.video_call_title = config_.video_call_title;
        dispatcher_config.body = config_.push_body;
        dispatcher_config.tag_prefix = config_.push_tag_prefix;
        dispatcher_ = std::make_unique<signaling::InvitationDispatcher>(dispatcher_config,
                                                                        invites_channel_,
                                                                        push_notifier,
                                                                        weak_from_this());
    });
}

bool CallSessionManager::StartSession(CallSession::Params params) {
    if (active_session_) {
        PLOG_WARNING << "Refuse to start call " << params.chat_room_id << " while in call " << active_session_->chat_room_id();
        return false;
    }
    try {
        active_session_ = CallSession::Create(config_,
                                              std::move(params),
                                              media_engine_,
                                              transport_,
                                              dispatcher_.get(),
                                              task_queue_,
                                              weak_from_this());
    } catch (const std::invalid_argument& exp) {
        PLOG_ERROR << "Failed to create call session: " << exp.what();
        return false;
    }
    active_session_->Start();
    return true;
}

// Implements signaling::InvitationDispatcher::Observer
void CallSessionManager::OnInvite(const signaling::Invite& invite) {
    if (active_session_ && active_session_->chat_room_id() == invite.chat_room_id) {
        return;
    }
    auto it = pending_invites_.find(invite.chat_room_id);
    if (it != pending_invites_.end() &&
        it->second.from == invite.from &&
        it->second.timestamp == invite.timestamp &&
        it->second.timestamp_text == invite.timestamp_text) {
        return;
    }
    PLOG_INFO << "Incoming " << invite.call_type << " call from " << invite.from << " in " << invite.chat_room_id;
    pending_invites_[invite.chat_room_id] = invite;
    if (auto observer = observer_.lock()) {
        observer->OnIncomingInvite(invite);
    }
}

void CallSessionManager::OnInviteCancelled(const signaling::CallCancelled& call_cancelled) {
    auto it = pending_invites_.find(call_cancelled.chat_room_id);
    if (it != pending_invites_.end() && it->second.from == call_cancelled.from) {
        PLOG_INFO << call_cancelled.from << " cancelled the call in " << call_cancelled.chat_room_id;
        pending_invites_.erase(it);
    } else if (active_session_ && active_session_->chat_room_id() == call_cancelled.chat_room_id) {
        // Accepted already, the session decides whether it is too late.
        if (!active_session_->HandleInviteCancelled(call_cancelled.from)) {
            PLOG_DEBUG << "Ignore cancellation of " << call_cancelled.chat_room_id << " after negotiation began.";
            return;
        }
        active_session_.reset();
    } else {
        PLOG_DEBUG << "Ignore cancellation of " << call_cancelled.chat_room_id << " which is not pending.";
        return;
    }
    if (auto observer = observer_.lock()) {
        observer->OnInviteCancelled(call_cancelled);
    }
}

// Implements CallSession::Observer
void CallSessionManager::OnSessionEnded(std::shared_ptr<CallSession> session,
                                        CallSession::EndReason reason,
                                        const std::string& error) {
    if (session == active_session_) {
        active_session_.reset();
    }
    auto observer = observer_.lock();
    if (!observer) {
        return;
    }
    if (reason == CallSession::EndReason::MEDIA_FAILURE ||
        reason == CallSession::EndReason::SIGNALING_FAILURE) {
        observer->OnCallFailed(session->chat_room_id(), error);
    } else {
        observer->OnCallEnded(session->chat_room_id());
    }
}

void CallSessionManager::OnRemoteParticipantConnected(std::shared_ptr<CallSession> session,
                                                      const std::string& remote_user_id) {
    if (session != active_session_) {
        return;
    }
    if (auto observer = observer_.lock()) {
        observer->OnRemoteParticipantConnected(remote_user_id);
    }
}

void CallSessionManager::OnRemoteMediaTrack(std::shared_ptr<CallSession> session,
                                            const std::string& remote_user_id,
                                            std::shared_ptr<MediaTrack> track) {
    if (session != active_session_) {
        return;
    }
    if (auto observer = observer_.lock()) {
        observer->OnRemoteMediaTrack(remote_user_id, std::move(track));
    }
}

} // namespace naivecall
