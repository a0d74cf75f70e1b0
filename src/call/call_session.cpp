#include "call/call_session.hpp"
#include "common/task_queue.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>

namespace naivecall {

std::shared_ptr<CallSession> CallSession::Create(const CallConfiguration& config,
                                                 Params params,
                                                 MediaEngine* media_engine,
                                                 signaling::BroadcastTransport* transport,
                                                 signaling::InvitationDispatcher* dispatcher,
                                                 TaskQueue* task_queue,
                                                 std::weak_ptr<Observer> observer) {
    if (!media_engine || !transport || !task_queue) {
        throw std::invalid_argument("CallSession requires a media engine, a broadcast transport and a task queue.");
    }
    if (params.chat_room_id.empty()) {
        throw std::invalid_argument("CallSession requires a chat room id.");
    }
    return std::shared_ptr<CallSession>(new CallSession(config,
                                                        std::move(params),
                                                        media_engine,
                                                        transport,
                                                        dispatcher,
                                                        task_queue,
                                                        std::move(observer)));
}

CallSession::CallSession(const CallConfiguration& config,
                         Params params,
                         MediaEngine* media_engine,
                         signaling::BroadcastTransport* transport,
                         signaling::InvitationDispatcher* dispatcher,
                         TaskQueue* task_queue,
                         std::weak_ptr<Observer> observer)
    : config_(config),
      params_(std::move(params)),
      media_engine_(media_engine),
      transport_(transport),
      dispatcher_(dispatcher),
      task_queue_(task_queue),
      observer_(std::move(observer)),
      video_off_(params_.call_type == signaling::CallType::VOICE),
      registry_(config_.local_user_id, params_.participants, [this](const std::string& remote_user_id){
          return CreatePeerConnection(remote_user_id);
      }) {
    if (registry_.remote_participants().empty()) {
        throw std::invalid_argument("A call needs at least one remote participant.");
    }
}

CallSession::~CallSession() {
    if (state_ != State::ENDED) {
        PLOG_WARNING << "Destroying call session " << params_.chat_room_id << " in state " << state_;
    }
}

void CallSession::Start() {
    if (state_ != State::NEW) {
        return;
    }
    state_ = State::ACQUIRING_MEDIA;
    MediaConstraints constraints;
    constraints.audio = true;
    constraints.video = params_.call_type == signaling::CallType::VIDEO;
    PLOG_INFO << "Starting " << params_.call_type << " call in " << params_.chat_room_id
              << " as " << ToString(params_.role);

    auto weak_this = weak_from_this();
    media_engine_->GetUserMedia(constraints, [weak_this](std::shared_ptr<MediaStream> stream){
        if (auto strong_this = weak_this.lock()) {
            strong_this->OnUserMedia(std::move(stream));
        } else if (stream) {
            stream->Stop();
        }
    }, [weak_this](const std::exception& exp){
        auto strong_this = weak_this.lock();
        if (!strong_this || strong_this->ended()) {
            return;
        }
        PLOG_ERROR << "Failed to acquire local media: " << exp.what();
        strong_this->End(EndReason::MEDIA_FAILURE, exp.what());
    });
}

void CallSession::End(EndReason reason, const std::string& error) {
    if (state_ == State::ENDED) {
        return;
    }
    const auto prev_state = state_;
    state_ = State::ENDED;
    PLOG_INFO << "Ending call " << params_.chat_room_id << " in state " << prev_state << ", reason: " << reason;

    // 1. Tell the others.
    try {
        if (call_channel_ && call_channel_->is_subscribed()) {
            call_channel_->SendCallEnded();
        }
    } catch (const std::exception& exp) {
        PLOG_WARNING << "Failed to send call ended: " << exp.what();
    }
    if (reason == EndReason::LOCAL_HANGUP) {
        try {
            CancelUnansweredInvites();
        } catch (const std::exception& exp) {
            PLOG_WARNING << "Failed to cancel invitations: " << exp.what();
        }
    }

    // 2. Close every peer connection.
    try {
        registry_.CloseAll();
    } catch (const std::exception& exp) {
        PLOG_WARNING << "Failed to close peer connections: " << exp.what();
    }

    // 3. Release the capture devices.
    try {
        if (local_stream_) {
            local_stream_->Stop();
        }
    } catch (const std::exception& exp) {
        PLOG_WARNING << "Failed to stop local tracks: " << exp.what();
    }

    // 4. Leave the call channel.
    try {
        if (call_channel_) {
            call_channel_->Unsubscribe();
        }
    } catch (const std::exception& exp) {
        PLOG_WARNING << "Failed to unsubscribe call channel: " << exp.what();
    }

    // Reported on the next turn, End may run inside a peer connection callback.
    task_queue_->Async([strong_this=shared_from_this(), reason, error](){
        if (auto observer = strong_this->observer_.lock()) {
            observer->OnSessionEnded(strong_this, reason, error);
        }
    });
}

bool CallSession::HandleInviteCancelled(const std::string& from) {
    if (state_ == State::ENDED || params_.role != Role::CALLEE || from != params_.caller_id) {
        return false;
    }
    // Negotiation with the caller has begun, its CallEnded reaches us on the call channel.
    auto peer_connection = registry_.Find(params_.caller_id);
    if (peer_connection && peer_connection->state() != PeerConnection::State::NEW) {
        return false;
    }
    PLOG_INFO << from << " cancelled call " << params_.chat_room_id << " before it was answered.";
    End(EndReason::REMOTE_HANGUP);
    return true;
}

bool CallSession::ToggleMute() {
    if (!local_stream_) {
        return muted_;
    }
    auto audio_tracks = local_stream_->audio_tracks();
    if (audio_tracks.empty()) {
        return muted_;
    }
    auto& track = audio_tracks.front();
    track->set_enabled(!track->enabled());
    muted_ = !track->enabled();
    PLOG_DEBUG << (muted_ ? "Muted" : "Unmuted") << " call " << params_.chat_room_id;
    return muted_;
}

bool CallSession::ToggleVideo() {
    if (!local_stream_) {
        return video_off_;
    }
    auto video_tracks = local_stream_->video_tracks();
    if (video_tracks.empty()) {
        return video_off_;
    }
    auto& track = video_tracks.front();
    track->set_enabled(!track->enabled());
    video_off_ = !track->enabled();
    PLOG_DEBUG << "Video " << (video_off_ ? "off" : "on") << " in call " << params_.chat_room_id;
    return video_off_;
}

// Implements signaling::CallChannel::Observer
void CallSession::OnRemoteOffer(const signaling::Offer& offer) {
    if (state_ != State::ACTIVE) {
        return;
    }
    if (auto peer_connection = PeerFor(offer.from)) {
        peer_connection->HandleRemoteOffer(offer.sdp);
    }
}

void CallSession::OnRemoteAnswer(const signaling::Answer& answer) {
    if (state_ != State::ACTIVE) {
        return;
    }
    if (auto peer_connection = registry_.Find(answer.from)) {
        peer_connection->HandleRemoteAnswer(answer.sdp);
    } else {
        PLOG_VERBOSE << "Drop answer from " << answer.from << " without a pending offer.";
    }
}

void CallSession::OnRemoteCandidate(const signaling::IceCandidate& candidate) {
    if (state_ != State::ACTIVE) {
        return;
    }
    if (auto peer_connection = PeerFor(candidate.from)) {
        peer_connection->HandleRemoteCandidate(candidate.candidate);
    }
}

void CallSession::OnRemoteCallEnded(const signaling::CallEnded& call_ended) {
    if (state_ != State::ACTIVE) {
        return;
    }
    PLOG_INFO << call_ended.from << " left call " << params_.chat_room_id;
    if (auto peer_connection = registry_.Find(call_ended.from)) {
        peer_connection->Close();
    }
}

// Implements PeerConnection::Observer
void CallSession::OnLocalDescription(const std::string& remote_user_id, SdpType type, const std::string& sdp) {
    if (state_ != State::ACTIVE || !call_channel_) {
        return;
    }
    try {
        if (type == SdpType::OFFER) {
            call_channel_->SendOffer(remote_user_id, sdp);
        } else {
            call_channel_->SendAnswer(remote_user_id, sdp);
        }
    } catch (const std::exception& exp) {
        PLOG_WARNING << "Failed to send " << type << " to " << remote_user_id << ": " << exp.what();
    }
}

void CallSession::OnLocalCandidate(const std::string& remote_user_id, const Candidate& candidate) {
    if (state_ != State::ACTIVE || !call_channel_) {
        return;
    }
    try {
        call_channel_->SendCandidate(remote_user_id, candidate);
    } catch (const std::exception& exp) {
        PLOG_WARNING << "Failed to send candidate to " << remote_user_id << ": " << exp.what();
    }
}

void CallSession::OnStateChanged(const std::string& remote_user_id, PeerConnection::State state) {
    if (state_ != State::ACTIVE) {
        return;
    }
    switch (state) {
    case PeerConnection::State::NEGOTIATING:
        negotiated_participants_.insert(remote_user_id);
        break;
    case PeerConnection::State::CONNECTED:
        negotiated_participants_.insert(remote_user_id);
        PLOG_INFO << remote_user_id << " connected in call " << params_.chat_room_id;
        if (auto observer = observer_.lock()) {
            observer->OnRemoteParticipantConnected(shared_from_this(), remote_user_id);
        }
        break;
    case PeerConnection::State::CLOSED:
        if (registry_.size() == registry_.remote_participants().size() && registry_.AllClosed()) {
            End(EndReason::REMOTE_HANGUP);
        }
        break;
    default:
        break;
    }
}

// Private methods
void CallSession::OnUserMedia(std::shared_ptr<MediaStream> stream) {
    if (!stream) {
        End(EndReason::MEDIA_FAILURE, "No local media.");
        return;
    }
    if (state_ != State::ACQUIRING_MEDIA) {
        // Ended while waiting for the devices.
        PLOG_DEBUG << "Release local media obtained after call " << params_.chat_room_id << " ended.";
        stream->Stop();
        return;
    }
    const bool wants_video = params_.call_type == signaling::CallType::VIDEO;
    if (!stream->HasTrack(MediaTrack::Kind::AUDIO) ||
        (wants_video && !stream->HasTrack(MediaTrack::Kind::VIDEO))) {
        stream->Stop();
        PLOG_ERROR << "Incomplete local media for " << params_.call_type << " call.";
        End(EndReason::MEDIA_FAILURE, "Incomplete local media.");
        return;
    }
    local_stream_ = std::move(stream);
    Join();
}

void CallSession::Join() {
    state_ = State::JOINING;
    const auto name = signaling::CallChannel::ChannelName(config_.call_channel_prefix, params_.chat_room_id);
    try {
        call_channel_ = std::make_unique<signaling::CallChannel>(transport_->CreateChannel(name, task_queue_),
                                                                 params_.chat_room_id,
                                                                 config_.local_user_id,
                                                                 weak_from_this());
    } catch (const std::exception& exp) {
        PLOG_ERROR << "Failed to create call channel " << name << ": " << exp.what();
        End(EndReason::SIGNALING_FAILURE, exp.what());
        return;
    }
    auto weak_this = weak_from_this();
    registry_.OnRemoteMediaAttached([weak_this](const std::string& remote_user_id, std::shared_ptr<MediaTrack> track){
        auto strong_this = weak_this.lock();
        if (!strong_this || strong_this->ended()) {
            return;
        }
        if (auto observer = strong_this->observer_.lock()) {
            observer->OnRemoteMediaTrack(strong_this, remote_user_id, std::move(track));
        }
    });
    call_channel_->Subscribe([weak_this](boost::system::error_code ec){
        if (auto strong_this = weak_this.lock()) {
            strong_this->OnCallChannelSubscribed(ec);
        }
    });
}

void CallSession::OnCallChannelSubscribed(boost::system::error_code ec) {
    if (state_ != State::JOINING) {
        return;
    }
    if (ec) {
        PLOG_ERROR << "Failed to join call channel of " << params_.chat_room_id << ": " << ec.message();
        End(EndReason::SIGNALING_FAILURE, ec.message());
        return;
    }
    state_ = State::ACTIVE;

    if (params_.role == Role::CALLER && dispatcher_) {
        dispatcher_->SendInvite(registry_.remote_participants(),
                                params_.chat_room_id,
                                params_.call_type,
                                params_.participants);
        invites_sent_ = true;
    }

    for (const auto& remote_user_id : registry_.remote_participants()) {
        auto peer_connection = PeerFor(remote_user_id);
        if (!peer_connection) {
            continue;
        }
        if (ShouldInitiate(remote_user_id)) {
            peer_connection->StartNegotiation();
        } else {
            peer_connection->AwaitRemoteOffer();
        }
        if (state_ != State::ACTIVE) {
            break;
        }
    }
}

bool CallSession::ShouldInitiate(const std::string& remote_user_id) const {
    if (params_.role == Role::CALLER) {
        return true;
    }
    if (remote_user_id == params_.caller_id) {
        return false;
    }
    return config_.local_user_id > remote_user_id;
}

std::shared_ptr<PeerConnection> CallSession::CreatePeerConnection(const std::string& remote_user_id) {
    PeerConnection::Configuration pc_config;
    pc_config.local_user_id = config_.local_user_id;
    pc_config.remote_user_id = remote_user_id;
    pc_config.polite = PeerConnection::IsPolite(config_.local_user_id, remote_user_id);
    pc_config.offer_retransmit_interval_ms = config_.offer_retransmit_interval_ms;
    pc_config.max_offer_retransmits = config_.max_offer_retransmits;
    auto media_transport = media_engine_->CreateTransport(config_.rtc_config, remote_user_id, task_queue_);
    return PeerConnection::Create(pc_config, std::move(media_transport), task_queue_, weak_from_this());
}

std::shared_ptr<PeerConnection> CallSession::PeerFor(const std::string& remote_user_id) {
    std::shared_ptr<PeerConnection> peer_connection;
    try {
        peer_connection = registry_.GetOrCreate(remote_user_id);
    } catch (const std::exception& exp) {
        PLOG_ERROR << "Failed to create peer connection with " << remote_user_id << ": " << exp.what();
        return nullptr;
    }
    if (peer_connection && local_stream_) {
        registry_.AttachLocalMedia(peer_connection, *local_stream_);
    }
    return peer_connection;
}

void CallSession::CancelUnansweredInvites() {
    if (params_.role != Role::CALLER || !invites_sent_ || !dispatcher_) {
        return;
    }
    std::vector<std::string> recipients;
    for (const auto& remote_user_id : registry_.remote_participants()) {
        if (negotiated_participants_.count(remote_user_id) == 0) {
            recipients.push_back(remote_user_id);
        }
    }
    if (!recipients.empty()) {
        dispatcher_->SendCancel(recipients, params_.chat_room_id);
    }
}

std::string CallSession::ToString(Role role) {
    switch (role) {
    case Role::CALLER:
        return "caller";
    case Role::CALLEE:
        return "callee";
    default:
        return "unknown";
    }
}

std::string CallSession::ToString(State state) {
    switch (state) {
    case State::NEW:
        return "new";
    case State::ACQUIRING_MEDIA:
        return "acquiring-media";
    case State::JOINING:
        return "joining";
    case State::ACTIVE:
        return "active";
    case State::ENDED:
        return "ended";
    default:
        return "unknown";
    }
}

std::string CallSession::ToString(EndReason reason) {
    switch (reason) {
    case EndReason::LOCAL_HANGUP:
        return "local-hangup";
    case EndReason::REMOTE_HANGUP:
        return "remote-hangup";
    case EndReason::MEDIA_FAILURE:
        return "media-failure";
    case EndReason::SIGNALING_FAILURE:
        return "signaling-failure";
    default:
        return "unknown";
    }
}

std::ostream& operator<<(std::ostream& out, CallSession::State state) {
    out << CallSession::ToString(state);
    return out;
}

std::ostream& operator<<(std::ostream& out, CallSession::EndReason reason) {
    out << CallSession::ToString(reason);
    return out;
}

} // namespace naivecall
