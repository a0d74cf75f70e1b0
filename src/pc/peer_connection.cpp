#include "pc/peer_connection.hpp"
#include "common/task_queue.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>

namespace naivecall {
namespace {

int Rank(PeerConnection::State state) {
    using State = PeerConnection::State;
    switch (state) {
    case State::NEW:
        return 0;
    case State::LOCAL_OFFER_SENT:
    case State::REMOTE_OFFER_RECEIVED:
        return 1;
    case State::NEGOTIATING:
        return 2;
    case State::CONNECTED:
        return 3;
    case State::CLOSED:
        return 4;
    default:
        return 4;
    }
}

} // namespace

bool PeerConnection::IsPolite(const std::string& local_user_id, const std::string& remote_user_id) {
    return local_user_id < remote_user_id;
}

std::shared_ptr<PeerConnection> PeerConnection::Create(Configuration config,
                                                       std::unique_ptr<MediaTransport> transport,
                                                       TaskQueue* task_queue,
                                                       std::weak_ptr<Observer> observer) {
    if (!transport || !task_queue) {
        throw std::invalid_argument("PeerConnection requires a media transport and a task queue.");
    }
    if (config.remote_user_id.empty() || config.remote_user_id == config.local_user_id) {
        throw std::invalid_argument("Invalid remote user id: " + config.remote_user_id);
    }
    auto peer_connection = std::shared_ptr<PeerConnection>(new PeerConnection(std::move(config),
                                                                              std::move(transport),
                                                                              task_queue,
                                                                              std::move(observer)));
    peer_connection->Init();
    return peer_connection;
}

PeerConnection::PeerConnection(Configuration config,
                               std::unique_ptr<MediaTransport> transport,
                               TaskQueue* task_queue,
                               std::weak_ptr<Observer> observer)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      task_queue_(task_queue),
      observer_(std::move(observer)) {}

PeerConnection::~PeerConnection() {
    if (state_ != State::CLOSED) {
        PLOG_WARNING << "Destroying unclosed peer connection with " << config_.remote_user_id;
        try {
            transport_->Close();
        } catch (const std::exception& exp) {
            PLOG_WARNING << "Failed to close media transport: " << exp.what();
        }
    }
}

bool PeerConnection::AddLocalTrack(std::shared_ptr<MediaTrack> track) {
    if (!track || state_ == State::CLOSED) {
        return false;
    }
    if (std::find(attached_track_ids_.begin(), attached_track_ids_.end(), track->track_id()) != attached_track_ids_.end()) {
        PLOG_VERBOSE << "Track " << track->track_id() << " is already attached to " << config_.remote_user_id;
        return false;
    }
    transport_->AddTrack(track);
    attached_track_ids_.push_back(track->track_id());
    return true;
}

void PeerConnection::Close() {
    if (state_ == State::CLOSED) {
        return;
    }
    PLOG_DEBUG << "Closing peer connection with " << config_.remote_user_id << " in state " << state_;
    ++offer_generation_;
    creating_offer_ = false;
    applying_answer_ = false;
    pending_remote_candidates_.clear();
    pending_remote_tracks_.clear();
    try {
        transport_->Close();
    } catch (const std::exception& exp) {
        PLOG_WARNING << "Failed to close media transport of " << config_.remote_user_id << ": " << exp.what();
    }
    UpdateState(State::CLOSED);
    remote_track_callback_ = nullptr;
}

void PeerConnection::OnRemoteMediaTrackReceived(MediaTrackCallback callback) {
    remote_track_callback_ = std::move(callback);
    if (!remote_track_callback_) {
        return;
    }
    auto pending_tracks = std::move(pending_remote_tracks_);
    pending_remote_tracks_.clear();
    for (auto& track : pending_tracks) {
        remote_track_callback_(std::move(track));
    }
}

// Private methods
void PeerConnection::Init() {
    transport_->OnStateChanged(weak_bind(&PeerConnection::OnTransportStateChanged, this, std::placeholders::_1));
    transport_->OnLocalCandidate(weak_bind(&PeerConnection::OnTransportCandidate, this, std::placeholders::_1));
    transport_->OnRemoteTrack(weak_bind(&PeerConnection::OnTransportRemoteTrack, this, std::placeholders::_1));
}

bool PeerConnection::UpdateState(State state) {
    if (state_ == state || state_ == State::CLOSED) {
        return false;
    }
    if (Rank(state) < Rank(state_)) {
        PLOG_WARNING << "Ignore state regression from " << state_ << " to " << state
                     << " with " << config_.remote_user_id;
        return false;
    }
    PLOG_DEBUG << "Peer connection with " << config_.remote_user_id << ": " << state_ << " -> " << state;
    state_ = state;
    if (auto observer = observer_.lock()) {
        observer->OnStateChanged(config_.remote_user_id, state_);
    }
    return true;
}

void PeerConnection::OnTransportStateChanged(MediaTransport::State transport_state) {
    if (state_ == State::CLOSED) {
        return;
    }
    PLOG_VERBOSE << "Media transport with " << config_.remote_user_id << " is " << transport_state;
    switch (transport_state) {
    case MediaTransport::State::CONNECTED:
        if (state_ == State::NEGOTIATING) {
            UpdateState(State::CONNECTED);
        }
        break;
    case MediaTransport::State::FAILED:
    case MediaTransport::State::CLOSED:
        Close();
        break;
    default:
        break;
    }
}

void PeerConnection::OnTransportCandidate(Candidate candidate) {
    if (state_ == State::CLOSED) {
        return;
    }
    local_candidates_.push_back(candidate);
    if (auto observer = observer_.lock()) {
        observer->OnLocalCandidate(config_.remote_user_id, candidate);
    }
}

void PeerConnection::OnTransportRemoteTrack(std::shared_ptr<MediaTrack> track) {
    if (state_ == State::CLOSED || !track) {
        return;
    }
    PLOG_DEBUG << "Remote " << track->kind() << " track " << track->track_id() << " from " << config_.remote_user_id;
    if (remote_track_callback_) {
        remote_track_callback_(std::move(track));
    } else {
        pending_remote_tracks_.push_back(std::move(track));
    }
}

std::string PeerConnection::ToString(State state) {
    switch (state) {
    case State::NEW:
        return "new";
    case State::LOCAL_OFFER_SENT:
        return "local-offer-sent";
    case State::REMOTE_OFFER_RECEIVED:
        return "remote-offer-received";
    case State::NEGOTIATING:
        return "negotiating";
    case State::CONNECTED:
        return "connected";
    case State::CLOSED:
        return "closed";
    default:
        return "unknown";
    }
}

std::ostream& operator<<(std::ostream& out, PeerConnection::State state) {
    out << PeerConnection::ToString(state);
    return out;
}

} // namespace naivecall
