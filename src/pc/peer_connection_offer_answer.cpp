#include "pc/peer_connection.hpp"
#include "common/task_queue.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace naivecall {

// Offer && Answer
void PeerConnection::StartNegotiation() {
    if (state_ != State::NEW || creating_offer_) {
        PLOG_VERBOSE << "Negotiation with " << config_.remote_user_id << " already started, state: " << state_;
        return;
    }
    creating_offer_ = true;
    const int generation = offer_generation_;
    auto weak_this = weak_from_this();
    transport_->CreateOffer([weak_this, generation](std::string sdp){
        auto strong_this = weak_this.lock();
        if (!strong_this || strong_this->offer_generation_ != generation) {
            return;
        }
        strong_this->creating_offer_ = false;
        strong_this->SendLocalOffer(sdp);
    }, [weak_this, generation](const std::exception& exp){
        auto strong_this = weak_this.lock();
        if (!strong_this || strong_this->offer_generation_ != generation) {
            return;
        }
        strong_this->creating_offer_ = false;
        strong_this->OnNegotiationFailure("create offer", exp);
    });
}

void PeerConnection::HandleRemoteOffer(const std::string& sdp) {
    switch (state_) {
    case State::NEW:
        if (creating_offer_) {
            if (!config_.polite) {
                PLOG_DEBUG << "Offer collision with " << config_.remote_user_id << ", keep the local offer.";
                return;
            }
            PLOG_DEBUG << "Offer collision with " << config_.remote_user_id << ", drop the local offer being created.";
            creating_offer_ = false;
            ++offer_generation_;
        }
        ApplyRemoteOffer(sdp);
        break;
    case State::LOCAL_OFFER_SENT:
        if (!config_.polite || applying_answer_) {
            PLOG_DEBUG << "Offer collision with " << config_.remote_user_id << ", keep waiting for the answer.";
            return;
        }
        PLOG_DEBUG << "Offer collision with " << config_.remote_user_id << ", roll back the local offer.";
        ++offer_generation_;
        local_offer_sdp_.clear();
        local_candidates_.clear();
        ApplyRemoteOffer(sdp);
        break;
    case State::REMOTE_OFFER_RECEIVED:
        PLOG_VERBOSE << "Ignore offer from " << config_.remote_user_id << " while answering.";
        break;
    case State::NEGOTIATING:
    case State::CONNECTED:
        if (remote_offer_sdp_ && *remote_offer_sdp_ == sdp && local_answer_sdp_) {
            PLOG_DEBUG << "Repeated offer from " << config_.remote_user_id << ", resend the answer.";
            if (auto observer = observer_.lock()) {
                observer->OnLocalDescription(config_.remote_user_id, SdpType::ANSWER, *local_answer_sdp_);
            }
        } else {
            PLOG_VERBOSE << "Ignore offer from " << config_.remote_user_id << " in state " << state_;
        }
        break;
    case State::CLOSED:
    default:
        break;
    }
}

void PeerConnection::HandleRemoteAnswer(const std::string& sdp) {
    if (state_ != State::LOCAL_OFFER_SENT || applying_answer_) {
        PLOG_VERBOSE << "Ignore answer from " << config_.remote_user_id << " in state " << state_;
        return;
    }
    applying_answer_ = true;
    const int generation = offer_generation_;
    auto weak_this = weak_from_this();
    transport_->SetRemoteDescription(sdp, SdpType::ANSWER, [weak_this, generation](){
        auto strong_this = weak_this.lock();
        if (!strong_this || strong_this->offer_generation_ != generation) {
            return;
        }
        strong_this->applying_answer_ = false;
        strong_this->remote_description_applied_ = true;
        strong_this->UpdateState(State::NEGOTIATING);
        strong_this->ProcessRemoteCandidates();
    }, [weak_this, generation](const std::exception& exp){
        auto strong_this = weak_this.lock();
        if (!strong_this || strong_this->offer_generation_ != generation) {
            return;
        }
        strong_this->applying_answer_ = false;
        strong_this->OnNegotiationFailure("apply answer", exp);
    });
}

void PeerConnection::HandleRemoteCandidate(const Candidate& candidate) {
    if (state_ == State::CLOSED) {
        return;
    }
    if (std::find(received_remote_candidates_.begin(), received_remote_candidates_.end(), candidate) != received_remote_candidates_.end()) {
        PLOG_VERBOSE << "Ignore repeated candidate from " << config_.remote_user_id;
        return;
    }
    received_remote_candidates_.push_back(candidate);
    if (remote_description_applied_) {
        ProcessRemoteCandidate(candidate);
    } else {
        PLOG_VERBOSE << "Buffer candidate from " << config_.remote_user_id << " until the remote description is applied.";
        pending_remote_candidates_.push_back(candidate);
    }
}

// Private methods
void PeerConnection::SendLocalOffer(const std::string& sdp) {
    if (state_ != State::NEW) {
        return;
    }
    local_offer_sdp_ = sdp;
    offer_retransmit_count_ = 0;
    UpdateState(State::LOCAL_OFFER_SENT);
    if (auto observer = observer_.lock()) {
        observer->OnLocalDescription(config_.remote_user_id, SdpType::OFFER, local_offer_sdp_);
    }
    ScheduleOfferRetransmission();
}

void PeerConnection::ApplyRemoteOffer(const std::string& sdp) {
    remote_offer_sdp_ = sdp;
    UpdateState(State::REMOTE_OFFER_RECEIVED);
    auto weak_this = weak_from_this();
    transport_->SetRemoteDescription(sdp, SdpType::OFFER, [weak_this](){
        auto strong_this = weak_this.lock();
        if (!strong_this || strong_this->state_ != State::REMOTE_OFFER_RECEIVED) {
            return;
        }
        strong_this->remote_description_applied_ = true;
        strong_this->ProcessRemoteCandidates();
        strong_this->CreateLocalAnswer();
    }, [weak_this](const std::exception& exp){
        auto strong_this = weak_this.lock();
        if (!strong_this) {
            return;
        }
        strong_this->OnNegotiationFailure("apply offer", exp);
    });
}

void PeerConnection::CreateLocalAnswer() {
    auto weak_this = weak_from_this();
    transport_->CreateAnswer([weak_this](std::string sdp){
        auto strong_this = weak_this.lock();
        if (!strong_this || strong_this->state_ != State::REMOTE_OFFER_RECEIVED) {
            return;
        }
        strong_this->local_answer_sdp_ = sdp;
        if (auto observer = strong_this->observer_.lock()) {
            observer->OnLocalDescription(strong_this->config_.remote_user_id, SdpType::ANSWER, sdp);
        }
        strong_this->UpdateState(State::NEGOTIATING);
    }, [weak_this](const std::exception& exp){
        auto strong_this = weak_this.lock();
        if (!strong_this) {
            return;
        }
        strong_this->OnNegotiationFailure("create answer", exp);
    });
}

void PeerConnection::ProcessRemoteCandidates() {
    auto candidates = std::move(pending_remote_candidates_);
    pending_remote_candidates_.clear();
    for (const auto& candidate : candidates) {
        if (state_ == State::CLOSED) {
            break;
        }
        ProcessRemoteCandidate(candidate);
    }
}

void PeerConnection::ProcessRemoteCandidate(const Candidate& candidate) {
    try {
        transport_->AddRemoteCandidate(candidate);
    } catch (const std::exception& exp) {
        OnNegotiationFailure("add remote candidate", exp);
    }
}

void PeerConnection::ScheduleOfferRetransmission() {
    if (config_.offer_retransmit_interval_ms <= 0) {
        return;
    }
    const int generation = offer_generation_;
    auto weak_this = weak_from_this();
    task_queue_->AsyncAfter(config_.offer_retransmit_interval_ms, [weak_this, generation](){
        if (auto strong_this = weak_this.lock()) {
            strong_this->RetransmitOffer(generation);
        }
    });
}

void PeerConnection::RetransmitOffer(int generation) {
    if (generation != offer_generation_ ||
        state_ != State::LOCAL_OFFER_SENT ||
        applying_answer_) {
        return;
    }
    if (offer_retransmit_count_ >= config_.max_offer_retransmits) {
        PLOG_WARNING << "No answer from " << config_.remote_user_id << " after "
                     << offer_retransmit_count_ << " retransmissions, give up.";
        Close();
        return;
    }
    ++offer_retransmit_count_;
    PLOG_VERBOSE << "Retransmit offer to " << config_.remote_user_id << ", attempt: " << offer_retransmit_count_;
    if (auto observer = observer_.lock()) {
        observer->OnLocalDescription(config_.remote_user_id, SdpType::OFFER, local_offer_sdp_);
        // The observer may close us while sending.
        auto candidates = local_candidates_;
        for (const auto& candidate : candidates) {
            if (state_ != State::LOCAL_OFFER_SENT) {
                return;
            }
            observer->OnLocalCandidate(config_.remote_user_id, candidate);
        }
    }
    ScheduleOfferRetransmission();
}

void PeerConnection::AwaitRemoteOffer() {
    if (state_ != State::NEW || config_.offer_retransmit_interval_ms <= 0) {
        return;
    }
    const TimeInterval timeout_ms = config_.offer_retransmit_interval_ms * (config_.max_offer_retransmits + 1);
    auto weak_this = weak_from_this();
    task_queue_->AsyncAfter(timeout_ms, [weak_this](){
        if (auto strong_this = weak_this.lock()) {
            strong_this->OnRemoteOfferTimeout();
        }
    });
}

void PeerConnection::OnRemoteOfferTimeout() {
    if (state_ != State::NEW || creating_offer_) {
        return;
    }
    PLOG_WARNING << "No offer from " << config_.remote_user_id << ", give up.";
    Close();
}

void PeerConnection::OnNegotiationFailure(const std::string& step, const std::exception& exp) {
    if (state_ == State::CLOSED) {
        return;
    }
    PLOG_ERROR << "Failed to " << step << " with " << config_.remote_user_id << ": " << exp.what();
    Close();
}

} // namespace naivecall
