#include "testing/fake_media_engine.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace naivecall {
namespace test {
namespace {

using Record = FakeMediaEngine::TransportRecord;
using Behavior = FakeMediaEngine::Behavior;

class FakeMediaTransport : public MediaTransport {
public:
    FakeMediaTransport(std::string label,
                       std::shared_ptr<Record> record,
                       std::shared_ptr<Behavior> behavior,
                       TaskQueue* task_queue)
        : label_(std::move(label)),
          record_(std::move(record)),
          behavior_(std::move(behavior)),
          task_queue_(task_queue) {}

    void AddTrack(std::shared_ptr<MediaTrack> track) override {
        record_->added_track_ids.push_back(track->track_id());
    }

    void CreateOffer(DescriptionCallback on_success, FailureCallback on_failure) override {
        auto record = record_;
        auto behavior = behavior_;
        auto sdp = label_ + " offer " + std::to_string(record->offers_created + 1);
        task_queue_->Async([this_label=label_, record, behavior, sdp, on_success, on_failure, task_queue=task_queue_](){
            if (record->closed) {
                return;
            }
            if (behavior->fail_create_offer) {
                on_failure(std::runtime_error("Failed to create offer."));
                return;
            }
            ++record->offers_created;
            record->local_description = sdp;
            record->local_type = SdpType::OFFER;
            on_success(sdp);
            GatherCandidates(this_label, record, behavior, task_queue);
        });
    }

    void CreateAnswer(DescriptionCallback on_success, FailureCallback on_failure) override {
        auto record = record_;
        auto behavior = behavior_;
        auto sdp = label_ + " answer " + std::to_string(record->answers_created + 1);
        task_queue_->Async([this_label=label_, record, behavior, sdp, on_success, on_failure, task_queue=task_queue_](){
            if (record->closed) {
                return;
            }
            if (!record->remote_description) {
                on_failure(std::logic_error("No remote offer to answer."));
                return;
            }
            ++record->answers_created;
            record->local_description = sdp;
            record->local_type = SdpType::ANSWER;
            on_success(sdp);
            GatherCandidates(this_label, record, behavior, task_queue);
            MaybeConnect(record, behavior, task_queue);
        });
    }

    void SetRemoteDescription(std::string sdp,
                              SdpType type,
                              SuccessCallback on_success,
                              FailureCallback on_failure) override {
        auto record = record_;
        auto behavior = behavior_;
        task_queue_->Async([record, behavior, sdp, type, on_success, on_failure, task_queue=task_queue_](){
            if (record->closed) {
                return;
            }
            if (behavior->fail_remote_description) {
                on_failure(std::runtime_error("Failed to apply remote " + naivecall::ToString(type) + "."));
                return;
            }
            if (type == SdpType::OFFER && record->local_type == SdpType::OFFER) {
                // Rollback
                record->local_description.reset();
                record->local_type.reset();
            }
            if (type == SdpType::ANSWER && record->local_type != SdpType::OFFER) {
                on_failure(std::logic_error("Unexpected remote answer."));
                return;
            }
            record->remote_description = sdp;
            ++record->remote_descriptions_applied;
            on_success();
            if (behavior->emit_remote_track && record->remote_track_callback) {
                record->remote_track_callback(std::make_shared<MediaTrack>(MediaTrack::Kind::AUDIO,
                                                                           "remote-audio-" + record->remote_user_id));
            }
            MaybeConnect(record, behavior, task_queue);
        });
    }

    void AddRemoteCandidate(const Candidate& candidate) override {
        if (record_->closed) {
            throw std::invalid_argument("Transport is closed.");
        }
        if (!record_->remote_description) {
            throw std::invalid_argument("Remote description is not set.");
        }
        if (behavior_->fail_remote_candidates) {
            throw std::invalid_argument("Invalid candidate: " + candidate.sdp);
        }
        record_->applied_candidates.push_back(candidate);
    }

    void Close() override {
        record_->closed = true;
        record_->state = State::CLOSED;
    }

    void OnLocalCandidate(CandidateCallback callback) override {
        record_->candidate_callback = std::move(callback);
    }

    void OnStateChanged(StateCallback callback) override {
        record_->state_callback = std::move(callback);
    }

    void OnRemoteTrack(RemoteTrackCallback callback) override {
        record_->remote_track_callback = std::move(callback);
    }

private:
    static void GatherCandidates(const std::string& label,
                                 std::shared_ptr<Record> record,
                                 std::shared_ptr<Behavior> behavior,
                                 TaskQueue* task_queue) {
        for (int i = 0; i < behavior->candidates_per_description; ++i) {
            Candidate candidate("candidate:" + label + "-" + std::to_string(record->offers_created + record->answers_created)
                                + "-" + std::to_string(i) + " 1 udp 2122260223 192.168.1.2 5000" + " typ host", "0", 0);
            task_queue->Async([record, candidate](){
                if (!record->closed && record->candidate_callback) {
                    record->candidate_callback(candidate);
                }
            });
        }
    }

    static void MaybeConnect(std::shared_ptr<Record> record,
                             std::shared_ptr<Behavior> behavior,
                             TaskQueue* task_queue) {
        if (!behavior->auto_connect ||
            !record->local_description ||
            !record->remote_description ||
            record->state != State::NEW) {
            return;
        }
        task_queue->Async([record](){
            for (auto state : {State::CONNECTING, State::CONNECTED}) {
                if (record->closed) {
                    return;
                }
                record->state = state;
                if (record->state_callback) {
                    record->state_callback(state);
                }
            }
        });
    }

private:
    const std::string label_;
    std::shared_ptr<Record> record_;
    std::shared_ptr<Behavior> behavior_;
    TaskQueue* const task_queue_;
};

} // namespace

FakeMediaEngine::FakeMediaEngine(std::string label, TaskQueue* task_queue)
    : label_(std::move(label)),
      task_queue_(task_queue),
      behavior_(std::make_shared<Behavior>()) {}

FakeMediaEngine::~FakeMediaEngine() = default;

void FakeMediaEngine::GetUserMedia(const MediaConstraints& constraints,
                                   UserMediaCallback on_success,
                                   FailureCallback on_failure) {
    ++user_media_requests_;
    PendingRequest request{constraints, std::move(on_success), std::move(on_failure)};
    if (behavior_->hold_user_media) {
        pending_request_ = std::make_unique<PendingRequest>(std::move(request));
        return;
    }
    CompleteUserMedia(std::move(request));
}

std::unique_ptr<MediaTransport> FakeMediaEngine::CreateTransport(const RtcConfiguration& config,
                                                                 const std::string& remote_user_id,
                                                                 TaskQueue* task_queue) {
    auto record = std::make_shared<TransportRecord>();
    record->remote_user_id = remote_user_id;
    transports_[remote_user_id] = record;
    PLOG_VERBOSE << label_ << " creates transport to " << remote_user_id
                 << " with " << config.ice_servers.size() << " ICE servers";
    return std::make_unique<FakeMediaTransport>(label_, record, behavior_, task_queue ? task_queue : task_queue_);
}

void FakeMediaEngine::ResolvePendingUserMedia() {
    if (!pending_request_) {
        return;
    }
    auto request = std::move(*pending_request_);
    pending_request_.reset();
    CompleteUserMedia(std::move(request));
}

std::shared_ptr<FakeMediaEngine::TransportRecord> FakeMediaEngine::transport_for(const std::string& remote_user_id) const {
    auto it = transports_.find(remote_user_id);
    return it != transports_.end() ? it->second : nullptr;
}

void FakeMediaEngine::SimulateTransportState(const std::string& remote_user_id, MediaTransport::State state) {
    auto record = transport_for(remote_user_id);
    if (!record) {
        throw std::invalid_argument("No transport to " + remote_user_id);
    }
    task_queue_->Async([record, state](){
        record->state = state;
        if (record->state_callback) {
            record->state_callback(state);
        }
    });
}

// Private methods
void FakeMediaEngine::CompleteUserMedia(PendingRequest request) {
    auto behavior = behavior_;
    std::shared_ptr<MediaStream> stream;
    if (!behavior->fail_user_media) {
        stream = std::make_shared<MediaStream>(label_ + "-stream-" + std::to_string(user_media_requests_));
        if (request.constraints.audio) {
            stream->AddTrack(std::make_shared<MediaTrack>(MediaTrack::Kind::AUDIO, label_ + "-audio-" + std::to_string(user_media_requests_)));
        }
        if (request.constraints.video && !behavior->drop_video) {
            stream->AddTrack(std::make_shared<MediaTrack>(MediaTrack::Kind::VIDEO, label_ + "-video-" + std::to_string(user_media_requests_)));
        }
        streams_.push_back(stream);
    }
    task_queue_->Async([stream, request=std::move(request)](){
        if (stream) {
            request.on_success(stream);
        } else {
            request.on_failure(std::runtime_error("Permission denied."));
        }
    });
}

} // namespace test
} // namespace naivecall
