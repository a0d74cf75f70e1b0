#ifndef _TESTING_FAKE_MEDIA_ENGINE_H_
#define _TESTING_FAKE_MEDIA_ENGINE_H_

#include "pc/media_engine.hpp"
#include "common/task_queue.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace naivecall {
namespace test {

// A scriptable media engine. Like a real engine, every completion and
// transport event is delivered asynchronously on the device queue.
class FakeMediaEngine : public MediaEngine {
public:
    struct Behavior {
        bool fail_user_media = false;
        // Omits the video track of a video request.
        bool drop_video = false;
        // GetUserMedia waits for ResolvePendingUserMedia.
        bool hold_user_media = false;
        bool fail_create_offer = false;
        bool fail_remote_description = false;
        bool fail_remote_candidates = false;
        // Reports CONNECTED once both descriptions are applied.
        bool auto_connect = true;
        // Local candidates gathered after each local description.
        int candidates_per_description = 1;
        // One remote audio track per applied remote description.
        bool emit_remote_track = true;
    };

    // What one transport has been asked to do.
    struct TransportRecord {
        std::string remote_user_id;
        std::vector<std::string> added_track_ids;
        std::vector<Candidate> applied_candidates;
        std::optional<std::string> local_description;
        std::optional<SdpType> local_type;
        std::optional<std::string> remote_description;
        int offers_created = 0;
        int answers_created = 0;
        int remote_descriptions_applied = 0;
        bool closed = false;
        MediaTransport::State state = MediaTransport::State::NEW;
        MediaTransport::StateCallback state_callback = nullptr;
        MediaTransport::CandidateCallback candidate_callback = nullptr;
        MediaTransport::RemoteTrackCallback remote_track_callback = nullptr;
    };

public:
    FakeMediaEngine(std::string label, TaskQueue* task_queue);
    ~FakeMediaEngine() override;

    Behavior& behavior() { return *behavior_; }
    const std::string& label() const { return label_; }

    void GetUserMedia(const MediaConstraints& constraints,
                      UserMediaCallback on_success,
                      FailureCallback on_failure) override;

    std::unique_ptr<MediaTransport> CreateTransport(const RtcConfiguration& config,
                                                    const std::string& remote_user_id,
                                                    TaskQueue* task_queue) override;

    // Completes a held GetUserMedia request.
    void ResolvePendingUserMedia();
    bool has_pending_user_media() const { return pending_request_ != nullptr; }

    int user_media_requests() const { return user_media_requests_; }
    const std::vector<std::shared_ptr<MediaStream>>& streams() const { return streams_; }

    // The most recent transport created towards `remote_user_id`.
    std::shared_ptr<TransportRecord> transport_for(const std::string& remote_user_id) const;
    size_t transport_count() const { return transports_.size(); }

    // Reports `state` from the transport towards `remote_user_id`.
    void SimulateTransportState(const std::string& remote_user_id, MediaTransport::State state);

private:
    struct PendingRequest {
        MediaConstraints constraints;
        UserMediaCallback on_success;
        FailureCallback on_failure;
    };

    void CompleteUserMedia(PendingRequest request);

private:
    const std::string label_;
    TaskQueue* const task_queue_;
    std::shared_ptr<Behavior> behavior_;
    int user_media_requests_ = 0;
    std::unique_ptr<PendingRequest> pending_request_;
    std::vector<std::shared_ptr<MediaStream>> streams_;
    std::map<std::string, std::shared_ptr<TransportRecord>> transports_;
};

} // namespace test
} // namespace naivecall

#endif
