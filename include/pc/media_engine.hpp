#ifndef _PC_MEDIA_ENGINE_H_
#define _PC_MEDIA_ENGINE_H_

#include "base/defines.hpp"
#include "pc/candidate.hpp"
#include "pc/configuration.hpp"
#include "pc/media/media_track.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

namespace naivecall {

class TaskQueue;

enum class SdpType {
    OFFER,
    ANSWER
};

NAIVECALL_CPP_EXPORT std::string ToString(SdpType type);

// The negotiated media path to one remote participant, provided by 
// a real-time media engine. Every callback is invoked on the task queue
// the transport was created with, never inline from the calling method.
class NAIVECALL_CPP_EXPORT MediaTransport {
public:
    enum class State {
        NEW,
        CONNECTING,
        CONNECTED,
        DISCONNECTED,
        FAILED,
        CLOSED
    };

    using DescriptionCallback = std::function<void(std::string sdp)>;
    using SuccessCallback = std::function<void()>;
    using FailureCallback = std::function<void(const std::exception& exp)>;
    using CandidateCallback = std::function<void(Candidate candidate)>;
    using StateCallback = std::function<void(State state)>;
    using RemoteTrackCallback = std::function<void(std::shared_ptr<MediaTrack> track)>;

    static std::string ToString(State state);
public:
    virtual ~MediaTransport() = default;

    virtual void AddTrack(std::shared_ptr<MediaTrack> track) = 0;

    // Creates a local description and applies it.
    virtual void CreateOffer(DescriptionCallback on_success, FailureCallback on_failure) = 0;
    virtual void CreateAnswer(DescriptionCallback on_success, FailureCallback on_failure) = 0;

    // Applying a remote offer while holding a local offer rolls the local one back.
    virtual void SetRemoteDescription(std::string sdp, 
                                      SdpType type, 
                                      SuccessCallback on_success, 
                                      FailureCallback on_failure) = 0;

    // Throws std::invalid_argument if the candidate can not be applied.
    virtual void AddRemoteCandidate(const Candidate& candidate) = 0;

    virtual void Close() = 0;

    virtual void OnLocalCandidate(CandidateCallback callback) = 0;
    virtual void OnStateChanged(StateCallback callback) = 0;
    virtual void OnRemoteTrack(RemoteTrackCallback callback) = 0;
};

// MediaEngine
class NAIVECALL_CPP_EXPORT MediaEngine {
public:
    using UserMediaCallback = std::function<void(std::shared_ptr<MediaStream> stream)>;
    using FailureCallback = std::function<void(const std::exception& exp)>;
public:
    virtual ~MediaEngine() = default;

    // Acquires the capture devices named by `constraints`. The stream may 
    // lack a requested kind, it is up to the caller to reject it.
    virtual void GetUserMedia(const MediaConstraints& constraints, 
                              UserMediaCallback on_success, 
                              FailureCallback on_failure) = 0;

    virtual std::unique_ptr<MediaTransport> CreateTransport(const RtcConfiguration& config,
                                                            const std::string& remote_user_id,
                                                            TaskQueue* task_queue) = 0;
};

NAIVECALL_CPP_EXPORT std::ostream& operator<<(std::ostream& out, SdpType type);
NAIVECALL_CPP_EXPORT std::ostream& operator<<(std::ostream& out, MediaTransport::State state);

} // namespace naivecall

#endif
