#ifndef _PC_MEDIA_TRACK_H_
#define _PC_MEDIA_TRACK_H_

#include "base/defines.hpp"

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace naivecall {

// A local capture track or a remote track surfaced by the media engine.
// Local tracks are owned by the call session, peer connections only 
// keep references for attaching them.
class NAIVECALL_CPP_EXPORT MediaTrack {
public:
    enum class Kind {
        AUDIO,
        VIDEO
    };

    using StoppedCallback = std::function<void()>;

    static std::string ToString(Kind kind);
public:
    MediaTrack(Kind kind, std::string track_id);
    ~MediaTrack();

    Kind kind() const { return kind_; }
    const std::string& track_id() const { return track_id_; }

    bool enabled() const { return enabled_; }
    void set_enabled(bool enabled);

    bool stopped() const { return stopped_; }
    // Releases the underlying device, the callback registered
    // by the capturer fires once.
    void Stop();

    void OnStopped(StoppedCallback callback);

private:
    DISALLOW_COPY_AND_ASSIGN(MediaTrack);

    const Kind kind_;
    const std::string track_id_;
    bool enabled_ = true;
    bool stopped_ = false;
    StoppedCallback stopped_callback_ = nullptr;
};

// MediaStream
class NAIVECALL_CPP_EXPORT MediaStream {
public:
    explicit MediaStream(std::string stream_id);

    const std::string& stream_id() const { return stream_id_; }

    void AddTrack(std::shared_ptr<MediaTrack> track);

    const std::vector<std::shared_ptr<MediaTrack>>& tracks() const { return tracks_; }
    std::vector<std::shared_ptr<MediaTrack>> audio_tracks() const;
    std::vector<std::shared_ptr<MediaTrack>> video_tracks() const;

    bool HasTrack(MediaTrack::Kind kind) const;

    // Stops every track, safe to call more than once.
    void Stop();

private:
    const std::string stream_id_;
    std::vector<std::shared_ptr<MediaTrack>> tracks_;
};

// MediaConstraints
struct NAIVECALL_CPP_EXPORT MediaConstraints {
    bool audio = true;
    bool video = false;
};

NAIVECALL_CPP_EXPORT std::ostream& operator<<(std::ostream& out, MediaTrack::Kind kind);

} // namespace naivecall

#endif
