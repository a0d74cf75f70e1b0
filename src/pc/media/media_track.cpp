#include "pc/media/media_track.hpp"

#include <plog/Log.h>

namespace naivecall {

std::string MediaTrack::ToString(Kind kind) {
    switch (kind) {
    case Kind::AUDIO:
        return "audio";
    case Kind::VIDEO:
        return "video";
    default:
        return "unknown";
    }
}

MediaTrack::MediaTrack(Kind kind, std::string track_id) 
    : kind_(kind),
      track_id_(std::move(track_id)) {}

MediaTrack::~MediaTrack() = default;

void MediaTrack::set_enabled(bool enabled) {
    if (stopped_) {
        PLOG_WARNING << "Ignore enabling a stopped track: " << track_id_;
        return;
    }
    enabled_ = enabled;
}

void MediaTrack::Stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    enabled_ = false;
    PLOG_DEBUG << "Local " << kind_ << " track stopped: " << track_id_;
    if (stopped_callback_) {
        auto callback = std::move(stopped_callback_);
        stopped_callback_ = nullptr;
        callback();
    }
}

void MediaTrack::OnStopped(StoppedCallback callback) {
    stopped_callback_ = std::move(callback);
}

// MediaStream
MediaStream::MediaStream(std::string stream_id) 
    : stream_id_(std::move(stream_id)) {}

void MediaStream::AddTrack(std::shared_ptr<MediaTrack> track) {
    if (track) {
        tracks_.push_back(std::move(track));
    }
}

std::vector<std::shared_ptr<MediaTrack>> MediaStream::audio_tracks() const {
    std::vector<std::shared_ptr<MediaTrack>> audio_tracks;
    for (const auto& track : tracks_) {
        if (track->kind() == MediaTrack::Kind::AUDIO) {
            audio_tracks.push_back(track);
        }
    }
    return audio_tracks;
}

std::vector<std::shared_ptr<MediaTrack>> MediaStream::video_tracks() const {
    std::vector<std::shared_ptr<MediaTrack>> video_tracks;
    for (const auto& track : tracks_) {
        if (track->kind() == MediaTrack::Kind::VIDEO) {
            video_tracks.push_back(track);
        }
    }
    return video_tracks;
}

bool MediaStream::HasTrack(MediaTrack::Kind kind) const {
    for (const auto& track : tracks_) {
        if (track->kind() == kind) {
            return true;
        }
    }
    return false;
}

void MediaStream::Stop() {
    for (auto& track : tracks_) {
        track->Stop();
    }
}

std::ostream& operator<<(std::ostream& out, MediaTrack::Kind kind) {
    out << MediaTrack::ToString(kind);
    return out;
}

} // namespace naivecall
