#include "pc/peer_connection_registry.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>

namespace naivecall {

PeerConnectionRegistry::PeerConnectionRegistry(std::string local_user_id, 
                                               const std::vector<std::string>& roster, 
                                               Factory factory)
    : local_user_id_(std::move(local_user_id)),
      factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("PeerConnectionRegistry requires a factory.");
    }
    for (const auto& user_id : roster) {
        if (user_id.empty() || user_id == local_user_id_) {
            continue;
        }
        remote_participants_.push_back(user_id);
    }
    std::sort(remote_participants_.begin(), remote_participants_.end());
    remote_participants_.erase(std::unique(remote_participants_.begin(), remote_participants_.end()), 
                               remote_participants_.end());
}

PeerConnectionRegistry::~PeerConnectionRegistry() {
    CloseAll();
}

bool PeerConnectionRegistry::IsRemoteParticipant(const std::string& user_id) const {
    return std::binary_search(remote_participants_.begin(), remote_participants_.end(), user_id);
}

std::shared_ptr<PeerConnection> PeerConnectionRegistry::GetOrCreate(const std::string& remote_user_id) {
    if (closed_) {
        return nullptr;
    }
    auto it = peer_connections_.find(remote_user_id);
    if (it != peer_connections_.end()) {
        return it->second;
    }
    if (!IsRemoteParticipant(remote_user_id)) {
        PLOG_WARNING << "Reject peer connection with " << remote_user_id << ", not a participant.";
        return nullptr;
    }
    auto peer_connection = factory_(remote_user_id);
    if (!peer_connection) {
        return nullptr;
    }
    peer_connections_.emplace(remote_user_id, peer_connection);
    BindRemoteMedia(remote_user_id, peer_connection);
    return peer_connection;
}

std::shared_ptr<PeerConnection> PeerConnectionRegistry::Find(const std::string& remote_user_id) const {
    auto it = peer_connections_.find(remote_user_id);
    return it != peer_connections_.end() ? it->second : nullptr;
}

size_t PeerConnectionRegistry::AttachLocalMedia(const std::shared_ptr<PeerConnection>& peer_connection, 
                                                const MediaStream& media_stream) {
    if (!peer_connection) {
        return 0;
    }
    size_t attached = 0;
    for (const auto& track : media_stream.tracks()) {
        if (peer_connection->AddLocalTrack(track)) {
            ++attached;
        }
    }
    return attached;
}

void PeerConnectionRegistry::OnRemoteMediaAttached(RemoteMediaCallback callback) {
    remote_media_callback_ = std::move(callback);
    for (const auto& [remote_user_id, peer_connection] : peer_connections_) {
        BindRemoteMedia(remote_user_id, peer_connection);
    }
}

void PeerConnectionRegistry::CloseAll() {
    if (closed_) {
        return;
    }
    closed_ = true;
    PLOG_DEBUG << "Closing " << peer_connections_.size() << " peer connections.";
    // Closing notifies observers, which may look the registry up again.
    auto peer_connections = peer_connections_;
    for (auto& [remote_user_id, peer_connection] : peer_connections) {
        try {
            peer_connection->Close();
        } catch (const std::exception& exp) {
            PLOG_WARNING << "Failed to close peer connection with " << remote_user_id << ": " << exp.what();
        }
    }
}

bool PeerConnectionRegistry::AllClosed() const {
    return std::all_of(peer_connections_.begin(), peer_connections_.end(), [](const auto& pair){
        return pair.second->is_closed();
    });
}

void PeerConnectionRegistry::ForEach(Visitor visitor) const {
    for (const auto& [remote_user_id, peer_connection] : peer_connections_) {
        visitor(remote_user_id, peer_connection);
    }
}

// Private methods
void PeerConnectionRegistry::BindRemoteMedia(const std::string& remote_user_id, 
                                             const std::shared_ptr<PeerConnection>& peer_connection) {
    if (!remote_media_callback_) {
        return;
    }
    peer_connection->OnRemoteMediaTrackReceived([callback=remote_media_callback_, remote_user_id](std::shared_ptr<MediaTrack> track){
        callback(remote_user_id, std::move(track));
    });
}

} // namespace naivecall
