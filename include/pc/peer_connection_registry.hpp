#ifndef _PC_PEER_CONNECTION_REGISTRY_H_
#define _PC_PEER_CONNECTION_REGISTRY_H_

#include "base/defines.hpp"
#include "pc/peer_connection.hpp"
#include "pc/media/media_track.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace naivecall {

// The peer connections of one call session, keyed by remote user id.
// Only members of the roster fixed at creation get a connection.
class NAIVECALL_CPP_EXPORT PeerConnectionRegistry {
public:
    using Factory = std::function<std::shared_ptr<PeerConnection>(const std::string& remote_user_id)>;
    using RemoteMediaCallback = std::function<void(const std::string& remote_user_id, std::shared_ptr<MediaTrack> track)>;
    using Visitor = std::function<void(const std::string& remote_user_id, const std::shared_ptr<PeerConnection>& peer_connection)>;
public:
    PeerConnectionRegistry(std::string local_user_id, 
                           const std::vector<std::string>& roster, 
                           Factory factory);
    ~PeerConnectionRegistry();

    const std::string& local_user_id() const { return local_user_id_; }
    // Sorted, without the local user.
    const std::vector<std::string>& remote_participants() const { return remote_participants_; }
    bool IsRemoteParticipant(const std::string& user_id) const;

    // Returns nullptr for the local user, users outside the roster and
    // once the registry is closed.
    std::shared_ptr<PeerConnection> GetOrCreate(const std::string& remote_user_id);
    std::shared_ptr<PeerConnection> Find(const std::string& remote_user_id) const;

    // Returns the number of tracks newly attached to `peer_connection`.
    size_t AttachLocalMedia(const std::shared_ptr<PeerConnection>& peer_connection, const MediaStream& media_stream);

    void OnRemoteMediaAttached(RemoteMediaCallback callback);

    // Closes every connection, only the first call has an effect.
    void CloseAll();
    bool closed() const { return closed_; }

    // True if no created connection is still open.
    bool AllClosed() const;

    size_t size() const { return peer_connections_.size(); }
    void ForEach(Visitor visitor) const;

private:
    DISALLOW_COPY_AND_ASSIGN(PeerConnectionRegistry);

    void BindRemoteMedia(const std::string& remote_user_id, const std::shared_ptr<PeerConnection>& peer_connection);

private:
    const std::string local_user_id_;
    std::vector<std::string> remote_participants_;
    Factory factory_;
    RemoteMediaCallback remote_media_callback_ = nullptr;
    std::map<std::string, std::shared_ptr<PeerConnection>> peer_connections_;
    bool closed_ = false;
};

} // namespace naivecall

#endif
