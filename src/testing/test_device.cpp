#include "testing/test_device.hpp"
#include "testing/queue_helpers.hpp"

#include <algorithm>

namespace naivecall {
namespace test {

// RecordingCallObserver
void RecordingCallObserver::OnIncomingInvite(const signaling::Invite& invite) {
    invites.push_back(invite);
}

void RecordingCallObserver::OnInviteCancelled(const signaling::CallCancelled& call_cancelled) {
    cancellations.push_back(call_cancelled);
}

void RecordingCallObserver::OnCallFailed(const std::string& chat_room_id, const std::string& error) {
    failed_calls.push_back(chat_room_id);
}

void RecordingCallObserver::OnCallEnded(const std::string& chat_room_id) {
    ended_calls.push_back(chat_room_id);
}

void RecordingCallObserver::OnRemoteParticipantConnected(const std::string& remote_user_id) {
    connected_participants.push_back(remote_user_id);
}

void RecordingCallObserver::OnRemoteMediaTrack(const std::string& remote_user_id, std::shared_ptr<MediaTrack> track) {
    remote_tracks.emplace_back(remote_user_id, track->track_id());
}

// TestDevice
TestDevice::TestDevice(signaling::LocalBroadcastHub* hub,
                       std::string user_id,
                       TimeInterval offer_retransmit_interval_ms,
                       int max_offer_retransmits)
    : user_id_(std::move(user_id)),
      queue_("TestDevice." + user_id_),
      engine_(user_id_, &queue_),
      observer_(std::make_shared<RecordingCallObserver>()) {
    CallConfiguration config;
    config.local_user_id = user_id_;
    config.offer_retransmit_interval_ms = offer_retransmit_interval_ms;
    config.max_offer_retransmits = max_offer_retransmits;
    manager_ = CallSessionManager::Create(config, &engine_, hub, nullptr, &queue_, observer_);
    manager_->Start();
    // Listening once the invites channel acknowledged the subscription.
    DrainQueues({&queue_});
}

TestDevice::~TestDevice() {
    manager_->Shutdown();
    manager_.reset();
}

bool TestDevice::IsConnectedTo(const std::string& remote_user_id) {
    return Read<bool>([remote_user_id](const RecordingCallObserver& o){
        return std::find(o.connected_participants.begin(), o.connected_participants.end(), remote_user_id) 
            != o.connected_participants.end();
    });
}

bool TestDevice::HasEnded(const std::string& chat_room_id) {
    return Read<bool>([chat_room_id](const RecordingCallObserver& o){
        return std::find(o.ended_calls.begin(), o.ended_calls.end(), chat_room_id) != o.ended_calls.end();
    });
}

bool TestDevice::HasFailed(const std::string& chat_room_id) {
    return Read<bool>([chat_room_id](const RecordingCallObserver& o){
        return std::find(o.failed_calls.begin(), o.failed_calls.end(), chat_room_id) != o.failed_calls.end();
    });
}

std::optional<PeerConnection::State> TestDevice::PeerState(const std::string& remote_user_id) {
    return queue_.Sync<std::optional<PeerConnection::State>>([this, remote_user_id]() -> std::optional<PeerConnection::State> {
        auto session = manager_->active_session();
        if (!session) {
            return std::nullopt;
        }
        auto peer_connection = session->registry().Find(remote_user_id);
        if (!peer_connection) {
            return std::nullopt;
        }
        return peer_connection->state();
    });
}

} // namespace test
} // namespace naivecall
