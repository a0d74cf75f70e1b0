#ifndef _TESTING_TEST_DEVICE_H_
#define _TESTING_TEST_DEVICE_H_

#include "call/call_session_manager.hpp"
#include "common/task_queue.hpp"
#include "signaling/local_broadcast_hub.hpp"
#include "testing/fake_media_engine.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace naivecall {
namespace test {

// Records what the calling surface reports. Written on the device queue,
// read through TestDevice::Read.
class RecordingCallObserver : public CallSessionManager::Observer {
public:
    void OnIncomingInvite(const signaling::Invite& invite) override;
    void OnInviteCancelled(const signaling::CallCancelled& call_cancelled) override;
    void OnCallFailed(const std::string& chat_room_id, const std::string& error) override;
    void OnCallEnded(const std::string& chat_room_id) override;
    void OnRemoteParticipantConnected(const std::string& remote_user_id) override;
    void OnRemoteMediaTrack(const std::string& remote_user_id, std::shared_ptr<MediaTrack> track) override;

    std::vector<signaling::Invite> invites;
    std::vector<signaling::CallCancelled> cancellations;
    std::vector<std::string> failed_calls;
    std::vector<std::string> ended_calls;
    std::vector<std::string> connected_participants;
    std::vector<std::pair<std::string, std::string>> remote_tracks;
};

// One simulated device: its own task queue, media engine and manager.
class TestDevice {
public:
    TestDevice(signaling::LocalBroadcastHub* hub,
               std::string user_id,
               TimeInterval offer_retransmit_interval_ms = 30,
               int max_offer_retransmits = 100);
    ~TestDevice();

    const std::string& user_id() const { return user_id_; }
    TaskQueue& queue() { return queue_; }
    FakeMediaEngine& engine() { return engine_; }
    CallSessionManager& manager() { return *manager_; }

    // Runs `reader` on the device queue.
    template<typename T>
    T Read(std::function<T(const RecordingCallObserver&)> reader) {
        return queue_.Sync<T>([this, reader](){ return reader(*observer_); });
    }

    size_t invite_count() { return Read<size_t>([](const RecordingCallObserver& o){ return o.invites.size(); }); }
    signaling::Invite last_invite() { return Read<signaling::Invite>([](const RecordingCallObserver& o){ return o.invites.back(); }); }
    bool IsConnectedTo(const std::string& remote_user_id);
    bool HasEnded(const std::string& chat_room_id);
    bool HasFailed(const std::string& chat_room_id);

    // The state of the connection towards `remote_user_id` in the active call.
    std::optional<PeerConnection::State> PeerState(const std::string& remote_user_id);

private:
    const std::string user_id_;
    TaskQueue queue_;
    FakeMediaEngine engine_;
    std::shared_ptr<RecordingCallObserver> observer_;
    std::shared_ptr<CallSessionManager> manager_;
};

} // namespace test
} // namespace naivecall

#endif
