#ifndef _CALL_DEMO_CLIENT_H_
#define _CALL_DEMO_CLIENT_H_

#include <call/call_session_manager.hpp>
#include <common/task_queue.hpp>
#include <signaling/local_broadcast_hub.hpp>
#include <testing/fake_media_engine.hpp>

#include <boost/asio.hpp>

#include <memory>
#include <set>
#include <string>

// A simulated device which answers every call it is invited to.
class Client : public naivecall::CallSessionManager::Observer,
               public std::enable_shared_from_this<Client> {
public:
    static std::shared_ptr<Client> Create(naivecall::CallConfiguration config,
                                          naivecall::signaling::LocalBroadcastHub* hub,
                                          boost::asio::io_context& ioc);
    ~Client() override;

    const std::string& user_id() const { return user_id_; }
    naivecall::CallSessionManager& manager() { return *manager_; }

    void Start();
    void Stop();

    size_t connected_count() const;

private:
    Client(naivecall::CallConfiguration config,
           naivecall::signaling::LocalBroadcastHub* hub,
           boost::asio::io_context& ioc);

    // Implements naivecall::CallSessionManager::Observer
    void OnIncomingInvite(const naivecall::signaling::Invite& invite) override;
    void OnInviteCancelled(const naivecall::signaling::CallCancelled& call_cancelled) override;
    void OnCallFailed(const std::string& chat_room_id, const std::string& error) override;
    void OnCallEnded(const std::string& chat_room_id) override;
    void OnRemoteParticipantConnected(const std::string& remote_user_id) override;
    void OnRemoteMediaTrack(const std::string& remote_user_id, std::shared_ptr<naivecall::MediaTrack> track) override;

private:
    const naivecall::CallConfiguration config_;
    const std::string user_id_;
    naivecall::signaling::LocalBroadcastHub* const hub_;
    boost::asio::io_context& ioc_;

    naivecall::TaskQueue task_queue_;
    naivecall::test::FakeMediaEngine media_engine_;
    std::shared_ptr<naivecall::CallSessionManager> manager_;
    // Accessed on `task_queue_`.
    std::set<std::string> connected_;
};

#endif
