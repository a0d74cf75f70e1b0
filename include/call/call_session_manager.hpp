#ifndef _CALL_CALL_SESSION_MANAGER_H_
#define _CALL_CALL_SESSION_MANAGER_H_

#include "base/defines.hpp"
#include "call/call_configuration.hpp"
#include "call/call_session.hpp"
#include "signaling/invitation_dispatcher.hpp"
#include "signaling/invites_channel.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace naivecall {

class TaskQueue;

// CallSessionManager
// The calling surface of one device. Owns the single active call session and
// the invitations waiting for an answer. Public methods may be called from
// any thread, observer callbacks run on the device task queue.
class NAIVECALL_CPP_EXPORT CallSessionManager : public signaling::InvitationDispatcher::Observer,
                                                public CallSession::Observer,
                                                public std::enable_shared_from_this<CallSessionManager> {
public:
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnIncomingInvite(const signaling::Invite& invite) = 0;
        virtual void OnInviteCancelled(const signaling::CallCancelled& call_cancelled) {}
        virtual void OnCallFailed(const std::string& chat_room_id, const std::string& error) {}
        virtual void OnCallEnded(const std::string& chat_room_id) = 0;
        virtual void OnRemoteParticipantConnected(const std::string& remote_user_id) = 0;
        virtual void OnRemoteMediaTrack(const std::string& remote_user_id, std::shared_ptr<MediaTrack> track) {}
    };

    // Throws std::invalid_argument if `config` is invalid.
    static std::shared_ptr<CallSessionManager> Create(CallConfiguration config,
                                                      MediaEngine* media_engine,
                                                      signaling::BroadcastTransport* transport,
                                                      std::shared_ptr<signaling::PushNotifier> push_notifier,
                                                      TaskQueue* task_queue,
                                                      std::weak_ptr<Observer> observer);
public:
    ~CallSessionManager() override;

    const CallConfiguration& config() const { return config_; }

    // Starts listening for invitations.
    void Start();

    // Returns false if a call is already active or the roster has nobody to call.
    bool StartCall(const std::string& chat_room_id,
                   const std::vector<std::string>& roster,
                   signaling::CallType call_type);

    // Returns false if the invite is no longer pending (cancelled, declined
    // or never received) or a call is already active.
    bool AcceptIncoming(const signaling::Invite& invite);
    void DeclineIncoming(const signaling::Invite& invite);

    void EndCall();

    bool ToggleMute();
    bool ToggleVideo();

    bool in_call() const;
    std::shared_ptr<CallSession> active_session() const;
    std::vector<signaling::Invite> pending_invites() const;

    // Ends the active call and stops listening for invitations.
    void Shutdown();

private:
    CallSessionManager(CallConfiguration config,
                       MediaEngine* media_engine,
                       signaling::BroadcastTransport* transport,
                       TaskQueue* task_queue,
                       std::weak_ptr<Observer> observer);
    DISALLOW_COPY_AND_ASSIGN(CallSessionManager);

    void Init(std::shared_ptr<signaling::PushNotifier> push_notifier);

    bool StartSession(CallSession::Params params);

    // Implements signaling::InvitationDispatcher::Observer
    void OnInvite(const signaling::Invite& invite) override;
    void OnInviteCancelled(const signaling::CallCancelled& call_cancelled) override;

    // Implements CallSession::Observer
    void OnSessionEnded(std::shared_ptr<CallSession> session, CallSession::EndReason reason, const std::string& error) override;
    void OnRemoteParticipantConnected(std::shared_ptr<CallSession> session, const std::string& remote_user_id) override;
    void OnRemoteMediaTrack(std::shared_ptr<CallSession> session,
                            const std::string& remote_user_id,
                            std::shared_ptr<MediaTrack> track) override;

private:
    const CallConfiguration config_;
    MediaEngine* const media_engine_;
    signaling::BroadcastTransport* const transport_;
    TaskQueue* const task_queue_;
    std::weak_ptr<Observer> observer_;

    std::shared_ptr<signaling::InvitesChannel> invites_channel_;
    std::unique_ptr<signaling::InvitationDispatcher> dispatcher_;

    std::shared_ptr<CallSession> active_session_;
    // Keyed by chat room id.
    std::map<std::string, signaling::Invite> pending_invites_;
};

} // namespace naivecall

#endif
