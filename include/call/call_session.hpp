#ifndef _CALL_CALL_SESSION_H_
#define _CALL_CALL_SESSION_H_

#include "base/defines.hpp"
#include "call/call_configuration.hpp"
#include "pc/media_engine.hpp"
#include "pc/peer_connection.hpp"
#include "pc/peer_connection_registry.hpp"
#include "signaling/call_channel.hpp"
#include "signaling/invitation_dispatcher.hpp"

#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace naivecall {

// CallSession
// One call on this device: the local media, the per-call signaling channel
// and one peer connection per remote participant. Lives on the device
// task queue, every method must be called from it.
class NAIVECALL_CPP_EXPORT CallSession : public signaling::CallChannel::Observer,
                                         public PeerConnection::Observer,
                                         public std::enable_shared_from_this<CallSession> {
public:
    enum class Role {
        CALLER,
        CALLEE
    };

    enum class State {
        NEW,
        ACQUIRING_MEDIA,
        JOINING,
        ACTIVE,
        ENDED
    };

    enum class EndReason {
        LOCAL_HANGUP,
        // Every remote participant left or could not be reached.
        REMOTE_HANGUP,
        MEDIA_FAILURE,
        SIGNALING_FAILURE
    };

    struct Params {
        std::string chat_room_id;
        signaling::CallType call_type = signaling::CallType::VOICE;
        Role role = Role::CALLER;
        std::string caller_id;
        // Every participant including the caller and the local user.
        std::vector<std::string> participants;
    };

    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnSessionEnded(std::shared_ptr<CallSession> session, EndReason reason, const std::string& error) = 0;
        virtual void OnRemoteParticipantConnected(std::shared_ptr<CallSession> session, const std::string& remote_user_id) = 0;
        virtual void OnRemoteMediaTrack(std::shared_ptr<CallSession> session,
                                        const std::string& remote_user_id,
                                        std::shared_ptr<MediaTrack> track) = 0;
    };

    static std::string ToString(Role role);
    static std::string ToString(State state);
    static std::string ToString(EndReason reason);

    static std::shared_ptr<CallSession> Create(const CallConfiguration& config,
                                               Params params,
                                               MediaEngine* media_engine,
                                               signaling::BroadcastTransport* transport,
                                               signaling::InvitationDispatcher* dispatcher,
                                               TaskQueue* task_queue,
                                               std::weak_ptr<Observer> observer);
public:
    ~CallSession() override;

    const std::string& chat_room_id() const { return params_.chat_room_id; }
    signaling::CallType call_type() const { return params_.call_type; }
    Role role() const { return params_.role; }
    State state() const { return state_; }
    bool ended() const { return state_ == State::ENDED; }
    const std::vector<std::string>& remote_participants() const { return registry_.remote_participants(); }
    const PeerConnectionRegistry& registry() const { return registry_; }
    std::shared_ptr<MediaStream> local_stream() const { return local_stream_; }
    bool muted() const { return muted_; }
    bool video_off() const { return video_off_; }

    // Acquires the local media, then joins the call channel and starts the
    // negotiations. The observer learns about a failure from OnSessionEnded.
    void Start();

    // Tears the call down, every step runs even if a former one fails.
    // Only the first call has an effect.
    void End(EndReason reason, const std::string& error = "");

    // A cancellation from the caller ends a callee session as long as the
    // negotiation with the caller has not begun. Returns true if it ended.
    bool HandleInviteCancelled(const std::string& from);

    // Return the new muted / video-off state.
    bool ToggleMute();
    bool ToggleVideo();

    // Implements signaling::CallChannel::Observer
    void OnRemoteOffer(const signaling::Offer& offer) override;
    void OnRemoteAnswer(const signaling::Answer& answer) override;
    void OnRemoteCandidate(const signaling::IceCandidate& candidate) override;
    void OnRemoteCallEnded(const signaling::CallEnded& call_ended) override;

    // Implements PeerConnection::Observer
    void OnLocalDescription(const std::string& remote_user_id, SdpType type, const std::string& sdp) override;
    void OnLocalCandidate(const std::string& remote_user_id, const Candidate& candidate) override;
    void OnStateChanged(const std::string& remote_user_id, PeerConnection::State state) override;

private:
    CallSession(const CallConfiguration& config,
                Params params,
                MediaEngine* media_engine,
                signaling::BroadcastTransport* transport,
                signaling::InvitationDispatcher* dispatcher,
                TaskQueue* task_queue,
                std::weak_ptr<Observer> observer);
    DISALLOW_COPY_AND_ASSIGN(CallSession);

    void OnUserMedia(std::shared_ptr<MediaStream> stream);
    void Join();
    void OnCallChannelSubscribed(boost::system::error_code ec);
    bool ShouldInitiate(const std::string& remote_user_id) const;
    std::shared_ptr<PeerConnection> CreatePeerConnection(const std::string& remote_user_id);
    std::shared_ptr<PeerConnection> PeerFor(const std::string& remote_user_id);
    void CancelUnansweredInvites();

private:
    const CallConfiguration config_;
    const Params params_;
    MediaEngine* const media_engine_;
    signaling::BroadcastTransport* const transport_;
    signaling::InvitationDispatcher* const dispatcher_;
    TaskQueue* const task_queue_;
    std::weak_ptr<Observer> observer_;

    State state_ = State::NEW;
    bool invites_sent_ = false;
    bool muted_ = false;
    bool video_off_ = false;

    std::shared_ptr<MediaStream> local_stream_;
    std::unique_ptr<signaling::CallChannel> call_channel_;
    PeerConnectionRegistry registry_;
    std::set<std::string> negotiated_participants_;
};

NAIVECALL_CPP_EXPORT std::ostream& operator<<(std::ostream& out, CallSession::State state);
NAIVECALL_CPP_EXPORT std::ostream& operator<<(std::ostream& out, CallSession::EndReason reason);

} // namespace naivecall

#endif
