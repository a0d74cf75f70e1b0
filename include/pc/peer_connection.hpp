#ifndef _PC_PEER_CONNECTION_H_
#define _PC_PEER_CONNECTION_H_

#include "base/defines.hpp"
#include "pc/candidate.hpp"
#include "pc/media_engine.hpp"
#include "pc/media/media_track.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace naivecall {

class TaskQueue;

// PeerConnection
// The offer/answer handshake with one remote participant. All methods
// must be called on the task queue passed to Create, which is also the
// queue the media transport reports on.
class NAIVECALL_CPP_EXPORT PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
    // The states never regress, LOCAL_OFFER_SENT and REMOTE_OFFER_RECEIVED
    // share the same rank and CLOSED is terminal.
    enum class State {
        NEW,
        LOCAL_OFFER_SENT,
        REMOTE_OFFER_RECEIVED,
        NEGOTIATING,
        CONNECTED,
        CLOSED
    };

    struct Configuration {
        std::string local_user_id;
        std::string remote_user_id;
        // The polite side gives up its own offer on glare.
        bool polite = false;
        // 0 disables offer retransmission.
        TimeInterval offer_retransmit_interval_ms = 2000;
        int max_offer_retransmits = 15;
    };

    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void OnLocalDescription(const std::string& remote_user_id, SdpType type, const std::string& sdp) = 0;
        virtual void OnLocalCandidate(const std::string& remote_user_id, const Candidate& candidate) = 0;
        virtual void OnStateChanged(const std::string& remote_user_id, State state) = 0;
    };

    using MediaTrackCallback = std::function<void(std::shared_ptr<MediaTrack> track)>;

    static std::string ToString(State state);
    static bool IsPolite(const std::string& local_user_id, const std::string& remote_user_id);

    static std::shared_ptr<PeerConnection> Create(Configuration config,
                                                  std::unique_ptr<MediaTransport> transport,
                                                  TaskQueue* task_queue,
                                                  std::weak_ptr<Observer> observer);
public:
    ~PeerConnection();

    const std::string& remote_user_id() const { return config_.remote_user_id; }
    State state() const { return state_; }
    bool is_closed() const { return state_ == State::CLOSED; }
    bool local_media_attached() const { return !attached_track_ids_.empty(); }
    size_t pending_remote_candidate_count() const { return pending_remote_candidates_.size(); }

    // Returns false if a track with the same id is already attached.
    bool AddLocalTrack(std::shared_ptr<MediaTrack> track);

    // Initiator path, NEW -> LOCAL_OFFER_SENT.
    void StartNegotiation();

    // Responder path. Closes the connection if no offer arrived within the
    // window the remote side keeps retransmitting for, i.e.
    // offer_retransmit_interval_ms * (max_offer_retransmits + 1).
    // Does nothing if retransmission is disabled.
    void AwaitRemoteOffer();

    void HandleRemoteOffer(const std::string& sdp);
    void HandleRemoteAnswer(const std::string& sdp);
    void HandleRemoteCandidate(const Candidate& candidate);

    void Close();

    void OnRemoteMediaTrackReceived(MediaTrackCallback callback);

private:
    PeerConnection(Configuration config,
                   std::unique_ptr<MediaTransport> transport,
                   TaskQueue* task_queue,
                   std::weak_ptr<Observer> observer);
    DISALLOW_COPY_AND_ASSIGN(PeerConnection);

    void Init();

    bool UpdateState(State state);

    // Negotiation
    void SendLocalOffer(const std::string& sdp);
    void ApplyRemoteOffer(const std::string& sdp);
    void CreateLocalAnswer();
    void ProcessRemoteCandidates();
    void ProcessRemoteCandidate(const Candidate& candidate);
    void ScheduleOfferRetransmission();
    void RetransmitOffer(int generation);
    void OnRemoteOfferTimeout();
    void OnNegotiationFailure(const std::string& step, const std::exception& exp);

    // MediaTransport callbacks
    void OnTransportStateChanged(MediaTransport::State transport_state);
    void OnTransportCandidate(Candidate candidate);
    void OnTransportRemoteTrack(std::shared_ptr<MediaTrack> track);

private:
    const Configuration config_;
    std::unique_ptr<MediaTransport> transport_;
    TaskQueue* const task_queue_;
    std::weak_ptr<Observer> observer_;

    State state_ = State::NEW;

    bool creating_offer_ = false;
    bool applying_answer_ = false;
    bool remote_description_applied_ = false;
    // Bumped whenever the pending local offer is dropped.
    int offer_generation_ = 0;
    int offer_retransmit_count_ = 0;

    std::string local_offer_sdp_;
    std::optional<std::string> remote_offer_sdp_;
    std::optional<std::string> local_answer_sdp_;

    std::vector<Candidate> local_candidates_;
    std::vector<Candidate> received_remote_candidates_;
    std::vector<Candidate> pending_remote_candidates_;

    std::vector<std::string> attached_track_ids_;

    MediaTrackCallback remote_track_callback_ = nullptr;
    std::vector<std::shared_ptr<MediaTrack>> pending_remote_tracks_;
};

NAIVECALL_CPP_EXPORT std::ostream& operator<<(std::ostream& out, PeerConnection::State state);

} // namespace naivecall

#endif
