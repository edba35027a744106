#pragma once

#include "fwd.hpp"
#include "chat_message.hpp"
#include "envelope.hpp"
#include "identity.hpp"
#include "negotiator.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace beam {

struct PeerInfo {
    std::string id;
    std::string name;
    ConnectionState state = ConnectionState::Idle;
    bool channelOpen = false;
};

// Keeps one Negotiator per remote peer in the current room and routes
// signaling between them and the transport. Must only be used from the
// thread running the Loop the transport and link factory post to.
class MeshCoordinator {
public:
    using MessageCallback = std::function<void(const ChatMessage&)>;
    using PeerCallback = std::function<void(const PeerRef&)>;
    using RosterCallback = std::function<void(const std::vector<PeerInfo>&)>;
    using RoomJoinedCallback = std::function<void(const std::string& roomId, const std::vector<PeerRef>& peers)>;
    using RoomsListCallback = std::function<void(const std::vector<RoomSummary>&)>;
    using GatheringCallback = std::function<void(const std::string& peerId)>;

    MeshCoordinator(PeerIdentity self, std::shared_ptr<SignalingTransport> transport, std::shared_ptr<LinkFactory> factory);
    ~MeshCoordinator();

    MeshCoordinator(const MeshCoordinator&) = delete;
    MeshCoordinator& operator=(const MeshCoordinator&) = delete;

    // Throws Error{TransportUnavailable}.
    void Connect();

    // Connects first if needed. Any current room is abandoned.
    void Join(const std::string& roomId);

    // Joins `roomId`, or a freshly generated room id when it is empty.
    // Returns the room id that was requested.
    std::string CreateOrJoin(const std::optional<std::string>& roomId = std::nullopt);

    ChatMessage SendMessage(const std::string& text);
    void Leave();
    void RequestRooms();

    // Peers with an open channel. This is what OnRosterChange reports.
    std::vector<PeerInfo> Roster() const;

    // Every record, including ones still negotiating or already dropped by
    // the link. Diagnostics only.
    std::vector<PeerInfo> AllPeers() const;

    const std::string& RoomId() const {
        return RoomId_;
    }

    const PeerIdentity& Self() const {
        return Self_;
    }

    void OnMessage(MessageCallback callback) { OnMessage_ = std::move(callback); }
    void OnPeerJoin(PeerCallback callback) { OnPeerJoin_ = std::move(callback); }
    void OnPeerLeave(PeerCallback callback) { OnPeerLeave_ = std::move(callback); }
    void OnPeerFailed(PeerCallback callback) { OnPeerFailed_ = std::move(callback); }
    void OnRosterChange(RosterCallback callback) { OnRosterChange_ = std::move(callback); }
    void OnRoomJoined(RoomJoinedCallback callback) { OnRoomJoined_ = std::move(callback); }
    void OnRoomsList(RoomsListCallback callback) { OnRoomsList_ = std::move(callback); }
    void OnGatheringComplete(GatheringCallback callback) { OnGatheringComplete_ = std::move(callback); }

private:
    void Dispatch(const Envelope& envelope);

    void Handle(const JoinSignal& signal);
    void Handle(const RoomJoinedSignal& signal);
    void Handle(const PeerJoinedSignal& signal);
    void Handle(const PeerLeftSignal& signal);
    void Handle(const OfferSignal& signal);
    void Handle(const AnswerSignal& signal);
    void Handle(const CandidateSignal& signal);
    void Handle(const GetRoomsSignal& signal);
    void Handle(const RoomsListSignal& signal);
    void Handle(const AnnounceSignal& signal);
    void Handle(const LeaveSignal& signal);

    std::shared_ptr<Negotiator> CreateRecord(const PeerRef& remote);
    std::shared_ptr<Negotiator> FindRecord(const std::string& peerId) const;
    void StartOffer(const PeerRef& remote);
    void RemovePeer(const PeerRef& peer);
    void HandleFailure(Negotiator& record);
    void HandleChannelPayload(Negotiator& record, const std::string& payload);
    void ResetRoom();
    void NotifyRoster();

private:
    PeerIdentity Self_;
    std::shared_ptr<SignalingTransport> Transport_;
    std::shared_ptr<LinkFactory> Factory_;

    std::string RoomId_;
    std::map<std::string, std::shared_ptr<Negotiator>> Records_;
    std::set<std::string> KnownPeers_;
    std::map<std::string, std::vector<IceCandidate>> HeldCandidates_;

    MessageCallback OnMessage_;
    PeerCallback OnPeerJoin_;
    PeerCallback OnPeerLeave_;
    PeerCallback OnPeerFailed_;
    RosterCallback OnRosterChange_;
    RoomJoinedCallback OnRoomJoined_;
    RoomsListCallback OnRoomsList_;
    GatheringCallback OnGatheringComplete_;
};

} // namespace beam
