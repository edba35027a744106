#include "mesh_coordinator.hpp"

#include "error.hpp"
#include "signaling_transport.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>

namespace beam {

namespace {

// Early candidates kept per unknown peer before its offer shows up.
constexpr size_t kMaxHeldCandidates = 64;

} // namespace

MeshCoordinator::MeshCoordinator(PeerIdentity self, std::shared_ptr<SignalingTransport> transport, std::shared_ptr<LinkFactory> factory)
    : Self_(std::move(self))
    , Transport_(std::move(transport))
    , Factory_(std::move(factory))
{ }

MeshCoordinator::~MeshCoordinator() {
    for (auto& [id, record] : Records_) {
        record->Teardown();
    }
    Records_.clear();
    Transport_->OnReceive(nullptr);
    Transport_->Close();
}

void MeshCoordinator::Connect() {
    Transport_->OnReceive([this](const Envelope& envelope) {
        Dispatch(envelope);
    });
    Transport_->Connect();
}

void MeshCoordinator::Join(const std::string& roomId) {
    if (!Transport_->IsConnected()) {
        Connect();
    }
    if (!RoomId_.empty()) {
        spdlog::info("Leaving room {} to join {}", RoomId_, NormalizeRoomId(roomId));
        ResetRoom();
    }

    spdlog::info("Joining room {} as {} ({})", NormalizeRoomId(roomId), Self_.displayName, Self_.id);
    Transport_->Send(JoinSignal{NormalizeRoomId(roomId), Self_.id, Self_.displayName});
}

std::string MeshCoordinator::CreateOrJoin(const std::optional<std::string>& roomId) {
    auto id = roomId ? NormalizeRoomId(*roomId) : std::string();
    if (id.empty()) {
        id = GenerateRoomId();
    }
    Join(id);
    return id;
}

ChatMessage MeshCoordinator::SendMessage(const std::string& text) {
    auto message = MakeChatMessage(Self_, text);
    const auto payload = SerializeChatMessage(message);

    size_t delivered = 0;
    for (auto& [id, record] : Records_) {
        if (!record->IsChannelOpen()) {
            continue;
        }
        if (record->Send(payload)) {
            ++delivered;
        }
    }
    spdlog::debug("Message {} sent to {} of {} peers", message.id, delivered, Records_.size());
    return message;
}

void MeshCoordinator::Leave() {
    if (Transport_->IsConnected()) {
        Transport_->Send(LeaveSignal{PeerRef{Self_.id, Self_.displayName}});
    }
    if (!RoomId_.empty()) {
        spdlog::info("Left room {}", RoomId_);
    }
    ResetRoom();
    Transport_->Close();
}

void MeshCoordinator::RequestRooms() {
    Transport_->Send(GetRoomsSignal{});
}

std::vector<PeerInfo> MeshCoordinator::Roster() const {
    std::vector<PeerInfo> roster;
    for (const auto& [id, record] : Records_) {
        if (record->IsChannelOpen()) {
            roster.push_back(PeerInfo{id, record->RemoteName(), record->State(), true});
        }
    }
    return roster;
}

std::vector<PeerInfo> MeshCoordinator::AllPeers() const {
    std::vector<PeerInfo> peers;
    peers.reserve(Records_.size());
    for (const auto& [id, record] : Records_) {
        peers.push_back(PeerInfo{id, record->RemoteName(), record->State(), record->IsChannelOpen()});
    }
    return peers;
}

void MeshCoordinator::Dispatch(const Envelope& envelope) {
    spdlog::trace("Received signaling: {}", EnvelopeType(envelope));
    std::visit([this](const auto& signal) { Handle(signal); }, envelope);
}

void MeshCoordinator::Handle(const JoinSignal& signal) {
    spdlog::debug("Ignoring join from {}", signal.peerId);
}

void MeshCoordinator::Handle(const RoomJoinedSignal& signal) {
    RoomId_ = signal.roomId;
    spdlog::info("Joined room {} with {} peers", RoomId_, signal.peers.size());

    if (OnRoomJoined_) {
        OnRoomJoined_(RoomId_, signal.peers);
    }

    // The newcomer offers to everyone already present.
    for (const auto& peer : signal.peers) {
        if (peer.peerId == Self_.id) {
            continue;
        }
        KnownPeers_.insert(peer.peerId);
        StartOffer(peer);
    }
    NotifyRoster();
}

void MeshCoordinator::Handle(const PeerJoinedSignal& signal) {
    if (signal.peer.peerId == Self_.id) {
        return;
    }
    if (!KnownPeers_.insert(signal.peer.peerId).second) {
        spdlog::debug("[Peer {}] Duplicate peer-joined ignored", signal.peer.peerId);
        return;
    }

    spdlog::info("[Peer {}] {} joined, waiting for offer", signal.peer.peerId, signal.peer.peerName);
    if (OnPeerJoin_) {
        OnPeerJoin_(signal.peer);
    }
}

void MeshCoordinator::Handle(const PeerLeftSignal& signal) {
    RemovePeer(signal.peer);
}

void MeshCoordinator::Handle(const OfferSignal& signal) {
    if (signal.to != Self_.id) {
        spdlog::debug("{}: offer for {}", ToString(ErrorCode::UnmatchedPeer), signal.to);
        return;
    }

    std::vector<IceCandidate> carried;
    if (auto existing = FindRecord(signal.from)) {
        const bool glare = existing->GetRole() == Negotiator::Role::Offerer && !existing->HasRemoteDescription();
        if (glare && Self_.id > signal.from) {
            spdlog::info("[Peer {}] Offer collision, keeping our offer", signal.from);
            return;
        }
        if (!glare && existing->State() != ConnectionState::Disconnected) {
            try {
                existing->ReceiveOffer(*Factory_, signal.offer);
            } catch (const Error& e) {
                spdlog::warn("[Peer {}] {}", signal.from, e.what());
                HandleFailure(*existing);
            }
            return;
        }

        spdlog::info("[Peer {}] Rebuilding connection to answer offer", signal.from);
        carried = existing->TakePendingCandidates();
        existing->Teardown();
        Records_.erase(signal.from);
    }

    PeerRef remote{signal.from, signal.fromName};
    auto record = CreateRecord(remote);
    Records_[remote.peerId] = record;

    if (auto held = HeldCandidates_.find(remote.peerId); held != HeldCandidates_.end()) {
        carried.insert(carried.end(), held->second.begin(), held->second.end());
        HeldCandidates_.erase(held);
    }
    for (const auto& candidate : carried) {
        record->ReceiveCandidate(candidate);
    }

    if (KnownPeers_.insert(remote.peerId).second && OnPeerJoin_) {
        OnPeerJoin_(remote);
    }

    try {
        record->ReceiveOffer(*Factory_, signal.offer);
    } catch (const Error& e) {
        spdlog::warn("[Peer {}] {}", remote.peerId, e.what());
        HandleFailure(*record);
        return;
    }
    NotifyRoster();
}

void MeshCoordinator::Handle(const AnswerSignal& signal) {
    if (signal.to != Self_.id) {
        spdlog::debug("{}: answer for {}", ToString(ErrorCode::UnmatchedPeer), signal.to);
        return;
    }

    auto record = FindRecord(signal.from);
    if (!record) {
        spdlog::debug("{}: answer from {} with no connection", ToString(ErrorCode::UnmatchedPeer), signal.from);
        return;
    }
    if (!signal.fromName.empty()) {
        record->SetRemoteName(signal.fromName);
    }

    try {
        record->ReceiveAnswer(signal.answer);
    } catch (const Error& e) {
        spdlog::warn("[Peer {}] {}", signal.from, e.what());
        HandleFailure(*record);
    }
}

void MeshCoordinator::Handle(const CandidateSignal& signal) {
    if (signal.to != Self_.id) {
        spdlog::debug("{}: candidate for {}", ToString(ErrorCode::UnmatchedPeer), signal.to);
        return;
    }

    if (auto record = FindRecord(signal.from)) {
        record->ReceiveCandidate(signal.candidate);
        return;
    }

    auto& held = HeldCandidates_[signal.from];
    if (held.size() >= kMaxHeldCandidates) {
        spdlog::debug("[Peer {}] Too many early candidates, dropping one", signal.from);
        return;
    }
    held.push_back(signal.candidate);
}

void MeshCoordinator::Handle(const GetRoomsSignal&) {
    spdlog::debug("Ignoring get-rooms");
}

void MeshCoordinator::Handle(const RoomsListSignal& signal) {
    if (OnRoomsList_) {
        OnRoomsList_(signal.rooms);
    }
}

void MeshCoordinator::Handle(const AnnounceSignal& signal) {
    if (signal.peer.peerId == Self_.id || FindRecord(signal.peer.peerId)) {
        return;
    }

    spdlog::info("[Peer {}] {} announced itself", signal.peer.peerId, signal.peer.peerName);
    if (KnownPeers_.insert(signal.peer.peerId).second && OnPeerJoin_) {
        OnPeerJoin_(signal.peer);
    }
    StartOffer(signal.peer);
    NotifyRoster();
}

void MeshCoordinator::Handle(const LeaveSignal& signal) {
    RemovePeer(signal.peer);
}

std::shared_ptr<Negotiator> MeshCoordinator::CreateRecord(const PeerRef& remote) {
    Negotiator::Events events;
    events.sendSignal = [this](const Envelope& envelope) {
        Transport_->Send(envelope, EnvelopeRecipient(envelope));
    };
    events.onStateChange = [this](Negotiator&) {
        NotifyRoster();
    };
    events.onFailed = [this](Negotiator& record) {
        HandleFailure(record);
    };
    events.onChannelMessage = [this](Negotiator& record, const std::string& payload) {
        HandleChannelPayload(record, payload);
    };
    events.onGatheringComplete = [this](Negotiator& record) {
        if (OnGatheringComplete_) {
            OnGatheringComplete_(record.RemoteId());
        }
    };

    return std::make_shared<Negotiator>(Self_, remote, std::move(events));
}

std::shared_ptr<Negotiator> MeshCoordinator::FindRecord(const std::string& peerId) const {
    auto it = Records_.find(peerId);
    return it == Records_.end() ? nullptr : it->second;
}

void MeshCoordinator::StartOffer(const PeerRef& remote) {
    if (Records_.count(remote.peerId)) {
        return;
    }

    auto record = CreateRecord(remote);
    Records_[remote.peerId] = record;
    try {
        record->Initiate(*Factory_);
    } catch (const Error& e) {
        spdlog::warn("[Peer {}] {}", remote.peerId, e.what());
        HandleFailure(*record);
    }
}

void MeshCoordinator::RemovePeer(const PeerRef& peer) {
    if (peer.peerId == Self_.id) {
        return;
    }

    HeldCandidates_.erase(peer.peerId);

    const bool known = KnownPeers_.erase(peer.peerId) > 0;
    auto it = Records_.find(peer.peerId);
    if (!known && it == Records_.end()) {
        spdlog::debug("{}: departure of unknown peer {}", ToString(ErrorCode::UnmatchedPeer), peer.peerId);
        return;
    }

    PeerRef left = peer;
    if (it != Records_.end()) {
        if (left.peerName.empty()) {
            left.peerName = it->second->RemoteName();
        }
        it->second->Teardown();
        Records_.erase(it);
    }

    spdlog::info("[Peer {}] {} left", left.peerId, left.peerName);
    if (OnPeerLeave_) {
        OnPeerLeave_(left);
    }
    NotifyRoster();
}

void MeshCoordinator::HandleFailure(Negotiator& record) {
    PeerRef failed{record.RemoteId(), record.RemoteName()};
    record.Teardown();

    // Only drop the map entry if it is still this record; a rebuilt one stays.
    if (auto it = Records_.find(failed.peerId); it != Records_.end() && it->second.get() == &record) {
        Records_.erase(it);
    }

    spdlog::warn("[Peer {}] Connection to {} failed", failed.peerId, failed.peerName);
    if (OnPeerFailed_) {
        OnPeerFailed_(failed);
    }
    NotifyRoster();
}

void MeshCoordinator::HandleChannelPayload(Negotiator& record, const std::string& payload) {
    ChannelPayload parsed;
    try {
        parsed = ParseChannelPayload(payload);
    } catch (const Error& e) {
        spdlog::warn("[Peer {}] Invalid channel payload dropped: {}", record.RemoteId(), e.what());
        return;
    }

    std::visit([this, &record](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Handshake>) {
            if (!value.name.empty() && value.name != record.RemoteName()) {
                spdlog::info("[Peer {}] Handshake from {}", record.RemoteId(), value.name);
                record.SetRemoteName(value.name);
                NotifyRoster();
            }
        } else if (OnMessage_) {
            OnMessage_(value);
        }
    }, parsed);
}

void MeshCoordinator::ResetRoom() {
    for (auto& [id, record] : Records_) {
        record->Teardown();
    }
    const bool hadRecords = !Records_.empty();
    Records_.clear();
    KnownPeers_.clear();
    HeldCandidates_.clear();
    RoomId_.clear();
    if (hadRecords) {
        NotifyRoster();
    }
}

void MeshCoordinator::NotifyRoster() {
    if (OnRosterChange_) {
        OnRosterChange_(Roster());
    }
}

} // namespace beam
