#include "room_registry.hpp"

#include "error.hpp"
#include "identity.hpp"

#include <spdlog/spdlog.h>

namespace beam {

std::vector<Delivery> RoomRegistry::Join(ClientId clientId, const std::string& roomId, const PeerRef& peer) {
    auto deliveries = Depart(clientId);

    auto id = NormalizeRoomId(roomId);
    if (id.empty()) {
        id = GenerateRoomId();
        while (Rooms_.count(id)) {
            id = GenerateRoomId();
        }
    }

    auto it = Rooms_.find(id);
    if (it == Rooms_.end()) {
        it = Rooms_.emplace(id, Room(id)).first;
        spdlog::info("Room {} created", id);
    }
    auto& room = it->second;

    const auto existing = room.Members();

    RoomJoinedSignal joined{id, {}};
    for (const auto& member : existing) {
        joined.peers.push_back(PeerRef{member.peerId, member.peerName});
    }
    deliveries.push_back(Delivery{clientId, SerializeEnvelope(joined)});

    const auto announcement = SerializeEnvelope(PeerJoinedSignal{peer});
    for (const auto& member : existing) {
        deliveries.push_back(Delivery{member.clientId, announcement});
    }

    room.AddMember(Member{clientId, peer.peerId, peer.peerName});
    ClientRooms_[clientId] = id;

    spdlog::info("[Client {}] {} ({}) joined room {} ({} members)", clientId, peer.peerName, peer.peerId, id, room.Size());
    return deliveries;
}

std::vector<Delivery> RoomRegistry::Relay(ClientId from, const std::string& to, const std::string& raw) {
    auto roomIt = ClientRooms_.find(from);
    if (roomIt == ClientRooms_.end()) {
        spdlog::debug("[Client {}] {}: relay while not in a room", from, ToString(ErrorCode::UnmatchedPeer));
        return {};
    }

    const auto& room = Rooms_.at(roomIt->second);
    auto target = room.FindPeer(to);
    if (!target) {
        spdlog::warn("[Client {}] {}: no peer {} in room {}", from, ToString(ErrorCode::UnmatchedPeer), to, room.Id());
        return {};
    }

    return {Delivery{target->clientId, raw}};
}

std::vector<Delivery> RoomRegistry::Depart(ClientId clientId) {
    auto roomIt = ClientRooms_.find(clientId);
    if (roomIt == ClientRooms_.end()) {
        return {};
    }

    auto it = Rooms_.find(roomIt->second);
    ClientRooms_.erase(roomIt);
    if (it == Rooms_.end()) {
        return {};
    }

    auto& room = it->second;
    auto member = room.FindMember(clientId);
    if (!member) {
        return {};
    }

    const auto departed = SerializeEnvelope(PeerLeftSignal{PeerRef{member->peerId, member->peerName}});
    spdlog::info("[Client {}] {} left room {}", clientId, member->peerName, room.Id());
    room.RemoveMember(clientId);

    std::vector<Delivery> deliveries;
    for (const auto& other : room.Members()) {
        deliveries.push_back(Delivery{other.clientId, departed});
    }

    if (room.Empty()) {
        spdlog::info("Room {} deleted", room.Id());
        Rooms_.erase(it);
    }
    return deliveries;
}

std::vector<Delivery> RoomRegistry::HandleMessage(ClientId clientId, const std::string& text) {
    auto envelope = ParseEnvelope(text);
    spdlog::debug("[Client {}] Received signaling: {}", clientId, EnvelopeType(envelope));

    if (auto join = std::get_if<JoinSignal>(&envelope)) {
        return Join(clientId, join->roomId, PeerRef{join->peerId, join->peerName});
    }
    if (auto recipient = EnvelopeRecipient(envelope)) {
        return Relay(clientId, *recipient, text);
    }
    if (std::holds_alternative<GetRoomsSignal>(envelope)) {
        return {Delivery{clientId, SerializeEnvelope(RoomsListSignal{ListRooms()})}};
    }
    if (std::holds_alternative<LeaveSignal>(envelope)) {
        return Depart(clientId);
    }

    spdlog::info("[Client {}] Unexpected message type: {}", clientId, EnvelopeType(envelope));
    return {};
}

std::vector<RoomSummary> RoomRegistry::ListRooms() const {
    std::vector<RoomSummary> rooms;
    rooms.reserve(Rooms_.size());
    for (const auto& [id, room] : Rooms_) {
        rooms.push_back(room.Summary());
    }
    return rooms;
}

std::optional<std::string> RoomRegistry::RoomOf(ClientId clientId) const {
    auto it = ClientRooms_.find(clientId);
    if (it == ClientRooms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace beam
