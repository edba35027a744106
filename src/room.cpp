#include "room.hpp"

#include <spdlog/spdlog.h>

namespace beam {

void Room::AddMember(const Member& member) {
    spdlog::debug("Adding participant {} to room {}", member.clientId, Id_);
    Members_[member.clientId] = member;
}

void Room::RemoveMember(ClientId clientId) {
    if (!Members_.count(clientId)) {
        return;
    }

    spdlog::debug("Removing participant {} from room {}", clientId, Id_);
    Members_.erase(clientId);
}

const Member* Room::FindMember(ClientId clientId) const {
    auto it = Members_.find(clientId);
    return it == Members_.end() ? nullptr : &it->second;
}

const Member* Room::FindPeer(const std::string& peerId) const {
    for (auto& [id, member] : Members_) {
        if (member.peerId == peerId) {
            return &member;
        }
    }
    return nullptr;
}

std::vector<Member> Room::Members() const {
    std::vector<Member> members;
    members.reserve(Members_.size());
    for (auto& [id, member] : Members_) {
        members.push_back(member);
    }
    return members;
}

RoomSummary Room::Summary() const {
    RoomSummary summary;
    summary.id = Id_;
    summary.peerCount = Members_.size();
    for (auto& [id, member] : Members_) {
        summary.peers.push_back(PeerRef{member.peerId, member.peerName});
    }
    return summary;
}

} // namespace beam
