#pragma once

#include "fwd.hpp"
#include "envelope.hpp"

#include <map>
#include <string>
#include <vector>

namespace beam {

struct Member {
    ClientId clientId = 0;
    std::string peerId;
    std::string peerName;
};

class Room {
public:
    explicit Room(std::string id)
        : Id_(std::move(id))
    { }

    void AddMember(const Member& member);
    void RemoveMember(ClientId clientId);

    bool HasMember(ClientId clientId) const {
        return Members_.count(clientId);
    }

    const Member* FindMember(ClientId clientId) const;
    const Member* FindPeer(const std::string& peerId) const;

    // Members in join order.
    std::vector<Member> Members() const;

    const std::string& Id() const {
        return Id_;
    }

    size_t Size() const {
        return Members_.size();
    }

    bool Empty() const {
        return Members_.empty();
    }

    RoomSummary Summary() const;

private:
    std::string Id_;
    // Client ids grow monotonically, so map order is join order.
    std::map<ClientId, Member> Members_;
};

} // namespace beam
