#pragma once

#include "fwd.hpp"
#include "envelope.hpp"
#include "room.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace beam {

// A message for one connected client.
struct Delivery {
    ClientId to = 0;
    std::string payload;
};

// Server-side room table. Pure bookkeeping: every call returns the messages
// to send and never touches a socket. Not thread-safe; the signaling server
// only calls it from its Loop.
class RoomRegistry {
public:
    // Leaves the client's previous room first. An empty room id gets a
    // generated one.
    std::vector<Delivery> Join(ClientId clientId, const std::string& roomId, const PeerRef& peer);

    // Forwards `raw` unchanged to the member of the sender's room whose peer
    // id is `to`.
    std::vector<Delivery> Relay(ClientId from, const std::string& to, const std::string& raw);

    std::vector<Delivery> Depart(ClientId clientId);

    // Throws Error{MalformedEnvelope} if `text` is not a valid envelope.
    std::vector<Delivery> HandleMessage(ClientId clientId, const std::string& text);

    std::vector<RoomSummary> ListRooms() const;

    size_t RoomCount() const {
        return Rooms_.size();
    }

    std::optional<std::string> RoomOf(ClientId clientId) const;

private:
    std::map<std::string, Room> Rooms_;
    std::unordered_map<ClientId, std::string> ClientRooms_;
};

} // namespace beam
