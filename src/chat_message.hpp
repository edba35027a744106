#pragma once

#include "identity.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace beam {

struct ChatMessage {
    std::string id;
    std::string sender;
    std::string senderName;
    std::string text;
    int64_t timestamp = 0;
};

// Sent once on every channel open so the other side learns our display name.
struct Handshake {
    std::string name;
    std::string id;
};

using ChannelPayload = std::variant<ChatMessage, Handshake>;

ChatMessage MakeChatMessage(const PeerIdentity& sender, const std::string& text);

std::string SerializeChatMessage(const ChatMessage& message);
std::string SerializeHandshake(const Handshake& handshake);

// Throws Error{MalformedEnvelope} when the payload is neither shape.
ChannelPayload ParseChannelPayload(const std::string& text);

} // namespace beam
