#include "chat_message.hpp"

#include "error.hpp"

#include <nlohmann/json.hpp>

namespace beam {

namespace {

using json = nlohmann::json;

} // namespace

ChatMessage MakeChatMessage(const PeerIdentity& sender, const std::string& text) {
    return ChatMessage{GenerateMessageId(), sender.id, sender.displayName, text, NowMillis()};
}

std::string SerializeChatMessage(const ChatMessage& message) {
    json j = {
        {"id", message.id},
        {"sender", message.sender},
        {"senderName", message.senderName},
        {"text", message.text},
        {"timestamp", message.timestamp}
    };
    return j.dump();
}

std::string SerializeHandshake(const Handshake& handshake) {
    json j = {
        {"type", "handshake"},
        {"name", handshake.name},
        {"id", handshake.id}
    };
    return j.dump();
}

ChannelPayload ParseChannelPayload(const std::string& text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            throw Error(ErrorCode::MalformedEnvelope, "channel payload is not an object");
        }

        if (j.value("type", "") == "handshake") {
            return Handshake{j.at("name").get<std::string>(), j.value("id", "")};
        }

        ChatMessage message;
        message.id = j.at("id").get<std::string>();
        message.sender = j.at("sender").get<std::string>();
        message.senderName = j.value("senderName", "");
        message.text = j.at("text").get<std::string>();
        message.timestamp = j.value("timestamp", int64_t{0});
        return message;
    } catch (const json::exception& e) {
        throw Error(ErrorCode::MalformedEnvelope, e.what());
    }
}

} // namespace beam
