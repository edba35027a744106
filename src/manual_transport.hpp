#pragma once

#include "fwd.hpp"
#include "signaling_transport.hpp"

#include <memory>
#include <string>
#include <vector>

namespace beam {

enum class ManualRole {
    Creator,
    Joiner,
};

// Two-party signaling with no server: everything this side sends is packed
// into a text blob the user carries to the other side by hand. The creator
// cannot know the joiner's id in advance, so the remote peer always appears
// under the fixed alias kRemoteAlias.
class ManualTransport : public SignalingTransport {
public:
    static constexpr char kRemoteAlias[] = "manual-peer";
    static constexpr char kDefaultRoom[] = "MANUAL";

    ManualTransport(std::shared_ptr<Loop> loop, ManualRole role);

    void Connect() override;
    void Send(const Envelope& envelope, const std::optional<std::string>& target = std::nullopt) override;
    void OnReceive(ReceiveHandler handler) override;
    void Close() override;
    bool IsConnected() const override;

    // Base64 JSON carrying our id, name and every envelope sent so far.
    std::string ExportBlob() const;

    // Throws Error{MalformedEnvelope} if the blob cannot be decoded.
    void ImportBlob(const std::string& blob);

    size_t OutboxSize() const {
        return Outbox_.size();
    }

    ManualRole Role() const {
        return Role_;
    }

private:
    std::shared_ptr<Loop> Loop_;
    ManualRole Role_;
    std::shared_ptr<ReceiveHandler> Handler_;
    bool Connected_ = false;

    std::string SelfId_;
    std::string SelfName_;
    std::vector<Envelope> Outbox_;
};

std::string EncodeBase64(const std::string& data);

// Throws Error{MalformedEnvelope} on invalid input.
std::string DecodeBase64(const std::string& text);

} // namespace beam
