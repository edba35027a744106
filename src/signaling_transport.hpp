#pragma once

#include "envelope.hpp"

#include <functional>
#include <optional>
#include <string>

namespace beam {

// Best-effort envelope delivery between peers sharing a room. Inbound
// envelopes are handed to the receive handler on the owning Loop.
class SignalingTransport {
public:
    using ReceiveHandler = std::function<void(const Envelope&)>;

    virtual ~SignalingTransport() = default;

    // Throws Error{TransportUnavailable}; leaves nothing half-open behind.
    virtual void Connect() = 0;

    // `target` names the recipient peer of directed envelopes.
    virtual void Send(const Envelope& envelope, const std::optional<std::string>& target = std::nullopt) = 0;

    virtual void OnReceive(ReceiveHandler handler) = 0;
    virtual void Close() = 0;
    virtual bool IsConnected() const = 0;
};

} // namespace beam
