#pragma once

#include "fwd.hpp"
#include "signaling_transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace beam {

// Room service reached through a signaling server over one WebSocket.
class WebSocketTransport : public SignalingTransport {
public:
    WebSocketTransport(std::shared_ptr<Loop> loop, std::string url, std::chrono::milliseconds connectTimeout);
    ~WebSocketTransport() override;

    void Connect() override;
    void Send(const Envelope& envelope, const std::optional<std::string>& target = std::nullopt) override;
    void OnReceive(ReceiveHandler handler) override;
    void Close() override;
    bool IsConnected() const override;

private:
    struct Shared;

    void DetachShared();

    std::shared_ptr<Loop> Loop_;
    std::string Url_;
    std::chrono::milliseconds ConnectTimeout_;
    std::shared_ptr<Shared> Shared_;
    std::shared_ptr<rtc::WebSocket> Ws_;
};

} // namespace beam
