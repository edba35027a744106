#pragma once

#include "fwd.hpp"
#include "config.hpp"

#include <rtc/rtc.hpp>

#include <atomic>
#include <memory>
#include <unordered_map>
#include <vector>

namespace beam {

struct Delivery;

// WebSocket front of the RoomRegistry. Socket callbacks only post to the
// Loop; the registry and client table are used from the Loop alone.
class SignalingServer {
public:
    SignalingServer(std::shared_ptr<Loop> loop, std::shared_ptr<RoomRegistry> registry, const ServerConfig& config);
    ~SignalingServer();

    // Throws Error{TransportUnavailable} if the port cannot be bound.
    void Start();
    void Stop();

    uint16_t Port() const;

private:
    void WsOpenCallback(std::shared_ptr<rtc::WebSocket> ws);
    void WsClosedCallback(std::shared_ptr<rtc::WebSocket> ws);
    void WsOnMessageCallback(std::shared_ptr<rtc::WebSocket> ws, rtc::message_variant&& message);

    ClientId FindClient(const std::shared_ptr<rtc::WebSocket>& ws) const;
    void Deliver(const std::vector<Delivery>& deliveries);

private:
    std::shared_ptr<Loop> Loop_;
    std::shared_ptr<RoomRegistry> Registry_;
    ServerConfig Config_;

    std::atomic_uint64_t IdGenerator_{1};
    std::unordered_map<ClientId, std::shared_ptr<rtc::WebSocket>> Clients_;
    std::shared_ptr<rtc::WebSocketServer> WsServer_;
};

} // namespace beam
