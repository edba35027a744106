#include "signaling_server.hpp"

#include "error.hpp"
#include "loop.hpp"
#include "room_registry.hpp"

#include <spdlog/spdlog.h>

namespace beam {

SignalingServer::SignalingServer(std::shared_ptr<Loop> loop, std::shared_ptr<RoomRegistry> registry, const ServerConfig& config)
    : Loop_(std::move(loop))
    , Registry_(std::move(registry))
    , Config_(config)
{ }

SignalingServer::~SignalingServer() {
    Stop();
}

void SignalingServer::Start() {
    rtc::WebSocketServer::Configuration wsCfg;
    wsCfg.port = Config_.wsPort;
    wsCfg.enableTls = false;
    wsCfg.bindAddress = Config_.bindAddress;

    try {
        WsServer_ = std::make_shared<rtc::WebSocketServer>(wsCfg);
    } catch (const std::exception& e) {
        throw Error(ErrorCode::TransportUnavailable,
                    "Cannot listen on port " + std::to_string(Config_.wsPort) + ": " + e.what());
    }

    WsServer_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
        ws->onOpen([this, ws]() {
            WsOpenCallback(ws);
        });

        ws->onClosed([this, ws]() {
            WsClosedCallback(ws);
        });

        ws->onMessage([this, ws](rtc::message_variant message) {
            WsOnMessageCallback(ws, std::move(message));
        });
    });

    spdlog::info("Signaling server listening on ws://{}:{}", Config_.bindAddress, WsServer_->port());
}

void SignalingServer::Stop() {
    if (!WsServer_) {
        return;
    }
    WsServer_->stop();
    WsServer_.reset();
}

uint16_t SignalingServer::Port() const {
    return WsServer_ ? WsServer_->port() : Config_.wsPort;
}

void SignalingServer::WsOpenCallback(std::shared_ptr<rtc::WebSocket> ws) {
    Loop_->EnqueueTask([this, ws = std::move(ws)]
    {
        auto id = IdGenerator_++;
        Clients_.emplace(id, ws);

        spdlog::info("[Client {}] WebSocket connected", id);
    });
}

void SignalingServer::WsClosedCallback(std::shared_ptr<rtc::WebSocket> ws) {
    Loop_->EnqueueTask([this, ws = std::move(ws)]
    {
        // Breaks the socket <-> callback reference cycle set up in Start().
        ws->resetCallbacks();

        auto clientId = FindClient(ws);
        if (!clientId) {
            return;
        }

        Clients_.erase(clientId);
        spdlog::info("[Client {}] WebSocket disconnected", clientId);
        Deliver(Registry_->Depart(clientId));
    });
}

void SignalingServer::WsOnMessageCallback(std::shared_ptr<rtc::WebSocket> ws, rtc::message_variant&& message) {
    Loop_->EnqueueTask([this, ws = std::move(ws), message = std::move(message)]
    {
        auto text = std::get_if<std::string>(&message);
        if (!text) {
            return;
        }

        auto clientId = FindClient(ws);
        if (!clientId) {
            spdlog::error("Client not found for signaling message");
            return;
        }

        try {
            Deliver(Registry_->HandleMessage(clientId, *text));
        } catch (const Error& e) {
            spdlog::warn("[Client {}] Invalid signaling message: {}", clientId, e.what());
        }
    });
}

ClientId SignalingServer::FindClient(const std::shared_ptr<rtc::WebSocket>& ws) const {
    for (auto& [id, client] : Clients_) {
        if (client == ws) {
            return id;
        }
    }
    return 0;
}

void SignalingServer::Deliver(const std::vector<Delivery>& deliveries) {
    for (const auto& delivery : deliveries) {
        auto it = Clients_.find(delivery.to);
        if (it == Clients_.end() || !it->second->isOpen()) {
            spdlog::debug("[Client {}] Gone, message dropped", delivery.to);
            continue;
        }

        try {
            it->second->send(delivery.payload);
        } catch (const std::exception& e) {
            spdlog::warn("[Client {}] Send failed: {}", delivery.to, e.what());
        }
    }
}

} // namespace beam
