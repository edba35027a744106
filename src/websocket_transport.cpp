#include "websocket_transport.hpp"

#include "error.hpp"
#include "loop.hpp"

#include <rtc/rtc.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <future>

namespace beam {

// State reachable from rtc callbacks; outlives the transport if a callback
// is still in flight.
struct WebSocketTransport::Shared {
    ReceiveHandler handler;
    std::atomic<bool> connected{false};
};

WebSocketTransport::WebSocketTransport(std::shared_ptr<Loop> loop, std::string url, std::chrono::milliseconds connectTimeout)
    : Loop_(std::move(loop))
    , Url_(std::move(url))
    , ConnectTimeout_(connectTimeout)
    , Shared_(std::make_shared<Shared>())
{ }

WebSocketTransport::~WebSocketTransport() {
    Close();
}

void WebSocketTransport::OnReceive(ReceiveHandler handler) {
    Shared_->handler = std::move(handler);
}

void WebSocketTransport::Connect() {
    if (Ws_) {
        return;
    }

    auto ws = std::make_shared<rtc::WebSocket>();
    auto opened = std::make_shared<std::promise<bool>>();
    auto settled = std::make_shared<std::atomic<bool>>(false);
    auto settle = [opened, settled](bool ok) {
        if (!settled->exchange(true)) {
            opened->set_value(ok);
        }
    };

    std::weak_ptr<Shared> weakShared = Shared_;
    auto loop = Loop_;
    const auto url = Url_;

    ws->onOpen([settle, weakShared, url]() {
        spdlog::info("Connected to signaling server {}", url);
        if (auto shared = weakShared.lock()) {
            shared->connected = true;
        }
        settle(true);
    });

    ws->onError([settle, url](std::string error) {
        spdlog::error("WebSocket error on {}: {}", url, error);
        settle(false);
    });

    ws->onClosed([settle, weakShared, url]() {
        spdlog::info("Disconnected from signaling server {}", url);
        if (auto shared = weakShared.lock()) {
            shared->connected = false;
        }
        settle(false);
    });

    ws->onMessage([loop, weakShared](rtc::message_variant message) {
        auto text = std::get_if<std::string>(&message);
        if (!text) {
            return;
        }
        loop->EnqueueTask([weakShared, text = std::move(*text)] {
            auto shared = weakShared.lock();
            if (!shared || !shared->handler) {
                return;
            }

            Envelope envelope;
            try {
                envelope = ParseEnvelope(text);
            } catch (const Error& e) {
                spdlog::warn("Invalid signaling message dropped: {}", e.what());
                return;
            }
            shared->handler(envelope);
        });
    });

    spdlog::info("Connecting to signaling server {}", Url_);
    try {
        ws->open(Url_);
    } catch (const std::exception& e) {
        throw Error(ErrorCode::TransportUnavailable, "Cannot open " + Url_ + ": " + e.what());
    }

    auto result = opened->get_future();
    if (result.wait_for(ConnectTimeout_) != std::future_status::ready || !result.get()) {
        DetachShared();
        ws->close();
        throw Error(ErrorCode::TransportUnavailable, "Could not connect to " + Url_);
    }

    Ws_ = std::move(ws);
}

void WebSocketTransport::Send(const Envelope& envelope, const std::optional<std::string>&) {
    if (!Ws_ || !Ws_->isOpen()) {
        spdlog::warn("Signaling socket not open, dropping {}", EnvelopeType(envelope));
        return;
    }

    try {
        Ws_->send(SerializeEnvelope(envelope));
    } catch (const std::exception& e) {
        spdlog::warn("Failed to send {}: {}", EnvelopeType(envelope), e.what());
    }
}

void WebSocketTransport::Close() {
    if (!Ws_) {
        return;
    }
    DetachShared();
    Ws_->close();
    Ws_.reset();
}

void WebSocketTransport::DetachShared() {
    // Late callbacks from the old socket land on the abandoned state, never on
    // the one a later Connect() hands to its new socket.
    auto handler = std::move(Shared_->handler);
    Shared_->connected = false;
    Shared_ = std::make_shared<Shared>();
    Shared_->handler = std::move(handler);
}

bool WebSocketTransport::IsConnected() const {
    return Ws_ && Shared_->connected;
}

} // namespace beam
