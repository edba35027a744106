#include "rtc_link.hpp"

#include "error.hpp"
#include "loop.hpp"

#include <rtc/rtc.hpp>

#include <spdlog/spdlog.h>

#include <variant>

namespace beam {

namespace {

LinkState FromRtcState(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return LinkState::New;
        case rtc::PeerConnection::State::Connecting: return LinkState::Connecting;
        case rtc::PeerConnection::State::Connected: return LinkState::Connected;
        case rtc::PeerConnection::State::Disconnected: return LinkState::Disconnected;
        case rtc::PeerConnection::State::Failed: return LinkState::Failed;
        case rtc::PeerConnection::State::Closed: return LinkState::Closed;
    }
    return LinkState::Failed;
}

class RtcChannel : public MessageChannel {
public:
    RtcChannel(std::shared_ptr<Loop> loop, std::shared_ptr<rtc::DataChannel> dc)
        : Handlers_(std::make_shared<Handlers>())
        , Dc_(std::move(dc))
    {
        std::weak_ptr<Handlers> weakHandlers = Handlers_;

        Dc_->onOpen([loop, weakHandlers]() {
            loop->EnqueueTask([weakHandlers] {
                if (auto h = weakHandlers.lock(); h && h->onOpen) {
                    h->onOpen();
                }
            });
        });

        Dc_->onClosed([loop, weakHandlers]() {
            loop->EnqueueTask([weakHandlers] {
                if (auto h = weakHandlers.lock(); h && h->onClosed) {
                    h->onClosed();
                }
            });
        });

        Dc_->onMessage([loop, weakHandlers](rtc::message_variant data) {
            auto text = std::get_if<std::string>(&data);
            if (!text) {
                spdlog::debug("Ignoring binary data channel message");
                return;
            }
            loop->EnqueueTask([weakHandlers, payload = std::move(*text)] {
                if (auto h = weakHandlers.lock(); h && h->onMessage) {
                    h->onMessage(payload);
                }
            });
        });
    }

    ~RtcChannel() override {
        Close();
    }

    bool IsOpen() const override {
        return Dc_->isOpen();
    }

    void Send(const std::string& payload) override {
        Dc_->send(payload);
    }

    void Close() override {
        *Handlers_ = Handlers{};
        if (!Dc_->isClosed()) {
            Dc_->close();
        }
    }

    void OnOpen(std::function<void()> callback) override {
        Handlers_->onOpen = std::move(callback);
    }

    void OnClosed(std::function<void()> callback) override {
        Handlers_->onClosed = std::move(callback);
    }

    void OnMessage(std::function<void(const std::string&)> callback) override {
        Handlers_->onMessage = std::move(callback);
    }

private:
    struct Handlers {
        std::function<void()> onOpen;
        std::function<void()> onClosed;
        std::function<void(const std::string&)> onMessage;
    };

    std::shared_ptr<Handlers> Handlers_;
    std::shared_ptr<rtc::DataChannel> Dc_;
};

class RtcLink : public PeerLink {
public:
    RtcLink(std::shared_ptr<Loop> loop, const rtc::Configuration& config, LinkCallbacks callbacks)
        : Loop_(std::move(loop))
        , Alive_(std::make_shared<bool>(true))
        , PeerConnection_(std::make_shared<rtc::PeerConnection>(config))
    {
        auto loopRef = Loop_;
        auto alive = Alive_;
        auto cb = std::make_shared<LinkCallbacks>(std::move(callbacks));

        auto post = [loopRef, alive](Task&& task) {
            loopRef->EnqueueTask([alive, task = std::move(task)] {
                if (*alive) {
                    task();
                }
            });
        };

        PeerConnection_->onLocalDescription([post, cb](rtc::Description desc) {
            SessionDescription description{desc.typeString(), std::string(desc)};
            post([cb, description] {
                if (cb->onLocalDescription) {
                    cb->onLocalDescription(description);
                }
            });
        });

        PeerConnection_->onLocalCandidate([post, cb](rtc::Candidate cand) {
            if (cand.candidate().empty()) {
                return;
            }
            IceCandidate candidate{cand.candidate(), cand.mid(), std::nullopt};
            post([cb, candidate] {
                if (cb->onLocalCandidate) {
                    cb->onLocalCandidate(candidate);
                }
            });
        });

        PeerConnection_->onStateChange([post, cb](rtc::PeerConnection::State state) {
            post([cb, state] {
                if (cb->onStateChange) {
                    cb->onStateChange(FromRtcState(state));
                }
            });
        });

        PeerConnection_->onGatheringStateChange([post, cb](rtc::PeerConnection::GatheringState state) {
            if (state != rtc::PeerConnection::GatheringState::Complete) {
                return;
            }
            post([cb] {
                if (cb->onGatheringComplete) {
                    cb->onGatheringComplete();
                }
            });
        });

        PeerConnection_->onDataChannel([post, loopRef, cb](std::shared_ptr<rtc::DataChannel> dc) {
            spdlog::debug("Remote data channel created: label={}", dc->label());
            // Wrap immediately so no open/message event slips past before the
            // handlers are installed on the loop.
            auto channel = std::make_shared<RtcChannel>(loopRef, std::move(dc));
            post([cb, channel] {
                if (cb->onChannel) {
                    cb->onChannel(channel);
                }
            });
        });
    }

    ~RtcLink() override {
        Close();
    }

    std::shared_ptr<MessageChannel> CreateChannel(const std::string& label) override {
        return std::make_shared<RtcChannel>(Loop_, PeerConnection_->createDataChannel(label));
    }

    void SetLocalOffer() override {
        PeerConnection_->setLocalDescription(rtc::Description::Type::Offer);
    }

    void SetLocalAnswer() override {
        PeerConnection_->setLocalDescription(rtc::Description::Type::Answer);
    }

    void SetRemoteDescription(const SessionDescription& description) override {
        PeerConnection_->setRemoteDescription(rtc::Description(description.sdp, description.type));
    }

    void AddRemoteCandidate(const IceCandidate& candidate) override {
        PeerConnection_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdpMid));
    }

    void Close() override {
        if (!*Alive_) {
            return;
        }
        *Alive_ = false;
        PeerConnection_->close();
    }

private:
    std::shared_ptr<Loop> Loop_;
    std::shared_ptr<bool> Alive_;
    std::shared_ptr<rtc::PeerConnection> PeerConnection_;
};

} // namespace

RtcLinkFactory::RtcLinkFactory(std::shared_ptr<Loop> loop, std::vector<std::string> iceServers)
    : Loop_(std::move(loop))
    , IceServers_(std::move(iceServers))
{ }

std::unique_ptr<PeerLink> RtcLinkFactory::CreateLink(LinkCallbacks callbacks) {
    rtc::Configuration config;
    config.disableAutoNegotiation = true;
    for (const auto& url : IceServers_) {
        config.iceServers.emplace_back(url);
    }

    try {
        return std::make_unique<RtcLink>(Loop_, config, std::move(callbacks));
    } catch (const std::exception& e) {
        throw Error(ErrorCode::NegotiationFailure, std::string("Cannot create PeerConnection: ") + e.what());
    }
}

} // namespace beam
