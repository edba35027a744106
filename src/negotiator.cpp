#include "negotiator.hpp"

#include "chat_message.hpp"
#include "error.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace beam {

namespace {

constexpr char kChannelLabel[] = "chat";

} // namespace

const char* ToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle: return "Idle";
        case ConnectionState::Negotiating: return "Negotiating";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Disconnected: return "Disconnected";
    }
    return "Unknown";
}

Negotiator::Negotiator(PeerIdentity self, PeerRef remote, Events events)
    : Self_(std::move(self))
    , Remote_(std::move(remote))
    , Events_(std::move(events))
{ }

Negotiator::~Negotiator() {
    Teardown();
}

void Negotiator::Initiate(LinkFactory& factory) {
    if (Closed_ || Link_) {
        spdlog::warn("[Peer {}] Initiate on a record that already has a connection", Remote_.peerId);
        return;
    }

    Role_ = Role::Offerer;
    try {
        CreateLink(factory);
        SetState(ConnectionState::Negotiating);
        AttachChannel(Link_->CreateChannel(kChannelLabel));

        spdlog::info("[Peer {}] Creating offer", Remote_.peerId);
        Link_->SetLocalOffer();
    } catch (const Error&) {
        Teardown();
        throw;
    } catch (const std::exception& e) {
        Teardown();
        throw Error(ErrorCode::NegotiationFailure, e.what());
    }
}

void Negotiator::ReceiveOffer(LinkFactory& factory, const SessionDescription& offer) {
    if (Closed_) {
        return;
    }
    if (!std::holds_alternative<AwaitingRemoteDescription>(Gate_)) {
        spdlog::warn("[Peer {}] Remote description already applied, ignoring offer", Remote_.peerId);
        return;
    }

    try {
        if (!Link_) {
            Role_ = Role::Answerer;
            CreateLink(factory);
        }
        SetState(ConnectionState::Negotiating);

        spdlog::info("[Peer {}] Processing offer...", Remote_.peerId);
        ApplyRemoteDescription(offer);

        Link_->SetLocalAnswer();
        spdlog::debug("[Peer {}] Local description set (answer will be generated)", Remote_.peerId);
    } catch (const Error&) {
        Teardown();
        throw;
    } catch (const std::exception& e) {
        Teardown();
        throw Error(ErrorCode::NegotiationFailure, e.what());
    }
}

void Negotiator::ReceiveAnswer(const SessionDescription& answer) {
    if (Closed_ || !Link_) {
        return;
    }
    if (Role_ != Role::Offerer || HasRemoteDescription()) {
        spdlog::warn("[Peer {}] Unexpected answer, ignoring", Remote_.peerId);
        return;
    }

    try {
        ApplyRemoteDescription(answer);
    } catch (const std::exception& e) {
        Teardown();
        throw Error(ErrorCode::NegotiationFailure, e.what());
    }
}

void Negotiator::ReceiveCandidate(const IceCandidate& candidate) {
    if (Closed_) {
        return;
    }

    if (auto awaiting = std::get_if<AwaitingRemoteDescription>(&Gate_)) {
        awaiting->pending.push_back(candidate);
        spdlog::debug("[Peer {}] Queued remote candidate ({} pending)", Remote_.peerId, awaiting->pending.size());
        return;
    }

    AddCandidate(candidate);
}

bool Negotiator::Send(const std::string& payload) {
    if (Closed_ || !ChannelOpen_ || !Channel_) {
        return false;
    }

    try {
        Channel_->Send(payload);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[Peer {}] {}: {}", Remote_.peerId, ToString(ErrorCode::ChannelSendFailure), e.what());
        return false;
    }
}

void Negotiator::Teardown() {
    if (Closed_) {
        return;
    }
    Closed_ = true;
    ChannelOpen_ = false;

    if (Channel_) {
        Channel_->Close();
        Channel_.reset();
    }
    if (Link_) {
        Link_->Close();
        Link_.reset();
    }

    Gate_ = AwaitingRemoteDescription{};
    State_ = ConnectionState::Disconnected;
    spdlog::debug("[Peer {}] Torn down", Remote_.peerId);
}

size_t Negotiator::PendingCandidateCount() const {
    if (auto awaiting = std::get_if<AwaitingRemoteDescription>(&Gate_)) {
        return awaiting->pending.size();
    }
    return 0;
}

std::vector<IceCandidate> Negotiator::TakePendingCandidates() {
    if (auto awaiting = std::get_if<AwaitingRemoteDescription>(&Gate_)) {
        return std::exchange(awaiting->pending, {});
    }
    return {};
}

void Negotiator::CreateLink(LinkFactory& factory) {
    std::weak_ptr<Negotiator> weak = weak_from_this();

    // Events may still be queued on the loop after teardown; they land here
    // and are dropped.
    auto live = [weak]() -> std::shared_ptr<Negotiator> {
        auto self = weak.lock();
        if (!self || self->Closed_) {
            return nullptr;
        }
        return self;
    };

    LinkCallbacks callbacks;
    callbacks.onLocalDescription = [live](const SessionDescription& description) {
        if (auto self = live()) {
            self->HandleLocalDescription(description);
        }
    };
    callbacks.onLocalCandidate = [live](const IceCandidate& candidate) {
        if (auto self = live()) {
            self->HandleLocalCandidate(candidate);
        }
    };
    callbacks.onStateChange = [live](LinkState state) {
        if (auto self = live()) {
            self->HandleLinkState(state);
        }
    };
    callbacks.onGatheringComplete = [live]() {
        if (auto self = live(); self && self->Events_.onGatheringComplete) {
            self->Events_.onGatheringComplete(*self);
        }
    };
    callbacks.onChannel = [live](std::shared_ptr<MessageChannel> channel) {
        auto self = live();
        if (!self) {
            channel->Close();
            return;
        }
        if (self->Channel_) {
            spdlog::warn("[Peer {}] Extra data channel, closing it", self->Remote_.peerId);
            channel->Close();
            return;
        }
        spdlog::info("[Peer {}] DataChannel received", self->Remote_.peerId);
        self->AttachChannel(std::move(channel));
    };

    spdlog::debug("[Peer {}] Creating PeerConnection", Remote_.peerId);
    Link_ = factory.CreateLink(std::move(callbacks));
}

void Negotiator::AttachChannel(std::shared_ptr<MessageChannel> channel) {
    std::weak_ptr<Negotiator> weak = weak_from_this();
    Channel_ = std::move(channel);

    Channel_->OnOpen([weak]() {
        if (auto self = weak.lock(); self && !self->Closed_) {
            self->HandleChannelOpen();
        }
    });

    Channel_->OnClosed([weak]() {
        if (auto self = weak.lock(); self && !self->Closed_) {
            self->HandleChannelClosed();
        }
    });

    Channel_->OnMessage([weak](const std::string& payload) {
        auto self = weak.lock();
        if (!self || self->Closed_ || !self->Events_.onChannelMessage) {
            return;
        }
        self->Events_.onChannelMessage(*self, payload);
    });
}

void Negotiator::ApplyRemoteDescription(const SessionDescription& description) {
    auto& awaiting = std::get<AwaitingRemoteDescription>(Gate_);

    Link_->SetRemoteDescription(description);
    spdlog::debug("[Peer {}] Remote description set ({})", Remote_.peerId, description.type);

    auto pending = std::move(awaiting.pending);
    Gate_ = RemoteDescriptionApplied{};

    if (!pending.empty()) {
        spdlog::debug("[Peer {}] Applying {} queued candidates", Remote_.peerId, pending.size());
    }
    for (const auto& candidate : pending) {
        AddCandidate(candidate);
    }
}

void Negotiator::AddCandidate(const IceCandidate& candidate) {
    try {
        Link_->AddRemoteCandidate(candidate);
        spdlog::trace("[Peer {}] Candidate added: {}", Remote_.peerId, candidate.candidate);
    } catch (const std::exception& e) {
        spdlog::warn("[Peer {}] Failed to add candidate: {}", Remote_.peerId, e.what());
    }
}

void Negotiator::HandleLocalDescription(const SessionDescription& description) {
    spdlog::debug("[Peer {}] Local description type: {}", Remote_.peerId, description.type);

    if (!Events_.sendSignal) {
        return;
    }
    if (description.type == "offer") {
        Events_.sendSignal(OfferSignal{Self_.id, Self_.displayName, Remote_.peerId, description});
    } else if (description.type == "answer") {
        Events_.sendSignal(AnswerSignal{Self_.id, Self_.displayName, Remote_.peerId, description});
    } else {
        spdlog::warn("[Peer {}] Unsupported local description type {}", Remote_.peerId, description.type);
    }
}

void Negotiator::HandleLocalCandidate(const IceCandidate& candidate) {
    if (Events_.sendSignal) {
        Events_.sendSignal(CandidateSignal{Self_.id, Remote_.peerId, candidate});
    }
}

void Negotiator::HandleLinkState(LinkState state) {
    spdlog::info("[Peer {}] PC State: {}", Remote_.peerId, ToString(state));

    switch (state) {
        case LinkState::Connected:
            SetState(ConnectionState::Connected);
            break;
        case LinkState::Disconnected:
        case LinkState::Closed:
            SetState(ConnectionState::Disconnected);
            break;
        case LinkState::Failed:
            Fail("connection failed");
            break;
        default:
            break;
    }
}

void Negotiator::HandleChannelOpen() {
    spdlog::info("[Peer {}] Data channel open", Remote_.peerId);
    ChannelOpen_ = true;

    try {
        Channel_->Send(SerializeHandshake(Handshake{Self_.displayName, Self_.id}));
    } catch (const std::exception& e) {
        spdlog::warn("[Peer {}] Handshake not sent: {}", Remote_.peerId, e.what());
    }

    if (State_ != ConnectionState::Connected) {
        SetState(ConnectionState::Connected);
    } else if (Events_.onStateChange) {
        Events_.onStateChange(*this);
    }
}

void Negotiator::HandleChannelClosed() {
    spdlog::info("[Peer {}] Data channel closed", Remote_.peerId);
    ChannelOpen_ = false;
    if (Events_.onStateChange) {
        Events_.onStateChange(*this);
    }
}

void Negotiator::SetState(ConnectionState state) {
    if (State_ == state) {
        return;
    }
    State_ = state;
    if (Events_.onStateChange) {
        Events_.onStateChange(*this);
    }
}

void Negotiator::Fail(const std::string& reason) {
    spdlog::warn("[Peer {}] {}: {}", Remote_.peerId, ToString(ErrorCode::NegotiationFailure), reason);

    auto self = shared_from_this();
    Teardown();
    if (Events_.onFailed) {
        Events_.onFailed(*this);
    }
}

} // namespace beam
