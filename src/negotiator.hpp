#pragma once

#include "fwd.hpp"
#include "envelope.hpp"
#include "identity.hpp"
#include "peer_link.hpp"

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace beam {

enum class ConnectionState {
    Idle,
    Negotiating,
    Connected,
    Disconnected,
};

const char* ToString(ConnectionState state);

// Remote candidates that arrived before the remote description. Only this
// alternative can hold candidates, and the link is never asked to add one
// while the gate is in it.
struct AwaitingRemoteDescription {
    std::vector<IceCandidate> pending;
};

struct RemoteDescriptionApplied { };

using CandidateGate = std::variant<AwaitingRemoteDescription, RemoteDescriptionApplied>;

// Drives the connection to one remote peer: offer/answer, candidate
// buffering, channel lifecycle. Owned by MeshCoordinator; lives on the Loop.
class Negotiator : public std::enable_shared_from_this<Negotiator> {
public:
    enum class Role {
        Offerer,
        Answerer,
    };

    struct Events {
        std::function<void(const Envelope&)> sendSignal;
        std::function<void(Negotiator&)> onStateChange;
        std::function<void(Negotiator&)> onFailed;
        std::function<void(Negotiator&, const std::string&)> onChannelMessage;
        std::function<void(Negotiator&)> onGatheringComplete;
    };

    Negotiator(PeerIdentity self, PeerRef remote, Events events);
    ~Negotiator();

    Negotiator(const Negotiator&) = delete;
    Negotiator& operator=(const Negotiator&) = delete;

    // Throws Error{NegotiationFailure} if the link cannot be set up; the
    // record is then closed and must be discarded by the caller.
    void Initiate(LinkFactory& factory);
    void ReceiveOffer(LinkFactory& factory, const SessionDescription& offer);
    void ReceiveAnswer(const SessionDescription& answer);
    void ReceiveCandidate(const IceCandidate& candidate);

    // Returns false when the channel is not open or the send failed.
    bool Send(const std::string& payload);

    void Teardown();

    const std::string& RemoteId() const {
        return Remote_.peerId;
    }

    const std::string& RemoteName() const {
        return Remote_.peerName;
    }

    void SetRemoteName(const std::string& name) {
        Remote_.peerName = name;
    }

    ConnectionState State() const {
        return State_;
    }

    Role GetRole() const {
        return Role_;
    }

    bool IsChannelOpen() const {
        return ChannelOpen_;
    }

    bool IsClosed() const {
        return Closed_;
    }

    bool HasRemoteDescription() const {
        return std::holds_alternative<RemoteDescriptionApplied>(Gate_);
    }

    size_t PendingCandidateCount() const;

    // Empties the queue of early candidates; used when a record is rebuilt
    // in the other role.
    std::vector<IceCandidate> TakePendingCandidates();

private:
    void CreateLink(LinkFactory& factory);
    void AttachChannel(std::shared_ptr<MessageChannel> channel);
    void ApplyRemoteDescription(const SessionDescription& description);
    void AddCandidate(const IceCandidate& candidate);

    void HandleLocalDescription(const SessionDescription& description);
    void HandleLocalCandidate(const IceCandidate& candidate);
    void HandleLinkState(LinkState state);
    void HandleChannelOpen();
    void HandleChannelClosed();

    void SetState(ConnectionState state);
    void Fail(const std::string& reason);

private:
    PeerIdentity Self_;
    PeerRef Remote_;
    Events Events_;

    Role Role_ = Role::Offerer;
    ConnectionState State_ = ConnectionState::Idle;
    CandidateGate Gate_;
    bool ChannelOpen_ = false;
    bool Closed_ = false;

    std::unique_ptr<PeerLink> Link_;
    std::shared_ptr<MessageChannel> Channel_;
};

} // namespace beam
