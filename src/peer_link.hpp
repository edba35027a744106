#pragma once

#include "envelope.hpp"

#include <functional>
#include <memory>
#include <string>

namespace beam {

enum class LinkState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed,
};

const char* ToString(LinkState state);

// Ordered, reliable message channel between two peers. Callbacks run on the
// owning Loop.
class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    virtual bool IsOpen() const = 0;

    // Throws when the underlying channel refuses the message.
    virtual void Send(const std::string& payload) = 0;
    virtual void Close() = 0;

    virtual void OnOpen(std::function<void()> callback) = 0;
    virtual void OnClosed(std::function<void()> callback) = 0;
    virtual void OnMessage(std::function<void(const std::string&)> callback) = 0;
};

struct LinkCallbacks {
    std::function<void(const SessionDescription&)> onLocalDescription;
    std::function<void(const IceCandidate&)> onLocalCandidate;
    std::function<void(LinkState)> onStateChange;
    std::function<void()> onGatheringComplete;
    std::function<void(std::shared_ptr<MessageChannel>)> onChannel;
};

// One direct connection to one remote peer. Callbacks are delivered on the
// owning Loop, never re-entrantly from inside these calls.
class PeerLink {
public:
    virtual ~PeerLink() = default;

    virtual std::shared_ptr<MessageChannel> CreateChannel(const std::string& label) = 0;

    // Create-and-set of the local description; the result arrives through
    // onLocalDescription.
    virtual void SetLocalOffer() = 0;
    virtual void SetLocalAnswer() = 0;

    virtual void SetRemoteDescription(const SessionDescription& description) = 0;
    virtual void AddRemoteCandidate(const IceCandidate& candidate) = 0;

    virtual void Close() = 0;
};

class LinkFactory {
public:
    virtual ~LinkFactory() = default;

    // Throws Error{NegotiationFailure} when no connection can be created.
    virtual std::unique_ptr<PeerLink> CreateLink(LinkCallbacks callbacks) = 0;
};

} // namespace beam
