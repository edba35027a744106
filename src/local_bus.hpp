#pragma once

#include "fwd.hpp"
#include "signaling_transport.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace beam {

// Named broadcast channels on one device. A publisher never hears its own
// messages back.
class BroadcastBus {
public:
    using SubscriptionId = uint64_t;
    using Listener = std::function<void(const std::string&)>;

    virtual ~BroadcastBus() = default;

    virtual SubscriptionId Subscribe(const std::string& channel, Listener listener) = 0;
    virtual void Unsubscribe(SubscriptionId subscription) = 0;
    virtual void Publish(SubscriptionId from, const std::string& channel, const std::string& message) = 0;
};

// Bus shared by sessions inside one process; deliveries go through the Loop.
class InProcessBus : public BroadcastBus {
public:
    explicit InProcessBus(std::shared_ptr<Loop> loop);

    SubscriptionId Subscribe(const std::string& channel, Listener listener) override;
    void Unsubscribe(SubscriptionId subscription) override;
    void Publish(SubscriptionId from, const std::string& channel, const std::string& message) override;

private:
    struct Subscriber {
        std::string channel;
        std::shared_ptr<Listener> listener;
    };

    std::shared_ptr<Loop> Loop_;
    std::mutex Mutex_;
    SubscriptionId NextId_ = 1;
    std::map<SubscriptionId, Subscriber> Subscribers_;
};

// Bus across processes on the same host: UDP multicast looped back on the
// local interface.
class UdpBus : public BroadcastBus {
public:
    UdpBus(std::shared_ptr<Loop> loop, const std::string& group, uint16_t port);
    ~UdpBus() override;

    SubscriptionId Subscribe(const std::string& channel, Listener listener) override;
    void Unsubscribe(SubscriptionId subscription) override;
    void Publish(SubscriptionId from, const std::string& channel, const std::string& message) override;

private:
    struct Impl;
    std::unique_ptr<Impl> Impl_;
};

// Signaling over a BroadcastBus channel named after the room. Joining
// subscribes and announces; leaving announces and unsubscribes.
class LocalBusTransport : public SignalingTransport {
public:
    LocalBusTransport(std::shared_ptr<Loop> loop, std::shared_ptr<BroadcastBus> bus);
    ~LocalBusTransport() override;

    void Connect() override;
    void Send(const Envelope& envelope, const std::optional<std::string>& target = std::nullopt) override;
    void OnReceive(ReceiveHandler handler) override;
    void Close() override;
    bool IsConnected() const override;

    static std::string ChannelName(const std::string& roomId);

private:
    void JoinChannel(const JoinSignal& join);
    void LeaveChannel();
    void Publish(const Envelope& envelope, const std::optional<std::string>& target);
    void HandleDatagram(const std::string& datagram);

private:
    std::shared_ptr<Loop> Loop_;
    std::shared_ptr<BroadcastBus> Bus_;
    std::shared_ptr<ReceiveHandler> Handler_;
    bool Connected_ = false;

    std::string SelfId_;
    std::string SelfName_;
    std::string Channel_;
    BroadcastBus::SubscriptionId Subscription_ = 0;
};

} // namespace beam
