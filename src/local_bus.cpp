#include "local_bus.hpp"

#include "error.hpp"
#include "identity.hpp"
#include "loop.hpp"

#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <thread>
#include <vector>

namespace beam {

namespace {

using json = nlohmann::json;
using boost::asio::ip::udp;

constexpr char kChannelPrefix[] = "peerbeam-";
constexpr size_t kMaxDatagram = 65507;

void Deliver(Loop& loop, std::weak_ptr<BroadcastBus::Listener> weakListener, std::string message) {
    loop.EnqueueTask([weakListener, message = std::move(message)] {
        if (auto listener = weakListener.lock()) {
            (*listener)(message);
        }
    });
}

} // namespace

InProcessBus::InProcessBus(std::shared_ptr<Loop> loop)
    : Loop_(std::move(loop))
{ }

BroadcastBus::SubscriptionId InProcessBus::Subscribe(const std::string& channel, Listener listener) {
    std::lock_guard<std::mutex> lock(Mutex_);
    auto id = NextId_++;
    Subscribers_[id] = Subscriber{channel, std::make_shared<Listener>(std::move(listener))};
    return id;
}

void InProcessBus::Unsubscribe(SubscriptionId subscription) {
    std::lock_guard<std::mutex> lock(Mutex_);
    Subscribers_.erase(subscription);
}

void InProcessBus::Publish(SubscriptionId from, const std::string& channel, const std::string& message) {
    std::lock_guard<std::mutex> lock(Mutex_);
    for (auto& [id, subscriber] : Subscribers_) {
        if (id == from || subscriber.channel != channel) {
            continue;
        }
        Deliver(*Loop_, subscriber.listener, message);
    }
}

struct UdpBus::Impl {
    struct Subscriber {
        std::string channel;
        std::shared_ptr<Listener> listener;
    };

    Impl(std::shared_ptr<Loop> loop, const std::string& group, uint16_t port)
        : EventLoop(std::move(loop))
        , Socket(Io)
        , Nonce(GeneratePeerId())
    {
        auto address = boost::asio::ip::make_address(group);
        GroupEndpoint = udp::endpoint(address, port);

        Socket.open(udp::v4());
        Socket.set_option(udp::socket::reuse_address(true));
        Socket.bind(udp::endpoint(boost::asio::ip::address_v4::any(), port));
        Socket.set_option(boost::asio::ip::multicast::enable_loopback(true));
        // TTL 0 keeps datagrams on this host.
        Socket.set_option(boost::asio::ip::multicast::hops(0));
        Socket.set_option(boost::asio::ip::multicast::join_group(address));

        Receive();
        Thread = std::thread([this] { Io.run(); });
    }

    ~Impl() {
        Io.stop();
        if (Thread.joinable()) {
            Thread.join();
        }
        boost::system::error_code ignored;
        Socket.close(ignored);
    }

    void Receive() {
        Socket.async_receive_from(boost::asio::buffer(Buffer), Sender,
            [this](const boost::system::error_code& ec, size_t size) {
                if (ec == boost::asio::error::operation_aborted) {
                    return;
                }
                if (!ec) {
                    Dispatch(std::string(Buffer.data(), size));
                } else {
                    spdlog::warn("Local bus receive error: {}", ec.message());
                }
                Receive();
            });
    }

    void Dispatch(const std::string& datagram) {
        json j;
        try {
            j = json::parse(datagram);
            const auto channel = j.at("channel").get<std::string>();
            const auto origin = j.at("origin").get<std::string>();
            const auto from = j.at("from").get<SubscriptionId>();
            const auto message = j.at("message").get<std::string>();

            std::lock_guard<std::mutex> lock(Mutex);
            for (auto& [id, subscriber] : Subscribers) {
                if ((origin == Nonce && id == from) || subscriber.channel != channel) {
                    continue;
                }
                Deliver(*EventLoop, subscriber.listener, message);
            }
        } catch (const json::exception& e) {
            spdlog::debug("Ignoring foreign datagram on local bus: {}", e.what());
        }
    }

    std::shared_ptr<beam::Loop> EventLoop;
    boost::asio::io_context Io;
    udp::socket Socket;
    udp::endpoint GroupEndpoint;
    udp::endpoint Sender;
    std::array<char, kMaxDatagram> Buffer;
    std::string Nonce;
    std::thread Thread;

    std::mutex Mutex;
    SubscriptionId NextId = 1;
    std::map<SubscriptionId, Subscriber> Subscribers;
};

UdpBus::UdpBus(std::shared_ptr<Loop> loop, const std::string& group, uint16_t port) {
    try {
        Impl_ = std::make_unique<Impl>(std::move(loop), group, port);
    } catch (const boost::system::system_error& e) {
        throw Error(ErrorCode::TransportUnavailable,
                    "Cannot open local bus on " + group + ":" + std::to_string(port) + ": " + e.what());
    }
    spdlog::info("Local bus listening on {}:{}", group, port);
}

UdpBus::~UdpBus() = default;

BroadcastBus::SubscriptionId UdpBus::Subscribe(const std::string& channel, Listener listener) {
    std::lock_guard<std::mutex> lock(Impl_->Mutex);
    auto id = Impl_->NextId++;
    Impl_->Subscribers[id] = Impl::Subscriber{channel, std::make_shared<Listener>(std::move(listener))};
    return id;
}

void UdpBus::Unsubscribe(SubscriptionId subscription) {
    std::lock_guard<std::mutex> lock(Impl_->Mutex);
    Impl_->Subscribers.erase(subscription);
}

void UdpBus::Publish(SubscriptionId from, const std::string& channel, const std::string& message) {
    json j = {
        {"channel", channel},
        {"origin", Impl_->Nonce},
        {"from", from},
        {"message", message}
    };
    auto datagram = std::make_shared<std::string>(j.dump());
    if (datagram->size() > kMaxDatagram) {
        spdlog::warn("Local bus message too large ({} bytes), dropped", datagram->size());
        return;
    }

    auto* impl = Impl_.get();
    boost::asio::post(impl->Io, [impl, datagram] {
        boost::system::error_code ec;
        impl->Socket.send_to(boost::asio::buffer(*datagram), impl->GroupEndpoint, 0, ec);
        if (ec) {
            spdlog::warn("Local bus send failed: {}", ec.message());
        }
    });
}

LocalBusTransport::LocalBusTransport(std::shared_ptr<Loop> loop, std::shared_ptr<BroadcastBus> bus)
    : Loop_(std::move(loop))
    , Bus_(std::move(bus))
    , Handler_(std::make_shared<ReceiveHandler>())
{ }

LocalBusTransport::~LocalBusTransport() {
    Close();
}

std::string LocalBusTransport::ChannelName(const std::string& roomId) {
    return kChannelPrefix + NormalizeRoomId(roomId);
}

void LocalBusTransport::Connect() {
    Connected_ = true;
}

void LocalBusTransport::OnReceive(ReceiveHandler handler) {
    *Handler_ = std::move(handler);
}

bool LocalBusTransport::IsConnected() const {
    return Connected_;
}

void LocalBusTransport::Close() {
    LeaveChannel();
    Connected_ = false;
}

void LocalBusTransport::Send(const Envelope& envelope, const std::optional<std::string>& target) {
    if (!Connected_) {
        spdlog::warn("Local bus not connected, dropping {}", EnvelopeType(envelope));
        return;
    }

    if (auto join = std::get_if<JoinSignal>(&envelope)) {
        JoinChannel(*join);
    } else if (std::holds_alternative<LeaveSignal>(envelope)) {
        LeaveChannel();
    } else if (std::holds_alternative<GetRoomsSignal>(envelope)) {
        spdlog::debug("Room listing is not available on the local bus");
    } else if (Subscription_ == 0) {
        spdlog::warn("Not in a room, dropping {}", EnvelopeType(envelope));
    } else {
        Publish(envelope, target);
    }
}

void LocalBusTransport::JoinChannel(const JoinSignal& join) {
    LeaveChannel();

    SelfId_ = join.peerId;
    SelfName_ = join.peerName;
    auto roomId = NormalizeRoomId(join.roomId);
    Channel_ = ChannelName(roomId);
    Subscription_ = Bus_->Subscribe(Channel_, [this](const std::string& datagram) {
        HandleDatagram(datagram);
    });
    spdlog::info("Joined local channel {}", Channel_);

    Publish(AnnounceSignal{PeerRef{SelfId_, SelfName_}}, std::nullopt);

    std::weak_ptr<ReceiveHandler> weakHandler = Handler_;
    Loop_->EnqueueTask([weakHandler, roomId] {
        if (auto handler = weakHandler.lock(); handler && *handler) {
            (*handler)(RoomJoinedSignal{roomId, {}});
        }
    });
}

void LocalBusTransport::LeaveChannel() {
    if (Subscription_ == 0) {
        return;
    }
    Publish(LeaveSignal{PeerRef{SelfId_, SelfName_}}, std::nullopt);
    Bus_->Unsubscribe(Subscription_);
    Subscription_ = 0;
    spdlog::info("Left local channel {}", Channel_);
    Channel_.clear();
}

void LocalBusTransport::Publish(const Envelope& envelope, const std::optional<std::string>& target) {
    json j = {{"envelope", EnvelopeToJson(envelope)}};
    if (target) {
        j["to"] = *target;
    }
    Bus_->Publish(Subscription_, Channel_, j.dump());
}

void LocalBusTransport::HandleDatagram(const std::string& datagram) {
    if (!*Handler_) {
        return;
    }

    Envelope envelope;
    try {
        auto j = json::parse(datagram);
        if (auto to = j.find("to"); to != j.end() && to->is_string() && to->get<std::string>() != SelfId_) {
            return;
        }
        envelope = EnvelopeFromJson(j.at("envelope"));
    } catch (const json::exception& e) {
        spdlog::warn("Invalid local bus message dropped: {}", e.what());
        return;
    } catch (const Error& e) {
        spdlog::warn("Invalid local bus message dropped: {}", e.what());
        return;
    }

    (*Handler_)(envelope);
}

} // namespace beam
