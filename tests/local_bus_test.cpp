#include "fakes.hpp"
#include "local_bus.hpp"
#include "mesh_coordinator.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace beam;
using namespace beam::fakes;

namespace {

struct BusPeer {
    std::shared_ptr<LocalBusTransport> transport;
    std::unique_ptr<MeshCoordinator> mesh;
    std::vector<ChatMessage> messages;
    std::vector<PeerRef> left;
};

class LocalBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        Loop_ = std::make_shared<Loop>();
        Network_ = std::make_shared<FakeNetwork>(Loop_);
        Bus_ = std::make_shared<InProcessBus>(Loop_);
    }

    void TearDown() override {
        Peers_.clear();
        Drain(*Loop_);
    }

    BusPeer& AddPeer(const std::string& id, const std::string& name) {
        auto peer = std::make_unique<BusPeer>();
        peer->transport = std::make_shared<LocalBusTransport>(Loop_, Bus_);
        peer->mesh = std::make_unique<MeshCoordinator>(PeerIdentity{id, name}, peer->transport, Network_);

        auto* p = peer.get();
        p->mesh->OnMessage([p](const ChatMessage& message) { p->messages.push_back(message); });
        p->mesh->OnPeerLeave([p](const PeerRef& ref) { p->left.push_back(ref); });
        p->mesh->Connect();

        Peers_.push_back(std::move(peer));
        return *p;
    }

    std::shared_ptr<Loop> Loop_;
    std::shared_ptr<FakeNetwork> Network_;
    std::shared_ptr<InProcessBus> Bus_;
    std::vector<std::unique_ptr<BusPeer>> Peers_;
};

} // namespace

TEST(LocalBusChannelTest, ChannelIsNamedAfterNormalizedRoom) {
    EXPECT_EQ(LocalBusTransport::ChannelName("abcd"), "peerbeam-ABCD");
    EXPECT_EQ(LocalBusTransport::ChannelName("ABCD"), "peerbeam-ABCD");
}

TEST_F(LocalBusTest, ThreePeersMeshWithoutServer) {
    auto& a = AddPeer("peer-a", "A");
    auto& b = AddPeer("peer-b", "B");
    auto& c = AddPeer("peer-c", "C");

    for (auto* peer : {&a, &b, &c}) {
        peer->mesh->Join("lan");
        Drain(*Loop_);
        EXPECT_EQ(peer->mesh->RoomId(), "LAN");
    }

    for (auto* peer : {&a, &b, &c}) {
        auto roster = peer->mesh->Roster();
        ASSERT_EQ(roster.size(), 2u) << peer->mesh->Self().id;
        for (const auto& info : roster) {
            EXPECT_NE(info.id, peer->mesh->Self().id);
        }
    }

    b.mesh->SendMessage("over the bus");
    Drain(*Loop_);
    ASSERT_EQ(a.messages.size(), 1u);
    ASSERT_EQ(c.messages.size(), 1u);
    EXPECT_EQ(a.messages[0].senderName, "B");
    EXPECT_TRUE(b.messages.empty());
}

TEST_F(LocalBusTest, RoomsAreSeparateChannels) {
    auto& a = AddPeer("peer-a", "A");
    auto& b = AddPeer("peer-b", "B");
    a.mesh->Join("one");
    b.mesh->Join("two");
    Drain(*Loop_);

    EXPECT_TRUE(a.mesh->AllPeers().empty());
    EXPECT_TRUE(b.mesh->AllPeers().empty());
}

TEST_F(LocalBusTest, LeaveTearsDownOnOthers) {
    auto& a = AddPeer("peer-a", "A");
    auto& b = AddPeer("peer-b", "B");
    auto& c = AddPeer("peer-c", "C");
    for (auto* peer : {&a, &b, &c}) {
        peer->mesh->Join("lan");
        Drain(*Loop_);
    }

    b.mesh->Leave();
    Drain(*Loop_);

    EXPECT_FALSE(b.transport->IsConnected());
    EXPECT_TRUE(b.mesh->AllPeers().empty());
    for (auto* peer : {&a, &c}) {
        ASSERT_EQ(peer->left.size(), 1u);
        EXPECT_EQ(peer->left[0].peerId, "peer-b");
        auto roster = peer->mesh->Roster();
        ASSERT_EQ(roster.size(), 1u);
        EXPECT_NE(roster[0].id, "peer-b");
    }
}

TEST_F(LocalBusTest, DatagramsForOtherPeersAreIgnored) {
    auto& a = AddPeer("peer-a", "A");
    a.mesh->Join("lan");
    Drain(*Loop_);

    auto remote = Network_->CreateLink(LinkCallbacks{});
    const auto channel = LocalBusTransport::ChannelName("lan");
    OfferSignal offer{"peer-z", "Zed", "peer-q", SessionDescription{"offer", "fake:1"}};

    nlohmann::json addressed = {{"envelope", EnvelopeToJson(offer)}, {"to", "peer-q"}};
    Bus_->Publish(0, channel, addressed.dump());
    Bus_->Publish(0, channel, "not json at all");
    Bus_->Publish(0, channel, R"({"envelope":{"type":"bogus"}})");
    Drain(*Loop_);
    EXPECT_TRUE(a.mesh->AllPeers().empty());

    offer.to = "peer-a";
    nlohmann::json direct = {{"envelope", EnvelopeToJson(offer)}, {"to", "peer-a"}};
    Bus_->Publish(0, channel, direct.dump());
    Drain(*Loop_);
    ASSERT_EQ(a.mesh->AllPeers().size(), 1u);
    EXPECT_EQ(a.mesh->AllPeers()[0].id, "peer-z");
}

TEST_F(LocalBusTest, SendOutsideRoomIsDropped) {
    auto transport = std::make_shared<LocalBusTransport>(Loop_, Bus_);
    int received = 0;
    auto listener = Bus_->Subscribe(LocalBusTransport::ChannelName("lan"), [&received](const std::string&) {
        ++received;
    });

    transport->Connect();
    transport->Send(CandidateSignal{"peer-a", "peer-b", IceCandidate{"candidate:x", "0", 0}}, std::string("peer-b"));
    Drain(*Loop_);
    EXPECT_EQ(received, 0);

    Bus_->Unsubscribe(listener);
}
