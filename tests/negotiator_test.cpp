#include "chat_message.hpp"
#include "error.hpp"
#include "fakes.hpp"
#include "negotiator.hpp"

#include <gtest/gtest.h>

using namespace beam;
using namespace beam::fakes;

namespace {

class NegotiatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Loop_ = std::make_shared<Loop>();
        Network_ = std::make_shared<FakeNetwork>(Loop_);
        Offerer_ = Make(PeerIdentity{"a", "Alice"}, PeerRef{"b", ""}, OffererOut_);
        Answerer_ = Make(PeerIdentity{"b", "Bob"}, PeerRef{"a", "Alice"}, AnswererOut_);
    }

    std::shared_ptr<Negotiator> Make(PeerIdentity self, PeerRef remote, std::vector<Envelope>& out) {
        Negotiator::Events events;
        events.sendSignal = [&out](const Envelope& envelope) { out.push_back(envelope); };
        events.onFailed = [this](Negotiator& n) { Failed_.push_back(n.RemoteId()); };
        events.onChannelMessage = [this](Negotiator& n, const std::string& payload) {
            Received_.emplace_back(n.RemoteId(), payload);
        };
        return std::make_shared<Negotiator>(std::move(self), std::move(remote), std::move(events));
    }

    // Hands every queued envelope to its recipient, in order.
    void Flush(std::vector<Envelope>& from, Negotiator& to) {
        auto batch = std::move(from);
        from.clear();
        for (const auto& envelope : batch) {
            Deliver(envelope, to);
        }
    }

    void Deliver(const Envelope& envelope, Negotiator& to) {
        if (auto offer = std::get_if<OfferSignal>(&envelope)) {
            to.ReceiveOffer(*Network_, offer->offer);
        } else if (auto answer = std::get_if<AnswerSignal>(&envelope)) {
            to.ReceiveAnswer(answer->answer);
        } else if (auto candidate = std::get_if<CandidateSignal>(&envelope)) {
            to.ReceiveCandidate(candidate->candidate);
        }
    }

    void Exchange() {
        for (int i = 0; i < 10; ++i) {
            Drain(*Loop_);
            Flush(OffererOut_, *Answerer_);
            Flush(AnswererOut_, *Offerer_);
        }
        Drain(*Loop_);
    }

    std::shared_ptr<Loop> Loop_;
    std::shared_ptr<FakeNetwork> Network_;
    std::vector<Envelope> OffererOut_;
    std::vector<Envelope> AnswererOut_;
    std::shared_ptr<Negotiator> Offerer_;
    std::shared_ptr<Negotiator> Answerer_;
    std::vector<std::string> Failed_;
    std::vector<std::pair<std::string, std::string>> Received_;
};

} // namespace

TEST_F(NegotiatorTest, InitiateEmitsOfferThenCandidates) {
    Offerer_->Initiate(*Network_);
    EXPECT_EQ(Offerer_->State(), ConnectionState::Negotiating);
    EXPECT_EQ(Offerer_->GetRole(), Negotiator::Role::Offerer);

    Drain(*Loop_);
    ASSERT_EQ(OffererOut_.size(), 3u);
    auto offer = std::get<OfferSignal>(OffererOut_[0]);
    EXPECT_EQ(offer.from, "a");
    EXPECT_EQ(offer.fromName, "Alice");
    EXPECT_EQ(offer.to, "b");
    EXPECT_TRUE(std::holds_alternative<CandidateSignal>(OffererOut_[1]));
    EXPECT_EQ(std::get<CandidateSignal>(OffererOut_[2]).to, "b");
}

TEST_F(NegotiatorTest, EarlyCandidatesWaitForRemoteDescription) {
    Offerer_->Initiate(*Network_);
    Drain(*Loop_);

    // Candidates overtake the offer.
    std::vector<IceCandidate> sent;
    for (const auto& envelope : OffererOut_) {
        if (auto candidate = std::get_if<CandidateSignal>(&envelope)) {
            sent.push_back(candidate->candidate);
            Answerer_->ReceiveCandidate(candidate->candidate);
        }
    }
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(Answerer_->PendingCandidateCount(), 2u);
    EXPECT_FALSE(Answerer_->HasRemoteDescription());

    Answerer_->ReceiveOffer(*Network_, std::get<OfferSignal>(OffererOut_[0]).offer);
    EXPECT_TRUE(Answerer_->HasRemoteDescription());
    EXPECT_EQ(Answerer_->PendingCandidateCount(), 0u);

    auto link = Network_->Link(2);
    ASSERT_NE(link, nullptr);
    EXPECT_FALSE(link->candidateBeforeRemote);
    ASSERT_EQ(link->addedCandidates.size(), 2u);
    EXPECT_EQ(link->addedCandidates[0].candidate, sent[0].candidate);
    EXPECT_EQ(link->addedCandidates[1].candidate, sent[1].candidate);

    // Later candidates go straight through.
    Answerer_->ReceiveCandidate(IceCandidate{"candidate:late", "0", 0});
    EXPECT_EQ(link->addedCandidates.size(), 3u);
}

TEST_F(NegotiatorTest, FullExchangeOpensChannelAndHandshakes) {
    Offerer_->Initiate(*Network_);
    Exchange();

    EXPECT_EQ(Offerer_->State(), ConnectionState::Connected);
    EXPECT_EQ(Answerer_->State(), ConnectionState::Connected);
    EXPECT_TRUE(Offerer_->IsChannelOpen());
    EXPECT_TRUE(Answerer_->IsChannelOpen());
    EXPECT_EQ(Answerer_->GetRole(), Negotiator::Role::Answerer);

    ASSERT_EQ(Received_.size(), 2u);
    for (const auto& [from, payload] : Received_) {
        EXPECT_TRUE(std::holds_alternative<Handshake>(ParseChannelPayload(payload))) << payload;
    }

    EXPECT_TRUE(Offerer_->Send("hello"));
    Drain(*Loop_);
    ASSERT_EQ(Received_.size(), 3u);
    EXPECT_EQ(Received_.back().first, "a");
    EXPECT_EQ(Received_.back().second, "hello");
}

TEST_F(NegotiatorTest, LinkConnectedAloneIsNotSendable) {
    Offerer_->Initiate(*Network_);
    Drain(*Loop_);

    Network_->Link(1)->callbacks.onStateChange(LinkState::Connected);
    EXPECT_EQ(Offerer_->State(), ConnectionState::Connected);
    EXPECT_FALSE(Offerer_->IsChannelOpen());
    EXPECT_FALSE(Offerer_->Send("too early"));
}

TEST_F(NegotiatorTest, SecondAnswerIsIgnored) {
    Offerer_->Initiate(*Network_);
    Exchange();
    ASSERT_TRUE(Offerer_->HasRemoteDescription());

    EXPECT_NO_THROW(Offerer_->ReceiveAnswer(SessionDescription{"answer", "fake:99"}));
    EXPECT_EQ(Network_->Link(1)->remoteDescription->sdp, "fake:2");
    EXPECT_TRUE(Failed_.empty());
}

TEST_F(NegotiatorTest, RepeatedOfferKeepsConnectedState) {
    Offerer_->Initiate(*Network_);
    Exchange();
    ASSERT_EQ(Answerer_->State(), ConnectionState::Connected);
    ASSERT_TRUE(Answerer_->IsChannelOpen());

    EXPECT_NO_THROW(Answerer_->ReceiveOffer(*Network_, SessionDescription{"offer", "fake:1"}));
    Drain(*Loop_);

    EXPECT_EQ(Answerer_->State(), ConnectionState::Connected);
    EXPECT_TRUE(Answerer_->IsChannelOpen());
    EXPECT_TRUE(AnswererOut_.empty());
    EXPECT_EQ(Network_->Links().size(), 2u);
    EXPECT_TRUE(Answerer_->Send("still up"));
}

TEST_F(NegotiatorTest, LinkCreationFailureThrows) {
    Network_->FailNextCreate = true;
    try {
        Offerer_->Initiate(*Network_);
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.Code(), ErrorCode::NegotiationFailure);
    }
    EXPECT_TRUE(Offerer_->IsClosed());
    EXPECT_EQ(Offerer_->State(), ConnectionState::Disconnected);
}

TEST_F(NegotiatorTest, UnusableOfferThrowsNegotiationFailure) {
    try {
        Answerer_->ReceiveOffer(*Network_, SessionDescription{"offer", "garbage"});
        FAIL() << "expected an error";
    } catch (const Error& e) {
        EXPECT_EQ(e.Code(), ErrorCode::NegotiationFailure);
    }
    EXPECT_TRUE(Answerer_->IsClosed());
}

TEST_F(NegotiatorTest, LinkFailureTearsDownAndReports) {
    Offerer_->Initiate(*Network_);
    Exchange();

    Network_->FailLink(1);
    Drain(*Loop_);

    ASSERT_EQ(Failed_.size(), 1u);
    EXPECT_EQ(Failed_[0], "b");
    EXPECT_TRUE(Offerer_->IsClosed());
    EXPECT_FALSE(Offerer_->IsChannelOpen());
    EXPECT_TRUE(Network_->Link(1)->closed);

    // The other side sees its channel close.
    EXPECT_FALSE(Answerer_->IsChannelOpen());
}

TEST_F(NegotiatorTest, TeardownSilencesPendingEvents) {
    Offerer_->Initiate(*Network_);
    Offerer_->Teardown();
    Drain(*Loop_);

    EXPECT_TRUE(OffererOut_.empty());
    EXPECT_EQ(Offerer_->State(), ConnectionState::Disconnected);
    EXPECT_FALSE(Offerer_->Send("x"));

    // Inputs after teardown are ignored.
    Offerer_->ReceiveCandidate(IceCandidate{"candidate:x", "0", 0});
    EXPECT_EQ(Offerer_->PendingCandidateCount(), 0u);
}

TEST_F(NegotiatorTest, FailedSendReturnsFalse) {
    Offerer_->Initiate(*Network_);
    Exchange();

    Network_->Link(1)->channel->FailSends = true;
    EXPECT_FALSE(Offerer_->Send("lost"));
    EXPECT_TRUE(Answerer_->Send("still fine"));
}
