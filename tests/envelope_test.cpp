#include "chat_message.hpp"
#include "envelope.hpp"
#include "error.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace beam;
using json = nlohmann::json;

namespace {

ErrorCode ParseErrorCode(const std::string& text) {
    try {
        ParseEnvelope(text);
    } catch (const Error& e) {
        return e.Code();
    }
    ADD_FAILURE() << "no error for " << text;
    return ErrorCode::InvalidConfig;
}

} // namespace

TEST(EnvelopeTest, ParsesJoin) {
    auto envelope = ParseEnvelope(R"({"type":"join","roomId":"abcd","peerId":"p1","peerName":"Alice"})");
    auto join = std::get_if<JoinSignal>(&envelope);
    ASSERT_NE(join, nullptr);
    EXPECT_EQ(join->roomId, "abcd");
    EXPECT_EQ(join->peerId, "p1");
    EXPECT_EQ(join->peerName, "Alice");
}

TEST(EnvelopeTest, JoinWithoutRoomIdIsAccepted) {
    auto envelope = ParseEnvelope(R"({"type":"join","peerId":"p1"})");
    ASSERT_TRUE(std::holds_alternative<JoinSignal>(envelope));
    EXPECT_TRUE(std::get<JoinSignal>(envelope).roomId.empty());
}

TEST(EnvelopeTest, ParsesRoomJoinedPeers) {
    auto envelope = ParseEnvelope(
        R"({"type":"room-joined","roomId":"ABCD","peers":[{"peerId":"a","peerName":"A"},{"peerId":"b","peerName":"B"}]})");
    auto joined = std::get<RoomJoinedSignal>(envelope);
    EXPECT_EQ(joined.roomId, "ABCD");
    ASSERT_EQ(joined.peers.size(), 2u);
    EXPECT_EQ(joined.peers[1].peerId, "b");
    EXPECT_EQ(joined.peers[1].peerName, "B");
}

TEST(EnvelopeTest, ParsesOfferAnswerAndCandidate) {
    auto offer = std::get<OfferSignal>(ParseEnvelope(
        R"({"type":"offer","from":"a","fromName":"A","to":"b","offer":{"type":"offer","sdp":"v=0"}})"));
    EXPECT_EQ(offer.from, "a");
    EXPECT_EQ(offer.to, "b");
    EXPECT_EQ(offer.offer.sdp, "v=0");

    auto answer = std::get<AnswerSignal>(ParseEnvelope(
        R"({"type":"answer","from":"b","to":"a","answer":{"type":"answer","sdp":"v=0"}})"));
    EXPECT_TRUE(answer.fromName.empty());
    EXPECT_EQ(answer.answer.type, "answer");

    auto candidate = std::get<CandidateSignal>(ParseEnvelope(
        R"({"type":"ice-candidate","from":"a","to":"b","candidate":{"candidate":"candidate:1","sdpMid":"0","sdpMLineIndex":0}})"));
    EXPECT_EQ(candidate.candidate.candidate, "candidate:1");
    EXPECT_EQ(candidate.candidate.sdpMid, "0");
    EXPECT_EQ(candidate.candidate.sdpMLineIndex, 0);
}

TEST(EnvelopeTest, CandidateLineIndexIsOptional) {
    auto candidate = std::get<CandidateSignal>(ParseEnvelope(
        R"({"type":"ice-candidate","from":"a","to":"b","candidate":{"candidate":"c","sdpMid":null}})"));
    EXPECT_FALSE(candidate.candidate.sdpMLineIndex.has_value());
    EXPECT_TRUE(candidate.candidate.sdpMid.empty());

    auto j = EnvelopeToJson(candidate);
    EXPECT_FALSE(j["candidate"].contains("sdpMLineIndex"));
}

TEST(EnvelopeTest, RoomsListUsesShortPeerFields) {
    RoomsListSignal list;
    list.rooms.push_back(RoomSummary{"ABCD", 1, {PeerRef{"a", "Alice"}}});

    auto j = EnvelopeToJson(list);
    EXPECT_EQ(j["type"], "rooms-list");
    EXPECT_EQ(j["rooms"][0]["id"], "ABCD");
    EXPECT_EQ(j["rooms"][0]["peerCount"], 1);
    EXPECT_EQ(j["rooms"][0]["peers"][0]["id"], "a");
    EXPECT_EQ(j["rooms"][0]["peers"][0]["name"], "Alice");

    auto parsed = std::get<RoomsListSignal>(EnvelopeFromJson(j));
    ASSERT_EQ(parsed.rooms.size(), 1u);
    EXPECT_EQ(parsed.rooms[0].peers[0].peerName, "Alice");
}

TEST(EnvelopeTest, MembershipSignalsUsePeerFields) {
    auto j = EnvelopeToJson(PeerLeftSignal{PeerRef{"a", "Alice"}});
    EXPECT_EQ(j, json({{"type", "peer-left"}, {"peerId", "a"}, {"peerName", "Alice"}}));

    auto announce = std::get<AnnounceSignal>(ParseEnvelope(R"({"type":"announce","peerId":"x","peerName":"X"})"));
    EXPECT_EQ(announce.peer.peerId, "x");
}

TEST(EnvelopeTest, GetRoomsHasOnlyType) {
    EXPECT_EQ(SerializeEnvelope(GetRoomsSignal{}), R"({"type":"get-rooms"})");
}

TEST(EnvelopeTest, RejectsMalformedInput) {
    EXPECT_EQ(ParseErrorCode("not json"), ErrorCode::MalformedEnvelope);
    EXPECT_EQ(ParseErrorCode("[1,2]"), ErrorCode::MalformedEnvelope);
    EXPECT_EQ(ParseErrorCode(R"({"roomId":"x"})"), ErrorCode::MalformedEnvelope);
    EXPECT_EQ(ParseErrorCode(R"({"type":"teleport"})"), ErrorCode::MalformedEnvelope);
    EXPECT_EQ(ParseErrorCode(R"({"type":"offer","from":"a","to":"b"})"), ErrorCode::MalformedEnvelope);
    EXPECT_EQ(ParseErrorCode(R"({"type":"offer","from":"a","to":"b","offer":{"type":"offer"}})"),
              ErrorCode::MalformedEnvelope);
    EXPECT_EQ(ParseErrorCode(R"({"type":"join","peerId":5})"), ErrorCode::MalformedEnvelope);
    EXPECT_EQ(ParseErrorCode(R"({"type":"room-joined","roomId":"A","peers":[7]})"), ErrorCode::MalformedEnvelope);
}

TEST(EnvelopeTest, TypeAndRecipient) {
    CandidateSignal candidate{"a", "b", IceCandidate{"c", "0", 0}};
    EXPECT_EQ(EnvelopeType(candidate), "ice-candidate");
    EXPECT_EQ(EnvelopeRecipient(candidate), std::optional<std::string>("b"));
    EXPECT_EQ(EnvelopeType(RoomJoinedSignal{}), "room-joined");
    EXPECT_FALSE(EnvelopeRecipient(JoinSignal{"R", "a", "A"}).has_value());
}

TEST(ChatMessageTest, ParsesMessageAndHandshake) {
    auto message = MakeChatMessage(PeerIdentity{"id1", "Alice"}, "hello");
    auto parsed = ParseChannelPayload(SerializeChatMessage(message));
    auto chat = std::get_if<ChatMessage>(&parsed);
    ASSERT_NE(chat, nullptr);
    EXPECT_EQ(chat->id, message.id);
    EXPECT_EQ(chat->sender, "id1");
    EXPECT_EQ(chat->senderName, "Alice");
    EXPECT_EQ(chat->text, "hello");
    EXPECT_EQ(chat->timestamp, message.timestamp);

    auto handshake = std::get<Handshake>(ParseChannelPayload(SerializeHandshake(Handshake{"Bob", "id2"})));
    EXPECT_EQ(handshake.name, "Bob");
    EXPECT_EQ(handshake.id, "id2");
}

TEST(ChatMessageTest, RejectsGarbage) {
    EXPECT_THROW(ParseChannelPayload("{"), Error);
    EXPECT_THROW(ParseChannelPayload(R"({"text":"no id"})"), Error);
    EXPECT_THROW(ParseChannelPayload(R"("just a string")"), Error);
}
