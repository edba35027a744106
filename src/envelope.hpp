#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace beam {

struct SessionDescription {
    std::string type; // "offer" or "answer"
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string sdpMid;
    std::optional<int> sdpMLineIndex;
};

struct PeerRef {
    std::string peerId;
    std::string peerName;
};

struct RoomSummary {
    std::string id;
    size_t peerCount = 0;
    std::vector<PeerRef> peers;
};

struct JoinSignal {
    std::string roomId;
    std::string peerId;
    std::string peerName;
};

struct RoomJoinedSignal {
    std::string roomId;
    std::vector<PeerRef> peers;
};

struct PeerJoinedSignal {
    PeerRef peer;
};

struct PeerLeftSignal {
    PeerRef peer;
};

struct OfferSignal {
    std::string from;
    std::string fromName;
    std::string to;
    SessionDescription offer;
};

struct AnswerSignal {
    std::string from;
    std::string fromName;
    std::string to;
    SessionDescription answer;
};

struct CandidateSignal {
    std::string from;
    std::string to;
    IceCandidate candidate;
};

struct GetRoomsSignal { };

struct RoomsListSignal {
    std::vector<RoomSummary> rooms;
};

struct AnnounceSignal {
    PeerRef peer;
};

struct LeaveSignal {
    PeerRef peer;
};

using Envelope = std::variant<
    JoinSignal,
    RoomJoinedSignal,
    PeerJoinedSignal,
    PeerLeftSignal,
    OfferSignal,
    AnswerSignal,
    CandidateSignal,
    GetRoomsSignal,
    RoomsListSignal,
    AnnounceSignal,
    LeaveSignal>;

// All of these throw Error{MalformedEnvelope} on bad input.
Envelope ParseEnvelope(const std::string& text);
Envelope EnvelopeFromJson(const nlohmann::json& j);

nlohmann::json EnvelopeToJson(const Envelope& envelope);
std::string SerializeEnvelope(const Envelope& envelope);

// Wire name, e.g. "ice-candidate".
std::string_view EnvelopeType(const Envelope& envelope);

// The `to` field of peer-to-peer envelopes; nullopt for everything else.
std::optional<std::string> EnvelopeRecipient(const Envelope& envelope);

} // namespace beam
