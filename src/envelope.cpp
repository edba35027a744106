#include "envelope.hpp"

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <iterator>
#include <type_traits>

namespace beam {

namespace {

using json = nlohmann::json;

template <typename T>
constexpr bool kAlwaysFalse = false;

std::string RequireString(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string()) {
        throw Error(ErrorCode::MalformedEnvelope, std::string("missing string field '") + field + "'");
    }
    return it->get<std::string>();
}

std::string OptionalString(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw Error(ErrorCode::MalformedEnvelope, std::string("field '") + field + "' is not a string");
    }
    return it->get<std::string>();
}

const json& RequireObject(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_object()) {
        throw Error(ErrorCode::MalformedEnvelope, std::string("missing object field '") + field + "'");
    }
    return *it;
}

const json& RequireArray(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_array()) {
        throw Error(ErrorCode::MalformedEnvelope, std::string("missing array field '") + field + "'");
    }
    return *it;
}

SessionDescription DescriptionFromJson(const json& j) {
    return SessionDescription{RequireString(j, "type"), RequireString(j, "sdp")};
}

json DescriptionToJson(const SessionDescription& description) {
    return {{"type", description.type}, {"sdp", description.sdp}};
}

IceCandidate CandidateFromJson(const json& j) {
    IceCandidate candidate;
    candidate.candidate = RequireString(j, "candidate");
    candidate.sdpMid = OptionalString(j, "sdpMid");
    if (auto it = j.find("sdpMLineIndex"); it != j.end() && it->is_number_integer()) {
        candidate.sdpMLineIndex = it->get<int>();
    }
    return candidate;
}

json CandidateToJson(const IceCandidate& candidate) {
    json j = {{"candidate", candidate.candidate}, {"sdpMid", candidate.sdpMid}};
    if (candidate.sdpMLineIndex) {
        j["sdpMLineIndex"] = *candidate.sdpMLineIndex;
    }
    return j;
}

// Membership notifications use {peerId, peerName}; room listings use {id, name}.
PeerRef PeerFromJson(const json& j, const char* idField, const char* nameField) {
    if (!j.is_object()) {
        throw Error(ErrorCode::MalformedEnvelope, "peer entry is not an object");
    }
    return PeerRef{RequireString(j, idField), OptionalString(j, nameField)};
}

json PeerToJson(const PeerRef& peer, const char* idField, const char* nameField) {
    return {{idField, peer.peerId}, {nameField, peer.peerName}};
}

RoomSummary RoomFromJson(const json& j) {
    if (!j.is_object()) {
        throw Error(ErrorCode::MalformedEnvelope, "room entry is not an object");
    }
    RoomSummary room;
    room.id = RequireString(j, "id");
    for (const auto& peer : RequireArray(j, "peers")) {
        room.peers.push_back(PeerFromJson(peer, "id", "name"));
    }
    room.peerCount = j.value("peerCount", room.peers.size());
    return room;
}

json RoomToJson(const RoomSummary& room) {
    json peers = json::array();
    for (const auto& peer : room.peers) {
        peers.push_back(PeerToJson(peer, "id", "name"));
    }
    return {{"id", room.id}, {"peerCount", room.peerCount}, {"peers", std::move(peers)}};
}

Envelope FromJsonUnchecked(const json& j) {
    if (!j.is_object()) {
        throw Error(ErrorCode::MalformedEnvelope, "envelope is not an object");
    }

    const std::string type = RequireString(j, "type");

    if (type == "join") {
        return JoinSignal{OptionalString(j, "roomId"), RequireString(j, "peerId"), OptionalString(j, "peerName")};
    }
    if (type == "room-joined") {
        RoomJoinedSignal signal;
        signal.roomId = RequireString(j, "roomId");
        for (const auto& peer : RequireArray(j, "peers")) {
            signal.peers.push_back(PeerFromJson(peer, "peerId", "peerName"));
        }
        return signal;
    }
    if (type == "peer-joined") {
        return PeerJoinedSignal{PeerFromJson(j, "peerId", "peerName")};
    }
    if (type == "peer-left") {
        return PeerLeftSignal{PeerFromJson(j, "peerId", "peerName")};
    }
    if (type == "offer") {
        return OfferSignal{RequireString(j, "from"), OptionalString(j, "fromName"), RequireString(j, "to"),
                           DescriptionFromJson(RequireObject(j, "offer"))};
    }
    if (type == "answer") {
        return AnswerSignal{RequireString(j, "from"), OptionalString(j, "fromName"), RequireString(j, "to"),
                            DescriptionFromJson(RequireObject(j, "answer"))};
    }
    if (type == "ice-candidate") {
        return CandidateSignal{RequireString(j, "from"), RequireString(j, "to"),
                               CandidateFromJson(RequireObject(j, "candidate"))};
    }
    if (type == "get-rooms") {
        return GetRoomsSignal{};
    }
    if (type == "rooms-list") {
        RoomsListSignal signal;
        for (const auto& room : RequireArray(j, "rooms")) {
            signal.rooms.push_back(RoomFromJson(room));
        }
        return signal;
    }
    if (type == "announce") {
        return AnnounceSignal{PeerFromJson(j, "peerId", "peerName")};
    }
    if (type == "leave") {
        return LeaveSignal{PeerFromJson(j, "peerId", "peerName")};
    }

    throw Error(ErrorCode::MalformedEnvelope, "unknown envelope type '" + type + "'");
}

} // namespace

Envelope EnvelopeFromJson(const json& j) {
    try {
        return FromJsonUnchecked(j);
    } catch (const json::exception& e) {
        throw Error(ErrorCode::MalformedEnvelope, e.what());
    }
}

Envelope ParseEnvelope(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw Error(ErrorCode::MalformedEnvelope, e.what());
    }
    return EnvelopeFromJson(j);
}

json EnvelopeToJson(const Envelope& envelope) {
    json j = std::visit([](const auto& signal) -> json {
        using T = std::decay_t<decltype(signal)>;

        if constexpr (std::is_same_v<T, JoinSignal>) {
            return {{"roomId", signal.roomId}, {"peerId", signal.peerId}, {"peerName", signal.peerName}};
        } else if constexpr (std::is_same_v<T, RoomJoinedSignal>) {
            json peers = json::array();
            for (const auto& peer : signal.peers) {
                peers.push_back(PeerToJson(peer, "peerId", "peerName"));
            }
            return {{"roomId", signal.roomId}, {"peers", std::move(peers)}};
        } else if constexpr (std::is_same_v<T, PeerJoinedSignal> || std::is_same_v<T, PeerLeftSignal> ||
                             std::is_same_v<T, AnnounceSignal> || std::is_same_v<T, LeaveSignal>) {
            return PeerToJson(signal.peer, "peerId", "peerName");
        } else if constexpr (std::is_same_v<T, OfferSignal>) {
            return {{"from", signal.from}, {"fromName", signal.fromName}, {"to", signal.to},
                    {"offer", DescriptionToJson(signal.offer)}};
        } else if constexpr (std::is_same_v<T, AnswerSignal>) {
            return {{"from", signal.from}, {"fromName", signal.fromName}, {"to", signal.to},
                    {"answer", DescriptionToJson(signal.answer)}};
        } else if constexpr (std::is_same_v<T, CandidateSignal>) {
            return {{"from", signal.from}, {"to", signal.to}, {"candidate", CandidateToJson(signal.candidate)}};
        } else if constexpr (std::is_same_v<T, GetRoomsSignal>) {
            return json::object();
        } else if constexpr (std::is_same_v<T, RoomsListSignal>) {
            json rooms = json::array();
            for (const auto& room : signal.rooms) {
                rooms.push_back(RoomToJson(room));
            }
            return {{"rooms", std::move(rooms)}};
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled envelope type");
        }
    }, envelope);

    j["type"] = std::string(EnvelopeType(envelope));
    return j;
}

std::string SerializeEnvelope(const Envelope& envelope) {
    return EnvelopeToJson(envelope).dump();
}

std::string_view EnvelopeType(const Envelope& envelope) {
    static constexpr std::string_view kNames[] = {
        "join",
        "room-joined",
        "peer-joined",
        "peer-left",
        "offer",
        "answer",
        "ice-candidate",
        "get-rooms",
        "rooms-list",
        "announce",
        "leave",
    };
    static_assert(std::size(kNames) == std::variant_size_v<Envelope>);
    return kNames[envelope.index()];
}

std::optional<std::string> EnvelopeRecipient(const Envelope& envelope) {
    if (auto offer = std::get_if<OfferSignal>(&envelope)) {
        return offer->to;
    }
    if (auto answer = std::get_if<AnswerSignal>(&envelope)) {
        return answer->to;
    }
    if (auto candidate = std::get_if<CandidateSignal>(&envelope)) {
        return candidate->to;
    }
    return std::nullopt;
}

} // namespace beam
