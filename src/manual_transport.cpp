#include "manual_transport.hpp"

#include "error.hpp"
#include "identity.hpp"
#include "loop.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace beam {

namespace {

using json = nlohmann::json;

using ToBase64 = boost::archive::iterators::base64_from_binary<
    boost::archive::iterators::transform_width<std::string::const_iterator, 6, 8>>;
using FromBase64 = boost::archive::iterators::transform_width<
    boost::archive::iterators::binary_from_base64<std::string::const_iterator>, 8, 6>;

} // namespace

std::string EncodeBase64(const std::string& data) {
    std::string out(ToBase64(data.begin()), ToBase64(data.end()));
    out.append((3 - data.size() % 3) % 3, '=');
    return out;
}

std::string DecodeBase64(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(clean), [](unsigned char c) {
        return !std::isspace(c);
    });
    if (clean.size() % 4 != 0) {
        throw Error(ErrorCode::MalformedEnvelope, "base64 length is not a multiple of 4");
    }

    size_t padding = 0;
    for (auto it = clean.rbegin(); it != clean.rend() && *it == '=' && padding < 2; ++it) {
        *it = 'A';
        ++padding;
    }

    try {
        std::string out(FromBase64(clean.begin()), FromBase64(clean.end()));
        out.erase(out.size() - std::min(padding, out.size()));
        return out;
    } catch (const std::exception& e) {
        throw Error(ErrorCode::MalformedEnvelope, std::string("invalid base64: ") + e.what());
    }
}

ManualTransport::ManualTransport(std::shared_ptr<Loop> loop, ManualRole role)
    : Loop_(std::move(loop))
    , Role_(role)
    , Handler_(std::make_shared<ReceiveHandler>())
{ }

void ManualTransport::Connect() {
    Connected_ = true;
}

void ManualTransport::OnReceive(ReceiveHandler handler) {
    *Handler_ = std::move(handler);
}

void ManualTransport::Close() {
    Connected_ = false;
    Outbox_.clear();
}

bool ManualTransport::IsConnected() const {
    return Connected_;
}

void ManualTransport::Send(const Envelope& envelope, const std::optional<std::string>&) {
    if (!Connected_) {
        spdlog::warn("Manual exchange closed, dropping {}", EnvelopeType(envelope));
        return;
    }

    if (auto join = std::get_if<JoinSignal>(&envelope)) {
        SelfId_ = join->peerId;
        SelfName_ = join->peerName;
        Outbox_.clear();

        auto roomId = join->roomId.empty() ? std::string(kDefaultRoom) : NormalizeRoomId(join->roomId);
        RoomJoinedSignal joined{roomId, {}};
        // The creator is the newcomer that offers; the joiner waits for a blob.
        if (Role_ == ManualRole::Creator) {
            joined.peers.push_back(PeerRef{kRemoteAlias, ""});
        }

        std::weak_ptr<ReceiveHandler> weakHandler = Handler_;
        Loop_->EnqueueTask([weakHandler, joined = std::move(joined)] {
            if (auto handler = weakHandler.lock(); handler && *handler) {
                (*handler)(joined);
            }
        });
        return;
    }

    if (EnvelopeRecipient(envelope)) {
        Outbox_.push_back(envelope);
        spdlog::debug("Manual exchange queued {} ({} pending)", EnvelopeType(envelope), Outbox_.size());
        return;
    }

    spdlog::debug("Manual exchange has no use for {}", EnvelopeType(envelope));
}

std::string ManualTransport::ExportBlob() const {
    json envelopes = json::array();
    for (const auto& envelope : Outbox_) {
        envelopes.push_back(EnvelopeToJson(envelope));
    }

    json j = {
        {"id", SelfId_},
        {"name", SelfName_},
        {"envelopes", std::move(envelopes)}
    };
    return EncodeBase64(j.dump());
}

void ManualTransport::ImportBlob(const std::string& blob) {
    std::vector<Envelope> inbound;
    try {
        auto j = json::parse(DecodeBase64(blob));
        for (const auto& item : j.at("envelopes")) {
            auto envelope = EnvelopeFromJson(item);
            if (auto offer = std::get_if<OfferSignal>(&envelope)) {
                offer->from = kRemoteAlias;
                offer->to = SelfId_;
                if (offer->fromName.empty()) {
                    offer->fromName = j.value("name", "");
                }
            } else if (auto answer = std::get_if<AnswerSignal>(&envelope)) {
                answer->from = kRemoteAlias;
                answer->to = SelfId_;
            } else if (auto candidate = std::get_if<CandidateSignal>(&envelope)) {
                candidate->from = kRemoteAlias;
                candidate->to = SelfId_;
            } else {
                continue;
            }
            inbound.push_back(std::move(envelope));
        }
    } catch (const json::exception& e) {
        throw Error(ErrorCode::MalformedEnvelope, std::string("invalid exchange blob: ") + e.what());
    }

    spdlog::info("Imported {} envelopes from the other side", inbound.size());

    std::weak_ptr<ReceiveHandler> weakHandler = Handler_;
    Loop_->EnqueueTask([weakHandler, inbound = std::move(inbound)] {
        auto handler = weakHandler.lock();
        if (!handler || !*handler) {
            return;
        }
        for (const auto& envelope : inbound) {
            (*handler)(envelope);
        }
    });
}

} // namespace beam
