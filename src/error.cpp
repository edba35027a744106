#include "error.hpp"

namespace beam {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::TransportUnavailable: return "TransportUnavailable";
        case ErrorCode::MalformedEnvelope: return "MalformedEnvelope";
        case ErrorCode::UnmatchedPeer: return "UnmatchedPeer";
        case ErrorCode::NegotiationFailure: return "NegotiationFailure";
        case ErrorCode::ChannelSendFailure: return "ChannelSendFailure";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

} // namespace beam
