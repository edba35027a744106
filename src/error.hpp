#pragma once

#include <stdexcept>
#include <string>

namespace beam {

enum class ErrorCode {
    TransportUnavailable,
    MalformedEnvelope,
    UnmatchedPeer,
    NegotiationFailure,
    ChannelSendFailure,
    InvalidConfig,
};

const char* ToString(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , Code_(code)
    { }

    ErrorCode Code() const {
        return Code_;
    }

private:
    ErrorCode Code_;
};

} // namespace beam
