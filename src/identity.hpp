#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace beam {

struct PeerIdentity {
    std::string id;
    std::string displayName;
};

// Fresh identity for this session; the id is never reused.
PeerIdentity MakeIdentity(const std::string& displayName);

// Random base-36 token followed by the current time in base 36.
std::string GeneratePeerId();
std::string GenerateMessageId();

// Six upper-case alphanumerics.
std::string GenerateRoomId();

// Trimmed and upper-cased; rooms compare equal after normalisation.
std::string NormalizeRoomId(std::string_view roomId);

int64_t NowMillis();

} // namespace beam
