#include "peer_link.hpp"

namespace beam {

const char* ToString(LinkState state) {
    switch (state) {
        case LinkState::New: return "New";
        case LinkState::Connecting: return "Connecting";
        case LinkState::Connected: return "Connected";
        case LinkState::Disconnected: return "Disconnected";
        case LinkState::Failed: return "Failed";
        case LinkState::Closed: return "Closed";
    }
    return "Unknown";
}

} // namespace beam
