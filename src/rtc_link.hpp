#pragma once

#include "fwd.hpp"
#include "peer_link.hpp"

#include <memory>
#include <string>
#include <vector>

namespace beam {

// libdatachannel-backed links. Every rtc callback is re-posted onto the Loop.
class RtcLinkFactory : public LinkFactory {
public:
    RtcLinkFactory(std::shared_ptr<Loop> loop, std::vector<std::string> iceServers);

    std::unique_ptr<PeerLink> CreateLink(LinkCallbacks callbacks) override;

private:
    std::shared_ptr<Loop> Loop_;
    std::vector<std::string> IceServers_;
};

} // namespace beam
