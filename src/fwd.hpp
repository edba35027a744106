#pragma once

#include <cstdint>

namespace rtc {

class DataChannel;
class PeerConnection;
class WebSocket;
class WebSocketServer;

} // namespace rtc

namespace beam {

using ClientId = uint64_t;

class Loop;
class LinkFactory;
class MeshCoordinator;
class MessageChannel;
class Negotiator;
class PeerLink;
class RoomRegistry;
class SignalingTransport;

} // namespace beam
