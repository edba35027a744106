#pragma once

#include "fwd.hpp"
#include "config.hpp"

#include <boost/beast/http.hpp>

#include <memory>
#include <thread>

namespace beam {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Read-only REST view of the room table:
//   GET /health -> {"status":"ok","roomCount":N}
//   GET /rooms  -> [{id, peerCount, peers:[{id,name}]}]
// Served on its own thread; registry snapshots are taken on the Loop.
class HttpApi {
public:
    HttpApi(std::shared_ptr<Loop> loop, std::shared_ptr<RoomRegistry> registry, const ServerConfig& config);
    ~HttpApi();

    // Throws Error{TransportUnavailable} if the port cannot be bound.
    void Start();
    void Stop();

    uint16_t Port() const;

    // Blocks until the Loop has produced the snapshot.
    HttpResponse Handle(const HttpRequest& request) const;

private:
    struct Impl;

    std::shared_ptr<Loop> Loop_;
    std::shared_ptr<RoomRegistry> Registry_;
    ServerConfig Config_;
    std::unique_ptr<Impl> Impl_;
    std::thread Thread_;
};

} // namespace beam
