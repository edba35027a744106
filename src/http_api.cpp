#include "http_api.hpp"

#include "error.hpp"
#include "loop.hpp"
#include "room_registry.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <chrono>

namespace beam {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

constexpr auto kSnapshotTimeout = std::chrono::seconds(2);

HttpResponse MakeResponse(const HttpRequest& request, http::status status, std::string body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, "peerbeam");
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::access_control_allow_methods, "GET, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");
    if (!body.empty()) {
        response.set(http::field::content_type, "application/json");
    }
    response.keep_alive(false);
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

json RoomsToJson(const std::vector<RoomSummary>& rooms) {
    json result = json::array();
    for (const auto& room : rooms) {
        json peers = json::array();
        for (const auto& peer : room.peers) {
            peers.push_back({{"id", peer.peerId}, {"name", peer.peerName}});
        }
        result.push_back({{"id", room.id}, {"peerCount", room.peerCount}, {"peers", std::move(peers)}});
    }
    return result;
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, const HttpApi& api)
        : Stream_(std::move(socket))
        , Api_(api)
    { }

    void Run() {
        Stream_.expires_after(std::chrono::seconds(30));
        http::async_read(Stream_, Buffer_, Request_,
            beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
    }

private:
    void OnRead(beast::error_code ec, size_t) {
        if (ec == http::error::end_of_stream) {
            Close();
            return;
        }
        if (ec) {
            spdlog::debug("HTTP read failed: {}", ec.message());
            return;
        }

        auto response = std::make_shared<HttpResponse>(Api_.Handle(Request_));
        http::async_write(Stream_, *response,
            [self = shared_from_this(), response](beast::error_code ec, size_t) {
                if (ec) {
                    spdlog::debug("HTTP write failed: {}", ec.message());
                }
                self->Close();
            });
    }

    void Close() {
        beast::error_code ignored;
        Stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

private:
    beast::tcp_stream Stream_;
    beast::flat_buffer Buffer_;
    HttpRequest Request_;
    const HttpApi& Api_;
};

} // namespace

struct HttpApi::Impl {
    Impl(const HttpApi& api, const tcp::endpoint& endpoint)
        : Api(api)
        , Acceptor(Io)
    {
        Acceptor.open(endpoint.protocol());
        Acceptor.set_option(asio::socket_base::reuse_address(true));
        Acceptor.bind(endpoint);
        Acceptor.listen(asio::socket_base::max_listen_connections);
    }

    void Accept() {
        Acceptor.async_accept(asio::make_strand(Io), [this](beast::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                spdlog::warn("HTTP accept failed: {}", ec.message());
            } else {
                std::make_shared<HttpSession>(std::move(socket), Api)->Run();
            }
            Accept();
        });
    }

    const HttpApi& Api;
    asio::io_context Io;
    tcp::acceptor Acceptor;
};

HttpApi::HttpApi(std::shared_ptr<Loop> loop, std::shared_ptr<RoomRegistry> registry, const ServerConfig& config)
    : Loop_(std::move(loop))
    , Registry_(std::move(registry))
    , Config_(config)
{ }

HttpApi::~HttpApi() {
    Stop();
}

void HttpApi::Start() {
    try {
        auto address = asio::ip::make_address(Config_.bindAddress);
        Impl_ = std::make_unique<Impl>(*this, tcp::endpoint(address, Config_.httpPort));
    } catch (const boost::system::system_error& e) {
        throw Error(ErrorCode::TransportUnavailable,
                    "Cannot listen on HTTP port " + std::to_string(Config_.httpPort) + ": " + e.what());
    }

    Impl_->Accept();
    Thread_ = std::thread([impl = Impl_.get()] { impl->Io.run(); });
    spdlog::info("HTTP API listening on http://{}:{}", Config_.bindAddress, Port());
}

void HttpApi::Stop() {
    if (!Impl_) {
        return;
    }
    Impl_->Io.stop();
    if (Thread_.joinable()) {
        Thread_.join();
    }
    Impl_.reset();
}

uint16_t HttpApi::Port() const {
    return Impl_ ? Impl_->Acceptor.local_endpoint().port() : Config_.httpPort;
}

HttpResponse HttpApi::Handle(const HttpRequest& request) const {
    if (request.method() == http::verb::options) {
        return MakeResponse(request, http::status::ok, "");
    }

    const auto target = std::string(request.target());
    const bool isHealth = target == "/health";
    const bool isRooms = target == "/rooms";
    if (request.method() != http::verb::get || (!isHealth && !isRooms)) {
        return MakeResponse(request, http::status::not_found, json({{"error", "not found"}}).dump());
    }

    auto registry = Registry_;
    auto snapshot = Loop_->Call([registry] { return registry->ListRooms(); });
    if (snapshot.wait_for(kSnapshotTimeout) != std::future_status::ready) {
        spdlog::warn("Room snapshot timed out for {}", target);
        return MakeResponse(request, http::status::service_unavailable, json({{"error", "busy"}}).dump());
    }
    const auto rooms = snapshot.get();

    if (isHealth) {
        return MakeResponse(request, http::status::ok, json({{"status", "ok"}, {"roomCount", rooms.size()}}).dump());
    }
    return MakeResponse(request, http::status::ok, RoomsToJson(rooms).dump());
}

} // namespace beam
