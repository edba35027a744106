#include "config.hpp"
#include "error.hpp"
#include "http_api.hpp"
#include "log.hpp"
#include "loop.hpp"
#include "room_registry.hpp"
#include "signaling_server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/spdlog.h>

#include <getopt.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

struct Options {
    std::optional<std::string> configPath;
    std::optional<long> wsPort;
    std::optional<long> httpPort;
    std::optional<std::string> logLevel;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config FILE] [--port N] [--http-port N] [--log-level LEVEL]" << std::endl;
}

std::optional<Options> ParseOptions(int argc, char* argv[]) {
    static const option longOptions[] = {
        {"config", required_argument, nullptr, 'c'},
        {"port", required_argument, nullptr, 'p'},
        {"http-port", required_argument, nullptr, 'H'},
        {"log-level", required_argument, nullptr, 'l'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    Options options;
    int opt;
    while ((opt = getopt_long(argc, argv, "c:p:H:l:h", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'c': options.configPath = optarg; break;
            case 'p': options.wsPort = std::strtol(optarg, nullptr, 10); break;
            case 'H': options.httpPort = std::strtol(optarg, nullptr, 10); break;
            case 'l': options.logLevel = optarg; break;
            default:
                PrintUsage(argv[0]);
                return std::nullopt;
        }
    }
    return options;
}

uint16_t CheckPort(long value) {
    if (value <= 0 || value > 65535) {
        throw beam::Error(beam::ErrorCode::InvalidConfig, "Port out of range: " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

beam::ServerConfig BuildConfig(const Options& options) {
    auto config = options.configPath ? beam::LoadServerConfig(*options.configPath) : beam::ServerConfig{};
    beam::ApplyEnvironment(config);

    if (options.wsPort) {
        config.wsPort = CheckPort(*options.wsPort);
    }
    if (options.httpPort) {
        config.httpPort = CheckPort(*options.httpPort);
    }
    if (options.logLevel) {
        beam::ParseLogLevel(*options.logLevel);
        config.logLevel = *options.logLevel;
    }
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = ParseOptions(argc, argv);
    if (!options) {
        return 2;
    }

    beam::ServerConfig config;
    try {
        config = BuildConfig(*options);
        beam::InitLogging(config.logLevel);
    } catch (const beam::Error& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    auto loop = std::make_shared<beam::Loop>();
    auto registry = std::make_shared<beam::RoomRegistry>();
    beam::SignalingServer server(loop, registry, config);
    beam::HttpApi api(loop, registry, config);

    try {
        server.Start();
        api.Start();
    } catch (const beam::Error& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    boost::asio::io_context signals;
    boost::asio::signal_set stopSignals(signals, SIGINT, SIGTERM);
    stopSignals.async_wait([loop](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            spdlog::info("Signal {} received, shutting down", signal);
            loop->Stop();
        }
    });
    std::thread signalThread([&signals] { signals.run(); });

    loop->Run();

    api.Stop();
    server.Stop();
    signals.stop();
    signalThread.join();
    return 0;
}
