#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace beam {

struct ServerConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t wsPort = 9876;
    uint16_t httpPort = 9877;
    std::string logLevel = "info";
};

enum class TransportMode {
    Server,
    Local,
    Manual,
};

struct ClientConfig {
    std::string name;
    std::string serverUrl = "ws://localhost:9876";
    TransportMode mode = TransportMode::Server;
    std::vector<std::string> iceServers = {
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302",
    };
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds roomPollInterval{3000};
    std::string localBusGroup = "239.255.42.99";
    uint16_t localBusPort = 9878;
    std::string logLevel = "info";
};

// Missing keys keep their defaults; present keys of the wrong type throw
// Error{InvalidConfig}.
ServerConfig ServerConfigFromJson(const nlohmann::json& j);
ClientConfig ClientConfigFromJson(const nlohmann::json& j);

ServerConfig LoadServerConfig(const std::string& path);
ClientConfig LoadClientConfig(const std::string& path);

// PORT overrides the signaling port, as on hosted deployments.
void ApplyEnvironment(ServerConfig& config);

TransportMode ParseTransportMode(const std::string& mode);
const char* ToString(TransportMode mode);

} // namespace beam
