#include "config.hpp"

#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>

namespace beam {

namespace {

using json = nlohmann::json;

json ReadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw Error(ErrorCode::InvalidConfig, "Cannot open config file: " + path);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw Error(ErrorCode::InvalidConfig, "Cannot parse config file " + path + ": " + e.what());
    }
}

uint16_t ToPort(int64_t value, const char* key) {
    if (value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
        throw Error(ErrorCode::InvalidConfig, std::string("Port out of range for '") + key + "'");
    }
    return static_cast<uint16_t>(value);
}

template <typename T>
void Read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        throw Error(ErrorCode::InvalidConfig, std::string("Config key '") + key + "' has the wrong type");
    }
}

void ReadPort(const json& j, const char* key, uint16_t& out) {
    int64_t value = out;
    Read(j, key, value);
    out = ToPort(value, key);
}

void ReadMillis(const json& j, const char* key, std::chrono::milliseconds& out) {
    int64_t value = out.count();
    Read(j, key, value);
    if (value <= 0) {
        throw Error(ErrorCode::InvalidConfig, std::string("Config key '") + key + "' must be positive");
    }
    out = std::chrono::milliseconds(value);
}

} // namespace

TransportMode ParseTransportMode(const std::string& mode) {
    if (mode == "server") return TransportMode::Server;
    if (mode == "local") return TransportMode::Local;
    if (mode == "manual") return TransportMode::Manual;
    throw Error(ErrorCode::InvalidConfig, "Unknown transport mode: " + mode);
}

const char* ToString(TransportMode mode) {
    switch (mode) {
        case TransportMode::Server: return "server";
        case TransportMode::Local: return "local";
        case TransportMode::Manual: return "manual";
    }
    return "unknown";
}

ServerConfig ServerConfigFromJson(const json& j) {
    if (!j.is_object()) {
        throw Error(ErrorCode::InvalidConfig, "Server config must be a JSON object");
    }

    ServerConfig config;
    Read(j, "bind_address", config.bindAddress);
    ReadPort(j, "ws_port", config.wsPort);
    ReadPort(j, "http_port", config.httpPort);
    Read(j, "log_level", config.logLevel);
    ParseLogLevel(config.logLevel);
    return config;
}

ClientConfig ClientConfigFromJson(const json& j) {
    if (!j.is_object()) {
        throw Error(ErrorCode::InvalidConfig, "Client config must be a JSON object");
    }

    ClientConfig config;
    Read(j, "name", config.name);
    Read(j, "server_url", config.serverUrl);

    std::string mode = ToString(config.mode);
    Read(j, "mode", mode);
    config.mode = ParseTransportMode(mode);

    Read(j, "ice_servers", config.iceServers);
    ReadMillis(j, "connect_timeout_ms", config.connectTimeout);
    ReadMillis(j, "room_poll_interval_ms", config.roomPollInterval);
    Read(j, "local_bus_group", config.localBusGroup);
    ReadPort(j, "local_bus_port", config.localBusPort);
    Read(j, "log_level", config.logLevel);
    ParseLogLevel(config.logLevel);
    return config;
}

ServerConfig LoadServerConfig(const std::string& path) {
    return ServerConfigFromJson(ReadJsonFile(path));
}

ClientConfig LoadClientConfig(const std::string& path) {
    return ClientConfigFromJson(ReadJsonFile(path));
}

void ApplyEnvironment(ServerConfig& config) {
    if (const char* port = std::getenv("PORT"); port && *port) {
        char* end = nullptr;
        long value = std::strtol(port, &end, 10);
        if (*end != '\0') {
            throw Error(ErrorCode::InvalidConfig, std::string("PORT is not a number: ") + port);
        }
        config.wsPort = ToPort(value, "PORT");
    }
}

} // namespace beam
