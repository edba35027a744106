#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace beam {

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
// Throws Error{InvalidConfig} for anything else.
spdlog::level::level_enum ParseLogLevel(const std::string& level);

// Configures the spdlog default logger and routes libdatachannel's own log
// output through it at the matching level.
void InitLogging(const std::string& level);

} // namespace beam
