#include "log.hpp"

#include "error.hpp"

#include <rtc/rtc.hpp>

namespace beam {

namespace {

rtc::LogLevel ToRtcLevel(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return rtc::LogLevel::Verbose;
        case spdlog::level::debug: return rtc::LogLevel::Debug;
        case spdlog::level::info: return rtc::LogLevel::Info;
        case spdlog::level::warn: return rtc::LogLevel::Warning;
        case spdlog::level::err: return rtc::LogLevel::Error;
        case spdlog::level::critical: return rtc::LogLevel::Fatal;
        default: return rtc::LogLevel::None;
    }
}

spdlog::level::level_enum FromRtcLevel(rtc::LogLevel level) {
    switch (level) {
        case rtc::LogLevel::Verbose: return spdlog::level::trace;
        case rtc::LogLevel::Debug: return spdlog::level::debug;
        case rtc::LogLevel::Info: return spdlog::level::info;
        case rtc::LogLevel::Warning: return spdlog::level::warn;
        case rtc::LogLevel::Error: return spdlog::level::err;
        case rtc::LogLevel::Fatal: return spdlog::level::critical;
        default: return spdlog::level::off;
    }
}

} // namespace

spdlog::level::level_enum ParseLogLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    throw Error(ErrorCode::InvalidConfig, "Unknown log level: " + level);
}

void InitLogging(const std::string& level) {
    auto parsed = ParseLogLevel(level);
    spdlog::set_level(parsed);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    rtc::InitLogger(ToRtcLevel(parsed), [](rtc::LogLevel rtcLevel, std::string message) {
        spdlog::log(FromRtcLevel(rtcLevel), "[rtc] {}", message);
    });
}

} // namespace beam
