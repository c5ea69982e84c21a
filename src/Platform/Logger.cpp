/**
 * @file Logger.cpp
 * @brief spdlog-backed library logger
 */

#include <LookForge/Platform/Logger.h>
#include <LookForge/Core/Exception.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace Look::Forge::Platform {

namespace {

constexpr const char* LOGGER_NAME = "lookforge";

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::warn;
}

LogLevel FromSpdlog(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return LogLevel::Trace;
        case spdlog::level::debug: return LogLevel::Debug;
        case spdlog::level::info:  return LogLevel::Info;
        case spdlog::level::warn:  return LogLevel::Warn;
        case spdlog::level::err:
        case spdlog::level::critical: return LogLevel::Error;
        default: return LogLevel::Off;
    }
}

} // namespace

std::shared_ptr<spdlog::logger> GetLogger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] {
        logger = spdlog::get(LOGGER_NAME);
        if (!logger) {
            logger = spdlog::stderr_color_mt(LOGGER_NAME);
        }
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::warn);
    });
    return logger;
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(ToSpdlog(level));
}

LogLevel GetLogLevel() {
    return FromSpdlog(GetLogger()->level());
}

LogLevel ParseLogLevel(const std::string& name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off")   return LogLevel::Off;
    throw ConfigurationException("unknown log level '" + name +
                                 "', expected one of: trace, debug, info, warn, error, off");
}

} // namespace Look::Forge::Platform
