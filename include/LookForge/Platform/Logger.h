#pragma once

/**
 * @file Logger.h
 * @brief Library logging, a thin wrapper over a named spdlog logger
 *
 * All library diagnostics go to the "lookforge" logger (stderr, color).
 * Default level is Warn so library use stays quiet; tools raise it
 * from the command line.
 *
 * @code
 * Log::Info("LUT written: {} ({}^3)", path, size);
 * Platform::SetLogLevel(Platform::LogLevel::Debug);
 * @endcode
 */

#include <LookForge/Core/Export.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>

namespace Look::Forge::Platform {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

/// Shared library logger (created on first use)
LOOKFORGE_API std::shared_ptr<spdlog::logger> GetLogger();

/// Set minimum level of the library logger
LOOKFORGE_API void SetLogLevel(LogLevel level);

/// Current minimum level
LOOKFORGE_API LogLevel GetLogLevel();

/**
 * @brief Parse "trace|debug|info|warn|error|off"
 * @throws ConfigurationException for any other name
 */
LOOKFORGE_API LogLevel ParseLogLevel(const std::string& name);

} // namespace Look::Forge::Platform

namespace Look::Forge::Log {

template<typename... Args>
inline void Trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Platform::GetLogger()->trace(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void Debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Platform::GetLogger()->debug(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void Info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Platform::GetLogger()->info(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void Warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Platform::GetLogger()->warn(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void Error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    Platform::GetLogger()->error(fmt, std::forward<Args>(args)...);
}

} // namespace Look::Forge::Log
