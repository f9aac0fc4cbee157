#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace svcmap {

/// Shared "svcmap" logger. Created on first use, default level warn.
/// Stays valid after spdlog::drop_all().
std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);
spdlog::level::level_enum logLevel();

/// spdlog level name (trace, debug, info, warn, err, critical, off) to
/// level. nullopt for an unknown name.
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

/// Set the level by name. Throws InvalidParameter for an unknown name.
void setLogLevel(const std::string& name);

/// Apply SVCMAP_LOG_LEVEL if it is set to a known level name.
/// Returns true when a level was applied.
bool configureLoggingFromEnv();

} // namespace svcmap

#define SVCMAP_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::svcmap::logger(), __VA_ARGS__)
#define SVCMAP_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::svcmap::logger(), __VA_ARGS__)
#define SVCMAP_LOG_INFO(...)  SPDLOG_LOGGER_INFO(::svcmap::logger(), __VA_ARGS__)
#define SVCMAP_LOG_WARN(...)  SPDLOG_LOGGER_WARN(::svcmap::logger(), __VA_ARGS__)
#define SVCMAP_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::svcmap::logger(), __VA_ARGS__)
