#include "common/logging.hpp"

#include "common/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>

namespace svcmap {

namespace {

constexpr const char* kLoggerName = "svcmap";

std::shared_ptr<spdlog::logger> createLogger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    // Owned here as well as by the registry, so dropping the registry
    // entry never leaves callers with a null logger.
    static const std::shared_ptr<spdlog::logger> instance = createLogger();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

spdlog::level::level_enum logLevel() {
    return logger()->level();
}

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

void setLogLevel(const std::string& name) {
    auto level = parseLogLevel(name);
    if (!level) {
        throw InvalidParameter("Unknown log level '" + name + "'");
    }
    setLogLevel(*level);
}

bool configureLoggingFromEnv() {
    const char* value = std::getenv("SVCMAP_LOG_LEVEL");
    if (!value || !*value) return false;

    auto level = parseLogLevel(value);
    if (!level) {
        SVCMAP_LOG_WARN("Ignoring unknown SVCMAP_LOG_LEVEL '{}'", value);
        return false;
    }
    setLogLevel(*level);
    return true;
}

} // namespace svcmap
