#pragma once

#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/common.h>

namespace nf::config {

constexpr static const auto* LOG_LEVEL_ENV = "NEWESTFILES_LOG_LEVEL";
constexpr static const auto* LOG_COLOR_ENV = "NEWESTFILES_LOG_COLOR";

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum newestfiles = spdlog::level::warn;  // Top-level events
    spdlog::level::level_enum filesystem  = spdlog::level::warn;  // Unreadable entries during the walk
    spdlog::level::level_enum shell       = spdlog::level::warn;  // Argument parsing decisions
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    spdlog::color_mode color = spdlog::color_mode::automatic;
};

struct Config {
    LoggingConfig logging;
};

// Reads NEWESTFILES_LOG_LEVEL and NEWESTFILES_LOG_COLOR; unset variables keep the defaults.
Config loadConfigFromEnv();

spdlog::level::level_enum parseLogLevel(const std::string& s);
spdlog::color_mode parseColorMode(const std::string& s);

} // namespace nf::config
