#include "config/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace nf::config {

static std::string lowered(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

spdlog::level::level_enum parseLogLevel(const std::string& s) {
    const auto name = lowered(s);
    // from_str() maps anything it doesn't know to "off", so only accept "off" when spelled out
    const auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off")
        throw std::invalid_argument("Invalid log level: '" + s + "' (expected trace, debug, info, warn, error, critical or off)");
    return lvl;
}

spdlog::color_mode parseColorMode(const std::string& s) {
    const auto mode = lowered(s);
    if (mode == "auto") return spdlog::color_mode::automatic;
    if (mode == "always") return spdlog::color_mode::always;
    if (mode == "never") return spdlog::color_mode::never;
    throw std::invalid_argument("Invalid log color mode: '" + s + "' (expected auto, always or never)");
}

Config loadConfigFromEnv() {
    Config cfg;

    if (const char* lvl = std::getenv(LOG_LEVEL_ENV); lvl && *lvl) {
        const auto level = parseLogLevel(lvl);
        auto& levels = cfg.logging.levels;
        levels.console_log_level = level;
        levels.subsystem_levels.newestfiles = level;
        levels.subsystem_levels.filesystem = level;
        levels.subsystem_levels.shell = level;
    }

    if (const char* color = std::getenv(LOG_COLOR_ENV); color && *color)
        cfg.logging.color = parseColorMode(color);

    return cfg;
}

} // namespace nf::config
