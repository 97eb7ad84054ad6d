/**
 * @file log.cpp
 * @brief spdlog-backed logger factory.
 */
#include "ignite/obs/log.hpp"
#include "ignite/config/constants.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ignite::obs {

using namespace ignite::config::constants;

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> lg = [] {
        if (auto existing = spdlog::get(LOG_LOGGER_NAME)) return existing;
        auto created = spdlog::stderr_color_mt(LOG_LOGGER_NAME);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::from_str(LOG_DEFAULT_LEVEL));
        return created;
    }();
    return lg;
}

bool set_level(std::string_view level) {
    const std::string name(level);
    const auto lvl = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept "off" when asked for it.
    if (lvl == spdlog::level::off && name != "off") return false;
    logger()->set_level(lvl);
    return true;
}

} // namespace ignite::obs
