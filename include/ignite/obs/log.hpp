#pragma once
/**
 * @file log.hpp
 * @brief Process-wide spdlog logger for diagnostics.
 * @details Console Blocks narrate setup on stdout; this logger carries
 *          diagnostics on stderr so the two never interleave on one stream.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ignite::obs {

    /// Shared "ignite" logger (stderr, colored). Created on first use.
    std::shared_ptr<spdlog::logger> logger();

    /**
     * @brief Apply a textual level ("trace", "debug", "info", "warn", "error", "critical", "off").
     * @return false when @p level is not recognized (level left unchanged).
     */
    bool set_level(std::string_view level);

} // namespace ignite::obs
