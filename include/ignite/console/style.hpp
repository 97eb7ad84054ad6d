#pragma once
/**
 * @file style.hpp
 * @brief ANSI SGR styling used by console Blocks.
 * @details Style is cosmetic only: it never changes the text a Block prints or
 *          its wrapping geometry. Sequences are always emitted, there is no
 *          terminal capability detection.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ignite::console {

/** @enum Emphasis
 *  @brief Emphasis applied to a Block's borders and text.
 */
enum class Emphasis : std::uint8_t {
    Normal = 0, ///< No emphasis (empty SGR prefix)
    Bright,     ///< Bold / bright intensity
    Dim         ///< Faint intensity
};

namespace sgr {
    inline constexpr std::string_view reset  = "\x1B[0m";
    inline constexpr std::string_view bright = "\x1B[1m";
    inline constexpr std::string_view dim    = "\x1B[2m";
    inline constexpr std::string_view green  = "\x1B[32m";

    /// Move the cursor to the start of the previous line.
    inline constexpr std::string_view prev_line = "\x1B[F";
} // namespace sgr

/// SGR prefix for an emphasis (empty for Normal).
std::string_view prefix(Emphasis e) noexcept;

/// Parse "normal" / "bright" / "bold" / "dim" (case-insensitive).
std::optional<Emphasis> emphasis_from_name(std::string_view name);

std::string_view to_string(Emphasis e) noexcept;

} // namespace ignite::console
