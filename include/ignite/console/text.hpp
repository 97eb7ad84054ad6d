#pragma once
/**
 * @file text.hpp
 * @brief Plain-text geometry helpers for Blocks: column counting, centering, word wrap.
 * @details Columns are counted in UTF-8 code points; no East Asian width tables.
 */

#include <string>
#include <string_view>
#include <vector>

namespace ignite::console {

    /// Number of UTF-8 code points in @p s.
    std::size_t display_cols(std::string_view s) noexcept;

    /// Leading @p cols code points of @p s.
    std::string take_cols(std::string_view s, std::size_t cols);

    /**
     * @brief Center @p s in a field of @p width columns.
     * @details Returns @p s unchanged when it is already at least @p width wide.
     *          The odd padding column goes right, except when both the margin
     *          and the width are odd (then it goes left).
     */
    std::string center(std::string_view s, int width);

    /**
     * @brief Greedy word wrap.
     * @param text Input; any whitespace run separates words.
     * @param width Maximum columns per line (values below 1 act as 1).
     * @return Physical lines, empty for blank input. A word wider than
     *         @p width starts its own line and is cut into width-sized pieces.
     * @note Deliberately unlike Python's textwrap, which fills the rest of the
     *       current line with the first piece of an over-long word. Keeping
     *       such a word on fresh lines leaves the preceding text intact.
     */
    std::vector<std::string> wrap(std::string_view text, int width);

    /// @p n copies of @p ch (empty for n <= 0).
    std::string repeat(char ch, int n);

} // namespace ignite::console
