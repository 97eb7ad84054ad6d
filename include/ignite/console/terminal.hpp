#pragma once
/**
 * @file terminal.hpp
 * @brief Terminal geometry query used when a Block has no explicit width.
 */

namespace ignite::console {

    /**
     * @brief Current display width in columns.
     * @details Order: TIOCGWINSZ on stdout, then $COLUMNS (floored at
     *          CONSOLE_COLUMNS_FLOOR), then CONSOLE_FALLBACK_WIDTH. Never fails.
     */
    int terminal_columns() noexcept;

    /// Same lookup against @p fd instead of stdout.
    int terminal_columns(int fd) noexcept;

} // namespace ignite::console
