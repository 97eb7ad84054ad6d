/**
 * @file terminal.cpp
 * @brief ioctl / environment backed terminal width.
 */
#include "ignite/console/terminal.hpp"
#include "ignite/config/constants.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <sys/ioctl.h>
#include <unistd.h>

namespace ignite::console {

using namespace ignite::config::constants;

int terminal_columns() noexcept {
    return terminal_columns(STDOUT_FILENO);
}

int terminal_columns(int fd) noexcept {
    struct winsize ws{};
    if (fd >= 0 && ::ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;

    const char* c = std::getenv("COLUMNS");
    if (c && *c) {
        int cols = 0;
        const char* end = c + std::strlen(c);
        auto [ptr, ec] = std::from_chars(c, end, cols);
        if (ec == std::errc{} && ptr == end) return std::max(CONSOLE_COLUMNS_FLOOR, cols);
    }
    return CONSOLE_FALLBACK_WIDTH;
}

} // namespace ignite::console
