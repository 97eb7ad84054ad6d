/**
 * @file text.cpp
 * @brief Column counting, centering and greedy wrapping.
 */
#include "ignite/console/text.hpp"

#include <algorithm>
#include <cctype>

namespace ignite::console {

namespace {

bool is_continuation(unsigned char c) noexcept { return (c & 0xC0) == 0x80; }

std::vector<std::string_view> split_words(std::string_view text) {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        const std::size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i > start) words.push_back(text.substr(start, i - start));
    }
    return words;
}

} // namespace

std::size_t display_cols(std::string_view s) noexcept {
    std::size_t n = 0;
    for (char c : s)
        if (!is_continuation(static_cast<unsigned char>(c))) ++n;
    return n;
}

std::string take_cols(std::string_view s, std::size_t cols) {
    std::size_t seen = 0;
    std::size_t i = 0;
    for (; i < s.size(); ++i) {
        if (!is_continuation(static_cast<unsigned char>(s[i]))) {
            if (seen == cols) break;
            ++seen;
        }
    }
    return std::string(s.substr(0, i));
}

std::string center(std::string_view s, int width) {
    const int len = static_cast<int>(display_cols(s));
    const int margin = width - len;
    if (margin <= 0) return std::string(s);

    const int left = margin / 2 + (margin & width & 1);
    std::string out;
    out.reserve(s.size() + static_cast<std::size_t>(margin));
    out.append(static_cast<std::size_t>(left), ' ');
    out.append(s);
    out.append(static_cast<std::size_t>(margin - left), ' ');
    return out;
}

std::vector<std::string> wrap(std::string_view text, int width) {
    const std::size_t limit = static_cast<std::size_t>(std::max(width, 1));
    std::vector<std::string> lines;
    std::string line;
    std::size_t line_cols = 0;

    auto flush = [&] {
        if (!line.empty()) lines.push_back(std::move(line));
        line.clear();
        line_cols = 0;
    };

    for (std::string_view word : split_words(text)) {
        std::size_t cols = display_cols(word);

        if (cols > limit) {
            flush();
            while (cols > limit) {
                std::string piece = take_cols(word, limit);
                word.remove_prefix(piece.size());
                cols -= limit;
                lines.push_back(std::move(piece));
            }
            if (!word.empty()) {
                line.assign(word);
                line_cols = cols;
            }
            continue;
        }

        const std::size_t needed = line.empty() ? cols : line_cols + 1 + cols;
        if (needed > limit) flush();
        if (!line.empty()) {
            line.push_back(' ');
            ++line_cols;
        }
        line.append(word);
        line_cols += cols;
    }
    flush();
    return lines;
}

std::string repeat(char ch, int n) {
    return n > 0 ? std::string(static_cast<std::size_t>(n), ch) : std::string{};
}

} // namespace ignite::console
