/**
 * @file block.cpp
 * @brief Frame drawing primitives and Block defaults.
 */
#include "ignite/console/block.hpp"
#include "ignite/console/terminal.hpp"
#include "ignite/console/text.hpp"
#include "ignite/config/constants.hpp"

#include <algorithm>

namespace ignite::console {

using namespace ignite::config::constants;

Emphasis default_emphasis(Variant v) noexcept {
    switch (v) {
        case Variant::Header: return Emphasis::Bright;
        case Variant::Body:   return Emphasis::Normal;
        case Variant::Footer: return Emphasis::Bright;
    }
    return Emphasis::Normal;
}

int resolve_width(std::optional<int> requested) noexcept {
    const int w = requested ? *requested : terminal_columns();
    return std::max(w, CONSOLE_MIN_WIDTH);
}

std::string_view to_string(Variant v) noexcept {
    switch (v) {
        case Variant::Header: return "header";
        case Variant::Body:   return "body";
        case Variant::Footer: return "footer";
    }
    return "body";
}

Frame::Frame(int width, Emphasis style, std::ostream& out) noexcept
    : width_(std::max(width, CONSOLE_MIN_WIDTH)), style_(style), out_(&out) {}

std::string Frame::vline() const {
    std::string s(sgr::reset);
    s.append(prefix(style_));
    s.push_back(CONSOLE_VLINE);
    s.append(sgr::reset);
    return s;
}

std::string Frame::success() const {
    std::string s(sgr::reset);
    s.append(sgr::bright);
    s.append(sgr::green);
    s.append(center(CONSOLE_SUCCESS_LABEL, width_ - 2));
    s.append(sgr::reset);
    return s;
}

// Every line ends with a reset so a style never bleeds into the next write.
void Frame::emit(const std::string& line) const {
    *out_ << line << sgr::reset << std::endl;
}

void Frame::border() const {
    std::string s(prefix(style_));
    s.push_back(CONSOLE_CORNER);
    s.append(repeat(CONSOLE_HLINE, width_ - 2));
    s.push_back(CONSOLE_CORNER);
    emit(s);
}

void Frame::closing_border() const {
    std::string s(prefix(style_));
    s.append(vline());
    s.append(repeat(CONSOLE_HLINE, width_ - 2));
    s.append(vline());
    emit(s);
}

void Frame::rewind(int rows) const {
    std::string s;
    for (int i = 0; i < rows; ++i) s.append(sgr::prev_line);
    *out_ << s << std::endl;
}

void Frame::conclude() const {
    rewind(2);
    emit(std::string(prefix(style_)) + vline() + success() + vline());
    closing_border();
}

void Frame::inline_item(const BodyItem& item) const {
    const std::string dimmed = std::string(prefix(style_)) + std::string(sgr::dim);
    for (const auto& line : wrap(item.text, width_))
        emit(vline() + dimmed + center(line, width_ - 2) + vline());

    item.step();

    rewind(1);
    emit(std::string(prefix(style_)) + vline() + success() + vline());

    std::string separator(1, CONSOLE_VLINE);
    separator.append(repeat(CONSOLE_HLINE, (width_ - 4) / 2));
    separator.push_back(CONSOLE_VLINE);
    emit(vline() + dimmed + center(separator, width_ - 2) + vline());
}

void Frame::body(const Lines& lines) const {
    for (const auto& item : lines) {
        if (item.has_step()) {
            inline_item(item);
            continue;
        }
        for (const auto& line : wrap(item.text, width_))
            emit(vline() + std::string(prefix(style_)) + center(line, width_ - 2) + vline());
    }
}

} // namespace ignite::console
