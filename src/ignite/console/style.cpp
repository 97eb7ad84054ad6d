/**
 * @file style.cpp
 * @brief Emphasis to SGR mapping.
 */
#include "ignite/console/style.hpp"

#include <algorithm>
#include <cctype>

namespace ignite::console {

std::string_view prefix(Emphasis e) noexcept {
    switch (e) {
        case Emphasis::Normal: return {};
        case Emphasis::Bright: return sgr::bright;
        case Emphasis::Dim:    return sgr::dim;
    }
    return {};
}

std::optional<Emphasis> emphasis_from_name(std::string_view name) {
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "normal" || s.empty()) return Emphasis::Normal;
    if (s == "bright" || s == "bold") return Emphasis::Bright;
    if (s == "dim")                   return Emphasis::Dim;
    return std::nullopt;
}

std::string_view to_string(Emphasis e) noexcept {
    switch (e) {
        case Emphasis::Normal: return "normal";
        case Emphasis::Bright: return "bright";
        case Emphasis::Dim:    return "dim";
    }
    return "normal";
}

} // namespace ignite::console
