#ifndef IGNITE_VERSION_HPP
#define IGNITE_VERSION_HPP

#pragma once

namespace ignite {

    /// Project semantic version components
    inline constexpr int version_major = 1;
    inline constexpr int version_minor = 2;
    inline constexpr int version_patch = 2;

    /// Combined version string (e.g. "1.2.2")
    inline constexpr const char* version_string = "1.2.2";

} // namespace ignite

#endif // IGNITE_VERSION_HPP
