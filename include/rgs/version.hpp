#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define RGS_VERSION_MAJOR 0
#define RGS_VERSION_MINOR 3
#define RGS_VERSION_PATCH 0
#define RGS_VERSION_STRING "0.3.0"

namespace rgs {

/// Project version information at compile time.
struct Version {
    static constexpr int major = RGS_VERSION_MAJOR;
    static constexpr int minor = RGS_VERSION_MINOR;
    static constexpr int patch = RGS_VERSION_PATCH;
    static constexpr const char* string = RGS_VERSION_STRING;
};

} // namespace rgs
