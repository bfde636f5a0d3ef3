#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define BULWARK_VERSION_MAJOR 0
#define BULWARK_VERSION_MINOR 3
#define BULWARK_VERSION_PATCH 0
#define BULWARK_VERSION_STRING "0.3.0"

namespace bulwark {

/// Library version information at compile time.
struct Version {
    static constexpr int major = BULWARK_VERSION_MAJOR;
    static constexpr int minor = BULWARK_VERSION_MINOR;
    static constexpr int patch = BULWARK_VERSION_PATCH;
    static constexpr const char* string = BULWARK_VERSION_STRING;
};

} // namespace bulwark
