#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define TBC_VERSION_MAJOR 0
#define TBC_VERSION_MINOR 3
#define TBC_VERSION_PATCH 0
#define TBC_VERSION_STRING "0.3.0"

namespace tbc {

/// Project version information at compile time.
struct Version {
    static constexpr int major = TBC_VERSION_MAJOR;
    static constexpr int minor = TBC_VERSION_MINOR;
    static constexpr int patch = TBC_VERSION_PATCH;
    static constexpr const char* string = TBC_VERSION_STRING;
};

} // namespace tbc
