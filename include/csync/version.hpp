#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CSYNC_VERSION_MAJOR 0
#define CSYNC_VERSION_MINOR 1
#define CSYNC_VERSION_PATCH 0
#define CSYNC_VERSION_STRING "0.1.0"

namespace csync {

/// Project version information at compile time.
struct Version {
    static constexpr int major = CSYNC_VERSION_MAJOR;
    static constexpr int minor = CSYNC_VERSION_MINOR;
    static constexpr int patch = CSYNC_VERSION_PATCH;
    static constexpr const char* string = CSYNC_VERSION_STRING;
};

} // namespace csync
