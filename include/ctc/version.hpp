#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CTC_VERSION_MAJOR 0
#define CTC_VERSION_MINOR 3
#define CTC_VERSION_PATCH 0
#define CTC_VERSION_STRING "0.3.0"

namespace ctc {

/// Compile-time version of the combat timing core.
struct Version {
    static constexpr int major = CTC_VERSION_MAJOR;
    static constexpr int minor = CTC_VERSION_MINOR;
    static constexpr int patch = CTC_VERSION_PATCH;
    static constexpr const char* string = CTC_VERSION_STRING;
};

} // namespace ctc