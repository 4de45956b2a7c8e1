// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fmt/format.h>
#include <string>
#include <string_view>

namespace surge {

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;

inline constexpr std::string_view BUILD_DATE = __DATE__;

// "0.1.0"
[[nodiscard]] inline std::string version_string() {
    return fmt::format("{}.{}.{}", VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH);
}

} // namespace surge
