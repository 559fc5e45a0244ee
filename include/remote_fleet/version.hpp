// === Version Metadata ========================================================
//
// Exposes the library's semantic version string used in logs and diagnostics.

#pragma once

#include <string_view>

namespace remote_fleet {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace remote_fleet
