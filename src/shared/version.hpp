// version.hpp (Shared Version Information)
// Centralized definitions for the roundstat title and build version. The
// version string may be injected by the build system so that `--version` and
// the startup log line name the exact build.

#pragma once

#include <string_view>

namespace roundstat::version {

inline constexpr std::string_view kToolTitle{"roundstat"};

namespace detail {

#if defined(ROUNDSTAT_VERSION_STRING)
inline constexpr std::string_view kVersionSource{ROUNDSTAT_VERSION_STRING};
#elif defined(ROUNDSTAT_VERSION)
inline constexpr std::string_view kVersionSource{ROUNDSTAT_VERSION};
#else
// Fallback used when the build system has not injected a version.
inline constexpr std::string_view kVersionSource{"0.3.0 dev"};
#endif

}  // namespace detail

inline constexpr std::string_view kToolVersion = detail::kVersionSource;

}  // namespace roundstat::version
