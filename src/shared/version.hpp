// version.hpp (Shared Version Information)
// Centralized definitions for the fragline title and build version. The
// version string may be injected by the build system so that the CLI
// `--version` flag and the driver logs report the exact build.

#pragma once

#include <string_view>

namespace fragline::version {

inline constexpr std::string_view kToolTitle{"fragline"};

namespace detail {

#if defined(FRAGLINE_VERSION_STRING)
inline constexpr std::string_view kVersionSource{FRAGLINE_VERSION_STRING};
#else
// Fallback used when the build system has not injected a version.
inline constexpr std::string_view kVersionSource{"0.1.0 dev"};
#endif

}  // namespace detail

inline constexpr std::string_view kToolVersion = detail::kVersionSource;

}  // namespace fragline::version
