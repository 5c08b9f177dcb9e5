#ifndef OB_BUILD_INFO_HPP
#define OB_BUILD_INFO_HPP

#include <string_view>

namespace ob::build_info {

inline constexpr std::string_view package_name = "omnibust";

// Set by the build system.
inline constexpr std::string_view version = OB_VERSION;

}

#endif // OB_BUILD_INFO_HPP
