#ifndef OB_UTIL_TOOLS_HPP
#define OB_UTIL_TOOLS_HPP

#include "filesystem.hpp"

namespace ob::util {

//! \returns the current working directory, or an empty string on failure.
fz::native_string get_current_directory_name();

//! Makes path absolute by prepending base, or the current working directory if base is empty.
fz::native_string make_absolute(const fz::native_string &path, const fz::native_string &base = {});

//! Number of worker threads to use when none is configured.
std::size_t default_thread_count();

}

#endif // OB_UTIL_TOOLS_HPP
