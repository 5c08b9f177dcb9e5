#ifndef OB_UTIL_FILESYSTEM_HPP
#define OB_UTIL_FILESYSTEM_HPP

#include <optional>
#include <string>
#include <vector>

#include <libfilezilla/local_filesys.hpp>
#include <libfilezilla/logger.hpp>
#include <libfilezilla/string.hpp>
#include <libfilezilla/time.hpp>

#include "glob.hpp"

namespace ob::util::fs {

#if defined(FZ_WINDOWS)
	inline constexpr fz::native_string::value_type native_separator = '\\';
#else
	inline constexpr fz::native_string::value_type native_separator = '/';
#endif

/*
 * Paths come in two flavours here:
 *
 * - native paths (fz::native_string), used to talk to the filesystem;
 * - unix-style relative paths (std::string, '/' separated), used as keys and compared with URL paths found in text.
 *
 * On Windows the latter are UTF-8, elsewhere they hold the very same bytes as the native name.
 */

//! Removes "." elements, empty elements and resolves ".." elements.
//! A leading '/' is kept. Leading ".." elements of a relative path are kept, those of an absolute path are dropped.
std::string normalize(std::string_view unix_path);

//! Splits a '/' separated path into its non-empty elements.
std::vector<std::string_view> elements(std::string_view unix_path);

fz::native_string join(fz::native_string lhs, fz::native_string_view rhs);

//! The parent directory of a native path, or the path itself if it has no parent.
fz::native_string parent(fz::native_string_view path);

//! Last element of a native path.
fz::native_string_view base(fz::native_string_view path);

bool is_absolute(fz::native_string_view path);

std::string to_unix(fz::native_string_view native_relative_path);
fz::native_string to_native(std::string_view unix_relative_path);

//! Resolves symlinks, "." and ".." and returns the canonical absolute path, if the path exists.
std::optional<fz::native_string> real_path(const fz::native_string &path);

//! If path is within root, returns the unix-style path of path relative to root.
std::optional<std::string> relative_to(fz::native_string_view root, fz::native_string_view path);

struct walk_entry
{
	fz::native_string path;
	std::string relative;
	std::int64_t size{-1};
	fz::datetime mtime;
};

struct walk_options
{
	//! Files are listed only if their relative path matches one of these, or this is empty.
	glob_list include;

	//! Files whose relative path matches one of these are not listed.
	glob_list exclude;

	//! Directories whose relative path, followed by a '/', matches one of these are not descended into.
	glob_list ignore_dirs;
};

//! Recursively lists the files within a root directory.
//! Symlinks are followed, but each directory is visited at most once, based on its real path, so that link cycles are harmless.
class walker
{
public:
	walker(fz::logger_interface &logger = fz::get_null_logger());

	//! \returns false if the root itself couldn't be listed. Problems with anything below the root are logged and recorded in errors.
	bool walk(const fz::native_string &root, const walk_options &opts, std::vector<walk_entry> &entries, std::vector<std::string> *errors = nullptr);

private:
	fz::logger_interface &logger_;
};

}

#endif // OB_UTIL_FILESYSTEM_HPP
