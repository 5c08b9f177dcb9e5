#ifndef OB_CONFIG_HPP
#define OB_CONFIG_HPP

#include <string>
#include <vector>

#include <libfilezilla/hash.hpp>
#include <libfilezilla/logger.hpp>
#include <libfilezilla/string.hpp>

#include "marker.hpp"
#include "multibust.hpp"
#include "util/glob.hpp"

namespace ob {

enum class mode: std::uint8_t
{
	//! Scan the project and write a starter configuration file.
	init,

	//! Report only, never write.
	scan,

	//! Add markers where missing, update stale ones.
	rewrite,

	//! Update existing markers only.
	update
};

std::string_view to_string(mode m);
bool convert(std::string_view s, mode &m);

std::string_view to_string(fz::hash_algorithm a);
bool convert(std::string_view s, fz::hash_algorithm &a);

//! A directory to be scanned, relative to the project directory unless absolute.
struct root_config
{
	std::string dir;

	//! Only for static directories: the URL path under which the directory is served, like "/static/".
	std::string url_prefix;

	util::glob_list include;
	util::glob_list exclude;
};

struct config
{
	static constexpr std::size_t min_hash_length = 4;
	static constexpr std::size_t max_hash_length = 24;

	static const std::vector<std::string> default_static_filetypes;
	static const std::vector<std::string> default_code_filetypes;
	static const util::glob_list default_ignore_dirs;
	static const std::string default_delimiters;
	static constexpr std::size_t default_max_file_size = 4*1024*1024;

	//! Directory the relative roots are relative to.
	fz::native_string project_dir;

	mode run_mode{mode::update};
	bool dry_run{};

	//! Rewrite markers even if their token is current.
	bool force{};

	std::vector<root_config> static_dirs;
	std::vector<root_config> code_dirs;

	//! Suffixes, dot included, identifying static resources both on disk and within references.
	std::vector<std::string> static_filetypes = default_static_filetypes;

	//! Suffixes of the files scanned for references, used when a code directory has no include globs of its own.
	std::vector<std::string> code_filetypes = default_code_filetypes;

	util::glob_list ignore_dirs = default_ignore_dirs;

	multibust::rules multibust;
	multibust::syntax placeholder_syntax = multibust::syntax::defaults();

	std::string marker = "_cb_";
	marker_form form{marker_form::querystring};

	fz::hash_algorithm hash{fz::hash_algorithm::md5};
	std::size_t hash_length{8};

	std::string delimiters = default_delimiters;
	std::size_t max_file_size{default_max_file_size};

	//! Zero means as many as the hardware supports.
	std::size_t threads{};

	//! \returns an explanation of what's wrong with the configuration, or an empty string if it's fine.
	std::string validate() const;

	//! The absolute path of a configured root.
	fz::native_string resolve_dir(const root_config &root) const;
};

/// \brief Reads the configuration file, JSON with // comments, into cfg.
///
/// Keys missing from the file leave the corresponding members of cfg untouched.
/// Errors are logged, the function returns false on any of them, including validation errors.
bool load(config &cfg, const fz::native_string &path, fz::logger_interface &logger = fz::get_null_logger());

//! Same as load(), but parsing the configuration from a string.
bool parse(config &cfg, std::string_view text, fz::logger_interface &logger = fz::get_null_logger());

//! Removes // comments running till the end of line, ignoring those within strings.
std::string strip_comments(std::string_view text);

}

#endif // OB_CONFIG_HPP
