#ifndef OB_PROJECT_INIT_HPP
#define OB_PROJECT_INIT_HPP

#include <string>
#include <vector>

#include <libfilezilla/logger.hpp>
#include <libfilezilla/string.hpp>

namespace ob::project_init {

inline constexpr char config_file_name[] = "omnibust.cfg";

//! What an initial configuration looks like.
struct proposal
{
	//! Directories holding static files referenced by code files, relative to the project.
	std::vector<std::string> static_dirs;

	//! Directories holding code files referencing static files, relative to the project.
	std::vector<std::string> code_dirs;
};

/// \brief Walks the project directory looking for code files referencing static files by name.
///
/// \returns false if the project directory can't be listed.
bool discover(const fz::native_string &project_dir, proposal &p, fz::logger_interface &logger = fz::get_null_logger());

//! The contents of the configuration file: JSON with comments, which load() accepts.
std::string render(const proposal &p);

enum class status: std::uint8_t
{
	written,

	//! Dry run: nothing written, the configuration has been returned instead.
	printed,

	//! There's already a configuration file, which is left alone.
	exists,

	failed
};

//! Discovers, renders and writes the configuration file into the project directory.
status run(const fz::native_string &project_dir, bool dry_run, std::string &text, fz::logger_interface &logger = fz::get_null_logger());

}

#endif // OB_PROJECT_INIT_HPP
