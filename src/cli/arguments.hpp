#ifndef OB_CLI_ARGUMENTS_HPP
#define OB_CLI_ARGUMENTS_HPP

#include <optional>
#include <string>

#include <libfilezilla/string.hpp>

#include "../omnibust/config.hpp"

namespace ob::cli {

struct arguments
{
	bool help{};
	bool version{};

	//! The project directory, the current one if none is given.
	fz::native_string root_dir;

	//! Defaults to omnibust.cfg within the project directory.
	fz::native_string cfg_path;

	std::optional<mode> run_mode;
	std::optional<marker_form> form;
	std::optional<std::size_t> threads;

	bool dry_run{};
	bool force{};
	bool verbose{};
	bool quiet{};
};

//! \returns false, with a description of the problem in error, if the arguments make no sense.
bool parse(int argc, char *argv[], arguments &args, std::string &error);

std::string usage(std::string_view program_name);

}

#endif // OB_CLI_ARGUMENTS_HPP
