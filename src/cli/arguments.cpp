#include <libfilezilla/format.hpp>

#include "arguments.hpp"

namespace ob::cli {

bool parse(int argc, char *argv[], arguments &args, std::string &error)
{
	using namespace std::string_view_literals;

	auto set_once = [&error](auto &opt, auto value, std::string_view what) {
		if (opt && *opt != value) {
			error = fz::sprintf("Only one %s can be given.", what);
			return false;
		}

		opt = value;
		return true;
	};

	std::optional<bool> verbosity;

	for (int i = 1; i < argc; ++i) {
		std::string_view arg = argv[i];

		if (arg == "--help"sv || arg == "-h"sv)
			args.help = true;
		else
		if (arg == "--version"sv)
			args.version = true;
		else
		if (arg == "--init"sv) {
			if (!set_once(args.run_mode, mode::init, "mode"))
				return false;
		}
		else
		if (arg == "--scan"sv) {
			if (!set_once(args.run_mode, mode::scan, "mode"))
				return false;
		}
		else
		if (arg == "--rewrite"sv) {
			if (!set_once(args.run_mode, mode::rewrite, "mode"))
				return false;
		}
		else
		if (arg == "--update"sv) {
			if (!set_once(args.run_mode, mode::update, "mode"))
				return false;
		}
		else
		if (arg == "--filename"sv) {
			if (!set_once(args.form, marker_form::filename, "marker form"))
				return false;
		}
		else
		if (arg == "--querystring"sv) {
			if (!set_once(args.form, marker_form::querystring, "marker form"))
				return false;
		}
		else
		if (arg == "--verbose"sv || arg == "-v"sv) {
			if (!set_once(verbosity, true, "of --verbose and --quiet"))
				return false;
		}
		else
		if (arg == "--quiet"sv || arg == "-q"sv) {
			if (!set_once(verbosity, false, "of --verbose and --quiet"))
				return false;
		}
		else
		if (arg == "--no-act"sv || arg == "-n"sv)
			args.dry_run = true;
		else
		if (arg == "--force"sv || arg == "-f"sv)
			args.force = true;
		else
		if (arg == "--cfg"sv || arg == "--threads"sv) {
			if (i+1 == argc) {
				error = fz::sprintf("Option %s requires a value.", arg);
				return false;
			}

			std::string_view value = argv[++i];

			if (arg == "--cfg"sv)
				args.cfg_path = fz::to_native(value);
			else {
				auto n = fz::to_integral<std::size_t>(value, std::size_t(-1));
				if (n == std::size_t(-1) || n == 0) {
					error = fz::sprintf("Invalid number of threads: %s.", value);
					return false;
				}

				args.threads = n;
			}
		}
		else
		if (fz::starts_with(arg, "-"sv)) {
			error = fz::sprintf("Unknown option %s.", arg);
			return false;
		}
		else {
			if (!args.root_dir.empty()) {
				error = "Only one project directory can be given.";
				return false;
			}

			args.root_dir = fz::to_native(arg);
		}
	}

	if (verbosity) {
		args.verbose = *verbosity;
		args.quiet = !*verbosity;
	}

	return true;
}

std::string usage(std::string_view program_name)
{
	return fz::sprintf(
		"Usage: %s (--help | --version)\n"
		"       %s <rootdir> --init [--no-act]\n"
		"       %s <rootdir> [--scan | --rewrite | --update] [--cfg <path>]\n"
		"                    [--no-act] [--force] [--filename | --querystring]\n"
		"                    [--verbose | --quiet] [--threads <n>]\n"
		"\n"
		"  --init         scan the project and write an initial omnibust.cfg\n"
		"  --scan         only report the references found\n"
		"  --rewrite      add cachebust markers to references lacking them, update the others\n"
		"  --update       update existing markers only (the default)\n"
		"  --cfg          configuration file, <rootdir>/omnibust.cfg by default\n"
		"  --no-act       show what would change, without writing anything\n"
		"  --force        rewrite markers even if their token is current\n"
		"  --filename     markers go into the file name: app_cb_0123abcd.js\n"
		"  --querystring  markers go into the query string: app.js?_cb_=0123abcd\n",
		program_name, program_name, program_name);
}

}
