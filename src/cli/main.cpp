#include <atomic>
#include <clocale>
#include <csignal>
#include <iostream>

#include <libfilezilla/thread_pool.hpp>

#include "../omnibust/build_info.hpp"
#include "../omnibust/config.hpp"
#include "../omnibust/engine.hpp"
#include "../omnibust/logger/stdio.hpp"
#include "../omnibust/project_init.hpp"
#include "../omnibust/util/tools.hpp"

#include "arguments.hpp"
#include "report_printer.hpp"

namespace {

enum exit_code: int
{
	exit_clean = 0,
	exit_warnings = 1,
	exit_fatal = 2
};

std::atomic<bool> interrupted{false};

void on_sigint(int)
{
	interrupted = true;
}

}

int main(int argc, char *argv[])
{
	using namespace ob;

	std::setlocale(LC_ALL, "");

	cli::arguments args;
	std::string error;
	std::string_view program_name = argc > 0 ? argv[0] : "omnibust";

	if (!cli::parse(argc, argv, args, error)) {
		std::cerr << error << "\n\n" << cli::usage(program_name);
		return exit_fatal;
	}

	if (args.help) {
		std::cout << cli::usage(program_name);
		return exit_clean;
	}

	if (args.version) {
		std::cout << build_info::package_name << " " << build_info::version << "\n";
		return exit_clean;
	}

	auto levels = args.verbose ? logmsg::verbose_types : args.quiet ? logmsg::quiet_types : logmsg::default_types;
	auto log_opts = logger::stdio::options().short_type_tag(!args.verbose);
	logger::stdio logger(stderr, levels, log_opts);

	auto root_dir = util::make_absolute(args.root_dir.empty() ? fz::native_string(fzT(".")) : args.root_dir);
	if (auto real = util::fs::real_path(root_dir))
		root_dir = std::move(*real);

	if (args.run_mode == mode::init) {
		std::string text;

		switch (project_init::run(root_dir, args.dry_run, text, logger)) {
			case project_init::status::printed:
				std::cout << text;
				return exit_clean;

			case project_init::status::written:
				return exit_clean;

			case project_init::status::exists:
			case project_init::status::failed:
				return exit_fatal;
		}

		return exit_fatal;
	}

	config cfg;
	cfg.project_dir = root_dir;

	auto cfg_path = args.cfg_path.empty()
		? util::fs::join(root_dir, fz::to_native(std::string_view(project_init::config_file_name)))
		: util::make_absolute(args.cfg_path);

	if (!load(cfg, cfg_path, logger))
		return exit_fatal;

	cfg.run_mode = args.run_mode.value_or(mode::update);
	cfg.dry_run = args.dry_run;
	cfg.force = args.force;

	if (args.form)
		cfg.form = *args.form;

	if (args.threads)
		cfg.threads = *args.threads;

	std::signal(SIGINT, on_sigint);

	fz::thread_pool pool;
	engine e(pool, logger);
	report rep;

	if (!e.run(cfg, rep, &interrupted))
		return exit_fatal;

	auto verbosity = args.verbose ? cli::report_printer::verbose : args.quiet ? cli::report_printer::quiet : cli::report_printer::normal;
	cli::report_printer(std::cout, verbosity).print(rep);

	return rep.has_warnings() ? exit_warnings : exit_clean;
}
