#ifndef OB_ENGINE_HPP
#define OB_ENGINE_HPP

#include <atomic>
#include <string>
#include <vector>

#include <libfilezilla/logger.hpp>
#include <libfilezilla/thread_pool.hpp>

#include "config.hpp"
#include "matcher.hpp"
#include "patcher.hpp"
#include "planner.hpp"

namespace ob {

struct reference_report
{
	std::string name;
	std::size_t line{};
	std::size_t offset{};
	std::string literal;

	match_result::kind_type match{match_result::unmatched};
	outcome result{outcome::unmatched};
	action todo{action::none};

	std::string token;
	std::string replacement;
	std::string reason;

	//! The resources the reference resolved to, or conflicts with, as root-relative paths.
	std::vector<std::string> resources;
};

struct report
{
	mode run_mode{mode::update};
	bool dry_run{};

	std::size_t resources_indexed{};
	std::size_t files_scanned{};

	//! Unreadable files and directories, files skipped by the scanner.
	std::vector<std::string> warnings;

	//! Ordered by file name, then position within the file.
	std::vector<reference_report> references;

	//! One per file with edits, in file name order.
	std::vector<patch_result> files;

	struct totals_type
	{
		std::size_t references{};
		std::size_t unmarked{};
		std::size_t unmatched{};
		std::size_t ambiguous{};
		std::size_t current{};
		std::size_t stale{};

		std::size_t inserted{};
		std::size_t updated{};
		std::size_t converted{};

		std::size_t files_written{};
		std::size_t files_skipped{};
		std::size_t files_failed{};
	} totals;

	bool cancelled{};

	//! Whether anything needs the attention of the user: unmatched or ambiguous references, files that couldn't be read or written.
	bool has_warnings() const;
};

//! Runs scan, rewrite and update passes over a project.
class engine
{
public:
	engine(fz::thread_pool &pool, fz::logger_interface &logger = fz::get_null_logger());

	/// \brief Indexes the static resources, scans the code, plans and applies the edits.
	///
	/// \returns false on a fatal error: an invalid configuration, or a directory that couldn't be listed.
	/// Everything else ends up in the report.
	/// Once cancel is set, no more files are written.
	bool run(const config &cfg, report &rep, const std::atomic<bool> *cancel = nullptr);

private:
	fz::thread_pool &pool_;
	fz::logger_interface &logger_;
};

}

#endif // OB_ENGINE_HPP
