#include <map>

#include <libfilezilla/format.hpp>

#include "engine.hpp"
#include "logger/modularized.hpp"
#include "logger/type.hpp"
#include "resource_index.hpp"
#include "scanner.hpp"

namespace ob {

bool report::has_warnings() const
{
	return !warnings.empty() || totals.unmatched || totals.ambiguous || totals.files_skipped || totals.files_failed || cancelled;
}

engine::engine(fz::thread_pool &pool, fz::logger_interface &logger)
	: pool_(pool)
	, logger_(logger)
{}

bool engine::run(const config &cfg, report &rep, const std::atomic<bool> *cancel)
{
	if (auto err = cfg.validate(); !err.empty()) {
		logger_.log_u(fz::logmsg::error, L"Invalid configuration: %s.", err);
		return false;
	}

	if (cfg.run_mode == mode::init) {
		logger_.log_u(fz::logmsg::error, L"The init mode is not handled by the engine.");
		return false;
	}

	rep = report();
	rep.run_mode = cfg.run_mode;
	rep.dry_run = cfg.dry_run;

	logger::modularized index_logger(logger_, "index");
	logger::modularized scanner_logger(logger_, "scanner");
	logger::modularized patcher_logger(logger_, "patcher");

	// The index must be complete before anything gets matched.
	resource_index index;
	if (!indexer(pool_, index_logger).build(cfg, index))
		return false;

	rep.resources_indexed = index.size();
	rep.warnings = index.warnings;

	scanner::result scanned;
	if (!scanner(pool_, scanner_logger).scan(cfg, scanned))
		return false;

	rep.files_scanned = scanned.files_scanned;
	rep.warnings.insert(rep.warnings.end(), scanned.warnings.begin(), scanned.warnings.end());

	logger_.log_u(fz::logmsg::status, L"Found %d references in %d files.", scanned.references.size(), scanned.files_scanned);

	matcher m(index, cfg);
	auto settings = planner_settings::from(cfg);

	std::vector<file_edits> files;
	std::map<fz::native_string, std::size_t> file_positions;

	for (auto &ref: scanned.references) {
		auto match = m.match(ref);
		auto p = plan_reference(ref, match, settings);

		reference_report rr;
		rr.name = ref.name;
		rr.line = ref.line;
		rr.offset = ref.offset;
		rr.literal = ref.literal;
		rr.match = match.kind;
		rr.result = p.result;
		rr.todo = p.todo;
		rr.token = p.token;
		rr.replacement = p.replacement;
		rr.reason = p.reason;

		for (auto &[key, r]: match.resources)
			rr.resources.push_back(r->relative);

		for (auto r: match.conflicting)
			rr.resources.push_back(r->relative);

		auto &t = rep.totals;
		++t.references;

		switch (p.result) {
			case outcome::unmarked:  ++t.unmarked; break;
			case outcome::unmatched: ++t.unmatched; break;
			case outcome::ambiguous: ++t.ambiguous; break;
			case outcome::current:   ++t.current; break;
			case outcome::stale:     ++t.stale; break;
		}

		if (p.todo != action::none && (p.replacement != ref.literal || settings.force)) {
			switch (p.todo) {
				case action::insert:  ++t.inserted; break;
				case action::update:  ++t.updated; break;
				case action::convert: ++t.converted; break;
				case action::none:    break;
			}

			auto [it, inserted] = file_positions.emplace(ref.path, files.size());
			if (inserted)
				files.push_back({ ref.path, ref.name, {} });

			files[it->second].edits.push_back({ ref.offset, ref.length, ref.line, ref.literal, p.replacement });
		}
		else
			rr.todo = action::none;

		if (p.result == outcome::unmatched || p.result == outcome::ambiguous)
			logger_.log_u(fz::logmsg::debug_info, L"%s:%d: %s is %s: %s.", ref.name, ref.line, ref.literal, to_string(p.result), p.reason);

		rep.references.push_back(std::move(rr));
	}

	patcher file_patcher(patcher_logger);

	for (auto &f: files) {
		if (cancel && *cancel && !rep.cancelled) {
			logger_.log_u(logmsg::warning, L"Interrupted, no more files will be written.");
			rep.cancelled = true;
		}

		auto res = file_patcher.apply(f, cfg.dry_run, cancel);

		switch (res.status) {
			case patch_result::written:       ++rep.totals.files_written; break;
			case patch_result::skipped_stale: ++rep.totals.files_skipped; break;
			case patch_result::failed:        ++rep.totals.files_failed; break;
			default: break;
		}

		rep.files.push_back(std::move(res));
	}

	return true;
}

}
