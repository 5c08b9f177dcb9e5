#include <libfilezilla/format.hpp>

#include "report_printer.hpp"

namespace ob::cli {

namespace {

void line(std::ostream &out, std::string_view label, const reference_report &r, std::string_view detail = {})
{
	out << fz::sprintf("%-10s: %s:%d: %s", label, r.name, r.line, r.literal);

	if (!detail.empty())
		out << " " << detail;

	out << "\n";
}

}

report_printer::report_printer(std::ostream &out, verbosity_type verbosity)
	: out_(out)
	, verbosity_(verbosity)
{}

void report_printer::print(const report &rep)
{
	bool scan_mode = rep.run_mode == mode::scan;

	for (auto &w: rep.warnings) {
		if (verbosity_ > quiet)
			out_ << fz::sprintf("%-10s: %s\n", "warning", w);
	}

	for (auto &r: rep.references)
		print_reference(r, scan_mode);

	for (auto &f: rep.files)
		print_file(f);

	if (verbosity_ > quiet)
		print_totals(rep);
}

void report_printer::print_reference(const reference_report &r, bool scan_mode)
{
	switch (r.result) {
		case outcome::ambiguous:
		case outcome::unmatched:
			line(out_, to_string(r.result), r, r.reason.empty() ? std::string() : fz::sprintf("(%s)", r.reason));
			return;

		default:
			break;
	}

	if (verbosity_ == quiet)
		return;

	if (r.todo != action::none) {
		line(out_, to_string(r.todo), r, fz::sprintf("-> %s", r.replacement));
		return;
	}

	// Without anything done, only scan mode reports what's been found, unless asked to be verbose.
	if (scan_mode || verbosity_ == verbose || r.result == outcome::stale)
		line(out_, to_string(r.result), r, r.token.empty() ? std::string() : fz::sprintf("[%s]", r.token));
}

void report_printer::print_file(const patch_result &f)
{
	switch (f.status) {
		case patch_result::written:
			if (verbosity_ > quiet)
				out_ << fz::sprintf("%-10s: %s (%d edits)\n", to_string(f.status), f.name, f.edits);
			break;

		case patch_result::dry_run:
			if (verbosity_ == quiet)
				break;

			for (auto &p: f.preview) {
				out_ << fz::sprintf("--- %s:%d\n", f.name, p.line);
				out_ << "- " << p.before << "\n";
				out_ << "+ " << p.after << "\n";
			}
			break;

		case patch_result::unchanged:
			break;

		case patch_result::skipped_stale:
		case patch_result::failed:
		case patch_result::cancelled:
			out_ << fz::sprintf("%-10s: %s", to_string(f.status), f.name);
			if (!f.reason.empty())
				out_ << " (" << f.reason << ")";
			out_ << "\n";
			break;
	}
}

void report_printer::print_totals(const report &rep)
{
	auto &t = rep.totals;

	out_ << fz::sprintf("\n%d static resources, %d files scanned, %d references: %d current, %d stale, %d unmarked, %d unmatched, %d ambiguous.\n",
		rep.resources_indexed, rep.files_scanned, t.references, t.current, t.stale, t.unmarked, t.unmatched, t.ambiguous);

	if (rep.run_mode == mode::scan)
		return;

	out_ << fz::sprintf("%s%d inserted, %d busted, %d converted; %d files written, %d skipped, %d failed.\n",
		rep.dry_run ? "Dry run: " : "", t.inserted, t.updated, t.converted, t.files_written, t.files_skipped, t.files_failed);
}

}
