#include <algorithm>

#include <libfilezilla/encode.hpp>
#include <libfilezilla/file.hpp>
#include <libfilezilla/format.hpp>
#include <libfilezilla/local_filesys.hpp>
#include <libfilezilla/util.hpp>

#ifndef FZ_WINDOWS
#	include <sys/stat.h>
#endif

#include "patcher.hpp"
#include "util/filesystem.hpp"
#include "util/io.hpp"
#include "util/scope_guard.hpp"

namespace ob {

std::string_view to_string(patch_result::status_type s)
{
	using namespace std::string_view_literals;

	switch (s) {
		case patch_result::written:       return "wrote"sv;
		case patch_result::unchanged:     return "unchanged"sv;
		case patch_result::skipped_stale: return "skipped"sv;
		case patch_result::failed:        return "failed"sv;
		case patch_result::dry_run:       return "would write"sv;
		case patch_result::cancelled:     return "cancelled"sv;
	}

	return {};
}

bool apply_edits(std::string &content, std::vector<edit> edits, std::string &reason)
{
	std::sort(edits.begin(), edits.end(), [](const edit &lhs, const edit &rhs) {
		return lhs.offset > rhs.offset;
	});

	std::size_t limit = content.size();

	for (auto &e: edits) {
		if (e.offset > content.size() || e.length > content.size() - e.offset) {
			reason = fz::sprintf("edit at line %d lies beyond the end of the file", e.line);
			return false;
		}

		if (e.offset + e.length > limit) {
			reason = fz::sprintf("edit at line %d overlaps another one", e.line);
			return false;
		}

		if (std::string_view(content).substr(e.offset, e.length) != e.original) {
			reason = fz::sprintf("text at line %d is no longer `%s'", e.line, e.original);
			return false;
		}

		limit = e.offset;
	}

	std::string res = content;

	for (auto &e: edits)
		res.replace(e.offset, e.length, e.replacement);

	content = std::move(res);
	return true;
}

std::vector<preview_line> make_preview(std::string_view content, const std::vector<edit> &edits)
{
	std::vector<preview_line> res;

	std::vector<const edit *> sorted;
	for (auto &e: edits) {
		if (e.offset + e.length <= content.size())
			sorted.push_back(&e);
	}

	std::sort(sorted.begin(), sorted.end(), [](const edit *lhs, const edit *rhs) {
		return lhs->offset < rhs->offset;
	});

	for (std::size_t i = 0; i < sorted.size();) {
		auto &first = *sorted[i];

		auto newline = first.offset ? content.rfind('\n', first.offset - 1) : std::string_view::npos;
		auto begin = newline == std::string_view::npos ? 0 : newline + 1;

		// Every edit starting before the end of the line goes into the same preview line.
		auto end = begin;
		auto j = i;
		do {
			end = content.find('\n', sorted[j]->offset + sorted[j]->length);
			if (end == std::string_view::npos)
				end = content.size();
		} while (++j < sorted.size() && sorted[j]->offset < end);

		auto line = content.substr(begin, end - begin);
		if (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);

		preview_line p;
		p.line = first.line;
		p.before = std::string(line);
		p.after = p.before;

		for (auto k = j; k-- > i;)
			p.after.replace(sorted[k]->offset - begin, sorted[k]->length, sorted[k]->replacement);

		res.push_back(std::move(p));
		i = j;
	}

	return res;
}

patcher::patcher(fz::logger_interface &logger)
	: logger_(logger)
{}

patch_result patcher::apply(const file_edits &f, bool dry_run, const std::atomic<bool> *cancel)
{
	patch_result res;
	res.name = f.name;
	res.edits = f.edits.size();

	if (f.edits.empty())
		return res;

	fz::buffer buf;
	if (auto err = util::io::read(f.path, buf); err != util::io::read_error::none) {
		res.status = patch_result::failed;
		res.reason = std::string(util::io::describe(err));
		logger_.log_u(fz::logmsg::error, L"Could not read `%s': %s.", f.name, res.reason);
		return res;
	}

	auto original = buf.to_view();
	std::string content(original);

	if (!apply_edits(content, f.edits, res.reason)) {
		res.status = patch_result::skipped_stale;
		logger_.log_u(fz::logmsg::debug_warning, L"Skipping `%s', it changed since it was scanned: %s.", f.name, res.reason);
		return res;
	}

	if (dry_run) {
		res.status = patch_result::dry_run;
		res.preview = make_preview(original, f.edits);
		return res;
	}

	if (cancel && *cancel) {
		res.status = patch_result::cancelled;
		return res;
	}

	if (!write_atomically(f.path, content, res.reason)) {
		res.status = patch_result::failed;
		logger_.log_u(fz::logmsg::error, L"Could not write `%s': %s.", f.name, res.reason);
		return res;
	}

	res.status = patch_result::written;
	logger_.log_u(fz::logmsg::debug_info, L"Wrote %d edits to `%s'.", f.edits.size(), f.name);

	return res;
}

bool patcher::write_atomically(const fz::native_string &path, std::string_view content, std::string &reason)
{
	auto dir = util::fs::parent(path);
	auto temp = util::fs::join(dir, fzT(".") + fz::native_string(util::fs::base(path)) + fz::to_native(".ob-" + fz::hex_encode<std::string>(fz::random_bytes(6)) + ".tmp"));

	bool is_link{};
	int mode{};
	if (fz::local_filesys::get_file_info(path, is_link, nullptr, nullptr, &mode) != fz::local_filesys::file) {
		reason = "the file no longer exists";
		return false;
	}

	util::scope_guard remove_temp = [&] {
		if (auto r = fz::remove_file(temp, false); !r)
			logger_.log_u(fz::logmsg::debug_warning, L"Could not remove temporary file `%s': %s.", temp, util::io::describe(r));
	};

	{
		fz::file file(temp, fz::file::writing, fz::file::empty);
		if (!file.opened()) {
			reason = "could not create a temporary file";
			return false;
		}

		if (!util::io::write(file, content)) {
			reason = "could not write the temporary file";
			return false;
		}

		if (!file.fsync()) {
			reason = "could not flush the temporary file";
			return false;
		}
	}

#ifndef FZ_WINDOWS
	if (::chmod(temp.c_str(), mode_t(mode & 07777)) != 0) {
		reason = "could not set the permissions of the temporary file";
		return false;
	}
#endif

	if (auto r = fz::rename_file(temp, path); !r) {
		reason = fz::sprintf("could not replace the file: %s", util::io::describe(r));
		return false;
	}

	remove_temp.dismiss();
	return true;
}

}
