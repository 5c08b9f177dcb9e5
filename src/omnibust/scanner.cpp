#include <algorithm>
#include <set>
#include <tuple>

#include <libfilezilla/format.hpp>

#include "scanner.hpp"
#include "logger/type.hpp"
#include "util/filesystem.hpp"
#include "util/io.hpp"
#include "util/parallel.hpp"
#include "util/tools.hpp"

namespace ob {

namespace {

char lower(char c)
{
	return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
}

bool ends_with_placeholder_close(std::string_view text, std::size_t end, const std::string &close)
{
	return end >= close.size() && text.substr(end - close.size(), close.size()) == close;
}

// How far back from the closing spelling the opening one is looked for.
constexpr std::size_t max_placeholder_length = 128;

}

scan_rule scan_rule::from(const config &cfg)
{
	scan_rule r;

	r.delimiters = cfg.delimiters;
	r.suffixes = cfg.static_filetypes;
	r.marker = cfg.marker;
	r.opaque = cfg.placeholder_syntax;
	r.max_file_size = cfg.max_file_size;

	for (auto &s: r.suffixes)
		std::transform(s.begin(), s.end(), s.begin(), lower);

	return r;
}

bool looks_binary(std::string_view text)
{
	return text.substr(0, binary_probe_size).find('\0') != std::string_view::npos;
}

std::vector<reference> scan_text(std::string_view text, const scan_rule &rule)
{
	std::vector<reference> res;

	auto is_delimiter = [&](char c) {
		return rule.delimiters.find(c) != std::string::npos;
	};

	// Within the query string and the fragment, '=' and '&' are part of the literal.
	auto ends_query = [&](char c) {
		return c != '=' && c != '&' && is_delimiter(c);
	};

	auto suffix_at = [&](std::size_t dot) -> std::size_t {
		for (auto &s: rule.suffixes) {
			if (dot + s.size() > text.size())
				continue;

			bool equal = true;
			for (std::size_t i = 0; i < s.size(); ++i) {
				if (lower(text[dot + i]) != lower(s[i])) {
					equal = false;
					break;
				}
			}

			if (!equal)
				continue;

			auto after = dot + s.size();
			if (after == text.size() || text[after] == '?' || text[after] == '#' || is_delimiter(text[after]))
				return s.size();
		}

		return 0;
	};

	std::size_t line = 1;
	std::size_t line_counted_till = 0;
	std::size_t previous_end = 0;

	for (auto dot = text.find('.'); dot != std::string_view::npos; dot = text.find('.', dot + 1)) {
		auto suffix_size = suffix_at(dot);
		if (suffix_size == 0)
			continue;

		// Extend left till a delimiter, taking placeholders as a whole.
		auto begin = dot;
		while (begin > previous_end) {
			bool skipped = false;

			for (auto &[open, close]: rule.opaque) {
				if (open.empty() || close.empty() || !ends_with_placeholder_close(text, begin, close))
					continue;

				auto search_from = begin - close.size();
				auto limit = search_from > max_placeholder_length ? search_from - max_placeholder_length : 0;
				auto open_pos = text.rfind(open, search_from);

				if (open_pos != std::string_view::npos && open_pos >= limit && open_pos >= previous_end && text.substr(open_pos, begin - open_pos).find('\n') == std::string_view::npos) {
					begin = open_pos;
					skipped = true;
					break;
				}
			}

			if (skipped)
				continue;

			if (is_delimiter(text[begin-1]))
				break;

			--begin;
		}

		// A bare suffix, or a directory-looking thing like "/.js", is no file name.
		if (begin == dot || text[dot-1] == '/')
			continue;

		auto end = dot + suffix_size;
		if (end < text.size() && (text[end] == '?' || text[end] == '#')) {
			while (end < text.size() && !ends_query(text[end]))
				++end;
		}

		// Keep the line count going.
		for (auto i = line_counted_till; i < begin; ++i) {
			if (text[i] == '\n')
				++line;
		}
		line_counted_till = begin;

		reference r;
		r.offset = begin;
		r.length = end - begin;
		r.line = line;
		r.literal = std::string(text.substr(begin, end - begin));
		r.marker = marker::find(r.literal, rule.marker);

		res.push_back(std::move(r));

		previous_end = end;
		dot = end - 1;
	}

	return res;
}

std::string_view to_string(scan_status s)
{
	using namespace std::string_view_literals;

	switch (s) {
		case scan_status::scanned:    return "scanned"sv;
		case scan_status::binary:     return "binary file"sv;
		case scan_status::too_big:    return "file too big"sv;
		case scan_status::unreadable: return "unreadable"sv;
	}

	return {};
}

scan_status scan_file(const fz::native_string &path, const scan_rule &rule, std::vector<reference> &out)
{
	fz::buffer buf;

	switch (util::io::read(path, buf, rule.max_file_size)) {
		case util::io::read_error::none:
			break;

		case util::io::read_error::too_big:
			return scan_status::too_big;

		case util::io::read_error::open_failed:
		case util::io::read_error::read_failed:
			return scan_status::unreadable;
	}

	auto text = buf.to_view();
	if (looks_binary(text))
		return scan_status::binary;

	for (auto &r: scan_text(text, rule)) {
		r.path = path;
		out.push_back(std::move(r));
	}

	return scan_status::scanned;
}

std::string display_name(const config &cfg, const fz::native_string &path)
{
	if (!cfg.project_dir.empty()) {
		if (auto rel = util::fs::relative_to(cfg.project_dir, path); rel && !rel->empty())
			return *rel;
	}

	return fz::to_utf8(path);
}

scanner::scanner(fz::thread_pool &pool, fz::logger_interface &logger)
	: pool_(pool)
	, logger_(logger)
{}

bool scanner::scan(const config &cfg, result &res)
{
	util::fs::walker walker(logger_);
	std::vector<util::fs::walk_entry> files;
	bool ok = true;

	for (auto &root: cfg.code_dirs) {
		util::fs::walk_options opts;

		opts.include = root.include;
		if (opts.include.empty()) {
			for (auto &t: cfg.code_filetypes)
				opts.include.push_back("*" + t);
		}

		opts.exclude = root.exclude;
		opts.ignore_dirs = cfg.ignore_dirs;

		if (!walker.walk(cfg.resolve_dir(root), opts, files, &res.warnings))
			ok = false;
	}

	if (!ok)
		return false;

	// Code directories may overlap: each file is scanned once.
	std::set<fz::native_string> seen;
	std::vector<fz::native_string> paths;

	for (auto &f: files) {
		auto real = util::fs::real_path(f.path);
		if (seen.insert(real ? *real : f.path).second)
			paths.push_back(std::move(f.path));
	}

	struct scanned
	{
		fz::native_string path;
		scan_status status;
		std::vector<reference> references;
	};

	auto rule = scan_rule::from(cfg);
	auto workers = cfg.threads ? cfg.threads : util::default_thread_count();

	auto results = util::parallel_collect<scanned>(pool_, workers, paths, [&rule](const fz::native_string &path, std::vector<scanned> &acc) {
		scanned s{ path, scan_status::scanned, {} };
		s.status = scan_file(path, rule, s.references);
		acc.push_back(std::move(s));
	});

	for (auto &s: results) {
		auto name = display_name(cfg, s.path);

		if (s.status != scan_status::scanned) {
			if (s.status == scan_status::binary)
				logger_.log_u(fz::logmsg::debug_info, L"Skipping binary file `%s'.", name);
			else
				res.warnings.push_back(fz::sprintf("Skipped `%s': %s", name, to_string(s.status)));

			continue;
		}

		++res.files_scanned;

		logger_.log_u(fz::logmsg::debug_verbose, L"Found %d references in `%s'.", s.references.size(), name);

		for (auto &r: s.references) {
			r.name = name;
			res.references.push_back(std::move(r));
		}
	}

	std::stable_sort(res.references.begin(), res.references.end(), [](const reference &lhs, const reference &rhs) {
		return std::tie(lhs.name, lhs.offset) < std::tie(rhs.name, rhs.offset);
	});

	for (auto &w: res.warnings)
		logger_.log_u(logmsg::warning, L"%s", w);

	return true;
}

}
