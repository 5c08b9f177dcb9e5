#include <algorithm>
#include <map>
#include <set>

#include <libfilezilla/file.hpp>
#include <libfilezilla/format.hpp>
#include <libfilezilla/local_filesys.hpp>

#include "project_init.hpp"
#include "config.hpp"
#include "scanner.hpp"
#include "util/filesystem.hpp"
#include "util/io.hpp"

namespace ob::project_init {

namespace {

bool has_suffix(std::string_view name, const std::vector<std::string> &suffixes)
{
	auto dot = name.rfind('.');
	if (dot == std::string_view::npos)
		return false;

	auto ext = name.substr(dot);
	for (auto &s: suffixes) {
		if (fz::equal_insensitive_ascii(ext, s))
			return true;
	}

	return false;
}

std::pair<std::string, std::string> split(std::string_view relative)
{
	auto slash = relative.rfind('/');
	if (slash == std::string_view::npos)
		return { ".", std::string(relative) };

	return { std::string(relative.substr(0, slash)), std::string(relative.substr(slash+1)) };
}

// Drops the directories lying within other directories of the set.
std::vector<std::string> outermost(const std::set<std::string> &dirs)
{
	std::vector<std::string> res;

	if (dirs.count("."))
		return { "." };

	for (auto &d: dirs) {
		bool nested = std::any_of(res.begin(), res.end(), [&d](const std::string &outer) {
			return fz::starts_with(d, outer + "/");
		});

		if (!nested)
			res.push_back(d);
	}

	return res;
}

std::string quoted(std::string_view s)
{
	std::string res = "\"";

	for (auto c: s) {
		if (c == '"' || c == '\\')
			res.append(1, '\\').append(1, c);
		else
		if (static_cast<unsigned char>(c) < 0x20)
			res.append(fz::sprintf("\\u%04x", int(c)));
		else
			res.append(1, c);
	}

	return res.append(1, '"');
}

std::string list(const std::vector<std::string> &v)
{
	std::string res = "[";

	for (std::size_t i = 0; i < v.size(); ++i) {
		if (i > 0)
			res.append(", ");

		res.append(quoted(v[i]));
	}

	return res.append("]");
}

}

bool discover(const fz::native_string &project_dir, proposal &p, fz::logger_interface &logger)
{
	util::fs::walk_options opts;
	opts.ignore_dirs = config::default_ignore_dirs;

	std::vector<util::fs::walk_entry> entries;
	if (!util::fs::walker(logger).walk(project_dir, opts, entries))
		return false;

	// File name -> directories it's found in.
	std::map<std::string, std::set<std::string>> static_files;
	std::vector<const util::fs::walk_entry *> code_files;

	for (auto &e: entries) {
		auto [dir, name] = split(e.relative);

		if (has_suffix(name, config::default_static_filetypes))
			static_files[name].insert(dir);

		if (has_suffix(name, config::default_code_filetypes))
			code_files.push_back(&e);
	}

	scan_rule rule;
	std::set<std::string> static_dirs;
	std::set<std::string> code_dirs;

	for (auto e: code_files) {
		std::vector<reference> refs;
		if (scan_file(e->path, rule, refs) != scan_status::scanned)
			continue;

		for (auto &r: refs) {
			auto clean = marker::strip(r.literal, r.marker);
			auto path = std::string(marker::split_url(clean).path);
			auto name = split(path).second;

			auto it = static_files.find(name);
			if (it == static_files.end())
				continue;

			code_dirs.insert(split(e->relative).first);
			static_dirs.insert(it->second.begin(), it->second.end());
		}
	}

	p.static_dirs = outermost(static_dirs);
	p.code_dirs = outermost(code_dirs);

	logger.log_u(fz::logmsg::status, L"Found %d static and %d code directories.", p.static_dirs.size(), p.code_dirs.size());

	return true;
}

std::string render(const proposal &p)
{
	return fz::sprintf(
		"{\n"
		"    // paths are relative to the project directory\n"
		"    \"static_dirs\": %s,\n"
		"    \"static_filetypes\": %s,\n"
		"\n"
		"    \"code_dirs\": %s,\n"
		"    \"code_filetypes\": %s,\n"
		"\n"
		"    // \"ignore_dirs\": [\"*lib/*\", \"*lib64/*\", \"*.git/*\", \"*.hg/*\", \"*.svn/*\"],\n"
		"\n"
		"    // \"marker\": \"_cb_\",\n"
		"    // \"marker_form\": \"querystring\",    // or \"filename\"\n"
		"    // \"hash_function\": \"md5\",          // sha1, sha256, sha512\n"
		"\n"
		"    // References containing a multibust placeholder are expanded using each\n"
		"    // of its values, the token being unique to the combination of all the\n"
		"    // static files. Example:\n"
		"    //\n"
		"    //     <img src=\"/static/i18n_img_{{ lang }}.png?_cb_=1234567\">\n"
		"    //\n"
		"    // If either of /static/i18n_img_en.png or /static/i18n_img_de.png\n"
		"    // changes, the token is refreshed.\n"
		"    //\n"
		"    // \"multibust\": [\n"
		"    //     {\"placeholder\": \"{{ lang }}\", \"values\": [\"en\", \"de\"]}\n"
		"    // ],\n"
		"\n"
		"    \"hash_length\": 8\n"
		"}\n",
		list(p.static_dirs), list(config::default_static_filetypes),
		list(p.code_dirs), list(config::default_code_filetypes));
}

status run(const fz::native_string &project_dir, bool dry_run, std::string &text, fz::logger_interface &logger)
{
	auto path = util::fs::join(project_dir, fz::to_native(std::string_view(config_file_name)));

	if (!dry_run && fz::local_filesys::get_file_type(path, true) != fz::local_filesys::unknown) {
		logger.log_u(fz::logmsg::error, L"`%s' already exists, not overwriting it.", path);
		return status::exists;
	}

	proposal p;
	if (!discover(project_dir, p, logger))
		return status::failed;

	if (p.static_dirs.empty() || p.code_dirs.empty())
		logger.log_u(fz::logmsg::debug_warning, L"No references to static files found: fill in static_dirs and code_dirs by hand.");

	text = render(p);

	if (dry_run)
		return status::printed;

	fz::file file(path, fz::file::writing, fz::file::empty);
	if (!file.opened() || !util::io::write(file, text)) {
		logger.log_u(fz::logmsg::error, L"Could not write `%s'.", path);
		return status::failed;
	}

	logger.log_u(fz::logmsg::status, L"Wrote `%s'.", path);

	return status::written;
}

}
