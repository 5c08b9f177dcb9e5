#include <algorithm>
#include <cstdlib>
#include <set>

#include <libfilezilla/format.hpp>

#include "filesystem.hpp"

#if defined(FZ_WINDOWS)
#	include <stdlib.h>
#else
#	include <climits>
#	include <cerrno>
#endif

namespace ob::util::fs {

namespace {

constexpr bool is_native_separator(fz::native_string::value_type c)
{
#if defined(FZ_WINDOWS)
	if (c == '\\')
		return true;
#endif

	return c == '/';
}

}

std::vector<std::string_view> elements(std::string_view unix_path)
{
	return fz::strtok_view(unix_path, "/", true);
}

std::string normalize(std::string_view unix_path)
{
	using namespace std::string_view_literals;

	bool is_absolute = !unix_path.empty() && unix_path[0] == '/';

	std::vector<std::string_view> out;
	std::size_t leading_dotdots = 0;

	for (auto e: elements(unix_path)) {
		if (e == "."sv)
			continue;

		if (e == ".."sv) {
			if (out.size() > leading_dotdots)
				out.pop_back();
			else
			// If the path is relative, do not remove the leading sequence of dot-dot's.
			if (!is_absolute) {
				out.push_back(e);
				++leading_dotdots;
			}

			continue;
		}

		out.push_back(e);
	}

	std::string res = is_absolute ? "/" : "";

	for (std::size_t i = 0; i < out.size(); ++i) {
		if (i > 0)
			res.append(1, '/');

		res.append(out[i]);
	}

	if (res.empty())
		res = ".";

	return res;
}

fz::native_string join(fz::native_string lhs, fz::native_string_view rhs)
{
	if (lhs.empty())
		return fz::native_string(rhs);

	if (!rhs.empty() && !is_native_separator(lhs.back()))
		lhs.append(1, native_separator);

	return lhs.append(rhs);
}

fz::native_string parent(fz::native_string_view path)
{
	auto it = std::find_if(path.rbegin(), path.rend(), is_native_separator);
	if (it == path.rend())
		return fzT(".");

	auto pos = std::size_t(path.rend() - it) - 1;

	// Keep the root separator.
	if (pos == 0)
		return fz::native_string(1, path[0]);

	return fz::native_string(path.substr(0, pos));
}

fz::native_string_view base(fz::native_string_view path)
{
	auto it = std::find_if(path.rbegin(), path.rend(), is_native_separator);
	return path.substr(std::size_t(path.rend() - it));
}

bool is_absolute(fz::native_string_view path)
{
#if defined(FZ_WINDOWS)
	if (path.size() >= 3 && path[1] == ':' && is_native_separator(path[2]))
		return true;

	return path.size() >= 2 && is_native_separator(path[0]) && is_native_separator(path[1]);
#else
	return !path.empty() && path[0] == '/';
#endif
}

std::string to_unix(fz::native_string_view native_relative_path)
{
#if defined(FZ_WINDOWS)
	return fz::replaced_substrings(fz::to_utf8(native_relative_path), "\\", "/");
#else
	return std::string(native_relative_path);
#endif
}

fz::native_string to_native(std::string_view unix_relative_path)
{
#if defined(FZ_WINDOWS)
	return fz::replaced_substrings(fz::to_wstring_from_utf8(unix_relative_path), L"/", L"\\");
#else
	return std::string(unix_relative_path);
#endif
}

std::optional<fz::native_string> real_path(const fz::native_string &path)
{
#if defined(FZ_WINDOWS)
	// Symlinks are not resolved here; good enough to detect a directory being visited twice through the same spelling.
	wchar_t *res = ::_wfullpath(nullptr, path.c_str(), 0);
#else
	char *res = ::realpath(path.c_str(), nullptr);
#endif

	if (!res)
		return {};

	fz::native_string ret(res);
	std::free(res);

	return ret;
}

std::optional<std::string> relative_to(fz::native_string_view root, fz::native_string_view path)
{
	while (root.size() > 1 && is_native_separator(root.back()))
		root.remove_suffix(1);

	if (path.size() < root.size() || path.substr(0, root.size()) != root)
		return {};

	auto rest = path.substr(root.size());
	if (rest.empty())
		return std::string();

	if (!is_native_separator(rest[0]) && !is_native_separator(root.back()))
		return {};

	while (!rest.empty() && is_native_separator(rest[0]))
		rest.remove_prefix(1);

	return to_unix(rest);
}

walker::walker(fz::logger_interface &logger)
	: logger_(logger)
{}

bool walker::walk(const fz::native_string &root, const walk_options &opts, std::vector<walk_entry> &entries, std::vector<std::string> *errors)
{
	auto report = [&](std::string msg) {
		logger_.log_u(fz::logmsg::debug_warning, L"%s", msg);

		if (errors)
			errors->push_back(std::move(msg));
	};

	auto root_real = real_path(root);
	if (!root_real || fz::local_filesys::get_file_type(*root_real, true) != fz::local_filesys::dir) {
		logger_.log_u(fz::logmsg::error, L"Directory `%s' does not exist or is not accessible.", root);
		return false;
	}

	std::set<fz::native_string> visited{ *root_real };

	struct pending_dir
	{
		fz::native_string path;
		std::string relative;
	};

	std::vector<pending_dir> pending{ { root, {} } };
	auto first_entry = entries.size();

	while (!pending.empty()) {
		auto dir = std::move(pending.back());
		pending.pop_back();

		fz::local_filesys lfs;

		if (!lfs.begin_find_files(dir.path, false, true)) {
			if (dir.relative.empty()) {
				logger_.log_u(fz::logmsg::error, L"Could not list directory `%s'.", dir.path);
				return false;
			}

			report(fz::sprintf("Could not list directory `%s'", fz::to_utf8(dir.path)));
			continue;
		}

		fz::native_string name;
		bool is_link{};
		fz::local_filesys::type type{};
		std::int64_t size{-1};
		fz::datetime mtime;
		int mode{};

		while (lfs.get_next_file(name, is_link, type, &size, &mtime, &mode)) {
			auto path = join(dir.path, name);
			auto relative = dir.relative.empty() ? to_unix(name) : dir.relative + "/" + to_unix(name);

			if (type == fz::local_filesys::dir) {
				if (opts.ignore_dirs.matches(relative + "/")) {
					logger_.log_u(fz::logmsg::debug_verbose, L"Ignoring directory `%s'.", relative);
					continue;
				}

				auto real = real_path(path);
				if (!real) {
					report(fz::sprintf("Could not resolve directory `%s'", fz::to_utf8(path)));
					continue;
				}

				if (!visited.insert(*real).second) {
					logger_.log_u(fz::logmsg::debug_info, L"Directory `%s' has already been visited, not following it again.", relative);
					continue;
				}

				pending.push_back({ std::move(path), std::move(relative) });
			}
			else
			if (type == fz::local_filesys::file) {
				if (!opts.include.empty() && !opts.include.matches(relative))
					continue;

				if (opts.exclude.matches(relative))
					continue;

				entries.push_back({ std::move(path), std::move(relative), size, mtime });
			}
			else
			if (is_link) {
				report(fz::sprintf("Broken symbolic link `%s'", fz::to_utf8(path)));
			}
		}

		lfs.end_find_files();
	}

	std::sort(entries.begin() + std::ptrdiff_t(first_entry), entries.end(), [](const walk_entry &lhs, const walk_entry &rhs) {
		return lhs.relative < rhs.relative;
	});

	return true;
}

}
