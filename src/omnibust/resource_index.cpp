#include <libfilezilla/file.hpp>
#include <libfilezilla/format.hpp>

#include "resource_index.hpp"
#include "logger/type.hpp"
#include "util/filesystem.hpp"
#include "util/parallel.hpp"
#include "util/tools.hpp"

namespace ob {

const static_resource *static_root::find(std::string_view relative) const
{
	auto it = resources.find(relative);
	if (it == resources.end())
		return nullptr;

	return &it->second;
}

std::size_t resource_index::size() const
{
	std::size_t res = 0;

	for (auto &r: roots)
		res += r.resources.size();

	return res;
}

bool digest_file(const fz::native_string &path, fz::hash_algorithm algorithm, std::vector<std::uint8_t> &digest)
{
	fz::file file(path, fz::file::reading, fz::file::existing);
	if (!file.opened())
		return false;

	fz::hash_accumulator acc(algorithm);

	std::uint8_t buf[64*1024];

	while (true) {
		auto res = file.read2(buf, sizeof(buf));
		if (!res)
			return false;

		if (res.value_ == 0)
			break;

		acc.update(buf, res.value_);
	}

	digest = acc.digest();
	return true;
}

std::string normalize_url_prefix(std::string_view prefix)
{
	if (prefix.empty())
		return {};

	auto res = util::fs::normalize(std::string("/").append(prefix));
	if (res.back() != '/')
		res.append(1, '/');

	return res;
}

indexer::indexer(fz::thread_pool &pool, fz::logger_interface &logger)
	: pool_(pool)
	, logger_(logger)
{}

bool indexer::build(const config &cfg, resource_index &index)
{
	struct job
	{
		std::size_t root;
		util::fs::walk_entry entry;
	};

	std::vector<job> jobs;
	util::fs::walker walker(logger_);

	index.roots.clear();
	index.roots.reserve(cfg.static_dirs.size());

	for (std::size_t i = 0; i < cfg.static_dirs.size(); ++i) {
		auto &rc = cfg.static_dirs[i];

		static_root root;
		root.dir = cfg.resolve_dir(rc);
		root.url_prefix = normalize_url_prefix(rc.url_prefix);

		auto real = util::fs::real_path(root.dir);
		if (!real) {
			logger_.log_u(fz::logmsg::error, L"Static directory `%s' does not exist.", root.dir);
			return false;
		}

		root.real_dir = std::move(*real);

		util::fs::walk_options opts;

		opts.include = rc.include;
		if (opts.include.empty()) {
			for (auto &t: cfg.static_filetypes)
				opts.include.push_back("*" + t);
		}

		opts.exclude = rc.exclude;
		opts.ignore_dirs = cfg.ignore_dirs;

		std::vector<util::fs::walk_entry> entries;
		if (!walker.walk(root.dir, opts, entries, &index.warnings))
			return false;

		for (auto &e: entries)
			jobs.push_back({ i, std::move(e) });

		index.roots.push_back(std::move(root));
	}

	struct digested
	{
		static_resource resource;
		bool ok{};
	};

	auto workers = cfg.threads ? cfg.threads : util::default_thread_count();

	auto results = util::parallel_collect<digested>(pool_, workers, jobs, [&cfg](const job &j, std::vector<digested> &acc) {
		digested d;

		auto &r = d.resource;
		r.relative = j.entry.relative;
		r.root = j.root;
		r.path = j.entry.path;
		r.size = j.entry.size;

		if (!j.entry.mtime.empty())
			r.mtime = j.entry.mtime.get_time_t() * 1000 + j.entry.mtime.get_milliseconds();

		d.ok = digest_file(r.path, cfg.hash, r.digest);

		acc.push_back(std::move(d));
	});

	for (auto &d: results) {
		if (!d.ok) {
			index.warnings.push_back(fz::sprintf("Could not read `%s'", fz::to_utf8(d.resource.path)));
			continue;
		}

		auto &root = index.roots[d.resource.root];
		auto relative = d.resource.relative;

		root.resources.emplace(std::move(relative), std::move(d.resource));
	}

	for (auto &w: index.warnings)
		logger_.log_u(logmsg::warning, L"%s", w);

	logger_.log_u(fz::logmsg::status, L"Indexed %d static resources in %d directories.", index.size(), index.roots.size());

	return true;
}

}
