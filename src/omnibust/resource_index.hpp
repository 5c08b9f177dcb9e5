#ifndef OB_RESOURCE_INDEX_HPP
#define OB_RESOURCE_INDEX_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <libfilezilla/hash.hpp>
#include <libfilezilla/logger.hpp>
#include <libfilezilla/thread_pool.hpp>

#include "config.hpp"

namespace ob {

//! A file within a static directory.
struct static_resource
{
	//! Unix-style path, relative to the root.
	std::string relative;

	//! Index of the root within the configured static directories.
	std::size_t root{};

	fz::native_string path;
	std::int64_t size{-1};

	//! Milliseconds since the epoch.
	std::int64_t mtime{};

	std::vector<std::uint8_t> digest;
};

struct static_root
{
	fz::native_string dir;

	//! The canonical form of dir, used to find out whether a path lies within the root.
	fz::native_string real_dir;

	//! Normalized so that it begins and ends with a '/'. Empty if none has been configured.
	std::string url_prefix;

	std::map<std::string, static_resource, std::less<>> resources;

	const static_resource *find(std::string_view relative) const;
};

//! All the static resources of a run. Built once, read-only afterwards.
struct resource_index
{
	std::vector<static_root> roots;

	//! Files that couldn't be read, directories that couldn't be listed.
	std::vector<std::string> warnings;

	std::size_t size() const;
};

//! Computes the digest of the file contents.
bool digest_file(const fz::native_string &path, fz::hash_algorithm algorithm, std::vector<std::uint8_t> &digest);

//! The url_prefix as stored within static_root.
std::string normalize_url_prefix(std::string_view prefix);

class indexer
{
public:
	indexer(fz::thread_pool &pool, fz::logger_interface &logger = fz::get_null_logger());

	/// \brief Walks the static directories of the configuration and digests every file found.
	///
	/// \returns false if any of the directories doesn't exist or can't be listed, which is fatal for the run.
	/// Files that can't be read are left out of the index and recorded among its warnings.
	bool build(const config &cfg, resource_index &index);

private:
	fz::thread_pool &pool_;
	fz::logger_interface &logger_;
};

}

#endif // OB_RESOURCE_INDEX_HPP
