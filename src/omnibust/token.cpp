#include <algorithm>

#include <libfilezilla/encode.hpp>
#include <libfilezilla/string.hpp>

#include "token.hpp"

namespace ob::token {

namespace {

std::string base32(const std::vector<std::uint8_t> &data)
{
	return fz::str_tolower_ascii(fz::base32_encode(data, fz::base32_type::locale_safe, false));
}

}

std::string encode(std::int64_t mtime, const std::vector<std::uint8_t> &digest, const settings &s)
{
	auto stat_length = std::min<std::size_t>(4, s.length / 2);
	auto hash_length = s.length - stat_length;

	// Little endian, whatever the platform.
	std::uint8_t mtime_bytes[8];
	for (std::size_t i = 0; i < sizeof(mtime_bytes); ++i)
		mtime_bytes[i] = std::uint8_t(std::uint64_t(mtime) >> (8*i));

	fz::hash_accumulator acc(s.algorithm);
	acc.update(mtime_bytes, sizeof(mtime_bytes));

	auto stat_part = base32(acc.digest());
	auto hash_part = base32(digest);

	return stat_part.substr(0, stat_length) + hash_part.substr(0, hash_length);
}

std::vector<std::uint8_t> combine(std::vector<std::vector<std::uint8_t>> digests, fz::hash_algorithm algorithm)
{
	std::sort(digests.begin(), digests.end());

	fz::hash_accumulator acc(algorithm);
	for (auto &d: digests)
		acc.update(d);

	return acc.digest();
}

std::string make(const static_resource &r, const settings &s)
{
	return encode(r.mtime, r.digest, s);
}

std::string make(const match_result &m, const settings &s)
{
	if (m.kind == match_result::single && !m.resources.empty())
		return make(*m.resources.front().second, s);

	if (m.kind != match_result::multi || m.resources.empty())
		return {};

	std::int64_t mtime = m.resources.front().second->mtime;
	std::vector<std::vector<std::uint8_t>> digests;

	for (auto &[key, r]: m.resources) {
		mtime = std::max(mtime, r->mtime);
		digests.push_back(r->digest);
	}

	return encode(mtime, combine(std::move(digests), s.algorithm), s);
}

}
