#ifndef OB_TOKEN_HPP
#define OB_TOKEN_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <libfilezilla/hash.hpp>

#include "matcher.hpp"

namespace ob::token {

struct settings
{
	fz::hash_algorithm algorithm{fz::hash_algorithm::md5};
	std::size_t length{8};
};

/// \brief Encodes an (mtime, digest) pair into a token of settings.length lowercase alphanumeric characters.
///
/// The first min(4, length/2) characters derive from the mtime, the rest from the digest.
/// Both parts are the locale-safe base32 encoding of a hash, truncated.
std::string encode(std::int64_t mtime, const std::vector<std::uint8_t> &digest, const settings &s);

//! Hashes the digests, sorted, one after the other. The order of the input doesn't matter.
std::vector<std::uint8_t> combine(std::vector<std::vector<std::uint8_t>> digests, fz::hash_algorithm algorithm);

std::string make(const static_resource &r, const settings &s);

//! The token of a single or multi match: for the latter the newest mtime and the combined digests are encoded.
//! \returns an empty string for any other match.
std::string make(const match_result &m, const settings &s);

}

#endif // OB_TOKEN_HPP
