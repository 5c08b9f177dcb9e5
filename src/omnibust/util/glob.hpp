#ifndef OB_UTIL_GLOB_HPP
#define OB_UTIL_GLOB_HPP

#include <string>
#include <string_view>
#include <vector>

namespace ob::util {

/// Shell-style wildcard matching: '*' matches any sequence (slashes included), '?' any single character,
/// '[...]' a character class, with '!' or '^' negating it and '-' denoting ranges. A backslash escapes the following character.
bool glob_match(std::string_view pattern, std::string_view text);

struct glob_list: std::vector<std::string>
{
	using vector::vector;

	//! \returns true if any of the globs matches the text.
	bool matches(std::string_view text) const;
};

}

#endif // OB_UTIL_GLOB_HPP
