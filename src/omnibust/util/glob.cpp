#include "glob.hpp"

namespace ob::util {

namespace {

// Matches the class starting right after '[' against ch.
// On return, pos points right after the closing ']'. If the class is unterminated, false is returned and pos is left untouched.
bool match_class(std::string_view pattern, std::size_t &pos, char ch, bool &matched)
{
	auto i = pos;
	bool negated = false;

	if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
		negated = true;
		++i;
	}

	matched = false;
	bool first = true;

	for (; i < pattern.size(); ++i) {
		char c = pattern[i];

		if (c == ']' && !first) {
			if (negated)
				matched = !matched;

			pos = i+1;
			return true;
		}

		first = false;

		if (c == '\\' && i+1 < pattern.size())
			c = pattern[++i];

		if (i+2 < pattern.size() && pattern[i+1] == '-' && pattern[i+2] != ']') {
			char hi = pattern[i+2];
			i += 2;

			if (hi == '\\' && i+1 < pattern.size())
				hi = pattern[++i];

			if (c <= ch && ch <= hi)
				matched = true;
		}
		else
		if (c == ch)
			matched = true;
	}

	return false;
}

}

bool glob_match(std::string_view pattern, std::string_view text)
{
	std::size_t p = 0, t = 0;

	// Backtracking point for the last '*' seen.
	std::size_t star_p = std::string_view::npos, star_t = 0;

	while (t < text.size()) {
		if (p < pattern.size()) {
			char c = pattern[p];

			if (c == '*') {
				star_p = ++p;
				star_t = t;
				continue;
			}

			if (c == '?') {
				++p; ++t;
				continue;
			}

			if (c == '[') {
				auto pos = p+1;
				bool matched{};

				if (match_class(pattern, pos, text[t], matched)) {
					if (matched) {
						p = pos; ++t;
						continue;
					}
				}
				else
				if (text[t] == '[') {
					// Unterminated class: the bracket is literal.
					++p; ++t;
					continue;
				}
			}
			else {
				if (c == '\\' && p+1 < pattern.size())
					c = pattern[++p];

				if (c == text[t]) {
					++p; ++t;
					continue;
				}
			}
		}

		if (star_p == std::string_view::npos)
			return false;

		p = star_p;
		t = ++star_t;
	}

	while (p < pattern.size() && pattern[p] == '*')
		++p;

	return p == pattern.size();
}

bool glob_list::matches(std::string_view text) const
{
	for (auto &g: *this) {
		if (glob_match(g, text))
			return true;
	}

	return false;
}

}
