#ifndef OB_MARKER_HPP
#define OB_MARKER_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace ob {

enum class marker_form: std::uint8_t
{
	none,

	//! ?_cb_=TOKEN or &_cb_=TOKEN
	querystring,

	//! name_cb_TOKEN.ext
	filename
};

std::string_view to_string(marker_form f);
bool convert(std::string_view s, marker_form &f);

namespace marker {

//! Longest token recognized in an existing marker.
inline constexpr std::size_t max_token_length = 32;

//! The parts of a URL literal, all as views into the literal itself.
struct url_parts
{
	//! "scheme://authority" or "//authority", empty for plain paths.
	std::string_view prefix;
	std::string_view path;

	//! Without the '?'.
	std::string_view query;

	//! Without the '#'.
	std::string_view fragment;

	bool has_query{};
	bool has_fragment{};
};

url_parts split_url(std::string_view literal);

//! Position and contents of a cachebust marker within a literal.
struct existing
{
	marker_form form{marker_form::none};

	//! The bytes to remove in order to strip the marker, including the '?' or '&' separator where applicable.
	std::size_t marker_offset{};
	std::size_t marker_length{};

	//! Where the token itself lies, possibly with zero length.
	std::size_t token_offset{};
	std::size_t token_length{};

	std::string token;

	explicit operator bool() const
	{
		return form != marker_form::none;
	}
};

//! Looks for a marker spelled with the given delimiter, first in the query string, then in the file name.
existing find(std::string_view literal, std::string_view delimiter);

//! Removes the marker, if any, from the literal.
std::string strip(std::string_view literal, const existing &m);

//! Adds a marker of the given form to a literal which has none.
std::string insert(std::string_view clean_literal, marker_form form, std::string_view delimiter, std::string_view token);

//! \returns the literal carrying the given token in the given form.
//! If the literal already has a marker of that form, only the token is replaced, otherwise the old marker is removed and a new one is inserted.
std::string apply(std::string_view literal, const existing &m, marker_form form, std::string_view delimiter, std::string_view token);

}

}

#endif // OB_MARKER_HPP
