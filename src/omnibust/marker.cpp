#include <libfilezilla/string.hpp>

#include "marker.hpp"

namespace ob {

std::string_view to_string(marker_form f)
{
	using namespace std::string_view_literals;

	switch (f) {
		case marker_form::none:        return "none"sv;
		case marker_form::querystring: return "querystring"sv;
		case marker_form::filename:    return "filename"sv;
	}

	return {};
}

bool convert(std::string_view s, marker_form &f)
{
	if (s == "querystring")
		f = marker_form::querystring;
	else
	if (s == "filename")
		f = marker_form::filename;
	else
		return false;

	return true;
}

namespace marker {

namespace {

bool is_alpha(char c)
{
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_alnum(char c)
{
	return is_alpha(c) || (c >= '0' && c <= '9');
}

bool is_token(std::string_view s)
{
	if (s.size() > max_token_length)
		return false;

	for (auto c: s) {
		if (!is_alnum(c))
			return false;
	}

	return true;
}

bool is_scheme_char(char c)
{
	return is_alnum(c) || c == '+' || c == '-' || c == '.';
}

std::size_t offset_of(std::string_view part, std::string_view whole)
{
	return std::size_t(part.data() - whole.data());
}

}

url_parts split_url(std::string_view literal)
{
	url_parts p;

	std::size_t pos = 0;

	auto authority_end = [&](std::size_t from) {
		auto end = literal.find_first_of("/?#", from);
		return end == std::string_view::npos ? literal.size() : end;
	};

	if (fz::starts_with(literal, std::string_view("//"))) {
		pos = authority_end(2);
	}
	else
	if (!literal.empty() && is_alpha(literal[0])) {
		std::size_t i = 1;
		while (i < literal.size() && is_scheme_char(literal[i]))
			++i;

		if (literal.substr(i, 3) == "://")
			pos = authority_end(i+3);
	}

	p.prefix = literal.substr(0, pos);

	auto path_end = literal.find_first_of("?#", pos);
	p.path = literal.substr(pos, path_end == std::string_view::npos ? std::string_view::npos : path_end - pos);

	if (path_end == std::string_view::npos)
		return p;

	auto fragment_begin = literal.find('#', path_end);

	if (literal[path_end] == '?') {
		p.has_query = true;

		auto query_end = fragment_begin == std::string_view::npos ? literal.size() : fragment_begin;
		p.query = literal.substr(path_end+1, query_end - path_end - 1);
	}

	if (fragment_begin != std::string_view::npos) {
		p.has_fragment = true;
		p.fragment = literal.substr(fragment_begin+1);
	}

	return p;
}

existing find(std::string_view literal, std::string_view delimiter)
{
	existing m;

	if (delimiter.empty())
		return m;

	auto parts = split_url(literal);

	if (parts.has_query) {
		auto query_offset = offset_of(parts.query, literal);
		auto params = fz::strtok_view(parts.query, "&", false);

		std::size_t begin = query_offset;

		for (std::size_t i = 0; i < params.size(); ++i) {
			auto param = params[i];
			auto end = begin + param.size();

			auto eq = param.find('=');
			auto name = param.substr(0, eq);

			if (name == delimiter) {
				auto value = eq == std::string_view::npos ? std::string_view() : param.substr(eq+1);

				if (is_token(value)) {
					m.form = marker_form::querystring;
					m.token_offset = begin + delimiter.size() + (eq == std::string_view::npos ? 0 : 1);
					m.token_length = value.size();
					m.token = std::string(value);

					if (params.size() == 1) {
						// Strip the '?' along with the only parameter.
						m.marker_offset = query_offset - 1;
						m.marker_length = end - m.marker_offset;
					}
					else
					if (i == 0) {
						m.marker_offset = begin;
						m.marker_length = param.size() + 1;
					}
					else {
						m.marker_offset = begin - 1;
						m.marker_length = param.size() + 1;
					}

					return m;
				}
			}

			begin = end + 1;
		}
	}

	auto path_offset = offset_of(parts.path, literal);
	auto slash = parts.path.rfind('/');
	auto base_offset = slash == std::string_view::npos ? 0 : slash + 1;
	auto base = parts.path.substr(base_offset);

	auto dot = base.rfind('.');
	if (dot == std::string_view::npos || dot == 0)
		return m;

	auto stem = base.substr(0, dot);
	auto pos = stem.rfind(delimiter);

	// There must be something left of the file name once the marker is gone.
	if (pos == std::string_view::npos || pos == 0)
		return m;

	auto token = stem.substr(pos + delimiter.size());
	if (!is_token(token))
		return m;

	m.form = marker_form::filename;
	m.marker_offset = path_offset + base_offset + pos;
	m.marker_length = dot - pos;
	m.token_offset = m.marker_offset + delimiter.size();
	m.token_length = token.size();
	m.token = std::string(token);

	return m;
}

std::string strip(std::string_view literal, const existing &m)
{
	std::string res(literal);

	if (m)
		res.erase(m.marker_offset, m.marker_length);

	return res;
}

std::string insert(std::string_view clean_literal, marker_form form, std::string_view delimiter, std::string_view token)
{
	std::string res(clean_literal);
	auto parts = split_url(clean_literal);

	if (form == marker_form::querystring) {
		auto pos = parts.has_fragment ? offset_of(parts.fragment, clean_literal) - 1 : clean_literal.size();

		std::string param;

		if (!parts.has_query)
			param = "?";
		else
		if (!parts.query.empty() && parts.query.back() != '&')
			param = "&";

		param.append(delimiter).append(1, '=').append(token);

		res.insert(pos, param);
	}
	else
	if (form == marker_form::filename) {
		auto path_offset = offset_of(parts.path, clean_literal);
		auto slash = parts.path.rfind('/');
		auto base_offset = slash == std::string_view::npos ? 0 : slash + 1;
		auto dot = parts.path.substr(base_offset).rfind('.');

		auto pos = dot == std::string_view::npos
			? path_offset + parts.path.size()
			: path_offset + base_offset + dot;

		res.insert(pos, std::string(delimiter).append(token));
	}

	return res;
}

std::string apply(std::string_view literal, const existing &m, marker_form form, std::string_view delimiter, std::string_view token)
{
	if (m && m.form == form) {
		std::string res(literal);

		if (form == marker_form::querystring && (m.token_offset == 0 || literal[m.token_offset-1] != '='))
			res.replace(m.token_offset, m.token_length, std::string(1, '=').append(token));
		else
			res.replace(m.token_offset, m.token_length, token);

		return res;
	}

	return insert(strip(literal, m), form, delimiter, token);
}

}

}
