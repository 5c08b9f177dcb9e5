#include <set>

#include <libfilezilla/format.hpp>
#include <libfilezilla/string.hpp>

#include "multibust.hpp"

namespace ob::multibust {

std::string rules::validate() const
{
	std::set<std::string_view> seen;

	for (auto &r: *this) {
		if (r.placeholder.empty())
			return "a multibust placeholder is empty";

		if (!seen.insert(r.placeholder).second)
			return fz::sprintf("multibust placeholder `%s' is configured more than once", r.placeholder);

		if (r.values.empty())
			return fz::sprintf("multibust placeholder `%s' has no substitution values", r.placeholder);

		for (auto &v: r.values) {
			if (v.find(r.placeholder) != std::string::npos)
				return fz::sprintf("a substitution value of multibust placeholder `%s' contains the placeholder itself", r.placeholder);
		}
	}

	return {};
}

const syntax &syntax::defaults()
{
	static const syntax s = {
		{ "{{", "}}" },
		{ "{%", "%}" },
		{ "${", "}" },
		{ "<%", "%>" },
	};

	return s;
}

std::string_view syntax::find_placeholder(std::string_view text) const
{
	std::string_view first;
	auto first_pos = std::string_view::npos;

	for (auto &[open, close]: *this) {
		if (open.empty() || close.empty())
			continue;

		auto begin = text.find(open);
		if (begin == std::string_view::npos || begin >= first_pos)
			continue;

		auto end = text.find(close, begin + open.size());
		if (end == std::string_view::npos)
			continue;

		first_pos = begin;
		first = text.substr(begin, end + close.size() - begin);
	}

	return first;
}

expansion expand(std::string_view path, const rules &rules, const syntax &syntax)
{
	expansion res;
	res.candidates.push_back({ {}, std::string(path) });

	for (auto &r: rules) {
		if (r.placeholder.empty() || path.find(r.placeholder) == std::string_view::npos)
			continue;

		res.status = expansion::expanded;

		std::vector<candidate> next;
		next.reserve(res.candidates.size() * r.values.size());

		for (auto &c: res.candidates) {
			for (auto &v: r.values) {
				auto key = c.key.empty() ? v : c.key + "," + v;
				next.push_back({ std::move(key), fz::replaced_substrings(c.path, r.placeholder, v) });
			}
		}

		res.candidates = std::move(next);
	}

	for (auto &c: res.candidates) {
		if (auto p = syntax.find_placeholder(c.path); !p.empty()) {
			res.status = expansion::unconfigured_placeholder;
			res.unconfigured = std::string(p);
			res.candidates.clear();
			break;
		}
	}

	return res;
}

}
