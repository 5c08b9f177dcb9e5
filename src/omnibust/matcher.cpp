#include <libfilezilla/format.hpp>

#include "matcher.hpp"
#include "multibust.hpp"
#include "util/filesystem.hpp"

namespace ob {

std::string_view to_string(match_result::kind_type k)
{
	using namespace std::string_view_literals;

	switch (k) {
		case match_result::unmatched: return "unmatched"sv;
		case match_result::single:    return "single"sv;
		case match_result::multi:     return "multi"sv;
		case match_result::ambiguous: return "ambiguous"sv;
	}

	return {};
}

matcher::matcher(const resource_index &index, const config &cfg)
	: index_(index)
	, cfg_(cfg)
{}

const static_resource *matcher::resolve_relative(const static_root &root, std::string_view clean_path, const fz::native_string &referencing_dir) const
{
	auto real = util::fs::real_path(util::fs::join(referencing_dir, util::fs::to_native(clean_path)));
	if (!real)
		return nullptr;

	auto key = util::fs::relative_to(root.real_dir, *real);
	if (!key || key->empty())
		return nullptr;

	return root.find(*key);
}

const static_resource *matcher::resolve_key(const static_root &root, std::string_view clean_path, std::size_t &matched) const
{
	auto path = util::fs::normalize(std::string("/").append(clean_path));

	if (!root.url_prefix.empty()) {
		if (!fz::starts_with(path, root.url_prefix))
			return nullptr;

		auto key = std::string_view(path).substr(root.url_prefix.size());
		matched = key.size();

		return root.find(key);
	}

	// Longest suffix first.
	std::string_view key(path);

	while (!key.empty()) {
		key.remove_prefix(1);

		if (auto r = root.find(key)) {
			matched = key.size();
			return r;
		}

		auto slash = key.find('/');
		if (slash == std::string_view::npos)
			break;

		key.remove_prefix(slash);
	}

	return nullptr;
}

std::vector<const static_resource *> matcher::resolve(std::string_view clean_path, bool is_relative, const fz::native_string &referencing_file) const
{
	std::vector<const static_resource *> res;

	if (clean_path.empty())
		return res;

	auto referencing_dir = util::fs::parent(referencing_file);

	// A location resolved against the referencing file beats any key lookup.
	static constexpr std::size_t exact = std::size_t(-1);
	std::size_t best{};

	for (auto &root: index_.roots) {
		const static_resource *r = nullptr;
		std::size_t matched{};

		if (is_relative && !referencing_file.empty()) {
			r = resolve_relative(root, clean_path, referencing_dir);
			if (r)
				matched = exact;
		}

		if (!r)
			r = resolve_key(root, clean_path, matched);

		if (!r || matched < best)
			continue;

		if (matched > best) {
			res.clear();
			best = matched;
		}

		res.push_back(r);
	}

	return res;
}

namespace {

// Resources whose contents differ from the first one's, the first one included. Empty if they all agree.
std::vector<const static_resource *> conflicts(const std::vector<const static_resource *> &hits)
{
	for (auto h: hits) {
		if (h->digest != hits.front()->digest)
			return hits;
	}

	return {};
}

std::string describe(const std::vector<const static_resource *> &hits)
{
	std::string res;

	for (auto h: hits) {
		if (!res.empty())
			res.append(", ");

		res.append(fz::sprintf("%s (static root #%d)", h->relative, h->root + 1));
	}

	return res;
}

}

match_result matcher::match(const reference &ref) const
{
	match_result res;

	auto clean = marker::strip(ref.literal, ref.marker);
	auto parts = marker::split_url(clean);

	bool is_relative = parts.prefix.empty() && !fz::starts_with(parts.path, std::string_view("/"));

	auto expansion = multibust::expand(parts.path, cfg_.multibust, cfg_.placeholder_syntax);

	if (!expansion) {
		res.reason = fz::sprintf("unconfigured placeholder %s", expansion.unconfigured);
		return res;
	}

	if (expansion.status == multibust::expansion::plain) {
		auto hits = resolve(parts.path, is_relative, ref.path);

		if (hits.empty()) {
			res.reason = "no such static resource";
			return res;
		}

		if (auto c = conflicts(hits); !c.empty()) {
			res.kind = match_result::ambiguous;
			res.reason = fz::sprintf("matches resources with different contents: %s", describe(c));
			res.conflicting = std::move(c);
			return res;
		}

		res.kind = match_result::single;
		res.resources.emplace_back(std::string(), hits.front());

		return res;
	}

	std::vector<std::string> missing;

	for (auto &c: expansion.candidates) {
		auto hits = resolve(c.path, is_relative, ref.path);

		if (hits.empty()) {
			missing.push_back(c.key);
			continue;
		}

		if (auto conflicting = conflicts(hits); !conflicting.empty()) {
			res.kind = match_result::ambiguous;
			res.reason = fz::sprintf("variant %s matches resources with different contents: %s", c.key, describe(conflicting));
			res.conflicting = std::move(conflicting);
			res.resources.clear();
			return res;
		}

		res.resources.emplace_back(c.key, hits.front());
	}

	if (!missing.empty()) {
		std::string keys;
		for (auto &k: missing) {
			if (!keys.empty())
				keys.append(", ");

			keys.append(k);
		}

		res.reason = res.resources.empty()
			? std::string("no static resource for any of the variants")
			: fz::sprintf("no static resource for variants %s", keys);

		res.resources.clear();
		return res;
	}

	res.kind = match_result::multi;
	return res;
}

}
