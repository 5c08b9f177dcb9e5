#ifndef OB_MATCHER_HPP
#define OB_MATCHER_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "reference.hpp"
#include "resource_index.hpp"

namespace ob {

struct match_result
{
	enum kind_type: std::uint8_t
	{
		unmatched,
		single,

		//! One resource per multibust substitution.
		multi,

		//! The same reference denotes resources with different contents.
		ambiguous
	};

	kind_type kind{unmatched};

	//! For single, one entry with an empty key. For multi, one entry per candidate, keyed by its substitution values.
	std::vector<std::pair<std::string, const static_resource *>> resources;

	//! For ambiguous, the resources in conflict.
	std::vector<const static_resource *> conflicting;

	//! Why the reference is unmatched or ambiguous.
	std::string reason;
};

std::string_view to_string(match_result::kind_type k);

//! Resolves references against the resource index.
class matcher
{
public:
	matcher(const resource_index &index, const config &cfg);

	match_result match(const reference &ref) const;

	/// \brief The resources the marker-free path denotes, at most one per static root, in roots order.
	///
	/// For each root, in order, the first of these that succeeds is taken:
	/// 1. a relative path is resolved against the directory of the referencing file;
	/// 2. if the root has a url prefix, the path must begin with it and the remainder is the key;
	/// 3. otherwise the path is looked up as a key, then with its leading elements dropped one by one.
	///
	/// Only the roots where the longest key matched are kept, those resolving relative paths first.
	std::vector<const static_resource *> resolve(std::string_view clean_path, bool is_relative, const fz::native_string &referencing_file) const;

private:
	const static_resource *resolve_relative(const static_root &root, std::string_view clean_path, const fz::native_string &referencing_dir) const;
	//! Sets matched to the length of the key found.
	const static_resource *resolve_key(const static_root &root, std::string_view clean_path, std::size_t &matched) const;

	const resource_index &index_;
	const config &cfg_;
};

}

#endif // OB_MATCHER_HPP
