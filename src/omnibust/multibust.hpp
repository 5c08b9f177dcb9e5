#ifndef OB_MULTIBUST_HPP
#define OB_MULTIBUST_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ob::multibust {

//! A template placeholder together with the values it can take.
struct rule
{
	std::string placeholder;
	std::vector<std::string> values;
};

struct rules: std::vector<rule>
{
	using vector::vector;

	//! \returns an explanation of what's wrong with the rules, or an empty string if they're fine.
	std::string validate() const;
};

//! The opening and closing spellings of the placeholders used by template languages, like {{ and }}.
struct syntax: std::vector<std::pair<std::string, std::string>>
{
	using vector::vector;

	static const syntax &defaults();

	//! \returns the first thing spelled like a placeholder within text, if any.
	std::string_view find_placeholder(std::string_view text) const;
};

struct candidate
{
	//! The substitution values that produced the candidate, comma separated. Empty if no substitution took place.
	std::string key;
	std::string path;
};

struct expansion
{
	enum status_type
	{
		//! No placeholder found, the path is the only candidate.
		plain,

		//! One candidate per combination of substitution values.
		expanded,

		//! The path contains a placeholder no rule knows about.
		unconfigured_placeholder
	};

	status_type status{plain};
	std::vector<candidate> candidates;

	//! The offending placeholder, when status is unconfigured_placeholder.
	std::string unconfigured;

	explicit operator bool() const
	{
		return status != unconfigured_placeholder;
	}
};

/// \brief Expands the placeholders within path.
///
/// Every rule whose placeholder occurs in the path contributes its values: with more than one such rule,
/// the candidates are the cartesian product of the values, in rules order.
/// Once all the configured placeholders have been substituted, anything still looking like a placeholder makes the expansion fail.
expansion expand(std::string_view path, const rules &rules, const syntax &syntax = syntax::defaults());

}

#endif // OB_MULTIBUST_HPP
