#ifndef OB_PLANNER_HPP
#define OB_PLANNER_HPP

#include <string>

#include "config.hpp"
#include "matcher.hpp"
#include "reference.hpp"
#include "token.hpp"

namespace ob {

//! What was found out about a reference.
enum class outcome: std::uint8_t
{
	//! Matched, but carries no marker.
	unmarked,

	unmatched,
	ambiguous,

	//! The marker carries the right token.
	current,

	//! The marker carries a token other than the right one.
	stale
};

//! What is to be done to a reference.
enum class action: std::uint8_t
{
	none,

	//! Add a marker.
	insert,

	//! Replace the token of the existing marker.
	update,

	//! Replace the existing marker with one of the configured form.
	convert
};

std::string_view to_string(outcome o);
std::string_view to_string(action a);

struct plan
{
	outcome result{outcome::unmatched};
	action todo{action::none};

	//! The token the reference should carry. Empty if unmatched or ambiguous.
	std::string token;

	//! What the literal becomes, if there's anything to do.
	std::string replacement;

	std::string reason;
};

struct planner_settings
{
	mode run_mode{mode::update};
	marker_form form{marker_form::querystring};
	std::string marker = "_cb_";
	token::settings token;
	bool force{};

	static planner_settings from(const config &cfg);
};

/// \brief Decides what to do about a reference, given its match.
///
/// Only rewrite mode adds markers, or converts them to the configured form.
/// Update mode only refreshes the tokens of existing markers, keeping their form.
/// With force set, both modes rewrite current markers as well.
/// Scan mode never does anything. Unmatched and ambiguous references are never touched.
plan plan_reference(const reference &ref, const match_result &match, const planner_settings &s);

}

#endif // OB_PLANNER_HPP
