#include "planner.hpp"

namespace ob {

std::string_view to_string(outcome o)
{
	using namespace std::string_view_literals;

	switch (o) {
		case outcome::unmarked:  return "unmarked"sv;
		case outcome::unmatched: return "unmatched"sv;
		case outcome::ambiguous: return "ambiguous"sv;
		case outcome::current:   return "current"sv;
		case outcome::stale:     return "stale"sv;
	}

	return {};
}

std::string_view to_string(action a)
{
	using namespace std::string_view_literals;

	switch (a) {
		case action::none:    return "none"sv;
		case action::insert:  return "inserted"sv;
		case action::update:  return "busted"sv;
		case action::convert: return "converted"sv;
	}

	return {};
}

planner_settings planner_settings::from(const config &cfg)
{
	planner_settings s;

	s.run_mode = cfg.run_mode;
	s.form = cfg.form;
	s.marker = cfg.marker;
	s.token.algorithm = cfg.hash;
	s.token.length = cfg.hash_length;
	s.force = cfg.force;

	return s;
}

plan plan_reference(const reference &ref, const match_result &match, const planner_settings &s)
{
	plan p;

	if (match.kind == match_result::unmatched || match.kind == match_result::ambiguous) {
		p.result = match.kind == match_result::unmatched ? outcome::unmatched : outcome::ambiguous;
		p.reason = match.reason;
		return p;
	}

	p.token = token::make(match, s.token);

	if (!ref.marker) {
		p.result = outcome::unmarked;

		if (s.run_mode == mode::rewrite) {
			p.todo = action::insert;
			p.replacement = marker::insert(ref.literal, s.form, s.marker, p.token);
		}

		return p;
	}

	p.result = ref.marker.token == p.token ? outcome::current : outcome::stale;

	if (s.run_mode == mode::rewrite && ref.marker.form != s.form) {
		p.todo = action::convert;
		p.replacement = marker::apply(ref.literal, ref.marker, s.form, s.marker, p.token);
	}
	else
	if ((s.run_mode == mode::rewrite || s.run_mode == mode::update) && (p.result == outcome::stale || s.force)) {
		p.todo = action::update;
		p.replacement = marker::apply(ref.literal, ref.marker, ref.marker.form, s.marker, p.token);
	}

	return p;
}

}
