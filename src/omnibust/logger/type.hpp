#ifndef OB_LOGGER_TYPE_HPP
#define OB_LOGGER_TYPE_HPP

#include <string_view>

#include <libfilezilla/logger.hpp>

namespace ob::logmsg
{
	using fz::logmsg::type;

	//! Per-reference problems that don't stop the run: unmatched references, ambiguous matches, skipped files.
	static inline constexpr type warning = fz::logmsg::custom1;

	static inline constexpr type default_types = type(fz::logmsg::status | fz::logmsg::error | warning);
	static inline constexpr type quiet_types = type(fz::logmsg::error);
	static inline constexpr type verbose_types = type(default_types | fz::logmsg::debug_warning | fz::logmsg::debug_info);
}

namespace ob::logger
{

inline std::wstring_view type2str(fz::logmsg::type t, bool short_format = true)
{
	using namespace std::string_view_literals;

	if (short_format) {
		switch(t) {
			case fz::logmsg::status:        return L"=="sv;
			case fz::logmsg::error:         return L"!!"sv;
			case fz::logmsg::command:       return L">>"sv;
			case fz::logmsg::reply:         return L"<<"sv;
			case logmsg::warning:           return L"WW"sv;
			case fz::logmsg::debug_warning: return L"DW"sv;
			case fz::logmsg::debug_info:    return L"DI"sv;
			case fz::logmsg::debug_verbose: return L"DV"sv;
			case fz::logmsg::debug_debug:   return L"DD"sv;
			default: break;
		}
	}
	else {
		switch(t) {
			case fz::logmsg::status:        return L"Status:"sv;
			case fz::logmsg::error:         return L"Error:"sv;
			case fz::logmsg::command:       return L"Command:"sv;
			case fz::logmsg::reply:         return L"Reply:"sv;
			case logmsg::warning:           return L"Warning:"sv;
			case fz::logmsg::debug_warning: return L"Debug Warning:"sv;
			case fz::logmsg::debug_info:    return L"Debug Info:"sv;
			case fz::logmsg::debug_verbose: return L"Debug Verbose:"sv;
			case fz::logmsg::debug_debug:   return L"Debug Debug:"sv;
			default: break;
		}
	}

	return {};
}

}
#endif // OB_LOGGER_TYPE_HPP
