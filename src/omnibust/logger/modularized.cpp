#include <libfilezilla/string.hpp>

#include "modularized.hpp"

namespace ob::logger {

modularized::modularized(fz::logger_interface &parent, std::string_view module_name)
	: parent_(parent)
	, prefix_(L"[" + fz::to_wstring_from_utf8(module_name) + L"] ")
{
	set_all(fz::logmsg::type(~0));
}

void modularized::do_log(fz::logmsg::type t, std::wstring &&msg)
{
	if (parent_.should_log(t))
		parent_.log_raw(t, prefix_ + msg);
}

}
