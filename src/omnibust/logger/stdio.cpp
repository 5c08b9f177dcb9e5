#include <libfilezilla/string.hpp>

#include "stdio.hpp"

namespace ob::logger {

stdio::stdio(std::FILE *f, fz::logmsg::type levels, options opts)
	: f_(f)
	, opts_(opts)
{
	set_all(levels);
}

void stdio::do_log(fz::logmsg::type t, std::wstring &&msg)
{
	std::string line;

	if (auto tag = type2str(t, opts_.short_type_tag_); !tag.empty())
		line.append(fz::to_utf8(tag)).append(1, ' ');

	line.append(fz::to_utf8(msg)).append(1, '\n');

	fz::scoped_lock lock(mutex_);
	std::fwrite(line.data(), 1, line.size(), f_);
	std::fflush(f_);
}

}
