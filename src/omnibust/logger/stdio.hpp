#ifndef OB_LOGGER_STDIO_HPP
#define OB_LOGGER_STDIO_HPP

#include <cstdio>

#include <libfilezilla/mutex.hpp>

#include "type.hpp"

namespace ob::logger {

//! Logs to a stdio stream, one line per message, prefixed by the message type tag.
class stdio: public fz::logger_interface
{
public:
	struct options
	{
		options &short_type_tag(bool v) { short_type_tag_ = v; return *this; }

		bool short_type_tag_{true};
	};

	stdio(std::FILE *f, fz::logmsg::type levels = logmsg::default_types, options opts = {});

	void do_log(fz::logmsg::type t, std::wstring &&msg) override;

private:
	fz::mutex mutex_;
	std::FILE *f_;
	options opts_;
};

}

#endif // OB_LOGGER_STDIO_HPP
