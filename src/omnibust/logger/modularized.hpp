#ifndef OB_LOGGER_MODULARIZED_HPP
#define OB_LOGGER_MODULARIZED_HPP

#include <string>

#include <libfilezilla/logger.hpp>

namespace ob::logger {

//! Forwards to another logger, prefixing every message with the name of the module that logged it.
//! Filtering is left to the parent logger.
class modularized: public fz::logger_interface
{
public:
	modularized(fz::logger_interface &parent, std::string_view module_name);

	void do_log(fz::logmsg::type t, std::wstring &&msg) override;

private:
	fz::logger_interface &parent_;
	std::wstring prefix_;
};

}

#endif // OB_LOGGER_MODULARIZED_HPP
