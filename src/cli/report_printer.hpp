#ifndef OB_CLI_REPORT_PRINTER_HPP
#define OB_CLI_REPORT_PRINTER_HPP

#include <ostream>

#include "../omnibust/engine.hpp"

namespace ob::cli {

class report_printer
{
public:
	enum verbosity_type: std::uint8_t
	{
		//! Conflicts, unmatched references and failures only.
		quiet,

		//! Plus whatever is changed, unmatched or stale.
		normal,

		//! Plus the references which are fine as they are.
		verbose
	};

	report_printer(std::ostream &out, verbosity_type verbosity = normal);

	void print(const report &rep);

private:
	void print_reference(const reference_report &r, bool scan_mode);
	void print_file(const patch_result &f);
	void print_totals(const report &rep);

	std::ostream &out_;
	verbosity_type verbosity_;
};

}

#endif // OB_CLI_REPORT_PRINTER_HPP
