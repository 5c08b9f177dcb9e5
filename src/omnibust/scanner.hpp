#ifndef OB_SCANNER_HPP
#define OB_SCANNER_HPP

#include <vector>

#include <libfilezilla/logger.hpp>
#include <libfilezilla/thread_pool.hpp>

#include "config.hpp"
#include "reference.hpp"

namespace ob {

/// \brief What makes a run of bytes a reference.
///
/// A literal is a maximal run of non-delimiter bytes whose path part ends with one of the suffixes,
/// optionally followed by a query string and a fragment.
/// Placeholders spelled according to the opaque syntax are taken as a whole, even if they contain delimiters.
struct scan_rule
{
	std::string delimiters = config::default_delimiters;
	std::vector<std::string> suffixes = config::default_static_filetypes;
	std::string marker = "_cb_";
	multibust::syntax opaque = multibust::syntax::defaults();
	std::size_t max_file_size = config::default_max_file_size;

	static scan_rule from(const config &cfg);
};

//! Finds all the references within text. Only offset, length, line, literal and marker are filled in.
std::vector<reference> scan_text(std::string_view text, const scan_rule &rule);

//! Files with a NUL byte within this many leading bytes are deemed binary.
inline constexpr std::size_t binary_probe_size = 8000;

bool looks_binary(std::string_view text);

enum class scan_status: std::uint8_t
{
	scanned,
	binary,
	too_big,
	unreadable
};

std::string_view to_string(scan_status s);

//! Scans a single file, appending its references to out.
scan_status scan_file(const fz::native_string &path, const scan_rule &rule, std::vector<reference> &out);

class scanner
{
public:
	struct result
	{
		//! Sorted by file name, then offset.
		std::vector<reference> references;

		std::vector<std::string> warnings;
		std::size_t files_scanned{};
	};

	scanner(fz::thread_pool &pool, fz::logger_interface &logger = fz::get_null_logger());

	//! Scans the code directories of the configuration.
	//! \returns false if any of them couldn't be listed.
	bool scan(const config &cfg, result &res);

private:
	fz::thread_pool &pool_;
	fz::logger_interface &logger_;
};

//! How a file is named in reports.
std::string display_name(const config &cfg, const fz::native_string &path);

}

#endif // OB_SCANNER_HPP
