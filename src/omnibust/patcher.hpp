#ifndef OB_PATCHER_HPP
#define OB_PATCHER_HPP

#include <atomic>
#include <string>
#include <vector>

#include <libfilezilla/logger.hpp>
#include <libfilezilla/string.hpp>

namespace ob {

//! Replacement of the bytes at [offset, offset+length), which must still be equal to original.
struct edit
{
	std::size_t offset{};
	std::size_t length{};

	//! 1-based, for reporting.
	std::size_t line{};

	std::string original;
	std::string replacement;
};

struct file_edits
{
	fz::native_string path;
	std::string name;
	std::vector<edit> edits;
};

//! How a line looks before and after one of the edits.
struct preview_line
{
	std::size_t line{};
	std::string before;
	std::string after;
};

struct patch_result
{
	enum status_type: std::uint8_t
	{
		written,

		//! Nothing to do.
		unchanged,

		//! The file changed since it was scanned.
		skipped_stale,

		failed,

		//! The edits have been computed, but not written.
		dry_run,

		//! The run was cancelled before the file could be written.
		cancelled
	};

	std::string name;
	status_type status{unchanged};
	std::size_t edits{};
	std::string reason;

	//! One per edited line, filled in in dry-run mode only.
	std::vector<preview_line> preview;
};

std::string_view to_string(patch_result::status_type s);

/// \brief Applies the edits to content, from the last one to the first.
///
/// \returns false, leaving content untouched and explaining why in reason, if any of the edits is out of bounds,
/// if the bytes it would replace are not its original ones, or if it overlaps another edit.
bool apply_edits(std::string &content, std::vector<edit> edits, std::string &reason);

//! The lines of content touched by the edits, in order, as they are and as they'd be with all of their edits applied.
std::vector<preview_line> make_preview(std::string_view content, const std::vector<edit> &edits);

class patcher
{
public:
	patcher(fz::logger_interface &logger = fz::get_null_logger());

	/// \brief Re-reads the file, verifies and applies the edits, then atomically replaces the file.
	///
	/// The new contents go to a temporary file in the same directory, with the permissions of the original,
	/// which is then renamed over the original. The temporary file is removed on any failure.
	/// If cancel is set before the writing starts, nothing is written.
	patch_result apply(const file_edits &f, bool dry_run, const std::atomic<bool> *cancel = nullptr);

private:
	bool write_atomically(const fz::native_string &path, std::string_view content, std::string &reason);

	fz::logger_interface &logger_;
};

}

#endif // OB_PATCHER_HPP
