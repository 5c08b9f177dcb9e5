#ifndef OB_UTIL_IO_HPP
#define OB_UTIL_IO_HPP

#include <string_view>

#include <libfilezilla/buffer.hpp>
#include <libfilezilla/file.hpp>
#include <libfilezilla/fsresult.hpp>

namespace ob::util::io {

enum class read_error: std::uint8_t
{
	none,
	open_failed,
	read_failed,
	too_big
};

//! Reads the whole file into buf, failing if it's bigger than max_size bytes.
read_error read(const fz::native_string &path, fz::buffer &buf, std::size_t max_size = std::size_t(-1));
read_error read(fz::file &file, fz::buffer &buf, std::size_t max_size = std::size_t(-1));

//! Writes all of data, retrying on partial writes.
bool write(fz::file &file, std::string_view data);

std::string_view describe(read_error e);
std::string_view describe(fz::result r);
std::string_view describe(fz::rwresult r);

}

#endif // OB_UTIL_IO_HPP
