#include "io.hpp"

namespace ob::util::io {

read_error read(fz::file &file, fz::buffer &buf, std::size_t max_size)
{
	if (!file.opened())
		return read_error::open_failed;

	auto size = file.size();
	if (size >= 0 && std::uint64_t(size) > max_size)
		return read_error::too_big;

	static constexpr std::size_t chunk_size = 64*1024;

	while (true) {
		auto res = file.read2(buf.get(chunk_size), chunk_size);
		if (!res)
			return read_error::read_failed;

		if (res.value_ == 0)
			break;

		buf.add(res.value_);

		// The file may have grown since size() was called.
		if (buf.size() > max_size)
			return read_error::too_big;
	}

	return read_error::none;
}

read_error read(const fz::native_string &path, fz::buffer &buf, std::size_t max_size)
{
	fz::file file(path, fz::file::reading, fz::file::existing);
	return read(file, buf, max_size);
}

bool write(fz::file &file, std::string_view data)
{
	if (!file.opened())
		return false;

	while (!data.empty()) {
		auto res = file.write2(data.data(), data.size());
		if (!res || res.value_ == 0)
			return false;

		data.remove_prefix(res.value_);
	}

	return true;
}

std::string_view describe(read_error e)
{
	using namespace std::string_view_literals;

	switch (e) {
		case read_error::none:        return "No error"sv;
		case read_error::open_failed: return "Couldn't open the file"sv;
		case read_error::read_failed: return "Couldn't read the file"sv;
		case read_error::too_big:     return "File exceeds the size limit"sv;
	}

	return {};
}

std::string_view describe(fz::result r)
{
	using namespace std::string_view_literals;

	switch (r.error_) {
		case fz::result::ok:             return "No error"sv;
		case fz::result::invalid:        return "Invalid file name or path"sv;
		case fz::result::noperm:         return "Permission denied"sv;
		case fz::result::nofile:         return "Couldn't open the file"sv;
		case fz::result::nodir:          return "Couldn't open the directory"sv;
		case fz::result::nospace:        return "No space left"sv;
		case fz::result::resource_limit: return "Too many open files or directories"sv;
		case fz::result::other:          return "Unknown error"sv;
	}

	return {};
}

std::string_view describe(fz::rwresult r)
{
	using namespace std::string_view_literals;

	switch (r.error_) {
		case fz::rwresult::none:       return "No error"sv;
		case fz::rwresult::invalid:    return "Invalid argument"sv;
		case fz::rwresult::nospace:    return "No space left"sv;
		case fz::rwresult::wouldblock: return "The operation would have blocked"sv;
		case fz::rwresult::other:      return "Unknown error"sv;
	}

	return {};
}

}
