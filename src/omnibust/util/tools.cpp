#include <thread>

#include <libfilezilla/libfilezilla.hpp>

#if defined(FZ_WINDOWS)
#	include <windows.h>
#else
#	include <unistd.h>
#	include <cerrno>
#endif

#include "tools.hpp"

namespace ob::util {

fz::native_string get_current_directory_name()
{
	fz::native_string buf;

#ifndef FZ_WINDOWS
	buf.resize(255);

	while (!::getcwd(buf.data(), buf.size()+1)) {
		if (errno != ERANGE) {
			return {};
		}

		buf.resize((buf.size()+1)*2 - 1);
	}

	buf.resize(fz::native_string::traits_type::length(buf.data()));
#else
	auto len = ::GetCurrentDirectoryW(0, nullptr);
	if (len == 0) {
		return {};
	}

	buf.resize(len-1);
	len = ::GetCurrentDirectoryW(DWORD(buf.size()+1), buf.data());
	if (len != buf.size()) {
		return {};
	}
#endif

	return buf;
}

fz::native_string make_absolute(const fz::native_string &path, const fz::native_string &base)
{
	if (path.empty() || fs::is_absolute(path))
		return path;

	auto dir = base.empty() ? get_current_directory_name() : base;
	if (dir.empty())
		return path;

	return fs::join(dir, path);
}

std::size_t default_thread_count()
{
	auto n = std::thread::hardware_concurrency();
	return n > 0 ? n : 1;
}

}
