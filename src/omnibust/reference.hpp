#ifndef OB_REFERENCE_HPP
#define OB_REFERENCE_HPP

#include <string>

#include <libfilezilla/string.hpp>

#include "marker.hpp"

namespace ob {

//! An occurrence of a URL-like literal within a scanned file.
struct reference
{
	//! The file the literal was found in, as given to the filesystem.
	fz::native_string path;

	//! The same file, as shown in reports: relative to the project directory when it lies within it.
	std::string name;

	std::size_t offset{};
	std::size_t length{};

	//! 1-based.
	std::size_t line{};

	std::string literal;

	//! Offsets are relative to the literal.
	marker::existing marker;

	marker::url_parts parts() const
	{
		return marker::split_url(literal);
	}
};

}

#endif // OB_REFERENCE_HPP
