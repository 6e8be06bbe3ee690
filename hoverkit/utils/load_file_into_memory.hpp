/*!
 * @file
 * @brief Helper function for loading the whole file content into memory.
 */

#pragma once

#include <hoverkit/exception.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace hoverkit::utils
{

// An exception is thrown in the case of the absence of file or
// if there is some error.
[[nodiscard]]
inline std::string
load_file_into_memory(
	const std::filesystem::path & file_name )
{
	std::string buffer;

	std::error_code ec;
	const auto file_size = std::filesystem::file_size( file_name, ec );
	if( ec )
		throw exception_t{
				fmt::format( "unable to get size of file '{}': {}",
						file_name.string(), ec.message() )
			};

	if( file_size )
	{
		std::ifstream file;
		file.open( file_name, std::ios_base::in | std::ios_base::binary );
		if( !file )
			throw exception_t{
					fmt::format( "unable to open file '{}'", file_name.string() )
				};

		file.exceptions( std::ifstream::badbit | std::ifstream::failbit );

		buffer.resize( file_size );
		file.read( buffer.data(), static_cast<std::streamsize>(file_size) );

		if( file.gcount() != static_cast<std::streamsize>(file_size) )
			throw exception_t{
					fmt::format( "number of bytes loaded mismatches the size of "
							"the file: bytes_loaded={}, file_size={}",
							file.gcount(),
							file_size )
				};
	}

	return buffer;
}

} /* namespace hoverkit::utils */
