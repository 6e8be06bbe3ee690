/*!
 * @file
 * @brief Helper function that throws an exception if some
 * system call returns an error.
 */

#pragma once

#include <hoverkit/exception.hpp>

#include <cerrno>
#include <string>
#include <system_error>

namespace hoverkit::utils
{

//! Throws exception_t with the description of errno if @a ret_code is -1.
inline void
ensure_successful_syscall(int ret_code, const char * what)
{
	if(-1 == ret_code)
	{
		throw exception_t( std::string(what) + ": failed -> " +
				std::system_category().message(errno));
	}
}

inline void
ensure_successful_syscall(int ret_code, const std::string & what)
{
	ensure_successful_syscall(ret_code, what.c_str());
}

} /* namespace hoverkit::utils */
