/*!
 * @file
 * @brief Escaping of regular expression metacharacters.
 */

#pragma once

#include <string>
#include <string_view>

namespace hoverkit::utils
{

//! Makes a regular expression that matches @a what literally.
[[nodiscard]]
inline std::string
regex_escape( std::string_view what )
{
	static constexpr std::string_view metachars{ "\\^$.|?*+()[]{}" };

	std::string result;
	result.reserve( what.size() * 2u );
	for( const char ch : what )
	{
		if( std::string_view::npos != metachars.find( ch ) )
			result += '\\';
		result += ch;
	}

	return result;
}

} /* namespace hoverkit::utils */
