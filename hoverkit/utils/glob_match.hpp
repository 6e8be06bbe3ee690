/*!
 * @file
 * @brief Matching of a string against a glob pattern.
 */

#pragma once

#include <string_view>

namespace hoverkit::utils
{

/*!
 * @brief Checks that @a value conforms to @a pattern.
 *
 * The only metacharacter is `*` that means zero or more arbitrary
 * characters. All other characters are compared literally.
 */
[[nodiscard]]
inline bool
glob_match( std::string_view pattern, std::string_view value ) noexcept
{
	using size_type = std::string_view::size_type;
	constexpr auto npos = std::string_view::npos;

	size_type p{}, v{};
	// Position of the last seen '*' and the value position it was tried at.
	size_type star_p{ npos }, star_v{};

	while( v < value.size() )
	{
		if( p < pattern.size() && '*' == pattern[ p ] )
		{
			star_p = p++;
			star_v = v;
		}
		else if( p < pattern.size() && pattern[ p ] == value[ v ] )
		{
			++p;
			++v;
		}
		else if( npos != star_p )
		{
			// Let the last '*' consume one more character.
			p = star_p + 1u;
			v = ++star_v;
		}
		else
			return false;
	}

	while( p < pattern.size() && '*' == pattern[ p ] )
		++p;

	return p == pattern.size();
}

} /* namespace hoverkit::utils */
