/*!
 * @file
 * @brief Percent-encoding of URL components.
 */

#include <hoverkit/utils/url_encoding.hpp>

namespace hoverkit::utils
{

namespace
{

[[nodiscard]]
constexpr bool
is_kept_as_is( char ch ) noexcept
{
	return ( ch >= 'a' && ch <= 'z' ) ||
			( ch >= 'A' && ch <= 'Z' ) ||
			( ch >= '0' && ch <= '9' ) ||
			'.' == ch || '-' == ch || '*' == ch || '_' == ch;
}

} /* namespace anonymous */

[[nodiscard]]
std::string
form_encode( std::string_view what )
{
	static constexpr char hex_digits[] = "0123456789ABCDEF";

	std::string to;
	to.reserve( what.size() );
	for( const char ch : what )
	{
		if( is_kept_as_is( ch ) )
			to += ch;
		else if( ' ' == ch )
			to += '+';
		else
		{
			const auto byte = static_cast< unsigned char >( ch );
			to += '%';
			to += hex_digits[ byte >> 4 ];
			to += hex_digits[ byte & 0x0fu ];
		}
	}

	return to;
}

[[nodiscard]]
std::string
query_component_encode( std::string_view what )
{
	// Literal `+` is already encoded as `%2B` by form_encode(), so
	// only spaces are affected by the replacement.
	const auto form_encoded = form_encode( what );

	std::string result;
	result.reserve( form_encoded.size() );
	for( const char ch : form_encoded )
	{
		if( '+' == ch )
			result += "%20";
		else
			result += ch;
	}

	return result;
}

} /* namespace hoverkit::utils */
