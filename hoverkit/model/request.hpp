/*!
 * @file
 * @brief Description of HTTP-request to be matched by the simulation engine.
 */

#pragma once

#include <hoverkit/model/field_matcher.hpp>

#include <iosfwd>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace hoverkit::model
{

//
// headers_t
//
/*!
 * @brief Type of container for HTTP-fields.
 *
 * Every field name can have several values.
 */
using headers_t = std::map< std::string, std::vector< std::string > >;

//
// request_t
//
/*!
 * @brief Description of a request to be matched.
 *
 * Every field except headers is described by a field_matcher_t.
 * By default all fields are blank.
 *
 * The scheme is set to `any` if it isn't specified by the user. It means
 * that both http and https requests are matched.
 */
struct request_t
{
	field_matcher_t m_path;
	field_matcher_t m_method;
	field_matcher_t m_destination;
	field_matcher_t m_scheme{ field_matcher_t::any() };
	field_matcher_t m_query;
	field_matcher_t m_body;
	headers_t m_headers;
};

namespace details
{

[[nodiscard]]
inline auto
tie( const request_t & v ) noexcept
{
	return std::tie(
			v.m_path,
			v.m_method,
			v.m_destination,
			v.m_scheme,
			v.m_query,
			v.m_body,
			v.m_headers );
}

} /* namespace details */

[[nodiscard]]
inline bool
operator==( const request_t & a, const request_t & b )
{
	return details::tie( a ) == details::tie( b );
}

[[nodiscard]]
inline bool
operator!=( const request_t & a, const request_t & b )
{
	return !( a == b );
}

[[nodiscard]]
inline bool
operator<( const request_t & a, const request_t & b )
{
	return details::tie( a ) < details::tie( b );
}

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const request_t & req );

} /* namespace hoverkit::model */
