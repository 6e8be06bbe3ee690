/*!
 * @file
 * @brief Description of a canned HTTP-response.
 */

#pragma once

#include <hoverkit/model/request.hpp>

#include <iosfwd>
#include <string>
#include <tuple>

namespace hoverkit::model
{

//
// response_t
//
/*!
 * @brief A response to be returned by the simulation engine.
 */
struct response_t
{
	//! HTTP status code.
	int m_status{ 200 };
	//! The body of the response.
	/*!
	 * If m_encoded_body is true then it's a base64 representation
	 * of the actual body.
	 */
	std::string m_body;
	bool m_encoded_body{ false };
	headers_t m_headers;
	//! Should the body be processed as a template by the engine?
	bool m_templated{ false };
};

namespace details
{

[[nodiscard]]
inline auto
tie( const response_t & v ) noexcept
{
	return std::tie(
			v.m_status,
			v.m_body,
			v.m_encoded_body,
			v.m_headers,
			v.m_templated );
}

} /* namespace details */

[[nodiscard]]
inline bool
operator==( const response_t & a, const response_t & b )
{
	return details::tie( a ) == details::tie( b );
}

[[nodiscard]]
inline bool
operator!=( const response_t & a, const response_t & b )
{
	return !( a == b );
}

[[nodiscard]]
inline bool
operator<( const response_t & a, const response_t & b )
{
	return details::tie( a ) < details::tie( b );
}

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const response_t & resp );

} /* namespace hoverkit::model */
