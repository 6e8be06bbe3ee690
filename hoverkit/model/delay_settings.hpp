/*!
 * @file
 * @brief Description of an artificial latency applied by the engine.
 */

#pragma once

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <tuple>

namespace hoverkit::model
{

//
// delay_settings_t
//
/*!
 * @brief A delay for requests those URL matches a pattern.
 *
 * The engine matches m_url_pattern (a regular expression) against
 * the concatenation of request's destination and path.
 */
struct delay_settings_t
{
	std::string m_url_pattern;
	std::chrono::milliseconds m_delay{};
	//! Method of requests to be delayed.
	/*!
	 * Empty value means requests with any method.
	 */
	std::optional< std::string > m_http_method;
};

namespace details
{

[[nodiscard]]
inline auto
tie( const delay_settings_t & v ) noexcept
{
	return std::tie( v.m_url_pattern, v.m_delay, v.m_http_method );
}

} /* namespace details */

[[nodiscard]]
inline bool
operator==( const delay_settings_t & a, const delay_settings_t & b )
{
	return details::tie( a ) == details::tie( b );
}

[[nodiscard]]
inline bool
operator!=( const delay_settings_t & a, const delay_settings_t & b )
{
	return !( a == b );
}

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const delay_settings_t & delay );

} /* namespace hoverkit::model */
