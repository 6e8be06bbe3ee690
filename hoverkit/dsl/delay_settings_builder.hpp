/*!
 * @file
 * @brief Helpers for making delay settings.
 */

#pragma once

#include <hoverkit/model/delay_settings.hpp>
#include <hoverkit/model/field_matcher.hpp>

#include <chrono>
#include <string>

namespace hoverkit::dsl
{

class stub_service_builder_t;

namespace impl
{

/*!
 * @brief Make a regular expression for URLs of requests to be delayed.
 *
 * The engine matches this expression against the concatenation
 * of request's destination and path. Only exact matchers can be
 * transformed into the expression, a fuzzy matcher is replaced by `.*`.
 *
 * If @a path is nullptr the whole destination is covered.
 */
[[nodiscard]]
std::string
make_url_pattern(
	const model::field_matcher_t & destination,
	const model::field_matcher_t * path );

} /* namespace impl */

//
// stub_service_delay_builder_t
//
/*!
 * @brief Builder for delays applied to all requests to a service.
 *
 * Is created by stub_service_builder_t::and_delay():
 * @code
 * service( "www.example.com" )
 * 	.get( "/api/bookings" ).will_return( success() )
 * 	.and_delay( std::chrono::seconds{3} ).for_method( "POST" );
 * @endcode
 */
class stub_service_delay_builder_t
{
public:
	stub_service_delay_builder_t(
		stub_service_builder_t & owner,
		std::chrono::milliseconds delay );

	//! Delay requests with any method.
	stub_service_builder_t &
	for_all();

	//! Delay only requests with the specified method.
	stub_service_builder_t &
	for_method( std::string method );

private:
	stub_service_builder_t & m_owner;
	const std::chrono::milliseconds m_delay;
};

} /* namespace hoverkit::dsl */
