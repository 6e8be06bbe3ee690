/*!
 * @file
 * @brief Builder for request/response pairs of one service.
 */

#pragma once

#include <hoverkit/dsl/delay_settings_builder.hpp>
#include <hoverkit/dsl/request_matcher_builder.hpp>
#include <hoverkit/dsl/text_matcher.hpp>

#include <hoverkit/model/simulation.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace hoverkit::dsl
{

//
// stub_service_builder_t
//
/*!
 * @brief Builder for all request/response pairs of a single service.
 *
 * Every request built by this builder has the same destination and
 * scheme.
 *
 * Usage example:
 * @code
 * using namespace hoverkit::dsl;
 *
 * auto booking_service = service( "https://www.my-test.com" )
 * 	.get( "/api/bookings/1" )
 * 	.will_return( success( R"({"bookingId":"1"})", "application/json" ) )
 * 	.post( "/api/bookings" )
 * 	.body( R"({"flightId":"1"})" )
 * 	.will_return( created( "http://localhost/api/bookings/1" ) );
 * @endcode
 */
class stub_service_builder_t
{
public:
	/*!
	 * @brief Make a builder for a base URL.
	 *
	 * The URL is split at the first occurrence of `://`. The part before
	 * the separator is the exact scheme, the remainder is the exact
	 * destination. If there is no separator the whole URL is the
	 * destination and any scheme is accepted.
	 */
	explicit stub_service_builder_t( std::string_view base_url );

	explicit stub_service_builder_t( const char * base_url )
		:	stub_service_builder_t{ std::string_view{ base_url } }
	{}

	explicit stub_service_builder_t( const std::string & base_url )
		:	stub_service_builder_t{ std::string_view{ base_url } }
	{}

	//! Make a builder for a destination matcher. Any scheme is accepted.
	explicit stub_service_builder_t( const text_matcher_t & destination );

	[[nodiscard]]
	const model::field_matcher_t &
	destination() const noexcept { return m_destination; }

	[[nodiscard]]
	const model::field_matcher_t &
	scheme() const noexcept { return m_scheme; }

	/*!
	 * @name Entry points for requests with the specific method.
	 * @{
	 */
	[[nodiscard]]
	request_matcher_builder_t
	get( const text_matcher_t & path );

	[[nodiscard]]
	request_matcher_builder_t
	put( const text_matcher_t & path );

	[[nodiscard]]
	request_matcher_builder_t
	post( const text_matcher_t & path );

	[[nodiscard]]
	request_matcher_builder_t
	delete_( const text_matcher_t & path );

	[[nodiscard]]
	request_matcher_builder_t
	patch( const text_matcher_t & path );

	//! Entry point for requests with any method.
	[[nodiscard]]
	request_matcher_builder_t
	any_method( const text_matcher_t & path );
	/*!
	 * @}
	 */

	//! Delay all requests to this service (or requests with some method).
	[[nodiscard]]
	stub_service_delay_builder_t
	and_delay( std::chrono::milliseconds delay );

	[[nodiscard]]
	const model::pair_set_t &
	request_response_pairs() const noexcept { return m_pairs; }

	[[nodiscard]]
	const model::delay_settings_container_t &
	delay_settings() const noexcept { return m_delays; }

	//! Register a pair.
	/*!
	 * A pair structurally equal to an already registered one is ignored.
	 */
	stub_service_builder_t &
	add_request_response_pair( model::request_response_pair_t pair );

	//! Register delay settings. An empty value is ignored.
	stub_service_builder_t &
	add_delay_setting( std::optional< model::delay_settings_t > delay );

	//! Make a simulation from the pairs and the delays.
	[[nodiscard]]
	model::simulation_t
	simulation() const;

private:
	model::field_matcher_t m_scheme{ model::field_matcher_t::any() };
	model::field_matcher_t m_destination;

	model::pair_set_t m_pairs;
	model::delay_settings_container_t m_delays;

	[[nodiscard]]
	request_matcher_builder_t
	make_request_builder(
		model::field_matcher_t method,
		const text_matcher_t & path );
};

/*!
 * @name Shorthands for creation of stub_service_builder_t for a base URL.
 * @{
 */
[[nodiscard]]
inline stub_service_builder_t
service( std::string_view base_url )
{
	return stub_service_builder_t{ base_url };
}

[[nodiscard]]
inline stub_service_builder_t
service( const char * base_url )
{
	return stub_service_builder_t{ std::string_view{ base_url } };
}

[[nodiscard]]
inline stub_service_builder_t
service( const std::string & base_url )
{
	return stub_service_builder_t{ std::string_view{ base_url } };
}
/*!
 * @}
 */

//! Shorthand for creation of stub_service_builder_t for a destination.
/*!
 * Usage example:
 * @code
 * service( matches( "*.example.com" ) ).get( "/" )...
 * @endcode
 */
[[nodiscard]]
inline stub_service_builder_t
service( const text_matcher_t & destination )
{
	return stub_service_builder_t{ destination };
}

} /* namespace hoverkit::dsl */
