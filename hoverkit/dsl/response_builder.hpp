/*!
 * @file
 * @brief Builder for canned responses.
 */

#pragma once

#include <hoverkit/dsl/http_body.hpp>

#include <hoverkit/model/delay_settings.hpp>
#include <hoverkit/model/response.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace hoverkit::dsl
{

//
// response_builder_t
//
/*!
 * @brief Builder for a response returned by the engine.
 *
 * Usually is created by one of helper functions like success(),
 * created() or not_found():
 * @code
 * service( "www.example.com" )
 * 	.post( "/api/bookings" )
 * 	.body( R"({"flightId": "1"})" )
 * 	.will_return( created( "http://localhost/api/bookings/1" )
 * 		.with_delay( std::chrono::seconds{1} ) );
 * @endcode
 */
class response_builder_t
{
public:
	response_builder_t &
	status( int value );

	response_builder_t &
	body( std::string value );

	//! Set the body and the corresponding `Content-Type` header.
	response_builder_t &
	body( const http_body_t & value );

	//! Add a value for the header.
	/*!
	 * All values for the same header are kept.
	 */
	response_builder_t &
	header( const std::string & name, std::string value );

	//! Ask the engine to process the body as a template.
	response_builder_t &
	templated();

	//! Set the body already encoded in base64.
	response_builder_t &
	encoded_body( std::string base64_body );

	//! Ask the engine to delay the response.
	response_builder_t &
	with_delay( std::chrono::milliseconds delay );

	[[nodiscard]]
	const model::response_t &
	build() const noexcept { return m_response; }

	[[nodiscard]]
	std::chrono::milliseconds
	delay() const noexcept { return m_delay; }

	//! Make delay settings for the request this response is bound to.
	/*!
	 * Returns an empty value if there is no delay for the response.
	 */
	[[nodiscard]]
	std::optional< model::delay_settings_t >
	delay_for( const model::request_t & request ) const;

private:
	model::response_t m_response;
	std::chrono::milliseconds m_delay{};
};

/*!
 * @name Creators of responses.
 * @{
 */
[[nodiscard]]
response_builder_t
response();

//! 200 OK.
[[nodiscard]]
response_builder_t
success();

//! 200 OK with a body of specified content type.
[[nodiscard]]
response_builder_t
success( std::string body, const std::string & content_type );

//! 201 Created with `Location` header.
[[nodiscard]]
response_builder_t
created( std::string location );

//! 204 No Content.
[[nodiscard]]
response_builder_t
no_content();

//! 400 Bad Request.
[[nodiscard]]
response_builder_t
bad_request();

//! 401 Unauthorized.
[[nodiscard]]
response_builder_t
unauthorised();

//! 403 Forbidden.
[[nodiscard]]
response_builder_t
forbidden();

//! 404 Not Found.
[[nodiscard]]
response_builder_t
not_found();

//! 500 Internal Server Error.
[[nodiscard]]
response_builder_t
server_error();

//! 503 Service Unavailable.
[[nodiscard]]
response_builder_t
service_unavailable();
/*!
 * @}
 */

} /* namespace hoverkit::dsl */
