/*!
 * @file
 * @brief Builder for canned responses.
 */

#include <hoverkit/dsl/response_builder.hpp>

#include <hoverkit/dsl/delay_settings_builder.hpp>

namespace hoverkit::dsl
{

//
// response_builder_t
//
response_builder_t &
response_builder_t::status( int value )
{
	m_response.m_status = value;
	return *this;
}

response_builder_t &
response_builder_t::body( std::string value )
{
	m_response.m_body = std::move(value);
	m_response.m_encoded_body = false;
	return *this;
}

response_builder_t &
response_builder_t::body( const http_body_t & value )
{
	body( value.body() );
	m_response.m_headers[ "Content-Type" ] =
			std::vector< std::string >{ value.content_type() };
	return *this;
}

response_builder_t &
response_builder_t::header( const std::string & name, std::string value )
{
	m_response.m_headers[ name ].push_back( std::move(value) );
	return *this;
}

response_builder_t &
response_builder_t::templated()
{
	m_response.m_templated = true;
	return *this;
}

response_builder_t &
response_builder_t::encoded_body( std::string base64_body )
{
	m_response.m_body = std::move(base64_body);
	m_response.m_encoded_body = true;
	return *this;
}

response_builder_t &
response_builder_t::with_delay( std::chrono::milliseconds delay )
{
	m_delay = delay;
	return *this;
}

std::optional< model::delay_settings_t >
response_builder_t::delay_for( const model::request_t & request ) const
{
	if( m_delay <= std::chrono::milliseconds::zero() )
		return std::nullopt;

	model::delay_settings_t result;
	result.m_url_pattern = impl::make_url_pattern(
			request.m_destination, &request.m_path );
	result.m_delay = m_delay;
	if( request.m_method.is_exact() )
		result.m_http_method = request.m_method.value();

	return result;
}

response_builder_t
response()
{
	return {};
}

response_builder_t
success()
{
	return response().status( 200 );
}

response_builder_t
success( std::string body, const std::string & content_type )
{
	auto result = success();
	result.body( std::move(body) ).header( "Content-Type", content_type );
	return result;
}

response_builder_t
created( std::string location )
{
	auto result = response();
	result.status( 201 );
	if( !location.empty() )
		result.header( "Location", std::move(location) );
	return result;
}

response_builder_t
no_content()
{
	return response().status( 204 );
}

response_builder_t
bad_request()
{
	return response().status( 400 );
}

response_builder_t
unauthorised()
{
	return response().status( 401 );
}

response_builder_t
forbidden()
{
	return response().status( 403 );
}

response_builder_t
not_found()
{
	return response().status( 404 );
}

response_builder_t
server_error()
{
	return response().status( 500 );
}

response_builder_t
service_unavailable()
{
	return response().status( 503 );
}

} /* namespace hoverkit::dsl */
