/*!
 * @file
 * @brief Builder for a description of a request to be matched.
 */

#include <hoverkit/dsl/request_matcher_builder.hpp>
#include <hoverkit/dsl/stub_service_builder.hpp>

#include <hoverkit/utils/url_encoding.hpp>

namespace hoverkit::dsl
{

namespace
{

[[nodiscard]]
std::string
encode_query( const query_params_t & params )
{
	std::string result;
	params.for_each( [&result]( const auto & key, const auto & value ) {
			if( !result.empty() )
				result += '&';
			result += utils::query_component_encode( key.pattern() );
			result += '=';
			result += utils::query_component_encode( value.pattern() );
		} );

	return result;
}

} /* namespace anonymous */

//
// request_matcher_builder_t
//
request_matcher_builder_t::request_matcher_builder_t(
	stub_service_builder_t & owner,
	model::field_matcher_t method,
	model::field_matcher_t scheme,
	model::field_matcher_t destination,
	model::field_matcher_t path )
	:	m_owner{ owner }
{
	m_request.m_method = std::move(method);
	m_request.m_scheme = std::move(scheme);
	m_request.m_destination = std::move(destination);
	m_request.m_path = std::move(path);
}

request_matcher_builder_t &
request_matcher_builder_t::body( std::string value )
{
	m_request.m_body = model::field_matcher_t::exact( std::move(value) );
	return *this;
}

request_matcher_builder_t &
request_matcher_builder_t::body( const http_body_t & value )
{
	return body( value.body() );
}

request_matcher_builder_t &
request_matcher_builder_t::body( model::field_matcher_t matcher )
{
	m_request.m_body = std::move(matcher);
	return *this;
}

request_matcher_builder_t &
request_matcher_builder_t::any_body()
{
	m_request.m_body = model::field_matcher_t::any();
	return *this;
}

request_matcher_builder_t &
request_matcher_builder_t::header( std::string name, std::string value )
{
	m_request.m_headers[ std::move(name) ] =
			std::vector< std::string >{ std::move(value) };
	return *this;
}

request_matcher_builder_t &
request_matcher_builder_t::any_query_params()
{
	m_request.m_query = model::field_matcher_t::any();
	m_query_params.clear();
	m_fuzzy_query = false;
	return *this;
}

stub_service_builder_t &
request_matcher_builder_t::will_return( const response_builder_t & response )
{
	auto request = build();
	auto delay = response.delay_for( request );

	m_owner.add_request_response_pair(
			model::request_response_pair_t{ std::move(request), response.build() } );
	m_owner.add_delay_setting( std::move(delay) );

	return m_owner;
}

model::request_t
request_matcher_builder_t::build() const
{
	model::request_t result = m_request;

	if( !m_query_params.empty() )
	{
		auto query = encode_query( m_query_params );
		result.m_query = m_fuzzy_query ?
				model::field_matcher_t::glob( std::move(query) ) :
				model::field_matcher_t::exact( std::move(query) );
	}

	return result;
}

void
request_matcher_builder_t::add_query_param(
	text_matcher_t key, text_matcher_t value )
{
	if( key.is_fuzzy() || value.is_fuzzy() )
		m_fuzzy_query = true;

	m_query_params.add( std::move(key), std::move(value) );
}

} /* namespace hoverkit::dsl */
