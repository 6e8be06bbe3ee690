/*!
 * @file
 * @brief Builder for request/response pairs of one service.
 */

#include <hoverkit/dsl/stub_service_builder.hpp>

namespace hoverkit::dsl
{

namespace
{

constexpr std::string_view scheme_separator{ "://" };

} /* namespace anonymous */

//
// stub_service_builder_t
//
stub_service_builder_t::stub_service_builder_t( std::string_view base_url )
{
	const auto pos = base_url.find( scheme_separator );
	if( std::string_view::npos == pos )
	{
		m_destination = model::field_matcher_t::exact( std::string{ base_url } );
	}
	else
	{
		m_scheme = model::field_matcher_t::exact(
				std::string{ base_url.substr( 0u, pos ) } );
		m_destination = model::field_matcher_t::exact(
				std::string{ base_url.substr( pos + scheme_separator.size() ) } );
	}
}

stub_service_builder_t::stub_service_builder_t(
	const text_matcher_t & destination )
	:	m_destination{ destination.field_matcher() }
{}

request_matcher_builder_t
stub_service_builder_t::get( const text_matcher_t & path )
{
	return make_request_builder( model::field_matcher_t::exact( "GET" ), path );
}

request_matcher_builder_t
stub_service_builder_t::put( const text_matcher_t & path )
{
	return make_request_builder( model::field_matcher_t::exact( "PUT" ), path );
}

request_matcher_builder_t
stub_service_builder_t::post( const text_matcher_t & path )
{
	return make_request_builder( model::field_matcher_t::exact( "POST" ), path );
}

request_matcher_builder_t
stub_service_builder_t::delete_( const text_matcher_t & path )
{
	return make_request_builder(
			model::field_matcher_t::exact( "DELETE" ), path );
}

request_matcher_builder_t
stub_service_builder_t::patch( const text_matcher_t & path )
{
	return make_request_builder(
			model::field_matcher_t::exact( "PATCH" ), path );
}

request_matcher_builder_t
stub_service_builder_t::any_method( const text_matcher_t & path )
{
	return make_request_builder( model::field_matcher_t::any(), path );
}

stub_service_delay_builder_t
stub_service_builder_t::and_delay( std::chrono::milliseconds delay )
{
	return { *this, delay };
}

stub_service_builder_t &
stub_service_builder_t::add_request_response_pair(
	model::request_response_pair_t pair )
{
	m_pairs.insert( std::move(pair) );
	return *this;
}

stub_service_builder_t &
stub_service_builder_t::add_delay_setting(
	std::optional< model::delay_settings_t > delay )
{
	if( delay )
		m_delays.push_back( std::move(*delay) );
	return *this;
}

model::simulation_t
stub_service_builder_t::simulation() const
{
	model::simulation_t result;
	result.m_pairs = m_pairs;
	result.m_global_actions.m_delays = m_delays;

	return result;
}

request_matcher_builder_t
stub_service_builder_t::make_request_builder(
	model::field_matcher_t method,
	const text_matcher_t & path )
{
	return request_matcher_builder_t{
			*this,
			std::move(method),
			m_scheme,
			m_destination,
			path.field_matcher()
		};
}

} /* namespace hoverkit::dsl */
