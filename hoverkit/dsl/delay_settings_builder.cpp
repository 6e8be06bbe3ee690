/*!
 * @file
 * @brief Helpers for making delay settings.
 */

#include <hoverkit/dsl/delay_settings_builder.hpp>
#include <hoverkit/dsl/stub_service_builder.hpp>

#include <hoverkit/utils/regex_escape.hpp>

namespace hoverkit::dsl
{

namespace impl
{

std::string
make_url_pattern(
	const model::field_matcher_t & destination,
	const model::field_matcher_t * path )
{
	if( !destination.is_exact() )
		return ".*";

	if( path && path->is_exact() )
		return utils::regex_escape( destination.value() + path->value() );

	return utils::regex_escape( destination.value() ) + ".*";
}

} /* namespace impl */

//
// stub_service_delay_builder_t
//
stub_service_delay_builder_t::stub_service_delay_builder_t(
	stub_service_builder_t & owner,
	std::chrono::milliseconds delay )
	:	m_owner{ owner }
	,	m_delay{ delay }
{}

stub_service_builder_t &
stub_service_delay_builder_t::for_all()
{
	return m_owner.add_delay_setting( model::delay_settings_t{
			impl::make_url_pattern( m_owner.destination(), nullptr ),
			m_delay,
			std::nullopt
		} );
}

stub_service_builder_t &
stub_service_delay_builder_t::for_method( std::string method )
{
	return m_owner.add_delay_setting( model::delay_settings_t{
			impl::make_url_pattern( m_owner.destination(), nullptr ),
			m_delay,
			std::move(method)
		} );
}

} /* namespace hoverkit::dsl */
