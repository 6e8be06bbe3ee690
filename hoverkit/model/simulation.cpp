/*!
 * @file
 * @brief The simulation: request/response pairs and global actions.
 */

#include <hoverkit/model/simulation.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <ostream>

namespace hoverkit::model
{

std::ostream &
operator<<( std::ostream & to, const request_t & req )
{
	to << "{path=" << req.m_path
		<< ", method=" << req.m_method
		<< ", destination=" << req.m_destination
		<< ", scheme=" << req.m_scheme
		<< ", query=" << req.m_query
		<< ", body=" << req.m_body;
	fmt::print( to, ", headers={}}}", req.m_headers );

	return to;
}

std::ostream &
operator<<( std::ostream & to, const response_t & resp )
{
	fmt::print( to, "{{status={}, body_size={}, encoded_body={}, "
			"headers={}, templated={}}}",
			resp.m_status,
			resp.m_body.size(),
			resp.m_encoded_body,
			resp.m_headers,
			resp.m_templated );

	return to;
}

std::ostream &
operator<<( std::ostream & to, const delay_settings_t & delay )
{
	fmt::print( to, "{{url_pattern={}, delay={}ms, http_method={}}}",
			delay.m_url_pattern,
			delay.m_delay.count(),
			delay.m_http_method ? *delay.m_http_method : std::string{ "*" } );

	return to;
}

std::ostream &
operator<<( std::ostream & to, const request_response_pair_t & pair )
{
	return (to << "{request=" << pair.m_request
			<< ", response=" << pair.m_response << "}");
}

std::ostream &
operator<<( std::ostream & to, const simulation_t & simulation )
{
	to << "{pairs=[";
	for( const auto & p : simulation.m_pairs )
		to << p << ";";

	to << "], delays=[";
	for( const auto & d : simulation.m_global_actions.m_delays )
		to << d << ";";

	return (to << "]}");
}

//
// simulation_t
//
void
simulation_t::merge( const simulation_t & other )
{
	m_pairs.insert( other.m_pairs.begin(), other.m_pairs.end() );

	m_global_actions.m_delays.insert(
			m_global_actions.m_delays.end(),
			other.m_global_actions.m_delays.begin(),
			other.m_global_actions.m_delays.end() );
}

} /* namespace hoverkit::model */
