/*!
 * @file
 * @brief The simulation: request/response pairs and global actions.
 */

#pragma once

#include <hoverkit/model/delay_settings.hpp>
#include <hoverkit/model/request.hpp>
#include <hoverkit/model/response.hpp>

#include <iosfwd>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace hoverkit::model
{

//
// request_response_pair_t
//
/*!
 * @brief An association between a request to be matched and
 * the response to be returned.
 */
struct request_response_pair_t
{
	request_t m_request;
	response_t m_response;
};

[[nodiscard]]
inline bool
operator==(
	const request_response_pair_t & a,
	const request_response_pair_t & b )
{
	return std::tie( a.m_request, a.m_response ) ==
			std::tie( b.m_request, b.m_response );
}

[[nodiscard]]
inline bool
operator!=(
	const request_response_pair_t & a,
	const request_response_pair_t & b )
{
	return !( a == b );
}

[[nodiscard]]
inline bool
operator<(
	const request_response_pair_t & a,
	const request_response_pair_t & b )
{
	return std::tie( a.m_request, a.m_response ) <
			std::tie( b.m_request, b.m_response );
}

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const request_response_pair_t & pair );

//
// pair_set_t
//
/*!
 * @brief Set of pairs.
 *
 * Structurally identical pairs are stored only once. The order of
 * pairs in the set is not significant for the engine.
 */
using pair_set_t = std::set< request_response_pair_t >;

//
// delay_settings_container_t
//
using delay_settings_container_t = std::vector< delay_settings_t >;

//
// global_actions_t
//
//! Actions applied by the engine to all pairs.
struct global_actions_t
{
	delay_settings_container_t m_delays;
};

[[nodiscard]]
inline bool
operator==( const global_actions_t & a, const global_actions_t & b )
{
	return a.m_delays == b.m_delays;
}

//
// simulation_t
//
/*!
 * @brief The whole simulation document.
 */
struct simulation_t
{
	//! Version of simulation schema supported by hoverkit.
	static constexpr const char * schema_version = "v2";

	pair_set_t m_pairs;
	global_actions_t m_global_actions;

	//! Add pairs and delays from another simulation.
	/*!
	 * Pairs already present aren't duplicated. Delays are appended
	 * to the end of the current list.
	 */
	void
	merge( const simulation_t & other );
};

[[nodiscard]]
inline bool
operator==( const simulation_t & a, const simulation_t & b )
{
	return std::tie( a.m_pairs, a.m_global_actions ) ==
			std::tie( b.m_pairs, b.m_global_actions );
}

[[nodiscard]]
inline bool
operator!=( const simulation_t & a, const simulation_t & b )
{
	return !( a == b );
}

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const simulation_t & simulation );

} /* namespace hoverkit::model */
