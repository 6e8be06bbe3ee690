/*!
 * @file
 * @brief Conversion of simulations to/from the engine's JSON format.
 */

#pragma once

#include <hoverkit/model/simulation.hpp>

#include <hoverkit/exception.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace hoverkit::json
{

//
// format_exception_t
//
//! Exception for malformed simulation documents.
class format_exception_t : public exception_t
{
public:
	format_exception_t( const std::string & what );
};

/*!
 * @name Conversion of separate parts of a simulation.
 * @{
 */
[[nodiscard]]
nlohmann::json
field_matcher_to_json( const model::field_matcher_t & matcher );

/*!
 * @throw format_exception_t if @a value isn't a valid matcher.
 */
[[nodiscard]]
model::field_matcher_t
field_matcher_from_json( const nlohmann::json & value );

[[nodiscard]]
nlohmann::json
request_to_json( const model::request_t & request );

[[nodiscard]]
model::request_t
request_from_json( const nlohmann::json & value );

[[nodiscard]]
nlohmann::json
response_to_json( const model::response_t & response );

[[nodiscard]]
model::response_t
response_from_json( const nlohmann::json & value );
/*!
 * @}
 */

//! Make JSON-representation of the whole simulation document.
[[nodiscard]]
nlohmann::json
simulation_to_json( const model::simulation_t & simulation );

/*!
 * @brief Restore a simulation from JSON-representation.
 *
 * @throw format_exception_t if @a value isn't a valid simulation document.
 */
[[nodiscard]]
model::simulation_t
simulation_from_json( const nlohmann::json & value );

//! Serialize a simulation into a string.
/*!
 * A negative @a indent means the compact representation.
 */
[[nodiscard]]
std::string
dump_simulation( const model::simulation_t & simulation, int indent = -1 );

/*!
 * @brief Parse a simulation from a string.
 *
 * @throw format_exception_t if @a content isn't a valid JSON or
 * isn't a valid simulation document.
 */
[[nodiscard]]
model::simulation_t
parse_simulation( std::string_view content );

} /* namespace hoverkit::json */
