/*!
 * @file
 * @brief Sources of simulations to be imported into the engine.
 */

#include <hoverkit/dsl/simulation_source.hpp>

#include <hoverkit/json/simulation_json.hpp>

#include <hoverkit/utils/load_file_into_memory.hpp>
#include <hoverkit/utils/overloaded.hpp>

namespace hoverkit::dsl
{

model::simulation_t
simulation_source_t::simulation() const
{
	return std::visit( utils::overloaded{
			[]( const model::simulation_t & s ) { return s; },
			[]( const json_text_t & t ) {
				return hoverkit::json::parse_simulation( t.m_text );
			},
			[]( const json_file_t & f ) {
				return hoverkit::json::parse_simulation(
						utils::load_file_into_memory( f.m_path ) );
			}
		},
		m_source );
}

} /* namespace hoverkit::dsl */
