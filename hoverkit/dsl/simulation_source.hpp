/*!
 * @file
 * @brief Sources of simulations to be imported into the engine.
 */

#pragma once

#include <hoverkit/dsl/stub_service_builder.hpp>

#include <hoverkit/model/simulation.hpp>

#include <filesystem>
#include <string>
#include <variant>

namespace hoverkit::dsl
{

//
// simulation_source_t
//
/*!
 * @brief A source of a simulation.
 *
 * A simulation built by the DSL is stored as is. A JSON text and
 * a file are parsed only when simulation() is called.
 *
 * Usage example:
 * @code
 * hoverfly.import_simulation( simulation_source_t::dsl(
 * 	service( "www.my-test.com" )
 * 		.get( "/api/bookings/1" )
 * 		.will_return( success() ),
 * 	service( "www.other-anotherservice.com" )
 * 		.put( "/api/bookings/1" )
 * 		.will_return( no_content() ) ) );
 * @endcode
 */
class simulation_source_t
{
	struct json_text_t
	{
		std::string m_text;
	};

	struct json_file_t
	{
		std::filesystem::path m_path;
	};

	using source_t = std::variant<
			model::simulation_t,
			json_text_t,
			json_file_t >;

	source_t m_source;

	explicit simulation_source_t( source_t source )
		:	m_source{ std::move(source) }
	{}

public:
	//! Pairs and delays from all services are merged into one simulation.
	template< typename... Services >
	[[nodiscard]]
	static simulation_source_t
	dsl( const Services &... services )
	{
		model::simulation_t result;
		( result.merge( static_cast< const stub_service_builder_t & >(
				services ).simulation() ), ... );

		return simulation_source_t{ source_t{ std::move(result) } };
	}

	[[nodiscard]]
	static simulation_source_t
	json( std::string text )
	{
		return simulation_source_t{ source_t{ json_text_t{ std::move(text) } } };
	}

	[[nodiscard]]
	static simulation_source_t
	file( std::filesystem::path path )
	{
		return simulation_source_t{ source_t{ json_file_t{ std::move(path) } } };
	}

	[[nodiscard]]
	static simulation_source_t
	empty()
	{
		return simulation_source_t{ source_t{ model::simulation_t{} } };
	}

	//! Get the simulation.
	/*!
	 * @throw hoverkit::json::format_exception_t if the JSON text is invalid.
	 * @throw hoverkit::exception_t if the file can't be read.
	 */
	[[nodiscard]]
	model::simulation_t
	simulation() const;
};

} /* namespace hoverkit::dsl */
