/*!
 * @file
 * @brief Conversion of simulations to/from the engine's JSON format.
 */

#include <hoverkit/json/simulation_json.hpp>

#include <hoverkit/utils/overloaded.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <optional>
#include <utility>

namespace hoverkit::json
{

namespace impl
{

// Names of fields in the simulation document.
constexpr const char * key_data = "data";
constexpr const char * key_pairs = "pairs";
constexpr const char * key_global_actions = "globalActions";
constexpr const char * key_delays = "delays";
constexpr const char * key_meta = "meta";
constexpr const char * key_schema_version = "schemaVersion";

constexpr const char * key_request = "request";
constexpr const char * key_response = "response";

constexpr const char * key_path = "path";
constexpr const char * key_method = "method";
constexpr const char * key_destination = "destination";
constexpr const char * key_scheme = "scheme";
constexpr const char * key_query = "query";
constexpr const char * key_body = "body";
constexpr const char * key_headers = "headers";

constexpr const char * key_status = "status";
constexpr const char * key_encoded_body = "encodedBody";
constexpr const char * key_templated = "templated";

constexpr const char * key_url_pattern = "urlPattern";
constexpr const char * key_delay = "delay";
constexpr const char * key_http_method = "httpMethod";

constexpr const char * key_exact_match = "exactMatch";
constexpr const char * key_glob_match = "globMatch";
constexpr const char * key_regex_match = "regexMatch";
constexpr const char * key_json_match = "jsonMatch";

using matcher_factory_t = model::field_matcher_t (*)( std::string );

//! Known names of matcher kinds and corresponding factories.
const std::array< std::pair< const char *, matcher_factory_t >, 4 >
	matcher_factories{{
		{ key_exact_match, &model::field_matcher_t::exact },
		{ key_glob_match, &model::field_matcher_t::glob },
		{ key_regex_match, &model::field_matcher_t::regex },
		{ key_json_match, &model::field_matcher_t::json }
	}};

[[nodiscard]]
const nlohmann::json &
required_member(
	const nlohmann::json & object,
	const char * name,
	std::string_view context )
{
	const auto it = object.find( name );
	if( it == object.end() )
		throw format_exception_t{
				fmt::format( "{}: '{}' is missing", context, name )
			};

	return *it;
}

[[nodiscard]]
const nlohmann::json *
optional_member(
	const nlohmann::json & object,
	const char * name ) noexcept
{
	const auto it = object.find( name );
	if( it == object.end() || it->is_null() )
		return nullptr;

	return &(*it);
}

void
ensure_object( const nlohmann::json & value, std::string_view context )
{
	if( !value.is_object() )
		throw format_exception_t{
				fmt::format( "{}: an object is expected, got {}",
						context, value.type_name() )
			};
}

[[nodiscard]]
nlohmann::json
headers_to_json( const model::headers_t & headers )
{
	auto result = nlohmann::json::object();
	for( const auto & [name, values] : headers )
		result[ name ] = values;

	return result;
}

[[nodiscard]]
model::headers_t
headers_from_json( const nlohmann::json & value, std::string_view context )
{
	ensure_object( value, context );

	model::headers_t result;
	for( const auto & [name, values] : value.items() )
	{
		if( !values.is_array() )
			throw format_exception_t{
					fmt::format( "{}: values of header '{}' should be an array",
							context, name )
				};

		auto & dest = result[ name ];
		for( const auto & v : values )
		{
			if( !v.is_string() )
				throw format_exception_t{
						fmt::format( "{}: value of header '{}' isn't a string",
								context, name )
					};
			dest.push_back( v.get< std::string >() );
		}
	}

	return result;
}

[[nodiscard]]
nlohmann::json
delay_to_json( const model::delay_settings_t & delay )
{
	nlohmann::json result{
		{ key_url_pattern, delay.m_url_pattern },
		{ key_delay, delay.m_delay.count() }
	};
	if( delay.m_http_method )
		result[ key_http_method ] = *delay.m_http_method;

	return result;
}

[[nodiscard]]
model::delay_settings_t
delay_from_json( const nlohmann::json & value )
{
	constexpr std::string_view context{ "delay" };

	ensure_object( value, context );

	model::delay_settings_t result;
	result.m_url_pattern = required_member( value, key_url_pattern, context )
			.get< std::string >();
	result.m_delay = std::chrono::milliseconds{
			required_member( value, key_delay, context ).get< std::int64_t >()
		};
	if( const auto * m = optional_member( value, key_http_method ) )
	{
		auto method = m->get< std::string >();
		if( !method.empty() )
			result.m_http_method = std::move(method);
	}

	return result;
}

//! Run @a action and convert exceptions from nlohmann::json.
template< typename Action >
[[nodiscard]]
auto
envelope_json_errors( Action && action )
{
	try
	{
		return action();
	}
	catch( const nlohmann::json::exception & x )
	{
		throw format_exception_t{ x.what() };
	}
}

} /* namespace impl */

//
// format_exception_t
//
format_exception_t::format_exception_t( const std::string & what )
	:	exception_t{ "simulation format: " + what }
{}

[[nodiscard]]
nlohmann::json
field_matcher_to_json( const model::field_matcher_t & matcher )
{
	using namespace model::matchers;

	return std::visit( utils::overloaded{
			[]( const blank_t & ) { return nlohmann::json::object(); },
			[]( const any_t & ) { return nlohmann::json{}; },
			[]( const exact_t & r ) {
				return nlohmann::json{ { impl::key_exact_match, r.m_value } };
			},
			[]( const glob_t & r ) {
				return nlohmann::json{ { impl::key_glob_match, r.m_value } };
			},
			[]( const regex_t & r ) {
				return nlohmann::json{ { impl::key_regex_match, r.m_value } };
			},
			[]( const json_t & r ) {
				return nlohmann::json{ { impl::key_json_match, r.m_value } };
			}
		},
		matcher.rule() );
}

[[nodiscard]]
model::field_matcher_t
field_matcher_from_json( const nlohmann::json & value )
{
	if( value.is_null() )
		return model::field_matcher_t::any();

	impl::ensure_object( value, "field matcher" );

	std::optional< model::field_matcher_t > result;
	for( const auto & item : value.items() )
	{
		const std::string & name = item.key();
		const auto & v = item.value();

		// The engine can export all kinds of a matcher with nulls
		// for unused ones.
		if( v.is_null() )
			continue;

		const auto it = std::find_if(
				impl::matcher_factories.begin(),
				impl::matcher_factories.end(),
				[&name]( const auto & p ) { return name == p.first; } );
		if( it == impl::matcher_factories.end() )
			throw format_exception_t{
					fmt::format( "unsupported field matcher kind: {}", name )
				};

		if( result )
			throw format_exception_t{
					fmt::format( "field matcher has several kinds, "
							"the second one is: {}", name )
				};

		if( !v.is_string() )
			throw format_exception_t{
					fmt::format( "value of '{}' should be a string", name )
				};

		result = it->second( v.get< std::string >() );
	}

	if( !result )
		return model::field_matcher_t::blank();

	return std::move(*result);
}

[[nodiscard]]
nlohmann::json
request_to_json( const model::request_t & request )
{
	return nlohmann::json{
		{ impl::key_path, field_matcher_to_json( request.m_path ) },
		{ impl::key_method, field_matcher_to_json( request.m_method ) },
		{ impl::key_destination,
				field_matcher_to_json( request.m_destination ) },
		{ impl::key_scheme, field_matcher_to_json( request.m_scheme ) },
		{ impl::key_query, field_matcher_to_json( request.m_query ) },
		{ impl::key_body, field_matcher_to_json( request.m_body ) },
		{ impl::key_headers, impl::headers_to_json( request.m_headers ) }
	};
}

[[nodiscard]]
model::request_t
request_from_json( const nlohmann::json & value )
{
	impl::ensure_object( value, impl::key_request );

	// A missing matcher is handled the same way as null.
	const auto matcher = [&value]( const char * name ) {
		const auto it = value.find( name );
		if( it == value.end() )
			return model::field_matcher_t::any();
		return field_matcher_from_json( *it );
	};

	model::request_t result;
	result.m_path = matcher( impl::key_path );
	result.m_method = matcher( impl::key_method );
	result.m_destination = matcher( impl::key_destination );
	result.m_scheme = matcher( impl::key_scheme );
	result.m_query = matcher( impl::key_query );
	result.m_body = matcher( impl::key_body );

	if( const auto * h = impl::optional_member( value, impl::key_headers ) )
		result.m_headers = impl::headers_from_json( *h, impl::key_headers );

	return result;
}

[[nodiscard]]
nlohmann::json
response_to_json( const model::response_t & response )
{
	return nlohmann::json{
		{ impl::key_status, response.m_status },
		{ impl::key_body, response.m_body },
		{ impl::key_encoded_body, response.m_encoded_body },
		{ impl::key_headers, impl::headers_to_json( response.m_headers ) },
		{ impl::key_templated, response.m_templated }
	};
}

[[nodiscard]]
model::response_t
response_from_json( const nlohmann::json & value )
{
	return impl::envelope_json_errors( [&value] {
		impl::ensure_object( value, impl::key_response );

		model::response_t result;
		result.m_status = impl::required_member(
				value, impl::key_status, impl::key_response ).get< int >();

		if( const auto * b = impl::optional_member( value, impl::key_body ) )
			result.m_body = b->get< std::string >();
		if( const auto * e = impl::optional_member(
				value, impl::key_encoded_body ) )
			result.m_encoded_body = e->get< bool >();
		if( const auto * h = impl::optional_member( value, impl::key_headers ) )
			result.m_headers = impl::headers_from_json( *h, impl::key_headers );
		if( const auto * t = impl::optional_member( value, impl::key_templated ) )
			result.m_templated = t->get< bool >();

		return result;
	} );
}

[[nodiscard]]
nlohmann::json
simulation_to_json( const model::simulation_t & simulation )
{
	auto pairs = nlohmann::json::array();
	for( const auto & p : simulation.m_pairs )
		pairs.push_back( nlohmann::json{
				{ impl::key_request, request_to_json( p.m_request ) },
				{ impl::key_response, response_to_json( p.m_response ) }
			} );

	auto delays = nlohmann::json::array();
	for( const auto & d : simulation.m_global_actions.m_delays )
		delays.push_back( impl::delay_to_json( d ) );

	return nlohmann::json{
		{ impl::key_data, {
				{ impl::key_pairs, std::move(pairs) },
				{ impl::key_global_actions, {
						{ impl::key_delays, std::move(delays) }
					} }
			} },
		{ impl::key_meta, {
				{ impl::key_schema_version, model::simulation_t::schema_version }
			} }
	};
}

[[nodiscard]]
model::simulation_t
simulation_from_json( const nlohmann::json & value )
{
	return impl::envelope_json_errors( [&value] {
		impl::ensure_object( value, "simulation" );

		if( const auto * meta = impl::optional_member( value, impl::key_meta ) )
		{
			if( const auto * v = impl::optional_member(
					*meta, impl::key_schema_version ) )
			{
				const auto version = v->get< std::string >();
				if( version != model::simulation_t::schema_version )
					throw format_exception_t{
							fmt::format( "unsupported schema version: {}", version )
						};
			}
		}

		const auto & data = impl::required_member(
				value, impl::key_data, "simulation" );
		impl::ensure_object( data, impl::key_data );

		model::simulation_t result;

		if( const auto * pairs = impl::optional_member( data, impl::key_pairs ) )
		{
			for( const auto & p : *pairs )
			{
				impl::ensure_object( p, "pair" );
				result.m_pairs.insert( model::request_response_pair_t{
						request_from_json( impl::required_member(
								p, impl::key_request, "pair" ) ),
						response_from_json( impl::required_member(
								p, impl::key_response, "pair" ) )
					} );
			}
		}

		if( const auto * actions = impl::optional_member(
				data, impl::key_global_actions ) )
		{
			if( const auto * delays = impl::optional_member(
					*actions, impl::key_delays ) )
			{
				for( const auto & d : *delays )
					result.m_global_actions.m_delays.push_back(
							impl::delay_from_json( d ) );
			}
		}

		return result;
	} );
}

[[nodiscard]]
std::string
dump_simulation( const model::simulation_t & simulation, int indent )
{
	return simulation_to_json( simulation ).dump( indent );
}

[[nodiscard]]
model::simulation_t
parse_simulation( std::string_view content )
{
	auto value = nlohmann::json::parse( content, nullptr, false );
	if( value.is_discarded() )
		throw format_exception_t{ "content is not a valid JSON" };

	return simulation_from_json( value );
}

} /* namespace hoverkit::json */
