/*!
 * @file
 * @brief Stuff for working with configuration.
 */

#include <hoverkit/config.hpp>

#include <hoverkit/utils/line_reader.hpp>
#include <hoverkit/utils/spdlog_log_levels.hpp>

#include <restinio/helpers/http_field_parsers/basics.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace hoverkit
{

namespace parse_config_impl
{

struct success_t {};

class failure_t
{
	std::string m_description;

public:
	failure_t( std::string description )
		:	m_description{ std::move(description) }
	{}

	[[nodiscard]]
	std::string_view
	description() const noexcept { return { m_description }; }
};

using command_handling_result_t = std::variant< success_t, failure_t >;

class command_handler_t
{
protected :
	template< typename Parser, typename Parsing_Result_Handler >
	[[nodiscard]]
	static command_handling_result_t
	perform_parsing(
		std::string_view content,
		Parser && parser,
		Parsing_Result_Handler && result_handler )
	{
		using namespace restinio::easy_parser;

		auto parse_result = try_parse(
				content,
				std::forward<Parser>(parser) );
		if( !parse_result )
			return failure_t{
					fmt::format( "unable to parse argument: {}",
							make_error_description( parse_result.error(), content ) )
			};
		else
			return result_handler( *parse_result );
	}

public:
	virtual ~command_handler_t() = default;

	[[nodiscard]]
	virtual command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const = 0;
};

using command_handler_unique_ptr_t = std::unique_ptr< command_handler_t >;

namespace parsers
{

//
// is_nonspace_char_predicate_t
//
struct is_nonspace_char_predicate_t
{
	[[nodiscard]]
	bool
	operator()( char ch ) const noexcept
	{
		return !restinio::easy_parser::impl::is_space(ch);
	}
};

//
// nonspace_char_seq_p
//
/*!
 * @brief A producer for easy_parser that extracts sequences of non-space
 * symbols.
 *
 * That producer makes instances of std::string.
 */
[[nodiscard]]
static auto
nonspace_char_seq_p()
{
	using namespace restinio::easy_parser;

	return produce< std::string >(
			repeat( 1, N,
				restinio::easy_parser::impl::symbol_producer_template_t<
						is_nonspace_char_predicate_t >{} >> to_container() )
		);
}

//
// timeout_value_p
//
/*!
 * @brief A producer for easy_parser that extracts time-out values
 * with possible suffixes (ms, s, min).
 *
 * A value without a suffix is treated as seconds.
 */
[[nodiscard]]
static auto
timeout_value_p()
{
	struct tmp_value_t
	{
		std::int_least64_t m_count{ 0 };
		int m_multiplier{ 1000 };
	};

	using namespace restinio::http_field_parsers;

	return produce< std::chrono::milliseconds >(
			produce< tmp_value_t >(
				non_negative_decimal_number_p< std::int_least64_t >()
						>> &tmp_value_t::m_count,
				maybe(
					produce< int >(
						alternatives(
							exact_p( "min" ) >> just_result( 60'000 ),
							exact_p( "ms" ) >> just_result( 1 ),
							exact_p( "s" ) >> just_result( 1'000 )
						)
					) >> &tmp_value_t::m_multiplier
				)
			)
			>> convert( []( const auto tmp ) {
					std::chrono::milliseconds r{ tmp.m_count };
					return r * tmp.m_multiplier;
				} )
			>> as_result()
		);
}

//
// port_p
//
[[nodiscard]]
static auto
port_p()
{
	return restinio::http_field_parsers::non_negative_decimal_number_p<
			port_t >();
}

//
// on_off_p
//
/*!
 * @brief A producer for easy_parser that extracts `on` or `off` values.
 *
 * Produces a bool.
 */
[[nodiscard]]
static auto
on_off_p()
{
	using namespace restinio::http_field_parsers;

	return produce< bool >(
			alternatives(
				exact_p( "on" ) >> just_result( true ),
				exact_p( "off" ) >> just_result( false )
			)
		);
}

} /* namespace parsers */

//
// log_level_handler_t
//
/*!
 * @brief Handler for `log_level` command.
 */
class log_level_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		using namespace restinio::http_field_parsers;

		return perform_parsing(
			content,
			token_p(),
			[&]( const std::string & level_name ) -> command_handling_result_t {
				const auto opt_level = hoverkit::utils::name_to_spdlog_level_enum(
						level_name );
				if( !opt_level )
					return failure_t{
							fmt::format( "unsupported log-level: {}", level_name )
					};

				current_cfg.m_log_level = *opt_level;

				return success_t{};
			} );
	}
};

//
// field_handler_t
//
/*!
 * @brief Handler for commands that just store a value into a config field.
 *
 * @tparam Field pointer to the field to be set.
 * @tparam Producer function that returns easy_parser's producer
 * for the value.
 */
template< auto Field, auto Producer >
class field_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			Producer(),
			[&]( auto && v ) -> command_handling_result_t {
				current_cfg.*Field = std::forward< decltype(v) >( v );

				return success_t{};
			} );
	}
};

//
// timeout_handler_t
//
/*!
 * @brief Handler for `timeout.startup` and `timeout.admin_request` commands.
 */
template< std::chrono::milliseconds config_t::*Field >
class timeout_handler_t : public command_handler_t
{
public:
	command_handling_result_t
	try_handle(
		std::string_view content,
		config_t & current_cfg ) const override
	{
		return perform_parsing(
			content,
			parsers::timeout_value_p(),
			[&]( std::chrono::milliseconds v ) -> command_handling_result_t {
				if( std::chrono::milliseconds::zero() == v )
					return failure_t{ "timeout can't be 0" };

				current_cfg.*Field = v;

				return success_t{};
			} );
	}
};

//! Set of space symbols.
[[nodiscard]]
inline constexpr std::string_view
spaces() noexcept { return { " \t\x0b" }; }

using line_reader_t = ::hoverkit::utils::line_reader_t;

/*!
 * @brief Splits a non-empty line into the command name and the rest.
 *
 * Leading and trailing spaces are removed from both parts.
 * The rest is empty for a command without arguments.
 */
[[nodiscard]]
std::pair< std::string_view, std::string_view >
split_line( std::string_view line )
{
	const auto trim = []( std::string_view v ) -> std::string_view {
		const auto first = v.find_first_not_of( spaces() );
		if( std::string_view::npos == first )
			return {};
		return v.substr( first, v.find_last_not_of( spaces() ) - first + 1u );
	};

	line = trim( line );
	if( line.empty() )
		throw config_parser_t::parser_exception_t(
				"split_line: only spaces in the input" );

	const auto command_end = line.find_first_of( spaces() );
	if( std::string_view::npos == command_end )
		return { line, std::string_view{} };

	return { line.substr( 0u, command_end ), trim( line.substr( command_end ) ) };
}

} /* namespace parse_config_impl */

//
// config_parser_t::parser_exception_t
//
config_parser_t::parser_exception_t::parser_exception_t(
	const std::string & what )
	:	exception_t{ "config_parser: " + what }
{}

//
// config_parser_t::impl_t
//
struct config_parser_t::impl_t
{
	using command_map_t = std::map<
			std::string,
			parse_config_impl::command_handler_unique_ptr_t,
			std::less<> >;

	command_map_t m_commands;

	/*!
	 * @return nullptr, if command handler isn't found.
	 */
	[[nodiscard]]
	const parse_config_impl::command_handler_t *
	find_command_handler( std::string_view name ) const noexcept
	{
		const auto it = m_commands.find( name );
		if( it != m_commands.end() )
			return it->second.get();
		else
			return nullptr;
	}
};

//
// config_parser_t
//
config_parser_t::config_parser_t()
	:	m_impl{ new impl_t{} }
{
	using namespace parse_config_impl;
	using namespace std::string_literals;

	m_impl->m_commands.emplace(
			"log_level"s,
			std::make_unique< log_level_handler_t >() );

	const auto add_field = [this]( std::string name, auto handler ) {
		m_impl->m_commands.emplace(
				std::move(name),
				std::make_unique< decltype(handler) >() );
	};

	add_field( "hoverfly.binary"s,
			field_handler_t< &config_t::m_binary,
					&parsers::nonspace_char_seq_p >{} );
	add_field( "hoverfly.host"s,
			field_handler_t< &config_t::m_host,
					&parsers::nonspace_char_seq_p >{} );
	add_field( "hoverfly.remote"s,
			field_handler_t< &config_t::m_remote_host,
					&parsers::nonspace_char_seq_p >{} );
	add_field( "destination"s,
			field_handler_t< &config_t::m_destination,
					&parsers::nonspace_char_seq_p >{} );

	add_field( "port.proxy"s,
			field_handler_t< &config_t::m_proxy_port, &parsers::port_p >{} );
	add_field( "port.admin"s,
			field_handler_t< &config_t::m_admin_port, &parsers::port_p >{} );

	add_field( "ssl.certificate"s,
			field_handler_t< &config_t::m_ssl_certificate,
					&parsers::nonspace_char_seq_p >{} );
	add_field( "ssl.key"s,
			field_handler_t< &config_t::m_ssl_key,
					&parsers::nonspace_char_seq_p >{} );

	add_field( "webserver"s,
			field_handler_t< &config_t::m_webserver, &parsers::on_off_p >{} );
	add_field( "tls_verification"s,
			field_handler_t< &config_t::m_tls_verification,
					&parsers::on_off_p >{} );

	m_impl->m_commands.emplace(
			"timeout.startup"s,
			std::make_unique<
					timeout_handler_t< &config_t::m_startup_timeout >
			>() );
	m_impl->m_commands.emplace(
			"timeout.admin_request"s,
			std::make_unique<
					timeout_handler_t< &config_t::m_admin_request_timeout >
			>() );
}

config_parser_t::~config_parser_t()
{}

[[nodiscard]]
config_t
config_parser_t::parse( std::string_view content )
{
	config_t result;

	// Counter for processed commands.
	// If it is zero after processing then we've got an empty config and
	// that is an error.
	std::size_t commands_processed{};

	using namespace parse_config_impl;

	line_reader_t line_reader{ content };
	line_reader.for_each_line( [&]( const line_reader_t::line_t & line ) {
			auto [command, rest] = split_line( line.content() );
			const auto handler = m_impl->find_command_handler( command );
			if( handler )
			{
				const auto handling_result = handler->try_handle( rest, result );
				if( const auto failure = std::get_if<failure_t>(&handling_result) )
				{
					throw parser_exception_t{
							fmt::format( "unable to process command {} at line {}: {}",
									command,
									line.number(),
									failure->description() )
						};
				}

				++commands_processed;
			}
			else
				throw parser_exception_t{
						fmt::format( "unknown command {} at line {}",
								command, line.number() )
					};
		} );

	if( !commands_processed )
		throw parser_exception_t{ "Empty config" };

	if( result.m_ssl_certificate.has_value() != result.m_ssl_key.has_value() )
		throw parser_exception_t{
			"ssl.certificate and ssl.key should be specified together"
		};

	if( 0u != result.m_proxy_port && result.m_proxy_port == result.m_admin_port )
		throw parser_exception_t{
			fmt::format( "port.proxy and port.admin should be different: {}",
					result.m_proxy_port )
		};

	return result;
}

} /* namespace hoverkit */
