/*!
 * @file
 * @brief Implementation of the client for the engine's admin API.
 */

#include <hoverkit/admin_client/pub.hpp>
#include <hoverkit/admin_client/http_parser_helpers.hpp>

#include <hoverkit/json/simulation_json.hpp>
#include <hoverkit/logging/wrap_logging.hpp>

#include <nlohmann/json.hpp>

#include <asio.hpp>

#include <fmt/format.h>

#include <array>
#include <optional>

namespace hoverkit::admin_client
{

namespace
{

const std::string_view health_target{ "/api/health" };
const std::string_view simulation_target{ "/api/v2/simulation" };
const std::string_view mode_target{ "/api/v2/hoverfly/mode" };
const std::string_view destination_target{ "/api/v2/hoverfly/destination" };

//
// request_performer_t
//
/*!
 * @brief The state of a single request to the admin API.
 *
 * All operations are performed asynchronously on an io_context
 * that belongs to the caller. The result is available after the
 * completion of io_context.run_for().
 */
class request_performer_t
{
public:
	request_performer_t(
		asio::io_context & io_ctx,
		std::string outgoing_request )
		:	m_resolver{ io_ctx }
		,	m_connection{ io_ctx }
		,	m_outgoing_request{ std::move(outgoing_request) }
	{
		http_parser_init( &m_parser, HTTP_RESPONSE );
		m_parser.data = this;

		http_parser_settings_init( &m_parser_settings );
		m_parser_settings.on_body =
			helpers::make_http_parser_callback<
					&request_performer_t::on_body >();
		m_parser_settings.on_message_complete =
			helpers::make_http_parser_callback<
					&request_performer_t::on_message_complete >();
	}

	void
	start( const std::string & host, port_t port )
	{
		m_resolver.async_resolve( host, std::to_string( port ),
				[this]( const asio::error_code & ec,
					asio::ip::tcp::resolver::results_type results )
				{
					on_resolve( ec, std::move(results) );
				} );
	}

	//! Cancel all pending operations.
	void
	cancel() noexcept
	{
		asio::error_code ignored;
		m_resolver.cancel();
		m_connection.close( ignored );
	}

	[[nodiscard]]
	bool
	completed() const noexcept { return m_message_complete; }

	[[nodiscard]]
	const std::optional< std::string > &
	failure() const noexcept { return m_failure; }

	[[nodiscard]]
	response_t
	response() const
	{
		return { static_cast<int>( m_parser.status_code ), m_body };
	}

private:
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_connection;

	const std::string m_outgoing_request;

	http_parser m_parser;
	http_parser_settings m_parser_settings;

	std::array< char, 4096 > m_incoming_buffer;

	std::string m_body;
	bool m_message_complete{ false };

	//! Description of an error if the request failed.
	std::optional< std::string > m_failure;

	void
	fail( std::string description )
	{
		m_failure = std::move(description);
		cancel();
	}

	void
	on_resolve(
		const asio::error_code & ec,
		asio::ip::tcp::resolver::results_type results )
	{
		if( ec )
			return fail( fmt::format( "unable to resolve: {}", ec.message() ) );

		asio::async_connect( m_connection, results,
				[this]( const asio::error_code & connect_ec,
					const asio::ip::tcp::endpoint & )
				{
					on_connect( connect_ec );
				} );
	}

	void
	on_connect( const asio::error_code & ec )
	{
		if( ec )
			return fail( fmt::format( "unable to connect: {}", ec.message() ) );

		asio::async_write( m_connection, asio::buffer( m_outgoing_request ),
				[this]( const asio::error_code & write_ec, std::size_t )
				{
					on_write( write_ec );
				} );
	}

	void
	on_write( const asio::error_code & ec )
	{
		if( ec )
			return fail( fmt::format( "unable to write the request: {}",
					ec.message() ) );

		read_next_part();
	}

	void
	read_next_part()
	{
		m_connection.async_read_some( asio::buffer( m_incoming_buffer ),
				[this]( const asio::error_code & ec, std::size_t bytes )
				{
					on_read( ec, bytes );
				} );
	}

	void
	on_read( const asio::error_code & ec, std::size_t bytes )
	{
		if( ec == asio::error::eof )
		{
			// A response without Content-Length is finished by EOF.
			// Zero-length input informs http_parser about it.
			http_parser_execute( &m_parser, &m_parser_settings, nullptr, 0u );
			if( !m_message_complete )
				fail( "connection closed before the end of the response" );
			return;
		}

		if( ec )
			return fail( fmt::format( "unable to read the response: {}",
					ec.message() ) );

		http_parser_execute(
				&m_parser, &m_parser_settings,
				m_incoming_buffer.data(), bytes );

		const auto err = HTTP_PARSER_ERRNO( &m_parser );
		if( HPE_OK != err )
			return fail( fmt::format( "unable to parse the response: {}",
					http_errno_name( err ) ) );

		if( m_message_complete )
			cancel();
		else
			read_next_part();
	}

	int
	on_body( const char * data, std::size_t size )
	{
		m_body.append( data, size );
		return 0;
	}

	int
	on_message_complete()
	{
		m_message_complete = true;
		return 0;
	}
};

[[nodiscard]]
bool
is_successful_status( int status ) noexcept
{
	return status >= 200 && status < 300;
}

} /* namespace anonymous */

//
// api_exception_t
//
api_exception_t::api_exception_t(
	std::string_view method,
	std::string_view target,
	int status,
	std::string body )
	:	exception_t{
			fmt::format( "admin API: {} {} failed with status {}: {}",
					method, target, status, body )
		}
	,	m_status{ status }
	,	m_body{ std::move(body) }
{}

//
// client_t
//
client_t::client_t(
	std::string host,
	port_t port,
	std::chrono::milliseconds timeout )
	:	m_host{ std::move(host) }
	,	m_port{ port }
	,	m_timeout{ timeout }
{}

bool
client_t::is_healthy() const noexcept
{
	try
	{
		return is_successful_status(
				perform( "GET", health_target, std::string_view{} ).m_status );
	}
	catch( const std::exception & x )
	{
		logging::direct_mode::trace(
				[this, &x]( auto & logger, auto level ) {
					logger.log( level, "health-check of {}:{} failed: {}",
							m_host, m_port, x.what() );
				} );
	}

	return false;
}

model::simulation_t
client_t::get_simulation() const
{
	const auto response = perform_successfully(
			"GET", simulation_target, std::string_view{} );

	return json::parse_simulation( response.m_body );
}

void
client_t::set_simulation( const model::simulation_t & simulation ) const
{
	perform_successfully( "PUT", simulation_target,
			json::dump_simulation( simulation ) );
}

void
client_t::delete_simulation() const
{
	perform_successfully( "DELETE", simulation_target, std::string_view{} );
}

std::string
client_t::get_mode() const
{
	const auto response = perform_successfully(
			"GET", mode_target, std::string_view{} );

	const auto document = nlohmann::json::parse( response.m_body, nullptr, false );
	if( document.is_discarded() || !document.is_object() )
		throw exception_t{
				fmt::format( "admin API: unexpected response for mode: {}",
						response.m_body )
			};

	const auto it = document.find( "mode" );
	if( it == document.end() || !it->is_string() )
		throw exception_t{
				fmt::format( "admin API: no mode in response: {}",
						response.m_body )
			};

	return it->get< std::string >();
}

void
client_t::set_mode( std::string_view mode ) const
{
	const nlohmann::json body{ { "mode", std::string{ mode } } };
	perform_successfully( "PUT", mode_target, body.dump() );
}

void
client_t::set_destination( std::string_view destination ) const
{
	const nlohmann::json body{ { "destination", std::string{ destination } } };
	perform_successfully( "PUT", destination_target, body.dump() );
}

response_t
client_t::perform(
	std::string_view method,
	std::string_view target,
	std::string_view body ) const
{
	logging::direct_mode::trace(
			[&]( auto & logger, auto level ) {
				logger.log( level, "admin API request: {} http://{}:{}{}, "
						"body_size={}",
						method, m_host, m_port, target, body.size() );
			} );

	std::string outgoing_request = fmt::format(
			"{} {} HTTP/1.1\r\n"
			"Host: {}:{}\r\n"
			"Connection: close\r\n"
			"Accept: application/json\r\n"
			"Content-Type: application/json\r\n"
			"Content-Length: {}\r\n"
			"\r\n",
			method, target,
			m_host, m_port,
			body.size() );
	outgoing_request.append( body.data(), body.size() );

	asio::io_context io_ctx;
	request_performer_t performer{ io_ctx, std::move(outgoing_request) };
	performer.start( m_host, m_port );

	io_ctx.run_for( m_timeout );
	if( !io_ctx.stopped() )
	{
		performer.cancel();
		throw exception_t{
				fmt::format( "admin API: {} {} timed out after {}ms",
						method, target, m_timeout.count() )
			};
	}

	if( const auto & failure = performer.failure(); failure )
		throw exception_t{
				fmt::format( "admin API: {} {} failed: {}",
						method, target, *failure )
			};

	if( !performer.completed() )
		throw exception_t{
				fmt::format( "admin API: {} {}: no response", method, target )
			};

	return performer.response();
}

response_t
client_t::perform_successfully(
	std::string_view method,
	std::string_view target,
	std::string_view body ) const
{
	auto response = perform( method, target, body );
	if( !is_successful_status( response.m_status ) )
		throw api_exception_t{
				method, target, response.m_status, std::move(response.m_body)
			};

	return response;
}

} /* namespace hoverkit::admin_client */
