#include <tests/fake_admin_api/pub.hpp>

#include <restinio/all.hpp>

#include <nlohmann/json.hpp>

#include <asio.hpp>

#include <mutex>
#include <thread>

namespace fake_admin_api
{

namespace
{

const char empty_simulation[] =
		R"({"data":{"pairs":[],"globalActions":{"delays":[]}},)"
		R"("meta":{"schemaVersion":"v2"}})";

struct reply_t
{
	std::uint16_t m_status;
	const char * m_reason;
	std::string m_body;
};

[[nodiscard]]
reply_t
ok( std::string body )
{
	return { 200u, "OK", std::move(body) };
}

[[nodiscard]]
reply_t
bad_request( std::string_view what )
{
	return { 400u, "Bad Request",
			nlohmann::json{ { "error", std::string{ what } } }.dump() };
}

} /* namespace anonymous */

std::uint16_t
find_free_port()
{
	asio::io_context io_ctx;
	asio::ip::tcp::acceptor acceptor{
			io_ctx,
			asio::ip::tcp::endpoint{ asio::ip::address_v4::loopback(), 0u }
		};

	return acceptor.local_endpoint().port();
}

struct server_t::internals_t
{
	using server_handle_t =
			restinio::running_server_handle_t< restinio::default_traits_t >;

	const std::uint16_t m_port;

	std::mutex m_lock;
	bool m_healthy{ true };
	std::chrono::milliseconds m_response_delay{};
	std::uint16_t m_failure_status{};
	std::string m_mode{ "simulate" };
	std::optional< std::string > m_destination;
	std::string m_simulation{ empty_simulation };
	std::vector< request_record_t > m_requests;

	server_handle_t m_server;

	explicit internals_t( std::uint16_t port )
		:	m_port{ port }
	{
		m_server = restinio::run_async(
				restinio::own_io_context(),
				restinio::server_settings_t< restinio::default_traits_t >{}
					.address( "127.0.0.1" )
					.port( m_port )
					.request_handler(
						[this]( restinio::request_handle_t req ) {
							return on_request( std::move(req) );
						} ),
				1u );
	}

	~internals_t()
	{
		m_server->stop();
		m_server->wait();
	}

	restinio::request_handling_status_t
	on_request( restinio::request_handle_t req )
	{
		std::chrono::milliseconds delay{};
		reply_t reply = [&] {
			std::lock_guard< std::mutex > lock{ m_lock };

			delay = m_response_delay;
			m_requests.push_back( request_record_t{
					req->header().method().c_str(),
					std::string{ req->header().path() },
					req->body()
				} );

			return handle( req->header().method(), req->header().path(),
					req->body() );
		}();

		if( std::chrono::milliseconds::zero() != delay )
			std::this_thread::sleep_for( delay );

		return req->create_response(
					restinio::http_status_line_t{
						restinio::http_status_code_t{ reply.m_status },
						std::string{ reply.m_reason }
					} )
				.append_header( restinio::http_field::content_type,
						"application/json" )
				.set_body( std::move(reply.m_body) )
				.done();
	}

	// Must be called with m_lock acquired.
	[[nodiscard]]
	reply_t
	handle(
		restinio::http_method_id_t method,
		std::string_view path,
		const std::string & body )
	{
		if( "/api/health" == path )
		{
			if( !m_healthy )
				return { 503u, "Service Unavailable", "{}" };
			return ok( R"({"message":"Hoverfly is healthy"})" );
		}

		if( 0u != m_failure_status )
			return { m_failure_status, "Failure",
					R"({"error":"Forced failure"})" };

		if( "/api/v2/simulation" == path )
		{
			if( restinio::http_method_get() == method )
				return ok( m_simulation );
			if( restinio::http_method_delete() == method )
			{
				m_simulation = empty_simulation;
				return ok( m_simulation );
			}
			if( restinio::http_method_put() == method )
			{
				if( nlohmann::json::parse( body, nullptr, false ).is_discarded() )
					return bad_request( "Invalid JSON" );
				m_simulation = body;
				return ok( m_simulation );
			}
		}

		if( "/api/v2/hoverfly/mode" == path )
		{
			if( restinio::http_method_get() == method )
				return ok( nlohmann::json{
						{ "mode", m_mode },
						{ "arguments", nlohmann::json::object() }
					}.dump() );
			if( restinio::http_method_put() == method )
			{
				const auto doc = nlohmann::json::parse( body, nullptr, false );
				if( !doc.is_object() || !doc.contains( "mode" ) )
					return bad_request( "No mode specified" );
				m_mode = doc.at( "mode" ).get< std::string >();
				return ok( body );
			}
		}

		if( "/api/v2/hoverfly/destination" == path &&
				restinio::http_method_put() == method )
		{
			const auto doc = nlohmann::json::parse( body, nullptr, false );
			if( !doc.is_object() || !doc.contains( "destination" ) )
				return bad_request( "No destination specified" );
			m_destination = doc.at( "destination" ).get< std::string >();
			return ok( body );
		}

		return { 404u, "Not Found", "{}" };
	}
};

server_t::server_t( std::uint16_t port )
	:	m_impl{ std::make_unique< internals_t >( port ) }
{}

server_t::~server_t() = default;

std::uint16_t
server_t::port() const noexcept
{
	return m_impl->m_port;
}

void
server_t::set_healthy( bool value )
{
	std::lock_guard< std::mutex > lock{ m_impl->m_lock };
	m_impl->m_healthy = value;
}

void
server_t::set_failure_status( std::uint16_t status )
{
	std::lock_guard< std::mutex > lock{ m_impl->m_lock };
	m_impl->m_failure_status = status;
}

void
server_t::set_response_delay( std::chrono::milliseconds delay )
{
	std::lock_guard< std::mutex > lock{ m_impl->m_lock };
	m_impl->m_response_delay = delay;
}

std::string
server_t::mode()
{
	std::lock_guard< std::mutex > lock{ m_impl->m_lock };
	return m_impl->m_mode;
}

std::optional< std::string >
server_t::destination()
{
	std::lock_guard< std::mutex > lock{ m_impl->m_lock };
	return m_impl->m_destination;
}

std::string
server_t::simulation()
{
	std::lock_guard< std::mutex > lock{ m_impl->m_lock };
	return m_impl->m_simulation;
}

std::vector< request_record_t >
server_t::requests()
{
	std::lock_guard< std::mutex > lock{ m_impl->m_lock };
	return m_impl->m_requests;
}

} /* namespace fake_admin_api */
