#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <hoverkit/admin_client/pub.hpp>
#include <hoverkit/dsl/pub.hpp>
#include <hoverkit/json/simulation_json.hpp>

#include <tests/fake_admin_api/pub.hpp>

#include <nlohmann/json.hpp>

using namespace std::chrono_literals;

namespace
{

[[nodiscard]]
hoverkit::admin_client::client_t
make_client( const fake_admin_api::server_t & server )
{
	return { "127.0.0.1", server.port(), 1s };
}

} /* namespace anonymous */

TEST_CASE("health") {
	fake_admin_api::server_t server{ fake_admin_api::find_free_port() };
	const auto client = make_client( server );

	REQUIRE( client.is_healthy() );

	server.set_healthy( false );
	REQUIRE( !client.is_healthy() );

	server.set_healthy( true );
	REQUIRE( client.is_healthy() );
}

TEST_CASE("nobody listens") {
	const hoverkit::admin_client::client_t client{
			"127.0.0.1", fake_admin_api::find_free_port(), 500ms };

	REQUIRE( !client.is_healthy() );
	REQUIRE_THROWS_AS( (void)client.get_mode(), hoverkit::exception_t );
}

TEST_CASE("unresolvable host") {
	const hoverkit::admin_client::client_t client{
			"no-such-host.invalid", 8888u, 2s };

	REQUIRE( !client.is_healthy() );
}

TEST_CASE("timeout") {
	fake_admin_api::server_t server{ fake_admin_api::find_free_port() };
	server.set_response_delay( 500ms );

	const hoverkit::admin_client::client_t client{
			"127.0.0.1", server.port(), 100ms };

	REQUIRE_THROWS_AS( (void)client.get_mode(), hoverkit::exception_t );
	REQUIRE( !client.is_healthy() );
}

TEST_CASE("simulation") {
	using namespace hoverkit::dsl;

	fake_admin_api::server_t server{ fake_admin_api::find_free_port() };
	const auto client = make_client( server );

	REQUIRE( client.get_simulation().m_pairs.empty() );

	auto svc = service( "https://www.my-test.com" );
	svc.get( "/api/bookings" )
			.query_param( "page", "1" )
			.will_return( success( R"({"id":1})", "application/json" ) )
		.and_delay( 1s ).for_all();
	const auto expected = svc.simulation();

	client.set_simulation( expected );
	REQUIRE( expected == hoverkit::json::parse_simulation( server.simulation() ) );
	REQUIRE( expected == client.get_simulation() );

	client.delete_simulation();
	REQUIRE( client.get_simulation().m_pairs.empty() );

	const auto requests = server.requests();
	REQUIRE( 5u == requests.size() );
	REQUIRE( "PUT" == requests[ 1 ].m_method );
	REQUIRE( "/api/v2/simulation" == requests[ 1 ].m_target );
	REQUIRE( "DELETE" == requests[ 3 ].m_method );
}

TEST_CASE("mode and destination") {
	fake_admin_api::server_t server{ fake_admin_api::find_free_port() };
	const auto client = make_client( server );

	REQUIRE( "simulate" == client.get_mode() );

	client.set_mode( "capture" );
	REQUIRE( "capture" == server.mode() );
	REQUIRE( "capture" == client.get_mode() );

	client.set_destination( "api.example.com" );
	REQUIRE( server.destination() );
	REQUIRE( "api.example.com" == *server.destination() );

	const auto requests = server.requests();
	REQUIRE( "PUT" == requests.back().m_method );
	REQUIRE( "/api/v2/hoverfly/destination" == requests.back().m_target );
	REQUIRE( nlohmann::json{ { "destination", "api.example.com" } } ==
			nlohmann::json::parse( requests.back().m_body ) );
}

TEST_CASE("negative responses") {
	fake_admin_api::server_t server{ fake_admin_api::find_free_port() };
	const auto client = make_client( server );

	{
		const auto r = client.perform( "PUT", "/api/v2/simulation", "{broken" );
		REQUIRE( 400 == r.m_status );
		REQUIRE( nlohmann::json{ { "error", "Invalid JSON" } } ==
				nlohmann::json::parse( r.m_body ) );
	}

	{
		const auto r = client.perform( "GET", "/api/v2/unknown", "" );
		REQUIRE( 404 == r.m_status );
	}
}

TEST_CASE("api exception") {
	fake_admin_api::server_t server{ fake_admin_api::find_free_port() };
	const auto client = make_client( server );

	server.set_failure_status( 500u );

	try
	{
		client.set_mode( "capture" );
		FAIL( "an exception is expected" );
	}
	catch( const hoverkit::admin_client::api_exception_t & x )
	{
		REQUIRE( 500 == x.status() );
		REQUIRE( R"({"error":"Forced failure"})" == x.body() );
	}

	REQUIRE_THROWS_AS( (void)client.get_simulation(),
			hoverkit::admin_client::api_exception_t );
	REQUIRE_THROWS_AS( client.delete_simulation(),
			hoverkit::admin_client::api_exception_t );
	REQUIRE_THROWS_AS( client.set_destination( "x" ),
			hoverkit::admin_client::api_exception_t );

	// Health-checks aren't affected.
	REQUIRE( client.is_healthy() );

	server.set_failure_status( 0u );
	REQUIRE_NOTHROW( client.set_mode( "capture" ) );
	REQUIRE( "capture" == server.mode() );
}

TEST_CASE("malformed documents from the server") {
	fake_admin_api::server_t server{ fake_admin_api::find_free_port() };
	const auto client = make_client( server );

	// The fake server stores any valid JSON as the simulation.
	(void)client.perform( "PUT", "/api/v2/simulation", R"({"data":[]})" );
	REQUIRE_THROWS_AS( (void)client.get_simulation(),
			hoverkit::json::format_exception_t );
}
