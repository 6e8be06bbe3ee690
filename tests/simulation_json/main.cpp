#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <hoverkit/json/simulation_json.hpp>
#include <hoverkit/dsl/pub.hpp>

using namespace std::string_view_literals;
using namespace std::chrono_literals;

namespace
{

using hoverkit::model::field_matcher_t;

} /* namespace anonymous */

TEST_CASE("field matchers") {
	using namespace hoverkit::json;

	REQUIRE( field_matcher_to_json( field_matcher_t::any() ).is_null() );
	REQUIRE( nlohmann::json::object() ==
			field_matcher_to_json( field_matcher_t::blank() ) );
	REQUIRE( nlohmann::json::parse( R"({"exactMatch":"GET"})" ) ==
			field_matcher_to_json( field_matcher_t::exact( "GET" ) ) );
	REQUIRE( nlohmann::json::parse( R"({"globMatch":"id=*"})" ) ==
			field_matcher_to_json( field_matcher_t::glob( "id=*" ) ) );
	REQUIRE( nlohmann::json::parse( R"({"regexMatch":"^a$"})" ) ==
			field_matcher_to_json( field_matcher_t::regex( "^a$" ) ) );
	REQUIRE( nlohmann::json::parse( R"({"jsonMatch":"{}"})" ) ==
			field_matcher_to_json( field_matcher_t::json( "{}" ) ) );

	REQUIRE( field_matcher_t::any() ==
			field_matcher_from_json( nlohmann::json{} ) );
	REQUIRE( field_matcher_t::blank() ==
			field_matcher_from_json( nlohmann::json::object() ) );
	REQUIRE( field_matcher_t::glob( "/a/*" ) == field_matcher_from_json(
			nlohmann::json::parse( R"({"globMatch":"/a/*"})" ) ) );

	// Unused kinds can be exported as nulls.
	REQUIRE( field_matcher_t::exact( "x" ) == field_matcher_from_json(
			nlohmann::json::parse(
				R"({"exactMatch":"x","globMatch":null,"regexMatch":null})" ) ) );

	REQUIRE_THROWS_AS( field_matcher_from_json(
			nlohmann::json::parse( R"({"xpathMatch":"/a"})" ) ),
			format_exception_t );
	REQUIRE_THROWS_AS( field_matcher_from_json(
			nlohmann::json::parse( R"({"exactMatch":"a","globMatch":"b"})" ) ),
			format_exception_t );
	REQUIRE_THROWS_AS( field_matcher_from_json(
			nlohmann::json::parse( R"({"exactMatch":1})" ) ),
			format_exception_t );
	REQUIRE_THROWS_AS( field_matcher_from_json( nlohmann::json( "GET" ) ),
			format_exception_t );
}

TEST_CASE("document layout") {
	using namespace hoverkit::dsl;

	auto svc = service( "https://www.my-test.com" );
	svc.get( "/api/bookings" )
			.query_param( "page", "1" )
			.header( "Accept", "application/json" )
			.will_return( success( R"({"id":1})", "application/json" )
					.with_delay( 2s ) );

	const auto doc = hoverkit::json::simulation_to_json( svc.simulation() );

	REQUIRE( "v2" == doc.at( "meta" ).at( "schemaVersion" ) );

	const auto & pairs = doc.at( "data" ).at( "pairs" );
	REQUIRE( 1u == pairs.size() );

	const auto & request = pairs[ 0 ].at( "request" );
	REQUIRE( nlohmann::json::parse( R"({"exactMatch":"/api/bookings"})" ) ==
			request.at( "path" ) );
	REQUIRE( nlohmann::json::parse( R"({"exactMatch":"GET"})" ) ==
			request.at( "method" ) );
	REQUIRE( nlohmann::json::parse( R"({"exactMatch":"www.my-test.com"})" ) ==
			request.at( "destination" ) );
	REQUIRE( nlohmann::json::parse( R"({"exactMatch":"https"})" ) ==
			request.at( "scheme" ) );
	REQUIRE( nlohmann::json::parse( R"({"exactMatch":"page=1"})" ) ==
			request.at( "query" ) );
	REQUIRE( nlohmann::json::object() == request.at( "body" ) );
	REQUIRE( nlohmann::json::parse( R"({"Accept":["application/json"]})" ) ==
			request.at( "headers" ) );

	const auto & response = pairs[ 0 ].at( "response" );
	REQUIRE( 200 == response.at( "status" ) );
	REQUIRE( R"({"id":1})" == response.at( "body" ) );
	REQUIRE( false == response.at( "encodedBody" ) );
	REQUIRE( false == response.at( "templated" ) );
	REQUIRE( nlohmann::json::parse(
			R"({"Content-Type":["application/json"]})" ) ==
			response.at( "headers" ) );

	const auto & delays = doc.at( "data" ).at( "globalActions" ).at( "delays" );
	REQUIRE( nlohmann::json::parse( R"([{
			"urlPattern": "www\\.my-test\\.com/api/bookings",
			"delay": 2000,
			"httpMethod": "GET"
		}])" ) == delays );
}

TEST_CASE("scheme any is null") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.my-test.com" );
	svc.get( "/" ).any_body().any_query_params().will_return( success() );

	const auto doc = hoverkit::json::simulation_to_json( svc.simulation() );
	const auto & request = doc.at( "data" ).at( "pairs" )[ 0 ].at( "request" );

	REQUIRE( request.at( "scheme" ).is_null() );
	REQUIRE( request.at( "body" ).is_null() );
	REQUIRE( request.at( "query" ).is_null() );
}

TEST_CASE("dump and parse") {
	using namespace hoverkit::dsl;

	auto bookings = service( "www.my-test.com" );
	bookings.get( "/api/bookings/1" )
			.will_return( success( R"({"id":1})", "application/json" ) )
		.post( "/api/bookings" )
			.body( hoverkit::model::field_matcher_t::json( R"({"flightId":"1"})" ) )
			.will_return( created( "http://localhost/api/bookings/1" ) )
		.and_delay( 1s ).for_method( "POST" );

	auto payments = service( "http://payments.local" );
	payments.any_method( matches( "/v1/*" ) )
			.query_param( "id", any() )
			.will_return( service_unavailable().templated() );

	const auto expected = simulation_source_t::dsl( bookings, payments )
			.simulation();

	const auto text = hoverkit::json::dump_simulation( expected, 4 );
	const auto actual = hoverkit::json::parse_simulation( text );

	REQUIRE( 3u == actual.m_pairs.size() );
	REQUIRE( expected == actual );
}

TEST_CASE("parse document exported by the engine") {
	const auto what = R"({
	"data": {
		"pairs": [
			{
				"request": {
					"path": [ ],
					"method": {"exactMatch": "GET"},
					"destination": {"globMatch": "*.example.com"},
					"scheme": null,
					"query": {"exactMatch": "a=b"},
					"body": {},
					"headers": {"X-Id": ["1", "2"]},
					"requiresState": null
				},
				"response": {
					"status": 204,
					"body": "",
					"encodedBody": false,
					"headers": {},
					"templated": false
				}
			}
		],
		"globalActions": {
			"delays": [],
			"delaysLogNormal": []
		}
	},
	"meta": {
		"schemaVersion": "v2",
		"hoverflyVersion": "v1.0.0",
		"timeExported": "2019-01-01T00:00:00Z"
	}
})"sv;

	// path is an array here.
	REQUIRE_THROWS_AS( hoverkit::json::parse_simulation( what ),
			hoverkit::json::format_exception_t );

	std::string fixed{ what };
	fixed.replace( fixed.find( "[ ]" ), 3u, "{\"exactMatch\": \"/\"}" );

	const auto sim = hoverkit::json::parse_simulation( fixed );
	REQUIRE( 1u == sim.m_pairs.size() );

	const auto & pair = *sim.m_pairs.begin();
	REQUIRE( field_matcher_t::exact( "/" ) == pair.m_request.m_path );
	REQUIRE( field_matcher_t::glob( "*.example.com" ) ==
			pair.m_request.m_destination );
	REQUIRE( pair.m_request.m_scheme.is_any() );
	REQUIRE( pair.m_request.m_body.is_blank() );
	REQUIRE( std::vector< std::string >{ "1", "2" } ==
			pair.m_request.m_headers.at( "X-Id" ) );
	REQUIRE( 204 == pair.m_response.m_status );
	REQUIRE( sim.m_global_actions.m_delays.empty() );
}

TEST_CASE("invalid documents") {
	using hoverkit::json::parse_simulation;
	using hoverkit::json::format_exception_t;

	REQUIRE_THROWS_AS( parse_simulation( "{"sv ), format_exception_t );
	REQUIRE_THROWS_AS( parse_simulation( "[]"sv ), format_exception_t );
	REQUIRE_THROWS_AS( parse_simulation( R"({"meta":{}})"sv ),
			format_exception_t );
	REQUIRE_THROWS_AS( parse_simulation(
			R"({"data":{"pairs":[]},"meta":{"schemaVersion":"v5"}})"sv ),
			format_exception_t );
	REQUIRE_THROWS_AS( parse_simulation(
			R"({"data":{"pairs":[{"request":{}}]}})"sv ),
			format_exception_t );
	REQUIRE_THROWS_AS( parse_simulation(
			R"({"data":{"pairs":[{"request":{},"response":{"status":"OK"}}]}})"sv ),
			format_exception_t );
	REQUIRE_THROWS_AS( parse_simulation(
			R"({"data":{"pairs":[],"globalActions":{"delays":[{"delay":1}]}}})"sv ),
			format_exception_t );

	REQUIRE_NOTHROW( (void)parse_simulation( R"({"data":{}})"sv ) );
}
