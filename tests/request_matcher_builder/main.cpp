#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <hoverkit/dsl/pub.hpp>

using namespace std::string_literals;

namespace
{

using hoverkit::model::field_matcher_t;
using hoverkit::model::matcher_kind_t;

} /* namespace anonymous */

TEST_CASE("literal fields are exact") {
	using namespace hoverkit::dsl;

	auto svc = service( "https://api.example.com" );
	const auto req = svc.post( "/api/bookings" ).build();

	REQUIRE( field_matcher_t::exact( "POST" ) == req.m_method );
	REQUIRE( field_matcher_t::exact( "https" ) == req.m_scheme );
	REQUIRE( field_matcher_t::exact( "api.example.com" ) == req.m_destination );
	REQUIRE( field_matcher_t::exact( "/api/bookings" ) == req.m_path );

	REQUIRE( req.m_query.is_blank() );
	REQUIRE( req.m_body.is_blank() );
	REQUIRE( req.m_headers.empty() );
}

TEST_CASE("methods") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	REQUIRE( field_matcher_t::exact( "GET" ) == svc.get( "/" ).build().m_method );
	REQUIRE( field_matcher_t::exact( "PUT" ) == svc.put( "/" ).build().m_method );
	REQUIRE( field_matcher_t::exact( "POST" ) == svc.post( "/" ).build().m_method );
	REQUIRE( field_matcher_t::exact( "DELETE" ) ==
			svc.delete_( "/" ).build().m_method );
	REQUIRE( field_matcher_t::exact( "PATCH" ) ==
			svc.patch( "/" ).build().m_method );
	REQUIRE( svc.any_method( "/" ).build().m_method.is_any() );
}

TEST_CASE("path matchers") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	REQUIRE( field_matcher_t::glob( "/api/*" ) ==
			svc.get( matches( "/api/*" ) ).build().m_path );
	REQUIRE( field_matcher_t::glob( "/api/*" ) ==
			svc.get( starts_with( "/api/" ) ).build().m_path );
	REQUIRE( field_matcher_t::glob( "*.json" ) ==
			svc.get( ends_with( ".json" ) ).build().m_path );
	REQUIRE( field_matcher_t::glob( "*bookings*" ) ==
			svc.get( contains( "bookings" ) ).build().m_path );
	REQUIRE( svc.get( any() ).build().m_path.is_any() );
	REQUIRE( field_matcher_t::exact( "/x" ) ==
			svc.get( equals_to( "/x" ) ).build().m_path );
	REQUIRE( field_matcher_t::exact( "/y" ) ==
			svc.get( "/y"s ).build().m_path );
}

TEST_CASE("literal query is exact") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	{
		const auto req = svc.get( "/api/bookings" )
				.query_param( "tag", "a", "b" )
				.build();
		REQUIRE( field_matcher_t::exact( "tag=a&tag=b" ) == req.m_query );
	}

	{
		const auto req = svc.get( "/api/bookings" )
				.query_param( "page", "1" )
				.query_param( "size", "20" )
				.query_param( "page", "2" )
				.build();
		// Values are grouped under the first occurrence of the key.
		REQUIRE( field_matcher_t::exact( "page=1&page=2&size=20" ) ==
				req.m_query );
	}

	{
		const auto req = svc.get( "/search" )
				.query_param( "name", "John Smith" )
				.query_param( "expr", "1+1=2" )
				.build();
		REQUIRE( field_matcher_t::exact( "name=John%20Smith&expr=1%2B1%3D2" ) ==
				req.m_query );
	}
}

TEST_CASE("numeric query values") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	const auto req = svc.get( "/api/bookings" )
			.query_param( "page", 1 )
			.query_param( "ratio", 0.5 )
			.query_param( "id", 7u, -8L )
			.query_param( "size", "20" )
			.build();
	REQUIRE( field_matcher_t::exact( "page=1&ratio=0.5&id=7&id=-8&size=20" ) ==
			req.m_query );
}

TEST_CASE("fuzzy query is glob") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	{
		const auto req = svc.get( "/api/bookings" )
				.query_param( "id", matches( "*" ) )
				.query_param( "page", "1" )
				.build();
		REQUIRE( field_matcher_t::glob( "id=*&page=1" ) == req.m_query );
	}

	{
		// A key without values accepts any value.
		const auto req = svc.get( "/api/bookings" )
				.query_param( "page", "1" )
				.query_param( "token" )
				.build();
		REQUIRE( field_matcher_t::glob( "page=1&token=*" ) == req.m_query );
	}

	{
		const auto req = svc.get( "/api/bookings" )
				.query_param( starts_with( "filter_" ), "on" )
				.build();
		REQUIRE( field_matcher_t::glob( "filter_*=on" ) == req.m_query );
	}

	{
		const auto req = svc.get( "/api/bookings" )
				.query_param( "q", contains( "hot dog" ) )
				.build();
		REQUIRE( field_matcher_t::glob( "q=*hot%20dog*" ) == req.m_query );
	}
}

TEST_CASE("exact matcher objects keep the query exact") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	const auto req = svc.get( "/" )
			.query_param( equals_to( "a" ), equals_to( "b" ) )
			.build();
	REQUIRE( field_matcher_t::exact( "a=b" ) == req.m_query );
}

TEST_CASE("any query params") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	REQUIRE( svc.get( "/" ).any_query_params().build().m_query.is_any() );

	SUBCASE("any_query_params after query_param") {
		const auto req = svc.get( "/" )
				.query_param( "id", matches( "1*" ) )
				.any_query_params()
				.build();
		REQUIRE( req.m_query.is_any() );
	}

	SUBCASE("query_param after any_query_params") {
		const auto req = svc.get( "/" )
				.any_query_params()
				.query_param( "id", "1" )
				.build();
		REQUIRE( field_matcher_t::exact( "id=1" ) == req.m_query );
	}

	SUBCASE("fuzziness is reset by any_query_params") {
		const auto req = svc.get( "/" )
				.query_param( "id", any() )
				.any_query_params()
				.query_param( "page", "3" )
				.build();
		REQUIRE( field_matcher_t::exact( "page=3" ) == req.m_query );
	}
}

TEST_CASE("headers") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	const auto req = svc.get( "/" )
			.header( "Authorization", "Bearer a" )
			.header( "Accept", "application/json" )
			.header( "Authorization", "Bearer b" )
			.build();

	REQUIRE( 2u == req.m_headers.size() );
	REQUIRE( std::vector< std::string >{ "Bearer b" } ==
			req.m_headers.at( "Authorization" ) );
	REQUIRE( std::vector< std::string >{ "application/json" } ==
			req.m_headers.at( "Accept" ) );
}

TEST_CASE("bodies") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	{
		const auto req = svc.post( "/" ).any_body().build();
		REQUIRE( req.m_body.is_any() );
		REQUIRE( field_matcher_t::blank() != req.m_body );
	}

	REQUIRE( field_matcher_t::exact( "hello" ) ==
			svc.post( "/" ).body( "hello" ).build().m_body );

	REQUIRE( field_matcher_t::exact( R"({"id":1})" ) ==
			svc.post( "/" )
				.body( http_body_t::json( nlohmann::json{ { "id", 1 } } ) )
				.build().m_body );

	REQUIRE( field_matcher_t::json( R"({"id":1})" ) ==
			svc.post( "/" )
				.body( field_matcher_t::json( R"({"id":1})" ) )
				.build().m_body );

	// The last call wins.
	REQUIRE( field_matcher_t::exact( "x" ) ==
			svc.post( "/" ).any_body().body( "x" ).build().m_body );
}

TEST_CASE("will_return registers the pair") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	auto & owner = svc.get( "/api/bookings/1" )
			.query_param( "tag", "a" )
			.will_return( success( R"({"id":1})", "application/json" ) );
	REQUIRE( &owner == &svc );

	REQUIRE( 1u == svc.request_response_pairs().size() );
	const auto & pair = *svc.request_response_pairs().begin();
	REQUIRE( field_matcher_t::exact( "tag=a" ) == pair.m_request.m_query );
	REQUIRE( 200 == pair.m_response.m_status );
	REQUIRE( R"({"id":1})" == pair.m_response.m_body );
	REQUIRE( svc.delay_settings().empty() );
}

TEST_CASE("builder can be reused for several responses") {
	using namespace hoverkit::dsl;

	auto svc = service( "www.example.com" );

	auto builder = svc.get( "/a" );
	builder.will_return( success() );
	builder.header( "X-Id", "1" ).will_return( not_found() );

	REQUIRE( 2u == svc.request_response_pairs().size() );
}
