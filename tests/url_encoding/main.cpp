#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <hoverkit/utils/url_encoding.hpp>
#include <hoverkit/utils/glob_match.hpp>
#include <hoverkit/utils/regex_escape.hpp>

#include <regex>

using namespace std::string_view_literals;

TEST_CASE("form_encode") {
	using hoverkit::utils::form_encode;

	REQUIRE( "abcXYZ019.-*_" == form_encode( "abcXYZ019.-*_"sv ) );
	REQUIRE( "a+b" == form_encode( "a b"sv ) );
	REQUIRE( "a%2Bb" == form_encode( "a+b"sv ) );
	REQUIRE( "%2Fpath%3Fx%3D1%26y" == form_encode( "/path?x=1&y"sv ) );
	REQUIRE( "%D0%96" == form_encode( "\xD0\x96"sv ) );
	REQUIRE( form_encode( ""sv ).empty() );
}

TEST_CASE("query_component_encode") {
	using hoverkit::utils::query_component_encode;

	REQUIRE( "John%20Smith" == query_component_encode( "John Smith"sv ) );
	REQUIRE( "1%2B1" == query_component_encode( "1+1"sv ) );
	REQUIRE( "*" == query_component_encode( "*"sv ) );
	REQUIRE( "a%7Eb" == query_component_encode( "a~b"sv ) );
}

TEST_CASE("query_component_encode differs from form_encode only in spaces") {
	using hoverkit::utils::form_encode;
	using hoverkit::utils::query_component_encode;

	REQUIRE( "a+b%2Bc" == form_encode( "a b+c"sv ) );
	REQUIRE( "a%20b%2Bc" == query_component_encode( "a b+c"sv ) );

	REQUIRE( form_encode( "/api?x=1&y=\xD0\x96"sv ) ==
			query_component_encode( "/api?x=1&y=\xD0\x96"sv ) );
	REQUIRE( "%20%20" == query_component_encode( "  "sv ) );
}

TEST_CASE("glob_match") {
	using hoverkit::utils::glob_match;

	REQUIRE( glob_match( ""sv, ""sv ) );
	REQUIRE( !glob_match( ""sv, "a"sv ) );
	REQUIRE( glob_match( "*"sv, ""sv ) );
	REQUIRE( glob_match( "*"sv, "anything"sv ) );
	REQUIRE( glob_match( "abc"sv, "abc"sv ) );
	REQUIRE( !glob_match( "abc"sv, "abcd"sv ) );
	REQUIRE( glob_match( "a*c"sv, "ac"sv ) );
	REQUIRE( glob_match( "a*c"sv, "abbbc"sv ) );
	REQUIRE( !glob_match( "a*c"sv, "abbbd"sv ) );
	REQUIRE( glob_match( "*b*"sv, "abc"sv ) );
	REQUIRE( glob_match( "a*b*c"sv, "aXbYbZc"sv ) );
	REQUIRE( !glob_match( "a*b*c"sv, "aXcYb"sv ) );
	REQUIRE( glob_match( "**"sv, "x"sv ) );

	// There are no other metacharacters.
	REQUIRE( glob_match( "a?c"sv, "a?c"sv ) );
	REQUIRE( !glob_match( "a?c"sv, "abc"sv ) );
}

TEST_CASE("regex_escape") {
	using hoverkit::utils::regex_escape;

	REQUIRE( "api\\.example\\.com/a" == regex_escape( "api.example.com/a"sv ) );
	REQUIRE( "\\(\\)\\[\\]\\{\\}\\*\\+\\?\\^\\$\\|\\\\" ==
			regex_escape( "()[]{}*+?^$|\\"sv ) );

	const std::string tricky{ "a.b*c(d)[e]?f+g^h$i|j\\k{1}" };
	const std::regex re{ regex_escape( tricky ) };
	REQUIRE( std::regex_match( tricky, re ) );
	REQUIRE( !std::regex_match( std::string{ "aXb*c(d)[e]?f+g^h$i|j\\k{1}" }, re ) );
}
