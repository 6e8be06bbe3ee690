/*!
 * @file
 * @brief A matching rule for a single field of HTTP-request.
 */

#include <hoverkit/model/field_matcher.hpp>

#include <hoverkit/utils/glob_match.hpp>
#include <hoverkit/utils/overloaded.hpp>

#include <nlohmann/json.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>
#include <regex>

namespace hoverkit::model
{

namespace
{

[[nodiscard]]
bool
regex_search( const std::string & pattern, std::string_view value )
{
	try
	{
		const std::regex re{ pattern, std::regex::ECMAScript };
		return std::regex_search( value.begin(), value.end(), re );
	}
	catch( const std::regex_error & )
	{
		return false;
	}
}

[[nodiscard]]
bool
json_equal( const std::string & expected, std::string_view value )
{
	const auto e = nlohmann::json::parse( expected, nullptr, false );
	const auto v = nlohmann::json::parse( value, nullptr, false );

	if( e.is_discarded() || v.is_discarded() )
		return false;

	return e == v;
}

} /* namespace anonymous */

[[nodiscard]]
const char *
to_string( matcher_kind_t kind ) noexcept
{
	const char * r = "unknown";
	switch( kind )
	{
		case matcher_kind_t::blank: r = "blank"; break;
		case matcher_kind_t::any: r = "any"; break;
		case matcher_kind_t::exact: r = "exact"; break;
		case matcher_kind_t::glob: r = "glob"; break;
		case matcher_kind_t::regex: r = "regex"; break;
		case matcher_kind_t::json: r = "json"; break;
	}
	return r;
}

std::ostream &
operator<<( std::ostream & to, matcher_kind_t kind )
{
	return (to << to_string( kind ));
}

//
// field_matcher_t
//
const std::string &
field_matcher_t::value() const noexcept
{
	static const std::string empty_value;

	return std::visit( utils::overloaded{
			[]( const matchers::blank_t & ) noexcept -> const std::string & {
				return empty_value;
			},
			[]( const matchers::any_t & ) noexcept -> const std::string & {
				return empty_value;
			},
			[]( const auto & r ) noexcept -> const std::string & {
				return r.m_value;
			}
		},
		m_rule );
}

bool
field_matcher_t::matches( std::string_view value ) const
{
	return std::visit( utils::overloaded{
			[value]( const matchers::blank_t & ) {
				return value.empty();
			},
			[]( const matchers::any_t & ) {
				return true;
			},
			[value]( const matchers::exact_t & r ) {
				return value == r.m_value;
			},
			[value]( const matchers::glob_t & r ) {
				return utils::glob_match( r.m_value, value );
			},
			[value]( const matchers::regex_t & r ) {
				return regex_search( r.m_value, value );
			},
			[value]( const matchers::json_t & r ) {
				return json_equal( r.m_value, value );
			}
		},
		m_rule );
}

std::ostream &
operator<<( std::ostream & to, const field_matcher_t & matcher )
{
	if( matcher.is_blank() || matcher.is_any() )
		fmt::print( to, "{}", to_string( matcher.kind() ) );
	else
		fmt::print( to, "{}(\"{}\")",
				to_string( matcher.kind() ), matcher.value() );

	return to;
}

} /* namespace hoverkit::model */
