/*!
 * @file
 * @brief Matchers for plain text values used in the DSL.
 */

#include <hoverkit/dsl/text_matcher.hpp>

#include <fmt/format.h>

namespace hoverkit::dsl
{

//
// text_matcher_t
//
std::string
text_matcher_t::pattern() const
{
	if( m_matcher.is_any() )
		return "*";

	return m_matcher.value();
}

text_matcher_t
matches( std::string pattern )
{
	return text_matcher_t{ model::field_matcher_t::glob( std::move(pattern) ) };
}

text_matcher_t
starts_with( std::string_view prefix )
{
	return matches( fmt::format( "{}*", prefix ) );
}

text_matcher_t
ends_with( std::string_view suffix )
{
	return matches( fmt::format( "*{}", suffix ) );
}

text_matcher_t
contains( std::string_view fragment )
{
	return matches( fmt::format( "*{}*", fragment ) );
}

text_matcher_t
any()
{
	return text_matcher_t{ model::field_matcher_t::any() };
}

} /* namespace hoverkit::dsl */
