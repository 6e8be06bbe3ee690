/*!
 * @file
 * @brief Matchers for plain text values used in the DSL.
 */

#pragma once

#include <hoverkit/model/field_matcher.hpp>

#include <string>
#include <string_view>

namespace hoverkit::dsl
{

//
// text_matcher_t
//
/*!
 * @brief A matcher for a plain text value: a path, a destination,
 * a key or a value of query parameter.
 *
 * A string is implicitly converted into the exact matcher. Other kinds
 * of matchers are created by helper functions:
 * @code
 * using namespace hoverkit::dsl;
 *
 * service( "www.example.com" )
 * 	.get( starts_with( "/api/" ) )
 * 	.query_param( "page", any() )
 * 	...
 * @endcode
 */
class text_matcher_t
{
	friend text_matcher_t matches( std::string pattern );
	friend text_matcher_t any();

	model::field_matcher_t m_matcher;

	explicit text_matcher_t( model::field_matcher_t matcher )
		:	m_matcher{ std::move(matcher) }
	{}

public:
	text_matcher_t( std::string value )
		:	m_matcher{ model::field_matcher_t::exact( std::move(value) ) }
	{}

	text_matcher_t( const char * value )
		:	text_matcher_t{ std::string{ value } }
	{}

	text_matcher_t( std::string_view value )
		:	text_matcher_t{ std::string{ value } }
	{}

	//! The matcher to be placed into a request description.
	[[nodiscard]]
	const model::field_matcher_t &
	field_matcher() const noexcept { return m_matcher; }

	//! The pattern used in the encoded query string.
	/*!
	 * It's the value for exact matcher, the pattern for glob matcher and
	 * `*` for any matcher.
	 */
	[[nodiscard]]
	std::string
	pattern() const;

	[[nodiscard]]
	bool
	is_fuzzy() const noexcept { return m_matcher.is_fuzzy(); }

	[[nodiscard]]
	friend bool
	operator==( const text_matcher_t & a, const text_matcher_t & b ) noexcept
	{
		return a.m_matcher == b.m_matcher;
	}

	[[nodiscard]]
	friend bool
	operator!=( const text_matcher_t & a, const text_matcher_t & b ) noexcept
	{
		return !( a == b );
	}
};

//! The exact matcher. The same as the implicit conversion from a string.
[[nodiscard]]
inline text_matcher_t
equals_to( std::string value )
{
	return text_matcher_t{ std::move(value) };
}

//! Matcher for a glob pattern where `*` means any sequence of characters.
[[nodiscard]]
text_matcher_t
matches( std::string pattern );

[[nodiscard]]
text_matcher_t
starts_with( std::string_view prefix );

[[nodiscard]]
text_matcher_t
ends_with( std::string_view suffix );

[[nodiscard]]
text_matcher_t
contains( std::string_view fragment );

//! Matcher that accepts any value.
[[nodiscard]]
text_matcher_t
any();

} /* namespace hoverkit::dsl */
