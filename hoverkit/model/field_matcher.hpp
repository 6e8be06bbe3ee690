/*!
 * @file
 * @brief A matching rule for a single field of HTTP-request.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>

namespace hoverkit::model
{

//
// matcher_kind_t
//
//! Kinds of matching rules supported by the simulation engine.
enum class matcher_kind_t
{
	//! No constraint supplied. An empty or absent value satisfies it.
	blank,
	//! Any value, including the absence of the value, satisfies it.
	any,
	//! Literal equality.
	exact,
	//! Glob pattern where `*` means zero or more arbitrary characters.
	glob,
	//! Regular expression.
	regex,
	//! Structural equality of JSON documents.
	json
};

//! Name of the kind for diagnostic messages.
[[nodiscard]]
const char *
to_string( matcher_kind_t kind ) noexcept;

std::ostream &
operator<<( std::ostream & to, matcher_kind_t kind );

namespace matchers
{

struct blank_t
{
	[[nodiscard]]
	bool
	operator==( const blank_t & ) const noexcept { return true; }

	[[nodiscard]]
	bool
	operator<( const blank_t & ) const noexcept { return false; }
};

struct any_t
{
	[[nodiscard]]
	bool
	operator==( const any_t & ) const noexcept { return true; }

	[[nodiscard]]
	bool
	operator<( const any_t & ) const noexcept { return false; }
};

//! Helper for kinds that hold one string value.
/*!
 * The Tag parameter is used only to make distinct types.
 */
template< typename Tag >
struct valued_matcher_t
{
	std::string m_value;

	[[nodiscard]]
	bool
	operator==( const valued_matcher_t & o ) const noexcept
	{
		return m_value == o.m_value;
	}

	[[nodiscard]]
	bool
	operator<( const valued_matcher_t & o ) const noexcept
	{
		return m_value < o.m_value;
	}
};

using exact_t = valued_matcher_t< struct exact_tag >;
using glob_t = valued_matcher_t< struct glob_tag >;
using regex_t = valued_matcher_t< struct regex_tag >;
using json_t = valued_matcher_t< struct json_tag >;

} /* namespace matchers */

//
// field_matcher_t
//
/*!
 * @brief A matching rule for one field of HTTP-request.
 *
 * It's a value type. Two instances are equal if they have the same kind
 * and the same value.
 *
 * Instances are created by factory methods:
 * @code
 * auto m1 = field_matcher_t::exact( "/api/bookings" );
 * auto m2 = field_matcher_t::glob( "/api/bookings/*" );
 * auto m3 = field_matcher_t::any();
 * @endcode
 */
class field_matcher_t
{
public:
	//! Type of the actual matching rule.
	/*!
	 * @attention
	 * The order of alternatives must correspond to the order of
	 * values in matcher_kind_t.
	 */
	using rule_t = std::variant<
			matchers::blank_t,
			matchers::any_t,
			matchers::exact_t,
			matchers::glob_t,
			matchers::regex_t,
			matchers::json_t >;

	//! The default matcher is the blank one.
	field_matcher_t() = default;

	[[nodiscard]]
	static field_matcher_t
	blank() { return field_matcher_t{ matchers::blank_t{} }; }

	[[nodiscard]]
	static field_matcher_t
	any() { return field_matcher_t{ matchers::any_t{} }; }

	[[nodiscard]]
	static field_matcher_t
	exact( std::string value )
	{
		return field_matcher_t{ matchers::exact_t{ std::move(value) } };
	}

	[[nodiscard]]
	static field_matcher_t
	glob( std::string pattern )
	{
		return field_matcher_t{ matchers::glob_t{ std::move(pattern) } };
	}

	[[nodiscard]]
	static field_matcher_t
	regex( std::string pattern )
	{
		return field_matcher_t{ matchers::regex_t{ std::move(pattern) } };
	}

	[[nodiscard]]
	static field_matcher_t
	json( std::string document )
	{
		return field_matcher_t{ matchers::json_t{ std::move(document) } };
	}

	[[nodiscard]]
	matcher_kind_t
	kind() const noexcept
	{
		return static_cast< matcher_kind_t >( m_rule.index() );
	}

	//! The value of the rule.
	/*!
	 * Empty string is returned for blank and any.
	 */
	[[nodiscard]]
	const std::string &
	value() const noexcept;

	[[nodiscard]]
	const rule_t &
	rule() const noexcept { return m_rule; }

	[[nodiscard]]
	bool
	is_exact() const noexcept { return matcher_kind_t::exact == kind(); }

	[[nodiscard]]
	bool
	is_any() const noexcept { return matcher_kind_t::any == kind(); }

	[[nodiscard]]
	bool
	is_blank() const noexcept { return matcher_kind_t::blank == kind(); }

	//! Is it a fuzzy rule (any rule but the exact one)?
	[[nodiscard]]
	bool
	is_fuzzy() const noexcept { return !is_exact(); }

	//! Evaluate the rule for a value of request's field.
	/*!
	 * An empty @a value is used for an absent field.
	 *
	 * Invalid regular expressions and invalid JSON documents never match.
	 */
	[[nodiscard]]
	bool
	matches( std::string_view value ) const;

	[[nodiscard]]
	friend bool
	operator==( const field_matcher_t & a, const field_matcher_t & b ) noexcept
	{
		return a.m_rule == b.m_rule;
	}

	[[nodiscard]]
	friend bool
	operator!=( const field_matcher_t & a, const field_matcher_t & b ) noexcept
	{
		return !( a == b );
	}

	[[nodiscard]]
	friend bool
	operator<( const field_matcher_t & a, const field_matcher_t & b ) noexcept
	{
		return a.m_rule < b.m_rule;
	}

private:
	explicit field_matcher_t( rule_t rule )
		:	m_rule{ std::move(rule) }
	{}

	rule_t m_rule;
};

// For debugging purposes only.
std::ostream &
operator<<( std::ostream & to, const field_matcher_t & matcher );

} /* namespace hoverkit::model */
