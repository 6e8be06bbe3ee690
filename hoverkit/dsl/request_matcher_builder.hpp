/*!
 * @file
 * @brief Builder for a description of a request to be matched.
 */

#pragma once

#include <hoverkit/dsl/http_body.hpp>
#include <hoverkit/dsl/query_params.hpp>
#include <hoverkit/dsl/response_builder.hpp>
#include <hoverkit/dsl/text_matcher.hpp>

#include <hoverkit/model/request.hpp>

#include <fmt/format.h>

#include <string>
#include <type_traits>
#include <utility>

namespace hoverkit::dsl
{

class stub_service_builder_t;

//
// request_matcher_builder_t
//
/*!
 * @brief Builder for a request that has the specific method and path.
 *
 * Is created by stub_service_builder_t and holds a reference to it.
 * The final request/response pair is registered in the owner by
 * will_return().
 *
 * @attention
 * The owner must outlive the builder. It's guaranteed when the whole
 * chain is written in a single expression.
 */
class request_matcher_builder_t
{
public:
	request_matcher_builder_t(
		stub_service_builder_t & owner,
		model::field_matcher_t method,
		model::field_matcher_t scheme,
		model::field_matcher_t destination,
		model::field_matcher_t path );

	//! Expect the exact body.
	request_matcher_builder_t &
	body( std::string value );

	//! Expect the exact body produced from structured data.
	request_matcher_builder_t &
	body( const http_body_t & value );

	//! Expect a body that conforms to a custom matcher.
	/*!
	 * Usage example:
	 * @code
	 * .body( field_matcher_t::json( R"({"id": 1})" ) )
	 * @endcode
	 */
	request_matcher_builder_t &
	body( model::field_matcher_t matcher );

	//! Accept any body.
	request_matcher_builder_t &
	any_body();

	//! Expect a header with the exact value.
	/*!
	 * A subsequent call for the same header replaces the previous value.
	 */
	request_matcher_builder_t &
	header( std::string name, std::string value );

	/*!
	 * @brief Expect a query parameter.
	 *
	 * If @a values is empty then the parameter can have any value.
	 * Otherwise a separate key=value pair is expected for every value.
	 *
	 * If the key or any value isn't an exact matcher then the whole
	 * query string will be matched as a glob pattern.
	 *
	 * Usage example:
	 * @code
	 * .query_param( "tag", "a", "b" )     // tag=a&tag=b
	 * .query_param( "page", 2 )           // page=2
	 * .query_param( "page", any() )       // page=*
	 * .query_param( starts_with( "utm" ) )
	 * @endcode
	 */
	template< typename... Values >
	request_matcher_builder_t &
	query_param( text_matcher_t key, Values &&... values )
	{
		if constexpr( 0u == sizeof...(values) )
			add_query_param( std::move(key), any() );
		else
			( add_query_param( key,
					make_query_value( std::forward<Values>(values) ) ), ... );

		return *this;
	}

	//! Accept any query string.
	/*!
	 * Query parameters added before this call are discarded. Query
	 * parameters added after this call replace `any` matcher for the query.
	 */
	request_matcher_builder_t &
	any_query_params();

	//! Bind the request to a response and register the pair in the owner.
	/*!
	 * If @a response has a delay then delay settings for the request
	 * are registered in the owner too.
	 *
	 * @return reference to the owner for chaining of the next request.
	 */
	stub_service_builder_t &
	will_return( const response_builder_t & response );

	//! Make the request description.
	/*!
	 * Query parameters are encoded into the query matcher at this point.
	 */
	[[nodiscard]]
	model::request_t
	build() const;

private:
	stub_service_builder_t & m_owner;

	model::request_t m_request;

	query_params_t m_query_params;
	//! Has a fuzzy key or value been added to m_query_params?
	bool m_fuzzy_query{ false };

	//! Numbers are turned into their text representation.
	template< typename Value >
	[[nodiscard]]
	static text_matcher_t
	make_query_value( Value && value )
	{
		if constexpr( std::is_arithmetic_v< std::decay_t< Value > > )
			return text_matcher_t{ fmt::to_string( value ) };
		else
			return text_matcher_t{ std::forward<Value>(value) };
	}

	void
	add_query_param( text_matcher_t key, text_matcher_t value );
};

} /* namespace hoverkit::dsl */
