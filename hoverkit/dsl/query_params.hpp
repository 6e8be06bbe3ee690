/*!
 * @file
 * @brief Ordered multimap for query parameters.
 */

#pragma once

#include <hoverkit/dsl/text_matcher.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace hoverkit::dsl
{

//
// query_params_t
//
/*!
 * @brief Container for query parameters with repeated keys.
 *
 * The order of keys is the order of their first insertion. Values
 * under a key are kept in the order of insertion too. This order
 * determines the content of the encoded query string.
 */
class query_params_t
{
public:
	using values_t = std::vector< text_matcher_t >;
	using entry_t = std::pair< text_matcher_t, values_t >;
	using container_t = std::vector< entry_t >;

	void
	add( text_matcher_t key, text_matcher_t value )
	{
		auto it = std::find_if( m_entries.begin(), m_entries.end(),
				[&key]( const entry_t & e ) { return e.first == key; } );
		if( it == m_entries.end() )
			it = m_entries.insert( m_entries.end(),
					entry_t{ std::move(key), values_t{} } );

		it->second.push_back( std::move(value) );
	}

	[[nodiscard]]
	bool
	empty() const noexcept { return m_entries.empty(); }

	void
	clear() noexcept { m_entries.clear(); }

	//! Call @a handler for every (key, value) pair.
	/*!
	 * The handler should have the following format:
	 * @code
	 * void(const text_matcher_t & key, const text_matcher_t & value);
	 * @endcode
	 */
	template< typename Handler >
	void
	for_each( Handler && handler ) const
	{
		for( const auto & [key, values] : m_entries )
			for( const auto & v : values )
				handler( key, v );
	}

private:
	container_t m_entries;
};

} /* namespace hoverkit::dsl */
