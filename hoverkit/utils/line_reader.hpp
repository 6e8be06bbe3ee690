/*!
 * @file
 * @brief A helper class for line-by-line processing of a char array.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>

namespace hoverkit::utils
{

//
// line_reader_t
//
/*!
 * @brief A helper class for line-by-line processing of a config content.
 *
 * Empty lines and lines started with '#' are skipped. Leading spaces
 * of every line are removed. Line numbers are counted from 1.
 *
 * Usage example:
 * @code
 * line_reader_t reader{ content };
 * reader.for_each_line( [&]( const line_reader_t::line_t & line ) {
 * 	std::cout << line.number() << ": " << line.content() << std::endl;
 * } );
 * @endcode
 */
class line_reader_t
{
public:
	//! Type for holding line numbers.
	using line_number_t = std::uint_fast32_t;

	class line_t
	{
		friend class line_reader_t;

		std::string_view m_content;
		line_number_t m_number;

		line_t(
			std::string_view content,
			line_number_t number )
			:	m_content{ content }
			,	m_number{ number }
		{}

	public:
		[[nodiscard]]
		std::string_view
		content() const noexcept { return m_content; }

		[[nodiscard]]
		line_number_t
		number() const noexcept { return m_number; }
	};

	line_reader_t( std::string_view content ) noexcept
		:	m_content{ content }
	{}

	template< typename Handler >
	void
	for_each_line( Handler && handler ) const
	{
		cursor_t cursor{ m_content };

		for(;;)
		{
			const auto r = cursor.next();
			if( !r )
				break;

			handler( line_t{ *r, cursor.m_line_number } );
		}
	}

private:
	[[nodiscard]]
	static constexpr std::string_view
	crlf() noexcept { return { "\r\n" }; }

	[[nodiscard]]
	static constexpr std::string_view
	spaces() noexcept { return { " \t\x0b" }; }

	//! The current position inside the content.
	struct cursor_t
	{
		std::string_view m_rest;
		line_number_t m_line_number{ 1u };

		void
		skip_to_eol() noexcept
		{
			m_rest.remove_prefix(
					std::min( m_rest.find_first_of( crlf() ), m_rest.size() ) );
		}

		void
		skip_eol() noexcept
		{
			++m_line_number;
			// \r\n is counted as a single end-of-line.
			if( m_rest.size() >= 2u && '\r' == m_rest[ 0 ] && '\n' == m_rest[ 1 ] )
				m_rest.remove_prefix( 2u );
			else
				m_rest.remove_prefix( 1u );
		}

		[[nodiscard]]
		std::optional< std::string_view >
		next() noexcept
		{
			while( !m_rest.empty() )
			{
				const auto non_space_pos = m_rest.find_first_not_of( spaces() );
				if( std::string_view::npos == non_space_pos )
				{
					m_rest = std::string_view{};
					break;
				}

				m_rest.remove_prefix( non_space_pos );

				const auto front_ch = m_rest.front();
				if( '#' == front_ch )
					skip_to_eol();
				else if( '\r' == front_ch || '\n' == front_ch )
					skip_eol();
				else
				{
					const auto length = std::min(
							m_rest.find_first_of( crlf() ), m_rest.size() );
					const auto result = m_rest.substr( 0u, length );
					m_rest.remove_prefix( length );
					return result;
				}
			}

			return std::nullopt;
		}
	};

	const std::string_view m_content;
};

} /* namespace hoverkit::utils */
