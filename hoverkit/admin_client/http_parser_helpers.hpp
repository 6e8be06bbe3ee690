/*!
 * @file
 * @brief Helpers for binding http_parser callbacks to methods of a class.
 */

#pragma once

#include <hoverkit/nothrow_block/macros.hpp>

#include <nodejs/http_parser/http_parser.h>

#include <utility>

namespace hoverkit::admin_client
{

namespace helpers
{

template<
	typename Handler,
	typename... Args >
[[nodiscard]]
int
wrap_http_parser_callback(
	http_parser * parser,
	int (Handler::*callback)( Args... ),
	Args ...args ) noexcept
{
	auto * handler = reinterpret_cast<Handler *>(parser->data);

	HOVERKIT_NOTHROW_BLOCK_BEGIN()
		return (handler->*callback)( std::forward<Args>(args)... );
	HOVERKIT_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)

	return -1;
}

template< typename T >
struct http_parser_callback_kind_detector;

template< typename Handler >
struct http_parser_callback_kind_detector<
	int (Handler::*)() >
{
	static constexpr bool with_data = false;
};

template< typename Handler >
struct http_parser_callback_kind_detector<
	int (Handler::*)( const char *, std::size_t ) >
{
	static constexpr bool with_data = true;
};

/*!
 * @brief Make a callback for http_parser_settings that calls
 * a method of the object stored in http_parser::data.
 *
 * Exceptions from the method are logged and converted into
 * an error for http_parser.
 */
template< auto Callback >
[[nodiscard]]
auto
make_http_parser_callback() noexcept
{
	using detector = http_parser_callback_kind_detector< decltype(Callback) >;

	if constexpr( detector::with_data )
		return []( http_parser * parser, const char * data, std::size_t size )
			{
				return wrap_http_parser_callback( parser, Callback, data, size );
			};
	else
		return []( http_parser * parser )
			{
				return wrap_http_parser_callback( parser, Callback );
			};
}

} /* namespace helpers */

} /* namespace hoverkit::admin_client */
