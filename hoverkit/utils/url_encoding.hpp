/*!
 * @file
 * @brief Percent-encoding of URL components.
 */

#pragma once

#include <string>
#include <string_view>

namespace hoverkit::utils
{

/*!
 * @brief Encoding in application/x-www-form-urlencoded format.
 *
 * The input is treated as a sequence of UTF-8 bytes. Alphanumeric
 * characters and `.`, `-`, `*`, `_` are left as is, a space is
 * replaced by `+`, all other bytes are replaced by `%XX` (upper case
 * hexadecimal digits).
 */
[[nodiscard]]
std::string
form_encode( std::string_view what );

/*!
 * @brief Encoding of a key or a value of a query string.
 *
 * It's form_encode() where `+` for spaces is replaced by `%20`.
 *
 * @note
 * `*` is not encoded, so glob patterns survive the encoding.
 */
[[nodiscard]]
std::string
query_component_encode( std::string_view what );

} /* namespace hoverkit::utils */
