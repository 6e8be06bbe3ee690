/*!
 * @file
 * @brief Helpers for working with spdlog's severity levels.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string_view>
#include <utility>

namespace hoverkit::utils
{

//! Conversion of a level name from the config or the command line.
/*!
 * Accepted names are: trace, debug, info, warn, error, crit, off.
 */
[[nodiscard]]
inline std::optional< spdlog::level::level_enum >
name_to_spdlog_level_enum( std::string_view name ) noexcept
{
	using namespace spdlog::level;

	static constexpr std::pair< std::string_view, level_enum > names[]{
		{ "trace", trace },
		{ "debug", debug },
		{ "info", info },
		{ "warn", warn },
		{ "error", err },
		{ "crit", critical },
		{ "off", off }
	};

	for( const auto & [n, level] : names )
		if( n == name )
			return level;

	return std::nullopt;
}

} /* namespace hoverkit::utils */
