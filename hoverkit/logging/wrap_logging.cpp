/*!
 * @file
 * @brief Helpers for logging.
 */

#include <hoverkit/logging/wrap_logging.hpp>

namespace hoverkit::logging
{

namespace impl
{

static std::shared_ptr< spdlog::logger > g_logger;

void
setup_logger( std::shared_ptr< spdlog::logger > logger ) noexcept
{
	g_logger = std::move(logger);
}

void
remove_logger() noexcept
{
	g_logger = {};
}

[[nodiscard]]
spdlog::logger &
logger() noexcept
{
	// Without an application logger the default one from spdlog is used.
	if( !g_logger )
		return *(spdlog::default_logger_raw());

	return *g_logger;
}

} /* namespace impl */

} /* namespace hoverkit::logging */
