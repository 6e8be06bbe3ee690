/*!
 * @file
 * @brief Helpers for logging.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace hoverkit
{

namespace logging
{

namespace impl
{

/*!
 * @brief Setup a logger for the whole application.
 *
 * It's assumed that this function is called only once at the
 * beginning of the application. And then @a logger will be used
 * until the finish of the application.
 */
void
setup_logger( std::shared_ptr< spdlog::logger > logger ) noexcept;

/*!
 * @brief Remove the logger previously set via setup_logger.
 *
 * After that call spdlog's default logger is used again.
 */
void
remove_logger() noexcept;

/*!
 * @brief Get access to logger that previously set via setup_logger.
 *
 * If there is no such logger then spdlog's default logger is returned.
 * hoverkit is a library and it can be used without any preliminary
 * setup of logging.
 */
[[nodiscard]]
spdlog::logger &
logger() noexcept;

/*!
 * @brief Check a possibilty to log a message with specified
 * severity level.
 */
[[nodiscard]]
inline bool
should_log( spdlog::level::level_enum level ) noexcept
{
	return logger().should_log( level );
}

} /* namespace impl */

/*!
 * @brief Helper class for setting/removing logger in RAII style.
 *
 * Calls impl::setup_logger() in the constructor, then impl::remove_logger()
 * in the destructor.
 *
 * Usage example:
 * @code
 * int main(int argc, char ** argv)
 * {
 * 	... // Parsing of command-line args.
 * 	hoverkit::logging::logger_holder_t logger_holder{
 * 		spdlog::default_logger()
 * 	};
 * 	... // All remaining actions of the application.
 * }
 * @endcode
 */
class logger_holder_t
{
public:
	logger_holder_t( std::shared_ptr< spdlog::logger > logger ) noexcept
	{
		impl::setup_logger( std::move(logger) );
	}

	~logger_holder_t()
	{
		impl::remove_logger();
	}

	logger_holder_t( const logger_holder_t & ) = delete;
	logger_holder_t &
	operator=( const logger_holder_t & ) = delete;
};

/*!
 * @brief Marker that tells that logging should be performed
 * via the main logger.
 */
struct direct_logging_marker_t {};

/*!
 * @brief A special wrapper around logging-level that tells that
 * logging is performed from wrap_logging helper.
 */
class processed_log_level_t
{
	spdlog::level::level_enum m_level;

public:
	explicit processed_log_level_t(
		spdlog::level::level_enum level )
		:	m_level{ level }
	{}

	[[nodiscard]]
	auto
	value() const noexcept { return m_level; }

	[[nodiscard]]
	operator spdlog::level::level_enum() const noexcept { return value(); }
};

/*!
 * @brief Perform logging via logger object directly.
 *
 * The functor @a action is called only if @a level is enabled
 * for logging.
 *
 * The functor @a action should have the following format:
 * @code
 * void(spdlog::logger &, processed_log_level_t);
 * @endcode
 */
template< typename Logging_Action >
void
wrap_logging(
	direct_logging_marker_t,
	spdlog::level::level_enum level,
	Logging_Action && action )
{
	if( impl::should_log( level ) )
	{
		action( impl::logger(), processed_log_level_t{ level } );
	}
}

/*!
 * @brief Shorthands for logging via the main logger.
 *
 * Usage example:
 * @code
 * hoverkit::logging::direct_mode::warn(
 * 	[&]( auto & logger, auto level ) {
 * 		logger.log( level, "something goes wrong: {}", description );
 * 	} );
 * @endcode
 */
namespace direct_mode
{

#define HOVERKIT_LOGGING_DIRECT_MODE_SHORTHAND(name, level_value) \
template< typename Logging_Action > \
void \
name( Logging_Action && action ) \
{ \
	wrap_logging( \
			direct_logging_marker_t{}, \
			level_value, \
			std::forward< Logging_Action >( action ) ); \
}

HOVERKIT_LOGGING_DIRECT_MODE_SHORTHAND(trace, spdlog::level::trace)
HOVERKIT_LOGGING_DIRECT_MODE_SHORTHAND(debug, spdlog::level::debug)
HOVERKIT_LOGGING_DIRECT_MODE_SHORTHAND(info, spdlog::level::info)
HOVERKIT_LOGGING_DIRECT_MODE_SHORTHAND(warn, spdlog::level::warn)
HOVERKIT_LOGGING_DIRECT_MODE_SHORTHAND(err, spdlog::level::err)
HOVERKIT_LOGGING_DIRECT_MODE_SHORTHAND(critical, spdlog::level::critical)

#undef HOVERKIT_LOGGING_DIRECT_MODE_SHORTHAND

} /* namespace direct_mode */

} /* namespace logging */

inline constexpr logging::direct_logging_marker_t direct_logging_mode;

} /* namespace hoverkit */
