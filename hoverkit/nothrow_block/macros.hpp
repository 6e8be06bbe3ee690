/*!
 * @file
 * @brief Macros for nothrow blocks.
 */

#pragma once

#include <hoverkit/logging/wrap_logging.hpp>

#include <exception>

namespace hoverkit::nothrow_block::impl
{

//! Where an exception was suppressed.
struct location_t
{
	const char * m_file;
	int m_line;
	const char * m_function;
	//! Name of the stage. Can be nullptr.
	const char * m_stage;
};

//! Logs an exception suppressed by a nothrow block.
/*!
 * @a description is nullptr for exceptions not derived from std::exception.
 */
inline void
log_suppressed_exception(
	const location_t & where,
	const char * description ) noexcept
{
	try
	{
		::hoverkit::logging::direct_mode::err(
			[&]( auto & logger, auto level ) {
				logger.log( level,
						"{}:{} [{}] unexpected exception at stage '{}' => {}",
						where.m_file, where.m_line, where.m_function,
						where.m_stage ? where.m_stage : "unspecified",
						description ? description : "description not available" );
			} );
	}
	catch( ... ) {} // Nothing can be done if logging fails.
}

} /* namespace hoverkit::nothrow_block::impl */

/*!
 * Starts a new block for catching and suppressing all exceptions.
 *
 * Usage example:
 * @code
 * HOVERKIT_NOTHROW_BLOCK_BEGIN()
 * 	HOVERKIT_NOTHROW_BLOCK_STAGE(remove_files)
 * 	... // Some code inside.
 * HOVERKIT_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
 * @endcode
 */
#define HOVERKIT_NOTHROW_BLOCK_BEGIN() \
{ \
	const char * hoverkit_nothrow_block_stage__ = nullptr; \
	(void)hoverkit_nothrow_block_stage__; \
	try \
	{

//! Names the current stage of the block for the log message.
#define HOVERKIT_NOTHROW_BLOCK_STAGE(stage_name) \
	hoverkit_nothrow_block_stage__ = #stage_name;

#define HOVERKIT_NOTHROW_BLOCK_LOCATION__() \
	::hoverkit::nothrow_block::impl::location_t{ \
		__FILE__, __LINE__, __PRETTY_FUNCTION__, hoverkit_nothrow_block_stage__ }

#define HOVERKIT_NOTHROW_BLOCK_END_STATEMENT_LOG_THEN_IGNORE() \
} \
catch( const std::exception & x ) \
{ \
	::hoverkit::nothrow_block::impl::log_suppressed_exception( \
			HOVERKIT_NOTHROW_BLOCK_LOCATION__(), x.what() ); \
} \
catch( ... ) \
{ \
	::hoverkit::nothrow_block::impl::log_suppressed_exception( \
			HOVERKIT_NOTHROW_BLOCK_LOCATION__(), nullptr ); \
}

/*!
 * Finishes block started by HOVERKIT_NOTHROW_BLOCK_BEGIN.
 *
 * Only LOG_THEN_IGNORE is supported as @a action.
 */
#define HOVERKIT_NOTHROW_BLOCK_END(action) \
	HOVERKIT_NOTHROW_BLOCK_END_STATEMENT_##action() \
}
