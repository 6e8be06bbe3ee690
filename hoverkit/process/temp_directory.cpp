/*!
 * @file
 * @brief A temporary directory removed in the destructor.
 */

#include <hoverkit/process/temp_directory.hpp>

#include <hoverkit/exception.hpp>

#include <hoverkit/logging/wrap_logging.hpp>
#include <hoverkit/nothrow_block/macros.hpp>

#include <fmt/format.h>

#include <stdlib.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <vector>

namespace hoverkit::process
{

//
// temp_directory_t
//
temp_directory_t::temp_directory_t( std::string_view prefix )
{
	const auto name_template =
			( std::filesystem::temp_directory_path() /
				fmt::format( "{}XXXXXX", prefix ) ).string();

	// mkdtemp modifies its argument.
	std::vector< char > buffer( name_template.begin(), name_template.end() );
	buffer.push_back( '\0' );

	if( !::mkdtemp( buffer.data() ) )
		throw exception_t{
				fmt::format( "unable to create temporary directory '{}': {}",
						name_template,
						std::system_category().message( errno ) )
			};

	m_path = std::filesystem::path{ buffer.data() };
}

temp_directory_t::~temp_directory_t()
{
	HOVERKIT_NOTHROW_BLOCK_BEGIN()
		HOVERKIT_NOTHROW_BLOCK_STAGE(purge)
		purge();
	HOVERKIT_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
}

std::filesystem::path
temp_directory_t::copy_file( const std::filesystem::path & source )
{
	auto target = m_path / source.filename();

	std::error_code ec;
	std::filesystem::copy_file( source, target,
			std::filesystem::copy_options::overwrite_existing, ec );
	if( ec )
		throw exception_t{
				fmt::format( "unable to copy '{}' to '{}': {}",
						source.string(), target.string(), ec.message() )
			};

	return target;
}

void
temp_directory_t::purge()
{
	if( m_purged )
		return;

	std::error_code ec;
	std::filesystem::remove_all( m_path, ec );
	if( ec )
		throw exception_t{
				fmt::format( "unable to remove '{}': {}",
						m_path.string(), ec.message() )
			};

	m_purged = true;

	logging::direct_mode::debug(
			[this]( auto & logger, auto level ) {
				logger.log( level, "temporary directory '{}' removed",
						m_path.string() );
			} );
}

} /* namespace hoverkit::process */
