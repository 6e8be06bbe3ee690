#include <hoverkit/config.hpp>

#include <hoverkit/dsl/simulation_source.hpp>
#include <hoverkit/launcher/pub.hpp>

#include <hoverkit/utils/ensure_successful_syscall.hpp>
#include <hoverkit/utils/load_file_into_memory.hpp>
#include <hoverkit/utils/spdlog_log_levels.hpp>

#include <hoverkit/logging/wrap_logging.hpp>

#include <hoverkit/nothrow_block/macros.hpp>

#include <signal.h>
#include <string.h>

#include <array>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <args/args.hxx>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>

#include <fmt/format.h>

namespace {

const char version_string[] =
R"ver(hoverkit v.0.1.0
[runs Hoverfly-compatible engine with a simulation]
)ver";

[[nodiscard]]
spdlog::level::level_enum
level_from_cmd_line( const std::string & name )
{
	const auto r = hoverkit::utils::name_to_spdlog_level_enum( name );
	if( !r )
		throw std::runtime_error( "Unsupported log-level: " + name );

	return *r;
}

[[nodiscard]]
hoverkit::launcher::engine_mode_t
mode_from_cmd_line( const std::string & name )
{
	using hoverkit::launcher::engine_mode_t;

	for( const auto m : { engine_mode_t::simulate, engine_mode_t::capture } )
		if( name == hoverkit::launcher::to_string( m ) )
			return m;

	throw std::runtime_error( "invalid value of --mode: " + name );
}

const std::string stdout_log_target = "stdout";
const std::string stderr_log_target = "stderr";

//
// log_destinations_t
//
/*!
 * @brief Places where log messages go.
 *
 * There can be at most one destination of every kind.
 */
struct log_destinations_t
{
	std::optional< std::string > m_console;
	std::optional< std::string > m_syslog_ident;
	std::optional< std::string > m_file;

	//! Handles a value of `--log-target`.
	/*!
	 * `stdout`/`stderr` mean the console, `@ident` means syslog,
	 * anything else is a file name.
	 */
	void
	add( const std::string & target )
	{
		if( stdout_log_target == target || stderr_log_target == target )
			store( m_console, "console", target );
		else if( !target.empty() && '@' == target.front() )
		{
			if( 1u == target.size() )
				throw std::runtime_error( "syslog ident is missing in: " + target );
			store( m_syslog_ident, "syslog", target.substr( 1u ) );
		}
		else
			store( m_file, "file", target );
	}

	[[nodiscard]]
	bool
	empty() const noexcept
	{
		return !m_console && !m_syslog_ident && !m_file;
	}

private:
	static void
	store(
		std::optional< std::string > & to,
		const char * kind,
		const std::string & value )
	{
		if( to )
			throw std::runtime_error( fmt::format(
					"{} log-target is specified twice: {} and {}",
					kind, *to, value ) );
		to = value;
	}
};

//
// cmd_line_args_t
//

//! Command-line arguments.
struct cmd_line_args_t
{
	log_destinations_t m_log_destinations;

	//! Log level from the command line.
	/*!
	 * The level from the config is used if it isn't specified.
	 */
	std::optional< spdlog::level::level_enum > m_log_level;
	spdlog::level::level_enum m_log_flush_level{ spdlog::level::err };
	std::size_t m_log_file_size{ 10ull*1024u*1024u };
	std::size_t m_log_file_count{ 3u };

	std::filesystem::path m_config_path;

	hoverkit::launcher::engine_mode_t m_mode{
			hoverkit::launcher::engine_mode_t::simulate
		};

	//! Simulation to be imported after the start.
	std::optional< std::filesystem::path > m_simulation_path;

	//! File for the simulation exported before the shutdown.
	std::optional< std::filesystem::path > m_export_path;
};

//
// finish_app_ex_t
//

//! An exception that tells that the application has to be finished.
class finish_app_ex_t : public std::runtime_error {

	int m_exit_code;

public:
	finish_app_ex_t(
		const char * what_arg,
		int exit_code )
	:	std::runtime_error{ what_arg }
	,	m_exit_code{ exit_code }
	{
	}

	int
	exit_code() const noexcept { return m_exit_code; }
};

//
// parse_cmd_line
//

/*!
 * Returns values of command-line args or throws finish_app_ex_t
 * if the application has nothing more to do.
 */
[[nodiscard]]
cmd_line_args_t
parse_cmd_line( int argc, char ** argv )
{
	cmd_line_args_t result;

	args::ArgumentParser parser(
			"hoverkit",
			"Runs an engine with the config and waits for a signal." );

	args::HelpFlag help( parser, "help", "Display this help text",
			{ 'h', "help" } );
	args::Flag version( parser, "version", "Show version number",
			{ 'v', "version" } );

	args::Group engine_group( parser, "Engine:" );

	args::ValueFlag< std::string > config_path( engine_group,
			"path", "Config file [required]",
			{ 'c', "config" } );
	args::ValueFlag< std::string > mode( engine_group,
			"simulate|capture", "Mode of the engine (default: simulate)",
			{ "mode" } );
	args::ValueFlag< std::string > simulation_path( engine_group,
			"path", "JSON file with a simulation to be imported",
			{ "simulation" } );
	args::ValueFlag< std::string > export_path( engine_group,
			"path", "JSON file for the simulation exported on shutdown",
			{ "export" } );

	args::Group logging_group( parser, "Logging:" );

	args::ValueFlagList< std::string > log_target( logging_group,
			"name",
			fmt::format( "'{}', '{}', '@ident' for syslog or a file name "
					"(default: {})",
					stdout_log_target, stderr_log_target, stdout_log_target ),
			{ "log-target" } );
	args::ValueFlag< std::string > log_level( logging_group,
			"level", "Logging level, 'off' turns logging off "
			"(default: log_level from the config)",
			{ 'l', "log-level" } );
	args::ValueFlag< std::string > log_flush_level( logging_group,
			"level",
			fmt::format( "Flush level (default: {})",
					spdlog::level::to_string_view( result.m_log_flush_level ) ),
			{ 'f', "log-flush-level" } );
	args::ValueFlag< std::size_t > log_file_size( logging_group,
			"bytes",
			fmt::format( "Maximum size of a log file (default: {})",
					result.m_log_file_size ),
			{ "log-file-size" } );
	args::ValueFlag< std::size_t > log_file_count( logging_group,
			"count",
			fmt::format( "Number of log files in rotation, at least 2 "
					"(default: {})",
					result.m_log_file_count ),
			{ "log-file-count" } );

	try
	{
		parser.ParseCLI( argc, argv );
	}
	catch( const args::Help & )
	{
		std::cout << parser;
		throw finish_app_ex_t( "cmd-line-help", 1 );
	}
	catch( const args::Error & e )
	{
		std::cerr << e.what() << std::endl << parser;
		throw finish_app_ex_t( "cmd-line-parse-error", 2 );
	}

	if( version )
	{
		std::cout << version_string << std::endl;
		throw finish_app_ex_t( "show-version-only", 0 );
	}

	for( const auto & nm : args::get( log_target ) )
		result.m_log_destinations.add( nm );

	if( log_level )
		result.m_log_level = level_from_cmd_line( args::get( log_level ) );
	if( log_flush_level )
		result.m_log_flush_level = level_from_cmd_line(
				args::get( log_flush_level ) );
	if( log_file_size )
	{
		result.m_log_file_size = args::get( log_file_size );
		if( 0u == result.m_log_file_size )
			throw std::runtime_error( "zero can't be used as log-file-size" );
	}
	if( log_file_count )
	{
		result.m_log_file_count = args::get( log_file_count );
		if( 2u > result.m_log_file_count )
			throw std::runtime_error( "log-file-count should be at least 2" );
	}

	if( !config_path )
		throw std::runtime_error( "param --config is absent" );
	result.m_config_path = args::get( config_path );
	if( mode )
		result.m_mode = mode_from_cmd_line( args::get( mode ) );
	if( simulation_path )
		result.m_simulation_path = args::get( simulation_path );
	if( export_path )
		result.m_export_path = args::get( export_path );

	return result;
}

//
// Signals that finish the application.
//
// SIGCHLD is here because the only child is the engine.
//
const std::array<int, 6> signals_to_wait{
	SIGINT, SIGHUP, SIGQUIT, SIGTERM, SIGPIPE, SIGCHLD
};

[[nodiscard]]
sigset_t
make_sigset()
{
	sigset_t result;
	sigemptyset( &result );
	for( auto s : signals_to_wait )
		::hoverkit::utils::ensure_successful_syscall(
				sigaddset( &result, s ),
				"make_sigset.sigaddset()" );

	return result;
}

// Must be called before the start of any threads.
void
block_signals()
{
	const auto sigset = make_sigset();
	::hoverkit::utils::ensure_successful_syscall(
			sigprocmask( SIG_BLOCK, &sigset, nullptr ),
			"block_signals.sigprocmask()" );
}

void
wait_for_shutdown_signal()
{
	const auto sigset = make_sigset();

	for(;;)
	{
		int signal{};
		if( const int rc = sigwait( &sigset, &signal ); 0 != rc )
			throw std::runtime_error( "sigwait failed: " +
					std::system_category().message( rc ) );

		if( SIGPIPE == signal )
			continue;

		if( SIGCHLD == signal )
			::hoverkit::logging::direct_mode::warn(
				[]( auto & logger, auto level ) {
					logger.log( level, "the engine has finished unexpectedly" );
				} );
		else
			::hoverkit::logging::direct_mode::info(
				[signal]( auto & logger, auto level ) {
					logger.log( level, "{} received, shutting down",
							::strsignal( signal ) );
				} );

		return;
	}
}

[[nodiscard]]
std::shared_ptr<spdlog::logger>
make_logger( const cmd_line_args_t & args )
{
	const auto & dest = args.m_log_destinations;

	std::vector< spdlog::sink_ptr > sinks;

	if( dest.m_console && stderr_log_target == *dest.m_console )
		sinks.push_back(
				std::make_shared< spdlog::sinks::stderr_color_sink_mt >() );
	else if( dest.m_console || dest.empty() )
		sinks.push_back(
				std::make_shared< spdlog::sinks::stdout_color_sink_mt >() );

	if( dest.m_syslog_ident )
	{
		const int syslog_option = 0;
		const int syslog_facility = 1; // user-level messages.
		sinks.push_back(
				std::make_shared< spdlog::sinks::syslog_sink_mt >(
						*dest.m_syslog_ident,
						syslog_option, syslog_facility,
						true ) );
	}

	if( dest.m_file )
		sinks.push_back(
				std::make_shared< spdlog::sinks::rotating_file_sink_mt >(
						*dest.m_file,
						args.m_log_file_size,
						args.m_log_file_count ) );

	auto logger = std::make_shared< spdlog::logger >(
			"hoverkit", sinks.begin(), sinks.end() );
	logger->set_level( args.m_log_level.value_or( spdlog::level::info ) );
	logger->flush_on( args.m_log_flush_level );

	return logger;
}

void
run_engine(
	const cmd_line_args_t & args,
	hoverkit::config_t config )
{
	hoverkit::launcher::hoverfly_t hoverfly{
			std::move(config), args.m_mode };

	hoverfly.start();

	if( args.m_simulation_path )
		hoverfly.import_simulation(
				hoverkit::dsl::simulation_source_t::file(
						*args.m_simulation_path ) );

	::hoverkit::logging::direct_mode::info(
		[&]( auto & logger, auto level ) {
			logger.log( level, "engine is running in {} mode, "
					"proxy port: {}, admin port: {}",
					hoverkit::launcher::to_string( hoverfly.mode() ),
					hoverfly.proxy_port(),
					hoverfly.admin_port() );
		} );

	wait_for_shutdown_signal();

	if( args.m_export_path )
	{
		HOVERKIT_NOTHROW_BLOCK_BEGIN()
			HOVERKIT_NOTHROW_BLOCK_STAGE(export_simulation)
			hoverfly.export_simulation( *args.m_export_path );
		HOVERKIT_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
	}

	hoverfly.close();
}

} /* anonymous namespace */

int
main(int argc, char ** argv)
{
	try
	{
		const auto args = parse_cmd_line( argc, argv );

		auto logger = make_logger( args );
		hoverkit::logging::logger_holder_t log_holder{ logger };

		const auto config = hoverkit::config_parser_t{}.parse(
				hoverkit::utils::load_file_into_memory( args.m_config_path ) );
		if( !args.m_log_level )
			logger->set_level( config.m_log_level );

		block_signals();

		run_engine( args, config );
	}
	catch( const finish_app_ex_t & need_finish )
	{
		return need_finish.exit_code();
	}
	catch( const std::exception & ex )
	{
		std::cerr << "*** Exception caught: " << ex.what() << std::endl;
		return 2;
	}

	return 0;
}
