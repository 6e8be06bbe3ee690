/*!
 * @file
 * @brief A child process with redirected output.
 */

#include <hoverkit/process/child_process.hpp>

#include <hoverkit/exception.hpp>

#include <hoverkit/logging/wrap_logging.hpp>
#include <hoverkit/nothrow_block/macros.hpp>
#include <hoverkit/utils/ensure_successful_syscall.hpp>

#include <fmt/format.h>

#include <sys/prctl.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

namespace hoverkit::process
{

namespace
{

//
// fd_holder_t
//
//! Closes a file descriptor in the destructor.
class fd_holder_t
{
	int m_fd;

public:
	explicit fd_holder_t( int fd ) noexcept : m_fd{ fd } {}

	~fd_holder_t()
	{
		if( m_fd >= 0 )
			::close( m_fd );
	}

	fd_holder_t( const fd_holder_t & ) = delete;
	fd_holder_t &
	operator=( const fd_holder_t & ) = delete;

	[[nodiscard]]
	int
	get() const noexcept { return m_fd; }

	void
	close() noexcept
	{
		if( m_fd >= 0 )
		{
			::close( m_fd );
			m_fd = -1;
		}
	}
};

constexpr std::chrono::milliseconds exit_polling_period{ 25 };

/*!
 * @brief Actions performed in the child after fork().
 *
 * Only async-signal-safe functions are used here.
 * The errno of a failed call is written into @a error_pipe.
 */
[[noreturn]]
void
run_child(
	int log_fd,
	int error_pipe,
	char * const * argv ) noexcept
{
	// The signal is sent when the thread that called fork() finishes,
	// not the whole parent process.
	::prctl( PR_SET_PDEATHSIG, SIGTERM );

	// The parent can block some signals, but the child should
	// receive them as usual.
	sigset_t empty_set;
	::sigemptyset( &empty_set );
	::sigprocmask( SIG_SETMASK, &empty_set, nullptr );

	if( -1 != ::dup2( log_fd, STDOUT_FILENO ) &&
			-1 != ::dup2( log_fd, STDERR_FILENO ) )
	{
		::execvp( argv[ 0 ], argv );
	}

	const int error_code = errno;
	[[maybe_unused]] const auto r =
			::write( error_pipe, &error_code, sizeof(error_code) );
	::_exit( 127 );
}

} /* namespace anonymous */

//
// child_process_t
//
child_process_t::child_process_t(
	const std::string & binary,
	const args_container_t & args,
	const std::filesystem::path & log_file )
{
	fd_holder_t log_fd{ ::open( log_file.c_str(),
			O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644 ) };
	utils::ensure_successful_syscall( log_fd.get(),
			fmt::format( "open log file '{}'", log_file.string() ) );

	// Is used for detection of exec failures: the write end is closed
	// by a successful exec.
	int pipe_fds[ 2 ];
	utils::ensure_successful_syscall( ::pipe2( pipe_fds, O_CLOEXEC ),
			"pipe2" );
	fd_holder_t read_end{ pipe_fds[ 0 ] };
	fd_holder_t write_end{ pipe_fds[ 1 ] };

	std::vector< std::string > argv_values;
	argv_values.reserve( args.size() + 1u );
	argv_values.push_back( binary );
	argv_values.insert( argv_values.end(), args.begin(), args.end() );

	std::vector< char * > argv;
	argv.reserve( argv_values.size() + 1u );
	for( auto & v : argv_values )
		argv.push_back( v.data() );
	argv.push_back( nullptr );

	m_pid = ::fork();
	utils::ensure_successful_syscall( m_pid, "fork" );

	if( 0 == m_pid )
		run_child( log_fd.get(), write_end.get(), argv.data() );

	write_end.close();

	int child_errno{};
	ssize_t bytes_read{};
	do
	{
		bytes_read = ::read( read_end.get(), &child_errno, sizeof(child_errno) );
	}
	while( -1 == bytes_read && EINTR == errno );

	if( bytes_read > 0 )
	{
		int status{};
		::waitpid( m_pid, &status, 0 );
		m_pid = -1;

		throw exception_t{
				fmt::format( "unable to start '{}': {}",
						binary, std::system_category().message( child_errno ) )
			};
	}

	logging::direct_mode::debug(
			[&]( auto & logger, auto level ) {
				logger.log( level, "process '{}' started, pid={}, log_file={}",
						binary, m_pid, log_file.string() );
			} );
}

child_process_t::~child_process_t()
{
	HOVERKIT_NOTHROW_BLOCK_BEGIN()
		HOVERKIT_NOTHROW_BLOCK_STAGE(terminate_child)
		terminate( std::chrono::seconds{ 5 } );
	HOVERKIT_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
}

bool
child_process_t::is_alive()
{
	if( m_pid <= 0 || m_exit_status )
		return false;

	int status{};
	const auto r = ::waitpid( m_pid, &status, WNOHANG );
	utils::ensure_successful_syscall( r, "waitpid" );

	if( 0 == r )
		return true;

	store_exit_status( status );
	return false;
}

void
child_process_t::terminate( std::chrono::milliseconds grace_period )
{
	if( !is_alive() )
		return;

	utils::ensure_successful_syscall( ::kill( m_pid, SIGTERM ), "kill(SIGTERM)" );

	const auto deadline = std::chrono::steady_clock::now() + grace_period;
	while( std::chrono::steady_clock::now() < deadline )
	{
		if( !is_alive() )
			return;

		std::this_thread::sleep_for( exit_polling_period );
	}

	if( !is_alive() )
		return;

	logging::direct_mode::warn(
			[this]( auto & logger, auto level ) {
				logger.log( level, "process {} doesn't finish after SIGTERM, "
						"SIGKILL will be used", m_pid );
			} );

	utils::ensure_successful_syscall( ::kill( m_pid, SIGKILL ), "kill(SIGKILL)" );

	int status{};
	pid_t r{};
	do
	{
		r = ::waitpid( m_pid, &status, 0 );
	}
	while( -1 == r && EINTR == errno );
	utils::ensure_successful_syscall( r, "waitpid" );

	store_exit_status( status );
}

void
child_process_t::store_exit_status( int status ) noexcept
{
	if( WIFEXITED( status ) )
		m_exit_status = WEXITSTATUS( status );
	else if( WIFSIGNALED( status ) )
		m_exit_status = 128 + WTERMSIG( status );
	else
		m_exit_status = -1;
}

} /* namespace hoverkit::process */
