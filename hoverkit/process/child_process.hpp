/*!
 * @file
 * @brief A child process with redirected output.
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hoverkit::process
{

//
// child_process_t
//
/*!
 * @brief A running child process.
 *
 * The process is started in the constructor. The stdout and stderr
 * of the child are redirected to a log file. If the object is destroyed
 * while the process is alive the process is terminated.
 *
 * The child receives SIGTERM if the parent dies.
 */
class child_process_t
{
public:
	//! Type for a list of command-line arguments.
	using args_container_t = std::vector< std::string >;

	/*!
	 * @param binary name or path of the executable. A name without
	 * slashes is searched in PATH.
	 * @param args command-line arguments without argv[0].
	 * @param log_file file for stdout and stderr of the child.
	 *
	 * @throw hoverkit::exception_t if the process can't be started.
	 */
	child_process_t(
		const std::string & binary,
		const args_container_t & args,
		const std::filesystem::path & log_file );

	~child_process_t();

	child_process_t( const child_process_t & ) = delete;
	child_process_t &
	operator=( const child_process_t & ) = delete;

	[[nodiscard]]
	pid_t
	pid() const noexcept { return m_pid; }

	//! Check that the process is still running.
	/*!
	 * Collects the exit status of the finished process.
	 */
	[[nodiscard]]
	bool
	is_alive();

	//! Exit status of the finished process.
	/*!
	 * It's the exit code for a normal exit and 128+signal for a process
	 * killed by a signal. Empty value if the process is still running.
	 */
	[[nodiscard]]
	std::optional< int >
	exit_status() const noexcept { return m_exit_status; }

	/*!
	 * @brief Stop the process.
	 *
	 * Sends SIGTERM and waits for the exit during @a grace_period.
	 * If the process is still running then it's killed by SIGKILL.
	 *
	 * Does nothing if the process is already finished.
	 */
	void
	terminate( std::chrono::milliseconds grace_period );

private:
	pid_t m_pid{ -1 };
	std::optional< int > m_exit_status;

	//! Handle the status returned by waitpid().
	void
	store_exit_status( int status ) noexcept;
};

} /* namespace hoverkit::process */
