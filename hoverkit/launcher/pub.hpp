/*!
 * @file
 * @brief The public interface of the engine launcher.
 */

#pragma once

#include <hoverkit/admin_client/pub.hpp>
#include <hoverkit/config.hpp>
#include <hoverkit/exception.hpp>

#include <hoverkit/dsl/simulation_source.hpp>

#include <hoverkit/model/simulation.hpp>

#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>

namespace hoverkit::process
{

class child_process_t;
class temp_directory_t;

} /* namespace hoverkit::process */

namespace hoverkit::launcher
{

//
// engine_mode_t
//
//! Mode of the engine.
enum class engine_mode_t
{
	//! Responses are produced from the imported simulation.
	simulate,
	//! Requests are forwarded to real services and recorded.
	capture
};

//! Name of the mode used by the admin API.
[[nodiscard]]
const char *
to_string( engine_mode_t mode ) noexcept;

std::ostream &
operator<<( std::ostream & to, engine_mode_t mode );

//
// hoverfly_t
//
/*!
 * @brief An instance of the engine used by tests.
 *
 * A local engine is started as a child process. If the config specifies
 * a remote host then already running engine is used.
 *
 * The engine is stopped and all temporary files are removed in close()
 * or in the destructor.
 *
 * Usage example:
 * @code
 * using namespace hoverkit::dsl;
 *
 * hoverkit::launcher::hoverfly_t hoverfly{
 * 	hoverkit::config_t{}, hoverkit::launcher::engine_mode_t::simulate };
 * hoverfly.start();
 * hoverfly.import_simulation( simulation_source_t::dsl(
 * 	service( "www.my-test.com" )
 * 		.get( "/api/bookings/1" )
 * 		.will_return( success() ) ) );
 * // Requests via the proxy on hoverfly.proxy_port()...
 * @endcode
 *
 * @attention
 * This class isn't thread-safe.
 *
 * @attention
 * A local engine receives SIGTERM when the thread that called start()
 * finishes (see PR_SET_PDEATHSIG). The thread must outlive the engine,
 * so start() shouldn't be called from a short-lived worker thread.
 */
class hoverfly_t
{
public:
	//! Time for the engine to finish after SIGTERM.
	static constexpr std::chrono::milliseconds shutdown_grace_period{ 5'000 };
	//! Period of health-checks during the start.
	static constexpr std::chrono::milliseconds health_polling_period{ 100 };

	/*!
	 * Zero ports in @a config are replaced by free ports (for a local
	 * engine) or by the default ports (for a remote engine).
	 *
	 * @throw hoverkit::exception_t if proxy and admin ports are the same,
	 * or if only one of the SSL certificate and key is specified.
	 */
	hoverfly_t( config_t config, engine_mode_t mode );
	~hoverfly_t();

	hoverfly_t( const hoverfly_t & ) = delete;
	hoverfly_t &
	operator=( const hoverfly_t & ) = delete;

	//! Start the engine and wait until it becomes healthy.
	/*!
	 * A repeated call is ignored with a warning.
	 *
	 * @throw hoverkit::exception_t if ports are busy, the engine can't be
	 * started or doesn't become healthy in time.
	 */
	void
	start();

	//! Stop the engine and remove temporary files.
	/*!
	 * A remote engine isn't stopped.
	 */
	void
	close();

	[[nodiscard]]
	bool
	is_started() const noexcept { return m_started; }

	//! Replace the engine's simulation.
	void
	import_simulation( const dsl::simulation_source_t & source );

	[[nodiscard]]
	model::simulation_t
	get_simulation() const;

	//! Store the current simulation of the engine into a file.
	void
	export_simulation( const std::filesystem::path & file_name ) const;

	//! Remove the simulation from the engine.
	void
	reset();

	[[nodiscard]]
	port_t
	proxy_port() const noexcept { return m_config.m_proxy_port; }

	[[nodiscard]]
	port_t
	admin_port() const noexcept { return m_config.m_admin_port; }

	[[nodiscard]]
	const config_t &
	config() const noexcept { return m_config; }

	[[nodiscard]]
	engine_mode_t
	mode() const noexcept { return m_mode; }

	//! Log file of a local engine.
	/*!
	 * Empty value for a remote engine or if the engine isn't started.
	 */
	[[nodiscard]]
	std::optional< std::filesystem::path >
	log_file() const;

private:
	const config_t m_config;
	const engine_mode_t m_mode;

	const admin_client::client_t m_admin;

	std::unique_ptr< process::temp_directory_t > m_temp_dir;
	std::unique_ptr< process::child_process_t > m_process;

	bool m_started{ false };

	void
	start_local();

	void
	ensure_remote_is_healthy() const;

	void
	wait_for_health();

	void
	ensure_started() const;

	//! Stop the child process and remove the temporary directory.
	void
	release_local_resources();
};

} /* namespace hoverkit::launcher */
