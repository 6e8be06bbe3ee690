/*!
 * @file
 * @brief Implementation of the engine launcher.
 */

#include <hoverkit/launcher/pub.hpp>

#include <hoverkit/json/simulation_json.hpp>
#include <hoverkit/logging/wrap_logging.hpp>
#include <hoverkit/nothrow_block/macros.hpp>
#include <hoverkit/process/child_process.hpp>
#include <hoverkit/process/temp_directory.hpp>

#include <asio.hpp>

#include <fmt/format.h>

#include <fstream>
#include <optional>
#include <ostream>
#include <thread>

namespace hoverkit::launcher
{

namespace
{

const char log_file_name[] = "hoverfly.log";

//
// port_reservation_t
//
/*!
 * @brief An ephemeral loopback port that stays bound while the object lives.
 *
 * Ports that are reserved at the same time are always different.
 */
class port_reservation_t
{
	asio::io_context m_io_ctx;
	asio::ip::tcp::acceptor m_acceptor{ m_io_ctx };

public:
	port_reservation_t()
	{
		asio::error_code ec;
		const asio::ip::tcp::endpoint endpoint{
				asio::ip::address_v4::loopback(), 0u };
		m_acceptor.open( endpoint.protocol(), ec );
		if( !ec )
			m_acceptor.bind( endpoint, ec );
		if( ec )
			throw exception_t{
					fmt::format( "unable to find a free port: {}", ec.message() )
				};
	}

	[[nodiscard]]
	port_t
	port() const { return m_acceptor.local_endpoint().port(); }
};

[[nodiscard]]
bool
is_port_in_use( port_t port )
{
	asio::io_context io_ctx;
	asio::ip::tcp::acceptor acceptor{ io_ctx };

	asio::error_code ec;
	const asio::ip::tcp::endpoint endpoint{ asio::ip::address_v4::any(), port };
	acceptor.open( endpoint.protocol(), ec );
	if( !ec )
		acceptor.set_option( asio::socket_base::reuse_address{ true }, ec );
	if( !ec )
		acceptor.bind( endpoint, ec );

	return static_cast<bool>( ec );
}

void
ensure_port_is_free( port_t port )
{
	if( is_port_in_use( port ) )
		throw exception_t{ fmt::format( "Port is already in use: {}", port ) };
}

void
ensure_ssl_files_are_paired( const config_t & config )
{
	if( config.m_ssl_certificate.has_value() != config.m_ssl_key.has_value() )
		throw exception_t{
				"SSL certificate and key should be specified together"
			};
}

[[nodiscard]]
config_t
resolve_ports( config_t config )
{
	if( config.is_remote() )
	{
		if( 0u == config.m_proxy_port )
			config.m_proxy_port = config_t::default_proxy_port;
		if( 0u == config.m_admin_port )
			config.m_admin_port = config_t::default_admin_port;
	}
	else
	{
		// Reservations are held until both ports are picked.
		std::optional< port_reservation_t > proxy_reservation;
		if( 0u == config.m_proxy_port )
		{
			proxy_reservation.emplace();
			config.m_proxy_port = proxy_reservation->port();
		}

		if( 0u == config.m_admin_port )
		{
			port_reservation_t admin_reservation;
			std::optional< port_reservation_t > another_reservation;
			// The configured proxy port isn't bound by us and can be
			// returned by the kernel.
			if( admin_reservation.port() == config.m_proxy_port )
				another_reservation.emplace();

			config.m_admin_port = another_reservation ?
					another_reservation->port() : admin_reservation.port();
		}
	}

	if( config.m_proxy_port == config.m_admin_port )
		throw exception_t{
				fmt::format( "Proxy and admin ports should be different: {}",
						config.m_proxy_port )
			};

	return config;
}

[[nodiscard]]
config_t
validate_config( config_t config )
{
	ensure_ssl_files_are_paired( config );

	return resolve_ports( std::move(config) );
}

} /* namespace anonymous */

const char *
to_string( engine_mode_t mode ) noexcept
{
	const char * r = "unknown";
	switch( mode )
	{
		case engine_mode_t::simulate: r = "simulate"; break;
		case engine_mode_t::capture: r = "capture"; break;
	}
	return r;
}

std::ostream &
operator<<( std::ostream & to, engine_mode_t mode )
{
	return (to << to_string( mode ));
}

//
// hoverfly_t
//
hoverfly_t::hoverfly_t( config_t config, engine_mode_t mode )
	:	m_config{ validate_config( std::move(config) ) }
	,	m_mode{ mode }
	,	m_admin{
			m_config.admin_host(),
			m_config.m_admin_port,
			m_config.m_admin_request_timeout
		}
{}

hoverfly_t::~hoverfly_t()
{
	HOVERKIT_NOTHROW_BLOCK_BEGIN()
		HOVERKIT_NOTHROW_BLOCK_STAGE(close)
		close();
	HOVERKIT_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)
}

void
hoverfly_t::start()
{
	if( m_started )
	{
		logging::direct_mode::warn(
				[]( auto & logger, auto level ) {
					logger.log( level, "Local Hoverfly is already running" );
				} );
		return;
	}

	if( m_config.is_remote() )
		ensure_remote_is_healthy();
	else
		start_local();

	try
	{
		m_admin.set_mode( to_string( m_mode ) );
		if( m_config.is_remote() && m_config.m_destination )
			m_admin.set_destination( *m_config.m_destination );
	}
	catch( const std::exception & )
	{
		HOVERKIT_NOTHROW_BLOCK_BEGIN()
			HOVERKIT_NOTHROW_BLOCK_STAGE(release_local_resources)
			release_local_resources();
		HOVERKIT_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)

		throw;
	}

	m_started = true;

	logging::direct_mode::info(
			[this]( auto & logger, auto level ) {
				logger.log( level, "Hoverfly is ready: host={}, proxy_port={}, "
						"admin_port={}, mode={}",
						m_config.admin_host(),
						m_config.m_proxy_port,
						m_config.m_admin_port,
						to_string( m_mode ) );
			} );
}

void
hoverfly_t::close()
{
	release_local_resources();

	if( m_started )
	{
		m_started = false;

		logging::direct_mode::info(
				[this]( auto & logger, auto level ) {
					logger.log( level, "Hoverfly is stopped: admin_port={}",
							m_config.m_admin_port );
				} );
	}
}

void
hoverfly_t::import_simulation( const dsl::simulation_source_t & source )
{
	ensure_started();

	const auto simulation = source.simulation();

	logging::direct_mode::debug(
			[&simulation]( auto & logger, auto level ) {
				logger.log( level, "importing simulation: pairs={}, delays={}",
						simulation.m_pairs.size(),
						simulation.m_global_actions.m_delays.size() );
			} );

	m_admin.set_simulation( simulation );
}

model::simulation_t
hoverfly_t::get_simulation() const
{
	ensure_started();

	return m_admin.get_simulation();
}

void
hoverfly_t::export_simulation( const std::filesystem::path & file_name ) const
{
	const auto content = json::dump_simulation( get_simulation(), 4 );

	std::ofstream file{ file_name, std::ios_base::out | std::ios_base::trunc };
	if( !file )
		throw exception_t{
				fmt::format( "unable to open file '{}' for writing",
						file_name.string() )
			};

	file << content;
	file.close();
	if( !file )
		throw exception_t{
				fmt::format( "unable to write the simulation to '{}'",
						file_name.string() )
			};

	logging::direct_mode::info(
			[&file_name]( auto & logger, auto level ) {
				logger.log( level, "simulation exported to '{}'",
						file_name.string() );
			} );
}

void
hoverfly_t::reset()
{
	ensure_started();

	m_admin.delete_simulation();
}

std::optional< std::filesystem::path >
hoverfly_t::log_file() const
{
	if( !m_temp_dir )
		return std::nullopt;

	return m_temp_dir->path() / log_file_name;
}

void
hoverfly_t::start_local()
{
	ensure_port_is_free( m_config.m_proxy_port );
	ensure_port_is_free( m_config.m_admin_port );

	try
	{
		m_temp_dir = std::make_unique< process::temp_directory_t >( "hoverkit." );

		process::child_process_t::args_container_t args{
				"-pp", std::to_string( m_config.m_proxy_port ),
				"-ap", std::to_string( m_config.m_admin_port )
			};

		if( engine_mode_t::capture == m_mode )
			args.emplace_back( "-capture" );

		if( m_config.m_webserver )
			args.emplace_back( "-webserver" );

		if( m_config.m_ssl_certificate )
		{
			args.emplace_back( "-cert" );
			args.push_back(
					m_temp_dir->copy_file( *m_config.m_ssl_certificate ).string() );
			args.emplace_back( "-key" );
			args.push_back(
					m_temp_dir->copy_file( *m_config.m_ssl_key ).string() );
		}

		if( m_config.m_destination )
		{
			args.emplace_back( "-destination" );
			args.push_back( *m_config.m_destination );
		}

		if( !m_config.m_tls_verification )
			args.emplace_back( "-tls-verification=false" );

		m_process = std::make_unique< process::child_process_t >(
				m_config.m_binary,
				args,
				m_temp_dir->path() / log_file_name );

		wait_for_health();
	}
	catch( const std::exception & )
	{
		HOVERKIT_NOTHROW_BLOCK_BEGIN()
			HOVERKIT_NOTHROW_BLOCK_STAGE(release_local_resources)
			release_local_resources();
		HOVERKIT_NOTHROW_BLOCK_END(LOG_THEN_IGNORE)

		throw;
	}
}

void
hoverfly_t::ensure_remote_is_healthy() const
{
	if( !m_admin.is_healthy() )
		throw exception_t{
				fmt::format( "Remote Hoverfly at {}:{} is not healthy",
						m_config.admin_host(), m_config.m_admin_port )
			};
}

void
hoverfly_t::wait_for_health()
{
	const auto deadline = std::chrono::steady_clock::now() +
			m_config.m_startup_timeout;

	for(;;)
	{
		if( !m_process->is_alive() )
			throw exception_t{
					fmt::format( "Hoverfly exited prematurely with status {}, "
							"see log file: {}",
							m_process->exit_status().value_or( -1 ),
							( m_temp_dir->path() / log_file_name ).string() )
				};

		if( m_admin.is_healthy() )
			return;

		if( std::chrono::steady_clock::now() >= deadline )
			throw exception_t{
					fmt::format( "Hoverfly has not become healthy in {}ms",
							m_config.m_startup_timeout.count() )
				};

		std::this_thread::sleep_for( health_polling_period );
	}
}

void
hoverfly_t::ensure_started() const
{
	if( !m_started )
		throw exception_t{ "Hoverfly is not started" };
}

void
hoverfly_t::release_local_resources()
{
	if( m_process )
	{
		m_process->terminate( shutdown_grace_period );
		m_process.reset();
	}

	if( m_temp_dir )
	{
		m_temp_dir->purge();
		m_temp_dir.reset();
	}
}

} /* namespace hoverkit::launcher */
