#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fake_admin_api
{

//! Description of a request received by the fake server.
struct request_record_t
{
	std::string m_method;
	std::string m_target;
	std::string m_body;
};

//! Picks a free TCP-port on the loopback interface.
[[nodiscard]]
std::uint16_t
find_free_port();

/*!
 * @brief A tiny imitation of the engine's admin API.
 *
 * Serves health-checks, the simulation, the mode and the destination
 * entries on 127.0.0.1. The server is stopped in the destructor.
 */
class server_t
{
public:
	explicit server_t( std::uint16_t port );
	~server_t();

	[[nodiscard]]
	std::uint16_t
	port() const noexcept;

	//! Turn health-checks on/off. Unhealthy server replies with 503.
	void
	set_healthy( bool value );

	//! Make all entries except the health-check reply with @a status.
	/*!
	 * Zero value turns the normal processing back.
	 */
	void
	set_failure_status( std::uint16_t status );

	//! Delay for every response.
	void
	set_response_delay( std::chrono::milliseconds delay );

	[[nodiscard]]
	std::string
	mode();

	[[nodiscard]]
	std::optional< std::string >
	destination();

	//! The current simulation document as it was received.
	[[nodiscard]]
	std::string
	simulation();

	[[nodiscard]]
	std::vector< request_record_t >
	requests();

private:
	struct internals_t;

	std::unique_ptr< internals_t > m_impl;
};

} /* namespace fake_admin_api */
