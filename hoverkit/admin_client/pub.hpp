/*!
 * @file
 * @brief The public interface of the client for the engine's admin API.
 */

#pragma once

#include <hoverkit/config.hpp>
#include <hoverkit/exception.hpp>

#include <hoverkit/model/simulation.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace hoverkit::admin_client
{

//
// api_exception_t
//
/*!
 * @brief Exception for negative responses from the admin API.
 */
class api_exception_t : public exception_t
{
	int m_status;
	std::string m_body;

public:
	api_exception_t(
		std::string_view method,
		std::string_view target,
		int status,
		std::string body );

	[[nodiscard]]
	int
	status() const noexcept { return m_status; }

	[[nodiscard]]
	const std::string &
	body() const noexcept { return m_body; }
};

//
// response_t
//
//! Response received from the admin API.
struct response_t
{
	int m_status{};
	std::string m_body;
};

//
// client_t
//
/*!
 * @brief Blocking client for the admin API of the engine.
 *
 * Every operation uses a separate connection. An operation fails with
 * hoverkit::exception_t if the response isn't received in the time-out
 * specified in the constructor.
 *
 * Operations throw api_exception_t if the status of the response
 * isn't 2xx.
 */
class client_t
{
public:
	client_t(
		std::string host,
		port_t port,
		std::chrono::milliseconds timeout );

	//! Check that the engine responds to health-checks.
	/*!
	 * Any error is treated as an unhealthy state.
	 */
	[[nodiscard]]
	bool
	is_healthy() const noexcept;

	[[nodiscard]]
	model::simulation_t
	get_simulation() const;

	//! Replace the current simulation.
	void
	set_simulation( const model::simulation_t & simulation ) const;

	//! Remove all pairs and delays from the engine.
	void
	delete_simulation() const;

	[[nodiscard]]
	std::string
	get_mode() const;

	void
	set_mode( std::string_view mode ) const;

	void
	set_destination( std::string_view destination ) const;

	//! Perform an arbitrary request.
	/*!
	 * Doesn't check the status of the response.
	 *
	 * @throw hoverkit::exception_t on I/O errors and time-outs.
	 */
	[[nodiscard]]
	response_t
	perform(
		std::string_view method,
		std::string_view target,
		std::string_view body ) const;

private:
	const std::string m_host;
	const port_t m_port;
	const std::chrono::milliseconds m_timeout;

	//! Perform a request and ensure the 2xx status of the response.
	response_t
	perform_successfully(
		std::string_view method,
		std::string_view target,
		std::string_view body ) const;
};

} /* namespace hoverkit::admin_client */
