/*!
 * @file
 * @brief Stuff for working with configuration.
 */

#pragma once

#include <hoverkit/exception.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hoverkit
{

//! Type for holding TCP-port numbers.
using port_t = std::uint16_t;

//
// config_t
//
/*!
 * @brief Configuration of the engine to be launched or used.
 */
struct config_t
{
	//! Default proxy port of the engine.
	static constexpr port_t default_proxy_port{ 8500u };
	//! Default admin port of the engine.
	static constexpr port_t default_admin_port{ 8888u };

	/*!
	 * @brief Log level to be used for logging.
	 *
	 * The value spdlog::level::off means that logging should
	 * be disabled.
	 */
	spdlog::level::level_enum m_log_level{ spdlog::level::info };

	/*!
	 * @brief Name or path of the engine's binary.
	 *
	 * If it's a name without slashes the binary is searched in PATH.
	 */
	std::string m_binary{ "hoverfly" };

	/*!
	 * @brief Host of already running engine.
	 *
	 * If it's set then no process is started and the remote engine
	 * is used.
	 */
	std::optional< std::string > m_remote_host;

	//! Host for access to the admin API of a local engine.
	std::string m_host{ "localhost" };

	/*!
	 * @name Ports of the engine.
	 *
	 * Zero means that a free port should be picked for a local engine,
	 * or the default port should be used for a remote one.
	 * @{
	 */
	port_t m_proxy_port{ 0u };
	port_t m_admin_port{ 0u };
	/*!
	 * @}
	 */

	/*!
	 * @name Custom CA certificate and key for the engine.
	 *
	 * They should be specified both or not specified at all.
	 * @{
	 */
	std::optional< std::filesystem::path > m_ssl_certificate;
	std::optional< std::filesystem::path > m_ssl_key;
	/*!
	 * @}
	 */

	//! Filter for destinations processed by the engine.
	std::optional< std::string > m_destination;

	//! Should the engine work as a webserver instead of a proxy?
	bool m_webserver{ false };

	//! Should the engine verify TLS certificates of upstream servers?
	bool m_tls_verification{ true };

	//! Time for waiting for the engine to become healthy.
	std::chrono::milliseconds m_startup_timeout{ 10'000 };

	//! Time-out for a single request to the admin API.
	std::chrono::milliseconds m_admin_request_timeout{ 5'000 };

	[[nodiscard]]
	bool
	is_remote() const noexcept { return m_remote_host.has_value(); }

	//! Host to be used for access to the admin API.
	[[nodiscard]]
	const std::string &
	admin_host() const noexcept
	{
		return m_remote_host ? *m_remote_host : m_host;
	}
};

//
// config_parser_t
//
/*!
 * @brief A class for parsing hoverkit's config.
 *
 * The config is a sequence of lines in the form `command args`.
 * Empty lines and lines started with `#` are ignored.
 *
 * @code
 * # Engine to be launched.
 * hoverfly.binary /opt/hoverfly/bin/hoverfly
 * port.proxy 8500
 * port.admin 0
 * timeout.startup 15s
 * @endcode
 *
 * It's supposed that an instance of that class is created just
 * once and then reused.
 */
class config_parser_t
{
public:
	//! Type of exception for parsing errors.
	struct parser_exception_t : public exception_t
	{
	public:
		parser_exception_t( const std::string & what );
	};

	config_parser_t();
	~config_parser_t();

	//! Parse the content of the config.
	/*!
	 * @throw parser_exception_t in the case of an error.
	 */
	[[nodiscard]]
	config_t
	parse( std::string_view content );

private:
	struct impl_t;

	std::unique_ptr<impl_t> m_impl;
};

} /* namespace hoverkit */
