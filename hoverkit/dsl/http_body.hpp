/*!
 * @file
 * @brief A body of HTTP-message produced from some structured data.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace hoverkit::dsl
{

//
// http_body_t
//
/*!
 * @brief The content of a body with its content type.
 */
class http_body_t
{
	std::string m_body;
	std::string m_content_type;

	http_body_t( std::string body, std::string content_type )
		:	m_body{ std::move(body) }
		,	m_content_type{ std::move(content_type) }
	{}

public:
	//! Make a body from JSON document in the compact form.
	[[nodiscard]]
	static http_body_t
	json( const nlohmann::json & document )
	{
		return { document.dump(), "application/json" };
	}

	[[nodiscard]]
	static http_body_t
	plain_text( std::string text )
	{
		return { std::move(text), "text/plain" };
	}

	[[nodiscard]]
	const std::string &
	body() const noexcept { return m_body; }

	[[nodiscard]]
	const std::string &
	content_type() const noexcept { return m_content_type; }
};

} /* namespace hoverkit::dsl */
