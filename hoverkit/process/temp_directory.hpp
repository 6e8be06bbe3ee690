/*!
 * @file
 * @brief A temporary directory removed in the destructor.
 */

#pragma once

#include <filesystem>
#include <string_view>

namespace hoverkit::process
{

//
// temp_directory_t
//
/*!
 * @brief A unique directory inside the system's temporary directory.
 *
 * The directory and all its content are removed by purge() or
 * in the destructor.
 */
class temp_directory_t
{
public:
	//! Create a directory with the name `<prefix>XXXXXX`.
	/*!
	 * @throw hoverkit::exception_t if the directory can't be created.
	 */
	explicit temp_directory_t( std::string_view prefix );

	~temp_directory_t();

	temp_directory_t( const temp_directory_t & ) = delete;
	temp_directory_t &
	operator=( const temp_directory_t & ) = delete;

	[[nodiscard]]
	const std::filesystem::path &
	path() const noexcept { return m_path; }

	//! Copy a file into the directory.
	/*!
	 * @return the path to the copy.
	 */
	std::filesystem::path
	copy_file( const std::filesystem::path & source );

	//! Remove the directory with all its content.
	/*!
	 * Can be called several times.
	 */
	void
	purge();

private:
	std::filesystem::path m_path;
	bool m_purged{ false };
};

} /* namespace hoverkit::process */
