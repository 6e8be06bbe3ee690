#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <hoverkit/process/child_process.hpp>
#include <hoverkit/process/temp_directory.hpp>

#include <hoverkit/exception.hpp>
#include <hoverkit/utils/load_file_into_memory.hpp>

#include <csignal>
#include <fstream>
#include <thread>

using namespace std::chrono_literals;

namespace
{

// Waits for the end of a short-living process.
void
wait_for_exit( hoverkit::process::child_process_t & child )
{
	for( int i = 0; i < 200 && child.is_alive(); ++i )
		std::this_thread::sleep_for( 10ms );
}

} /* namespace anonymous */

TEST_CASE("temp directory") {
	using namespace hoverkit::process;

	std::filesystem::path dir_path;
	{
		temp_directory_t dir{ "hoverkit-test." };
		dir_path = dir.path();

		REQUIRE( std::filesystem::is_directory( dir_path ) );
		REQUIRE( 0 == dir_path.filename().string().rfind( "hoverkit-test.", 0 ) );

		const auto source = dir_path / "source.pem";
		{
			std::ofstream out{ source };
			out << "certificate";
		}

		std::filesystem::create_directory( dir_path / "sub" );
		temp_directory_t nested{ ( dir_path / "sub" / "n." ).string() };
		const auto copy = nested.copy_file( source );
		REQUIRE( nested.path() / "source.pem" == copy );
		REQUIRE( "certificate" == hoverkit::utils::load_file_into_memory( copy ) );

		// The second copy overwrites the first one.
		REQUIRE_NOTHROW( (void)nested.copy_file( source ) );

		nested.purge();
		REQUIRE( !std::filesystem::exists( nested.path() ) );
		REQUIRE_NOTHROW( nested.purge() );
	}

	REQUIRE( !std::filesystem::exists( dir_path ) );
}

TEST_CASE("normal exit") {
	using namespace hoverkit::process;

	temp_directory_t dir{ "hoverkit-test." };
	const auto log_file = dir.path() / "out.log";

	child_process_t child{ "/bin/sh", { "-c", "echo hello; echo oops 1>&2" },
			log_file };
	REQUIRE( child.pid() > 0 );

	wait_for_exit( child );
	REQUIRE( !child.is_alive() );
	REQUIRE( child.exit_status() );
	REQUIRE( 0 == *child.exit_status() );

	REQUIRE( "hello\noops\n" ==
			hoverkit::utils::load_file_into_memory( log_file ) );
}

TEST_CASE("exit code") {
	using namespace hoverkit::process;

	temp_directory_t dir{ "hoverkit-test." };

	child_process_t child{ "sh", { "-c", "exit 3" }, dir.path() / "out.log" };
	wait_for_exit( child );
	REQUIRE( child.exit_status() );
	REQUIRE( 3 == *child.exit_status() );
}

TEST_CASE("terminate") {
	using namespace hoverkit::process;

	temp_directory_t dir{ "hoverkit-test." };

	child_process_t child{ "/bin/sleep", { "30" }, dir.path() / "out.log" };
	REQUIRE( child.is_alive() );
	REQUIRE( !child.exit_status() );

	child.terminate( 2s );
	REQUIRE( !child.is_alive() );
	REQUIRE( child.exit_status() );
	REQUIRE( 128 + SIGTERM == *child.exit_status() );

	// Repeated call does nothing.
	REQUIRE_NOTHROW( child.terminate( 2s ) );
}

TEST_CASE("kill after grace period") {
	using namespace hoverkit::process;

	temp_directory_t dir{ "hoverkit-test." };

	child_process_t child{ "/bin/sh",
			{ "-c", "trap '' TERM; echo ready; while :; do sleep 1; done" },
			dir.path() / "out.log" };

	// Give the shell time to install the trap.
	for( int i = 0; i < 200; ++i )
	{
		if( "ready\n" == hoverkit::utils::load_file_into_memory(
				dir.path() / "out.log" ) )
			break;
		std::this_thread::sleep_for( 10ms );
	}

	child.terminate( 100ms );
	REQUIRE( !child.is_alive() );
	REQUIRE( 128 + SIGKILL == *child.exit_status() );
}

TEST_CASE("missing binary") {
	using namespace hoverkit::process;

	temp_directory_t dir{ "hoverkit-test." };

	REQUIRE_THROWS_AS(
			child_process_t( "/no/such/binary", {}, dir.path() / "out.log" ),
			hoverkit::exception_t );
	REQUIRE_THROWS_AS(
			child_process_t( "no-such-binary-in-path", {}, dir.path() / "out.log" ),
			hoverkit::exception_t );
}

TEST_CASE("log file can't be created") {
	using namespace hoverkit::process;

	REQUIRE_THROWS_AS(
			child_process_t( "/bin/true", {}, "/no/such/dir/out.log" ),
			hoverkit::exception_t );
}
