/// Test the Process_supervisor with ordinary shell utilities
///
///    tsuper  --log_level=all

/*   Part of the roomplay package.
 *
 *   Copyright 2026 The roomplay authors
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 *
 */


/// Dynamically link boost test framework
#define BOOST_TEST_MODULE supervisor_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <signal.h>
#include <unistd.h>

#include "cmdrun.hpp"
#include "logging.hpp"
#include "procgroup.hpp"
#include "supervisor.hpp"

namespace fs = boost::filesystem;

/// Logging plus a supervisor on a scratch log directory, with short
/// timings so the tests stay quick.
///
struct SuperFixture {
    fs::path dir;
    std::unique_ptr<Process_supervisor> sup;
    SuperFixture() {
        init_logging("tsuper","tsuper_%5N.log",LF_FILE|LF_DEBUG);
        dir = fs::temp_directory_path() / fs::unique_path( "tsuper-%%%%-%%%%" );
        sup.reset( new Process_supervisor( dir ) );
        sup->set_timing( 200, 1000, 1000 );
    }
    ~SuperFixture() {
        sup->stop_all();
        sup.reset();
        boost::system::error_code ec;
        fs::remove_all( dir, ec );
        finish_logging();
    }
};

static const Command Sleeper { "sleep", "30" };

static void pause_ms( long ms )
{
    std::this_thread::sleep_for( std::chrono::milliseconds(ms) );
}

//////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_CASE( Start_stop_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Start_stop_test";

    BOOST_TEST( fs::is_directory( sf.dir ) );
    BOOST_CHECK_EQUAL( sf.sup->get_log_path( "Kitchen" ), sf.dir / "Kitchen.log" );
    BOOST_TEST( not sf.sup->is_running( "Kitchen" ) );
    BOOST_CHECK_EQUAL( sf.sup->get_pid( "Kitchen" ), NOTAPID );

    Op_result r = sf.sup->start( "Kitchen", Sleeper );
    BOOST_TEST( r.ok );
    BOOST_CHECK_EQUAL( r.message, "Process 'Kitchen' started successfully" );
    BOOST_TEST( sf.sup->is_running( "Kitchen" ) );
    BOOST_TEST( not sf.sup->is_degraded( "Kitchen" ) );
    pid_t pid = sf.sup->get_pid( "Kitchen" );
    BOOST_TEST( pid > 0 );
    BOOST_TEST( fs::exists( sf.dir / "Kitchen.log" ) );

    r = sf.sup->start( "Kitchen", Sleeper );
    BOOST_TEST( not r.ok );
    BOOST_CHECK_EQUAL( r.message, "Process 'Kitchen' is already running" );
    BOOST_CHECK_EQUAL( sf.sup->get_pid( "Kitchen" ), pid );

    r = sf.sup->stop( "Kitchen" );
    BOOST_TEST( r.ok );
    BOOST_CHECK_EQUAL( r.message, "Process 'Kitchen' stopped successfully" );
    BOOST_TEST( not sf.sup->is_running( "Kitchen" ) );
    BOOST_TEST( kill( pid, 0 ) != 0 );     // really gone

    r = sf.sup->stop( "Kitchen" );
    BOOST_TEST( not r.ok );
    BOOST_CHECK_EQUAL( r.message, "Process 'Kitchen' not found" );
}

/// A child that exits inside the grace period is a failed start and
/// its output is quoted.
///
BOOST_AUTO_TEST_CASE( Immediate_exit_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Immediate_exit_test";

    Op_result r = sf.sup->start( "Den", {"sh", "-c", "echo no such device >&2; exit 4"} );
    BOOST_TEST( not r.ok );
    BOOST_TEST( r.message.find( "Process failed to start: exited immediately with exit code 4" ) == 0 );
    BOOST_TEST( r.message.find( "no such device" ) != std::string::npos );
    BOOST_TEST( not sf.sup->is_running( "Den" ) );

    // the failed start leaves nothing behind, so a new start is allowed
    r = sf.sup->start( "Den", Sleeper );
    BOOST_TEST( r.ok );
}

BOOST_AUTO_TEST_CASE( Missing_binary_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Missing_binary_test";

    bool used_fallback = true;
    Op_result r = sf.sup->start( "Porch", {"no-such-player-binary", "-x"},
                                 Sleeper, &used_fallback );
    BOOST_TEST( not r.ok );
    BOOST_CHECK_EQUAL( r.message, "Binary 'no-such-player-binary' not found" );
    BOOST_TEST( not used_fallback );
    BOOST_TEST( not sf.sup->is_running( "Porch" ) );
}

BOOST_AUTO_TEST_CASE( Fallback_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Fallback_test";

    const Command failing { "sh", "-c", "exit 1" };
    bool used_fallback = false;
    Op_result r = sf.sup->start( "Office", failing, Sleeper, &used_fallback );
    BOOST_TEST( r.ok );
    BOOST_CHECK_EQUAL( r.message, "Process 'Office' started with fallback configuration" );
    BOOST_TEST( used_fallback );
    BOOST_TEST( sf.sup->is_running( "Office" ) );
    BOOST_TEST( sf.sup->is_degraded( "Office" ) );

    r = sf.sup->start( "Attic", failing, failing, &used_fallback );
    BOOST_TEST( not r.ok );
    BOOST_TEST( r.message.find( "; fallback also failed: " ) != std::string::npos );
    BOOST_TEST( not used_fallback );
}

/// A child ignoring SIGTERM is killed.
///
BOOST_AUTO_TEST_CASE( Force_stop_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Force_stop_test";

    Op_result r = sf.sup->start( "Garage", {"sh", "-c", "trap '' TERM; sleep 30"} );
    BOOST_REQUIRE( r.ok );
    pid_t pid = sf.sup->get_pid( "Garage" );
    r = sf.sup->stop( "Garage" );
    BOOST_TEST( r.ok );
    BOOST_CHECK_EQUAL( r.message, "Process 'Garage' force stopped" );
    BOOST_TEST( kill( pid, 0 ) != 0 );
    BOOST_TEST( not sf.sup->is_running( "Garage" ) );
}

/// Processes that die on their own are reported and cleaned up.
///
BOOST_AUTO_TEST_CASE( Crash_cleanup_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Crash_cleanup_test";

    BOOST_REQUIRE( sf.sup->start( "Bath", {"sleep", "1"} ).ok );
    BOOST_REQUIRE( sf.sup->start( "Hall", Sleeper ).ok );
    pause_ms( 1500 );

    auto st = sf.sup->get_all_statuses( {"Bath", "Hall", "Never"} );
    BOOST_REQUIRE_EQUAL( st.size(), 3u );
    BOOST_TEST( not st["Bath"] );
    BOOST_TEST( st["Hall"] );
    BOOST_TEST( not st["Never"] );

    auto cleaned = sf.sup->cleanup_dead_processes();
    BOOST_REQUIRE_EQUAL( cleaned.size(), 1u );
    BOOST_CHECK_EQUAL( cleaned[0], "Bath" );
    BOOST_CHECK_EQUAL( sf.sup->get_pid( "Bath" ), NOTAPID );
    BOOST_TEST( sf.sup->cleanup_dead_processes().empty() );

    // an exited process is reaped by the next start of its name
    BOOST_REQUIRE( sf.sup->start( "Bath", {"sleep", "1"} ).ok );
    pause_ms( 1500 );
    Op_result r = sf.sup->start( "Bath", Sleeper );
    BOOST_TEST( r.ok );

    // or by a stop, which reports it was not running
    BOOST_REQUIRE( sf.sup->start( "Loft", {"sleep", "1"} ).ok );
    pause_ms( 1500 );
    r = sf.sup->stop( "Loft" );
    BOOST_TEST( not r.ok );
    BOOST_CHECK_EQUAL( r.message, "Process 'Loft' was not running" );

    BOOST_CHECK_EQUAL( sf.sup->stop_all(), 2 );
    BOOST_TEST( not sf.sup->is_running( "Hall" ) );
}

/// Only one of several concurrent starts of a name may win.
///
BOOST_AUTO_TEST_CASE( Concurrent_start_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Concurrent_start_test";

    std::atomic<int> wins {0};
    std::atomic<int> busy {0};
    std::vector<std::thread> threads;
    for (int i=0; i<4; i++) {
        threads.emplace_back( [&sf, &wins, &busy]() {
            Op_result r = sf.sup->start( "Shared", Sleeper );
            if (r.ok) {
                ++wins;
            } else if (r.message == "Process 'Shared' is already running") {
                ++busy;
            }
        } );
    }
    for (auto &t : threads) t.join();
    BOOST_CHECK_EQUAL( wins.load(), 1 );
    BOOST_CHECK_EQUAL( busy.load(), 3 );
    BOOST_TEST( sf.sup->is_running( "Shared" ) );
}

/// Each start's failure message quotes only that run's output.
///
BOOST_AUTO_TEST_CASE( Log_tail_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Log_tail_test";

    Op_result r = sf.sup->start( "Nook", {"sh", "-c", "echo first-run; exit 2"} );
    BOOST_TEST( not r.ok );
    BOOST_TEST( r.message.find( "first-run" ) != std::string::npos );
    r = sf.sup->start( "Nook", {"sh", "-c", "echo second-run; exit 2"} );
    BOOST_TEST( not r.ok );
    BOOST_TEST( r.message.find( "second-run" ) != std::string::npos );
    BOOST_TEST( r.message.find( "first-run" ) == std::string::npos );
}

/// Without process groups only the direct child is signalled, which
/// is enough for a plain binary.
///
BOOST_AUTO_TEST_CASE( Pid_signaller_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Pid_signaller_test";

    sf.sup->set_signaller( std::make_shared<Pid_signaller>() );
    BOOST_REQUIRE( sf.sup->start( "Attic", Sleeper ).ok );
    pid_t pid = sf.sup->get_pid( "Attic" );
    BOOST_TEST( getpgid( pid ) == getpgid( 0 ) );
    Op_result r = sf.sup->stop( "Attic" );
    BOOST_TEST( r.ok );
    BOOST_CHECK_EQUAL( r.message, "Process 'Attic' stopped successfully" );
    BOOST_TEST( kill( pid, 0 ) != 0 );
}

/// Pipe descriptors held by process pid.
///
static int count_pipes( pid_t pid )
{
    int n = 0;
    fs::path fddir = fs::path("/proc") / std::to_string(pid) / "fd";
    for (const auto &ent : fs::directory_iterator( fddir )) {
        boost::system::error_code ec;
        fs::path target = fs::read_symlink( ent.path(), ec );
        if (not ec and target.string().compare( 0, 5, "pipe:" ) == 0) {
            ++n;
        }
    }
    return n;
}

/// A player started while a helper command is being captured must not
/// inherit the capture pipe.
///
BOOST_AUTO_TEST_CASE( Helper_pipe_test )
{
    SuperFixture sf;
    LOG_INFO(Lgr) << "Unit test: Helper_pipe_test";

    int rc = -100;
    std::thread helper( [&rc]() {
        std::string out;
        rc = run_capture( {"sleep", "1"}, out, 5000 );
    } );
    pause_ms( 100 );
    Op_result r = sf.sup->start( "Study", Sleeper );
    helper.join();
    BOOST_REQUIRE( r.ok );
    BOOST_CHECK_EQUAL( rc, 0 );
    BOOST_CHECK_EQUAL( count_pipes( sf.sup->get_pid( "Study" ) ), 0 );
}
