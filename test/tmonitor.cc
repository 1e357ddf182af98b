/// Test the Status_monitor and its listeners
///
///    tmonitor  --log_level=all

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
#define BOOST_TEST_MODULE monitor_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <boost/filesystem/fstream.hpp>
#include <jsoncpp/json/json.h>

#include "logging.hpp"
#include "statmon.hpp"

namespace fs = boost::filesystem;

/// Simple test fixture that just handles logging setup/teardown.
///
struct LogFixture {
    LogFixture() {
        init_logging("tmonitor","tmonitor_%5N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

/// Counts snapshots; throws while broken is set.
///
class Counting_listener : public Status_listener {
private:
    std::string m_name;
public:
    explicit Counting_listener( const std::string &n="counting" ) : m_name( n ) {}
    std::atomic<int> seen {0};
    std::atomic<bool> broken {false};
    Status_map last {};
    const char* name() const override { return m_name.c_str(); }
    void publish( const Status_map &sm ) override {
        if (broken) throw Status_publish_error();
        last = sm;
        ++seen;
    }
};

/// Queries the monitor from inside publish(), then throws a value that
/// is not a std::exception.
///
class Querying_listener : public Status_listener {
public:
    Status_monitor *mon {nullptr};
    unsigned long polls_seen {0};
    unsigned own_failures {0};
    const char* name() const override { return "querying"; }
    void publish( const Status_map& ) override {
        polls_seen = mon->polls();
        own_failures = mon->failures( name() );
        throw 42;
    }
};

static Status_map sample()
{
    return Status_map { {"Kitchen", true}, {"Den", false} };
}

//////////////////////////////////////////////////////////////////////////

/// One failing listener is counted and does not block the others.
///
BOOST_AUTO_TEST_CASE( Poll_failure_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Poll_failure_test";

    auto good = std::make_shared<Counting_listener>();
    auto bad = std::make_shared<Counting_listener>( "flaky" );
    bad->broken = true;
    Status_monitor mon( sample );
    mon.add_listener( std::make_shared<Log_status_listener>() );
    mon.add_listener( bad );
    mon.add_listener( good );
    mon.add_listener( nullptr );

    for (int i=0; i<12; i++) {
        BOOST_TEST( mon.poll_once() );
    }
    BOOST_CHECK_EQUAL( good->seen.load(), 12 );
    BOOST_CHECK_EQUAL( mon.polls(), 12u );
    BOOST_CHECK_EQUAL( mon.failures( "flaky" ), 12u );
    BOOST_CHECK_EQUAL( mon.failures( "counting" ), 0u );
    BOOST_CHECK_EQUAL( good->last.size(), 2u );
    BOOST_TEST( good->last["Kitchen"] );

    bad->broken = false;
    BOOST_TEST( mon.poll_once() );
    BOOST_CHECK_EQUAL( mon.failures( "flaky" ), 0u );
    BOOST_CHECK_EQUAL( bad->seen.load(), 1 );
    BOOST_CHECK_EQUAL( mon.failures( "no-such-listener" ), 0u );
}

/// Listeners may call back into the monitor, and any thrown value is
/// counted as a failure.
///
BOOST_AUTO_TEST_CASE( Listener_callback_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Listener_callback_test";

    auto good = std::make_shared<Counting_listener>();
    auto ql = std::make_shared<Querying_listener>();
    Status_monitor mon( sample );
    ql->mon = &mon;
    mon.add_listener( ql );
    mon.add_listener( good );

    BOOST_TEST( mon.poll_once() );
    BOOST_TEST( mon.poll_once() );
    BOOST_CHECK_EQUAL( ql->polls_seen, 2u );
    BOOST_CHECK_EQUAL( ql->own_failures, 1u );
    BOOST_CHECK_EQUAL( mon.failures( "querying" ), 2u );
    BOOST_CHECK_EQUAL( good->seen.load(), 2 );
}

/// A snapshot that throws is reported by poll_once().
///
BOOST_AUTO_TEST_CASE( Snapshot_failure_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Snapshot_failure_test";

    auto cl = std::make_shared<Counting_listener>();
    Status_monitor mon( []() -> Status_map {
        throw std::runtime_error( "store unavailable" );
    } );
    mon.add_listener( cl );
    BOOST_TEST( not mon.poll_once() );
    BOOST_CHECK_EQUAL( cl->seen.load(), 0 );
    BOOST_CHECK_EQUAL( mon.polls(), 0u );
}

/// The thread polls on its interval and stops promptly.
///
BOOST_AUTO_TEST_CASE( Thread_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Thread_test";

    auto cl = std::make_shared<Counting_listener>();
    Status_monitor mon( sample );
    mon.set_timing( 50, 50 );
    BOOST_CHECK_EQUAL( mon.interval_ms(), 50 );
    mon.add_listener( cl );
    BOOST_TEST( not mon.running() );
    mon.start();
    BOOST_TEST( mon.running() );
    std::this_thread::sleep_for( std::chrono::milliseconds(400) );

    mon.set_timing( 60000, 60000 );
    auto t0 = std::chrono::steady_clock::now();
    mon.stop();
    auto waited = std::chrono::steady_clock::now() - t0;
    BOOST_TEST( not mon.running() );
    BOOST_TEST( cl->seen.load() >= 3 );
    BOOST_TEST( std::chrono::duration_cast<std::chrono::milliseconds>(waited).count() < 5000 );

    // restart after stop
    int before = cl->seen.load();
    mon.set_timing( 50, 50 );
    mon.start();
    std::this_thread::sleep_for( std::chrono::milliseconds(200) );
    mon.stop();
    BOOST_TEST( cl->seen.load() > before );
}

BOOST_AUTO_TEST_CASE( Status_file_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Status_file_test";

    fs::path dir = fs::temp_directory_path() / fs::unique_path( "tmonitor-%%%%-%%%%" );
    fs::create_directories( dir );
    fs::path sfile = dir / "status.json";

    Status_file_listener sfl( sfile );
    sfl.publish( sample() );
    BOOST_REQUIRE( fs::exists( sfile ) );

    Json::Value root;
    {
        fs::ifstream ifs( sfile );
        Json::CharReaderBuilder rb;
        std::string errs;
        BOOST_REQUIRE( Json::parseFromStream( rb, ifs, &root, &errs ) );
    }
    BOOST_TEST( root["time"].asInt64() > 0 );
    BOOST_TEST( root["players"]["Kitchen"].asBool() );
    BOOST_TEST( not root["players"]["Den"].asBool() );

    sfl.remove_file();
    BOOST_TEST( not fs::exists( sfile ) );

    // an unwritable location throws, which the monitor counts
    auto nowhere = std::make_shared<Status_file_listener>( dir / "missing" / "status.json" );
    BOOST_CHECK_THROW( nowhere->publish( sample() ), Status_publish_error );
    Status_monitor mon( sample );
    mon.add_listener( nowhere );
    BOOST_TEST( mon.poll_once() );
    BOOST_CHECK_EQUAL( mon.failures( "status-file" ), 1u );

    fs::remove_all( dir );
}
