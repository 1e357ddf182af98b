/// Test the Config class
///
///    tconfig  --log_level=all

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
#define BOOST_TEST_MODULE config_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <iostream>
#include <boost/filesystem/fstream.hpp>

#include "logging.hpp"
#include "config.hpp"
#include "configutil.hpp"
#include "statmon.hpp"
#include "supervisor.hpp"
#include "volsvc.hpp"

namespace fs = boost::filesystem;

/// Simple test fixture that just handles logging setup/teardown.
///
struct LogFixture {
    LogFixture() {
        init_logging("tconfig","tconfig_%5N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

static const std::string ConfName { TEST_DIR "/tconfig.json" };

//////////////////////////////////////////////////////////////////////////

/// Do some tests on test file. All of these should return normally,
/// none should throw.
///
BOOST_AUTO_TEST_CASE( Valid_params_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Valid_params_test";

    Config cfg( ConfName.c_str() );
    cfg.read_config();
    BOOST_TEST( cfg.get_schema() == "1.0" );

    // Bool
    bool autostart {true};
    BOOST_TEST( cfg.get_bool("General","autostart",autostart) );
    BOOST_TEST( autostart == false );

    // Unsigned
    unsigned grace { 500 };
    BOOST_TEST( cfg.get_unsigned("Supervisor","startup_grace_ms",grace) );
    BOOST_CHECK_EQUAL( grace, 250u );
    unsigned interval { 2 };
    BOOST_TEST( cfg.get_unsigned("Monitor","interval_secs",interval) );
    BOOST_CHECK_EQUAL( interval, 3u );

    // absent key leaves the value alone
    unsigned missing { 1313 };
    BOOST_TEST( not cfg.get_unsigned("Monitor","no_such_key",missing) );
    BOOST_CHECK_EQUAL( missing, 1313u );

    // String
    std::string control { "PCM" };
    BOOST_TEST( cfg.get_string("Volume","mixer_control",control) );
    BOOST_CHECK_EQUAL( control, "Master" );

    // Absent section
    std::string bin { "snapclient" };
    BOOST_TEST( not cfg.get_string("Sendspin","binary",bin) );
    BOOST_CHECK_EQUAL( bin, "snapclient" );

    // Pathnames
    fs::path path1 {"/foo/bar"};
    BOOST_TEST( cfg.get_pathname("Volume","amixer_bin",
                                 FileCond::MustExist, path1) );
    BOOST_CHECK_EQUAL( path1, fs::path("/bin/sh") );

    fs::path path2_default("/bin/sh");
    fs::path path2 {path2_default};
    BOOST_TEST( not cfg.get_pathname("Volume","aplay_bin",
                                     FileCond::MustExist, path2) );
    BOOST_CHECK_EQUAL( path2, path2_default );

    fs::path logdir {"/nowhere"};
    BOOST_TEST( cfg.get_pathname("General","process_log_dir",
                                 FileCond::NA, logdir) );
    BOOST_CHECK_EQUAL( logdir, fs::path("/tmp/roomplay_tconfig_logs") );
}

/// Values that exist but violate their expected type or condition.
///
BOOST_AUTO_TEST_CASE( Invalid_params_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Invalid_params_test";

    Config cfg( ConfName.c_str() );
    cfg.read_config();

    // negative value for an unsigned
    unsigned timeout { 5 };
    BOOST_CHECK_THROW( cfg.get_unsigned("Volume","command_timeout_secs",timeout),
                       Config_error );
    BOOST_CHECK_EQUAL( timeout, 5u );

    // string where a number is expected
    unsigned n { 0 };
    BOOST_CHECK_THROW( cfg.get_unsigned("Volume","mixer_control",n), Config_error );
    BOOST_CHECK_EQUAL( n, 0u );

    // section that is not an object
    std::string s;
    BOOST_CHECK_THROW( cfg.get_string("Broken","anything",s), Config_error );

    // this path exists but must not
    fs::path shpath {"/bin/sh"};
    BOOST_CHECK_THROW( cfg.get_pathname("Volume","aplay_bin",
                                        FileCond::MustNotExist, shpath),
                       Config_path_error );

    // the path given in the JSON does not exist
    fs::path invalidpath {"/tmp"};
    BOOST_CHECK_THROW( cfg.get_pathname("Snapcast","secret_path",
                                        FileCond::MustExist, invalidpath),
                       Config_path_error );
}

/// The modules read their timing sections as counts; a negative
/// count is refused.
///
BOOST_AUTO_TEST_CASE( Module_sections_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Module_sections_test";

    Config cfg( ConfName.c_str() );
    cfg.read_config();

    fs::path logdir = fs::temp_directory_path() / fs::unique_path( "tconfig-%%%%%%" );
    {
        Process_supervisor sup( logdir );
        BOOST_CHECK_NO_THROW( sup.configure( cfg ) );
    }
    fs::remove_all( logdir );

    Status_monitor mon( []() { return Status_map(); } );
    mon.configure( cfg );
    BOOST_CHECK_EQUAL( mon.interval_ms(), 3000 );

    Alsa_volume_service vs;
    BOOST_CHECK_THROW( vs.configure( cfg ), Config_error );   // -2 seconds
}

/// Missing and malformed files.
///
BOOST_AUTO_TEST_CASE( Config_file_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Config_file_test";

    Config nofile( "/no/such/dir/roomplay.json" );
    BOOST_CHECK_THROW( nofile.read_config(), Config_file_error );

    fs::path bad = fs::temp_directory_path() / fs::unique_path( "tconfig-%%%%%%.json" );
    {
        fs::ofstream ofs( bad );
        ofs << "{ \"schema\": \"1.0\", \"General\": ";
    }
    Config badcfg( bad.c_str() );
    BOOST_CHECK_THROW( badcfg.read_config(), Config_file_error );

    {
        fs::ofstream ofs( bad, std::ios::trunc );
        ofs << "[1, 2, 3]\n";
    }
    BOOST_CHECK_THROW( badcfg.read_config(), Config_file_error );

    {
        fs::ofstream ofs( bad, std::ios::trunc );
        ofs << "{ \"General\": {} }\n";
    }
    badcfg.read_config();
    BOOST_TEST( badcfg.get_schema() == "unknown" );
    BOOST_TEST( not badcfg.file_has_changed() );
    fs::last_write_time( bad, badcfg.last_file_write() + 10 );
    BOOST_TEST( badcfg.file_has_changed() );
    fs::remove( bad );
    BOOST_TEST( badcfg.file_has_changed() );
}

/// Helpers in configutil
///
BOOST_AUTO_TEST_CASE( Config_util_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Config_util_test";

    const char *home = getenv( "HOME" );
    if (home) {
        BOOST_CHECK_EQUAL( expand_home("~/x/y.json"), fs::path(home) / "x/y.json" );
    }
    BOOST_CHECK_EQUAL( expand_home("/abs/path"), fs::path("/abs/path") );

    fs::path sh;
    BOOST_TEST( find_in_path( "sh", sh ) );
    BOOST_TEST( fs::exists( sh ) );
    fs::path nothing;
    BOOST_TEST( not find_in_path( "no-such-binary-roomplay", nothing ) );
    BOOST_TEST( fs::is_directory( runtime_dir() ) );
}
