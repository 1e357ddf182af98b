/**
 * Roomplay: runs one network audio player process per room, using
 * squeezelite, sendspin or snapclient as configured in a JSON players
 * file, and keeps them alive until told to stop.
 *
 * Expects a configuration file, by default ~/.config/roomplay/roomplay.json,
 * which may name the players file, e.g. ~/.config/roomplay/players.json
 *
 * The program is designed to run for an extended period (months).
 * It responds to signals at runtime:
 *    TERM, INT (^c), QUIT -- stop all players and exit
 *    HUP -- reread the players file
 */

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

#include <cstring>
#include <iostream>
#include <unistd.h>
#include <signal.h>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include "version.h"
#include "main.hpp"
#include "roomplay.hpp"
#include "logging.hpp"
#include "jobutil.hpp"
#include "configutil.hpp"

namespace po = boost::program_options;

/// Our official name, used in pid file
const char *Main::AppName { "roomplay" };

/// Config file unless changed on the command line
std::string Main::DefaultConfigPath { "~/.config/roomplay/roomplay.json" };

/// Set by the signal handler, polled by Roomplay::run()
volatile sig_atomic_t Main::Terminate = 0;
volatile sig_atomic_t Main::gTermSignal = 0;
volatile sig_atomic_t Main::ReloadReq = 0;


/// Log the version and compilation information.
/// If force==false, this will only print every LOG_INTERVAL_SECS,
/// with the intention of getting this info in every log file.
///
void Main::log_banner(bool force)
{
    constexpr const time_t LOG_INTERVAL_SECS { 600 };

    static time_t last=0;
    time_t now = time(0);
    if ( ((now - last) < LOG_INTERVAL_SECS) and not force ) {
        return;
    }
    LOG_INFO(Lgr) << AppName << " version "
                  << VERSION_STR "  built "  __DATE__ " " __TIME__ ;
    last = now;
}


/// Signal handler function for various signals.
/// This is handled in the main loop.
///
static void my_signal_handler(int s)
{
    if ((s == SIGTERM) || (s == SIGINT) || (s==SIGQUIT)) {
        Main::Terminate = 1;
        Main::gTermSignal = s;
    }
    else if (s == SIGHUP) {
        Main::ReloadReq = 1;
    }
}

/// Handle TERM, INT, QUIT and HUP
///
static void setup_term_handler()
{
    struct sigaction sa;
    memset( &sa, 0, sizeof(sa) );
    sa.sa_handler = my_signal_handler;
    sigaction(SIGTERM, &sa, NULL);
    sigaction(SIGINT, &sa, NULL);
    sigaction(SIGQUIT, &sa, NULL);
    sigaction(SIGHUP, &sa, NULL);
}

/// Summary printed by --test
///
static void report( Roomplay &rp )
{
    std::cout << "Providers:\n";
    rp.print_providers( std::cout );
    std::cout << "\nPlayers:\n";
    rp.print_players( std::cout );
    for (const auto &pc : rp.orchestrator().players()) {
        Op_result r = rp.orchestrator().check_player( pc.name );
        if (not r.ok) {
            std::cout << pc.name << ": " << r.message << "\n";
        }
    }
}


////////////////////////////////////////////////////////////////////


/// Top Level Function initializes and finalizes logging, creates
/// a Roomplay object and has it supervise players until stopped by signal.
///
int main(int ac, char **av)
{
    int return_code = 0;
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help","option information")
        ("config",po::value<std::string>(),"use a particular config file")
        ("console","echo log to console in addition to log file")
        ("debug","show debug level messages in logs")
        ("list","list configured players and exit")
        ("providers","list player providers and exit")
        ("test","check configuration and players and exit without running")
        ("version","print version identifier and exit without running");
    po::variables_map vm;
    try {
        po::store( po::parse_command_line(ac,av,desc),vm);
        po::notify(vm);
    } catch( const std::exception &err) {
        std::cerr << "Fatal command line error: " << err.what() << std::endl;
        exit(13);
    }
    if (vm.count("help")) {
        std::cout << desc << "\n";
        exit(0);
    }
    if (vm.count("version")) {
        std::cout << Main::AppName << " version "
                  << VERSION_STR "  built "  __DATE__ " " __TIME__  << "\n";
        exit(0);
    }
    bool report_only = (vm.count("list") or vm.count("providers"));
    bool test_mode = (vm.count("test") > 0) or report_only;
    if (not test_mode) {
        if (is_running(Main::AppName)) {  // one daemon owns the players
            std::cerr  << "Abort: only one copy of " << Main::AppName
                       << " may be running at a time." << std::endl;
            exit(2);
        }
        if (mark_running(Main::AppName)) {
            std::cerr << "Warning: could not write pid file" << std::endl;
        }
    } else if (not report_only) {
        std::cerr << ";;; Test mode\n";
    }
    //
    setup_term_handler();
    auto  logpath = expand_home( "~/logs/roomplay_%5N.log" );
    int log_mode = (vm.count("console") or vm.count("test")
                   ? (LF_FILE|LF_CONSOLE) : LF_FILE);
    if (test_mode) log_mode = LF_CONSOLE;
    if (report_only and not vm.count("console")) log_mode = 0;
    //
    if (vm.count("debug")) { log_mode |= LF_DEBUG; }
    init_logging( Main::AppName, logpath.c_str(), log_mode );
    Main::log_banner(true);
    // -------------------------- RUN --------------------------
    auto rp = std::make_unique<Roomplay>( test_mode );
    try  {
        if (vm.count("config")) {
            std::string cstr { vm["config"].as<std::string>() };
            rp->configure( cstr, true );
        } else {
            rp->configure( Main::DefaultConfigPath, false );
        }
        if (vm.count("list")) {
            rp->print_players( std::cout );
        } else if (vm.count("providers")) {
            rp->print_providers( std::cout );
        } else if (test_mode) {
            report( *rp );
        } else {
            rp->run(); // <==MAY RUN "FOREVER"==
        }
    }
    catch (Config_error &ex) {
        return_code = 1;
        LOG_ERROR(Lgr) << "main: fatal error--" << ex.what();
    }
    catch (std::exception &ex) {
        return_code = 2;
        LOG_ERROR(Lgr) << "main: fatal runtime error--" << ex.what();
    }
    // ---------------------------------------------------------
    int n = rp->shutdown();
    rp.reset();
    LOG_INFO(Lgr) << "Stopped " << n << " player(s); exiting on signal "
                  << Main::gTermSignal;
    finish_logging();
    if (not test_mode) {
        mark_ended(Main::AppName);
    }
    return return_code;
}
