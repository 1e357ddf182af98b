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

#include <errno.h>
#include <unistd.h>
#include <signal.h>

#include <iostream>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include "jobutil.hpp"
#include "configutil.hpp"


namespace fs = boost::filesystem;

///////////////////////////////////////////////////////////////////////////


/// Compute the pid file path: "<prog>.pid" in runtime_dir().
///
static fs::path get_pid_path( const char* prog )
{
    std::string fname(prog);
    fname += ".pid";
    return runtime_dir() / fname;
}

/// Attempt to read a pid from the ppath, storing in pid if successful.
/// Return true on success, else false.
///
static bool read_pid( const fs::path &ppath, pid_t &pid )
{
    pid = 0;
    fs::ifstream ifs( ppath );
    if (!ifs.fail()) {
        ifs >> pid;
        return (pid > 0);
    }
    return false;
}

/// Check to see if this pid exists by sending it a 0 signal.  Return
/// true if it seems to exist (doesn't mean it is in a good state).
///
static bool is_live_pid( pid_t pid )
{
    if (0==kill(pid,0)) {
        return true;
    }
    return (errno != ESRCH);
}


/////////////////////////////////// API ///////////////////////////////////

/// Test for the presence of the pidfile named by prog.
/// Return 0 if no live pid found, or the running pid if found.
/// A pid file naming our own pid does not count.
///
pid_t is_running(const char *prog)
{
    pid_t pid=0;
    fs::path pidpath = get_pid_path(prog);

    if (fs::exists(pidpath)) {
        if (read_pid( pidpath, pid )) {
            bool livep = (pid != getpid()) and is_live_pid( pid );
            std::cerr << "PID file " << pidpath << " with PID=" << pid
                      << (livep ? " and is alive" : " but is dead") << std::endl;
            return (livep ? pid : 0);
        }
        std::cerr << "Failed to read a live pid from "
                  << pidpath << std::endl;
    }
    return 0;
}


/// Write our pid to the pidfile named by prog.
/// Return (-1) if we could not create this file.
///
int mark_running( const char *prog )
{
    fs::path pidpath = get_pid_path(prog);
    fs::ofstream  pofs( pidpath );
    if (pofs.fail()) {
        return (-1);
    }
    pofs << getpid();
    return 0;
}


/// Delete the pidfile for prog.  Not an error if this pidfile does
/// not exist.
///
void mark_ended( const char *prog )
{
    boost::system::error_code ec;
    fs::remove( get_pid_path(prog), ec );
    if (ec) {
        std::cerr << "Failed to delete pidfile for " << prog
                  << ": " << ec.message() << std::endl;
    }
}
