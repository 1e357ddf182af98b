#pragma once

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

#include <sys/types.h>
#include <sys/wait.h>
#include <vector>
#include <mutex>
#include <memory>
#include <string>
#include <utility>

#include <boost/filesystem.hpp>
#include "logging.hpp"
#include "procgroup.hpp"

#include "cmexceptions.hpp"

/// Some symbolic values used in Child_mgr:
///
enum { NOTAPID=(-1) };

/// Commanded and observed phases of child operation:
///
enum class ChildPhase {
    gone,                       //! process terminated (or never started)
    running,                    //! process running
    unknown                     //! state cannot be determined
};

///////////////////////////////////////////////////////////////////////

/**
 * Child_mgr
 *   Class that manages one child process: start, probe, signal, kill.
 * Each instance is associated with a binary and a set of arguments.
 * The binary is resolved the way execvp() does, so a bare name is
 * searched for on $PATH.
 *
 * The child is launched in its own process group (per the configured
 * Group_signaller) with stdin from /dev/null and stdout/stderr appended
 * to a log file.  A failed exec is reported back to start_child()
 * through a close-on-exec pipe, so a missing binary is detected
 * synchronously and distinguished from other exec errors.
 *
 * Liveness is observed by polling waitpid(pid, WNOHANG) on demand;
 * nothing is cached between probes, and no SIGCHLD handler is
 * installed, so other code in the process may run and reap its own
 * subprocesses freely.
 *
 * Typical usage:
 *
 *   spCM cm = Child_mgr::create( "kitchen" );   // shared pointer
 *   cm->set_binary( "squeezelite" );
 *   cm->set_log_path( "/var/log/roomplay/kitchen.log" );
 *   cm->set_args( {"-n", "Kitchen"} );
 *   cm->start_child();          // may throw CM_start_exception et al.
 *   cm->running();              // waitpid probe
 *   cm->kill_child(false, 5000) // SIGTERM to group, wait up to 5s
 *
 * Thread safe: all members lock m_mutex; waits poll without holding it.
 */
class Child_mgr : public std::enable_shared_from_this<Child_mgr>
{
private:
    mutable std::mutex m_mutex {};
    pid_t m_pid {NOTAPID};             // last pid seen running
    int m_exit_status {0};             // last exit status or signal
    int m_exit_reason {0};             // CLD_EXITED or CLD_KILLED
    int m_terminate   {0};             // last kill signal (0 if none)
    ChildPhase m_obs_phase = ChildPhase::gone;
    std::vector<std::string> m_args {};   // cached args
    std::string m_binary {};           // executable name or path
    boost::filesystem::path m_log_path {}; // stdout+stderr, or /dev/null
    off_t m_log_offset {0};            // log size when last started
    std::string m_name {};             // user friendly name
    spSignaller m_signaller { default_signaller() };
    //
    void postmortem( int, int );
    void probe_locked();
    void presume_dead();
    Child_mgr();
    Child_mgr( const std::string& );

public:
    static const char* phase_name( ChildPhase );
    //
    void set_args( const std::vector<std::string>& );
    //
    std::string exit_description() const;
    pid_t get_pid() const;
    bool kill_child(bool force, long wait_ms);
    ChildPhase poll_phase();
    bool running();
    void set_binary( const std::string & );
    void set_log_path( const boost::filesystem::path & );
    void set_signaller( spSignaller );
    void start_child();
    std::string log_tail( size_t ) const;
    bool wait_for_exit( long wait_ms );
    // factory
    template<typename... Ts>
    static std::shared_ptr<Child_mgr> create(Ts&&... params)
    {
        return std::shared_ptr<Child_mgr>(
            new Child_mgr(std::forward<Ts>(params)...));
    }
    ~Child_mgr();
};

/// smart pointer to a Child_mgr:
using spCM = std::shared_ptr<Child_mgr>;
