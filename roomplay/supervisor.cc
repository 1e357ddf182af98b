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

#include <string.h>
#include <chrono>
#include <thread>
#include <boost/algorithm/string/join.hpp>

#include "supervisor.hpp"
#include "config.hpp"
#include "logging.hpp"

/// Bytes of the child's log quoted in an immediate-failure message
constexpr size_t FailureTailBytes {400};


/// CTOR.  Creates the log directory.
/// * May throw boost::filesystem::filesystem_error
///
Process_supervisor::Process_supervisor( const boost::filesystem::path &logdir )
    : m_log_dir( logdir )
{
    boost::filesystem::create_directories( m_log_dir );
    LOG_INFO(Lgr) << "Process_supervisor logs to " << m_log_dir;
}

/// DTOR.  Children are not stopped here; the owner calls stop_all().
Process_supervisor::~Process_supervisor()
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if (not m_procs.empty()) {
        LOG_WARNING(Lgr) << "Process_supervisor destroyed with "
                         << m_procs.size() << " tracked process(es)";
    }
}

/// Read timing from the Supervisor section.
/// * May throw Config_error
///
void Process_supervisor::configure( Config &cfg )
{
    unsigned grace = static_cast<unsigned>( m_grace_ms );
    unsigned stop_s = static_cast<unsigned>( m_stop_ms / 1000 );
    unsigned kill_s = static_cast<unsigned>( m_kill_ms / 1000 );
    cfg.get_unsigned( "Supervisor", "startup_grace_ms", grace );
    cfg.get_unsigned( "Supervisor", "stop_timeout_secs", stop_s );
    cfg.get_unsigned( "Supervisor", "kill_timeout_secs", kill_s );
    if (stop_s < 1 or kill_s < 1) {
        LOG_ERROR(Lgr) << "Supervisor timing values out of range";
        throw Config_error();
    }
    set_timing( grace, stop_s * 1000L, kill_s * 1000L );
}

void Process_supervisor::set_timing( long grace_ms, long stop_ms, long kill_ms )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    m_grace_ms = grace_ms;
    m_stop_ms = stop_ms;
    m_kill_ms = kill_ms;
    LOG_DEBUG(Lgr) << "Supervisor timing: grace " << grace_ms
                   << "ms, stop " << stop_ms << "ms, kill " << kill_ms << "ms";
}

void Process_supervisor::set_signaller( spSignaller sg )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if (sg) m_signaller = sg;
}

/// "<log dir>/<name>.log"
///
boost::filesystem::path
Process_supervisor::get_log_path( const std::string &name ) const
{
    return m_log_dir / (name + ".log");
}

/// Start cmd and wait out the grace period.  Returns the live child,
/// or null with errmsg set.  missing is set if the binary was not
/// found.  Called without m_mutex held.
///
spCM Process_supervisor::launch( const std::string &name, const Command &cmd,
                                 bool &missing, std::string &errmsg )
{
    missing = false;
    if (cmd.empty()) {
        errmsg = "Empty command";
        return spCM();
    }
    long grace;
    spSignaller sg;
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        grace = m_grace_ms;
        sg = m_signaller;
    }
    spCM cm = Child_mgr::create( name );
    cm->set_binary( cmd.front() );
    cm->set_args( Command( cmd.begin()+1, cmd.end() ) );
    cm->set_log_path( get_log_path(name) );
    cm->set_signaller( sg );
    LOG_INFO(Lgr) << "Starting process '" << name << "' with command: "
                  << boost::algorithm::join( cmd, " " );
    try {
        cm->start_child();
    }
    catch (CM_binary_missing_exception&) {
        missing = true;
        errmsg = "Binary '" + cmd.front() + "' not found";
        return spCM();
    }
    catch (CM_exec_exception &ex) {
        errmsg = "Cannot execute '" + cmd.front() + "': " + strerror(ex.m_errno);
        return spCM();
    }
    catch (CM_exception &ex) {
        errmsg = std::string("Error starting process: ") + ex.what();
        return spCM();
    }
    std::this_thread::sleep_for( std::chrono::milliseconds(grace) );
    if (not cm->running()) {
        errmsg = "exited immediately with " + cm->exit_description();
        std::string tail = cm->log_tail( FailureTailBytes );
        if (not tail.empty()) {
            errmsg += ": " + tail;
        }
        return spCM();
    }
    return cm;
}

/// Start a process for name.  If the primary command dies within the
/// grace period and a fallback is given, the fallback is tried.  On
/// success *used_fallback tells which command is running.
///
Op_result Process_supervisor::start( const std::string &name,
                                     const Command &cmd,
                                     const Command &fallback,
                                     bool *used_fallback )
{
    if (used_fallback) *used_fallback = false;
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        auto it = m_procs.find( name );
        if (it != m_procs.end()) {
            const Entry &e = it->second;
            if (e.slot != Slot::running or e.cm->running()) {
                LOG_WARNING(Lgr) << "Process '" << name << "' is already running";
                return Op_result::failure( "Process '" + name + "' is already running" );
            }
            LOG_INFO(Lgr) << "Reaping exited process '" << name << "' ("
                          << e.cm->exit_description() << ")";
            m_procs.erase( it );
        }
        m_procs[name] = Entry();        // starting placeholder
    }

    bool missing = false;
    bool fell_back = false;
    std::string err;
    spCM cm = launch( name, cmd, missing, err );
    Op_result result;
    if (cm) {
        result = Op_result::success( "Process '" + name + "' started successfully" );
    } else {
        LOG_ERROR(Lgr) << "Process '" << name << "' failed to start: " << err;
        if (missing or fallback.empty()) {
            result = Op_result::failure( missing ? err
                                         : "Process failed to start: " + err );
        } else {
            LOG_INFO(Lgr) << "Trying fallback command for '" << name << "'";
            std::string err2;
            cm = launch( name, fallback, missing, err2 );
            if (cm) {
                fell_back = true;
                result = Op_result::success(
                    "Process '" + name + "' started with fallback configuration" );
            } else {
                LOG_ERROR(Lgr) << "Fallback for '" << name << "' failed: " << err2;
                result = Op_result::failure( "Process failed to start: " + err
                                             + "; fallback also failed: " + err2 );
            }
        }
    }

    std::lock_guard<std::mutex> lock( m_mutex );
    if (cm) {
        Entry &e = m_procs[name];
        e.cm = cm;
        e.slot = Slot::running;
        e.fallback = fell_back;
        if (used_fallback) *used_fallback = fell_back;
        LOG_INFO(Lgr) << "Started process '" << name << "' with PID "
                      << cm->get_pid() << (fell_back ? " (fallback)" : "");
    } else {
        m_procs.erase( name );
    }
    return result;
}

/// Stop the process for name: SIGTERM to its group, then SIGKILL if
/// it outlives the stop timeout.  The entry is dropped in every case.
///
Op_result Process_supervisor::stop( const std::string &name )
{
    spCM cm;
    long stop_ms, kill_ms;
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        auto it = m_procs.find( name );
        if (it == m_procs.end()) {
            return Op_result::failure( "Process '" + name + "' not found" );
        }
        Entry &e = it->second;
        if (e.slot == Slot::starting) {
            return Op_result::failure( "Process '" + name + "' is still starting" );
        }
        if (e.slot == Slot::stopping) {
            return Op_result::failure( "Process '" + name + "' is already stopping" );
        }
        if (not e.cm->running()) {
            LOG_INFO(Lgr) << "Process '" << name << "' had already exited ("
                          << e.cm->exit_description() << ")";
            m_procs.erase( it );
            return Op_result::failure( "Process '" + name + "' was not running" );
        }
        e.slot = Slot::stopping;
        cm = e.cm;
        stop_ms = m_stop_ms;
        kill_ms = m_kill_ms;
    }

    bool forced = false;
    bool gone = cm->kill_child( false, stop_ms );
    if (not gone) {
        forced = true;
        LOG_WARNING(Lgr) << "Process '" << name
                         << "' ignored SIGTERM; sending SIGKILL";
        gone = cm->kill_child( true, kill_ms );
        if (not gone) {
            LOG_ERROR(Lgr) << "Process '" << name << "' (pid " << cm->get_pid()
                           << ") survived SIGKILL; no longer tracked";
        }
    }
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_procs.erase( name );
    }
    if (forced) {
        LOG_INFO(Lgr) << "Force stopped process '" << name << "'";
        return Op_result::success( "Process '" + name + "' force stopped" );
    }
    LOG_INFO(Lgr) << "Stopped process '" << name << "'";
    return Op_result::success( "Process '" + name + "' stopped successfully" );
}

/// Fresh liveness probe.  A name still in its start grace period is
/// not yet running.
///
bool Process_supervisor::is_running( const std::string &name )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    auto it = m_procs.find( name );
    if (it == m_procs.end() or it->second.slot == Slot::starting) {
        return false;
    }
    return it->second.cm->running();
}

/// True if name is running on its fallback command.
///
bool Process_supervisor::is_degraded( const std::string &name ) const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    auto it = m_procs.find( name );
    return (it != m_procs.end()) and it->second.fallback;
}

pid_t Process_supervisor::get_pid( const std::string &name ) const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    auto it = m_procs.find( name );
    if (it == m_procs.end() or not it->second.cm) {
        return NOTAPID;
    }
    return it->second.cm->get_pid();
}

/// Liveness of every listed name; names never started report false.
///
Status_map
Process_supervisor::get_all_statuses( const std::vector<std::string> &names )
{
    Status_map statuses;
    for (const auto &name : names) {
        statuses[name] = is_running( name );
    }
    return statuses;
}

/// Drop entries whose process exited without a stop() and return
/// their names.
///
std::vector<std::string> Process_supervisor::cleanup_dead_processes()
{
    std::vector<std::string> cleaned;
    std::lock_guard<std::mutex> lock( m_mutex );
    for (auto it = m_procs.begin(); it != m_procs.end(); ) {
        const Entry &e = it->second;
        if (e.slot == Slot::running and not e.cm->running()) {
            LOG_DEBUG(Lgr) << "Cleaned up terminated process '" << it->first
                           << "' (" << e.cm->exit_description() << ")";
            cleaned.push_back( it->first );
            it = m_procs.erase( it );
        } else {
            ++it;
        }
    }
    return cleaned;
}

/// Stop everything; returns how many processes were actually stopped.
///
int Process_supervisor::stop_all()
{
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        for (const auto &pr : m_procs) {
            names.push_back( pr.first );
        }
    }
    int stopped = 0;
    for (const auto &name : names) {
        Op_result r = stop( name );
        if (r.ok) {
            ++stopped;
        } else {
            LOG_INFO(Lgr) << "stop_all: " << r.message;
        }
    }
    LOG_INFO(Lgr) << "Stopped " << stopped << " process(es)";
    return stopped;
}
