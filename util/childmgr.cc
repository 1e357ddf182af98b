/* Each instance of the Child_mgr class manages a child process.
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

#include "childmgr.hpp"
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <sstream>

/// Interval between liveness probes while waiting for an exit.
static const long PollIntervalMs { 20 };

////////////////////////////////////////////////////////////////////////

/// CTOR. Private.
///
Child_mgr::Child_mgr()
{
}

/// CTOR with friendly name. Private.
///
Child_mgr::Child_mgr( const std::string &nm )
    : m_name(nm)
{
}


/// DTOR.  The child should have been killed prior to this, e.g. via
/// kill_child.  A child that has already exited is reaped here so
/// no zombie is left behind; a live child is left alone.
///
Child_mgr::~Child_mgr()
{
    if (m_pid != NOTAPID) {
        int status = 0;
        (void) waitpid( m_pid, &status, WNOHANG );
    }
}


/// Class method retrieves phase name
///
const char*
Child_mgr::phase_name( ChildPhase p )
{
    switch (p) {
    case ChildPhase::gone:
        return "gone";
    case ChildPhase::running:
        return "running";
    default:
        return "unknown";
    }
}

/// Set the executable: a path, or a bare name to search on $PATH.
void Child_mgr::set_binary( const std::string &b )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_binary = b;
}

/// Child stdout and stderr are appended to this file.  If empty,
/// output is discarded.
void Child_mgr::set_log_path( const boost::filesystem::path &p )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_log_path = p;
}

/// Replace the signalling strategy, e.g. for platforms without groups.
void Child_mgr::set_signaller( spSignaller sg )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (sg) { m_signaller = sg; }
}

/// Replace all arguments (not including argv[0]).
void Child_mgr::set_args( const std::vector<std::string> &args )
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_args = args;
}

pid_t Child_mgr::get_pid() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pid;
}

/// Human readable account of the last exit, e.g. "exit code 1" or
/// "killed by signal 9 (Killed)".
///
std::string Child_mgr::exit_description() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostringstream os;
    if (m_exit_reason == CLD_EXITED) {
        os << "exit code " << m_exit_status;
    } else if (m_exit_reason == CLD_KILLED or m_exit_reason == CLD_DUMPED) {
        os << "killed by signal " << m_exit_status
           << " (" << strsignal(m_exit_status) << ")";
    } else {
        os << "no exit status";
    }
    return os.str();
}

/// Child exited with given status, reason=CLD_EXITED, or was killed,
/// reason=CLD_KILLED.  Caller holds m_mutex.
///
void Child_mgr::postmortem( int status, int reason )
{
    m_pid = NOTAPID;
    m_exit_status = status;
    m_exit_reason = reason;
    m_obs_phase = ChildPhase::gone;
}

/// Presume the child is dead and reset various member vars.
/// Caller holds m_mutex.
///
void Child_mgr::presume_dead()
{
    m_obs_phase = ChildPhase::gone;
    m_pid = NOTAPID;
    m_terminate = 0;
}

/// Probe the child with a non-blocking waitpid(), updating m_obs_phase.
/// Reaps the child if it has exited.  Caller holds m_mutex.
///
/// * Will not throw
///
void Child_mgr::probe_locked()
{
    if (m_pid == NOTAPID) {
        m_obs_phase = ChildPhase::gone;
        return;
    }
    int status = 0;
    pid_t rc = waitpid( m_pid, &status, WNOHANG );
    if (rc == 0) {
        m_obs_phase = ChildPhase::running;
    }
    else if (rc == m_pid) {
        if (WIFEXITED(status)) {
            postmortem( WEXITSTATUS(status), CLD_EXITED );
        } else if (WIFSIGNALED(status)) {
            postmortem( WTERMSIG(status), CLD_KILLED );
        }
        // stopped/continued: still alive
    }
    else if (errno == ECHILD) {
        // somebody else reaped it, or it was never ours
        presume_dead();
    }
    else {
        m_obs_phase = ChildPhase::unknown;
    }
}

/// Probe the child and return the observed phase.
///
ChildPhase Child_mgr::poll_phase()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    probe_locked();
    return m_obs_phase;
}

/// Check run status and return true if child is running.
///
bool Child_mgr::running()
{
    return (poll_phase() == ChildPhase::running);
}

/// Wait up to wait_ms MILLIseconds for the child to exit, probing at
/// short intervals.  Return true if the child is gone.
///
/// * Will NOT throw
///
bool Child_mgr::wait_for_exit( long wait_ms )
{
    long waited = 0;
    for (;;) {
        if (poll_phase() == ChildPhase::gone) {
            return true;
        }
        if (waited >= wait_ms) {
            break;
        }
        long step = std::min(PollIntervalMs, wait_ms - waited);
        struct timespec ts { step / 1000, (step % 1000) * 1'000'000L };
        while (nanosleep( &ts, &ts ) and errno == EINTR) {}
        waited += step;
    }
    LOG_WARNING(Lgr) << "Child " << m_name << "(" << get_pid()
                     << ") persists in phase "
                     << phase_name( poll_phase() ) << " after "
                     << wait_ms << "ms";
    return false;
}


/// Signal the child process (and its group) to terminate: SIGTERM,
/// or SIGKILL if force is set.  Then wait up to wait_ms milliseconds
/// for it to exit.  Returns true if the child is gone afterwards.
///
/// *  Will NOT throw.
///
bool Child_mgr::kill_child( bool force, long wait_ms )
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        probe_locked();
        if (m_obs_phase == ChildPhase::gone) {
            return true;   // was already dead
        }
        m_terminate = (force ? SIGKILL : SIGTERM);

        int err = m_signaller->signal( m_pid, m_terminate );
        if (err) {
            LOG_WARNING(Lgr)
                << "Child_mgr failed to kill " << m_name << " pid=" << m_pid
                << " (" << strerror(err) << ")";
            if (err == ESRCH) {
                presume_dead();
                return true;
            }
            return false;
        }
        LOG_DEBUG(Lgr) << "Child_mgr killed " << m_name << " pid=" << m_pid
            << " signal=" << (SIGTERM==m_terminate ? "SIGTERM" : "SIGKILL")
            << " via " << m_signaller->name();
    }
    return wait_for_exit( wait_ms );
}


/// Launch the child process.  Set binary and args prior to calling
/// this function.  Refuses (throws) if a child is still running.
///
/// * May throw CM_start_exception, CM_binary_missing_exception,
///   or CM_exec_exception.
///
void Child_mgr::start_child()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    probe_locked();
    if (m_obs_phase == ChildPhase::running) {
        LOG_ERROR(Lgr) << "Child_mgr " << m_name << " already has pid "
                       << m_pid;
        throw CM_start_exception();
    }
    //
    std::vector<const char*> argv {};        // captive ptrs to args
    argv.push_back( m_binary.c_str() );      // arg0: the binary
    for (const std::string &s : m_args) {
        argv.push_back(s.c_str());
    }
    argv.push_back(nullptr);                 // terminate arg list

    const char *outpath = (m_log_path.empty() ? "/dev/null"
                                              : m_log_path.c_str());
    int outfd = open( outpath, O_WRONLY|O_CREAT|O_APPEND|O_CLOEXEC, 0644 );
    if (outfd < 0) {
        LOG_ERROR(Lgr) << "Child_mgr for " << m_name << " cannot open "
                       << outpath << ": " << strerror(errno);
        throw CM_start_exception();
    }
    off_t logstart = lseek( outfd, 0, SEEK_END );
    m_log_offset = (logstart > 0) ? logstart : 0;
    int nullfd = open( "/dev/null", O_RDONLY|O_CLOEXEC );
    int errpipe[2];
    if (nullfd < 0 or pipe2( errpipe, O_CLOEXEC )) {
        LOG_ERROR(Lgr) << "Child_mgr for " << m_name
                       << " cannot prepare descriptors: " << strerror(errno);
        close(outfd);
        if (nullfd >= 0) close(nullfd);
        throw CM_start_exception();
    }

    m_exit_status = 0;
    m_exit_reason = 0;
    m_terminate = 0;

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(outfd); close(nullfd);
        close(errpipe[0]); close(errpipe[1]);
        LOG_ERROR(Lgr) << "Child_mgr for " << m_name << " failed to fork "
                       << m_binary << ": " << strerror(err);
        throw CM_start_exception();
    }
    if (pid == 0) {
        // In the child: only async-signal-safe calls from here on.
        m_signaller->child_setup();
        dup2( nullfd, STDIN_FILENO );
        dup2( outfd, STDOUT_FILENO );
        dup2( outfd, STDERR_FILENO );
        execvp( argv[0], const_cast<char* const*>(&argv[0]) );
        int err = errno;
        ssize_t w = write( errpipe[1], &err, sizeof(err) );
        (void) w;
        _exit(127);
    }
    // parent
    close(outfd);
    close(nullfd);
    close(errpipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read( errpipe[0], &child_errno, sizeof(child_errno) );
    } while (n < 0 and errno == EINTR);
    close(errpipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec failed; collect the child that exited with 127
        int status = 0;
        waitpid( pid, &status, 0 );
        m_pid = pid;
        postmortem( WIFEXITED(status) ? WEXITSTATUS(status) : 127,
                    CLD_EXITED );
        LOG_ERROR(Lgr) << "Child_mgr for " << m_name
                       << " failed to exec '" << m_binary << "': "
                       << strerror(child_errno);
        if (child_errno == ENOENT) {
            throw CM_binary_missing_exception();
        }
        throw CM_exec_exception(child_errno);
    }
    m_pid = pid;
    m_obs_phase = ChildPhase::running;
    LOG_INFO(Lgr) << "Child_mgr started " << m_name
                  << " child pid=" << m_pid ;
}


/// Return up to maxbytes from the end of what the latest run wrote to
/// the log file, trimmed of surrounding whitespace.  Empty if there is
/// no log.
///
/// * Will NOT throw
///
std::string Child_mgr::log_tail( size_t maxbytes ) const
{
    boost::filesystem::path lp;
    std::streamoff since = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        lp = m_log_path;
        since = m_log_offset;
    }
    if (lp.empty()) return std::string();
    try {
        std::ifstream ifs( lp.c_str(), std::ios::binary );
        if (not ifs) return std::string();
        ifs.seekg( 0, std::ios::end );
        std::streamoff size = ifs.tellg();
        std::streamoff start =
            (size > static_cast<std::streamoff>(maxbytes))
            ? size - static_cast<std::streamoff>(maxbytes) : 0;
        if (start < since) start = since;
        if (start > size) start = size;
        ifs.seekg( start );
        std::string s( static_cast<size_t>(size - start), '\0' );
        ifs.read( &s[0], size - start );
        const char *ws = " \t\r\n";
        size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos) return std::string();
        size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    } catch (std::exception &err) {
        LOG_DEBUG(Lgr) << "Child_mgr cannot read log " << lp << ": "
                       << err.what();
        return std::string();
    }
}
