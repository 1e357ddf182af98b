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
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <chrono>
#include <cstring>

#include "cmdrun.hpp"
#include "logging.hpp"


/// Collect everything the child writes to fd until EOF or the deadline.
/// Return false if the deadline passed first.
///
static bool drain( int fd, std::string &out,
                   std::chrono::steady_clock::time_point deadline )
{
    using namespace std::chrono;
    char buf[1024];
    while (true) {
        long left = duration_cast<milliseconds>(
            deadline - steady_clock::now()).count();
        if (left <= 0) return false;
        struct pollfd pfd { fd, POLLIN, 0 };
        int rc = poll( &pfd, 1, static_cast<int>(left) );
        if (rc < 0) {
            if (errno == EINTR) continue;
            return true;
        }
        if (rc == 0) return false;
        ssize_t n = read( fd, buf, sizeof(buf) );
        if (n < 0) {
            if (errno == EINTR) continue;
            return true;
        }
        if (n == 0) return true;  // EOF
        out.append( buf, static_cast<size_t>(n) );
    }
}

/// Run a helper and capture its output.  The helper gets /dev/null for
/// stdin and shares one pipe for stdout and stderr.  The pipe is
/// close-on-exec so players started meanwhile do not inherit it.  On timeout the
/// helper is killed and reaped.
///
/// Returns the exit status, or one of RC_NOEXEC, RC_TIMEOUT, RC_SIGNAL.
///
int run_capture( const std::vector<std::string> &argv,
                 std::string &out,
                 long timeout_ms )
{
    out.clear();
    if (argv.empty()) return RC_NOEXEC;

    std::vector<char*> cargs;
    for (const auto &a : argv) {
        cargs.push_back( const_cast<char*>(a.c_str()) );
    }
    cargs.push_back( nullptr );

    int pfd[2];
    if (pipe2( pfd, O_CLOEXEC ) < 0) {
        LOG_ERROR(Lgr) << "run_capture: pipe failed: " << strerror(errno);
        return RC_NOEXEC;
    }
    pid_t pid = fork();
    if (pid < 0) {
        LOG_ERROR(Lgr) << "run_capture: fork failed: " << strerror(errno);
        close( pfd[0] );
        close( pfd[1] );
        return RC_NOEXEC;
    }
    if (pid == 0) {
        // child: only async-signal-safe calls from here
        int nfd = open( "/dev/null", O_RDONLY|O_CLOEXEC );
        if (nfd >= 0) { dup2( nfd, STDIN_FILENO ); close( nfd ); }
        dup2( pfd[1], STDOUT_FILENO );
        dup2( pfd[1], STDERR_FILENO );
        close( pfd[0] );
        close( pfd[1] );
        execvp( cargs[0], cargs.data() );
        _exit( 127 );
    }
    close( pfd[1] );
    auto deadline = std::chrono::steady_clock::now()
        + std::chrono::milliseconds( timeout_ms );
    bool finished = drain( pfd[0], out, deadline );
    close( pfd[0] );

    int status = 0;
    if (not finished) {
        LOG_WARNING(Lgr) << "run_capture: " << argv[0] << " timed out after "
                         << timeout_ms << " ms";
        kill( pid, SIGKILL );
        while (waitpid( pid, &status, 0 ) < 0 and errno == EINTR) {}
        return RC_TIMEOUT;
    }
    // output closed; the child is exiting or already gone
    while (waitpid( pid, &status, 0 ) < 0) {
        if (errno != EINTR) return RC_SIGNAL;
    }
    if (WIFEXITED(status)) {
        int rc = WEXITSTATUS(status);
        if (rc == 127) {
            LOG_DEBUG(Lgr) << "run_capture: " << argv[0]
                           << " could not be executed";
            return RC_NOEXEC;
        }
        return rc;
    }
    return RC_SIGNAL;
}
