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
#include <signal.h>
#include <unistd.h>

#include "procgroup.hpp"


/// In the child: start a new session.  Failure (already a group
/// leader) is harmless; the child then shares our group, and killpg
/// on its pid will fail over to a plain kill().
///
void Pgroup_signaller::child_setup() const
{
    (void) setsid();
}

/// Signal the group led by pid.  If there is no such group (setsid
/// failed in the child) signal pid alone.
///
int Pgroup_signaller::signal( pid_t pid, int sig ) const
{
    if (0 == killpg( pid, sig )) {
        return 0;
    }
    if (errno == ESRCH) {
        if (0 == kill( pid, sig )) {
            return 0;
        }
    }
    return errno;
}

int Pid_signaller::signal( pid_t pid, int sig ) const
{
    if (0 == kill( pid, sig )) {
        return 0;
    }
    return errno;
}


spSignaller default_signaller()
{
#if defined(_POSIX_JOB_CONTROL) && (_POSIX_JOB_CONTROL > 0)
    static spSignaller s = std::make_shared<Pgroup_signaller>();
#else
    static spSignaller s = std::make_shared<Pid_signaller>();
#endif
    return s;
}
