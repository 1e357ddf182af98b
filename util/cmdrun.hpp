#pragma once

/* Run a short-lived helper program and capture its output.
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

#include <string>
#include <vector>

/// Special results of run_capture (otherwise the exit status 0..255):
enum {
    RC_NOEXEC  = (-1),     //! could not fork or exec the program
    RC_TIMEOUT = (-2),     //! killed after the time limit
    RC_SIGNAL  = (-3)      //! terminated by some other signal
};

/// Run argv[0] (searched on $PATH) with the remaining arguments, wait
/// at most timeout_ms, and collect stdout+stderr into out.
///
int run_capture( const std::vector<std::string> &argv,
                 std::string &out,
                 long timeout_ms );
