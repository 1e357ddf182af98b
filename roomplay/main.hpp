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

#include <signal.h>
#include <string>

namespace Main {
    extern const char *AppName;
    extern ::std::string DefaultConfigPath;
    // set by signal handlers, polled by the daemon loop
    extern volatile sig_atomic_t ReloadReq;
    extern volatile sig_atomic_t Terminate;
    extern volatile sig_atomic_t gTermSignal;

    void log_banner(bool);
}
