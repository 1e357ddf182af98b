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
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <stdexcept>
#include <vector>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include "configutil.hpp"

namespace fs = boost::filesystem;
using namespace std;

////////////////////////////////////////////////////////////////////////


/// Expand a leading '~' to the home directory in the argument path,
/// and return the result.  This relies on *nix specific environment
/// variable HOME. It emulates the shell in a limited way: "~user"
/// forms are not supported.
///
/// Will throw invalid_argument error if HOME is needed but unset.
///
fs::path expand_home(fs::path inpath)
{
    if (inpath.size() < 1) return inpath;
    string out { inpath.c_str() };
    if (out[0] == '~') {
        char const* phome = getenv("HOME");
        if (nullptr == phome) {
            throw invalid_argument("HOME not set in environment.");
        }
        out.replace(0, 1, phome);
        return fs::path(out);
    }
    return inpath;
}

////////////////////////////////////////////////////////////////////////

////////////////////////////////////////////////////////////////////////

/// Resolve binary name prog the way execvp() would: a name containing
/// a '/' is taken as a path, anything else is searched for in each
/// directory of $PATH.  On success the resolved path is stored in
/// found and true is returned.
///
/// * Will NOT throw
///
bool find_in_path( const std::string &prog, fs::path &found )
{
    if (prog.empty()) return false;
    if (prog.find('/') != string::npos) {
        if (0 == access(prog.c_str(), X_OK)) {
            found = prog;
            return true;
        }
        return false;
    }
    const char *penv = getenv("PATH");
    string pathvar { penv ? penv : "/usr/local/bin:/usr/bin:/bin" };
    vector<string> dirs;
    boost::algorithm::split( dirs, pathvar, boost::algorithm::is_any_of(":") );
    for (const auto &d : dirs) {
        fs::path candidate = fs::path(d.empty() ? "." : d) / prog;
        boost::system::error_code ec;
        if (fs::is_regular_file(candidate, ec)
            and (0 == access(candidate.c_str(), X_OK))) {
            found = candidate;
            return true;
        }
    }
    return false;
}

/// Directory for run-time status files: $XDG_RUNTIME_DIR when set,
/// otherwise /tmp.
///
fs::path runtime_dir()
{
    const char *rtdir = getenv("XDG_RUNTIME_DIR");
    if (rtdir and *rtdir) {
        return fs::path(rtdir);
    }
    return fs::path("/tmp");
}
