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

#include <string>
#include <boost/filesystem.hpp>

/// Expand a leading '~' to $HOME.
boost::filesystem::path expand_home(boost::filesystem::path);

/// Locate an executable by name on $PATH (or verify an explicit path).
bool find_in_path( const std::string &, boost::filesystem::path & );

/// Runtime directory for small status files.
boost::filesystem::path runtime_dir();
