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

#include <exception>
#include <string>
#include <vector>
#include <map>


/// Outcome of an operation requested by the transport layer.  The
/// message is meant for display; ok==true may still carry a warning.
///
struct Op_result {
    bool ok {false};
    std::string message {};

    static Op_result success( const std::string &m ) { return {true, m}; }
    static Op_result failure( const std::string &m ) { return {false, m}; }
};


/// An executable invocation: binary name followed by its arguments.
using Command = std::vector<std::string>;

/// Player name to running flag.
using Status_map = std::map<std::string,bool>;


/// Thrown when the player store cannot be read or written.
///
struct Store_error : public std::exception {
    const char* what() const throw() { return "Player store exception"; }
};


/// Range limits on player parameters
constexpr int MinVolume {0};
constexpr int MaxVolume {100};
constexpr int DefaultVolume {75};
constexpr int MinDelayMs {-1000};
constexpr int MaxDelayMs {1000};
