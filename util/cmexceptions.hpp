#pragma once
/// Exceptions for Child_mgr and friends


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

/// Thrown on problem with child processes
struct CM_exception : public std::exception {
    const char* what() const throw() { return "Child_mgr exception"; }
};

/// Occurs when we cannot start a child process (fork, pipe, log file).
struct CM_start_exception : public CM_exception {
    const char* what() const throw() {
        return "Child_mgr failed to start child process";
    }
};

/// The binary could not be found (exec reported ENOENT).
struct CM_binary_missing_exception : public CM_start_exception {
    const char* what() const throw() {
        return "Child_mgr binary not found";
    }
};

/// Exec of the binary failed for some reason other than ENOENT;
/// the errno reported by the child is kept.
struct CM_exec_exception : public CM_start_exception {
    int m_errno {0};
    explicit CM_exec_exception(int e) : m_errno(e) {}
    const char* what() const throw() {
        return "Child_mgr failed to exec binary";
    }
};
