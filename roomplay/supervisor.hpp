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

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

#include "common.hpp"
#include "childmgr.hpp"

class Config;


/**
 * Process_supervisor
 *   Owns one child process per player name.  Lifecycle of a name:
 *
 *     absent -> starting -> running [fallback] -> stopping -> absent
 *
 * The "starting" and "stopping" entries are placeholders held while a
 * start is in its grace period or a stop is escalating; they make the
 * "already running" test and the registration one atomic step, so two
 * starts of the same name cannot both succeed.  The map lock is never
 * held across a sleep.
 *
 * Liveness is probed afresh on every query; a child that died on its
 * own is reported as not running and is reaped by the next stop or
 * cleanup_dead_processes() call.
 *
 * Nothing here throws to the caller except the constructor, which must
 * be able to create the log directory.
 */
class Process_supervisor {
private:
    enum class Slot { starting, running, stopping };
    struct Entry {
        spCM cm {};
        Slot slot { Slot::starting };
        bool fallback {false};
    };
    mutable std::mutex m_mutex {};
    std::map<std::string,Entry> m_procs {};
    boost::filesystem::path m_log_dir;
    long m_grace_ms {500};
    long m_stop_ms {5000};
    long m_kill_ms {2000};
    spSignaller m_signaller { default_signaller() };
    //
    spCM launch( const std::string&, const Command&, bool&, std::string& );
public:
    explicit Process_supervisor( const boost::filesystem::path& );
    ~Process_supervisor();
    //
    void configure( Config& );
    void set_timing( long /*grace_ms*/, long /*stop_ms*/, long /*kill_ms*/ );
    void set_signaller( spSignaller );
    //
    Op_result start( const std::string&, const Command&,
                     const Command &fallback = Command(),
                     bool *used_fallback = nullptr );
    Op_result stop( const std::string& );
    bool is_running( const std::string& );
    bool is_degraded( const std::string& ) const;
    pid_t get_pid( const std::string& ) const;
    Status_map get_all_statuses( const std::vector<std::string>& );
    std::vector<std::string> cleanup_dead_processes();
    int stop_all();
    boost::filesystem::path get_log_path( const std::string& ) const;
};
