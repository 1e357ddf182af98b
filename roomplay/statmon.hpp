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

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/filesystem.hpp>

#include "common.hpp"

class Config;


/// A listener failed to publish a snapshot.
struct Status_publish_error : public std::exception {
    const char* what() const throw() { return "Status publish exception"; }
};


/// Receives each status snapshot.  publish() may throw; the monitor
/// counts and logs the failure and carries on.
///
class Status_listener {
public:
    virtual ~Status_listener()=0;
    virtual const char* name() const = 0;
    virtual void publish( const Status_map& ) = 0;
};

using spStatus_listener = std::shared_ptr<Status_listener>;


/// Logs players that changed between running and stopped.
///
class Log_status_listener : public Status_listener {
private:
    Status_map m_last {};
    bool m_first {true};
public:
    const char* name() const override { return "log"; }
    void publish( const Status_map& ) override;
};


/// Writes each snapshot to a small JSON file:
///   { "time": <epoch secs>, "players": { "<name>": true|false, ... } }
///
class Status_file_listener : public Status_listener {
private:
    boost::filesystem::path m_path;
public:
    explicit Status_file_listener( const boost::filesystem::path& );
    const char* name() const override { return "status-file"; }
    void publish( const Status_map& ) override;
    void remove_file();
};


/**
 * Status_monitor
 *   One background thread that periodically takes a snapshot (normally
 * Player_orchestrator::get_all_statuses) and hands it to every listener.
 * A failing listener never stops the loop or the other listeners.  If
 * taking the snapshot itself fails the next poll is delayed.
 *
 * stop() wakes the thread at once and joins it.
 */
class Status_monitor {
public:
    using Snapshot_fn = std::function<Status_map()>;
private:
    struct Slot {
        spStatus_listener listener;
        unsigned failures {0};
    };
    Snapshot_fn m_snapshot;
    long m_interval_ms {2000};
    long m_error_delay_ms {5000};
    mutable std::mutex m_mutex {};
    std::condition_variable m_cv {};
    bool m_stop {false};
    std::vector<Slot> m_slots {};
    std::unique_ptr<std::thread> m_thread {};
    unsigned long m_polls {0};
    //
    void worker();
    void record_outcome( const spStatus_listener&, const std::string& );
public:
    explicit Status_monitor( Snapshot_fn );
    ~Status_monitor();
    //
    void configure( Config& );
    void set_timing( long /*interval_ms*/, long /*error_delay_ms*/ );
    void add_listener( spStatus_listener );
    bool poll_once();
    void start();
    void stop();
    bool running() const;
    unsigned failures( const std::string& ) const;
    unsigned long polls() const;
    long interval_ms() const;
};
