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

#include <ctime>
#include <chrono>
#include <boost/filesystem/fstream.hpp>
#include <jsoncpp/json/json.h>

#include "statmon.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace fs = boost::filesystem;

/// Listener failures logged individually before thinning out
constexpr unsigned LogFirstFailures {3};
constexpr unsigned LogEveryNthFailure {10};


/// Pro forma destructor is required even though pure virtual interface.
Status_listener::~Status_listener() { }


void Log_status_listener::publish( const Status_map &sm )
{
    for (const auto &pr : sm) {
        auto it = m_last.find( pr.first );
        if (it == m_last.end()) {
            if (not m_first or pr.second) {
                LOG_INFO(Lgr) << "Player '" << pr.first << "' "
                              << (pr.second ? "running" : "stopped");
            }
        } else if (it->second != pr.second) {
            LOG_INFO(Lgr) << "Player '" << pr.first << "' "
                          << (pr.second ? "is now running" : "has stopped");
        }
    }
    m_last = sm;
    m_first = false;
}

//////////////////////////////////////////////////////////////////////////

Status_file_listener::Status_file_listener( const fs::path &p )
    : m_path( p )
{
}

/// * May throw Status_publish_error
///
void Status_file_listener::publish( const Status_map &sm )
{
    Json::Value root { Json::objectValue };
    root["time"] = Json::Int64( time(0) );
    Json::Value jp { Json::objectValue };
    for (const auto &pr : sm) {
        jp[pr.first] = pr.second;
    }
    root["players"] = jp;

    fs::path tmp = m_path;
    tmp += ".tmp";
    {
        fs::ofstream ofs( tmp, std::ios::out | std::ios::trunc );
        if (not ofs) {
            throw Status_publish_error();
        }
        Json::StreamWriterBuilder wbuilder;
        wbuilder["indentation"] = "";
        std::unique_ptr<Json::StreamWriter> writer( wbuilder.newStreamWriter() );
        writer->write( root, &ofs );
        ofs << "\n";
        if (not ofs) {
            throw Status_publish_error();
        }
    }
    boost::system::error_code ec;
    fs::rename( tmp, m_path, ec );
    if (ec) {
        throw Status_publish_error();
    }
}

void Status_file_listener::remove_file()
{
    boost::system::error_code ec;
    fs::remove( m_path, ec );
}

//////////////////////////////////////////////////////////////////////////
///                           Status_monitor

/// CTOR
Status_monitor::Status_monitor( Snapshot_fn fn )
    : m_snapshot( fn )
{
}

/// DTOR
Status_monitor::~Status_monitor()
{
    stop();
}

/// Read the Monitor section.
/// * May throw Config_error
///
void Status_monitor::configure( Config &cfg )
{
    unsigned interval = static_cast<unsigned>( m_interval_ms / 1000 );
    unsigned delay = static_cast<unsigned>( m_error_delay_ms / 1000 );
    cfg.get_unsigned( "Monitor", "interval_secs", interval );
    cfg.get_unsigned( "Monitor", "error_delay_secs", delay );
    if (interval < 1) {
        LOG_ERROR(Lgr) << "Monitor timing values out of range";
        throw Config_error();
    }
    set_timing( interval * 1000L, delay * 1000L );
}

void Status_monitor::set_timing( long interval_ms, long error_delay_ms )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    m_interval_ms = interval_ms;
    m_error_delay_ms = error_delay_ms;
}

void Status_monitor::add_listener( spStatus_listener sl )
{
    if (not sl) return;
    std::lock_guard<std::mutex> lock( m_mutex );
    m_slots.push_back( Slot { sl, 0 } );
    LOG_DEBUG(Lgr) << "Status_monitor: added listener " << sl->name();
}

/// Take one snapshot and publish it.  Returns false if the snapshot
/// could not be taken (listener failures do not count).  Listeners run
/// without m_mutex held, so they may query the monitor.
///
bool Status_monitor::poll_once()
{
    Status_map sm;
    try {
        sm = m_snapshot();
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "Status_monitor: snapshot failed: " << ex.what();
        return false;
    }
    std::vector<spStatus_listener> listeners;
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        ++m_polls;
        for (const auto &slot : m_slots) {
            listeners.push_back( slot.listener );
        }
    }
    for (const auto &sl : listeners) {
        std::string err;
        try {
            sl->publish( sm );
        }
        catch (std::exception &ex) {
            err = ex.what();
        }
        catch (...) {
            err = "unknown exception";
        }
        record_outcome( sl, err );
    }
    return true;
}

/// Update the failure count of listener sl; err is empty on success.
///
void Status_monitor::record_outcome( const spStatus_listener &sl,
                                     const std::string &err )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    for (auto &slot : m_slots) {
        if (slot.listener != sl) continue;
        if (err.empty()) {
            if (slot.failures > 0) {
                LOG_INFO(Lgr) << "Status listener " << sl->name()
                              << " recovered after " << slot.failures
                              << " failure(s)";
                slot.failures = 0;
            }
        } else {
            ++slot.failures;
            if (slot.failures <= LogFirstFailures
                or (slot.failures % LogEveryNthFailure) == 0) {
                LOG_WARNING(Lgr) << "Status listener " << sl->name()
                                 << " failed (" << slot.failures << "): "
                                 << err;
            }
        }
        return;
    }
}

/// Thread body: poll, then sleep until the next interval or stop().
///
void Status_monitor::worker()
{
    LOG_INFO(Lgr) << "Status_monitor started";
    while (true) {
        bool ok = poll_once();
        std::unique_lock<std::mutex> lock( m_mutex );
        long wait_ms = ok ? m_interval_ms : m_error_delay_ms;
        m_cv.wait_for( lock, std::chrono::milliseconds(wait_ms),
                       [this]{ return m_stop; } );
        if (m_stop) break;
    }
    LOG_INFO(Lgr) << "Status_monitor stopped";
}

void Status_monitor::start()
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if (m_thread) {
        LOG_WARNING(Lgr) << "Status_monitor already running";
        return;
    }
    m_stop = false;
    m_thread.reset( new std::thread( &Status_monitor::worker, this ) );
}

void Status_monitor::stop()
{
    std::unique_ptr<std::thread> th;
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_stop = true;
        th.swap( m_thread );
    }
    m_cv.notify_all();
    if (th and th->joinable()) {
        th->join();
    }
}

bool Status_monitor::running() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return (m_thread != nullptr);
}

/// Consecutive failures of the named listener.
///
unsigned Status_monitor::failures( const std::string &name ) const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    for (const auto &slot : m_slots) {
        if (name == slot.listener->name()) return slot.failures;
    }
    return 0;
}

unsigned long Status_monitor::polls() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_polls;
}

long Status_monitor::interval_ms() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_interval_ms;
}
