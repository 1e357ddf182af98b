/**
 * Boost logging setup and teardown functions.
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


/// must define this to use the shared lib
#ifndef BOOST_LOG_DYN_LINK
#define BOOST_LOG_DYN_LINK 1
#endif

#include <iostream>
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>

#include "logging.hpp"

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;
namespace fs = boost::filesystem;

BOOST_LOG_ATTRIBUTE_KEYWORD( thread_id, "ThreadID",
                             logging::attributes::current_thread_id::value_type )

/// Rotation and retention of the daemon log
constexpr unsigned long RotateBytes    { 5UL * 1024 * 1024 };
constexpr unsigned long KeepBytes      { 16UL * 1024 * 1024 };
constexpr unsigned long MinFreeBytes   { 100UL * 1024 * 1024 };
constexpr unsigned      KeepFiles      { 7 };

/// Application name to include
const char* LogAppName=nullptr;

/// Global log source for roomplay:
roomplay_logger_t  Lgr;

/// "2026-10-19 08:15:02 <info> [roomplay] {0x7f..} message"
/// The thread id tells request threads from the status monitor.
///
static void rlog_formatter(logging::record_view const& rec,
                           logging::formatting_ostream& strm)
{
    static const auto stamp = expr::stream
        << expr::format_date_time< boost::posix_time::ptime >
               ("TimeStamp","%Y-%m-%d %H:%M:%S");
    stamp(rec, strm);
    strm << " <" << rec[lt::severity] << "> [" << LogAppName << "] ";
    if (auto tid = rec[thread_id]) {
        strm << "{" << tid.get() << "} ";
    }
    strm << rec[expr::smessage];
}

using file_sink_t = sinks::synchronous_sink< sinks::text_file_backend >;
using os_sink_t = sinks::synchronous_sink< sinks::text_ostream_backend >;

/// Player logs live in their own directory; this is the daemon's log.
/// It rotates at midnight or at RotateBytes, and rotated files go to
/// "old/" beside it.  Flushed per record so a crash loses nothing.
///
static void
init_file_logging( boost::shared_ptr< logging::core > core,
                   const char* file_pattern )
{
    auto backend = boost::make_shared< sinks::text_file_backend >(
        keywords::file_name = file_pattern,
        keywords::rotation_size = RotateBytes,
        keywords::time_based_rotation
            = sinks::file::rotation_at_time_point(0, 0, 0) );
    backend->auto_flush(true);

    fs::path target = fs::path(file_pattern).parent_path();
    if (target.empty()) { target = "."; }
    target /= "old";
    backend->set_file_collector( sinks::file::make_collector(
        keywords::target = target.string(),
        keywords::max_size = KeepBytes,
        keywords::min_free_space = MinFreeBytes,
        keywords::max_files = KeepFiles ) );
    backend->scan_for_files();

    auto sink = boost::make_shared< file_sink_t >( backend );
    sink->set_formatter(&rlog_formatter);
    core->add_sink(sink);
}

/// Echo to std::clog, for --console and --test.
///
static void
init_console_logging( boost::shared_ptr< logging::core > core )
{
    auto backend = boost::make_shared< sinks::text_ostream_backend >();
    backend->add_stream(
        boost::shared_ptr< std::ostream >(&std::clog, boost::null_deleter()));
    auto sink = boost::make_shared< os_sink_t >( backend );
    sink->set_formatter(&rlog_formatter);
    core->add_sink(sink);
}


/// Init the logger with console and/or text_file_backends.  With
/// neither flag the core is disabled, so nothing reaches the terminal.
/// Typical file_pattern: "roomplay_%5N.log"
///
void init_logging(const char* appname, const char* file_pattern, int flags)
{
    LogAppName = appname;
    boost::shared_ptr< logging::core > core = logging::core::get();
    if (flags & LF_FILE) {
        init_file_logging(core,file_pattern);
    }
    if (flags & LF_CONSOLE) {
        init_console_logging(core);
    }
    core->set_logging_enabled( 0 != (flags & (LF_FILE|LF_CONSOLE)) );
    logging::add_common_attributes();

    if (0 == (flags & LF_DEBUG)) {
        core->set_filter(lt::severity >= lt::info);
    } else {
        core->reset_filter();
    }
}

/// Flush and detach every sink.  The core is left enabled for the
/// next init_logging (each test case calls both).
///
void finish_logging()
{
    boost::shared_ptr< logging::core > core = logging::core::get();
    core->flush();
    core->remove_all_sinks();
    core->set_logging_enabled(true);
}
