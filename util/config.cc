/**
 * Methods for daemon configuration class Config
 * This uses a simplified JSON with a 2-level structure
 * consisting of (1) section, and (2) parameter within section.
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

#include <ctime>
#include <iostream>
#include <stdexcept>
#include <memory>
#include <boost/filesystem/fstream.hpp>
#include <jsoncpp/json/json.h>

#include "logging.hpp"
#include "config.hpp"
#include "configutil.hpp"

namespace fs = boost::filesystem;


////////////////////////////////////////////////////////////////////////

/// Locate section.param in root; returns a null value when either
/// level is missing.  A section that is present but not an object
/// is a configuration defect.
///
static const Json::Value&
lookup( const Json::Value &root, const char *section, const char *param )
{
    static const Json::Value Nothing {};
    const Json::Value &sec = root[section];
    if (sec.isNull()) return Nothing;
    if (not sec.isObject()) {
        LOG_ERROR(Lgr) << "Config section " << section << " is not an object";
        throw Config_error();
    }
    return sec[param];
}

/// The value at section.param must be convertible to type t.
///
static void
require_type( const Json::Value &val, Json::ValueType t,
              const char *section, const char *param )
{
    if (not val.isConvertibleTo(t)) {
        LOG_ERROR(Lgr) << "Config " << section << "." << param
                       << " has the wrong type: " << val.toStyledString();
        throw Config_error();
    }
}


/// CTOR for Config establishes defaults
///
Config::Config()
{ }

/// CTOR with config path
///
Config::Config(const char* pathname)
{
    set_config_path(pathname);
}


/// Sets the configuration path.  This does *not* verify that
/// the file exists.
///
void Config::set_config_path( const std::string& p )
{
    m_config_path = expand_home(p);
}


/// Read configuration parameters per m_config_path.
/// * May throw Config_file_error
///
void Config::read_config()
{
    if (not fs::exists(m_config_path)) {
        LOG_ERROR(Lgr)
            << "Config no such file: " << m_config_path;
        throw Config_file_error();
    }
    Json::CharReaderBuilder builder;
    std::string errs;
    fs::ifstream sfile(m_config_path);
    if (not Json::parseFromStream(builder, sfile, &m_croot, &errs)) {
        LOG_ERROR(Lgr) << "Config error reading from "
                       << m_config_path << ": " << errs;
        throw Config_file_error();
    }
    if (not m_croot.isObject()) {
        LOG_ERROR(Lgr) << "Config " << m_config_path
                       << " must hold a JSON object";
        throw Config_file_error();
    }
    m_file_writetime = last_write_time(m_config_path);
    //
    const Json::Value &sch=m_croot["schema"];
    if (not sch.isNull()) {
        m_schema = sch.asString();
    } else {
        m_schema = "unknown";
    }
}


/// may be called after load to log some information about the
/// config file: name, last write time, declared schema
///
void Config::log_about()
{
    LOG_INFO(Lgr) << "Config loaded file " << m_config_path;
    std::string lwt=std::ctime(&m_file_writetime);
    lwt.pop_back();
    LOG_INFO(Lgr) << "Config schema " << m_schema
                  << ", last written " << lwt;
}

/// Check the disk file for possible changes since last load.
/// @returns true if the file has changed since the last load,
///   or false if the file has never been loaded.
///
bool Config::file_has_changed()
{
    if (m_file_writetime <= 0) { return false; } // never loaded
    boost::system::error_code ec;
    std::time_t mtime = last_write_time(m_config_path, ec);
    if (ec) { return true; }  // vanished counts as a change
    return (mtime > m_file_writetime);
}


/// Retrieve a bool value from section/param and deposit it in value,
/// returning true.  If the section/param cannot be found then
/// do not change value but return false.  May throw.
///
bool Config::get_bool(const char *section, const char *param, bool &value)
{
    const Json::Value &val=lookup(m_croot, section, param);
    if (val.isNull()) {
        return false;
    }
    require_type(val, Json::booleanValue, section, param);
    value = val.asBool();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "="
                  << (value ? "true" : "false");
    return true;
}

/// Retrieve an unsigned value from section/param.  Negative values
/// are a defect. May throw.
///
bool Config::get_unsigned(const char *section, const char *param,
                          unsigned &value)
{
    const Json::Value &val=lookup(m_croot, section, param);
    if (val.isNull()) {
        return false;
    }
    require_type(val, Json::uintValue, section, param);
    value = val.asUInt();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "="
                  << value;
    return true;
}

/// Retrieve a string value from section/param and deposit it in value,
/// returning true.  If the section/param cannot be found then
/// value is unchanged and this function returns false. May throw.
///
bool Config::get_string(const char *section, const char *param,
                        std::string &value)
{
    const Json::Value &val=lookup(m_croot, section, param);
    if (val.isNull()) {
        return false;
    }
    require_type(val, Json::stringValue, section, param);
    value = val.asString();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "=" << value;
    return true;
}

/// Retrieve a pathname from section.param and deposit it in value,
/// returning true.  If the section.param cannot be found then value
/// remains unchanged and function returns false. In either case,
/// test whether the FileCond constraint is satisfied by the resulting
/// value.  May throw.
///
bool Config::get_pathname( const char *section, const char *param,
                           FileCond cond, boost::filesystem::path &value)
{
    bool found=true;
    const Json::Value &val=lookup(m_croot, section, param);
    if (val.isNull()) {
        found = false;
    } else {
        require_type(val, Json::stringValue, section, param);
        value = expand_home( val.asString() );
    }
    if (cond == FileCond::MustExist) {
        if (not fs::exists(value)
            or not fs::is_regular_file(value)) {
            LOG_ERROR(Lgr) << "Config " << section << "." << param
                           << ", File not found: " << value;
            throw Config_path_error();
        }
    } else if (cond == FileCond::MustNotExist) {
        if (fs::exists(value)) {
            LOG_ERROR(Lgr) << "Config " << section << "." << param
                           << ", File already exists: " << value;
            throw Config_path_error();
        }
    } else if (cond == FileCond::MustExistDir) {
        if (not fs::exists(value)
            or not fs::is_directory(value)) {
            LOG_ERROR(Lgr) << "Config " << section << "." << param
                           << ", Directory not found: " << value;
            throw Config_path_error();
        }
    }
    if (found) {
        LOG_INFO(Lgr) << "Config " << section << "." << param << "=" << value;
    }
    return found;
}
