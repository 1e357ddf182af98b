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
#include <boost/optional.hpp>
#include <jsoncpp/json/json.h>

#include "common.hpp"


/// Longest acceptable player name
constexpr size_t MaxPlayerNameLength {100};

/// JSON member names of the core fields
namespace Pkey {
    constexpr const char *name        {"name"};
    constexpr const char *device      {"device"};
    constexpr const char *provider    {"provider"};
    constexpr const char *server_ip   {"server_ip"};
    constexpr const char *server_url  {"server_url"};
    constexpr const char *mac_address {"mac_address"};
    constexpr const char *enabled     {"enabled"};
    constexpr const char *volume      {"volume"};
    constexpr const char *delay_ms    {"delay_ms"};
}


/**
 * Declarative configuration of one room player.  A plain value type:
 * copies are independent, so a provider may complete a copy without
 * disturbing the caller's record.
 *
 * Fields not known to roomplay itself are kept in m_extra and written
 * back unchanged.
 */
struct Player_config {
    std::string name {};
    std::string device {};
    std::string provider {};           // empty means the registry default
    std::string server_ip {};
    std::string server_url {};
    std::string mac_address {};
    bool enabled {true};
    boost::optional<int> volume {};    // unknown until set or read back
    int delay_ms {0};
    Json::Value extra { Json::objectValue };
    //
    static bool is_core_key( const std::string& );
    static Player_config from_json( const Json::Value& );
    Json::Value to_json() const;
    //
    std::string extra_string( const char*, const std::string &dflt="" ) const;
    Op_result merge_fields( const Json::Value& );
    bool set_field( const std::string&, const Json::Value& );
};


/// Check a proposed player name: length and character set.
Op_result validate_player_name( const std::string& );
