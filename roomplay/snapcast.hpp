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

#include "provider.hpp"

/// Registry type name
constexpr const char *SnapcastType {"snapcast"};


/// Provider for snapclient, the Snapcast multi-room client.  Needs the
/// server address ("host" or "host:port"); volume belongs to the server.
///
class Snapcast_provider : public Base_provider {
protected:
    Op_result check_specific( const Player_config& ) const override;
public:
    Snapcast_provider();
    static bool split_server( const std::string&, std::string& /*host*/,
                              std::string& /*port*/ );
    //
    Command build_command( const Player_config&,
                           const boost::filesystem::path& ) const override;
    bool supports_fallback() const override { return true; }
    Command build_fallback_command(
        const Player_config&, const boost::filesystem::path& ) const override;
};
