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
#include "volsvc.hpp"

/// Registry type name
constexpr const char *SqueezeliteType {"squeezelite"};


/// Provider for squeezelite, a Logitech Media Server compatible client.
/// The server is optional (squeezelite discovers one on the LAN).
/// Volume is the hardware mixer of the player's device.
///
class Squeezelite_provider : public Base_provider {
private:
    spVolume_service m_volsvc;
public:
    explicit Squeezelite_provider( spVolume_service );
    //
    Command build_command( const Player_config&,
                           const boost::filesystem::path& ) const override;
    bool supports_fallback() const override { return true; }
    Command build_fallback_command(
        const Player_config&, const boost::filesystem::path& ) const override;
    int get_volume( const Player_config& ) override;
    Op_result set_volume( const Player_config&, int ) override;
};
