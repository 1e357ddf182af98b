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

#include "squeezelite.hpp"
#include "logging.hpp"

/// Output device used by the fallback command
static const char *FallbackDevice {"default"};

//////////////////////////////////////////////////////////////////////////////

/// CTOR
Squeezelite_provider::Squeezelite_provider( spVolume_service vs )
    : Base_provider( SqueezeliteType, "Squeezelite", "Squeezelite", "squeezelite" ),
      m_volsvc( vs )
{
}

/// squeezelite -n NAME -o DEVICE -m MAC -f LOG [-s SERVER]
///
Command Squeezelite_provider::build_command( const Player_config &pc,
                                             const boost::filesystem::path &log ) const
{
    Command cmd { m_binary, "-n", pc.name, "-o", pc.device };
    if (not pc.mac_address.empty()) {
        cmd.push_back( "-m" );
        cmd.push_back( pc.mac_address );
    }
    cmd.push_back( "-f" );
    cmd.push_back( log.string() );
    if (not pc.server_ip.empty()) {
        cmd.push_back( "-s" );
        cmd.push_back( pc.server_ip );
    }
    return cmd;
}

/// Same invocation on the default output device.
///
Command Squeezelite_provider::build_fallback_command(
    const Player_config &pc, const boost::filesystem::path &log ) const
{
    Player_config fb { pc };
    fb.device = FallbackDevice;
    return build_command( fb, log );
}

/// Hardware volume of the player's device; the stored value if the
/// mixer cannot be read.
///
int Squeezelite_provider::get_volume( const Player_config &pc )
{
    if (m_volsvc) {
        int v = m_volsvc->get_volume( pc.device, "" );
        if (v >= 0) return v;
        LOG_DEBUG(Lgr) << "No hardware volume for " << pc.name
                       << " on " << pc.device;
    }
    return Base_provider::get_volume( pc );
}

Op_result Squeezelite_provider::set_volume( const Player_config &pc, int pct )
{
    if (not m_volsvc) {
        return Op_result::failure( "No volume service available" );
    }
    return m_volsvc->set_volume( pc.device, pct, "" );
}
