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

#include <boost/regex.hpp>

#include "snapcast.hpp"
#include "logging.hpp"

/// Soundcard used by the fallback command
static const char *FallbackSoundcard {"default"};


/// CTOR
Snapcast_provider::Snapcast_provider()
    : Base_provider( SnapcastType, "Snapcast", "Snapcast", "snapclient" )
{
}

/// Split "host", "host:port" or "[v6addr]:port".  A bare IPv6
/// address is taken whole as the host.  Returns false if the port is
/// not in 1..65535.
///
bool Snapcast_provider::split_server( const std::string &addr,
                                      std::string &host,
                                      std::string &port )
{
    static const boost::regex hpre { "^(\\[[^\\]]+\\]|[^:]+)(?::(\\d{1,5}))?$" };
    host = addr;
    port.clear();
    boost::smatch m;
    if (boost::regex_match( addr, m, hpre )) {
        host = m[1].str();
        if (host.size() > 2 and host.front() == '[') {
            host = host.substr( 1, host.size()-2 );
        }
        if (m[2].matched) {
            port = m[2].str();
            int p = std::stoi( port );
            if (p < 1 or p > 65535) return false;
        }
    }
    return true;
}

Op_result Snapcast_provider::check_specific( const Player_config &pc ) const
{
    if (pc.server_ip.empty()) {
        return Op_result::failure( "Snapcast requires a server address" );
    }
    std::string host, port;
    if (not split_server( pc.server_ip, host, port ) or host.empty()) {
        return Op_result::failure( "Invalid server address: " + pc.server_ip );
    }
    return Op_result::success( "" );
}

/// snapclient --host HOST [--port PORT] --hostID MAC --soundcard DEV
///            [--latency D] --logsink file:LOG
///
Command Snapcast_provider::build_command( const Player_config &pc,
                                          const boost::filesystem::path &log ) const
{
    std::string host, port;
    split_server( pc.server_ip, host, port );
    Command cmd { m_binary, "--host", host };
    if (not port.empty()) {
        cmd.push_back( "--port" );
        cmd.push_back( port );
    }
    if (not pc.mac_address.empty()) {
        cmd.push_back( "--hostID" );
        cmd.push_back( pc.mac_address );
    }
    cmd.push_back( "--soundcard" );
    cmd.push_back( pc.device );
    if (pc.delay_ms != 0) {
        cmd.push_back( "--latency" );
        cmd.push_back( std::to_string(pc.delay_ms) );
    }
    cmd.push_back( "--logsink" );
    cmd.push_back( "file:" + log.string() );
    return cmd;
}

Command Snapcast_provider::build_fallback_command(
    const Player_config &pc, const boost::filesystem::path &log ) const
{
    Player_config fb { pc };
    fb.device = FallbackSoundcard;
    return build_command( fb, log );
}
