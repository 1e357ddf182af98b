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

#include <cctype>
#include <boost/regex.hpp>

#include "sendspin.hpp"
#include "logging.hpp"


/// CTOR
Sendspin_provider::Sendspin_provider()
    : Base_provider( SendspinType, "Sendspin", "Sendspin", "sendspin" )
{
}

/// "sendspin-<name folded to [a-z0-9-]>-<8 hex of md5(name)>"
///
std::string Sendspin_provider::client_id_for( const std::string &name )
{
    std::string folded;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        folded += (std::isalnum(uc) ? static_cast<char>(std::tolower(uc)) : '-');
    }
    return "sendspin-" + folded + "-" + md5_hex(name).substr(0,8);
}

Op_result Sendspin_provider::check_specific( const Player_config &pc ) const
{
    static const boost::regex urlre { "^(wss?|https?)://[^\\s/]+.*$",
                                      boost::regex::icase };
    if (pc.server_url.empty()) {
        return Op_result::failure( "Sendspin requires a server URL" );
    }
    if (not boost::regex_match( pc.server_url, urlre )) {
        return Op_result::failure( "Invalid server URL: " + pc.server_url );
    }
    return Op_result::success( "" );
}

/// Adds the client id on top of the common completion.
///
Player_config Sendspin_provider::prepare_config( const Player_config &pc ) const
{
    Player_config out = Base_provider::prepare_config( pc );
    if (out.extra_string( ClientIdKey ).empty()) {
        out.extra[ClientIdKey] = client_id_for( out.name );
    }
    return out;
}

/// sendspin --url URL --name NAME --id ID --audio-device DEV
///          [--static-delay-ms D]
///
/// The player writes its own diagnostics to stderr, which the
/// supervisor already routes to the log path.
///
Command Sendspin_provider::build_command( const Player_config &pc,
                                          const boost::filesystem::path& ) const
{
    std::string cid = pc.extra_string( ClientIdKey );
    if (cid.empty()) cid = client_id_for( pc.name );
    Command cmd { m_binary,
                  "--url", pc.server_url,
                  "--name", pc.name,
                  "--id", cid,
                  "--audio-device", pc.device };
    if (pc.delay_ms != 0) {
        cmd.push_back( "--static-delay-ms" );
        cmd.push_back( std::to_string(pc.delay_ms) );
    }
    return cmd;
}
