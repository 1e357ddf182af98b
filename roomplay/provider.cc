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

#include <cstdio>
#include <sstream>
#include <boost/regex.hpp>
#include <boost/uuid/detail/md5.hpp>
#include <boost/version.hpp>

#include "provider.hpp"
#include "config.hpp"
#include "configutil.hpp"
#include "logging.hpp"


/// Pro forma destructor is required even though pure virtual interface.
Provider::~Provider() { }


/// Raw 16 byte MD5 digest of s.
///
static void md5_bytes( const std::string &s, unsigned char (&out)[16] )
{
    using boost::uuids::detail::md5;
    md5 hash;
    md5::digest_type digest;
    hash.process_bytes( s.data(), s.size() );
    hash.get_digest( digest );
#if BOOST_VERSION >= 108600
    for (int i=0; i<16; i++) { out[i] = digest[i]; }
#else
    // four words, each holding its bytes most significant first
    for (int w=0; w<4; w++) {
        for (int k=0; k<4; k++) {
            out[4*w+k] = static_cast<unsigned char>( digest[w] >> (24 - 8*k) );
        }
    }
#endif
}

std::string md5_hex( const std::string &s )
{
    unsigned char b[16];
    md5_bytes( s, b );
    char buf[33];
    for (int i=0; i<16; i++) {
        snprintf( buf + 2*i, 3, "%02x", b[i] );
    }
    return std::string( buf, 32 );
}

/// First six digest bytes; the low bits of the first octet are forced
/// to "locally administered, unicast".
///
std::string derive_mac_address( const std::string &name )
{
    unsigned char b[16];
    md5_bytes( name, b );
    b[0] = static_cast<unsigned char>( (b[0] & 0xFC) | 0x02 );
    char buf[18];
    snprintf( buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
              b[0], b[1], b[2], b[3], b[4], b[5] );
    return std::string( buf );
}

bool is_valid_mac_address( const std::string &mac )
{
    static const boost::regex macre {
        "^[0-9A-Fa-f]{2}(:[0-9A-Fa-f]{2}){5}$" };
    return boost::regex_match( mac, macre );
}


//////////////////////////////////////////////////////////////////////////
///                          Base_provider

/// CTOR
Base_provider::Base_provider( const char *type, const char *display,
                              const char *section, const char *binary )
    : m_type(type), m_display(display), m_section(section), m_binary(binary)
{
}

/// Take the binary name or path from the provider's config section.
/// * May throw Config_error
///
void Base_provider::configure( Config &cfg )
{
    cfg.get_string( m_section.c_str(), "binary", m_binary );
    if (m_binary.empty()) {
        LOG_ERROR(Lgr) << m_section << ".binary must not be empty";
        throw Config_error();
    }
    LOG_INFO(Lgr) << m_display << " provider uses '" << m_binary << "'"
                  << (is_available() ? "" : " (not found)");
}

bool Base_provider::is_available() const
{
    boost::filesystem::path found;
    return find_in_path( m_binary, found );
}

/// Hook for subclasses: checks of their required fields.
///
Op_result Base_provider::check_specific( const Player_config& ) const
{
    return Op_result::success( "" );
}

/// Range checks common to every provider, then check_specific().
///
Op_result Base_provider::validate_config( const Player_config &pc ) const
{
    if (pc.name.empty()) {
        return Op_result::failure( "Player name is required" );
    }
    if (pc.device.empty()) {
        return Op_result::failure( m_display + " requires an audio device" );
    }
    if (pc.volume and (*pc.volume < MinVolume or *pc.volume > MaxVolume)) {
        return Op_result::failure( "Volume must be between 0 and 100" );
    }
    if (pc.delay_ms < MinDelayMs or pc.delay_ms > MaxDelayMs) {
        return Op_result::failure( "delay_ms must be between -1000 and 1000" );
    }
    if (not pc.mac_address.empty() and not is_valid_mac_address(pc.mac_address)) {
        return Op_result::failure( "Invalid MAC address: " + pc.mac_address );
    }
    Op_result r = check_specific( pc );
    if (not r.ok) return r;
    return Op_result::success( "Configuration is valid" );
}

/// Return a completed copy: provider type and MAC filled in if blank.
///
Player_config Base_provider::prepare_config( const Player_config &pc ) const
{
    Player_config out { pc };
    if (out.provider.empty()) {
        out.provider = m_type;
    }
    if (out.mac_address.empty()) {
        out.mac_address = derive_mac_address( out.name );
        LOG_DEBUG(Lgr) << "Derived MAC " << out.mac_address
                       << " for " << out.name;
    }
    return out;
}

Command Base_provider::build_fallback_command(
    const Player_config&, const boost::filesystem::path& ) const
{
    return Command();
}

/// Stored-only volume: the last value the user asked for.
///
int Base_provider::get_volume( const Player_config &pc )
{
    return pc.volume ? *pc.volume : DefaultVolume;
}

/// Stored-only volume: nothing to do at the hardware level.
///
Op_result Base_provider::set_volume( const Player_config&, int pct )
{
    return Op_result::success( "Volume set to " + std::to_string(pct) + "%" );
}
