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
#include <sstream>

#include "playercfg.hpp"
#include "logging.hpp"


/// Characters other than letters and digits allowed in a name
static const std::string NamePunct {" -_'"};

static const char * const CoreKeys[] = {
    Pkey::name, Pkey::device, Pkey::provider, Pkey::server_ip,
    Pkey::server_url, Pkey::mac_address, Pkey::enabled, Pkey::volume,
    Pkey::delay_ms
};

/// True if key names one of the fields held outside of extra.
///
bool Player_config::is_core_key( const std::string &key )
{
    for (auto ck : CoreKeys) {
        if (key == ck) return true;
    }
    return false;
}


/// Fetch a string member, tolerating absence or a non-string value.
///
static std::string jstring( const Json::Value &jv, const char *key )
{
    const Json::Value &m = jv[key];
    if (m.isString()) return m.asString();
    if (m.isNull()) return std::string();
    LOG_WARNING(Lgr) << "Player field '" << key << "' is not a string";
    return m.isConvertibleTo(Json::stringValue) ? m.asString() : std::string();
}

/// Build a config from its JSON object form.  Malformed members are
/// logged and defaulted; a non-object throws Store_error.
///
Player_config Player_config::from_json( const Json::Value &jv )
{
    if (not jv.isObject()) {
        LOG_ERROR(Lgr) << "Player record is not a JSON object";
        throw Store_error();
    }
    Player_config pc;
    pc.name        = jstring( jv, Pkey::name );
    pc.device      = jstring( jv, Pkey::device );
    pc.provider    = jstring( jv, Pkey::provider );
    pc.server_ip   = jstring( jv, Pkey::server_ip );
    pc.server_url  = jstring( jv, Pkey::server_url );
    pc.mac_address = jstring( jv, Pkey::mac_address );
    //
    const Json::Value &jen = jv[Pkey::enabled];
    if (jen.isBool()) { pc.enabled = jen.asBool(); }
    const Json::Value &jvol = jv[Pkey::volume];
    if (jvol.isInt()) { pc.volume = jvol.asInt(); }
    const Json::Value &jdel = jv[Pkey::delay_ms];
    if (jdel.isInt()) { pc.delay_ms = jdel.asInt(); }
    //
    for (const auto &key : jv.getMemberNames()) {
        if (not is_core_key(key)) {
            pc.extra[key] = jv[key];
        }
    }
    return pc;
}

/// Render as a JSON object: extras first, then the core fields, so a
/// stray extra can never shadow a core value.
///
Json::Value Player_config::to_json() const
{
    Json::Value jv { Json::objectValue };
    if (extra.isObject()) {
        for (const auto &key : extra.getMemberNames()) {
            if (not is_core_key(key)) jv[key] = extra[key];
        }
    }
    jv[Pkey::name] = name;
    jv[Pkey::device] = device;
    jv[Pkey::provider] = provider;
    jv[Pkey::server_ip] = server_ip;
    jv[Pkey::server_url] = server_url;
    jv[Pkey::mac_address] = mac_address;
    jv[Pkey::enabled] = enabled;
    if (volume) { jv[Pkey::volume] = *volume; }
    jv[Pkey::delay_ms] = delay_ms;
    return jv;
}

/// String value of an extra field, or dflt.
///
std::string
Player_config::extra_string( const char *key, const std::string &dflt ) const
{
    const Json::Value &m = extra[key];
    if (m.isString()) return m.asString();
    if (m.isIntegral()) return std::to_string( m.asLargestInt() );
    return dflt;
}

/// Merge caller-supplied fields.  The identity keys (name, device,
/// provider) are never taken from here; other core keys must carry the
/// right type, and anything else lands in extra.
///
Op_result Player_config::merge_fields( const Json::Value &jv )
{
    if (jv.isNull()) return Op_result::success( "" );
    if (not jv.isObject()) {
        return Op_result::failure( "Extra fields must be a JSON object" );
    }
    for (const auto &key : jv.getMemberNames()) {
        if (key == Pkey::name or key == Pkey::device or key == Pkey::provider) {
            LOG_DEBUG(Lgr) << "Ignoring extra field '" << key
                           << "' that would overwrite " << key;
            continue;
        }
        if (not set_field( key, jv[key] )) {
            return Op_result::failure( "Invalid value for field '" + key + "'" );
        }
    }
    return Op_result::success( "" );
}

/// Assign one field by its JSON name.  Core fields must have the right
/// type (false is returned otherwise); any other key becomes an extra.
///
bool Player_config::set_field( const std::string &key, const Json::Value &val )
{
    if (key == Pkey::name or key == Pkey::device or key == Pkey::provider
        or key == Pkey::server_ip or key == Pkey::server_url
        or key == Pkey::mac_address) {
        if (not val.isString()) return false;
        std::string s = val.asString();
        if (key == Pkey::name) name = s;
        else if (key == Pkey::device) device = s;
        else if (key == Pkey::provider) provider = s;
        else if (key == Pkey::server_ip) server_ip = s;
        else if (key == Pkey::server_url) server_url = s;
        else mac_address = s;
        return true;
    }
    if (key == Pkey::enabled) {
        if (not val.isBool()) return false;
        enabled = val.asBool();
        return true;
    }
    if (key == Pkey::volume) {
        if (val.isNull()) { volume = boost::none; return true; }
        if (not val.isInt()) return false;
        volume = val.asInt();
        return true;
    }
    if (key == Pkey::delay_ms) {
        if (not val.isInt()) return false;
        delay_ms = val.asInt();
        return true;
    }
    extra[key] = val;
    return true;
}

//////////////////////////////////////////////////////////////////////////

/// Player names key processes and log files, so keep them tame.
///
Op_result validate_player_name( const std::string &name )
{
    if (name.empty()) {
        return Op_result::failure( "Player name must not be empty" );
    }
    if (name.size() > MaxPlayerNameLength) {
        std::ostringstream oss;
        oss << "Name must be at most " << MaxPlayerNameLength << " characters";
        return Op_result::failure( oss.str() );
    }
    std::string bad;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) continue;
        if (NamePunct.find(c) != std::string::npos) continue;
        if (bad.find(c) == std::string::npos) bad += c;
    }
    if (not bad.empty()) {
        return Op_result::failure( "Name contains invalid characters: " + bad );
    }
    return Op_result::success( "Name is valid" );
}
