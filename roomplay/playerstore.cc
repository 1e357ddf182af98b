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

#include <boost/filesystem/fstream.hpp>

#include "playerstore.hpp"
#include "logging.hpp"

namespace fs = boost::filesystem;


/// Pro forma destructor is required even though pure virtual interface.
Config_store::~Config_store() { }

/// Rename or replace: store cfg under its own name, then drop old_name
/// if that differs.  Stores able to do this in one write override it.
///
void Config_store::replace_player( const std::string &old_name,
                                   const Player_config &cfg )
{
    set_player( cfg.name, cfg );
    if (old_name != cfg.name) {
        delete_player( old_name );
    }
}

//////////////////////////////////////////////////////////////////////////
///                        Json_player_store

/// CTOR.  Nothing is read until load().
Json_player_store::Json_player_store( const fs::path &p )
    : m_path( p )
{
}

/// Read the players file.  A missing file is an empty store.
/// * May throw Store_error if the file is unreadable or malformed
///
void Json_player_store::load()
{
    std::map<std::string,Player_config> players;
    if (fs::exists( m_path )) {
        fs::ifstream ifs( m_path );
        if (not ifs) {
            LOG_ERROR(Lgr) << "Cannot open players file " << m_path;
            throw Store_error();
        }
        Json::Value root;
        Json::CharReaderBuilder rbuilder;
        std::string errs;
        if (not Json::parseFromStream( rbuilder, ifs, &root, &errs )) {
            LOG_ERROR(Lgr) << "Players file " << m_path << " is malformed: " << errs;
            throw Store_error();
        }
        if (not root.isObject()) {
            LOG_ERROR(Lgr) << "Players file " << m_path << " is not an object";
            throw Store_error();
        }
        std::string schema = root.get( "schema", StoreSchema ).asString();
        if (schema != StoreSchema) {
            LOG_WARNING(Lgr) << "Players file schema " << schema
                             << " (expected " << StoreSchema << ")";
        }
        const Json::Value &jplayers = root["players"];
        if (not jplayers.isNull() and not jplayers.isObject()) {
            LOG_ERROR(Lgr) << "Players file: 'players' is not an object";
            throw Store_error();
        }
        for (const auto &key : jplayers.getMemberNames()) {
            Player_config pc = Player_config::from_json( jplayers[key] );
            if (pc.name != key) {
                if (not pc.name.empty()) {
                    LOG_WARNING(Lgr) << "Player record '" << key
                                     << "' names itself '" << pc.name << "'";
                }
                pc.name = key;
            }
            players[key] = pc;
        }
    } else {
        LOG_INFO(Lgr) << "No players file at " << m_path << " yet";
    }
    std::lock_guard<std::mutex> lock( m_mutex );
    m_players.swap( players );
    LOG_INFO(Lgr) << "Loaded " << m_players.size() << " player(s) from " << m_path;
}

/// Whole store as a JSON document.  Caller holds m_mutex.
///
Json::Value Json_player_store::document() const
{
    Json::Value root { Json::objectValue };
    root["schema"] = StoreSchema;
    Json::Value jplayers { Json::objectValue };
    for (const auto &pr : m_players) {
        jplayers[pr.first] = pr.second.to_json();
    }
    root["players"] = jplayers;
    return root;
}

/// Write doc to "<path>.tmp" and rename it into place.
/// * May throw Store_error
///
void Json_player_store::write_document( const Json::Value &doc )
{
    fs::path tmp = m_path;
    tmp += ".tmp";
    try {
        if (m_path.has_parent_path()) {
            fs::create_directories( m_path.parent_path() );
        }
        {
            fs::ofstream ofs( tmp, std::ios::out | std::ios::trunc );
            if (not ofs) {
                LOG_ERROR(Lgr) << "Cannot write " << tmp;
                throw Store_error();
            }
            Json::StreamWriterBuilder wbuilder;
            wbuilder["indentation"] = "  ";
            std::unique_ptr<Json::StreamWriter> writer( wbuilder.newStreamWriter() );
            writer->write( doc, &ofs );
            ofs << "\n";
            ofs.flush();
            if (not ofs) {
                LOG_ERROR(Lgr) << "Short write to " << tmp;
                throw Store_error();
            }
        }
        fs::rename( tmp, m_path );
    }
    catch (fs::filesystem_error &ex) {
        LOG_ERROR(Lgr) << "Cannot save players file " << m_path << ": " << ex.what();
        boost::system::error_code ec;
        fs::remove( tmp, ec );
        throw Store_error();
    }
}

/// Persist the candidate map and adopt it, or leave m_players alone
/// and rethrow.  Caller holds m_mutex.
///
void Json_player_store::commit( std::map<std::string,Player_config> &candidate )
{
    m_players.swap( candidate );
    try {
        write_document( document() );
    }
    catch (Store_error&) {
        m_players.swap( candidate );
        throw;
    }
}

/// * May throw Store_error
///
void Json_player_store::save()
{
    std::lock_guard<std::mutex> lock( m_mutex );
    write_document( document() );
}

bool Json_player_store::player_exists( const std::string &name ) const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_players.count( name ) > 0;
}

boost::optional<Player_config>
Json_player_store::get_player( const std::string &name ) const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    auto it = m_players.find( name );
    if (it == m_players.end()) return boost::none;
    return it->second;
}

std::vector<Player_config> Json_player_store::all_players() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    std::vector<Player_config> v;
    for (const auto &pr : m_players) v.push_back( pr.second );
    return v;
}

std::vector<std::string> Json_player_store::list_players() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    std::vector<std::string> v;
    for (const auto &pr : m_players) v.push_back( pr.first );
    return v;
}

/// * May throw Store_error
///
void Json_player_store::set_player( const std::string &name,
                                    const Player_config &cfg )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    auto candidate = m_players;
    candidate[name] = cfg;
    candidate[name].name = name;
    commit( candidate );
}

/// Returns false if there was no such player.
/// * May throw Store_error
///
bool Json_player_store::delete_player( const std::string &name )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if (not m_players.count( name )) return false;
    auto candidate = m_players;
    candidate.erase( name );
    commit( candidate );
    return true;
}

/// Set one field of a stored record.  Returns false if the player is
/// unknown or the value has the wrong type for a core field.
/// * May throw Store_error
///
bool Json_player_store::update_player_field( const std::string &name,
                                             const std::string &field,
                                             const Json::Value &value )
{
    if (field == Pkey::name) {
        LOG_WARNING(Lgr) << "update_player_field cannot rename " << name;
        return false;
    }
    std::lock_guard<std::mutex> lock( m_mutex );
    auto it = m_players.find( name );
    if (it == m_players.end()) return false;
    auto candidate = m_players;
    if (not candidate[name].set_field( field, value )) {
        LOG_WARNING(Lgr) << "Bad value for " << name << "." << field;
        return false;
    }
    commit( candidate );
    return true;
}

/// One write for update and rename.
/// * May throw Store_error
///
void Json_player_store::replace_player( const std::string &old_name,
                                        const Player_config &cfg )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    auto candidate = m_players;
    candidate.erase( old_name );
    candidate[cfg.name] = cfg;
    commit( candidate );
}
