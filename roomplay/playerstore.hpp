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

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <jsoncpp/json/json.h>

#include "playercfg.hpp"


/**
 * Abstract durable store of player records keyed by name.
 * Mutators persist before returning and throw Store_error if they
 * cannot; the in-memory view is unchanged in that case.
 */
class Config_store {
public:
    virtual ~Config_store()=0;
    //
    virtual void load()=0;
    virtual void save()=0;
    virtual bool player_exists( const std::string& ) const = 0;
    virtual boost::optional<Player_config> get_player( const std::string& ) const = 0;
    virtual std::vector<Player_config> all_players() const = 0;
    virtual std::vector<std::string> list_players() const = 0;
    virtual void set_player( const std::string&, const Player_config& )=0;
    virtual bool delete_player( const std::string& )=0;
    virtual bool update_player_field( const std::string&, const std::string&,
                                      const Json::Value& )=0;
    virtual void replace_player( const std::string& /*old*/, const Player_config& );
};

using spConfig_store = std::shared_ptr<Config_store>;


/// Schema written to the players file
constexpr const char *StoreSchema {"1.0"};


/**
 * Config_store kept in one JSON document:
 *
 *   { "schema": "1.0", "players": { "<name>": { ...record... }, ... } }
 *
 * Writes go to a temporary file in the same directory which is then
 * renamed over the original.
 */
class Json_player_store : public Config_store {
private:
    mutable std::mutex m_mutex {};
    std::map<std::string,Player_config> m_players {};
    boost::filesystem::path m_path;
    //
    Json::Value document() const;
    void commit( std::map<std::string,Player_config>& );
protected:
    virtual void write_document( const Json::Value& );
public:
    explicit Json_player_store( const boost::filesystem::path& );
    const boost::filesystem::path& path() const { return m_path; }
    //
    void load() override;
    void save() override;
    bool player_exists( const std::string& ) const override;
    boost::optional<Player_config> get_player( const std::string& ) const override;
    std::vector<Player_config> all_players() const override;
    std::vector<std::string> list_players() const override;
    void set_player( const std::string&, const Player_config& ) override;
    bool delete_player( const std::string& ) override;
    bool update_player_field( const std::string&, const std::string&,
                              const Json::Value& ) override;
    void replace_player( const std::string&, const Player_config& ) override;
};
