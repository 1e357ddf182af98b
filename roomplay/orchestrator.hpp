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
#include <boost/optional.hpp>
#include <jsoncpp/json/json.h>

#include "common.hpp"
#include "playercfg.hpp"
#include "playerstore.hpp"
#include "registry.hpp"
#include "supervisor.hpp"
#include "volsvc.hpp"


/**
 * Player_orchestrator
 *   The one object the front end talks to.  It ties together the player
 * store, the provider registry, the process supervisor and the volume
 * service, and keeps them consistent:
 *
 *  - names are validated and unique before anything is stored
 *  - a player is stopped before it is deleted or reconfigured
 *  - the stored volume always follows the last request, whatever the
 *    hardware said
 *
 * Every operation on a given name runs under that name's lock (renames
 * take both), so read-modify-persist sequences on one player are
 * serialized while different players proceed in parallel.
 *
 * No member throws; failures come back as Op_result or an empty value
 * and are logged.
 */
class Player_orchestrator {
private:
    std::shared_ptr<Provider_registry> m_registry;
    std::shared_ptr<Process_supervisor> m_super;
    spConfig_store m_store;
    spVolume_service m_volsvc;
    std::mutex m_locks_mutex {};
    std::map<std::string,std::shared_ptr<std::mutex>> m_locks {};
    //
    std::shared_ptr<std::mutex> name_lock( const std::string& );
    Op_result start_locked( const std::string& );
    Op_result do_update( const std::string&, const std::string&,
                         const std::string&, const std::string&,
                         const Json::Value& );
public:
    Player_orchestrator( std::shared_ptr<Provider_registry>,
                         std::shared_ptr<Process_supervisor>,
                         spConfig_store,
                         spVolume_service );
    //
    Op_result create_player( const std::string& /*name*/,
                             const std::string& /*device*/,
                             const std::string& /*provider type*/,
                             const Json::Value &extra = Json::Value() );
    Op_result update_player( const std::string& /*old name*/,
                             const std::string& /*new name*/,
                             const std::string& /*device*/,
                             const std::string &ptype = std::string(),
                             const Json::Value &extra = Json::Value() );
    Op_result delete_player( const std::string& );
    Op_result start_player( const std::string& );
    Op_result stop_player( const std::string& );
    bool get_player_status( const std::string& );
    Status_map get_all_statuses();
    boost::optional<int> get_player_volume( const std::string& );
    Op_result set_player_volume( const std::string&, int );
    Op_result set_player_offset( const std::string&, int );
    //
    std::vector<Player_config> players() const;
    boost::optional<Player_config> get_player( const std::string& ) const;
    std::vector<Provider_info> get_available_providers() const;
    Op_result check_player( const std::string& ) const;
    //
    std::vector<Audio_device> get_audio_devices();
    std::vector<std::string> get_mixer_controls( const std::string& );
    int get_device_volume( const std::string&, const std::string& );
    Op_result set_device_volume( const std::string&, int, const std::string& );
    Op_result play_test_tone( const std::string& );
    //
    int autostart();
    std::vector<std::string> reap_crashed();
    Op_result reload();
    int shutdown();
};
