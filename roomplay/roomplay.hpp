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

#include <ctime>
#include <iosfwd>
#include <memory>
#include <string>
#include <boost/filesystem.hpp>

#include "config.hpp"
#include "orchestrator.hpp"
#include "statmon.hpp"


///////////////////////////////// Roomplay //////////////////////////////////

/// The daemon: builds the collaborators from the configuration, owns
/// the single Player_orchestrator, and runs the supervision loop until
/// a termination signal.
///
class Roomplay {
private:
    std::unique_ptr<Config> m_config;
    std::shared_ptr<Alsa_volume_service> m_volsvc {};
    std::shared_ptr<Provider_registry> m_registry {};
    std::shared_ptr<Json_player_store> m_store {};
    std::shared_ptr<Process_supervisor> m_super {};
    std::unique_ptr<Player_orchestrator> m_orch {};
    std::unique_ptr<Status_monitor> m_monitor {};
    std::shared_ptr<Status_file_listener> m_status_file {};
    bool m_test;                       // true: report only, no side effects
    bool m_autostart {true};
    bool m_config_change_noted {false};
    time_t m_reap_secs {2};
    //
    void check_config_file();
    void reload_players();
public:
    explicit Roomplay( bool test );
    Roomplay(const Roomplay&) = delete;
    void operator=(Roomplay const&) = delete;
    ~Roomplay();
    //
    void configure( const std::string&, bool /*must_exist*/ );
    Player_orchestrator& orchestrator() { return *m_orch; }
    void print_players( std::ostream& ) const;
    void print_providers( std::ostream& ) const;
    void run();
    int shutdown();
};
