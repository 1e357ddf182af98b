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

#include <time.h>
#include <iostream>
#include <iomanip>

#include "roomplay.hpp"
#include "main.hpp"
#include "configutil.hpp"
#include "logging.hpp"


namespace fs = boost::filesystem;

/// Defaults for the General section
static const char *DefaultPlayersFile {"~/.config/roomplay/players.json"};
static const char *DefaultProcessLogDir {"~/logs/roomplay/players"};
static const char *StatusFileName {"roomplay_status.json"};


/// CTOR
Roomplay::Roomplay( bool test )
    : m_config( std::make_unique<Config>() ), m_test( test )
{
}

/// DTOR
Roomplay::~Roomplay()
{
    if (m_monitor) m_monitor->stop();
}

/// Read the configuration file p and build every collaborator.  If the
/// file is absent and must_exist is false, built-in defaults are used.
/// * May throw Config_error and its kin, Store_error, filesystem_error
///
void Roomplay::configure( const std::string &p, bool must_exist )
{
    constexpr const char* GSection { "General" };
    m_config->set_config_path( p );
    if (must_exist or fs::exists( m_config->config_path() )) {
        m_config->read_config();    // may throw
        m_config->log_about();
        if (m_config->get_schema() != "1.0") {
            LOG_WARNING(Lgr) << "Config schema '" << m_config->get_schema()
                             << "' (expected 1.0) in " << p;
        }
    } else {
        LOG_WARNING(Lgr) << "No config file " << m_config->config_path()
                         << "; using defaults";
    }

    fs::path players_file = expand_home( DefaultPlayersFile );
    m_config->get_pathname( GSection, "players_file", FileCond::NA, players_file );
    fs::path logdir = expand_home( DefaultProcessLogDir );
    m_config->get_pathname( GSection, "process_log_dir", FileCond::NA, logdir );
    m_config->get_bool( GSection, "autostart", m_autostart );
    fs::path status_file = runtime_dir() / StatusFileName;
    m_config->get_pathname( GSection, "status_file", FileCond::NA, status_file );

    m_volsvc = std::make_shared<Alsa_volume_service>();
    m_volsvc->configure( *m_config );

    m_registry = std::make_shared<Provider_registry>();
    Provider_registry::install_standard( *m_registry, m_volsvc );
    m_registry->configure( *m_config );

    m_store = std::make_shared<Json_player_store>( players_file );
    m_store->load();

    m_super = std::make_shared<Process_supervisor>( logdir );
    m_super->configure( *m_config );

    m_orch = std::make_unique<Player_orchestrator>( m_registry, m_super,
                                                    m_store, m_volsvc );

    Player_orchestrator *orch = m_orch.get();
    m_monitor = std::make_unique<Status_monitor>(
        [orch]() { return orch->get_all_statuses(); } );
    m_monitor->configure( *m_config );
    m_reap_secs = static_cast<time_t>( m_monitor->interval_ms() / 1000 );
    m_monitor->add_listener( std::make_shared<Log_status_listener>() );
    m_status_file = std::make_shared<Status_file_listener>( status_file );
    m_monitor->add_listener( m_status_file );
}

/// Table of stored players.
///
void Roomplay::print_players( std::ostream &os ) const
{
    auto players = m_orch->players();
    if (players.empty()) {
        os << "No players configured.\n";
        return;
    }
    for (const auto &pc : players) {
        os << std::left << std::setw(24) << pc.name
           << std::setw(14) << (pc.provider.empty() ? m_registry->default_type()
                                                     : pc.provider)
           << std::setw(20) << pc.device
           << (pc.volume ? std::to_string(*pc.volume) + "%" : std::string("-"))
           << (pc.enabled ? "" : "  (disabled)") << "\n";
    }
}

/// Table of registered providers.
///
void Roomplay::print_providers( std::ostream &os ) const
{
    for (const auto &pi : m_registry->get_provider_info( false )) {
        os << std::left << std::setw(14) << pi.type
           << std::setw(14) << pi.display_name
           << std::setw(14) << pi.binary
           << (pi.available ? "available" : "not installed")
           << (pi.supports_fallback ? ", fallback" : "") << "\n";
    }
}

/// Note once that the config file was edited; it is only read at boot.
///
void Roomplay::check_config_file()
{
    if (not m_config_change_noted and m_config->file_has_changed()) {
        LOG_WARNING(Lgr) << "Config file " << m_config->config_path()
                         << " has changed; restart " << Main::AppName
                         << " to apply it";
        m_config_change_noted = true;
    }
}

/// Re-read the player store on SIGHUP.
///
void Roomplay::reload_players()
{
    Main::ReloadReq = 0;
    LOG_INFO(Lgr) << "Reloading players on signal";
    Op_result r = m_orch->reload();
    LOG_INFO(Lgr) << r.message;
}


///////////////////////////////// MAIN LOOP ////////////////////////////////////

/// Autostart players, then watch for crashes and signals until the
/// Terminate flag is set.
///
void Roomplay::run()
{
    if (m_autostart) {
        m_orch->autostart();
    } else {
        LOG_INFO(Lgr) << "Autostart disabled";
    }
    m_monitor->start();
    LOG_INFO(Lgr) << "Supervising players.";

    struct timespec rest { 1, 0 };
    time_t last_reap = time(0);
    for (;;) {
        if (Main::Terminate) { break; }
        if (nanosleep( &rest, nullptr )) {
            LOG_DEBUG(Lgr) << "Sleep interrupted";
        }
        if (Main::Terminate) { break; }
        if (Main::ReloadReq) {
            reload_players();
        }
        time_t now = time(0);
        if (now - last_reap >= m_reap_secs) {
            m_orch->reap_crashed();
            check_config_file();
            last_reap = now;
        }
        Main::log_banner(false);
    }
}

/// Stop the monitor and every player.  Returns the number of players
/// stopped.
///
int Roomplay::shutdown()
{
    if (m_monitor) {
        m_monitor->stop();
    }
    int n = 0;
    if (m_orch) {
        n = m_orch->shutdown();
    }
    if (m_status_file and not m_test) {
        m_status_file->remove_file();
    }
    return n;
}
