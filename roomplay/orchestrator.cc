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

#include "orchestrator.hpp"
#include "logging.hpp"


/// CTOR.  The collaborators are shared with the daemon main.
///
Player_orchestrator::Player_orchestrator(
    std::shared_ptr<Provider_registry> reg,
    std::shared_ptr<Process_supervisor> super,
    spConfig_store store,
    spVolume_service vs )
    : m_registry( reg ), m_super( super ), m_store( store ), m_volsvc( vs )
{
}

/// The mutex serializing operations on name (created on first use).
///
std::shared_ptr<std::mutex>
Player_orchestrator::name_lock( const std::string &name )
{
    std::lock_guard<std::mutex> lock( m_locks_mutex );
    auto &mp = m_locks[name];
    if (not mp) {
        mp = std::make_shared<std::mutex>();
    }
    return mp;
}

static std::string not_found( const std::string &name )
{
    return "Player '" + name + "' not found";
}

//////////////////////////////////////////////////////////////////////////
///                           Lifecycle

/// Create and persist a new player.  Defaults: enabled, volume 75.
/// An empty provider type selects the registry default.
///
Op_result Player_orchestrator::create_player( const std::string &name,
                                              const std::string &device,
                                              const std::string &ptype,
                                              const Json::Value &extra )
{
    Op_result nv = validate_player_name( name );
    if (not nv.ok) return nv;
    auto nm = name_lock( name );
    std::lock_guard<std::mutex> lock( *nm );
    try {
        if (m_store->player_exists( name )) {
            LOG_WARNING(Lgr) << "create_player: '" << name << "' already exists";
            return Op_result::failure( "Player '" + name + "' already exists" );
        }
        std::string type = ptype.empty() ? m_registry->default_type() : ptype;
        spProvider prov = m_registry->get( type );
        if (not prov) {
            LOG_WARNING(Lgr) << "create_player: unknown provider " << type;
            return Op_result::failure( "Unknown provider type: " + type );
        }
        Player_config pc;
        pc.name = name;
        pc.device = device;
        pc.provider = type;
        pc.enabled = true;
        pc.volume = DefaultVolume;
        Op_result mr = pc.merge_fields( extra );
        if (not mr.ok) return mr;
        Op_result vr = prov->validate_config( pc );
        if (not vr.ok) {
            LOG_WARNING(Lgr) << "create_player '" << name << "': " << vr.message;
            return vr;
        }
        pc = prov->prepare_config( pc );
        m_store->set_player( name, pc );
        LOG_INFO(Lgr) << "Created player '" << name << "' (" << type
                      << ") on " << device;
        return Op_result::success( "Player '" + name + "' created successfully" );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "create_player '" << name << "' failed: " << ex.what();
        return Op_result::failure( std::string("Failed to create player: ") + ex.what() );
    }
}

/// Reconfigure (and possibly rename) a player.  A running player is
/// stopped, and restarted under the new configuration once it has been
/// saved; a failed restart still counts as a successful update.
///
Op_result Player_orchestrator::update_player( const std::string &old_name,
                                              const std::string &new_name,
                                              const std::string &device,
                                              const std::string &ptype,
                                              const Json::Value &extra )
{
    const std::string &target = new_name.empty() ? old_name : new_name;
    if (target != old_name) {
        Op_result nv = validate_player_name( target );
        if (not nv.ok) return nv;
    }
    auto m1 = name_lock( old_name );
    auto m2 = name_lock( target );
    std::unique_lock<std::mutex> l1( *m1, std::defer_lock );
    std::unique_lock<std::mutex> l2( *m2, std::defer_lock );
    if (m1 == m2) {
        l1.lock();
    } else {
        std::lock( l1, l2 );
    }
    try {
        return do_update( old_name, target, device, ptype, extra );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "update_player '" << old_name << "' failed: " << ex.what();
        return Op_result::failure( std::string("Failed to update player: ") + ex.what() );
    }
}

/// Body of update_player; both name locks are held.
///
Op_result Player_orchestrator::do_update( const std::string &old_name,
                                          const std::string &new_name,
                                          const std::string &device,
                                          const std::string &ptype,
                                          const Json::Value &extra )
{
    auto existing = m_store->get_player( old_name );
    if (not existing) {
        return Op_result::failure( not_found(old_name) );
    }
    bool renaming = (new_name != old_name);
    if (renaming and m_store->player_exists( new_name )) {
        LOG_WARNING(Lgr) << "update_player: '" << new_name << "' already exists";
        return Op_result::failure( "Player '" + new_name + "' already exists" );
    }
    Player_config pc { *existing };
    pc.name = new_name;
    if (not device.empty()) pc.device = device;
    if (not ptype.empty()) pc.provider = ptype;
    Op_result mr = pc.merge_fields( extra );
    if (not mr.ok) return mr;

    spProvider prov = m_registry->get_for_player( pc );
    if (prov) {
        Op_result vr = prov->validate_config( pc );
        if (not vr.ok) {
            LOG_WARNING(Lgr) << "update_player '" << old_name << "': " << vr.message;
            return vr;
        }
        pc = prov->prepare_config( pc );
    } else {
        LOG_WARNING(Lgr) << "update_player '" << old_name << "': provider '"
                         << pc.provider << "' is not registered; saving anyway";
    }

    bool was_running = m_super->is_running( old_name );
    if (was_running) {
        Op_result sr = m_super->stop( old_name );
        LOG_INFO(Lgr) << "update_player stopped '" << old_name << "': " << sr.message;
    }
    try {
        m_store->replace_player( old_name, pc );
    }
    catch (Store_error&) {
        LOG_ERROR(Lgr) << "update_player: could not save '" << new_name << "'";
        if (was_running) {
            Op_result rr = start_locked( old_name );
            LOG_INFO(Lgr) << "Restarted '" << old_name << "' on the old "
                          << "configuration: " << rr.message;
        }
        return Op_result::failure( "Failed to save configuration for '" + old_name + "'" );
    }
    LOG_INFO(Lgr) << "Updated player '" << old_name << "'"
                  << (renaming ? (" as '" + new_name + "'") : std::string());

    if (was_running) {
        Op_result rr = start_locked( new_name );
        if (not rr.ok) {
            LOG_WARNING(Lgr) << "Player '" << new_name << "' updated but restart failed: "
                             << rr.message;
            return Op_result::success(
                "Player updated successfully, but failed to restart: " + rr.message );
        }
        return Op_result::success( "Player updated and restarted successfully" );
    }
    return Op_result::success( "Player updated successfully" );
}

/// Stop (outcome ignored) and forget a player.
///
Op_result Player_orchestrator::delete_player( const std::string &name )
{
    auto nm = name_lock( name );
    std::lock_guard<std::mutex> lock( *nm );
    try {
        if (not m_store->player_exists( name )) {
            return Op_result::failure( not_found(name) );
        }
        Op_result sr = m_super->stop( name );
        LOG_DEBUG(Lgr) << "delete_player stop '" << name << "': " << sr.message;
        m_store->delete_player( name );
        LOG_INFO(Lgr) << "Deleted player '" << name << "'";
        return Op_result::success( "Player '" + name + "' deleted successfully" );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "delete_player '" << name << "' failed: " << ex.what();
        return Op_result::failure( std::string("Failed to delete player: ") + ex.what() );
    }
}

/// Start under the caller's name lock.
///
Op_result Player_orchestrator::start_locked( const std::string &name )
{
    auto pc = m_store->get_player( name );
    if (not pc) {
        return Op_result::failure( not_found(name) );
    }
    spProvider prov = m_registry->get_for_player( *pc );
    if (not prov) {
        LOG_ERROR(Lgr) << "start_player '" << name << "': unknown provider '"
                       << pc->provider << "'";
        return Op_result::failure( "Unknown provider type: " + pc->provider );
    }
    auto logpath = m_super->get_log_path( name );
    Command cmd = prov->build_command( *pc, logpath );
    Command fallback;
    if (prov->supports_fallback()) {
        fallback = prov->build_fallback_command( *pc, logpath );
    }
    bool used_fallback = false;
    Op_result r = m_super->start( name, cmd, fallback, &used_fallback );
    if (not r.ok) {
        LOG_WARNING(Lgr) << "Player '" << name << "' did not start: " << r.message;
        return r;
    }
    if (used_fallback) {
        LOG_WARNING(Lgr) << "Player '" << name << "' running on fallback device; '"
                         << pc->device << "' unavailable";
        return Op_result::success( "Player '" + name + "' started with default device"
                                   " (device '" + pc->device + "' unavailable)" );
    }
    return Op_result::success( "Player '" + name + "' started successfully" );
}

Op_result Player_orchestrator::start_player( const std::string &name )
{
    auto nm = name_lock( name );
    std::lock_guard<std::mutex> lock( *nm );
    try {
        return start_locked( name );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "start_player '" << name << "' failed: " << ex.what();
        return Op_result::failure( std::string("Error starting player: ") + ex.what() );
    }
}

Op_result Player_orchestrator::stop_player( const std::string &name )
{
    auto nm = name_lock( name );
    std::lock_guard<std::mutex> lock( *nm );
    return m_super->stop( name );
}

bool Player_orchestrator::get_player_status( const std::string &name )
{
    return m_super->is_running( name );
}

/// Running flag for every stored player, including never-started ones.
///
Status_map Player_orchestrator::get_all_statuses()
{
    return m_super->get_all_statuses( m_store->list_players() );
}

//////////////////////////////////////////////////////////////////////////
///                        Volume and offset

/// Current volume via the provider, else the stored one, else the
/// default.  If no volume was ever stored, the value returned is saved
/// as a side effect (failure to save is only logged).  Empty only for an
/// unknown name.
///
boost::optional<int>
Player_orchestrator::get_player_volume( const std::string &name )
{
    auto nm = name_lock( name );
    std::lock_guard<std::mutex> lock( *nm );
    auto pc = m_store->get_player( name );
    if (not pc) return boost::none;
    boost::optional<int> vol = pc->volume;
    spProvider prov = m_registry->get_for_player( *pc );
    if (prov) {
        int v = prov->get_volume( *pc );
        if (v >= MinVolume and v <= MaxVolume) {
            vol = v;
        }
    }
    if (not vol) {
        vol = DefaultVolume;
    }
    if (not pc->volume) {
        try {
            m_store->update_player_field( name, Pkey::volume, Json::Value(*vol) );
            LOG_INFO(Lgr) << "Recorded volume " << *vol << "% for '" << name << "'";
        }
        catch (std::exception &ex) {
            LOG_WARNING(Lgr) << "Could not record volume for '" << name
                             << "': " << ex.what();
        }
    }
    return vol;
}

/// The stored volume always becomes pct; the hardware result only adds
/// a warning to the message.
///
Op_result Player_orchestrator::set_player_volume( const std::string &name, int pct )
{
    if (pct < MinVolume or pct > MaxVolume) {
        return Op_result::failure( "Volume must be between 0 and 100" );
    }
    auto nm = name_lock( name );
    std::lock_guard<std::mutex> lock( *nm );
    try {
        auto pc = m_store->get_player( name );
        if (not pc) {
            return Op_result::failure( not_found(name) );
        }
        if (not m_store->update_player_field( name, Pkey::volume, Json::Value(pct) )) {
            return Op_result::failure( "Failed to save volume for '" + name + "'" );
        }
        std::string vmsg = "Volume set to " + std::to_string(pct) + "%";
        spProvider prov = m_registry->get_for_player( *pc );
        Op_result hw = prov ? prov->set_volume( *pc, pct )
            : Op_result::failure( "unknown provider '" + pc->provider + "'" );
        if (not hw.ok) {
            LOG_WARNING(Lgr) << "Volume for '" << name << "' saved as " << pct
                             << "% but not applied: " << hw.message;
            return Op_result::success( vmsg + " (hardware volume not applied: "
                                       + hw.message + ")" );
        }
        LOG_INFO(Lgr) << "Volume for '" << name << "' set to " << pct << "%";
        return Op_result::success( vmsg );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "set_player_volume '" << name << "' failed: " << ex.what();
        return Op_result::failure( std::string("Failed to set volume: ") + ex.what() );
    }
}

/// Store a sync offset; it takes effect at the next start.
///
Op_result Player_orchestrator::set_player_offset( const std::string &name, int delay_ms )
{
    if (delay_ms < MinDelayMs or delay_ms > MaxDelayMs) {
        return Op_result::failure( "delay_ms must be between -1000 and 1000" );
    }
    auto nm = name_lock( name );
    std::lock_guard<std::mutex> lock( *nm );
    try {
        if (not m_store->update_player_field( name, Pkey::delay_ms, Json::Value(delay_ms) )) {
            return Op_result::failure( not_found(name) );
        }
        LOG_INFO(Lgr) << "Offset for '" << name << "' set to " << delay_ms << "ms";
        return Op_result::success( "Offset updated to " + std::to_string(delay_ms)
                                   + "ms. Restart player to apply." );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "set_player_offset '" << name << "' failed: " << ex.what();
        return Op_result::failure( std::string("Failed to set offset: ") + ex.what() );
    }
}

//////////////////////////////////////////////////////////////////////////
///                          Queries

std::vector<Player_config> Player_orchestrator::players() const
{
    return m_store->all_players();
}

boost::optional<Player_config>
Player_orchestrator::get_player( const std::string &name ) const
{
    return m_store->get_player( name );
}

/// Providers whose binaries are installed; all of them if none is.
///
std::vector<Provider_info> Player_orchestrator::get_available_providers() const
{
    auto infos = m_registry->get_provider_info( true );
    if (infos.empty()) {
        LOG_WARNING(Lgr) << "No provider binaries found; listing all providers";
        infos = m_registry->get_provider_info( false );
    }
    return infos;
}

/// Whether the stored configuration of name could be started as is:
/// known provider, binary installed, and the provider accepts it.
///
Op_result Player_orchestrator::check_player( const std::string &name ) const
{
    auto pc = m_store->get_player( name );
    if (not pc) {
        return Op_result::failure( not_found(name) );
    }
    spProvider prov = m_registry->get_for_player( *pc );
    if (not prov) {
        return Op_result::failure( "Unknown provider type: " + pc->provider );
    }
    if (not prov->is_available()) {
        return Op_result::failure( "Binary '" + prov->binary() + "' not found" );
    }
    return prov->validate_config( *pc );
}

//////////////////////////////////////////////////////////////////////////
///                        Device passthrough

std::vector<Audio_device> Player_orchestrator::get_audio_devices()
{
    if (not m_volsvc) return {};
    return m_volsvc->get_devices();
}

std::vector<std::string>
Player_orchestrator::get_mixer_controls( const std::string &dev )
{
    if (not m_volsvc) return {};
    return m_volsvc->get_mixer_controls( dev );
}

int Player_orchestrator::get_device_volume( const std::string &dev,
                                            const std::string &control )
{
    if (not m_volsvc) return -1;
    return m_volsvc->get_volume( dev, control );
}

Op_result Player_orchestrator::set_device_volume( const std::string &dev,
                                                  int pct,
                                                  const std::string &control )
{
    if (pct < MinVolume or pct > MaxVolume) {
        return Op_result::failure( "Volume must be between 0 and 100" );
    }
    if (not m_volsvc) {
        return Op_result::failure( "No volume service available" );
    }
    return m_volsvc->set_volume( dev, pct, control );
}

Op_result Player_orchestrator::play_test_tone( const std::string &dev )
{
    if (not m_volsvc) {
        return Op_result::failure( "No volume service available" );
    }
    return m_volsvc->play_test_tone( dev );
}

//////////////////////////////////////////////////////////////////////////
///                         Daemon support

/// Start every enabled player.  Returns the number started.
///
int Player_orchestrator::autostart()
{
    int started = 0;
    for (const auto &pc : m_store->all_players()) {
        if (not pc.enabled) {
            LOG_INFO(Lgr) << "Autostart: '" << pc.name << "' is disabled";
            continue;
        }
        Op_result r = start_player( pc.name );
        if (r.ok) {
            ++started;
        } else {
            LOG_WARNING(Lgr) << "Autostart: " << r.message;
        }
    }
    LOG_INFO(Lgr) << "Autostarted " << started << " player(s)";
    return started;
}

/// Forget processes that exited on their own; returns their names.
///
std::vector<std::string> Player_orchestrator::reap_crashed()
{
    auto names = m_super->cleanup_dead_processes();
    for (const auto &name : names) {
        LOG_WARNING(Lgr) << "Player '" << name << "' exited unexpectedly; see "
                         << m_super->get_log_path( name );
    }
    return names;
}

/// Re-read the player store.  Running processes are left alone.
///
Op_result Player_orchestrator::reload()
{
    try {
        m_store->load();
        return Op_result::success( "Player configuration reloaded" );
    }
    catch (std::exception &ex) {
        LOG_ERROR(Lgr) << "Reload failed: " << ex.what();
        return Op_result::failure( std::string("Reload failed: ") + ex.what() );
    }
}

/// Stop every player process.
///
int Player_orchestrator::shutdown()
{
    LOG_INFO(Lgr) << "Stopping all players";
    return m_super->stop_all();
}
