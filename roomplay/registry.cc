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

#include "registry.hpp"
#include "logging.hpp"
#include "config.hpp"

////////////////////////////////////////////////////////////////////////////
/// *EXTEND*

#include "squeezelite.hpp"
#include "sendspin.hpp"
#include "snapcast.hpp"
// *EXTEND*


/// CTOR
Provider_registry::Provider_registry( const std::string &dflt )
    : m_default_type( dflt )
{
}

/// Create and register every provider roomplay knows about.
///
void Provider_registry::install_standard( Provider_registry &reg,
                                          spVolume_service vs )
{
    reg.register_provider( SqueezeliteType,
                           std::make_shared<Squeezelite_provider>(vs) );
    reg.register_provider( SendspinType, std::make_shared<Sendspin_provider>() );
    reg.register_provider( SnapcastType, std::make_shared<Snapcast_provider>() );
    // ^ *EXTEND* ^
}

/// Register (or replace) the provider for a type name.
///
void Provider_registry::register_provider( const std::string &type,
                                           spProvider pp )
{
    if (not pp) {
        LOG_ERROR(Lgr) << "Provider_registry: attempt to register null provider";
        return;
    }
    std::lock_guard<std::mutex> lock( m_mutex );
    if (m_providers.count(type)) {
        LOG_WARNING(Lgr) << "Provider_registry: replacing provider " << type;
    }
    m_providers[type] = pp;
    LOG_DEBUG(Lgr) << "Registered provider " << type;
}

spProvider Provider_registry::get( const std::string &type ) const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    auto it = m_providers.find( type );
    return (it == m_providers.end()) ? spProvider() : it->second;
}

/// Resolve by the player's provider field; an empty field means the
/// default type.  An unknown explicit type yields null.
///
spProvider Provider_registry::get_for_player( const Player_config &pc ) const
{
    return get( pc.provider.empty() ? m_default_type : pc.provider );
}

std::vector<std::string> Provider_registry::list_providers() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    std::vector<std::string> names;
    for (const auto &pr : m_providers) {
        names.push_back( pr.first );
    }
    return names;
}

/// Availability is probed on each call (binary on PATH).
///
std::vector<Provider_info>
Provider_registry::get_provider_info( bool available_only ) const
{
    std::vector<spProvider> provs;
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        for (const auto &pr : m_providers) {
            provs.push_back( pr.second );
        }
    }
    std::vector<Provider_info> infos;
    for (const auto &pp : provs) {
        Provider_info pi;
        pi.type = pp->type_name();
        pi.display_name = pp->display_name();
        pi.binary = pp->binary();
        pi.available = pp->is_available();
        pi.supports_fallback = pp->supports_fallback();
        if (available_only and not pi.available) continue;
        infos.push_back( pi );
    }
    return infos;
}

/// Let every registered provider read its config section.
/// * May throw Config_error
///
void Provider_registry::configure( Config &cfg )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    for (auto &pr : m_providers) {
        pr.second->configure( cfg );
    }
}
