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
#include <mutex>
#include <string>
#include <vector>

#include "provider.hpp"
#include "volsvc.hpp"

class Config;

/// Summary of one registered provider for display.
struct Provider_info {
    std::string type {};
    std::string display_name {};
    std::string binary {};
    bool available {false};
    bool supports_fallback {false};
};


/// Name-keyed catalog of providers.
///
class Provider_registry {
private:
    mutable std::mutex m_mutex {};
    std::map<std::string,spProvider> m_providers {};
    std::string m_default_type;
public:
    explicit Provider_registry( const std::string &dflt="squeezelite" );
    //
    void register_provider( const std::string&, spProvider );
    spProvider get( const std::string& ) const;
    spProvider get_for_player( const Player_config& ) const;
    const std::string& default_type() const { return m_default_type; }
    std::vector<std::string> list_providers() const;
    std::vector<Provider_info> get_provider_info( bool /*available_only*/ ) const;
    void configure( Config& );
    //
    static void install_standard( Provider_registry&, spVolume_service );
};
