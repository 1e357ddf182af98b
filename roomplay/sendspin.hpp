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

#include "provider.hpp"

/// Registry type name
constexpr const char *SendspinType {"sendspin"};

/// Extra field holding the stable client identifier
constexpr const char *ClientIdKey {"client_id"};


/// Provider for the Sendspin synchronized-stream client.  Needs a
/// server URL; volume is applied by the server, so only stored here.
///
class Sendspin_provider : public Base_provider {
protected:
    Op_result check_specific( const Player_config& ) const override;
public:
    Sendspin_provider();
    static std::string client_id_for( const std::string& );
    //
    Player_config prepare_config( const Player_config& ) const override;
    Command build_command( const Player_config&,
                           const boost::filesystem::path& ) const override;
};
