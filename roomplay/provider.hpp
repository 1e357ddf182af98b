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

#include <memory>
#include <string>
#include <boost/filesystem.hpp>

#include "common.hpp"
#include "playercfg.hpp"

class Config;


/**
 * Abstract Provider interface.  A provider knows how one family of
 * player binaries is configured and launched.  Providers are stateless
 * with respect to players: one instance serves every player of its type,
 * and nothing here spawns processes.
 */
class Provider {
public:
    virtual ~Provider()=0;
    //
    virtual const std::string& type_name() const = 0;
    virtual const std::string& display_name() const = 0;
    virtual const std::string& binary() const = 0;
    virtual void configure( Config& ) = 0;
    virtual bool is_available() const = 0;
    //
    virtual Op_result validate_config( const Player_config& ) const = 0;
    virtual Player_config prepare_config( const Player_config& ) const = 0;
    virtual Command build_command( const Player_config&,
                                   const boost::filesystem::path& ) const = 0;
    virtual bool supports_fallback() const = 0;
    virtual Command build_fallback_command(
        const Player_config&, const boost::filesystem::path& ) const = 0;
    //
    virtual int get_volume( const Player_config& ) = 0;
    virtual Op_result set_volume( const Player_config&, int ) = 0;
};

/// Shared pointer to a Provider.
using spProvider = std::shared_ptr<Provider>;


/**
 * Base_provider implements the parts common to all concrete providers:
 * names, binary lookup, range checks, pseudo-MAC completion, and the
 * stored-only volume behavior.  Subclasses add their required fields
 * and command line.
 */
class Base_provider : public Provider {
protected:
    std::string m_type;
    std::string m_display;
    std::string m_section;             // Config section name
    std::string m_binary;
    //
    virtual Op_result check_specific( const Player_config& ) const;
public:
    Base_provider( const char* /*type*/, const char* /*display*/,
                   const char* /*section*/, const char* /*binary*/ );
    //
    const std::string& type_name() const override { return m_type; }
    const std::string& display_name() const override { return m_display; }
    const std::string& binary() const override { return m_binary; }
    void configure( Config& ) override;
    bool is_available() const override;
    //
    Op_result validate_config( const Player_config& ) const override;
    Player_config prepare_config( const Player_config& ) const override;
    bool supports_fallback() const override { return false; }
    Command build_fallback_command(
        const Player_config&, const boost::filesystem::path& ) const override;
    int get_volume( const Player_config& ) override;
    Op_result set_volume( const Player_config&, int ) override;
};


/// Deterministic locally administered unicast MAC from a player name.
std::string derive_mac_address( const std::string& );

/// True for six colon separated hex octets.
bool is_valid_mac_address( const std::string& );

/// Lower case hex MD5 of a string.
std::string md5_hex( const std::string& );
