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
#include <vector>

#include "common.hpp"

class Config;


/// An output device as the sound system names it.
struct Audio_device {
    std::string id {};          // e.g. "hw:0,0"
    std::string name {};        // human readable
};


/**
 * Abstract device/volume service: device enumeration and hardware
 * mixer access.  None of the members throw; failures come back as a
 * failed Op_result, an empty list, or a volume of -1 (unknown).
 *
 * An empty control name selects the configured default control.
 */
class Volume_service {
public:
    virtual ~Volume_service()=0;
    //
    virtual std::vector<Audio_device> get_devices()=0;
    virtual std::vector<std::string> get_mixer_controls( const std::string& )=0;
    virtual int get_volume( const std::string& /*dev*/,
                            const std::string& /*control*/ )=0;
    virtual Op_result set_volume( const std::string& /*dev*/, int,
                                  const std::string& /*control*/ )=0;
    virtual Op_result play_test_tone( const std::string& )=0;
};

using spVolume_service = std::shared_ptr<Volume_service>;


/**
 * Volume_service that drives the ALSA command line tools: aplay for
 * enumeration, amixer for controls and volume, speaker-test for tones.
 */
class Alsa_volume_service : public Volume_service {
private:
    std::string m_control {"Master"};
    std::string m_alt_control {"PCM"};
    std::string m_amixer {"amixer"};
    std::string m_aplay {"aplay"};
    std::string m_speaker_test {"speaker-test"};
    long m_timeout_ms {10000};
    //
    int read_volume( const std::string&, const std::string& );
    bool write_volume( const std::string&, const std::string&, int,
                       std::string& );
public:
    Alsa_volume_service();
    void configure( Config& );
    static std::string card_of( const std::string& );
    static std::vector<Audio_device> parse_aplay( const std::string& );
    static std::vector<std::string> parse_scontrols( const std::string& );
    static int parse_percent( const std::string& );
    //
    std::vector<Audio_device> get_devices() override;
    std::vector<std::string> get_mixer_controls( const std::string& ) override;
    int get_volume( const std::string&, const std::string& ) override;
    Op_result set_volume( const std::string&, int, const std::string& ) override;
    Op_result play_test_tone( const std::string& ) override;
};
