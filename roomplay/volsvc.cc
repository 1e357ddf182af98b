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

#include <sstream>
#include <boost/regex.hpp>
#include <boost/algorithm/string.hpp>

#include "volsvc.hpp"
#include "config.hpp"
#include "cmdrun.hpp"
#include "logging.hpp"


/// Pro forma destructor for the interface.
Volume_service::~Volume_service() { }


/// CTOR
Alsa_volume_service::Alsa_volume_service()
{
}

/// Read the Volume section of the daemon configuration.
/// * May throw Config_error on a malformed value
///
void Alsa_volume_service::configure( Config &cfg )
{
    cfg.get_string( "Volume", "mixer_control", m_control );
    cfg.get_string( "Volume", "amixer_bin", m_amixer );
    cfg.get_string( "Volume", "aplay_bin", m_aplay );
    cfg.get_string( "Volume", "speaker_test_bin", m_speaker_test );
    unsigned secs = static_cast<unsigned>( m_timeout_ms / 1000 );
    if (cfg.get_unsigned( "Volume", "command_timeout_secs", secs )) {
        if (secs < 1) {
            LOG_ERROR(Lgr) << "Volume command_timeout_secs must be positive";
            throw Config_error();
        }
        m_timeout_ms = secs * 1000L;
    }
    LOG_INFO(Lgr) << "Alsa_volume_service control '" << m_control
                  << "' via " << m_amixer;
}

/// Mixer card for a PCM device: "hw:1,0" and "plughw:1,0" both
/// become "hw:1".  Anything else (e.g. "default") is passed as is.
///
std::string Alsa_volume_service::card_of( const std::string &dev )
{
    static const boost::regex hwre { "^(?:plug)?hw:([^,]+)(?:,.*)?$" };
    boost::smatch m;
    if (boost::regex_match( dev, m, hwre )) {
        return "hw:" + m[1].str();
    }
    return dev;
}

/// Parse output of "aplay -l":
///   card 0: PCH [HDA Intel PCH], device 0: ALC892 Analog [ALC892 Analog]
///
std::vector<Audio_device> Alsa_volume_service::parse_aplay( const std::string &txt )
{
    static const boost::regex linere {
        "^card (\\d+): [^\\[]*\\[([^\\]]*)\\], device (\\d+): [^\\[]*\\[([^\\]]*)\\]" };
    std::vector<Audio_device> devs;
    std::istringstream iss( txt );
    std::string line;
    while (std::getline( iss, line )) {
        boost::smatch m;
        if (boost::regex_search( line, m, linere )) {
            Audio_device d;
            d.id = "hw:" + m[1].str() + "," + m[3].str();
            d.name = m[2].str() + ": " + m[4].str();
            devs.push_back( d );
        }
    }
    return devs;
}

/// Parse output of "amixer scontrols":
///   Simple mixer control 'Master',0
///
std::vector<std::string>
Alsa_volume_service::parse_scontrols( const std::string &txt )
{
    static const boost::regex ctlre { "Simple mixer control '([^']+)',\\d+" };
    std::vector<std::string> ctls;
    auto it = boost::sregex_iterator( txt.begin(), txt.end(), ctlre );
    for ( ; it != boost::sregex_iterator(); ++it) {
        ctls.push_back( (*it)[1].str() );
    }
    return ctls;
}

/// First "[NN%]" in amixer sget output, or -1.
///
int Alsa_volume_service::parse_percent( const std::string &txt )
{
    static const boost::regex pctre { "\\[(\\d{1,3})%\\]" };
    boost::smatch m;
    if (boost::regex_search( txt, m, pctre )) {
        int v = std::stoi( m[1].str() );
        if (v >= MinVolume and v <= MaxVolume) return v;
    }
    return -1;
}

//////////////////////////////////////////////////////////////////////////

/// Run "amixer -D CARD sget CONTROL" and extract the percentage.
///
int Alsa_volume_service::read_volume( const std::string &dev,
                                      const std::string &control )
{
    std::string out;
    int rc = run_capture( { m_amixer, "-D", card_of(dev), "sget", control },
                          out, m_timeout_ms );
    if (rc != 0) {
        LOG_DEBUG(Lgr) << "amixer sget " << control << " on " << dev
                       << " failed (" << rc << ")";
        return -1;
    }
    return parse_percent( out );
}

/// Run "amixer -D CARD sset CONTROL N%".  On failure errmsg says why.
///
bool Alsa_volume_service::write_volume( const std::string &dev,
                                        const std::string &control,
                                        int pct,
                                        std::string &errmsg )
{
    std::string out;
    int rc = run_capture( { m_amixer, "-D", card_of(dev), "sset", control,
                            std::to_string(pct) + "%" },
                          out, m_timeout_ms );
    if (rc == 0) return true;
    if (rc == RC_NOEXEC) {
        errmsg = m_amixer + " is not available";
    } else if (rc == RC_TIMEOUT) {
        errmsg = m_amixer + " timed out";
    } else {
        boost::algorithm::trim( out );
        errmsg = out.empty() ? ("amixer exit status " + std::to_string(rc)) : out;
    }
    return false;
}


std::vector<Audio_device> Alsa_volume_service::get_devices()
{
    std::string out;
    int rc = run_capture( { m_aplay, "-l" }, out, m_timeout_ms );
    if (rc != 0) {
        LOG_WARNING(Lgr) << m_aplay << " -l failed (" << rc << ")";
        return {};
    }
    auto devs = parse_aplay( out );
    LOG_DEBUG(Lgr) << "Found " << devs.size() << " audio device(s)";
    return devs;
}


std::vector<std::string>
Alsa_volume_service::get_mixer_controls( const std::string &dev )
{
    std::string out;
    int rc = run_capture( { m_amixer, "-D", card_of(dev), "scontrols" },
                          out, m_timeout_ms );
    if (rc != 0) {
        LOG_WARNING(Lgr) << "Cannot list mixer controls for " << dev;
        return {};
    }
    return parse_scontrols( out );
}

/// Volume of dev in percent, or -1.  With no control given, the
/// configured control is tried and then the alternate (PCM).
///
int Alsa_volume_service::get_volume( const std::string &dev,
                                     const std::string &control )
{
    if (not control.empty()) {
        return read_volume( dev, control );
    }
    int v = read_volume( dev, m_control );
    if (v < 0 and m_alt_control != m_control) {
        v = read_volume( dev, m_alt_control );
    }
    return v;
}


Op_result Alsa_volume_service::set_volume( const std::string &dev,
                                           int pct,
                                           const std::string &control )
{
    if (pct < MinVolume or pct > MaxVolume) {
        return Op_result::failure( "Volume must be between 0 and 100" );
    }
    std::string err;
    std::string used = control.empty() ? m_control : control;
    bool ok = write_volume( dev, used, pct, err );
    if (not ok and control.empty() and m_alt_control != m_control) {
        std::string err2;
        if (write_volume( dev, m_alt_control, pct, err2 )) {
            ok = true;
            used = m_alt_control;
        }
    }
    if (not ok) {
        LOG_WARNING(Lgr) << "Hardware volume on " << dev << " not set: " << err;
        return Op_result::failure( "Failed to set volume on " + dev + ": " + err );
    }
    LOG_INFO(Lgr) << "Set " << dev << " " << used << " to " << pct << "%";
    return Op_result::success( "Volume set to " + std::to_string(pct) + "%" );
}


Op_result Alsa_volume_service::play_test_tone( const std::string &dev )
{
    std::string out;
    int rc = run_capture( { m_speaker_test, "-D", dev, "-t", "sine", "-l", "1" },
                          out, m_timeout_ms );
    if (rc == 0) {
        return Op_result::success( "Test tone played on " + dev );
    }
    if (rc == RC_NOEXEC) {
        return Op_result::failure( m_speaker_test + " is not available" );
    }
    if (rc == RC_TIMEOUT) {
        return Op_result::failure( "Test tone on " + dev + " timed out" );
    }
    boost::algorithm::trim( out );
    LOG_WARNING(Lgr) << "Test tone on " << dev << " failed: " << out;
    return Op_result::failure( "Test tone failed on " + dev );
}
