/// Test Player_config and the JSON player store
///
///    tstore  --log_level=all

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


/// Dynamically link boost test framework
#define BOOST_TEST_MODULE store_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <boost/filesystem/fstream.hpp>

#include "logging.hpp"
#include "playercfg.hpp"
#include "playerstore.hpp"

namespace fs = boost::filesystem;

/// Handles logging setup/teardown and a scratch players file.
///
struct StoreFixture {
    fs::path dir;
    fs::path file;
    StoreFixture() {
        init_logging("tstore","tstore_%5N.log",LF_FILE|LF_DEBUG);
        dir = fs::temp_directory_path() / fs::unique_path( "tstore-%%%%-%%%%" );
        file = dir / "players.json";
    }
    ~StoreFixture() {
        boost::system::error_code ec;
        fs::remove_all( dir, ec );
        finish_logging();
    }
};

/// A store whose disk can be made to fail on demand.
///
class Flaky_store : public Json_player_store {
public:
    bool fail {false};
    int writes {0};
    explicit Flaky_store( const fs::path &p ) : Json_player_store( p ) {}
protected:
    void write_document( const Json::Value &doc ) override {
        if (fail) throw Store_error();
        ++writes;
        Json_player_store::write_document( doc );
    }
};

static Player_config make_player( const std::string &name, const std::string &dev )
{
    Player_config pc;
    pc.name = name;
    pc.device = dev;
    pc.provider = "squeezelite";
    pc.volume = 75;
    return pc;
}

//////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_CASE( Name_validation_test )
{
    StoreFixture sf;
    LOG_INFO(Lgr) << "Unit test: Name_validation_test";

    BOOST_TEST( validate_player_name( "Kitchen" ).ok );
    BOOST_TEST( validate_player_name( "Kid's Room - 2_b" ).ok );

    Op_result r = validate_player_name( "" );
    BOOST_TEST( not r.ok );
    BOOST_CHECK_EQUAL( r.message, "Player name must not be empty" );

    r = validate_player_name( std::string( 101, 'a' ) );
    BOOST_TEST( not r.ok );
    BOOST_CHECK_EQUAL( r.message, "Name must be at most 100 characters" );
    BOOST_TEST( validate_player_name( std::string( 100, 'a' ) ).ok );

    r = validate_player_name( "Den/1" );
    BOOST_TEST( not r.ok );
    BOOST_TEST( r.message.find( "invalid characters" ) != std::string::npos );
    BOOST_TEST( r.message.find( "/" ) != std::string::npos );
}

/// JSON form keeps unknown fields and never lets them shadow core ones.
///
BOOST_AUTO_TEST_CASE( Player_json_test )
{
    StoreFixture sf;
    LOG_INFO(Lgr) << "Unit test: Player_json_test";

    Json::Value jv { Json::objectValue };
    jv["name"] = "Kitchen";
    jv["device"] = "hw:1,0";
    jv["provider"] = "snapcast";
    jv["server_ip"] = "10.0.0.5";
    jv["volume"] = 40;
    jv["delay_ms"] = -20;
    jv["enabled"] = false;
    jv["color"] = "blue";

    Player_config pc = Player_config::from_json( jv );
    BOOST_CHECK_EQUAL( pc.name, "Kitchen" );
    BOOST_CHECK_EQUAL( pc.provider, "snapcast" );
    BOOST_TEST( pc.volume.is_initialized() );
    BOOST_CHECK_EQUAL( *pc.volume, 40 );
    BOOST_CHECK_EQUAL( pc.delay_ms, -20 );
    BOOST_TEST( not pc.enabled );
    BOOST_CHECK_EQUAL( pc.extra_string( "color" ), "blue" );
    BOOST_CHECK_EQUAL( pc.extra_string( "shape", "round" ), "round" );

    Json::Value out = pc.to_json();
    BOOST_CHECK_EQUAL( out["color"].asString(), "blue" );
    BOOST_CHECK_EQUAL( out["server_ip"].asString(), "10.0.0.5" );
    BOOST_CHECK_EQUAL( out["volume"].asInt(), 40 );

    // absent volume stays absent
    Json::Value jnv { Json::objectValue };
    jnv["name"] = "Den";
    Player_config pn = Player_config::from_json( jnv );
    BOOST_TEST( not pn.volume.is_initialized() );
    BOOST_TEST( pn.enabled );
    BOOST_TEST( not pn.to_json().isMember( "volume" ) );

    BOOST_CHECK_THROW( Player_config::from_json( Json::Value( "x" ) ), Store_error );
}

/// Caller-supplied fields: identity keys are ignored, typed core keys
/// are checked, anything else is kept.
///
BOOST_AUTO_TEST_CASE( Merge_fields_test )
{
    StoreFixture sf;
    LOG_INFO(Lgr) << "Unit test: Merge_fields_test";

    Player_config pc = make_player( "Kitchen", "hw:1,0" );
    Json::Value extra { Json::objectValue };
    extra["name"] = "Hijack";
    extra["device"] = "hw:9,9";
    extra["provider"] = "sendspin";
    extra["server_url"] = "ws://music.local:8927/sendspin";
    extra["notes"] = "by the window";
    BOOST_TEST( pc.merge_fields( extra ).ok );
    BOOST_CHECK_EQUAL( pc.name, "Kitchen" );
    BOOST_CHECK_EQUAL( pc.device, "hw:1,0" );
    BOOST_CHECK_EQUAL( pc.provider, "squeezelite" );
    BOOST_CHECK_EQUAL( pc.server_url, "ws://music.local:8927/sendspin" );
    BOOST_CHECK_EQUAL( pc.extra_string( "notes" ), "by the window" );

    Json::Value badvol { Json::objectValue };
    badvol["volume"] = "loud";
    Op_result r = pc.merge_fields( badvol );
    BOOST_TEST( not r.ok );
    BOOST_CHECK_EQUAL( r.message, "Invalid value for field 'volume'" );

    BOOST_TEST( pc.merge_fields( Json::Value() ).ok );
    BOOST_TEST( not pc.merge_fields( Json::Value( 3 ) ).ok );
}

/// Records survive a reload from disk.
///
BOOST_AUTO_TEST_CASE( Persistence_test )
{
    StoreFixture sf;
    LOG_INFO(Lgr) << "Unit test: Persistence_test";
    {
        Json_player_store store( sf.file );
        store.load();   // missing file is an empty store
        BOOST_TEST( store.list_players().empty() );
        store.set_player( "Kitchen", make_player( "Kitchen", "hw:1,0" ) );
        store.set_player( "Den", make_player( "Den", "hw:2,0" ) );
        BOOST_TEST( store.update_player_field( "Den", "volume", Json::Value(30) ) );
        BOOST_TEST( fs::exists( sf.file ) );
        BOOST_TEST( not fs::exists( fs::path( sf.file.string() + ".tmp" ) ) );
    }
    Json_player_store again( sf.file );
    again.load();
    auto names = again.list_players();
    BOOST_REQUIRE_EQUAL( names.size(), 2u );
    BOOST_CHECK_EQUAL( names[0], "Den" );
    BOOST_CHECK_EQUAL( names[1], "Kitchen" );
    auto den = again.get_player( "Den" );
    BOOST_REQUIRE( den );
    BOOST_CHECK_EQUAL( *den->volume, 30 );
    BOOST_CHECK_EQUAL( den->device, "hw:2,0" );

    BOOST_TEST( again.delete_player( "Den" ) );
    BOOST_TEST( not again.delete_player( "Den" ) );
    BOOST_TEST( not again.player_exists( "Den" ) );

    // field updates that must be refused
    BOOST_TEST( not again.update_player_field( "Nobody", "volume", Json::Value(5) ) );
    BOOST_TEST( not again.update_player_field( "Kitchen", "name", Json::Value("K2") ) );
    BOOST_TEST( not again.update_player_field( "Kitchen", "enabled", Json::Value(3) ) );
    BOOST_TEST( again.update_player_field( "Kitchen", "enabled", Json::Value(false) ) );
    BOOST_TEST( not again.get_player( "Kitchen" )->enabled );
}

/// The record key wins over the name inside the record; bad files throw.
///
BOOST_AUTO_TEST_CASE( Load_test )
{
    StoreFixture sf;
    LOG_INFO(Lgr) << "Unit test: Load_test";
    fs::create_directories( sf.dir );
    {
        fs::ofstream ofs( sf.file );
        ofs << "{ \"schema\": \"1.0\", \"players\": {"
            << " \"Porch\": { \"name\": \"Deck\", \"device\": \"hw:3,0\","
            << "  \"provider\": \"squeezelite\", \"lamp\": 7 } } }\n";
    }
    Json_player_store store( sf.file );
    store.load();
    auto pc = store.get_player( "Porch" );
    BOOST_REQUIRE( pc );
    BOOST_CHECK_EQUAL( pc->name, "Porch" );
    BOOST_CHECK_EQUAL( pc->extra_string( "lamp" ), "7" );
    BOOST_TEST( not store.get_player( "Deck" ) );

    {
        fs::ofstream ofs( sf.file, std::ios::trunc );
        ofs << "{ \"players\": [ 1, 2 ] }\n";
    }
    BOOST_CHECK_THROW( store.load(), Store_error );
    BOOST_TEST( store.player_exists( "Porch" ) );   // old view kept

    {
        fs::ofstream ofs( sf.file, std::ios::trunc );
        ofs << "{ not json";
    }
    BOOST_CHECK_THROW( store.load(), Store_error );
}

/// A failed write leaves the in-memory view untouched.
///
BOOST_AUTO_TEST_CASE( Rollback_test )
{
    StoreFixture sf;
    LOG_INFO(Lgr) << "Unit test: Rollback_test";

    Flaky_store store( sf.file );
    store.load();
    store.set_player( "Kitchen", make_player( "Kitchen", "hw:1,0" ) );
    BOOST_CHECK_EQUAL( store.writes, 1 );

    store.fail = true;
    BOOST_CHECK_THROW( store.set_player( "Den", make_player( "Den", "hw:2,0" ) ),
                       Store_error );
    BOOST_TEST( not store.player_exists( "Den" ) );

    BOOST_CHECK_THROW( store.update_player_field( "Kitchen", "volume", Json::Value(10) ),
                       Store_error );
    BOOST_CHECK_EQUAL( *store.get_player( "Kitchen" )->volume, 75 );

    Player_config renamed = make_player( "Galley", "hw:1,0" );
    BOOST_CHECK_THROW( store.replace_player( "Kitchen", renamed ), Store_error );
    BOOST_TEST( store.player_exists( "Kitchen" ) );
    BOOST_TEST( not store.player_exists( "Galley" ) );

    BOOST_CHECK_THROW( store.delete_player( "Kitchen" ), Store_error );
    BOOST_TEST( store.player_exists( "Kitchen" ) );

    store.fail = false;
    store.replace_player( "Kitchen", renamed );
    BOOST_TEST( store.player_exists( "Galley" ) );
    BOOST_TEST( not store.player_exists( "Kitchen" ) );
    BOOST_CHECK_EQUAL( store.writes, 2 );
}
