#include <catch2/catch.hpp>

#include <config/options.hpp>

using namespace l2stream;
using l2stream::config::parse_number;
using l2stream::config::parse_options;

TEST_CASE( "Number parsing", "[config][options]" ) {
    REQUIRE( 37 == *parse_number("37") );
    REQUIRE( 0x25 == *parse_number("0x25") );
    REQUIRE( 0x1001 == *parse_number("0X1001") );
    REQUIRE( !parse_number("") );
    REQUIRE( !parse_number("0x") );
    REQUIRE( !parse_number("12ab") );
    REQUIRE( !parse_number("-1") );
    REQUIRE( !parse_number("99999999999") );
}

TEST_CASE( "Options defaults", "[config][options]" ) {
    std::string error;
    auto config = parse_options({}, error);
    REQUIRE( config );
    REQUIRE( error.empty() );

    REQUIRE( DEFAULT_PSM == config->psm );
    REQUIRE( SourceKind::Capture == config->source );
    REQUIRE( "input.pcm" == config->input_path );
    REQUIRE( "output.pcm" == config->output_path );
    REQUIRE( config->playback );
    REQUIRE( !config->to_file );
    REQUIRE( !config->loopback );
    REQUIRE( config->pace_file );
    REQUIRE( 0 == config->chunk_size );
    REQUIRE( 48000 == config->audio.sample_rate );
    REQUIRE( 1 == config->audio.channels );
    REQUIRE( SampleFormat::S16LE == config->audio.format );
    REQUIRE( DEFAULT_QUANTUM == config->quantum );
    REQUIRE( config->connect_address.empty() );
    REQUIRE( !config->send );
    REQUIRE( !config->verbose );
}

TEST_CASE( "Options override defaults", "[config][options]" ) {
    std::string error;
    auto config = parse_options({"--psm", "0x1001", "--source", "file", "--input", "/tmp/in.raw",
                                 "--no-playback", "--to-file", "--output", "/tmp/out.raw",
                                 "--loopback", "--chunk", "988", "--rate", "16000",
                                 "--channels", "2", "--format", "f32", "--quantum", "256",
                                 "--no-pace", "--connect", "11:22:33:44:55:66", "--send",
                                 "--verbose"},
                                error);
    REQUIRE( config );
    REQUIRE( 0x1001 == config->psm );
    REQUIRE( SourceKind::File == config->source );
    REQUIRE( "/tmp/in.raw" == config->input_path );
    REQUIRE( !config->playback );
    REQUIRE( config->to_file );
    REQUIRE( "/tmp/out.raw" == config->output_path );
    REQUIRE( config->loopback );
    REQUIRE( 988 == config->chunk_size );
    REQUIRE( 16000 == config->audio.sample_rate );
    REQUIRE( 2 == config->audio.channels );
    REQUIRE( SampleFormat::F32LE == config->audio.format );
    REQUIRE( 256 == config->quantum );
    REQUIRE( !config->pace_file );
    REQUIRE( "11:22:33:44:55:66" == config->connect_address );
    REQUIRE( config->send );
    REQUIRE( config->verbose );
}

TEST_CASE( "Invalid options name the option", "[config][options]" ) {
    std::string error;

    SECTION( "even PSM" ) {
        REQUIRE( !parse_options({"--psm", "0x24"}, error) );
        REQUIRE( error.find("--psm") != std::string::npos );
    }
    SECTION( "PSM with odd upper byte" ) {
        REQUIRE( !parse_options({"--psm", "0x0101"}, error) );
        REQUIRE( error.find("--psm") != std::string::npos );
    }
    SECTION( "missing value" ) {
        REQUIRE( !parse_options({"--input"}, error) );
        REQUIRE( error.find("--input") != std::string::npos );
    }
    SECTION( "bad source" ) {
        REQUIRE( !parse_options({"--source", "radio"}, error) );
        REQUIRE( error.find("--source") != std::string::npos );
    }
    SECTION( "bad format" ) {
        REQUIRE( !parse_options({"--format", "s24"}, error) );
        REQUIRE( error.find("--format") != std::string::npos );
    }
    SECTION( "channels out of range" ) {
        REQUIRE( !parse_options({"--channels", "3"}, error) );
        REQUIRE( error.find("--channels") != std::string::npos );
    }
    SECTION( "unknown option" ) {
        REQUIRE( !parse_options({"--bogus"}, error) );
        REQUIRE( error.find("--bogus") != std::string::npos );
    }
    SECTION( "send without a peer" ) {
        REQUIRE( !parse_options({"--send"}, error) );
        REQUIRE( error.find("--send") != std::string::npos );
    }
}
