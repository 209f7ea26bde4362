#include <catch2/catch.hpp>

#include "fake_transport.hpp"

#include <stream/chunking.hpp>
#include <types/audio_format.hpp>

using namespace l2stream;

TEST_CASE( "AudioFormat frame and rate arithmetic", "[audio][format]" ) {
    AudioFormat mono;
    REQUIRE( 48000 == mono.sample_rate );
    REQUIRE( 1 == mono.channels );
    REQUIRE( SampleFormat::S16LE == mono.format );
    REQUIRE( 2 == mono.bytes_per_frame() );
    REQUIRE( 96000 == mono.bytes_per_second() );

    AudioFormat stereo_float{44100, 2, SampleFormat::F32LE};
    REQUIRE( 8 == stereo_float.bytes_per_frame() );
    REQUIRE( 352800 == stereo_float.bytes_per_second() );

    AudioFormat u8{8000, 1, SampleFormat::U8};
    REQUIRE( 1 == u8.bytes_per_frame() );
}

TEST_CASE( "AudioFormat chunk duration", "[audio][format][pacing]" ) {
    AudioFormat format;

    REQUIRE( std::chrono::microseconds(1000000) == format.duration_of(96000) );
    REQUIRE( std::chrono::microseconds(10291) == format.duration_of(988) );
    REQUIRE( std::chrono::microseconds(0) == format.duration_of(0) );

    AudioFormat broken{0, 1, SampleFormat::S16LE};
    REQUIRE( std::chrono::microseconds(0) == broken.duration_of(1000) );
}

TEST_CASE( "AudioFormat minimum buffer is one quantum", "[audio][format]" ) {
    AudioFormat format;
    REQUIRE( 2048 == format.min_buffer_size(1024) );

    AudioFormat stereo{48000, 2, SampleFormat::S16LE};
    REQUIRE( 1024 == stereo.min_buffer_size(256) );
}

TEST_CASE( "Chunk size selection", "[chunk][config]" ) {
    auto [socket, peer] = test::make_socket_pair("11:22:33:44:55:66", "local", 672);
    Config config;

    SECTION( "audio on both sides uses the audio buffer" ) {
        REQUIRE( 2048 == stream::select_chunk_size(config, *socket, stream::Direction::Send) );
        REQUIRE( 2048 == stream::select_chunk_size(config, *socket, stream::Direction::Receive) );
    }

    SECTION( "data mode uses the MTU" ) {
        config.source = SourceKind::File;
        config.pace_file = false;
        config.playback = false;
        REQUIRE( 672 == stream::select_chunk_size(config, *socket, stream::Direction::Send) );
        REQUIRE( 672 == stream::select_chunk_size(config, *socket, stream::Direction::Receive) );
    }

    SECTION( "paced files are streamed as audio" ) {
        config.source = SourceKind::File;
        config.quantum = 512;
        REQUIRE( 1024 == stream::select_chunk_size(config, *socket, stream::Direction::Send) );
    }

    SECTION( "explicit override wins" ) {
        config.chunk_size = 100;
        REQUIRE( 100 == stream::select_chunk_size(config, *socket, stream::Direction::Send) );
        REQUIRE( 100 == stream::select_chunk_size(config, *socket, stream::Direction::Receive) );
    }
}
