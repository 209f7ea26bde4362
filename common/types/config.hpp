#pragma once

#include "audio_format.hpp"
#include "enums.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace l2stream {

// L2CAP PSM the service listens and connects on
constexpr uint16_t DEFAULT_PSM = 0x0025;

// PipeWire graph quantum in frames (default.clock.quantum)
constexpr uint32_t DEFAULT_QUANTUM = 1024;

// Device-side buffering as a multiple of the minimum buffer size
constexpr uint32_t DEVICE_BUFFER_FACTOR = 4;

constexpr const char* DEFAULT_INPUT_FILE = "input.pcm";
constexpr const char* DEFAULT_OUTPUT_FILE = "output.pcm";

struct Config {
    // Transport
    uint16_t psm = DEFAULT_PSM;

    // Source (exclusive: capture or file)
    SourceKind source = SourceKind::Capture;
    std::string input_path = DEFAULT_INPUT_FILE;

    // Sinks
    bool playback = true;
    bool to_file = false;
    bool loopback = false;
    std::string output_path = DEFAULT_OUTPUT_FILE;

    // Streaming
    AudioFormat audio{};
    uint32_t quantum = DEFAULT_QUANTUM;
    size_t chunk_size = 0;     // 0 = automatic
    bool pace_file = true;     // play files back at real-time rate

    // Initial client-role connection (daemon only)
    std::string connect_address;
    bool send = false;

    bool verbose = false;
};

} // namespace l2stream
