#pragma once

#include "enums.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace l2stream {

struct AudioFormat {
    uint32_t sample_rate = 48000;
    uint32_t channels = 1;
    SampleFormat format = SampleFormat::S16LE;

    uint32_t bytes_per_frame() const { return channels * bytes_per_sample(format); }
    uint64_t bytes_per_second() const { return uint64_t{sample_rate} * bytes_per_frame(); }

    // Playback time represented by `bytes` of audio in this format
    std::chrono::microseconds duration_of(size_t bytes) const {
        uint64_t rate = bytes_per_second();
        if (rate == 0) return std::chrono::microseconds{0};
        return std::chrono::microseconds{(uint64_t{bytes} * 1000000) / rate};
    }

    // Smallest buffer the audio graph accepts: one quantum of frames
    size_t min_buffer_size(uint32_t quantum) const {
        return size_t{quantum} * bytes_per_frame();
    }
};

} // namespace l2stream
