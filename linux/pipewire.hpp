#pragma once

#include <stream/endpoints.hpp>
#include <types/audio_format.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace pipewire {

class Stream;

// Microphone capture from the default PipeWire source
class Capture : public l2stream::stream::Source {
public:
    Capture(const l2stream::AudioFormat& format, uint32_t quantum);
    ~Capture() override;

    bool open();

    // Blocks until data is full or the stream is interrupted
    std::optional<size_t> read(std::span<uint8_t> data) override;
    bool live() const override { return true; }
    void interrupt() override;
    void close() override;

private:
    std::unique_ptr<Stream> stream_;
};

// Playback to the default PipeWire sink
class Playback : public l2stream::stream::Sink {
public:
    Playback(const l2stream::AudioFormat& format, uint32_t quantum);
    ~Playback() override;

    bool open();

    l2stream::SinkKind kind() const override { return l2stream::SinkKind::Playback; }

    // Blocks until the ring buffer has room for all of data
    bool write(std::span<const uint8_t> data) override;
    void interrupt() override;
    void close() override;

private:
    std::unique_ptr<Stream> stream_;
};

} // namespace pipewire
