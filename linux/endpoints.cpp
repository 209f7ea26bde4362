#include "endpoints.hpp"
#include "pipewire.hpp"

#include <stream/chunking.hpp>
#include <stream/file_io.hpp>

#include <iostream>

namespace endpoints {

using namespace l2stream;

std::unique_ptr<stream::Source> LinuxEndpoints::open_source() {
    if (config_.source == SourceKind::Capture) {
        auto capture = std::make_unique<pipewire::Capture>(config_.audio, config_.quantum);
        if (!capture->open()) {
            std::cerr << "endpoints: microphone capture unavailable" << std::endl;
            return nullptr;
        }
        return capture;
    }

    auto file = std::make_unique<stream::FileSource>(config_.pace_file);
    if (!file->open(config_.input_path)) return nullptr;
    return file;
}

std::vector<std::unique_ptr<stream::Sink>> LinuxEndpoints::open_sinks(
    const std::shared_ptr<transport::Socket>& socket, bool sending) {
    std::vector<std::unique_ptr<stream::Sink>> sinks;

    if (config_.playback) {
        auto playback = std::make_unique<pipewire::Playback>(config_.audio, config_.quantum);
        if (playback->open()) {
            sinks.push_back(std::move(playback));
        } else {
            std::cerr << "endpoints: playback unavailable" << std::endl;
        }
    }

    if (config_.to_file) {
        auto file = std::make_unique<stream::FileSink>();
        if (file->open(config_.output_path)) {
            sinks.push_back(std::move(file));
        }
    }

    // Echoing while our own sender is active would interleave two streams
    if (config_.loopback) {
        if (sending) {
            std::cout << "endpoints: loopback disabled while sending" << std::endl;
        } else {
            sinks.push_back(std::make_unique<stream::LoopbackSink>(socket));
        }
    }

    return sinks;
}

size_t LinuxEndpoints::chunk_size(const transport::Socket& socket,
                                  stream::Direction direction) const {
    return stream::select_chunk_size(config_, socket, direction);
}

} // namespace endpoints
