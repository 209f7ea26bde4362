#include "chunking.hpp"
#include <algorithm>

namespace l2stream::stream {

size_t select_chunk_size(const Config& config, const transport::Socket& socket,
                         Direction direction) {
    if (config.chunk_size > 0) return config.chunk_size;

    bool audio = false;
    size_t mtu = 0;
    if (direction == Direction::Send) {
        audio = config.source == SourceKind::Capture || config.pace_file;
        mtu = socket.max_transmit_size();
    } else {
        audio = config.playback;
        mtu = socket.max_receive_size();
    }

    size_t size = audio ? config.audio.min_buffer_size(config.quantum) : mtu;
    return std::max<size_t>(1, size);
}

} // namespace l2stream::stream
