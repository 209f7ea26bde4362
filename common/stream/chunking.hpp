#pragma once

#include "../types/config.hpp"
#include "endpoints.hpp"
#include <cstddef>

namespace l2stream::stream {

// Pump chunk size for one direction of a connection.
//
//   --chunk given          that size
//   audio on that side     one quantum of audio (capture, paced file, playback)
//   otherwise              the negotiated L2CAP frame size
//
// Never returns 0.
size_t select_chunk_size(const Config& config, const transport::Socket& socket,
                         Direction direction);

} // namespace l2stream::stream
