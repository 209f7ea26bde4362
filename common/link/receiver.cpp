#include "receiver.hpp"
#include <iostream>

namespace l2stream::link {

ReceiverPump::ReceiverPump(std::shared_ptr<transport::Socket> socket,
                           std::vector<std::unique_ptr<stream::Sink>> sinks,
                           PumpOptions options, LostCallback on_lost)
    : Worker(WorkerRole::Receiver),
      socket_(std::move(socket)),
      sinks_(std::move(sinks)),
      options_(options),
      on_lost_(std::move(on_lost)),
      chunk_(options.chunk_size) {}

void ReceiverPump::run() {
    std::cout << "receiver: begin, chunk " << chunk_.size() << " bytes, "
              << sinks_.size() << " sink(s)" << std::endl;

    bool lost = false;
    while (!cancelled()) {
        auto n = socket_->read(chunk_);
        if (!n || *n == 0) {
            lost = !cancelled();
            if (lost) {
                std::cerr << "receiver: " << (n ? "peer closed the connection" : "read failed")
                          << std::endl;
            }
            break;
        }
        bytes_received_.fetch_add(*n, std::memory_order_relaxed);

        if (options_.verbose) {
            std::cout << "receiver: read " << *n << " bytes" << std::endl;
        }

        if (!forward(*n)) {
            lost = !cancelled();
            break;
        }
    }

    for (auto& sink : sinks_) {
        sink->close();
    }
    std::cout << "receiver: end after " << bytes_received() << " bytes" << std::endl;

    if (lost && on_lost_) {
        on_lost_(*this);
    }
}

bool ReceiverPump::forward(size_t length) {
    std::span<const uint8_t> data{chunk_.data(), length};

    for (auto& sink : sinks_) {
        if (sink->write(data)) continue;

        // Losing the recording ends the session; playback glitches do not
        if (sink->kind() == SinkKind::File) {
            std::cerr << "receiver: file write failed, disconnecting" << std::endl;
            return false;
        }
        std::cerr << "receiver: " << to_string(sink->kind()) << " write of "
                  << length << " bytes failed" << std::endl;
    }
    return true;
}

void ReceiverPump::on_cancel() {
    socket_->close();
    for (auto& sink : sinks_) {
        sink->interrupt();
    }
}

} // namespace l2stream::link
