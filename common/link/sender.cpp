#include "sender.hpp"
#include <iostream>

namespace l2stream::link {

SenderPump::SenderPump(std::shared_ptr<transport::Socket> socket,
                       std::unique_ptr<stream::Source> source, PumpOptions options,
                       LostCallback on_lost)
    : Worker(WorkerRole::Sender),
      socket_(std::move(socket)),
      source_(std::move(source)),
      options_(options),
      on_lost_(std::move(on_lost)),
      chunk_(options.chunk_size) {}

void SenderPump::run() {
    std::cout << "sender: begin, chunk " << chunk_.size() << " bytes" << std::endl;

    bool lost = false;
    while (!cancelled()) {
        auto n = source_->read(chunk_);
        if (!n) {
            if (!cancelled()) {
                std::cerr << "sender: source read failed" << std::endl;
            }
            break;
        }

        if (*n == 0) {
            if (source_->live()) continue;
            std::cout << "sender: source exhausted after " << bytes_sent() << " bytes" << std::endl;
            break;
        }

        if (!socket_->write({chunk_.data(), *n})) {
            lost = !cancelled();
            if (lost) {
                std::cerr << "sender: write failed, peer disconnected" << std::endl;
            }
            break;
        }
        bytes_sent_.fetch_add(*n, std::memory_order_relaxed);

        if (options_.verbose) {
            std::cout << "sender: wrote " << *n << " bytes" << std::endl;
        }

        // Do not overrun the transport when replaying recorded audio
        if (source_->paced() && !sleep_for(options_.audio.duration_of(*n))) {
            break;
        }
    }

    source_->close();
    std::cout << "sender: end" << std::endl;

    if (lost && on_lost_) {
        on_lost_(*this);
    }
}

void SenderPump::on_cancel() {
    socket_->close();
    source_->interrupt();
}

} // namespace l2stream::link
