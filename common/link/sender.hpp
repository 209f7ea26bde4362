#pragma once

#include "../stream/endpoints.hpp"
#include "../transport/socket.hpp"
#include "worker.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace l2stream::link {

// Moves chunks from a source to the socket until the source is exhausted,
// the peer disconnects, or the pump is cancelled
class SenderPump : public Worker {
public:
    using LostCallback = std::function<void(Worker&)>;

    SenderPump(std::shared_ptr<transport::Socket> socket, std::unique_ptr<stream::Source> source,
               PumpOptions options, LostCallback on_lost);

    uint64_t bytes_sent() const { return bytes_sent_.load(std::memory_order_relaxed); }

protected:
    void run() override;
    void on_cancel() override;

private:
    std::shared_ptr<transport::Socket> socket_;
    std::unique_ptr<stream::Source> source_;
    PumpOptions options_;
    LostCallback on_lost_;

    std::vector<uint8_t> chunk_;
    std::atomic<uint64_t> bytes_sent_{0};
};

} // namespace l2stream::link
