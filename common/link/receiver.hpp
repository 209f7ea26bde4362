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

// Reads chunks from the socket and forwards each one to every sink
class ReceiverPump : public Worker {
public:
    using LostCallback = std::function<void(Worker&)>;

    ReceiverPump(std::shared_ptr<transport::Socket> socket,
                 std::vector<std::unique_ptr<stream::Sink>> sinks, PumpOptions options,
                 LostCallback on_lost);

    uint64_t bytes_received() const { return bytes_received_.load(std::memory_order_relaxed); }

protected:
    void run() override;
    void on_cancel() override;

private:
    // false when the failure ends the connection
    bool forward(size_t length);

    std::shared_ptr<transport::Socket> socket_;
    std::vector<std::unique_ptr<stream::Sink>> sinks_;
    PumpOptions options_;
    LostCallback on_lost_;

    std::vector<uint8_t> chunk_;
    std::atomic<uint64_t> bytes_received_{0};
};

} // namespace l2stream::link
