#pragma once

#include "../transport/socket.hpp"
#include "../types/enums.hpp"
#include "worker.hpp"
#include <functional>
#include <memory>

namespace l2stream::link {

// Server role: accepts inbound connections until the link is connected
class Listener : public Worker {
public:
    struct Callbacks {
        std::function<ConnectionState()> get_state;
        std::function<void(Listener&, std::unique_ptr<transport::Socket>)> on_accepted;
    };

    Listener(std::unique_ptr<transport::ServerSocket> server, Callbacks callbacks);

protected:
    void run() override;
    void on_cancel() override;

private:
    std::unique_ptr<transport::ServerSocket> server_;
    Callbacks callbacks_;
};

} // namespace l2stream::link
