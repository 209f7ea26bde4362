#include "listener.hpp"
#include <iostream>

namespace l2stream::link {

Listener::Listener(std::unique_ptr<transport::ServerSocket> server, Callbacks callbacks)
    : Worker(WorkerRole::Listener), server_(std::move(server)), callbacks_(std::move(callbacks)) {}

void Listener::run() {
    std::cout << "listener: begin" << std::endl;

    while (!cancelled() && callbacks_.get_state() != ConnectionState::Connected) {
        // Returns on a new connection, or with nullptr once closed
        auto socket = server_->accept();
        if (!socket) {
            if (!cancelled()) {
                std::cerr << "listener: accept() failed" << std::endl;
            }
            break;
        }

        std::cout << "listener: accepted " << socket->address() << std::endl;
        callbacks_.on_accepted(*this, std::move(socket));
    }

    // Release the PSM so a replacement listener can bind it
    server_->close();
    std::cout << "listener: end" << std::endl;
}

void Listener::on_cancel() {
    server_->close();
}

} // namespace l2stream::link
