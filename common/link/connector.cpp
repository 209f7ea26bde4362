#include "connector.hpp"
#include <iostream>

namespace l2stream::link {

using transport::TransportError;

Connector::Connector(std::string address, std::shared_ptr<transport::Socket> socket,
                     bool sending, Callbacks callbacks)
    : Worker(WorkerRole::Connector),
      address_(std::move(address)),
      socket_(std::move(socket)),
      sending_(sending),
      callbacks_(std::move(callbacks)) {}

void Connector::run() {
    std::cout << "connector: begin " << address_ << (sending_ ? " (sender)" : "") << std::endl;

    if (!socket_) {
        std::cerr << "connector: no socket for " << address_ << std::endl;
        callbacks_.on_failed(*this, TransportError::Unreachable);
        return;
    }

    if (callbacks_.describe_peer && !cancelled()) {
        callbacks_.describe_peer(address_);
    }
    if (callbacks_.cancel_discovery) {
        callbacks_.cancel_discovery();
    }

    // Blocks until connected, refused, or the socket is closed by cancel()
    TransportError err = socket_->connect();
    if (err != TransportError::None) {
        socket_->close();
        if (!cancelled()) {
            std::cerr << "connector: connect to " << address_ << " failed: "
                      << transport::to_string(err) << std::endl;
        }
        callbacks_.on_failed(*this, err);
        return;
    }

    std::cout << "connector: connected to " << address_ << std::endl;
    callbacks_.on_connected(*this, socket_, sending_);
}

void Connector::on_cancel() {
    if (socket_) {
        socket_->close();
    }
}

} // namespace l2stream::link
