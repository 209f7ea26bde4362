#pragma once

#include "../transport/socket.hpp"
#include "worker.hpp"
#include <functional>
#include <memory>
#include <string>

namespace l2stream::link {

// Client role: one outbound connect attempt, reported exactly once
class Connector : public Worker {
public:
    struct Callbacks {
        std::function<void(const std::string&)> describe_peer;
        std::function<void()> cancel_discovery;
        std::function<void(Connector&, std::shared_ptr<transport::Socket>, bool sending)> on_connected;
        std::function<void(Connector&, transport::TransportError)> on_failed;
    };

    // `socket` may be null when the address could not be resolved
    Connector(std::string address, std::shared_ptr<transport::Socket> socket, bool sending,
              Callbacks callbacks);

    const std::string& address() const { return address_; }
    bool sending() const { return sending_; }

protected:
    void run() override;
    void on_cancel() override;

private:
    std::string address_;
    std::shared_ptr<transport::Socket> socket_;
    bool sending_;
    Callbacks callbacks_;
};

} // namespace l2stream::link
