#include "service.hpp"
#include "connector.hpp"
#include "listener.hpp"
#include "receiver.hpp"
#include "sender.hpp"
#include <algorithm>
#include <iostream>

namespace l2stream::link {

using transport::Socket;
using transport::TransportError;

LinkService::LinkService(transport::Transport& transport, stream::EndpointFactory& endpoints,
                         const Config& config)
    : transport_(transport), endpoints_(endpoints), config_(config) {}

LinkService::~LinkService() {
    close();
}

bool LinkService::initialize() {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    if (initialized_) return true;

    if (!transport_.adapter_available()) {
        std::cerr << "link: unable to obtain a Bluetooth adapter" << std::endl;
        return false;
    }

    initialized_ = true;
    state_ = ConnectionState::None;
    return true;
}

void LinkService::start() {
    std::lock_guard lock(mutex_);
    reap_locked();
    if (!usable_locked("start")) return;
    start_locked();
}

void LinkService::connect(const std::string& address, bool sending) {
    std::lock_guard lock(mutex_);
    reap_locked();
    if (!usable_locked("connect")) return;
    connect_locked(address, sending);
}

void LinkService::connected(std::shared_ptr<Socket> socket, bool sending) {
    std::lock_guard lock(mutex_);
    reap_locked();
    if (!socket) return;
    if (!usable_locked("connected")) {
        socket->close();
        return;
    }
    connected_locked(std::move(socket), sending);
}

void LinkService::stop() {
    std::lock_guard lock(mutex_);
    reap_locked();
    if (closed_) return;
    stop_locked();
}

void LinkService::disconnect() {
    std::lock_guard lock(mutex_);
    reap_locked();
    if (!usable_locked("disconnect")) return;

    if (state_ != ConnectionState::Connected && state_ != ConnectionState::Connecting) {
        std::cout << "link: nothing to disconnect" << std::endl;
        return;
    }
    std::cout << "link: disconnect " << peer_address_ << std::endl;
    start_locked();
}

void LinkService::close() {
    std::vector<std::shared_ptr<Worker>> workers;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        std::cout << "link: close" << std::endl;
        stop_locked();
        closed_ = true;
        workers.swap(retired_);
    }

    // Workers blocked on the lock see themselves cancelled and return
    for (auto& worker : workers) {
        worker->join();
    }
}

ConnectionState LinkService::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

LinkStatus LinkService::status() const {
    std::lock_guard lock(mutex_);
    return {state_, peer_address_, sending_};
}

bool LinkService::is_active(WorkerRole role) const {
    std::lock_guard lock(mutex_);
    const auto& worker = slot(role);
    return worker && !worker->finished();
}

void LinkService::start_locked() {
    std::cout << "link: start" << std::endl;

    cancel_locked(WorkerRole::Connector);
    cancel_locked(WorkerRole::Sender);
    cancel_locked(WorkerRole::Receiver);

    peer_address_.clear();
    sending_ = false;
    set_state_locked(ConnectionState::Listening);

    // A listener whose accept() failed has ended its loop; replace it
    if (slot(WorkerRole::Listener) && slot(WorkerRole::Listener)->finished()) {
        cancel_locked(WorkerRole::Listener);
    }
    if (slot(WorkerRole::Listener)) return;

    auto server = transport_.listen();
    if (!server) {
        std::cerr << "link: cannot listen on PSM 0x" << std::hex << config_.psm << std::dec
                  << std::endl;
        return;
    }

    Listener::Callbacks callbacks;
    callbacks.get_state = [this]() { return state(); };
    callbacks.on_accepted = [this](Listener& listener, std::unique_ptr<Socket> socket) {
        on_accepted(listener, std::move(socket));
    };
    launch_locked(std::make_shared<Listener>(std::move(server), std::move(callbacks)));
}

void LinkService::connect_locked(const std::string& address, bool sending) {
    std::cout << "link: connect to " << address << std::endl;

    // Cancel any attempt in progress
    if (state_ == ConnectionState::Connecting) {
        cancel_locked(WorkerRole::Connector);
    }
    cancel_locked(WorkerRole::Sender);
    cancel_locked(WorkerRole::Receiver);

    std::shared_ptr<Socket> socket = transport_.create_socket(address);

    Connector::Callbacks callbacks;
    callbacks.describe_peer = [this](const std::string& peer) { transport_.describe_peer(peer); };
    callbacks.cancel_discovery = [this]() { transport_.cancel_discovery(); };
    callbacks.on_connected = [this](Connector& connector, std::shared_ptr<Socket> s, bool snd) {
        on_connector_connected(connector, std::move(s), snd);
    };
    callbacks.on_failed = [this](Connector& connector, TransportError error) {
        on_connect_failed(connector, error);
    };
    launch_locked(std::make_shared<Connector>(address, std::move(socket), sending,
                                              std::move(callbacks)));

    peer_address_ = address;
    sending_ = sending;
    set_state_locked(ConnectionState::Connecting);
}

void LinkService::connected_locked(std::shared_ptr<Socket> socket, bool sending) {
    std::cout << "link: connected to " << socket->address() << std::endl;

    cancel_locked(WorkerRole::Connector);
    cancel_locked(WorkerRole::Sender);
    cancel_locked(WorkerRole::Receiver);

    // Only one peer at a time
    cancel_locked(WorkerRole::Listener);

    peer_address_ = socket->address();
    sending_ = sending;

    auto on_lost = [this](Worker& pump) { on_stream_lost(pump); };

    PumpOptions options;
    options.audio = config_.audio;
    options.verbose = config_.verbose;

    if (sending) {
        auto source = endpoints_.open_source();
        if (source) {
            options.chunk_size =
                std::max<size_t>(1, endpoints_.chunk_size(*socket, stream::Direction::Send));
            launch_locked(std::make_shared<SenderPump>(socket, std::move(source), options, on_lost));
        } else {
            std::cerr << "link: no source available, receiving only" << std::endl;
        }
    }

    auto sinks = endpoints_.open_sinks(socket, sending);
    options.chunk_size =
        std::max<size_t>(1, endpoints_.chunk_size(*socket, stream::Direction::Receive));
    launch_locked(std::make_shared<ReceiverPump>(socket, std::move(sinks), options, on_lost));

    set_state_locked(ConnectionState::Connected);
}

void LinkService::stop_locked() {
    std::cout << "link: stop" << std::endl;

    cancel_locked(WorkerRole::Connector);
    cancel_locked(WorkerRole::Sender);
    cancel_locked(WorkerRole::Receiver);
    cancel_locked(WorkerRole::Listener);

    peer_address_.clear();
    sending_ = false;
    set_state_locked(ConnectionState::None);
}

void LinkService::connection_failed_or_lost_locked() {
    std::cout << "link: connection failed or lost, listening again" << std::endl;
    start_locked();
}

void LinkService::launch_locked(std::shared_ptr<Worker> worker) {
    auto role = worker->role();
    if (slot(role)) {
        std::cerr << "link: replacing live " << to_string(role) << std::endl;
        cancel_locked(role);
    }
    slot(role) = std::move(worker);
    slot(role)->start();
}

void LinkService::cancel_locked(WorkerRole role) {
    auto& worker = slot(role);
    if (!worker) return;

    worker->cancel();
    retired_.push_back(std::move(worker));
    worker.reset();
}

void LinkService::retire_locked(WorkerRole role) {
    auto& worker = slot(role);
    if (!worker) return;

    retired_.push_back(std::move(worker));
    worker.reset();
}

void LinkService::reap_locked() {
    for (auto it = retired_.begin(); it != retired_.end();) {
        auto& worker = *it;
        if (worker->finished() && !worker->is_current_thread()) {
            worker->join();
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }
}

void LinkService::set_state_locked(ConnectionState state) {
    if (state_ == state) return;
    std::cout << "link: state " << to_string(state_) << " -> " << to_string(state) << std::endl;
    state_ = state;
}

bool LinkService::usable_locked(const char* operation) const {
    if (closed_) {
        std::cerr << "link: " << operation << "() after close" << std::endl;
        return false;
    }
    if (!initialized_) {
        std::cerr << "link: " << operation << "() before initialize" << std::endl;
        return false;
    }
    return true;
}

void LinkService::on_accepted(Listener& listener, std::unique_ptr<Socket> socket) {
    std::lock_guard lock(mutex_);
    reap_locked();

    if (listener.cancelled() || closed_) {
        socket->close();
        return;
    }

    switch (state_) {
        case ConnectionState::Listening:
        case ConnectionState::Connecting:
            // Server role: the peer decides whether it sends
            connected_locked(std::shared_ptr<Socket>(std::move(socket)), false);
            break;
        case ConnectionState::None:
        case ConnectionState::Connected:
            std::cout << "link: closing unwanted connection from " << socket->address()
                      << std::endl;
            socket->close();
            break;
    }
}

void LinkService::on_connector_connected(Connector& connector, std::shared_ptr<Socket> socket,
                                         bool sending) {
    std::lock_guard lock(mutex_);
    reap_locked();

    if (connector.cancelled() || closed_) {
        socket->close();
        return;
    }

    // The connector is done; retiring (not cancelling) keeps its socket open
    if (slot(WorkerRole::Connector).get() == &connector) {
        retire_locked(WorkerRole::Connector);
    }
    connected_locked(std::move(socket), sending);
}

void LinkService::on_connect_failed(Connector& connector, TransportError error) {
    std::lock_guard lock(mutex_);
    reap_locked();

    if (connector.cancelled() || closed_) return;

    std::cerr << "link: connection to " << connector.address() << " failed ("
              << transport::to_string(error) << ")" << std::endl;
    connection_failed_or_lost_locked();
}

void LinkService::on_stream_lost(Worker& pump) {
    std::lock_guard lock(mutex_);
    reap_locked();

    if (pump.cancelled() || closed_) return;

    std::cerr << "link: " << to_string(pump.role()) << " lost the connection" << std::endl;
    connection_failed_or_lost_locked();
}

} // namespace l2stream::link
