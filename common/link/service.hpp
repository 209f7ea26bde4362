#pragma once

#include "../stream/endpoints.hpp"
#include "../transport/socket.hpp"
#include "../types/config.hpp"
#include "../types/enums.hpp"
#include "worker.hpp"
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace l2stream::link {

class Connector;
class Listener;

struct LinkStatus {
    ConnectionState state = ConnectionState::None;
    std::string peer_address;
    bool sending = false;
};

// Connection state machine.
//
// Owns the connection state and one worker slot per role. Every operation,
// including the callbacks workers make from their own threads, runs under a
// single mutex; the blocking socket calls run inside the workers, outside it.
//
//   start()      cancel connector and pumps, Listening, ensure a listener
//   connect()    cancel previous connector and pumps, new connector, Connecting
//   connected()  cancel connector, pumps and listener, start pumps, Connected
//   stop()       cancel everything, None
//
// Any worker failure returns to listening through start(), without backoff.
// Reports from workers that were already cancelled are ignored.
class LinkService {
public:
    LinkService(transport::Transport& transport, stream::EndpointFactory& endpoints,
                const Config& config);
    ~LinkService();

    LinkService(const LinkService&) = delete;
    LinkService& operator=(const LinkService&) = delete;

    // false when no usable Bluetooth adapter is present.
    // Once initialized, further calls change nothing.
    bool initialize();

    void start();
    void connect(const std::string& address, bool sending);
    void connected(std::shared_ptr<transport::Socket> socket, bool sending);
    void stop();

    // Drops the current peer (or pending attempt) and listens again
    void disconnect();

    // Stops all workers and waits for their threads; final
    void close();

    ConnectionState state() const;
    LinkStatus status() const;

    // A worker of `role` is registered and its loop is still running
    bool is_active(WorkerRole role) const;

private:
    void start_locked();
    void connect_locked(const std::string& address, bool sending);
    void connected_locked(std::shared_ptr<transport::Socket> socket, bool sending);
    void stop_locked();
    void connection_failed_or_lost_locked();

    void launch_locked(std::shared_ptr<Worker> worker);
    void cancel_locked(WorkerRole role);
    void retire_locked(WorkerRole role);
    void reap_locked();
    void set_state_locked(ConnectionState state);
    bool usable_locked(const char* operation) const;

    std::shared_ptr<Worker>& slot(WorkerRole role) { return workers_[static_cast<size_t>(role)]; }
    const std::shared_ptr<Worker>& slot(WorkerRole role) const {
        return workers_[static_cast<size_t>(role)];
    }

    // Worker callbacks
    void on_accepted(Listener& listener, std::unique_ptr<transport::Socket> socket);
    void on_connector_connected(Connector& connector, std::shared_ptr<transport::Socket> socket,
                                bool sending);
    void on_connect_failed(Connector& connector, transport::TransportError error);
    void on_stream_lost(Worker& pump);

    transport::Transport& transport_;
    stream::EndpointFactory& endpoints_;
    Config config_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::None;
    std::array<std::shared_ptr<Worker>, worker_role_count> workers_;
    std::vector<std::shared_ptr<Worker>> retired_;
    std::string peer_address_;
    bool sending_ = false;
    bool initialized_ = false;
    bool closed_ = false;
};

} // namespace l2stream::link
