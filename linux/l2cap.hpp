#pragma once

#include <transport/socket.hpp>

#include <dbus/dbus.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace l2cap {

using l2stream::transport::TransportError;

// Default MTU for basic mode L2CAP channels
constexpr size_t DEFAULT_MTU = 672;

// Map connect() errno to a transport error
TransportError error_from_errno(int err);

// Connection-oriented L2CAP channel (SOCK_SEQPACKET).
//
// The fd is non-blocking; blocking calls poll() on it together with an
// eventfd so that close() from another thread wakes them immediately.
class Socket : public l2stream::transport::Socket {
public:
    // Outbound channel, connect() performs the attempt
    Socket(std::string address, uint16_t psm);

    // Accepted channel
    Socket(int fd, std::string address);

    ~Socket() override;

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    TransportError connect() override;
    std::optional<size_t> read(std::span<uint8_t> buffer) override;
    bool write(std::span<const uint8_t> data) override;
    void close() override;
    bool is_open() const override;

    const std::string& address() const override { return address_; }
    size_t max_transmit_size() const override { return omtu_; }
    size_t max_receive_size() const override { return imtu_; }

private:
    // Waits for `events` on the channel; false once closed or on error
    bool wait(short events);
    void query_mtu();

    std::string address_;
    uint16_t psm_ = 0;

    mutable std::mutex mutex_;
    int fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> closed_{false};

    size_t imtu_ = DEFAULT_MTU;
    size_t omtu_ = DEFAULT_MTU;

    // Rest of a packet larger than the caller's buffer
    std::vector<uint8_t> pending_;
    size_t pending_offset_ = 0;
};

class ServerSocket : public l2stream::transport::ServerSocket {
public:
    ServerSocket(int fd, uint16_t psm);
    ~ServerSocket() override;

    ServerSocket(const ServerSocket&) = delete;
    ServerSocket& operator=(const ServerSocket&) = delete;

    std::unique_ptr<l2stream::transport::Socket> accept() override;
    void close() override;

private:
    std::mutex mutex_;
    int fd_ = -1;
    int wake_fd_ = -1;
    uint16_t psm_ = 0;
    std::atomic<bool> closed_{false};
};

// Local adapter, reached through BlueZ on the system bus
class Transport : public l2stream::transport::Transport {
public:
    Transport(DBusConnection* system_bus, uint16_t psm);

    bool adapter_available() override;
    std::unique_ptr<l2stream::transport::Socket> create_socket(const std::string& address) override;
    std::unique_ptr<l2stream::transport::ServerSocket> listen() override;
    void cancel_discovery() override;
    void describe_peer(const std::string& address) override;

private:
    DBusConnection* bus_;
    std::mutex bus_mutex_;
    uint16_t psm_;
};

} // namespace l2cap
