#include "l2cap.hpp"
#include "bluez.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/l2cap.h>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace l2cap {

TransportError error_from_errno(int err) {
    switch (err) {
        case EHOSTDOWN:
        case EHOSTUNREACH:
        case ECONNREFUSED:
            return TransportError::Unreachable;
        case ETIMEDOUT:
            return TransportError::Timeout;
        case EACCES:
        case EPERM:
            return TransportError::PermissionDenied;
        case ENODEV:
        case ENETDOWN:
        case EADDRNOTAVAIL:
            return TransportError::AdapterUnavailable;
        case ECONNRESET:
        case ECONNABORTED:
            return TransportError::Disconnected;
        default:
            return TransportError::Unreachable;
    }
}

static int make_wake_fd() {
    int fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (fd < 0) {
        std::cerr << "l2cap: eventfd failed: " << strerror(errno) << std::endl;
    }
    return fd;
}

static void signal_wake_fd(int fd) {
    if (fd < 0) return;
    uint64_t one = 1;
    if (::write(fd, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        std::cerr << "l2cap: wakeup failed: " << strerror(errno) << std::endl;
    }
}

// Bind to the local adapter; psm 0 picks a dynamic one
static bool bind_local(int sock, uint16_t psm) {
    struct sockaddr_l2 local_addr = {};
    local_addr.l2_family = AF_BLUETOOTH;
    memset(&local_addr.l2_bdaddr, 0, sizeof(local_addr.l2_bdaddr));
    local_addr.l2_psm = htobs(psm);

    return bind(sock, reinterpret_cast<struct sockaddr*>(&local_addr), sizeof(local_addr)) == 0;
}

Socket::Socket(std::string address, uint16_t psm)
    : address_(std::move(address)), psm_(psm), wake_fd_(make_wake_fd()) {}

Socket::Socket(int fd, std::string address)
    : address_(std::move(address)), fd_(fd), wake_fd_(make_wake_fd()) {
    query_mtu();
}

Socket::~Socket() {
    close();
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
    }
}

TransportError Socket::connect() {
    bdaddr_t target;
    if (str2ba(address_.c_str(), &target) < 0) {
        std::cerr << "l2cap: invalid MAC address: " << address_ << std::endl;
        return TransportError::Unreachable;
    }

    {
        std::lock_guard lock(mutex_);
        if (closed_) return TransportError::Closed;

        int sock = socket(AF_BLUETOOTH, SOCK_SEQPACKET | SOCK_NONBLOCK | SOCK_CLOEXEC,
                          BTPROTO_L2CAP);
        if (sock < 0) {
            int err = errno;
            std::cerr << "l2cap: socket creation failed: " << strerror(err) << std::endl;
            return (err == EACCES || err == EPERM) ? TransportError::PermissionDenied
                                                   : TransportError::AdapterUnavailable;
        }

        if (!bind_local(sock, 0)) {
            std::cerr << "l2cap: bind failed: " << strerror(errno) << std::endl;
            ::close(sock);
            return TransportError::AdapterUnavailable;
        }

        struct sockaddr_l2 remote_addr = {};
        remote_addr.l2_family = AF_BLUETOOTH;
        remote_addr.l2_bdaddr = target;
        remote_addr.l2_psm = htobs(psm_);

        if (::connect(sock, reinterpret_cast<struct sockaddr*>(&remote_addr),
                      sizeof(remote_addr)) < 0 && errno != EINPROGRESS) {
            int err = errno;
            std::cerr << "l2cap: connect failed: " << strerror(err) << std::endl;
            ::close(sock);
            return error_from_errno(err);
        }
        fd_ = sock;
    }

    // Connection completes (or fails) when the channel becomes writable
    if (!wait(POLLOUT)) return TransportError::Closed;

    int err = 0;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return TransportError::Closed;

        socklen_t len = sizeof(err);
        if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
            err = errno;
        }
    }
    if (err != 0) {
        std::cerr << "l2cap: connect to " << address_ << " failed: " << strerror(err) << std::endl;
        return error_from_errno(err);
    }

    query_mtu();
    std::cout << "l2cap: connected to " << address_ << " (imtu " << imtu_
              << ", omtu " << omtu_ << ")" << std::endl;
    return TransportError::None;
}

std::optional<size_t> Socket::read(std::span<uint8_t> buffer) {
    {
        std::lock_guard lock(mutex_);
        if (pending_offset_ < pending_.size()) {
            size_t n = std::min(buffer.size(), pending_.size() - pending_offset_);
            memcpy(buffer.data(), pending_.data() + pending_offset_, n);
            pending_offset_ += n;
            return n;
        }
    }

    while (true) {
        if (!wait(POLLIN)) return std::nullopt;

        std::lock_guard lock(mutex_);
        if (closed_) return std::nullopt;

        // A packet longer than the buffer would be truncated; stage it
        bool direct = buffer.size() >= imtu_;
        if (!direct) pending_.resize(imtu_);

        ssize_t n = direct ? ::recv(fd_, buffer.data(), buffer.size(), MSG_DONTWAIT)
                           : ::recv(fd_, pending_.data(), pending_.size(), MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            std::cerr << "l2cap: recv failed: " << strerror(errno) << std::endl;
            pending_.clear();
            pending_offset_ = 0;
            return std::nullopt;
        }
        if (n == 0) {
            pending_.clear();
            pending_offset_ = 0;
            return size_t{0};
        }
        if (direct) return static_cast<size_t>(n);

        pending_.resize(static_cast<size_t>(n));
        size_t copied = std::min(buffer.size(), pending_.size());
        memcpy(buffer.data(), pending_.data(), copied);
        pending_offset_ = copied;
        return copied;
    }
}

bool Socket::write(std::span<const uint8_t> data) {
    size_t offset = 0;
    while (offset < data.size()) {
        size_t len = std::min(omtu_, data.size() - offset);

        if (!wait(POLLOUT)) return false;

        std::lock_guard lock(mutex_);
        if (closed_) return false;

        ssize_t written = ::send(fd_, data.data() + offset, len, MSG_DONTWAIT | MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            std::cerr << "l2cap: send failed: " << strerror(errno) << std::endl;
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

void Socket::close() {
    if (closed_.exchange(true)) return;

    signal_wake_fd(wake_fd_);

    std::lock_guard lock(mutex_);
    if (fd_ >= 0) {
        shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
}

bool Socket::is_open() const {
    std::lock_guard lock(mutex_);
    return !closed_ && fd_ >= 0;
}

bool Socket::wait(short events) {
    int fd;
    {
        std::lock_guard lock(mutex_);
        if (closed_ || fd_ < 0) return false;
        fd = fd_;
    }

    struct pollfd fds[2] = {};
    fds[0].fd = fd;
    fds[0].events = events;
    fds[1].fd = wake_fd_;
    fds[1].events = POLLIN;

    while (poll(fds, 2, -1) < 0) {
        if (errno != EINTR) {
            std::cerr << "l2cap: poll failed: " << strerror(errno) << std::endl;
            return false;
        }
    }

    // Errors and hangups on the channel are reported by the next recv/send
    return !(fds[1].revents & POLLIN) && !closed_;
}

void Socket::query_mtu() {
    std::lock_guard lock(mutex_);
    if (fd_ < 0) return;

    struct l2cap_options opts = {};
    socklen_t len = sizeof(opts);
    if (getsockopt(fd_, SOL_L2CAP, L2CAP_OPTIONS, &opts, &len) < 0) {
        std::cerr << "l2cap: cannot query MTU, using " << DEFAULT_MTU << std::endl;
        return;
    }
    if (opts.imtu > 0) imtu_ = opts.imtu;
    if (opts.omtu > 0) omtu_ = opts.omtu;
}

ServerSocket::ServerSocket(int fd, uint16_t psm)
    : fd_(fd), wake_fd_(make_wake_fd()), psm_(psm) {}

ServerSocket::~ServerSocket() {
    close();
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
    }
}

std::unique_ptr<l2stream::transport::Socket> ServerSocket::accept() {
    while (true) {
        int fd;
        {
            std::lock_guard lock(mutex_);
            if (closed_ || fd_ < 0) return nullptr;
            fd = fd_;
        }

        struct pollfd fds[2] = {};
        fds[0].fd = fd;
        fds[0].events = POLLIN;
        fds[1].fd = wake_fd_;
        fds[1].events = POLLIN;

        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            std::cerr << "l2cap: poll failed: " << strerror(errno) << std::endl;
            return nullptr;
        }
        if ((fds[1].revents & POLLIN) || closed_) return nullptr;

        struct sockaddr_l2 remote_addr = {};
        socklen_t len = sizeof(remote_addr);
        int client;
        {
            std::lock_guard lock(mutex_);
            if (closed_) return nullptr;
            client = accept4(fd_, reinterpret_cast<struct sockaddr*>(&remote_addr), &len,
                             SOCK_NONBLOCK | SOCK_CLOEXEC);
        }
        if (client < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
                errno == ECONNABORTED) {
                continue;
            }
            std::cerr << "l2cap: accept failed: " << strerror(errno) << std::endl;
            return nullptr;
        }

        char addr[18] = {};
        ba2str(&remote_addr.l2_bdaddr, addr);
        std::cout << "l2cap: accepted " << addr << " on PSM 0x" << std::hex << psm_ << std::dec
                  << std::endl;
        return std::make_unique<Socket>(client, addr);
    }
}

void ServerSocket::close() {
    if (closed_.exchange(true)) return;

    signal_wake_fd(wake_fd_);

    // Closing the fd releases the PSM for the next listener
    std::lock_guard lock(mutex_);
    if (fd_ >= 0) {
        shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
}

Transport::Transport(DBusConnection* system_bus, uint16_t psm)
    : bus_(system_bus), psm_(psm) {}

bool Transport::adapter_available() {
    if (!bus_) {
        std::cerr << "l2cap: no system bus connection" << std::endl;
        return false;
    }

    std::lock_guard lock(bus_mutex_);
    auto adapter = bluez::get_adapter_path(bus_);
    if (!adapter) {
        std::cerr << "l2cap: no Bluetooth adapter found" << std::endl;
        return false;
    }
    if (!bluez::is_adapter_powered(bus_, *adapter)) {
        std::cerr << "l2cap: adapter " << *adapter << " is powered off" << std::endl;
        return false;
    }

    std::cout << "l2cap: using adapter " << *adapter << std::endl;
    return true;
}

std::unique_ptr<l2stream::transport::Socket> Transport::create_socket(const std::string& address) {
    return std::make_unique<Socket>(address, psm_);
}

void Transport::describe_peer(const std::string& address) {
    if (!bus_) return;

    std::lock_guard lock(bus_mutex_);
    std::string name = bluez::get_device_name(bus_, address);
    if (!name.empty()) {
        std::cout << "l2cap: peer " << address << " is " << name << std::endl;
    }
}

std::unique_ptr<l2stream::transport::ServerSocket> Transport::listen() {
    int sock = socket(AF_BLUETOOTH, SOCK_SEQPACKET | SOCK_NONBLOCK | SOCK_CLOEXEC, BTPROTO_L2CAP);
    if (sock < 0) {
        std::cerr << "l2cap: socket creation failed: " << strerror(errno) << std::endl;
        return nullptr;
    }

    if (!bind_local(sock, psm_)) {
        std::cerr << "l2cap: bind to PSM 0x" << std::hex << psm_ << std::dec
                  << " failed: " << strerror(errno) << std::endl;
        ::close(sock);
        return nullptr;
    }

    if (::listen(sock, 1) < 0) {
        std::cerr << "l2cap: listen failed: " << strerror(errno) << std::endl;
        ::close(sock);
        return nullptr;
    }

    std::cout << "l2cap: listening on PSM 0x" << std::hex << psm_ << std::dec << std::endl;
    return std::make_unique<ServerSocket>(sock, psm_);
}

void Transport::cancel_discovery() {
    if (!bus_) return;
    std::lock_guard lock(bus_mutex_);
    bluez::stop_discovery(bus_);
}

} // namespace l2cap
