#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace l2stream::transport {

enum class TransportError {
    None,
    Unreachable,
    Timeout,
    PermissionDenied,
    AdapterUnavailable,
    Closed,
    Disconnected,
};

inline std::string_view to_string(TransportError error) {
    switch (error) {
        case TransportError::None: return "none";
        case TransportError::Unreachable: return "unreachable";
        case TransportError::Timeout: return "timeout";
        case TransportError::PermissionDenied: return "permission denied";
        case TransportError::AdapterUnavailable: return "adapter unavailable";
        case TransportError::Closed: return "closed";
        case TransportError::Disconnected: return "disconnected";
    }
    return "unknown";
}

// Bidirectional byte stream bound to a remote device.
// close() may be called from any thread, any number of times, and
// unblocks connect/read/write in progress on other threads.
class Socket {
public:
    virtual ~Socket() = default;

    // Blocking outbound connect
    virtual TransportError connect() = 0;

    // Blocking read of up to buffer.size() bytes.
    // Returns 0 when the peer closed, nullopt on error or local close.
    virtual std::optional<size_t> read(std::span<uint8_t> buffer) = 0;

    // Blocking write of the whole buffer; false once disconnected
    virtual bool write(std::span<const uint8_t> data) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual const std::string& address() const = 0;

    // Negotiated frame sizes, used to size data-mode chunks
    virtual size_t max_transmit_size() const = 0;
    virtual size_t max_receive_size() const = 0;
};

// Listening endpoint. close() unblocks a pending accept().
class ServerSocket {
public:
    virtual ~ServerSocket() = default;

    // Blocks until a peer connects; nullptr once closed or on error
    virtual std::unique_ptr<Socket> accept() = 0;

    virtual void close() = 0;
};

// Adapter-level factory for sockets
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool adapter_available() = 0;

    // Unconnected socket for `address`; connect() performs the attempt.
    // Construction only, called with the link state locked.
    virtual std::unique_ptr<Socket> create_socket(const std::string& address) = 0;

    // nullptr when the adapter cannot listen
    virtual std::unique_ptr<ServerSocket> listen() = 0;

    // Inquiry slows down connection setup
    virtual void cancel_discovery() {}

    // Logs what the adapter knows about `address`; may block
    virtual void describe_peer(const std::string&) {}
};

} // namespace l2stream::transport
