#pragma once

#include "../transport/socket.hpp"
#include "../types/enums.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace l2stream::stream {

// Byte source feeding the sender pump.
// read() and close() are called from the pump thread only;
// interrupt() may be called from any thread.
class Source {
public:
    virtual ~Source() = default;

    // Fills up to data.size() bytes. 0 means nothing available (end of a
    // file, or no data yet on a live source), nullopt means the source failed
    // or was interrupted.
    virtual std::optional<size_t> read(std::span<uint8_t> data) = 0;

    // Live sources are polled again after returning 0
    virtual bool live() const = 0;

    // Real-time paced (one chunk per chunk duration)
    virtual bool paced() const { return false; }

    virtual void interrupt() {}
    virtual void close() {}
};

// Byte sink fed by the receiver pump, same threading rules as Source
class Sink {
public:
    virtual ~Sink() = default;

    virtual SinkKind kind() const = 0;
    virtual bool write(std::span<const uint8_t> data) = 0;

    virtual void interrupt() {}
    virtual void close() {}
};

enum class Direction {
    Send,
    Receive,
};

// Opens the configured sources and sinks for each new connection
class EndpointFactory {
public:
    virtual ~EndpointFactory() = default;

    // nullptr if the source cannot be opened
    virtual std::unique_ptr<Source> open_source() = 0;

    // Sinks that failed to open are left out
    virtual std::vector<std::unique_ptr<Sink>> open_sinks(
        const std::shared_ptr<transport::Socket>& socket, bool sending) = 0;

    virtual size_t chunk_size(const transport::Socket& socket, Direction direction) const = 0;
};

// Echoes received bytes back to the peer
class LoopbackSink : public Sink {
public:
    explicit LoopbackSink(std::shared_ptr<transport::Socket> socket)
        : socket_(std::move(socket)) {}

    SinkKind kind() const override { return SinkKind::Loopback; }
    bool write(std::span<const uint8_t> data) override {
        return socket_ && socket_->write(data);
    }

private:
    std::shared_ptr<transport::Socket> socket_;
};

} // namespace l2stream::stream
