#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace l2stream {

enum class ConnectionState : uint8_t {
    None = 0,        // doing nothing
    Listening = 1,   // accepting incoming connections
    Connecting = 2,  // outgoing connection in progress
    Connected = 3,   // streaming with a remote device
};

inline std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::None: return "none";
        case ConnectionState::Listening: return "listening";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
    }
    return "unknown";
}

// Worker roles owned by the link service, one active instance each
enum class WorkerRole : uint8_t {
    Listener = 0,
    Connector = 1,
    Sender = 2,
    Receiver = 3,
};

constexpr size_t worker_role_count = 4;

inline std::string_view to_string(WorkerRole role) {
    switch (role) {
        case WorkerRole::Listener: return "listener";
        case WorkerRole::Connector: return "connector";
        case WorkerRole::Sender: return "sender";
        case WorkerRole::Receiver: return "receiver";
    }
    return "unknown";
}

enum class SourceKind : uint8_t {
    Capture,  // live audio capture
    File,
};

inline std::string_view to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::Capture: return "mic";
        case SourceKind::File: return "file";
    }
    return "unknown";
}

inline std::optional<SourceKind> source_kind_from_string(std::string_view s) {
    if (s == "mic" || s == "capture") return SourceKind::Capture;
    if (s == "file") return SourceKind::File;
    return std::nullopt;
}

enum class SinkKind : uint8_t {
    Playback,
    File,
    Loopback,  // echo back to the sending peer
};

inline std::string_view to_string(SinkKind kind) {
    switch (kind) {
        case SinkKind::Playback: return "playback";
        case SinkKind::File: return "file";
        case SinkKind::Loopback: return "loopback";
    }
    return "unknown";
}

enum class SampleFormat : uint8_t {
    U8,
    S16LE,
    F32LE,
};

inline std::string_view to_string(SampleFormat format) {
    switch (format) {
        case SampleFormat::U8: return "u8";
        case SampleFormat::S16LE: return "s16";
        case SampleFormat::F32LE: return "f32";
    }
    return "unknown";
}

inline std::optional<SampleFormat> sample_format_from_string(std::string_view s) {
    if (s == "u8") return SampleFormat::U8;
    if (s == "s16" || s == "s16le") return SampleFormat::S16LE;
    if (s == "f32" || s == "f32le") return SampleFormat::F32LE;
    return std::nullopt;
}

inline uint32_t bytes_per_sample(SampleFormat format) {
    switch (format) {
        case SampleFormat::U8: return 1;
        case SampleFormat::S16LE: return 2;
        case SampleFormat::F32LE: return 4;
    }
    return 2;
}

} // namespace l2stream
