#include "pipewire.hpp"
#include <types/config.hpp>

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <spa/pod/builder.h>
#include <spa/utils/ringbuffer.h>

namespace pipewire {

namespace {

spa_audio_format to_spa_format(l2stream::SampleFormat format) {
    switch (format) {
        case l2stream::SampleFormat::U8: return SPA_AUDIO_FORMAT_U8;
        case l2stream::SampleFormat::S16LE: return SPA_AUDIO_FORMAT_S16_LE;
        case l2stream::SampleFormat::F32LE: return SPA_AUDIO_FORMAT_F32_LE;
    }
    return SPA_AUDIO_FORMAT_S16_LE;
}

uint32_t next_power_of_two(size_t n) {
    uint32_t size = 1;
    while (size < n) size <<= 1;
    return size;
}

} // anonymous namespace

// pw_stream on its own thread loop, exchanging audio with the caller through
// a ring buffer. Capture fills the ring from process(), playback drains it.
class Stream {
public:
    Stream(pw_direction direction, const l2stream::AudioFormat& format, uint32_t quantum)
        : direction_(direction), format_(format), quantum_(quantum) {
        size_t min_size = std::max<size_t>(1, format.min_buffer_size(quantum));
        ring_.resize(next_power_of_two(min_size * l2stream::DEVICE_BUFFER_FACTOR));
        spa_ringbuffer_init(&ring_index_);
    }

    ~Stream() { close(); }

    bool open();
    size_t read(std::span<uint8_t> data);
    bool write(std::span<const uint8_t> data);
    void interrupt();
    void close();

    bool usable() {
        std::lock_guard lock(mutex_);
        return !interrupted_ && !failed_;
    }

private:
    const char* name() const { return direction_ == PW_DIRECTION_INPUT ? "capture" : "playback"; }
    uint32_t ring_size() const { return static_cast<uint32_t>(ring_.size()); }

    static void on_state_changed(void* data, pw_stream_state old, pw_stream_state state,
                                 const char* error);
    static void on_process(void* data);

    void capture_process(spa_data& d);
    void playback_process(spa_data& d, uint32_t requested);

    static const pw_stream_events stream_events;

    pw_direction direction_;
    l2stream::AudioFormat format_;
    uint32_t quantum_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<uint8_t> ring_;
    spa_ringbuffer ring_index_{};
    bool interrupted_ = false;
    bool failed_ = false;
};

const pw_stream_events Stream::stream_events = {
    .version = PW_VERSION_STREAM_EVENTS,
    .state_changed = Stream::on_state_changed,
    .process = Stream::on_process,
};

bool Stream::open() {
    pw_init(nullptr, nullptr);

    loop_ = pw_thread_loop_new(name(), nullptr);
    if (!loop_) {
        std::cerr << "pipewire: failed to create " << name() << " loop" << std::endl;
        return false;
    }

    pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, direction_ == PW_DIRECTION_INPUT ? "Capture" : "Playback",
        PW_KEY_MEDIA_ROLE, "Communication",
        nullptr);
    pw_properties_setf(props, PW_KEY_NODE_LATENCY, "%u/%u", quantum_, format_.sample_rate);

    // Takes ownership of props
    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop_),
                                   direction_ == PW_DIRECTION_INPUT ? "l2stream-capture"
                                                                    : "l2stream-playback",
                                   props, &stream_events, this);
    if (!stream_) {
        std::cerr << "pipewire: failed to create " << name() << " stream" << std::endl;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    uint8_t buffer[1024];
    spa_pod_builder b;
    spa_pod_builder_init(&b, buffer, sizeof(buffer));

    spa_audio_info_raw info;
    memset(&info, 0, sizeof(info));
    info.format = to_spa_format(format_.format);
    info.rate = format_.sample_rate;
    info.channels = format_.channels;

    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    auto flags = static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT |
                                              PW_STREAM_FLAG_MAP_BUFFERS);
    if (pw_stream_connect(stream_, direction_, PW_ID_ANY, flags, params, 1) < 0) {
        std::cerr << "pipewire: failed to connect " << name() << " stream" << std::endl;
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        std::cerr << "pipewire: failed to start " << name() << " loop" << std::endl;
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    std::cout << "pipewire: " << name() << " " << format_.sample_rate << " Hz, "
              << format_.channels << " ch, " << to_string(format_.format)
              << ", ring " << ring_.size() << " bytes" << std::endl;
    return true;
}

size_t Stream::read(std::span<uint8_t> data) {
    std::unique_lock lock(mutex_);
    size_t got = 0;

    while (got < data.size()) {
        uint32_t index;
        int32_t filled = 0;
        cv_.wait(lock, [&] {
            filled = spa_ringbuffer_get_read_index(&ring_index_, &index);
            return interrupted_ || failed_ || filled > 0;
        });
        if (interrupted_ || failed_) break;

        auto n = static_cast<uint32_t>(std::min<size_t>(filled, data.size() - got));
        spa_ringbuffer_read_data(&ring_index_, ring_.data(), ring_size(),
                                 index & (ring_size() - 1), data.data() + got, n);
        spa_ringbuffer_read_update(&ring_index_, index + n);
        got += n;
    }
    return got;
}

bool Stream::write(std::span<const uint8_t> data) {
    std::unique_lock lock(mutex_);
    size_t done = 0;

    while (done < data.size()) {
        uint32_t index;
        int32_t filled = 0;
        cv_.wait(lock, [&] {
            filled = spa_ringbuffer_get_write_index(&ring_index_, &index);
            return interrupted_ || failed_ || static_cast<uint32_t>(filled) < ring_size();
        });
        if (interrupted_ || failed_) return false;

        uint32_t space = ring_size() - static_cast<uint32_t>(filled);
        auto n = static_cast<uint32_t>(std::min<size_t>(space, data.size() - done));
        spa_ringbuffer_write_data(&ring_index_, ring_.data(), ring_size(),
                                  index & (ring_size() - 1), data.data() + done, n);
        spa_ringbuffer_write_update(&ring_index_, index + n);
        done += n;
    }
    return true;
}

void Stream::interrupt() {
    {
        std::lock_guard lock(mutex_);
        interrupted_ = true;
    }
    cv_.notify_all();
}

void Stream::close() {
    interrupt();

    // Stopping the loop first guarantees no callback runs during teardown
    if (loop_) pw_thread_loop_stop(loop_);
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void Stream::on_state_changed(void* data, pw_stream_state, pw_stream_state state,
                              const char* error) {
    auto* self = static_cast<Stream*>(data);

    if (state == PW_STREAM_STATE_ERROR) {
        std::cerr << "pipewire: " << self->name() << " stream error: "
                  << (error ? error : "unknown") << std::endl;
        {
            std::lock_guard lock(self->mutex_);
            self->failed_ = true;
        }
        self->cv_.notify_all();
    } else if (state == PW_STREAM_STATE_STREAMING) {
        std::cout << "pipewire: " << self->name() << " streaming" << std::endl;
    }
}

void Stream::on_process(void* data) {
    auto* self = static_cast<Stream*>(data);

    pw_buffer* b = pw_stream_dequeue_buffer(self->stream_);
    if (!b) return;

    spa_buffer* buf = b->buffer;
    if (buf->datas[0].data) {
        if (self->direction_ == PW_DIRECTION_INPUT) {
            self->capture_process(buf->datas[0]);
        } else {
            self->playback_process(buf->datas[0], static_cast<uint32_t>(b->requested));
        }
    }

    pw_stream_queue_buffer(self->stream_, b);
    self->cv_.notify_all();
}

void Stream::capture_process(spa_data& d) {
    uint32_t offset = std::min(d.chunk->offset, d.maxsize);
    uint32_t size = std::min(d.chunk->size, d.maxsize - offset);
    auto* src = static_cast<uint8_t*>(d.data) + offset;

    std::lock_guard lock(mutex_);
    uint32_t index;
    int32_t filled = spa_ringbuffer_get_write_index(&ring_index_, &index);
    uint32_t space = ring_size() - static_cast<uint32_t>(std::max<int32_t>(filled, 0));

    // Reader is behind; drop what does not fit
    if (size > space) size = space;

    spa_ringbuffer_write_data(&ring_index_, ring_.data(), ring_size(),
                              index & (ring_size() - 1), src, size);
    spa_ringbuffer_write_update(&ring_index_, index + size);
}

void Stream::playback_process(spa_data& d, uint32_t requested) {
    uint32_t stride = std::max<uint32_t>(1, format_.bytes_per_frame());
    uint32_t size = d.maxsize - d.maxsize % stride;
    if (requested > 0) size = std::min(size, requested * stride);

    auto* dst = static_cast<uint8_t*>(d.data);
    uint32_t copied = 0;
    {
        std::lock_guard lock(mutex_);
        uint32_t index;
        int32_t filled = spa_ringbuffer_get_read_index(&ring_index_, &index);
        if (filled > 0) {
            copied = std::min(size, static_cast<uint32_t>(filled));
            copied -= copied % stride;
            spa_ringbuffer_read_data(&ring_index_, ring_.data(), ring_size(),
                                     index & (ring_size() - 1), dst, copied);
            spa_ringbuffer_read_update(&ring_index_, index + copied);
        }
    }

    // Underrun: pad with silence
    int silence = format_.format == l2stream::SampleFormat::U8 ? 0x80 : 0;
    memset(dst + copied, silence, size - copied);

    d.chunk->offset = 0;
    d.chunk->stride = static_cast<int32_t>(stride);
    d.chunk->size = size;
}

Capture::Capture(const l2stream::AudioFormat& format, uint32_t quantum)
    : stream_(std::make_unique<Stream>(PW_DIRECTION_INPUT, format, quantum)) {}

Capture::~Capture() = default;

bool Capture::open() {
    return stream_->open();
}

std::optional<size_t> Capture::read(std::span<uint8_t> data) {
    size_t n = stream_->read(data);
    if (n < data.size() && !stream_->usable()) return std::nullopt;
    return n;
}

void Capture::interrupt() {
    stream_->interrupt();
}

void Capture::close() {
    stream_->close();
}

Playback::Playback(const l2stream::AudioFormat& format, uint32_t quantum)
    : stream_(std::make_unique<Stream>(PW_DIRECTION_OUTPUT, format, quantum)) {}

Playback::~Playback() = default;

bool Playback::open() {
    return stream_->open();
}

bool Playback::write(std::span<const uint8_t> data) {
    return stream_->write(data);
}

void Playback::interrupt() {
    stream_->interrupt();
}

void Playback::close() {
    stream_->close();
}

} // namespace pipewire
