#pragma once

#include "../types/audio_format.hpp"
#include "../types/enums.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace l2stream::link {

// Background task owned by the link service.
//
// A worker runs a blocking loop on its own thread. Cancellation is
// cooperative: cancel() closes whatever the loop is blocked on (see
// on_cancel()) and the loop exits on its next check. cancel() is
// idempotent and safe after the loop already ended on its own.
// Owners cancel and join a worker before dropping the last reference.
class Worker {
public:
    explicit Worker(WorkerRole role) : role_(role) {}
    virtual ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void start();
    void cancel();

    // Must not be called from the worker's own thread
    void join();

    WorkerRole role() const { return role_; }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    bool finished() const { return finished_.load(std::memory_order_acquire); }
    bool is_current_thread() const { return thread_.get_id() == std::this_thread::get_id(); }

protected:
    virtual void run() = 0;

    // Unblocks run(); called at most once
    virtual void on_cancel() = 0;

    // Interruptible sleep; false if cancelled before it elapsed
    bool sleep_for(std::chrono::microseconds duration);

private:
    WorkerRole role_;
    std::thread thread_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};

    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

// Settings shared by the sender and receiver pumps
struct PumpOptions {
    size_t chunk_size = 0;
    AudioFormat audio{};
    bool verbose = false;
};

} // namespace l2stream::link
