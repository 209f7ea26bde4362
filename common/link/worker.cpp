#include "worker.hpp"

namespace l2stream::link {

Worker::~Worker() {
    if (thread_.joinable()) {
        if (is_current_thread()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void Worker::start() {
    thread_ = std::thread([this]() {
        run();
        finished_.store(true, std::memory_order_release);
    });
}

void Worker::cancel() {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    on_cancel();

    {
        std::lock_guard lock(sleep_mutex_);
    }
    sleep_cv_.notify_all();
}

void Worker::join() {
    if (thread_.joinable() && !is_current_thread()) {
        thread_.join();
    }
}

bool Worker::sleep_for(std::chrono::microseconds duration) {
    std::unique_lock lock(sleep_mutex_);
    return !sleep_cv_.wait_for(lock, duration, [this]() { return cancelled(); });
}

} // namespace l2stream::link
