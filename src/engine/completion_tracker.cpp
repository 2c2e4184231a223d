/**
 * @file completion_tracker.cpp
 * @brief Implementation of completion_tracker
 */

#include "kcenon/bulk_copy/engine/completion_tracker.h"

namespace kcenon::bulk_copy {

auto completion_tracker::record_success() -> std::size_t {
    return succeeded_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

auto completion_tracker::value() const -> std::size_t {
    return succeeded_.load(std::memory_order_acquire);
}

void completion_tracker::add(std::size_t workers) {
    std::lock_guard<std::mutex> lock(mutex_);
    outstanding_ += workers;
}

void completion_tracker::done() {
    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outstanding_ > 0) {
            --outstanding_;
        }
        finished = outstanding_ == 0;
    }
    if (finished) {
        all_done_.notify_all();
    }
}

void completion_tracker::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    all_done_.wait(lock, [this] { return outstanding_ == 0; });
}

auto completion_tracker::wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return all_done_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
}

auto completion_tracker::outstanding() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

}  // namespace kcenon::bulk_copy
