/**
 * @file work_queue.h
 * @brief Bounded multi-producer multi-consumer queue feeding copy workers
 */

#ifndef KCENON_BULK_COPY_ENGINE_WORK_QUEUE_H
#define KCENON_BULK_COPY_ENGINE_WORK_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace kcenon::bulk_copy {

/**
 * @brief Bounded FIFO with blocking push/pop and close semantics
 *
 * push() blocks while the queue is full. pop() blocks while it is empty and
 * open. After close() pending items are still handed out; once they are
 * drained pop() returns std::nullopt and push() is refused.
 *
 * @tparam T Item type
 */
template <typename T>
class work_queue {
public:
    /**
     * @param capacity Maximum number of buffered items (0 is treated as 1)
     */
    explicit work_queue(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    work_queue(const work_queue&) = delete;
    auto operator=(const work_queue&) -> work_queue& = delete;

    /**
     * @brief Add an item, waiting for room
     * @return false if the queue was closed before the item could be added
     */
    auto push(T item) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Take the oldest item, waiting for one to arrive
     * @return Item, or std::nullopt once the queue is closed and drained
     */
    auto pop() -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Stop accepting items and wake every waiter
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /**
     * @brief Drop buffered items that no worker has taken yet
     * @return Number of items dropped
     */
    auto discard_pending() -> std::size_t {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped = items_.size();
            items_.clear();
        }
        not_full_.notify_all();
        return dropped;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_ENGINE_WORK_QUEUE_H
