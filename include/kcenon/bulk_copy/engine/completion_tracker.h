/**
 * @file completion_tracker.h
 * @brief Success counter and worker barrier for one batch
 */

#ifndef KCENON_BULK_COPY_ENGINE_COMPLETION_TRACKER_H
#define KCENON_BULK_COPY_ENGINE_COMPLETION_TRACKER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace kcenon::bulk_copy {

/**
 * @brief Counts successful items and lets the orchestrator wait for workers
 *
 * Workers register with add() before they start and call done() exactly
 * once on exit. wait_all() returns when every registered worker is done.
 */
class completion_tracker {
public:
    completion_tracker() = default;

    completion_tracker(const completion_tracker&) = delete;
    auto operator=(const completion_tracker&) -> completion_tracker& = delete;

    /**
     * @brief Record one successful item
     * @return Count after the increment
     */
    auto record_success() -> std::size_t;

    /**
     * @brief Number of successful items so far
     */
    [[nodiscard]] auto value() const -> std::size_t;

    /**
     * @brief Register workers that will later call done()
     */
    void add(std::size_t workers = 1);

    /**
     * @brief Mark one registered worker as finished
     */
    void done();

    /**
     * @brief Block until every registered worker called done()
     */
    void wait_all();

    /**
     * @brief Wait with a timeout
     * @return true if every worker finished in time
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Workers registered but not yet done
     */
    [[nodiscard]] auto outstanding() const -> std::size_t;

    /**
     * @brief Calls done() when it goes out of scope
     */
    class worker_guard {
    public:
        explicit worker_guard(completion_tracker& tracker) : tracker_(tracker) {}
        ~worker_guard() { tracker_.done(); }

        worker_guard(const worker_guard&) = delete;
        auto operator=(const worker_guard&) -> worker_guard& = delete;

    private:
        completion_tracker& tracker_;
    };

private:
    std::atomic<std::size_t> succeeded_{0};

    mutable std::mutex mutex_;
    std::condition_variable all_done_;
    std::size_t outstanding_ = 0;
};

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_ENGINE_COMPLETION_TRACKER_H
