// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for bulk_copy batches
 *
 * Runs the long-lived copy workers of a batch. Each worker loops over the
 * shared work queue until it is drained, so a pool must be able to run all
 * submitted workers at the same time.
 *
 * Workers are grouped by stage ("upload" / "download"). The engine asks how
 * many workers of a stage are still alive, e.g. to report how many are
 * draining in-flight items after a failure.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::bulk_copy::adapters {

/**
 * @brief Live worker counts keyed by stage name
 *
 * @note Thread-safe.
 */
class stage_counter {
public:
    void enter(const std::string& stage);
    void leave(const std::string& stage);
    [[nodiscard]] auto count(const std::string& stage) const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::size_t> counts_;
};

/**
 * @brief Interface of the pool that runs a batch's workers
 */
class copy_thread_pool_interface {
public:
    virtual ~copy_thread_pool_interface() = default;

    /**
     * @brief Start a worker in a stage
     * @param worker Worker loop
     * @param stage Stage the worker belongs to
     * @return Future that becomes ready once the worker has left its stage;
     *         rethrows what the worker threw
     */
    virtual auto submit_to_stage(std::function<void()> worker, const std::string& stage)
        -> std::future<void> = 0;

    /**
     * @brief Number of workers the pool was sized for
     */
    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;

    /**
     * @brief Workers of a stage that have not finished yet
     */
    [[nodiscard]] virtual auto active_workers(const std::string& stage) const
        -> std::size_t = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Runs copy workers as thread_system jobs
 *
 * The pool gets exactly one thread per worker so that every blocking worker
 * loop runs at once.
 */
class thread_system_copy_adapter : public copy_thread_pool_interface {
public:
    /**
     * @brief Create a started pool
     * @param worker_count Threads to start (0 = hardware concurrency)
     * @param pool_name Name given to the thread_system pool
     */
    [[nodiscard]] static auto create(std::size_t worker_count, const std::string& pool_name)
        -> std::shared_ptr<thread_system_copy_adapter>;

    thread_system_copy_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool,
                               std::size_t worker_count);
    ~thread_system_copy_adapter() override;

    thread_system_copy_adapter(const thread_system_copy_adapter&) = delete;
    thread_system_copy_adapter& operator=(const thread_system_copy_adapter&) = delete;

    auto submit_to_stage(std::function<void()> worker, const std::string& stage)
        -> std::future<void> override;
    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto active_workers(const std::string& stage) const -> std::size_t override;

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    std::size_t worker_count_;
    std::shared_ptr<stage_counter> stages_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Pool that gives every worker its own std::async thread
 */
class async_copy_pool : public copy_thread_pool_interface {
public:
    /**
     * @param worker_count Reported worker count (0 = hardware concurrency)
     */
    explicit async_copy_pool(std::size_t worker_count = 0);

    auto submit_to_stage(std::function<void()> worker, const std::string& stage)
        -> std::future<void> override;
    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto active_workers(const std::string& stage) const -> std::size_t override;

private:
    std::size_t worker_count_;
    std::shared_ptr<stage_counter> stages_;
};

/**
 * @brief Factory for the pool that runs a batch's workers
 *
 * Selects thread_system_copy_adapter when KCENON_WITH_THREAD_SYSTEM is set,
 * async_copy_pool otherwise.
 */
class copy_pool_factory {
public:
    [[nodiscard]] static auto create(std::size_t worker_count, const std::string& pool_name)
        -> std::shared_ptr<copy_thread_pool_interface>;

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::bulk_copy::adapters
