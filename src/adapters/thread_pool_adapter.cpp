// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation for bulk_copy
 */

#include "kcenon/bulk_copy/adapters/thread_pool_adapter.h"

#include <exception>
#include <system_error>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::bulk_copy::adapters {

namespace {

auto default_worker_count() -> std::size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

/**
 * @brief Keeps a worker counted in its stage for the guard's lifetime
 */
class stage_guard {
public:
    stage_guard(stage_counter& stages, const std::string& stage)
        : stages_(stages), stage_(stage) {}
    ~stage_guard() { stages_.leave(stage_); }

    stage_guard(const stage_guard&) = delete;
    stage_guard& operator=(const stage_guard&) = delete;

private:
    stage_counter& stages_;
    const std::string& stage_;
};

}  // namespace

// ============================================================================
// stage_counter
// ============================================================================

void stage_counter::enter(const std::string& stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[stage];
}

void stage_counter::leave(const std::string& stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage);
    if (it != counts_.end() && it->second > 0) {
        --it->second;
    }
}

auto stage_counter::count(const std::string& stage) const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage);
    return it != counts_.end() ? it->second : 0;
}

// ============================================================================
// thread_system_copy_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/**
 * @brief thread_system job running one copy worker loop
 */
class worker_job : public kcenon::thread::job {
public:
    explicit worker_job(std::function<void()> body, const std::string& name)
        : job(name), body_(std::move(body)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        body_();
        return common::ok();
    }

private:
    std::function<void()> body_;
};

}  // namespace

auto thread_system_copy_adapter::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<thread_system_copy_adapter> {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_copy_adapter>(std::move(pool), worker_count);
}

thread_system_copy_adapter::thread_system_copy_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool, std::size_t worker_count)
    : pool_(std::move(pool)),
      worker_count_(worker_count),
      stages_(std::make_shared<stage_counter>()) {}

thread_system_copy_adapter::~thread_system_copy_adapter() = default;

auto thread_system_copy_adapter::submit_to_stage(std::function<void()> worker,
                                                 const std::string& stage)
    -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    stages_->enter(stage);
    auto body = [worker = std::move(worker), promise, stages = stages_, stage]() {
        std::exception_ptr failure;
        {
            // Leave the stage before the future is released: the waiter
            // may destroy this adapter as soon as get() returns.
            stage_guard guard(*stages, stage);
            try {
                worker();
            } catch (...) {
                failure = std::current_exception();
            }
        }
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    };

    pool_->enqueue(std::make_unique<worker_job>(std::move(body), "copy_worker_" + stage));
    return future;
}

auto thread_system_copy_adapter::worker_count() const -> std::size_t {
    return worker_count_;
}

auto thread_system_copy_adapter::active_workers(const std::string& stage) const
    -> std::size_t {
    return stages_->count(stage);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_copy_pool
// ============================================================================

async_copy_pool::async_copy_pool(std::size_t worker_count)
    : worker_count_(worker_count > 0 ? worker_count : default_worker_count()),
      stages_(std::make_shared<stage_counter>()) {}

auto async_copy_pool::submit_to_stage(std::function<void()> worker, const std::string& stage)
    -> std::future<void> {
    stages_->enter(stage);
    try {
        return std::async(std::launch::async,
                          [worker = std::move(worker), stages = stages_, stage]() {
                              stage_guard guard(*stages, stage);
                              worker();
                          });
    } catch (const std::system_error&) {
        stages_->leave(stage);
        throw;
    }
}

auto async_copy_pool::worker_count() const -> std::size_t {
    return worker_count_;
}

auto async_copy_pool::active_workers(const std::string& stage) const -> std::size_t {
    return stages_->count(stage);
}

// ============================================================================
// copy_pool_factory
// ============================================================================

auto copy_pool_factory::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<copy_thread_pool_interface> {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_copy_adapter::create(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_copy_pool>(worker_count);
#endif
}

}  // namespace kcenon::bulk_copy::adapters
