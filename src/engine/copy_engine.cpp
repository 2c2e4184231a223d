/**
 * @file copy_engine.cpp
 * @brief Bulk copy orchestrator implementation
 */

#include "kcenon/bulk_copy/engine/copy_engine.h"

#include <kcenon/bulk_copy/adapters/thread_pool_adapter.h>
#include <kcenon/bulk_copy/core/checksum.h>
#include <kcenon/bulk_copy/core/data_path.h>
#include <kcenon/bulk_copy/core/logging.h>
#include <kcenon/bulk_copy/engine/completion_tracker.h>
#include <kcenon/bulk_copy/engine/destination_resolver.h>
#include <kcenon/bulk_copy/engine/work_queue.h>
#include <kcenon/bulk_copy/store/remote_store.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <optional>
#include <span>
#include <system_error>
#include <thread>
#include <vector>

namespace kcenon::bulk_copy {

namespace {

constexpr std::size_t download_buffer_size = 64 * 1024;

/**
 * @brief Shared state of one running batch
 */
struct batch_state {
    batch_state(copy_direction dir, std::string dest, std::size_t queue_capacity)
        : direction(dir), destination(std::move(dest)), queue(queue_capacity) {}

    const copy_direction direction;
    const std::string destination;

    work_queue<std::string> queue;
    completion_tracker tracker;
    std::atomic<uint64_t> bytes{0};
    std::atomic<bool> aborted{false};

    std::mutex failure_mutex;
    std::optional<failed_item> failure;

    std::shared_ptr<adapters::copy_thread_pool_interface> pool;
};

auto elapsed_since(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

}  // namespace

// ============================================================================
// copy_engine::impl
// ============================================================================

struct copy_engine::impl {
    copy_config config;
    destination_resolver resolver;

    std::mutex output_mutex;
    std::mutex callback_mutex;
    item_callback item_observer;

    std::atomic<uint64_t> next_temp_id{0};

    explicit impl(copy_config cfg) : config(std::move(cfg)), resolver(config.store) {}

    void write_line(std::ostream& stream, const std::string& line) {
        std::lock_guard<std::mutex> lock(output_mutex);
        stream << line << '\n';
    }

    void notify(const std::string& item, const transfer_outcome& outcome) {
        std::lock_guard<std::mutex> lock(callback_mutex);
        if (item_observer) {
            item_observer(item, outcome);
        }
    }

    auto upload(const std::string& local_item, const std::string& destination)
        -> transfer_outcome {
        auto local = strip_file_scheme(local_item);

        std::error_code ec;
        auto status = std::filesystem::status(local, ec);
        if (status.type() == std::filesystem::file_type::not_found) {
            return unexpected{error{error_code::local_file_not_found,
                                    "no such file: " + local}};
        }
        if (ec) {
            return unexpected{error{error_code::local_open_failed,
                                    "cannot access " + local + ": " + ec.message()}};
        }
        if (!std::filesystem::is_regular_file(status)) {
            return unexpected{error{error_code::local_not_regular_file,
                                    local + " is not a regular file"}};
        }

        std::ifstream input(local, std::ios::binary);
        if (!input) {
            return unexpected{error{error_code::local_open_failed,
                                    "cannot open " + local}};
        }

        auto target = resolver.resolve_upload(destination, local);

        copy_log_context ctx;
        ctx.item = local;
        ctx.target = target.uri;
        BC_LOG_DEBUG_CTX(log_category::resolver, to_string(target.mode), ctx);

        auto local_digest = checksum::sha256_file(local);
        if (!local_digest.has_value()) {
            return unexpected{local_digest.error()};
        }

        auto stored = config.store->put(target.uri, input);
        if (!stored.has_value()) {
            return unexpected{stored.error()};
        }

        // Stores that do not hash their content report an empty etag
        const auto& etag = stored.value().etag;
        if (!etag.empty() && etag != local_digest.value()) {
            return unexpected{error{error_code::remote_transfer_failed,
                "checksum mismatch for " + target.uri + ": sent " + local_digest.value() +
                    ", stored " + etag}};
        }

        transfer_success success;
        success.location = target.uri;
        success.bytes = stored.value().bytes_written;
        success.checksum = local_digest.value();
        success.mode = target.mode;
        return success;
    }

    auto download(const std::string& remote_item, const std::string& destination)
        -> transfer_outcome {
        if (classify_path(remote_item) != path_kind::remote) {
            return unexpected{error{error_code::invalid_remote_path,
                                    "not a remote path: " + remote_item}};
        }

        auto reader = config.store->get(remote_item);
        if (!reader.has_value()) {
            return unexpected{reader.error()};
        }

        auto target = destination_resolver::resolve_download(strip_file_scheme(destination),
                                                            remote_item);
        if (!target.has_value()) {
            return unexpected{target.error()};
        }
        const auto& path = target.value();

        auto temp = path.parent_path() /
                    ("." + path.filename().string() + ".part-" +
                     std::to_string(next_temp_id.fetch_add(1)));
        auto discard = [&temp]() {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
        };

        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return unexpected{error{error_code::local_open_failed,
                                    "cannot create file " + path.string()}};
        }

        std::vector<std::byte> buffer(download_buffer_size);
        sha256_hasher hasher;
        uint64_t total = 0;
        auto& source = *reader.value();
        while (source.has_more()) {
            auto count = source.read(buffer);
            if (!count.has_value()) {
                output.close();
                discard();
                return unexpected{count.error()};
            }
            if (count.value() == 0) {
                break;
            }

            output.write(reinterpret_cast<const char*>(buffer.data()),
                         static_cast<std::streamsize>(count.value()));
            if (!output) {
                output.close();
                discard();
                return unexpected{error{error_code::local_write_error,
                                        "failed to write " + path.string()}};
            }
            hasher.update(std::span<const std::byte>(buffer.data(), count.value()));
            total += count.value();
        }

        output.close();
        if (!output) {
            discard();
            return unexpected{error{error_code::local_write_error,
                                    "failed to finish " + path.string()}};
        }

        std::error_code ec;
        std::filesystem::rename(temp, path, ec);
        if (ec) {
            discard();
            return unexpected{error{error_code::local_rename_failed,
                "cannot move download into " + path.string() + ": " + ec.message()}};
        }

        transfer_success success;
        success.location = path.string();
        success.bytes = total;
        success.checksum = hasher.finalize();
        return success;
    }

    void report_progress(copy_direction direction, const std::string& item,
                         const transfer_success& success) {
        if (direction == copy_direction::upload) {
            write_line(*config.out, "Uploaded " + success.location);
        } else {
            write_line(*config.out,
                       "Downloaded " + item + " (" + format_size(success.bytes) + "B)");
        }
    }

    void handle_failure(batch_state& state, const std::string& item, const error& err) {
        auto line = state.direction == copy_direction::upload
                        ? "Error uploading " + item + ": " + err.message
                        : "Failed to download " + item + ": " + err.message;

        copy_log_context ctx;
        ctx.item = item;
        ctx.error_message = err.message;
        BC_LOG_ERROR_CTX(log_category::worker, to_string(classify(err.code)), ctx);

        if (config.on_failure == fatal_policy::exit_process) {
            {
                std::lock_guard<std::mutex> lock(output_mutex);
                *config.err << line << std::endl;
                config.out->flush();
            }
            get_logger().flush();
            std::quick_exit(EXIT_FAILURE);
        }

        write_line(*config.err, line);
        {
            std::lock_guard<std::mutex> lock(state.failure_mutex);
            if (!state.failure) {
                state.failure = failed_item{item, err};
            }
        }
        state.aborted.store(true);
        state.queue.close();
        auto dropped = state.queue.discard_pending();
        if (dropped > 0) {
            BC_LOG_DEBUG(log_category::engine,
                         "dropped " + std::to_string(dropped) + " queued item(s) after failure");
        }
        if (state.pool) {
            auto running = state.pool->active_workers(to_string(state.direction));
            BC_LOG_DEBUG(log_category::engine,
                         std::to_string(running) + " worker(s) still running after failure");
        }
    }

    auto process_item(batch_state& state, const std::string& item, std::size_t worker_id)
        -> std::optional<error> {
        auto start = std::chrono::steady_clock::now();
        auto outcome = state.direction == copy_direction::upload
                           ? upload(item, state.destination)
                           : download(item, state.destination);
        notify(item, outcome);

        if (!outcome.has_value()) {
            return outcome.error();
        }

        const auto& success = outcome.value();
        state.tracker.record_success();
        state.bytes.fetch_add(success.bytes);
        report_progress(state.direction, item, success);

        copy_log_context ctx;
        ctx.item = item;
        ctx.target = success.location;
        ctx.bytes = success.bytes;
        ctx.worker = worker_id;
        ctx.duration_ms = static_cast<uint64_t>(elapsed_since(start).count());
        BC_LOG_DEBUG_CTX(log_category::worker, "item copied", ctx);
        return std::nullopt;
    }

    void worker_loop(batch_state& state, std::size_t worker_id) {
        while (!state.aborted.load()) {
            auto item = state.queue.pop();
            if (!item) {
                break;
            }
            if (state.aborted.load()) {
                break;
            }

            std::optional<error> failure;
            try {
                failure = process_item(state, *item, worker_id);
            } catch (const std::exception& e) {
                // Store backends and item observers may throw
                failure = error{error_code::internal_error,
                                std::string("unexpected exception: ") + e.what()};
            }

            if (failure) {
                handle_failure(state, *item, *failure);
            }
        }
    }

    void record_internal_failure(batch_state& state, const std::string& message) {
        error err{error_code::internal_error, message};
        BC_LOG_ERROR(log_category::engine, message);
        {
            std::lock_guard<std::mutex> lock(state.failure_mutex);
            if (!state.failure) {
                state.failure = failed_item{"", err};
            }
        }
        state.aborted.store(true);
        state.queue.close();
        state.queue.discard_pending();
    }

    auto run(const std::vector<std::string>& sources, const std::string& destination,
             std::size_t concurrency) -> batch_report {
        auto start = std::chrono::steady_clock::now();

        batch_report report;
        report.direction = classify_direction(destination);
        report.total_items = sources.size();

        if (concurrency == 0) {
            BC_LOG_WARN(log_category::engine, "concurrency 0 requested, using 1");
            concurrency = 1;
        }

        if (sources.empty()) {
            write_line(*config.out, std::string("Finished ") +
                                        progressive_verb(report.direction) + " 0 file(s)");
            report.elapsed = elapsed_since(start);
            return report;
        }

        auto workers = std::min(concurrency, sources.size());
        auto capacity = config.work_queue_capacity > 0 ? config.work_queue_capacity
                                                       : workers;
        report.workers_spawned = workers;

        batch_state state(report.direction, destination, capacity);
        const std::string stage = to_string(report.direction);
        auto pool = adapters::copy_pool_factory::create(workers, "bulk_copy_" + stage);
        state.pool = pool;

        BC_LOG_INFO(log_category::engine,
                    "Starting " + stage + " of " + std::to_string(sources.size()) +
                        " item(s) to " + destination + " with " +
                        std::to_string(pool->worker_count()) + " worker(s)");

        std::thread producer([&state, &sources]() {
            for (const auto& source : sources) {
                if (!state.queue.push(source)) {
                    break;
                }
            }
            state.queue.close();
        });

        std::vector<std::future<void>> futures;
        futures.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            state.tracker.add();
            try {
                futures.push_back(pool->submit_to_stage(
                    [this, &state, i]() {
                        completion_tracker::worker_guard guard(state.tracker);
                        try {
                            worker_loop(state, i);
                        } catch (const std::exception& e) {
                            record_internal_failure(
                                state, std::string("worker failed: ") + e.what());
                        }
                    },
                    stage));
            } catch (const std::system_error& e) {
                state.tracker.done();
                record_internal_failure(state,
                                        std::string("cannot start worker: ") + e.what());
                break;
            }
        }

        state.tracker.wait_all();
        // Every worker has exited; release a producer still blocked on a full queue
        state.queue.close();
        producer.join();

        for (auto& future : futures) {
            try {
                future.get();
            } catch (const std::exception& e) {
                record_internal_failure(state, std::string("worker failed: ") + e.what());
            }
        }

        report.succeeded = state.tracker.value();
        report.bytes_transferred = state.bytes.load();
        {
            std::lock_guard<std::mutex> lock(state.failure_mutex);
            report.failure = state.failure;
        }
        report.elapsed = elapsed_since(start);

        if (report.ok()) {
            write_line(*config.out, std::string("Finished ") +
                                        progressive_verb(report.direction) + " " +
                                        std::to_string(report.succeeded) + " file(s)");
            BC_LOG_INFO(log_category::engine,
                        "Batch complete: " + std::to_string(report.succeeded) + " item(s) in " +
                            std::to_string(report.elapsed.count()) + "ms");
        } else {
            BC_LOG_ERROR(log_category::engine,
                         "Batch stopped after " + std::to_string(report.succeeded) +
                             " item(s): " + report.failure->err.message);
        }

        return report;
    }
};

// ============================================================================
// copy_engine::builder
// ============================================================================

copy_engine::builder::builder() = default;

auto copy_engine::builder::with_store(std::shared_ptr<remote_store> store) -> builder& {
    config_.store = std::move(store);
    return *this;
}

auto copy_engine::builder::with_concurrency(std::size_t concurrency) -> builder& {
    config_.concurrency = concurrency;
    return *this;
}

auto copy_engine::builder::with_queue_capacity(std::size_t capacity) -> builder& {
    config_.work_queue_capacity = capacity;
    return *this;
}

auto copy_engine::builder::with_fatal_policy(fatal_policy policy) -> builder& {
    config_.on_failure = policy;
    return *this;
}

auto copy_engine::builder::with_output(std::ostream& out) -> builder& {
    config_.out = &out;
    return *this;
}

auto copy_engine::builder::with_error_output(std::ostream& err) -> builder& {
    config_.err = &err;
    return *this;
}

auto copy_engine::builder::build() -> result<copy_engine> {
    if (!config_.store) {
        return unexpected{error{error_code::missing_store,
                                "A remote store is required"}};
    }
    if (config_.concurrency == 0) {
        return unexpected{error{error_code::invalid_concurrency,
                                "Concurrency must be at least 1"}};
    }

    return copy_engine{std::move(config_)};
}

// ============================================================================
// copy_engine
// ============================================================================

copy_engine::copy_engine(copy_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    get_logger().initialize();
}

copy_engine::copy_engine(copy_engine&&) noexcept = default;
auto copy_engine::operator=(copy_engine&&) noexcept -> copy_engine& = default;
copy_engine::~copy_engine() = default;

auto copy_engine::run(const std::vector<std::string>& sources,
                      const std::string& destination,
                      std::size_t concurrency) -> batch_report {
    return impl_->run(sources, destination, concurrency);
}

auto copy_engine::run(const std::vector<std::string>& sources,
                      const std::string& destination) -> batch_report {
    return impl_->run(sources, destination, impl_->config.concurrency);
}

auto copy_engine::upload_one(const std::string& local_item,
                             const std::string& destination) -> transfer_outcome {
    return impl_->upload(local_item, destination);
}

auto copy_engine::download_one(const std::string& remote_item,
                               const std::string& destination) -> transfer_outcome {
    return impl_->download(remote_item, destination);
}

void copy_engine::on_item_complete(item_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->item_observer = std::move(callback);
}

auto copy_engine::config() const -> const copy_config& {
    return impl_->config;
}

}  // namespace kcenon::bulk_copy
