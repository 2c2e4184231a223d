/**
 * @file copy_engine.h
 * @brief Bulk copy orchestrator: direction dispatch, work queue and workers
 */

#ifndef KCENON_BULK_COPY_ENGINE_COPY_ENGINE_H
#define KCENON_BULK_COPY_ENGINE_COPY_ENGINE_H

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/bulk_copy/core/types.h"
#include "kcenon/bulk_copy/engine/copy_types.h"

namespace kcenon::bulk_copy {

class remote_store;

/**
 * @brief Copies a batch of items between the local filesystem and a store
 *
 * The destination decides the direction once per batch: a remote URI means
 * every source is a local file to upload, a local path means every source
 * is a remote object to download. One producer feeds a bounded queue and
 * min(concurrency, sources) workers drain it.
 *
 * @code
 * auto store = directory_store::create("/srv/objects");
 * auto engine = copy_engine::builder()
 *     .with_store(std::move(store.value()))
 *     .with_concurrency(4)
 *     .build();
 *
 * if (engine.has_value()) {
 *     auto report = engine.value().run({"a.txt", "b.txt"}, "data://x");
 *     // Uploaded data://x/a.txt
 *     // Uploaded data://x/b.txt
 *     // Finished uploading 2 file(s)
 * }
 * @endcode
 */
class copy_engine {
public:
    /**
     * @brief Per-item observer, called from worker threads
     */
    using item_callback =
        std::function<void(const std::string& item, const transfer_outcome& outcome)>;

    /**
     * @brief Builder for copy_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the remote store (required)
         * @param store Store shared by every worker
         * @return Reference to builder for chaining
         */
        auto with_store(std::shared_ptr<remote_store> store) -> builder&;

        /**
         * @brief Set the default worker count
         * @param concurrency Maximum concurrent transfers (default: 8)
         * @return Reference to builder for chaining
         */
        auto with_concurrency(std::size_t concurrency) -> builder&;

        /**
         * @brief Set work queue capacity
         * @param capacity Buffered items (default: 0, same as worker count)
         * @return Reference to builder for chaining
         */
        auto with_queue_capacity(std::size_t capacity) -> builder&;

        /**
         * @brief Set failure handling
         * @param policy What to do on the first failed item
         * @return Reference to builder for chaining
         */
        auto with_fatal_policy(fatal_policy policy) -> builder&;

        /**
         * @brief Set the stream for progress and summary lines
         */
        auto with_output(std::ostream& out) -> builder&;

        /**
         * @brief Set the stream for fatal error lines
         */
        auto with_error_output(std::ostream& err) -> builder&;

        /**
         * @brief Build the engine
         * @return Engine, or missing_store / invalid_concurrency
         */
        [[nodiscard]] auto build() -> result<copy_engine>;

    private:
        copy_config config_;
    };

    // Non-copyable, movable
    copy_engine(const copy_engine&) = delete;
    auto operator=(const copy_engine&) -> copy_engine& = delete;
    copy_engine(copy_engine&&) noexcept;
    auto operator=(copy_engine&&) noexcept -> copy_engine&;
    ~copy_engine();

    /**
     * @brief Copy every source to the destination
     *
     * Blocks until every worker has exited. Prints one progress line per
     * successful item and, if the batch did not fail, one summary line.
     * A concurrency of 0 is treated as 1.
     *
     * With fatal_policy::exit_process the first failure terminates the
     * process and this call does not return.
     */
    auto run(const std::vector<std::string>& sources,
             const std::string& destination,
             std::size_t concurrency) -> batch_report;

    /**
     * @brief Copy with the configured concurrency
     */
    auto run(const std::vector<std::string>& sources,
             const std::string& destination) -> batch_report;

    /**
     * @brief Upload one local file, resolving its target against destination
     */
    [[nodiscard]] auto upload_one(const std::string& local_item,
                                  const std::string& destination) -> transfer_outcome;

    /**
     * @brief Download one remote object to or into destination
     */
    [[nodiscard]] auto download_one(const std::string& remote_item,
                                    const std::string& destination) -> transfer_outcome;

    /**
     * @brief Register an observer for every per-item outcome
     */
    void on_item_complete(item_callback callback);

    /**
     * @brief Get current configuration
     */
    [[nodiscard]] auto config() const -> const copy_config&;

private:
    explicit copy_engine(copy_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_ENGINE_COPY_ENGINE_H
