/**
 * @file copy_types.h
 * @brief Types shared by the copy engine, its resolver and its callers
 */

#ifndef KCENON_BULK_COPY_ENGINE_COPY_TYPES_H
#define KCENON_BULK_COPY_ENGINE_COPY_TYPES_H

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "kcenon/bulk_copy/core/data_path.h"
#include "kcenon/bulk_copy/core/types.h"

namespace kcenon::bulk_copy {

class remote_store;

/**
 * @brief Direction of a batch, fixed before any worker starts
 */
enum class copy_direction {
    upload,    ///< Local files to the remote store
    download   ///< Remote objects to the local filesystem
};

[[nodiscard]] constexpr auto to_string(copy_direction direction) -> const char* {
    switch (direction) {
        case copy_direction::upload: return "upload";
        case copy_direction::download: return "download";
        default: return "unknown";
    }
}

/**
 * @brief Verb used in the summary line ("uploading" / "downloading")
 */
[[nodiscard]] constexpr auto progressive_verb(copy_direction direction) -> const char* {
    return direction == copy_direction::upload ? "uploading" : "downloading";
}

/**
 * @brief Decide the direction from the destination's shape
 *
 * A local destination means download, a remote one means upload.
 */
[[nodiscard]] inline auto classify_direction(std::string_view destination) -> copy_direction {
    return classify_path(destination) == path_kind::local ? copy_direction::download
                                                          : copy_direction::upload;
}

/**
 * @brief How an upload lands on its remote target
 */
enum class write_mode {
    overwrite,     ///< Destination is an existing file; it is replaced
    insert_child,  ///< Destination is a directory; item goes in by basename
    create_new     ///< Destination does not exist; created at the literal path
};

[[nodiscard]] constexpr auto to_string(write_mode mode) -> const char* {
    switch (mode) {
        case write_mode::overwrite: return "overwrite";
        case write_mode::insert_child: return "insert_child";
        case write_mode::create_new: return "create_new";
        default: return "unknown";
    }
}

/**
 * @brief Resolved remote target for one uploaded item
 */
struct write_target {
    std::string uri;
    write_mode mode = write_mode::create_new;
};

/**
 * @brief Successful transfer of one item
 */
struct transfer_success {
    std::string location;              ///< Remote URI or local path written
    uint64_t bytes = 0;                ///< Bytes transferred
    std::string checksum;              ///< SHA-256 of the copied content
    std::optional<write_mode> mode;    ///< Set for uploads only
};

/**
 * @brief Outcome of one item: success or the error that stopped it
 */
using transfer_outcome = result<transfer_success>;

/**
 * @brief The first item that failed in a batch
 */
struct failed_item {
    std::string item;
    error err;
};

/**
 * @brief Aggregate result of one run
 */
struct batch_report {
    copy_direction direction = copy_direction::download;
    std::size_t total_items = 0;        ///< Sources handed to run()
    std::size_t succeeded = 0;          ///< Items that completed successfully
    std::size_t workers_spawned = 0;    ///< min(concurrency, total_items)
    uint64_t bytes_transferred = 0;     ///< Sum over successful items
    std::optional<failed_item> failure; ///< First failure, if any
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto ok() const noexcept -> bool { return !failure.has_value(); }
};

/**
 * @brief What happens when an item fails
 */
enum class fatal_policy {
    exit_process,     ///< Print the error, flush and terminate with status 1
    stop_and_report   ///< Stop handing out work and return the failure in the report
};

[[nodiscard]] constexpr auto to_string(fatal_policy policy) -> const char* {
    switch (policy) {
        case fatal_policy::exit_process: return "exit_process";
        case fatal_policy::stop_and_report: return "stop_and_report";
        default: return "unknown";
    }
}

/**
 * @brief Copy engine configuration
 */
struct copy_config {
    /// Remote store shared by all workers
    std::shared_ptr<remote_store> store;

    /// Default worker count for run(sources, destination)
    std::size_t concurrency = 8;

    /// Work queue capacity (0 = same as the effective worker count)
    std::size_t work_queue_capacity = 0;

    /// Failure handling
    fatal_policy on_failure = fatal_policy::exit_process;

    /// Progress and summary lines
    std::ostream* out = &std::cout;

    /// Fatal error lines
    std::ostream* err = &std::cerr;
};

/**
 * @brief Parse a worker count given as text (e.g. a command-line value)
 * @return Positive count, or invalid_concurrency unless the whole text is a
 *         decimal number greater than zero
 */
[[nodiscard]] inline auto parse_concurrency(std::string_view text) -> result<std::size_t> {
    std::size_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size() || value == 0) {
        return unexpected{error{error_code::invalid_concurrency,
            "concurrency must be a positive integer: '" + std::string(text) + "'"}};
    }
    return value;
}

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_ENGINE_COPY_TYPES_H
