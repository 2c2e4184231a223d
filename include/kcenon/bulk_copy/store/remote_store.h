/**
 * @file remote_store.h
 * @brief Remote object store abstraction used by the copy engine
 *
 * The engine only needs three operations from a remote store: stat, get and
 * put. Implementations must be safe to call concurrently from every worker
 * of a batch; the engine shares one instance through std::shared_ptr.
 */

#ifndef KCENON_BULK_COPY_STORE_REMOTE_STORE_H
#define KCENON_BULK_COPY_STORE_REMOTE_STORE_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "kcenon/bulk_copy/core/types.h"

namespace kcenon::bulk_copy {

/**
 * @brief Kind of object a remote URI resolves to
 */
enum class object_kind {
    file,
    directory,
    not_found
};

[[nodiscard]] constexpr auto to_string(object_kind kind) -> const char* {
    switch (kind) {
        case object_kind::file: return "file";
        case object_kind::directory: return "directory";
        case object_kind::not_found: return "not_found";
        default: return "unknown";
    }
}

/**
 * @brief Result of a stat query
 */
struct object_info {
    /// URI that was queried
    std::string uri;

    /// What the URI resolves to
    object_kind kind = object_kind::not_found;

    /// Object size in bytes (files only)
    uint64_t size = 0;
};

/**
 * @brief Result of a put operation
 */
struct put_result {
    /// URI of the written object
    std::string uri;

    /// Total bytes written
    uint64_t bytes_written = 0;

    /// Entity tag of the stored content (SHA-256 hex for stores that compute one)
    std::string etag;
};

/**
 * @brief Streaming reader over one remote object
 *
 * Allows downloading large objects in chunks without loading them into
 * memory. A reader is used by a single worker and need not be thread-safe.
 */
class object_reader {
public:
    virtual ~object_reader() = default;

    /**
     * @brief Read the next chunk
     * @param buffer Buffer to read into
     * @return Bytes read (0 at end of object) or error
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Check if the object has more data
     */
    [[nodiscard]] virtual auto has_more() const -> bool = 0;

    /**
     * @brief Get bytes read so far
     */
    [[nodiscard]] virtual auto bytes_read() const -> uint64_t = 0;

    /**
     * @brief Get total object size
     */
    [[nodiscard]] virtual auto total_size() const -> uint64_t = 0;
};

/**
 * @brief Remote object store interface
 *
 * @code
 * auto store = directory_store::create("/var/lib/bulk_copy");
 * if (store.has_value()) {
 *     auto info = store.value()->stat("data://photos");
 *     if (info.has_value() && info.value().kind == object_kind::directory) {
 *         // upload into the directory
 *     }
 * }
 * @endcode
 */
class remote_store {
public:
    virtual ~remote_store() = default;

    remote_store(const remote_store&) = delete;
    auto operator=(const remote_store&) -> remote_store& = delete;

    /**
     * @brief Store name for logs (e.g. "directory")
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Query what a URI resolves to
     *
     * A URI that names nothing is not an error: it yields
     * object_kind::not_found. Errors are reserved for failures to ask.
     */
    [[nodiscard]] virtual auto stat(const std::string& uri) -> result<object_info> = 0;

    /**
     * @brief Open a remote file for reading
     * @return Reader, or remote_not_found / remote_transfer_failed
     */
    [[nodiscard]] virtual auto get(const std::string& uri)
        -> result<std::unique_ptr<object_reader>> = 0;

    /**
     * @brief Create or replace a remote file with the stream's content
     * @param uri Target object
     * @param content Stream read until EOF
     */
    [[nodiscard]] virtual auto put(const std::string& uri, std::istream& content)
        -> result<put_result> = 0;

protected:
    remote_store() = default;
};

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_STORE_REMOTE_STORE_H
