/**
 * @file directory_store.h
 * @brief Remote store backed by a local directory tree
 */

#ifndef KCENON_BULK_COPY_STORE_DIRECTORY_STORE_H
#define KCENON_BULK_COPY_STORE_DIRECTORY_STORE_H

#include <filesystem>
#include <memory>

#include "remote_store.h"

namespace kcenon::bulk_copy {

/**
 * @brief Object store that keeps objects as files under a root directory
 *
 * A URI "scheme://a/b/c" maps to "<root>/scheme/a/b/c". Directories in the
 * tree are reported as remote directories. The top of every scheme
 * ("data://") always exists as a directory.
 *
 * Writes go to a temporary sibling first and are renamed into place, so
 * concurrent writers to one URI leave exactly one complete object behind.
 */
class directory_store : public remote_store {
public:
    /// Environment variable read by create_from_environment()
    static constexpr const char* root_env_var = "BULK_COPY_STORE_ROOT";

    /**
     * @brief Create a store rooted at a directory (created if missing)
     */
    [[nodiscard]] static auto create(const std::filesystem::path& root)
        -> result<std::unique_ptr<directory_store>>;

    /**
     * @brief Create a store rooted at $BULK_COPY_STORE_ROOT
     */
    [[nodiscard]] static auto create_from_environment()
        -> result<std::unique_ptr<directory_store>>;

    ~directory_store() override;

    [[nodiscard]] auto name() const -> std::string_view override;
    [[nodiscard]] auto stat(const std::string& uri) -> result<object_info> override;
    [[nodiscard]] auto get(const std::string& uri)
        -> result<std::unique_ptr<object_reader>> override;
    [[nodiscard]] auto put(const std::string& uri, std::istream& content)
        -> result<put_result> override;

    /**
     * @brief Get root directory
     */
    [[nodiscard]] auto root() const -> const std::filesystem::path&;

    /**
     * @brief Map a remote URI to its file under the root
     * @return Local path, or invalid_remote_path for local or escaping URIs
     */
    [[nodiscard]] auto resolve(const std::string& uri) const -> result<std::filesystem::path>;

private:
    explicit directory_store(std::filesystem::path root);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_STORE_DIRECTORY_STORE_H
