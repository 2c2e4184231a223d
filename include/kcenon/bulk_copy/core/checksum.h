/**
 * @file checksum.h
 * @brief SHA-256 utilities for object etags
 */

#ifndef KCENON_BULK_COPY_CORE_CHECKSUM_H
#define KCENON_BULK_COPY_CORE_CHECKSUM_H

#include <kcenon/bulk_copy/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace kcenon::bulk_copy {

/**
 * @brief Incremental SHA-256 hasher backed by OpenSSL EVP
 *
 * Used to compute an etag while content streams through a store, without
 * reading the data a second time.
 */
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(const sha256_hasher&) = delete;
    auto operator=(const sha256_hasher&) -> sha256_hasher& = delete;
    sha256_hasher(sha256_hasher&&) noexcept;
    auto operator=(sha256_hasher&&) noexcept -> sha256_hasher&;

    /**
     * @brief Feed more data into the digest
     */
    void update(std::span<const std::byte> data);

    /**
     * @brief Finish the digest
     * @return Lowercase hex string; the hasher must not be reused afterwards
     */
    [[nodiscard]] auto finalize() -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief One-shot SHA-256 helpers
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;
};

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_CORE_CHECKSUM_H
