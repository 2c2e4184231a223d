/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 utilities
 */

#include <kcenon/bulk_copy/core/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace kcenon::bulk_copy {

namespace {

auto digest_to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

}  // namespace

struct sha256_hasher::impl {
    struct deleter_md_ctx {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    std::unique_ptr<EVP_MD_CTX, deleter_md_ctx> ctx;

    impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("failed to initialize SHA-256 digest");
        }
    }
};

sha256_hasher::sha256_hasher() : impl_(std::make_unique<impl>()) {}

sha256_hasher::~sha256_hasher() = default;

sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;

auto sha256_hasher::operator=(sha256_hasher&&) noexcept -> sha256_hasher& = default;

void sha256_hasher::update(std::span<const std::byte> data) {
    if (data.empty()) {
        return;
    }
    EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size());
}

auto sha256_hasher::finalize() -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &length);
    return digest_to_hex(digest.data(), length);
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    sha256_hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::local_open_failed, "cannot open file: " + path.string()});
    }

    sha256_hasher hasher;
    std::array<char, 64 * 1024> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0) {
            hasher.update(std::as_bytes(
                std::span<const char>(buffer.data(), static_cast<std::size_t>(bytes_read))));
        }
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::local_read_error, "failed to read file: " + path.string()});
    }

    return hasher.finalize();
}

}  // namespace kcenon::bulk_copy
