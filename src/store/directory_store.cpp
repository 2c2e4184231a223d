/**
 * @file directory_store.cpp
 * @brief Directory-backed remote store implementation
 */

#include "kcenon/bulk_copy/store/directory_store.h"

#include <kcenon/bulk_copy/core/checksum.h>
#include <kcenon/bulk_copy/core/data_path.h>
#include <kcenon/bulk_copy/core/logging.h>

#include <array>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <thread>

namespace kcenon::bulk_copy {

namespace {

constexpr std::size_t io_buffer_size = 64 * 1024;

/**
 * @brief Reader over a file in the store tree
 */
class file_object_reader : public object_reader {
public:
    file_object_reader(std::ifstream file, uint64_t size)
        : file_(std::move(file)), size_(size) {}

    auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (buffer.empty() || !has_more()) {
            return std::size_t{0};
        }

        file_.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        if (file_.bad()) {
            return unexpected{error{error_code::remote_transfer_failed,
                                    "failed to read object data"}};
        }

        auto count = static_cast<std::size_t>(file_.gcount());
        read_ += count;
        return count;
    }

    auto has_more() const -> bool override {
        return read_ < size_ && !file_.eof();
    }

    auto bytes_read() const -> uint64_t override { return read_; }

    auto total_size() const -> uint64_t override { return size_; }

private:
    std::ifstream file_;
    uint64_t size_;
    uint64_t read_ = 0;
};

}  // namespace

struct directory_store::impl {
    std::filesystem::path root;
    std::atomic<uint64_t> next_temp_id{0};

    explicit impl(std::filesystem::path path) : root(std::move(path)) {}

    auto temp_path_for(const std::filesystem::path& target) -> std::filesystem::path {
        auto thread_tag = std::hash<std::thread::id>{}(std::this_thread::get_id());
        auto name = "." + target.filename().string() + ".part-" +
                    std::to_string(thread_tag) + "-" + std::to_string(next_temp_id++);
        return target.parent_path() / name;
    }
};

directory_store::directory_store(std::filesystem::path root)
    : impl_(std::make_unique<impl>(std::move(root))) {}

directory_store::~directory_store() = default;

auto directory_store::create(const std::filesystem::path& root)
    -> result<std::unique_ptr<directory_store>> {
    if (root.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "store root must not be empty"}};
    }

    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
        std::filesystem::create_directories(root, ec);
        if (ec) {
            return unexpected{error{error_code::invalid_configuration,
                "failed to create store root " + root.string() + ": " + ec.message()}};
        }
    } else if (!std::filesystem::is_directory(root, ec)) {
        return unexpected{error{error_code::invalid_configuration,
                                "store root is not a directory: " + root.string()}};
    }

    return std::unique_ptr<directory_store>(new directory_store(root));
}

auto directory_store::create_from_environment()
    -> result<std::unique_ptr<directory_store>> {
    const char* root = std::getenv(root_env_var);
    if (!root || *root == '\0') {
        return unexpected{error{error_code::missing_store,
            std::string(root_env_var) + " is not set"}};
    }
    return create(root);
}

auto directory_store::name() const -> std::string_view {
    return "directory";
}

auto directory_store::root() const -> const std::filesystem::path& {
    return impl_->root;
}

auto directory_store::resolve(const std::string& uri) const -> result<std::filesystem::path> {
    auto parsed = parse_data_path(uri);
    if (!parsed.is_remote()) {
        return unexpected{error{error_code::invalid_remote_path,
                                "not a remote URI: " + uri}};
    }
    if (parsed.scheme.find('/') != std::string::npos || parsed.scheme == "..") {
        return unexpected{error{error_code::invalid_remote_path,
                                "invalid scheme in URI: " + uri}};
    }

    auto relative = parsed.path;
    auto first = relative.find_first_not_of('/');
    relative = (first == std::string::npos) ? std::string{} : relative.substr(first);

    auto normal = (std::filesystem::path(parsed.scheme) / relative).lexically_normal();
    if (normal.empty() || *normal.begin() != std::filesystem::path(parsed.scheme)) {
        return unexpected{error{error_code::invalid_remote_path,
                                "URI escapes the store: " + uri}};
    }

    return impl_->root / normal;
}

auto directory_store::stat(const std::string& uri) -> result<object_info> {
    auto path = resolve(uri);
    if (!path) {
        return unexpected{path.error()};
    }

    object_info info;
    info.uri = uri;

    // The top of a scheme always exists, even before anything is written to it.
    auto parsed = parse_data_path(uri);
    if (parsed.path.find_first_not_of('/') == std::string::npos) {
        info.kind = object_kind::directory;
        return info;
    }

    std::error_code ec;
    auto status = std::filesystem::status(path.value(), ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        info.kind = object_kind::not_found;
        return info;
    }
    if (ec) {
        return unexpected{error{error_code::remote_transfer_failed,
                                "failed to stat " + uri + ": " + ec.message()}};
    }

    if (std::filesystem::is_directory(status)) {
        info.kind = object_kind::directory;
    } else if (std::filesystem::is_regular_file(status)) {
        info.kind = object_kind::file;
        info.size = std::filesystem::file_size(path.value(), ec);
        if (ec) {
            return unexpected{error{error_code::remote_transfer_failed,
                                    "failed to read size of " + uri + ": " + ec.message()}};
        }
    } else {
        info.kind = object_kind::not_found;
    }
    return info;
}

auto directory_store::get(const std::string& uri)
    -> result<std::unique_ptr<object_reader>> {
    auto path = resolve(uri);
    if (!path) {
        return unexpected{path.error()};
    }

    std::error_code ec;
    if (std::filesystem::is_directory(path.value(), ec)) {
        return unexpected{error{error_code::remote_transfer_failed,
                                uri + " is a directory"}};
    }
    if (!std::filesystem::is_regular_file(path.value(), ec)) {
        return unexpected{error{error_code::remote_not_found,
                                "object not found: " + uri}};
    }

    auto size = std::filesystem::file_size(path.value(), ec);
    if (ec) {
        return unexpected{error{error_code::remote_transfer_failed,
                                "failed to read size of " + uri + ": " + ec.message()}};
    }

    std::ifstream file(path.value(), std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::remote_access_denied,
                                "cannot open object " + uri}};
    }

    copy_log_context ctx;
    ctx.item = uri;
    ctx.bytes = size;
    BC_LOG_DEBUG_CTX(log_category::store, "opened object for reading", ctx);

    return std::unique_ptr<object_reader>(
        std::make_unique<file_object_reader>(std::move(file), size));
}

auto directory_store::put(const std::string& uri, std::istream& content)
    -> result<put_result> {
    auto path = resolve(uri);
    if (!path) {
        return unexpected{path.error()};
    }
    const auto& target = path.value();

    auto parsed = parse_data_path(uri);
    if (target.filename().empty() ||
        parsed.path.find_first_not_of('/') == std::string::npos) {
        return unexpected{error{error_code::invalid_remote_path,
                                "no object name in " + uri}};
    }

    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
        return unexpected{error{error_code::remote_transfer_failed,
                                "cannot overwrite directory " + uri}};
    }

    auto parent = target.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return unexpected{error{error_code::remote_transfer_failed,
                "failed to create parent of " + uri + ": " + ec.message()}};
        }
    }

    auto temp = impl_->temp_path_for(target);
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected{error{error_code::remote_access_denied,
                                "cannot create object " + uri}};
    }

    sha256_hasher hasher;
    std::array<char, io_buffer_size> buffer{};
    uint64_t total = 0;

    auto discard = [&temp]() {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
    };

    while (content) {
        content.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = static_cast<std::size_t>(content.gcount());
        if (count == 0) {
            break;
        }

        out.write(buffer.data(), static_cast<std::streamsize>(count));
        if (!out) {
            out.close();
            discard();
            return unexpected{error{error_code::remote_transfer_failed,
                                    "failed to write object " + uri}};
        }
        hasher.update(std::as_bytes(std::span<const char>(buffer.data(), count)));
        total += count;
    }

    if (content.bad()) {
        out.close();
        discard();
        return unexpected{error{error_code::local_read_error,
                                "failed to read upload content"}};
    }

    out.close();
    if (!out) {
        discard();
        return unexpected{error{error_code::remote_transfer_failed,
                                "failed to finish object " + uri}};
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        discard();
        return unexpected{error{error_code::remote_transfer_failed,
                                "failed to commit object " + uri + ": " + ec.message()}};
    }

    put_result res;
    res.uri = uri;
    res.bytes_written = total;
    res.etag = hasher.finalize();

    copy_log_context ctx;
    ctx.item = uri;
    ctx.bytes = total;
    BC_LOG_DEBUG_CTX(log_category::store, "object stored", ctx);

    return res;
}

}  // namespace kcenon::bulk_copy
