/**
 * @file types.h
 * @brief Core type definitions for bulk_copy
 */

#ifndef KCENON_BULK_COPY_CORE_TYPES_H
#define KCENON_BULK_COPY_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::bulk_copy {

/**
 * @brief Error codes for copy operations
 */
enum class error_code {
    success = 0,

    // Local I/O errors (-100 to -119)
    local_file_not_found = -100,
    local_not_regular_file = -101,
    local_open_failed = -102,
    local_read_error = -103,
    local_write_error = -104,
    local_rename_failed = -105,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,
    invalid_concurrency = -141,
    missing_store = -142,

    // Remote transfer errors (-160 to -179)
    remote_not_found = -160,
    remote_transfer_failed = -161,
    remote_access_denied = -162,
    invalid_remote_path = -163,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::local_file_not_found:
            return "local file not found";
        case error_code::local_not_regular_file:
            return "not a regular file";
        case error_code::local_open_failed:
            return "cannot open local file";
        case error_code::local_read_error:
            return "local read error";
        case error_code::local_write_error:
            return "local write error";
        case error_code::local_rename_failed:
            return "cannot move file into place";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_concurrency:
            return "concurrency must be positive";
        case error_code::missing_store:
            return "no remote store configured";
        case error_code::remote_not_found:
            return "remote object not found";
        case error_code::remote_transfer_failed:
            return "remote transfer failed";
        case error_code::remote_access_denied:
            return "remote access denied";
        case error_code::invalid_remote_path:
            return "invalid remote path";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error taxonomy used by the batch failure policy
 */
enum class error_class {
    none,
    local_io,
    remote_transfer,
    configuration,
    internal
};

/**
 * @brief Map an error code to its taxonomy class
 */
[[nodiscard]] constexpr auto classify(error_code code) -> error_class {
    auto value = static_cast<int>(code);
    if (value == 0) return error_class::none;
    if (value <= -100 && value > -120) return error_class::local_io;
    if (value <= -140 && value > -160) return error_class::configuration;
    if (value <= -160 && value > -180) return error_class::remote_transfer;
    return error_class::internal;
}

[[nodiscard]] constexpr auto to_string(error_class cls) -> const char* {
    switch (cls) {
        case error_class::none: return "none";
        case error_class::local_io: return "local I/O error";
        case error_class::remote_transfer: return "remote transfer error";
        case error_class::configuration: return "configuration error";
        case error_class::internal: return "internal error";
        default: return "unknown";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error, similar to std::expected.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::bulk_copy

#endif  // KCENON_BULK_COPY_CORE_TYPES_H
