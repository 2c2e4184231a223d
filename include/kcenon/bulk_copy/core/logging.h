// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/bulk_copy/config/feature_flags.h"

#if KCENON_WITH_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::bulk_copy {

/**
 * @brief Log categories for bulk_copy
 */
struct log_category {
    static constexpr std::string_view engine = "bulk_copy.engine";
    static constexpr std::string_view worker = "bulk_copy.worker";
    static constexpr std::string_view resolver = "bulk_copy.resolver";
    static constexpr std::string_view store = "bulk_copy.store";
    static constexpr std::string_view cli = "bulk_copy.cli";
};

/**
 * @brief Log levels for bulk_copy
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name ("debug", "WARN", ...)
 * @return Parsed level, or std::nullopt for an unknown name
 */
inline std::optional<log_level> parse_log_level(std::string_view name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) {
        lowered += static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
    }
    if (lowered == "trace") return log_level::trace;
    if (lowered == "debug") return log_level::debug;
    if (lowered == "info") return log_level::info;
    if (lowered == "warn" || lowered == "warning") return log_level::warn;
    if (lowered == "error") return log_level::error;
    if (lowered == "fatal") return log_level::fatal;
    return std::nullopt;
}

/**
 * @brief Structured context attached to a copy log record
 */
struct copy_log_context {
    std::string item;
    std::optional<std::string> target;
    std::optional<uint64_t> bytes;
    std::optional<std::size_t> worker;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!item.empty()) add_field("item", item);
        if (target) add_field("target", *target);
        if (bytes) add_uint("bytes", *bytes);
        if (worker) add_uint("worker", *worker);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape_json_string(const std::string& input) -> std::string {
        std::string output;
        output.reserve(input.size() + 16);
        for (char c : input) {
            switch (c) {
                case '"':  output += "\\\""; break;
                case '\\': output += "\\\\"; break;
                case '\b': output += "\\b";  break;
                case '\f': output += "\\f";  break;
                case '\n': output += "\\n";  break;
                case '\r': output += "\\r";  break;
                case '\t': output += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        output += buf;
                    } else {
                        output += c;
                    }
            }
        }
        return output;
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< One JSON object per record
};

class copy_logger;

copy_logger& get_logger();

/**
 * @brief Process-wide diagnostic logger
 *
 * Records go to kcenon logger_system when it is compiled in, otherwise to
 * stderr. A callback, when set, sees every record that passes the level
 * filter.
 */
class copy_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const copy_log_context*)>;

    copy_logger() = default;
    ~copy_logger() = default;

    copy_logger(const copy_logger&) = delete;
    copy_logger& operator=(const copy_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if KCENON_WITH_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if KCENON_WITH_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if KCENON_WITH_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress the stderr/logger_system sink (callback still fires)
     */
    void set_sink_enabled(bool enabled) { sink_enabled_.store(enabled); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const copy_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (!sink_enabled_.load()) return;

        std::string record = get_output_format() == log_output_format::json
            ? format_json(level, category, message, context)
            : format_text(category, message, context);

#if KCENON_WITH_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), record, file, line, function);
            } else {
                logger_->log(to_logger_level(level), record);
            }
            return;
        }
#endif
        if (get_output_format() == log_output_format::text) {
            record = get_timestamp() + " [" + std::string(log_level_to_string(level)) + "] " +
                     record;
        }
        output_to_stderr(record);
    }

    void flush() {
#if KCENON_WITH_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
        std::cerr.flush();
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const copy_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const copy_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_iso8601_timestamp() << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\""
            << copy_log_context::escape_json_string(std::string(message)) << "\"";
        if (context) {
            auto ctx = context->to_json();
            if (ctx.size() > 2) {
                oss << "," << ctx.substr(1, ctx.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if KCENON_WITH_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> sink_enabled_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

inline copy_logger& get_logger() {
    static copy_logger instance;
    return instance;
}

#define BC_LOG(level, category, message) \
    kcenon::bulk_copy::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define BC_LOG_CTX(level, category, message, context) \
    kcenon::bulk_copy::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define BC_LOG_TRACE(category, message) \
    BC_LOG(kcenon::bulk_copy::log_level::trace, category, message)

#define BC_LOG_DEBUG(category, message) \
    BC_LOG(kcenon::bulk_copy::log_level::debug, category, message)

#define BC_LOG_INFO(category, message) \
    BC_LOG(kcenon::bulk_copy::log_level::info, category, message)

#define BC_LOG_WARN(category, message) \
    BC_LOG(kcenon::bulk_copy::log_level::warn, category, message)

#define BC_LOG_ERROR(category, message) \
    BC_LOG(kcenon::bulk_copy::log_level::error, category, message)

#define BC_LOG_FATAL(category, message) \
    BC_LOG(kcenon::bulk_copy::log_level::fatal, category, message)

#define BC_LOG_DEBUG_CTX(category, message, ctx) \
    BC_LOG_CTX(kcenon::bulk_copy::log_level::debug, category, message, ctx)

#define BC_LOG_INFO_CTX(category, message, ctx) \
    BC_LOG_CTX(kcenon::bulk_copy::log_level::info, category, message, ctx)

#define BC_LOG_WARN_CTX(category, message, ctx) \
    BC_LOG_CTX(kcenon::bulk_copy::log_level::warn, category, message, ctx)

#define BC_LOG_ERROR_CTX(category, message, ctx) \
    BC_LOG_CTX(kcenon::bulk_copy::log_level::error, category, message, ctx)

#define BC_LOG_FATAL_CTX(category, message, ctx) \
    BC_LOG_CTX(kcenon::bulk_copy::log_level::fatal, category, message, ctx)

} // namespace kcenon::bulk_copy
