/**
 * @file test_logging.cpp
 * @brief Unit tests for structured copy logging
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_copy/core/logging.h>

#include <mutex>
#include <string>
#include <vector>

namespace kcenon::bulk_copy::test {

// =============================================================================
// Log level Tests
// =============================================================================

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, LevelNames) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_log_level("debug"), log_level::debug);
    EXPECT_EQ(parse_log_level("DEBUG"), log_level::debug);
    EXPECT_EQ(parse_log_level("Warning"), log_level::warn);
    EXPECT_EQ(parse_log_level("error"), log_level::error);
}

TEST_F(LogLevelTest, ParseRejectsUnknown) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

// =============================================================================
// Log context Tests
// =============================================================================

class CopyLogContextTest : public ::testing::Test {};

TEST_F(CopyLogContextTest, EmptyContextIsEmptyObject) {
    copy_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(CopyLogContextTest, FieldsInJson) {
    copy_log_context ctx;
    ctx.item = "a.txt";
    ctx.target = "data://x/a.txt";
    ctx.bytes = 1536;
    ctx.worker = 2;

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"item\":\"a.txt\""), std::string::npos);
    EXPECT_NE(json.find("\"target\":\"data://x/a.txt\""), std::string::npos);
    EXPECT_NE(json.find("\"bytes\":1536"), std::string::npos);
    EXPECT_NE(json.find("\"worker\":2"), std::string::npos);
    EXPECT_EQ(json.find("error_message"), std::string::npos);
}

TEST_F(CopyLogContextTest, EscapesSpecialCharacters) {
    EXPECT_EQ(copy_log_context::escape_json_string("a\"b"), "a\\\"b");
    EXPECT_EQ(copy_log_context::escape_json_string("a\\b"), "a\\\\b");
    EXPECT_EQ(copy_log_context::escape_json_string("a\nb"), "a\\nb");
}

// =============================================================================
// Logger Tests
// =============================================================================

class CopyLoggerTest : public ::testing::Test {
protected:
    struct record {
        log_level level;
        std::string category;
        std::string message;
        bool has_context;
    };

    void SetUp() override {
        auto& logger = get_logger();
        saved_level_ = logger.get_level();
        logger.set_sink_enabled(false);
        logger.set_callback([this](log_level level, std::string_view category,
                                   std::string_view message, const copy_log_context* ctx) {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back(
                {level, std::string(category), std::string(message), ctx != nullptr});
        });
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_sink_enabled(true);
        logger.set_level(saved_level_);
        logger.set_output_format(log_output_format::text);
    }

    auto records() -> std::vector<record> {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    std::mutex mutex_;
    std::vector<record> records_;
    log_level saved_level_ = log_level::info;
};

TEST_F(CopyLoggerTest, LevelFilter) {
    get_logger().set_level(log_level::warn);

    BC_LOG_INFO(log_category::engine, "hidden");
    BC_LOG_WARN(log_category::engine, "shown");
    BC_LOG_ERROR(log_category::worker, "also shown");

    auto seen = records();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].message, "shown");
    EXPECT_EQ(seen[0].level, log_level::warn);
    EXPECT_EQ(seen[1].category, "bulk_copy.worker");
}

TEST_F(CopyLoggerTest, IsEnabled) {
    get_logger().set_level(log_level::error);
    EXPECT_FALSE(get_logger().is_enabled(log_level::warn));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
    EXPECT_TRUE(get_logger().is_enabled(log_level::fatal));
}

TEST_F(CopyLoggerTest, ContextIsPassedToCallback) {
    get_logger().set_level(log_level::debug);

    copy_log_context ctx;
    ctx.item = "a.txt";
    BC_LOG_DEBUG_CTX(log_category::store, "with context", ctx);
    BC_LOG_DEBUG(log_category::store, "without context");

    auto seen = records();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[0].has_context);
    EXPECT_FALSE(seen[1].has_context);
    EXPECT_EQ(seen[0].category, "bulk_copy.store");
}

TEST_F(CopyLoggerTest, OutputFormatRoundTrip) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);
    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(CopyLoggerTest, CategoryNames) {
    EXPECT_EQ(log_category::engine, "bulk_copy.engine");
    EXPECT_EQ(log_category::resolver, "bulk_copy.resolver");
    EXPECT_EQ(log_category::cli, "bulk_copy.cli");
}

}  // namespace kcenon::bulk_copy::test
