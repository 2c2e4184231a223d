/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, error classes and result<T>
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_copy/core/types.h>
#include <kcenon/bulk_copy/engine/copy_types.h>

#include <string>

namespace kcenon::bulk_copy::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Local I/O errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::local_file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::local_rename_failed), -105);

    // Configuration errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -140);
    EXPECT_EQ(static_cast<int>(error_code::missing_store), -142);

    // Remote transfer errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::remote_not_found), -160);
    EXPECT_EQ(static_cast<int>(error_code::invalid_remote_path), -163);

    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, ToStringIsStable) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::local_not_regular_file), "not a regular file");
    EXPECT_STREQ(to_string(error_code::remote_transfer_failed), "remote transfer failed");
    EXPECT_STREQ(to_string(error_code::invalid_concurrency), "concurrency must be positive");
}

TEST_F(ErrorCodeTest, ClassifyLocalErrors) {
    EXPECT_EQ(classify(error_code::local_file_not_found), error_class::local_io);
    EXPECT_EQ(classify(error_code::local_open_failed), error_class::local_io);
    EXPECT_EQ(classify(error_code::local_write_error), error_class::local_io);
    EXPECT_EQ(classify(error_code::local_rename_failed), error_class::local_io);
}

TEST_F(ErrorCodeTest, ClassifyRemoteErrors) {
    EXPECT_EQ(classify(error_code::remote_not_found), error_class::remote_transfer);
    EXPECT_EQ(classify(error_code::remote_transfer_failed), error_class::remote_transfer);
    EXPECT_EQ(classify(error_code::remote_access_denied), error_class::remote_transfer);
    EXPECT_EQ(classify(error_code::invalid_remote_path), error_class::remote_transfer);
}

TEST_F(ErrorCodeTest, ClassifyOtherErrors) {
    EXPECT_EQ(classify(error_code::success), error_class::none);
    EXPECT_EQ(classify(error_code::invalid_concurrency), error_class::configuration);
    EXPECT_EQ(classify(error_code::missing_store), error_class::configuration);
    EXPECT_EQ(classify(error_code::internal_error), error_class::internal);
}

// =============================================================================
// result<T> Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected{error{error_code::remote_not_found, "gone"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::remote_not_found);
    EXPECT_EQ(r.error().message, "gone");
}

TEST_F(ResultTest, ErrorFromCodeUsesDefaultMessage) {
    error err(error_code::local_open_failed);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "cannot open local file");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::internal_error, "boom"}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "boom");
}

// =============================================================================
// copy types Tests
// =============================================================================

class CopyTypesTest : public ::testing::Test {};

TEST_F(CopyTypesTest, DefaultConfig) {
    copy_config config;
    EXPECT_EQ(config.concurrency, 8u);
    EXPECT_EQ(config.work_queue_capacity, 0u);
    EXPECT_EQ(config.on_failure, fatal_policy::exit_process);
    EXPECT_FALSE(config.store);
}

TEST_F(CopyTypesTest, ReportWithoutFailureIsOk) {
    batch_report report;
    EXPECT_TRUE(report.ok());

    report.failure = failed_item{"a.txt", error{error_code::local_open_failed, "denied"}};
    EXPECT_FALSE(report.ok());
}

TEST_F(CopyTypesTest, EnumNames) {
    EXPECT_STREQ(to_string(copy_direction::upload), "upload");
    EXPECT_STREQ(to_string(copy_direction::download), "download");
    EXPECT_STREQ(progressive_verb(copy_direction::upload), "uploading");
    EXPECT_STREQ(progressive_verb(copy_direction::download), "downloading");
    EXPECT_STREQ(to_string(write_mode::insert_child), "insert_child");
    EXPECT_STREQ(to_string(fatal_policy::stop_and_report), "stop_and_report");
}

TEST_F(CopyTypesTest, ParseConcurrencyAcceptsPositiveNumbers) {
    auto one = parse_concurrency("1");
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one.value(), 1u);

    auto many = parse_concurrency("64");
    ASSERT_TRUE(many.has_value());
    EXPECT_EQ(many.value(), 64u);
}

TEST_F(CopyTypesTest, ParseConcurrencyRejectsPartialNumbers) {
    for (const char* text : {"3abc", "4 ", " 4", "2.5", "+3", "0x10"}) {
        auto parsed = parse_concurrency(text);
        ASSERT_FALSE(parsed.has_value()) << text;
        EXPECT_EQ(parsed.error().code, error_code::invalid_concurrency) << text;
    }
}

TEST_F(CopyTypesTest, ParseConcurrencyRejectsZeroAndNegatives) {
    EXPECT_FALSE(parse_concurrency("0").has_value());
    EXPECT_FALSE(parse_concurrency("-2").has_value());
    EXPECT_FALSE(parse_concurrency("").has_value());
    EXPECT_FALSE(parse_concurrency("99999999999999999999999").has_value());
}

}  // namespace kcenon::bulk_copy::test
