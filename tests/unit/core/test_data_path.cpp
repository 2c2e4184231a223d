/**
 * @file test_data_path.cpp
 * @brief Unit tests for path classification and URI helpers
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_copy/core/data_path.h>
#include <kcenon/bulk_copy/engine/copy_types.h>

namespace kcenon::bulk_copy::test {

// =============================================================================
// classify_path
// =============================================================================

class ClassifyPathTest : public ::testing::Test {};

TEST_F(ClassifyPathTest, PlainPathIsLocal) {
    EXPECT_EQ(classify_path("a.txt"), path_kind::local);
    EXPECT_EQ(classify_path("./out"), path_kind::local);
    EXPECT_EQ(classify_path("/tmp/x/y"), path_kind::local);
}

TEST_F(ClassifyPathTest, EmptyStringIsLocal) {
    EXPECT_EQ(classify_path(""), path_kind::local);
}

TEST_F(ClassifyPathTest, FileSchemeIsLocal) {
    EXPECT_EQ(classify_path("file://tmp/a.txt"), path_kind::local);
    EXPECT_EQ(classify_path("file:///tmp/a.txt"), path_kind::local);
}

TEST_F(ClassifyPathTest, OtherSchemesAreRemote) {
    EXPECT_EQ(classify_path("data://x"), path_kind::remote);
    EXPECT_EQ(classify_path("s3://bucket/key"), path_kind::remote);
    EXPECT_EQ(classify_path("dropbox://"), path_kind::remote);
}

TEST_F(ClassifyPathTest, EmptySchemeIsLocal) {
    EXPECT_EQ(classify_path("://x"), path_kind::local);
}

TEST_F(ClassifyPathTest, OnlyFirstSeparatorSplits) {
    auto parsed = parse_data_path("data://a/b://c");
    EXPECT_EQ(parsed.scheme, "data");
    EXPECT_EQ(parsed.path, "a/b://c");
    EXPECT_TRUE(parsed.is_remote());
}

TEST_F(ClassifyPathTest, DirectionFollowsDestination) {
    EXPECT_EQ(classify_direction("data://x"), copy_direction::upload);
    EXPECT_EQ(classify_direction("./out"), copy_direction::download);
    EXPECT_EQ(classify_direction("file://out"), copy_direction::download);
    EXPECT_EQ(classify_direction(""), copy_direction::download);
}

// =============================================================================
// parse / render
// =============================================================================

class DataPathTest : public ::testing::Test {};

TEST_F(DataPathTest, ParseWithoutScheme) {
    auto parsed = parse_data_path("dir/file.bin");
    EXPECT_TRUE(parsed.scheme.empty());
    EXPECT_EQ(parsed.path, "dir/file.bin");
    EXPECT_FALSE(parsed.is_remote());
}

TEST_F(DataPathTest, RoundTripToUri) {
    EXPECT_EQ(parse_data_path("data://x/y").to_uri(), "data://x/y");
    EXPECT_EQ(parse_data_path("local/file").to_uri(), "local/file");
}

TEST_F(DataPathTest, StripFileScheme) {
    EXPECT_EQ(strip_file_scheme("file:///tmp/a.txt"), "/tmp/a.txt");
    EXPECT_EQ(strip_file_scheme("file://a.txt"), "a.txt");
    EXPECT_EQ(strip_file_scheme("a.txt"), "a.txt");
    EXPECT_EQ(strip_file_scheme("data://a.txt"), "data://a.txt");
}

TEST_F(DataPathTest, RemoteBasename) {
    EXPECT_EQ(remote_basename("data://x/a.txt"), "a.txt");
    EXPECT_EQ(remote_basename("data://a.txt"), "a.txt");
    EXPECT_EQ(remote_basename("data://x/dir/"), "dir");
    EXPECT_EQ(remote_basename("data://x//"), "x");
}

TEST_F(DataPathTest, RemoteBasenameOfRootIsEmpty) {
    EXPECT_EQ(remote_basename("data://"), "");
    EXPECT_EQ(remote_basename("data:///"), "");
}

TEST_F(DataPathTest, JoinRemote) {
    EXPECT_EQ(join_remote("data://x", "a.txt"), "data://x/a.txt");
    EXPECT_EQ(join_remote("data://x/", "a.txt"), "data://x/a.txt");
    EXPECT_EQ(join_remote("data://", "a.txt"), "data://a.txt");
}

// =============================================================================
// format_size
// =============================================================================

class FormatSizeTest : public ::testing::Test {};

TEST_F(FormatSizeTest, SmallValuesArePlain) {
    EXPECT_EQ(format_size(0), "0");
    EXPECT_EQ(format_size(512), "512");
    EXPECT_EQ(format_size(1023), "1023");
}

TEST_F(FormatSizeTest, BinarySuffixes) {
    EXPECT_EQ(format_size(1024), "1.0K");
    EXPECT_EQ(format_size(1536), "1.5K");
    EXPECT_EQ(format_size(1024 * 1024), "1.0M");
    EXPECT_EQ(format_size(3ull * 1024 * 1024 * 1024), "3.0G");
    EXPECT_EQ(format_size(2ull * 1024 * 1024 * 1024 * 1024), "2.0T");
}

TEST_F(FormatSizeTest, LargestSuffixIsTera) {
    EXPECT_EQ(format_size(2048ull * 1024 * 1024 * 1024 * 1024), "2048.0T");
}

}  // namespace kcenon::bulk_copy::test
