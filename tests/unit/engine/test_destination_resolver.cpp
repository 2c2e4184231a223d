/**
 * @file test_destination_resolver.cpp
 * @brief Unit tests for upload and download target resolution
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_copy/engine/destination_resolver.h>

#include "mocks/memory_store.h"

#include <filesystem>
#include <fstream>
#include <random>

namespace kcenon::bulk_copy::test {

// =============================================================================
// Upload resolution
// =============================================================================

class UploadResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<memory_store>();
        resolver_ = std::make_unique<destination_resolver>(store_);
    }

    std::shared_ptr<memory_store> store_;
    std::unique_ptr<destination_resolver> resolver_;
};

TEST_F(UploadResolverTest, ExistingFileIsOverwritten) {
    store_->add_file("data://x/target.bin", "old");

    auto target = resolver_->resolve_upload("data://x/target.bin", "/tmp/other.txt");
    EXPECT_EQ(target.mode, write_mode::overwrite);
    EXPECT_EQ(target.uri, "data://x/target.bin");
}

TEST_F(UploadResolverTest, ExistingDirectoryGetsChild) {
    store_->add_directory("data://x");

    auto target = resolver_->resolve_upload("data://x", "some/dir/a.txt");
    EXPECT_EQ(target.mode, write_mode::insert_child);
    EXPECT_EQ(target.uri, "data://x/a.txt");
}

TEST_F(UploadResolverTest, DirectoryWithTrailingSlash) {
    store_->add_directory("data://x");

    auto target = resolver_->resolve_upload("data://x/", "b.txt");
    EXPECT_EQ(target.mode, write_mode::insert_child);
    EXPECT_EQ(target.uri, "data://x/b.txt");
}

TEST_F(UploadResolverTest, SchemeRootIsDirectory) {
    auto target = resolver_->resolve_upload("data://", "a.txt");
    EXPECT_EQ(target.mode, write_mode::insert_child);
    EXPECT_EQ(target.uri, "data://a.txt");
}

TEST_F(UploadResolverTest, MissingDestinationIsCreatedLiterally) {
    auto target = resolver_->resolve_upload("data://x/new.bin", "a.txt");
    EXPECT_EQ(target.mode, write_mode::create_new);
    EXPECT_EQ(target.uri, "data://x/new.bin");
}

TEST_F(UploadResolverTest, CreateNewIgnoresItemName) {
    auto first = resolver_->resolve_upload("data://x/new.bin", "a.txt");
    auto second = resolver_->resolve_upload("data://x/new.bin", "b.txt");
    EXPECT_EQ(first.uri, second.uri);
}

TEST_F(UploadResolverTest, StatFailureFallsBackToCreateNew) {
    store_->add_directory("data://x");
    store_->fail_stat(true);

    auto target = resolver_->resolve_upload("data://x", "a.txt");
    EXPECT_EQ(target.mode, write_mode::create_new);
    EXPECT_EQ(target.uri, "data://x");
}

TEST_F(UploadResolverTest, QueriesStoreForEveryItem) {
    store_->add_directory("data://x");

    (void)resolver_->resolve_upload("data://x", "a.txt");
    (void)resolver_->resolve_upload("data://x", "b.txt");
    (void)resolver_->resolve_upload("data://x", "c.txt");
    EXPECT_EQ(store_->stat_calls(), 3u);
}

// =============================================================================
// Download resolution
// =============================================================================

class DownloadResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("bulk_copy_test_resolver_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

TEST_F(DownloadResolverTest, ExistingDirectoryGetsBasename) {
    auto target = destination_resolver::resolve_download(test_dir_, "data://x/a.txt");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value(), test_dir_ / "a.txt");
}

TEST_F(DownloadResolverTest, NestedRemotePathUsesLastSegment) {
    auto target = destination_resolver::resolve_download(test_dir_, "data://x/y/z/deep.bin");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value(), test_dir_ / "deep.bin");
}

TEST_F(DownloadResolverTest, MissingPathIsTakenLiterally) {
    auto dest = test_dir_ / "renamed.txt";
    auto target = destination_resolver::resolve_download(dest, "data://x/a.txt");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value(), dest);
}

TEST_F(DownloadResolverTest, ExistingFileIsTakenLiterally) {
    auto dest = test_dir_ / "existing.txt";
    std::ofstream(dest) << "old";

    auto target = destination_resolver::resolve_download(dest, "data://x/a.txt");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value(), dest);
}

TEST_F(DownloadResolverTest, RootItemIntoDirectoryFails) {
    auto target = destination_resolver::resolve_download(test_dir_, "data://");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error().code, error_code::invalid_remote_path);
}

}  // namespace kcenon::bulk_copy::test
