/**
 * @file test_checksum.cpp
 * @brief Unit tests for SHA-256 utilities
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_copy/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace kcenon::bulk_copy::test {

namespace {

auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

}  // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("bulk_copy_test_checksum_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ChecksumTest, SHA256_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::sha256(empty),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, SHA256_KnownValue) {
    EXPECT_EQ(checksum::sha256(to_bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, IncrementalMatchesOneShot) {
    sha256_hasher hasher;
    hasher.update(to_bytes("a"));
    hasher.update(to_bytes("b"));
    hasher.update(to_bytes("c"));
    EXPECT_EQ(hasher.finalize(), checksum::sha256(to_bytes("abc")));
}

TEST_F(ChecksumTest, HasherIsMovable) {
    sha256_hasher first;
    first.update(to_bytes("ab"));
    sha256_hasher second = std::move(first);
    second.update(to_bytes("c"));
    EXPECT_EQ(second.finalize(), checksum::sha256(to_bytes("abc")));
}

TEST_F(ChecksumTest, FileHashMatchesDataHash) {
    auto path = create_test_file("abc.txt", "abc");
    auto result = checksum::sha256_file(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), checksum::sha256(to_bytes("abc")));
}

TEST_F(ChecksumTest, MissingFileFails) {
    auto result = checksum::sha256_file(test_dir_ / "missing.bin");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::local_open_failed);
}

}  // namespace kcenon::bulk_copy::test
