/*
 * ============================================================================
 * Stealerlog Log Loader Unit Tests
 * ============================================================================
 *
 * File and directory intake, validation limits and content digests.
 *
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "stealerlog/core/log_loader.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace stealerlog::core;

namespace fs = std::filesystem;

// ============================================================================
// Test Fixture
// ============================================================================

class LogLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
            ("stealerlog_loader_" + std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(root_ / "Browsers");

        WriteFile(root_ / "System.txt", "abc");
        WriteFile(root_ / "Passwords.txt", "URL: https://a.com\nUsername: x\nPassword: y\n");
        WriteFile(root_ / "Browsers" / "Cookies.log", "cookie");
        WriteFile(root_ / "empty.txt", "");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    static void WriteFile(const fs::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    fs::path root_;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(LogLoaderTest, LoadPath_DirectoryRecursiveSorted) {
    LogLoader loader;
    auto files = loader.LoadPath(root_);

    // empty.txt is below the minimum size
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].source.file_name, "Cookies.log");
    EXPECT_EQ(files[1].source.file_name, "Passwords.txt");
    EXPECT_EQ(files[2].source.file_name, "System.txt");
}

TEST_F(LogLoaderTest, LoadPath_NonRecursive) {
    LogLoader::Config config;
    config.recursive = false;

    LogLoader loader(config);
    auto files = loader.LoadPath(root_);

    ASSERT_EQ(files.size(), 2u);
    for (const auto& file : files) {
        EXPECT_NE(file.source.file_name, "Cookies.log");
    }
}

TEST_F(LogLoaderTest, LoadPath_SingleFile) {
    LogLoader loader;
    auto files = loader.LoadPath(root_ / "System.txt");

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].source.file_name, "System.txt");
    EXPECT_EQ(files[0].source.content, "abc");
    EXPECT_EQ(files[0].size, 3u);
    EXPECT_EQ(files[0].path.string(), (root_ / "System.txt").string());
}

TEST_F(LogLoaderTest, LoadPath_MissingPathThrows) {
    LogLoader loader;
    EXPECT_THROW(loader.LoadPath(root_ / "does-not-exist"), std::runtime_error);
}

TEST_F(LogLoaderTest, LoadFile_ComputesSha256) {
    LogLoader loader;
    auto file = loader.LoadFile(root_ / "System.txt");

    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->sha256, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(LogLoaderTest, LoadFile_HashingDisabled) {
    LogLoader::Config config;
    config.compute_hashes = false;

    LogLoader loader(config);
    auto file = loader.LoadFile(root_ / "System.txt");

    ASSERT_TRUE(file.has_value());
    EXPECT_TRUE(file->sha256.empty());
}

TEST_F(LogLoaderTest, LoadFile_KeepsBinaryBytes) {
    const std::string bytes("\xff\xfeO\0S\0", 6);
    WriteFile(root_ / "utf16.txt", bytes);

    LogLoader loader;
    auto file = loader.LoadFile(root_ / "utf16.txt");

    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->source.content, bytes);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(LogLoaderTest, ValidateFile_SizeLimits) {
    LogLoader::Config config;
    config.max_file_size = 4;

    LogLoader loader(config);

    EXPECT_TRUE(loader.ValidateFile(root_ / "System.txt").valid);

    auto too_large = loader.ValidateFile(root_ / "Passwords.txt");
    EXPECT_FALSE(too_large.valid);
    EXPECT_NE(too_large.error_message.find("too large"), std::string::npos);

    auto too_small = loader.ValidateFile(root_ / "empty.txt");
    EXPECT_FALSE(too_small.valid);
    EXPECT_NE(too_small.error_message.find("too small"), std::string::npos);

    EXPECT_FALSE(loader.LoadFile(root_ / "Passwords.txt").has_value());
}

TEST_F(LogLoaderTest, ValidateFile_MissingAndDirectory) {
    LogLoader loader;

    auto missing = loader.ValidateFile(root_ / "nope.txt");
    EXPECT_FALSE(missing.valid);
    EXPECT_EQ(missing.error_message, "File does not exist");

    auto directory = loader.ValidateFile(root_ / "Browsers");
    EXPECT_FALSE(directory.valid);
    EXPECT_EQ(directory.error_message, "Not a regular file");
}

TEST_F(LogLoaderTest, ValidateFile_UnexpectedExtensionWarns) {
    WriteFile(root_ / "Screenshot.jpg", "jpeg");

    LogLoader loader;
    auto result = loader.ValidateFile(root_ / "Screenshot.jpg");

    EXPECT_TRUE(result.valid);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_TRUE(loader.ValidateFile(root_ / "System.txt").warnings.empty());
}
