#include <gtest/gtest.h>
#include "chunkwire/core/utils.hpp"
#include <filesystem>
#include <fstream>
#include <limits>

using namespace chunkwire::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("SQLite"), "sqlite");
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
}

TEST_F(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(2000)), "2s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(125000)), "2m 5s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::hours(3) + std::chrono::minutes(4)), "3h 4m");
}

TEST_F(StringUtilsTest, FormatEta) {
    EXPECT_EQ(StringUtils::format_eta(65.4), "1:05");
    EXPECT_EQ(StringUtils::format_eta(3725.0), "1:02:05");
    EXPECT_EQ(StringUtils::format_eta(0.0), "--:--");
    EXPECT_EQ(StringUtils::format_eta(std::numeric_limits<double>::infinity()), "--:--");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_file.txt";
        test_dir = "test_dir/nested";
    }

    void TearDown() override {
        std::filesystem::remove(test_file);
        std::filesystem::remove_all("test_dir");
    }

    std::string test_file;
    std::string test_dir;
};

TEST_F(FileUtilsTest, Exists) {
    EXPECT_FALSE(FileUtils::exists(test_file));

    std::ofstream file(test_file);
    file << "test";
    file.close();

    EXPECT_TRUE(FileUtils::exists(test_file));
}

TEST_F(FileUtilsTest, CreateDirectories) {
    EXPECT_TRUE(FileUtils::create_directories(test_dir));
    EXPECT_TRUE(FileUtils::exists(test_dir));
    EXPECT_TRUE(FileUtils::create_directories(test_dir));
}

TEST_F(FileUtilsTest, ExpandUser) {
    EXPECT_EQ(FileUtils::expand_user("~/data"), FileUtils::get_home_dir() / "data");
    EXPECT_EQ(FileUtils::expand_user("relative/path"), std::filesystem::path("relative/path"));
}

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, Now) {
    auto time1 = TimeUtils::now();
    auto time2 = TimeUtils::now();

    EXPECT_GE(time2, time1);
}

TEST_F(TimeUtilsTest, UnixMillis) {
    auto time = TimeUtils::from_unix_millis(1700000000123);
    EXPECT_EQ(TimeUtils::to_unix_millis(time), 1700000000123);
}

TEST_F(TimeUtilsTest, FormatTimestamp) {
    auto timestamp = TimeUtils::format_timestamp(TimeUtils::now());

    EXPECT_FALSE(timestamp.empty());
    EXPECT_TRUE(timestamp.find('-') != std::string::npos);
    EXPECT_TRUE(timestamp.find(':') != std::string::npos);
}
