#include "pbu/config/upload_config.hpp"

#include "support/test_files.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace pbu::config;
using pbu::upload::kMiB;

namespace fs = std::filesystem;

TEST(UploadConfigTest, EmptyObjectKeepsDefaults) {
    auto config = parse_config("{}");
    ASSERT_TRUE(config.is_ok()) << config.error();

    const auto& value = config.value();
    EXPECT_EQ(value.chunk_size, 8 * kMiB);
    EXPECT_EQ(value.batch_thread_count, 4u);
    EXPECT_EQ(value.concurrent_thread_count, 8u);
    EXPECT_EQ(value.remote_path, "/");
    EXPECT_EQ(value.poll_interval_ms, 500u);
    EXPECT_EQ(value.max_poll_attempts, 0u);
    EXPECT_FALSE(value.async_finish);
    EXPECT_EQ(value.log_level, spdlog::level::info);
}

TEST(UploadConfigTest, ParsesEverySection) {
    auto config = parse_config(R"({
        "paths":   { "local_path": "/data/outgoing", "remote_path": "/Uploads" },
        "limits":  { "chunk_size": 16777216, "batch_thread_count": 2, "concurrent_thread_count": 6 },
        "finish":  { "poll_interval_ms": 250, "max_poll_attempts": 40 },
        "store":   { "root": "/srv/remote", "async_finish": true, "async_polls": 3 },
        "logging": { "level": "debug" }
    })");
    ASSERT_TRUE(config.is_ok()) << config.error();

    const auto& value = config.value();
    EXPECT_EQ(value.local_path, fs::path("/data/outgoing"));
    EXPECT_EQ(value.remote_path, "/Uploads");
    EXPECT_EQ(value.chunk_size, 16 * kMiB);
    EXPECT_EQ(value.batch_thread_count, 2u);
    EXPECT_EQ(value.concurrent_thread_count, 6u);
    EXPECT_EQ(value.log_level, spdlog::level::debug);

    auto options = value.coordinator_options();
    EXPECT_EQ(options.chunk_size, 16 * kMiB);
    EXPECT_EQ(options.remote_folder, "/Uploads");
    EXPECT_EQ(options.poll_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(options.max_poll_attempts, 40u);

    auto store = value.store_options();
    EXPECT_EQ(store.root, fs::path("/srv/remote"));
    EXPECT_TRUE(store.async_finish);
    EXPECT_EQ(store.async_polls, 3u);
}

TEST(UploadConfigTest, RejectsMalformedInput) {
    EXPECT_EQ(parse_config("{ not json").error().code, pbu::ErrorCode::ConfigError);
    EXPECT_TRUE(parse_config("[1, 2]").is_error());
    EXPECT_TRUE(parse_config(R"({"limits": 5})").is_error());
    EXPECT_TRUE(parse_config(R"({"limits": {"chunk_size": -4}})").is_error());
    EXPECT_TRUE(parse_config(R"({"limits": {"chunk_size": "8MB"}})").is_error());
    EXPECT_TRUE(parse_config(R"({"paths": {"remote_path": 7}})").is_error());
    EXPECT_TRUE(parse_config(R"({"store": {"async_finish": "yes"}})").is_error());
    EXPECT_TRUE(parse_config(R"({"logging": {"level": "chatty"}})").is_error());
}

TEST(UploadConfigTest, LogLevels) {
    EXPECT_EQ(parse_log_level("warn").value(), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("off").value(), spdlog::level::off);
    EXPECT_TRUE(parse_log_level("loud").is_error());
}

TEST(UploadConfigTest, ExpandsHomeDirectory) {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(expand_home("~/upload"), fs::path(std::string(home) + "/upload"));
    EXPECT_EQ(expand_home("/abs/path"), fs::path("/abs/path"));
}

TEST(UploadConfigTest, LoadsFromFile) {
    const auto dir = pbu::testing::create_temp_dir("pbu_config_");
    const auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << R"({"limits": {"chunk_size": 4194304}})";
    }

    auto config = load_config(path);
    ASSERT_TRUE(config.is_ok()) << config.error();
    EXPECT_EQ(config.value().chunk_size, 4 * kMiB);

    auto missing = load_config(dir / "absent.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, pbu::ErrorCode::ConfigError);
    fs::remove_all(dir);
}
