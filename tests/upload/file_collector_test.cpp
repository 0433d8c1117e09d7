#include "pbu/upload/file_collector.hpp"

#include "support/test_files.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace pbu::upload;
namespace fs = std::filesystem;

TEST(FileCollectorTest, CollectsSortedRegularFiles) {
    const auto dir = pbu::testing::create_temp_dir("pbu_collect_");
    pbu::testing::write_source(dir, "b.txt", 20);
    pbu::testing::write_source(dir, "a.txt", 10);
    pbu::testing::write_source(dir, ".DS_Store", 5);
    pbu::testing::write_source(dir, ".gitignore", 5);
    fs::create_directories(dir / "nested");
    pbu::testing::write_source(dir / "nested", "c.txt", 5);

    auto files = collect_files(dir);
    ASSERT_TRUE(files.is_ok()) << files.error();
    ASSERT_EQ(files.value().size(), 2u);
    EXPECT_EQ(files.value()[0].destination_name, "a.txt");
    EXPECT_EQ(files.value()[0].size, 10u);
    EXPECT_EQ(files.value()[1].destination_name, "b.txt");
    EXPECT_EQ(files.value()[1].path, dir / "b.txt");
    fs::remove_all(dir);
}

TEST(FileCollectorTest, SkipsDanglingSymlinks) {
    const auto dir = pbu::testing::create_temp_dir("pbu_collect_");
    pbu::testing::write_source(dir, "a.bin", 16);
    fs::create_symlink(dir / "gone.bin", dir / "z_stale.bin");
    fs::create_symlink(dir / "gone.bin", dir / "0_stale.bin");

    auto files = collect_files(dir);
    ASSERT_TRUE(files.is_ok()) << files.error();
    ASSERT_EQ(files.value().size(), 1u);
    EXPECT_EQ(files.value()[0].destination_name, "a.bin");
    EXPECT_EQ(files.value()[0].size, 16u);
    fs::remove_all(dir);
}

TEST(FileCollectorTest, FolderWithOnlyDanglingSymlinkIsEmpty) {
    const auto dir = pbu::testing::create_temp_dir("pbu_collect_");
    fs::create_symlink(dir / "gone.bin", dir / "stale.bin");

    auto files = collect_files(dir);
    ASSERT_TRUE(files.is_ok()) << files.error();
    EXPECT_TRUE(files.value().empty());
    fs::remove_all(dir);
}

TEST(FileCollectorTest, MissingFolderIsNotFound) {
    auto files = collect_files("/nonexistent/pbu/folder");
    ASSERT_TRUE(files.is_error());
    EXPECT_EQ(files.error().code, pbu::ErrorCode::NotFound);
}

TEST(FileCollectorTest, IgnoredNames) {
    EXPECT_TRUE(is_ignored_file(".DS_Store"));
    EXPECT_TRUE(is_ignored_file(".localized"));
    EXPECT_TRUE(is_ignored_file(".gitignore"));
    EXPECT_FALSE(is_ignored_file(".bashrc"));
}

TEST(FileCollectorTest, SplitsIntoBatchesOfAtMostMaxSize) {
    std::vector<SourceFile> files(2 * kMaxBatchSize + 1);
    for (std::size_t i = 0; i < files.size(); ++i) {
        files[i].destination_name = std::to_string(i);
    }

    auto batches = split_into_batches(files);
    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(batches[0].size(), kMaxBatchSize);
    EXPECT_EQ(batches[1].size(), kMaxBatchSize);
    ASSERT_EQ(batches[2].size(), 1u);
    EXPECT_EQ(batches[2][0].destination_name, std::to_string(2 * kMaxBatchSize));

    EXPECT_TRUE(split_into_batches({}).empty());
    EXPECT_EQ(split_into_batches(files, 700).size(), 3u);
}
