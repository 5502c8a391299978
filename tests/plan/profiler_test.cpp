#include <gtest/gtest.h>
#include "rpl/plan/profiler.hpp"
#include "support/temp_dir.hpp"

#include <filesystem>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace rpl;

namespace {

std::vector<plan::DirectoryStats> walk(plan::DirectoryProfiler& profiler) {
    std::vector<plan::DirectoryStats> out;
    while (auto stats = profiler.next()) {
        out.push_back(*stats);
    }
    return out;
}

} // namespace

TEST(DirectoryProfiler, PostOrderWithSubtreeTotals) {
    test::TempDir dir;
    test::write_bytes(dir / "a.txt", 10);
    test::write_bytes(dir / "x/b.bin", 20);
    test::write_bytes(dir / "x/y/c.bin", 30);
    test::write_bytes(dir / "x/y/d.bin", 5);
    fs::create_directories(dir / "z");

    auto profiler = plan::DirectoryProfiler::open(dir.path());
    ASSERT_TRUE(profiler.is_ok());
    auto stats = walk(profiler.value());

    ASSERT_EQ(stats.size(), 4u);
    EXPECT_EQ(stats[0].relative_path, "x/y");
    EXPECT_EQ(stats[1].relative_path, "x");
    EXPECT_EQ(stats[2].relative_path, "z");
    EXPECT_EQ(stats[3].relative_path, "");

    EXPECT_EQ(stats[0].own_files, 2u);
    EXPECT_EQ(stats[0].total_bytes, 35u);
    EXPECT_EQ(stats[0].depth, 2u);

    EXPECT_EQ(stats[1].own_bytes, 20u);
    EXPECT_EQ(stats[1].total_bytes, 55u);
    EXPECT_EQ(stats[1].total_files, 3u);
    EXPECT_EQ(stats[1].child_count, 1u);

    EXPECT_EQ(stats[2].total_files, 0u);

    EXPECT_EQ(stats[3].own_bytes, 10u);
    EXPECT_EQ(stats[3].total_bytes, 65u);
    EXPECT_EQ(stats[3].total_files, 4u);
    EXPECT_EQ(stats[3].child_count, 2u);
    EXPECT_EQ(stats[3].depth, 0u);
    EXPECT_EQ(profiler.value().unreadable_count(), 0u);
}

TEST(DirectoryProfiler, SymlinksAreNotFollowed) {
    test::TempDir dir;
    test::write_bytes(dir / "real/file.bin", 100);
    fs::create_directory_symlink(dir / "real", dir / "link");
    fs::create_symlink(dir / "real/file.bin", dir / "file-link");

    auto profiler = plan::DirectoryProfiler::open(dir.path());
    ASSERT_TRUE(profiler.is_ok());
    auto stats = walk(profiler.value());

    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats.back().total_bytes, 100u);
    EXPECT_EQ(stats.back().total_files, 1u);
}

TEST(DirectoryProfiler, MissingRootIsProfilingError) {
    test::TempDir dir;

    auto missing = plan::DirectoryProfiler::open(dir / "absent");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::Profiling);

    test::write_bytes(dir / "file.txt", 1);
    auto not_dir = plan::DirectoryProfiler::open(dir / "file.txt");
    ASSERT_TRUE(not_dir.is_error());
    EXPECT_EQ(not_dir.error().kind, ErrorKind::Profiling);
}

TEST(DirectoryProfiler, UnreadableSubdirectoryIsFlagged) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits do not apply to root";
    }
    test::TempDir dir;
    test::write_bytes(dir / "open/a.bin", 10);
    test::write_bytes(dir / "locked/b.bin", 10);
    ::chmod((dir / "locked").c_str(), 0);

    auto profiler = plan::DirectoryProfiler::open(dir.path());
    ASSERT_TRUE(profiler.is_ok());
    auto stats = walk(profiler.value());
    ::chmod((dir / "locked").c_str(), 0755);

    ASSERT_EQ(stats.size(), 3u);
    EXPECT_EQ(stats[0].relative_path, "locked");
    EXPECT_TRUE(stats[0].unreadable);
    EXPECT_EQ(stats[2].total_bytes, 10u);
    EXPECT_EQ(profiler.value().unreadable_count(), 1u);
}
