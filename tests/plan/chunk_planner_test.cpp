#include <gtest/gtest.h>
#include "rpl/plan/chunk_planner.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace rpl;
using namespace rpl::plan;

namespace {

/// Post-order stats built from (relative path -> own bytes, own files)
class TreeSource : public StatsSource {
public:
    struct Node {
        std::uint64_t bytes;
        std::uint64_t files;
    };

    explicit TreeSource(std::map<std::string, Node> nodes) : nodes_(std::move(nodes)) {
        build("", 0);
    }

    std::optional<DirectoryStats> next() override {
        if (cursor_ >= order_.size()) {
            return std::nullopt;
        }
        return order_[cursor_++];
    }

private:
    DirectoryStats build(const std::string& rel, std::uint32_t depth) {
        DirectoryStats stats;
        stats.relative_path = rel;
        stats.path = "/src" + (rel.empty() ? std::string() : "/" + rel);
        stats.depth = depth;
        stats.own_bytes = nodes_.at(rel).bytes;
        stats.own_files = nodes_.at(rel).files;
        stats.total_bytes = stats.own_bytes;
        stats.total_files = stats.own_files;

        for (const auto& [path, node] : nodes_) {
            if (path.empty() || parent_of(path) != rel) {
                continue;
            }
            auto child = build(path, depth + 1);
            stats.total_bytes += child.total_bytes;
            stats.total_files += child.total_files;
            ++stats.child_count;
        }
        order_.push_back(stats);
        return stats;
    }

    static std::string parent_of(const std::string& path) {
        const auto slash = path.rfind('/');
        return slash == std::string::npos ? std::string() : path.substr(0, slash);
    }

    std::map<std::string, Node> nodes_;
    std::vector<DirectoryStats> order_;
    std::size_t cursor_ = 0;
};

std::vector<Chunk> plan_tree(const std::map<std::string, TreeSource::Node>& nodes, PlanParameters params) {
    TreeSource source(nodes);
    ChunkPlanner planner(params, "/src", "/dst", "profile");
    return planner.plan(source);
}

/// Directories a chunk covers, for partition checks
std::set<std::string> covered(const Chunk& chunk, const std::map<std::string, TreeSource::Node>& nodes) {
    std::set<std::string> out;
    for (const auto& [path, node] : nodes) {
        if (path == chunk.relative_path) {
            out.insert(path);
        } else if (chunk.recursive &&
                   (chunk.relative_path.empty() || path.rfind(chunk.relative_path + "/", 0) == 0)) {
            out.insert(path);
        }
    }
    return out;
}

const std::map<std::string, TreeSource::Node> kTree = {
    {"", {100, 2}},
    {"a", {400, 10}},
    {"a/a1", {300, 5}},
    {"a/a2", {900, 40}},
    {"b", {50, 1}},
    {"c", {0, 0}},
    {"c/c1", {600, 20}},
    {"c/c1/deep", {700, 30}},
};

} // namespace

TEST(ChunkPlanner, WholeTreeFitsInOneChunk) {
    auto chunks = plan_tree(kTree, {1000000, 1000000, 0});

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_TRUE(chunks[0].recursive);
    EXPECT_EQ(chunks[0].relative_path, "");
    EXPECT_EQ(chunks[0].source_path, "/src");
    EXPECT_EQ(chunks[0].destination_path, "/dst");
    EXPECT_EQ(chunks[0].estimated_bytes, 3050u);
    EXPECT_EQ(chunks[0].scope, "profile");
    EXPECT_EQ(chunks[0].status, ChunkStatus::Pending);
}

TEST(ChunkPlanner, ChunksPartitionTheTree) {
    auto chunks = plan_tree(kTree, {1000, 50, 0});

    std::map<std::string, int> seen;
    for (const auto& chunk : chunks) {
        for (const auto& path : covered(chunk, kTree)) {
            seen[path]++;
        }
    }
    for (const auto& [path, node] : kTree) {
        if (node.files == 0 && path == "c") {
            // Split directory with no own files needs no files-only chunk
            EXPECT_LE(seen[path], 1) << path;
            continue;
        }
        EXPECT_EQ(seen[path], 1) << "directory '" << path << "'";
    }

    const auto totals = summarize(chunks);
    EXPECT_EQ(totals.bytes, 3050u);
    EXPECT_EQ(totals.files, 108u);
}

TEST(ChunkPlanner, OnlyIrreducibleChunksExceedThresholds) {
    const PlanParameters params{1000, 50, 0};
    auto chunks = plan_tree(kTree, params);

    for (const auto& chunk : chunks) {
        const bool over = chunk.estimated_bytes > params.max_bytes || chunk.estimated_files > params.max_files;
        EXPECT_EQ(over, chunk.oversized) << chunk.relative_path;
        if (over) {
            EXPECT_FALSE(chunk.recursive) << chunk.relative_path;
        }
    }
}

TEST(ChunkPlanner, SplitsOversizedDirectoryIntoChildrenAndOwnFiles) {
    auto chunks = plan_tree(kTree, {1000, 50, 0});

    std::map<std::string, const Chunk*> by_key;
    for (const auto& chunk : chunks) {
        by_key[chunk.relative_path + (chunk.recursive ? "|R" : "|F")] = &chunk;
    }

    EXPECT_TRUE(by_key.count("|F"));      // root's own files
    EXPECT_TRUE(by_key.count("a/a1|R"));
    EXPECT_TRUE(by_key.count("a/a2|R"));
    EXPECT_TRUE(by_key.count("a|F"));
    EXPECT_TRUE(by_key.count("b|R"));
    EXPECT_TRUE(by_key.count("c/c1/deep|R"));
    EXPECT_TRUE(by_key.count("c/c1|F"));
    EXPECT_FALSE(by_key.count("c|F"));
}

TEST(ChunkPlanner, DepthLimitForcesRecursiveChunks) {
    auto chunks = plan_tree(kTree, {100, 5, 1});

    for (const auto& chunk : chunks) {
        if (chunk.recursive) {
            EXPECT_LE(std::count(chunk.relative_path.begin(), chunk.relative_path.end(), '/'), 0)
                << chunk.relative_path;
        }
    }
    auto c = std::find_if(chunks.begin(), chunks.end(),
                          [](const Chunk& ch) { return ch.relative_path == "c" && ch.recursive; });
    ASSERT_NE(c, chunks.end());
    EXPECT_TRUE(c->oversized);
    EXPECT_EQ(c->estimated_bytes, 1300u);
}

TEST(ChunkPlanner, SortedLargestFirst) {
    auto chunks = plan_tree(kTree, {1000, 50, 0});

    for (std::size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_GE(chunks[i - 1].estimated_bytes, chunks[i].estimated_bytes);
    }
}

TEST(ChunkPlanner, DeterministicIds) {
    const PlanParameters params{1000, 50, 0};
    auto first = plan_tree(kTree, params);
    auto second = plan_tree(kTree, params);

    ASSERT_EQ(first.size(), second.size());
    std::set<std::string> unique;
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].id, second[i].id);
        unique.insert(first[i].id.str());
    }
    EXPECT_EQ(unique.size(), first.size());

    EXPECT_NE(ChunkPlanner::make_id("a", true, params), ChunkPlanner::make_id("a", false, params));
    EXPECT_NE(ChunkPlanner::make_id("a", true, params),
              ChunkPlanner::make_id("a", true, PlanParameters{2000, 50, 0}));
}

TEST(ChunkPlanner, TenGigabyteScenario) {
    // 10 GB / 50,000 files: root with 10 departments of 10 projects each.
    // Each project holds 80 MB and 490 files directly; one project is a
    // single flat 1.5 GB directory. The root holds the remainder.
    constexpr std::uint64_t MB = 1024 * 1024;
    std::map<std::string, TreeSource::Node> nodes;
    nodes[""] = {0, 0};
    std::uint64_t total_bytes = 0;
    std::uint64_t total_files = 0;
    for (int d = 0; d < 10; ++d) {
        const auto dept = "dept" + std::to_string(d);
        nodes[dept] = {0, 0};
        for (int p = 0; p < 10; ++p) {
            const auto project = dept + "/proj" + std::to_string(p);
            TreeSource::Node node{80 * MB, 490};
            if (d == 0 && p == 0) {
                node = {1536 * MB, 490};
            }
            nodes[project] = node;
            total_bytes += node.bytes;
            total_files += node.files;
        }
    }
    const std::uint64_t ten_gb = 10ULL * 1024 * MB;
    ASSERT_LE(total_bytes, ten_gb);
    nodes[""] = {ten_gb - total_bytes, 50000 - total_files};

    const PlanParameters params{1024 * MB, 5000, 0};
    auto chunks = plan_tree(nodes, params);

    std::size_t oversized = 0;
    for (const auto& chunk : chunks) {
        if (chunk.oversized) {
            ++oversized;
            EXPECT_EQ(chunk.relative_path, "dept0/proj0");
        } else {
            EXPECT_LE(chunk.estimated_bytes, params.max_bytes);
            EXPECT_LE(chunk.estimated_files, params.max_files);
        }
    }
    EXPECT_LE(oversized, 1u);

    const auto totals = summarize(chunks);
    EXPECT_EQ(totals.bytes, ten_gb);
    EXPECT_EQ(totals.files, 50000u);
}

TEST(ChunkPlanner, UnreadableDirectoryKeepsAZeroSizeChunk) {
    class ListSource : public StatsSource {
    public:
        explicit ListSource(std::vector<DirectoryStats> stats) : stats_(std::move(stats)) {}

        std::optional<DirectoryStats> next() override {
            if (cursor_ >= stats_.size()) {
                return std::nullopt;
            }
            return stats_[cursor_++];
        }

    private:
        std::vector<DirectoryStats> stats_;
        std::size_t cursor_ = 0;
    };

    DirectoryStats locked;
    locked.relative_path = "locked";
    locked.path = "/src/locked";
    locked.depth = 1;
    locked.unreadable = true;

    DirectoryStats big;
    big.relative_path = "big";
    big.path = "/src/big";
    big.depth = 1;
    big.own_bytes = big.total_bytes = 2000;
    big.own_files = big.total_files = 1;

    DirectoryStats root;
    root.path = "/src";
    root.total_bytes = 2000;
    root.total_files = 1;
    root.child_count = 2;

    ListSource source({locked, big, root});
    ChunkPlanner planner({1500, 100, 0}, "/src", "/dst", "profile");
    const auto chunks = planner.plan(source);

    auto it = std::find_if(chunks.begin(), chunks.end(),
                           [](const Chunk& c) { return c.relative_path == "locked"; });
    ASSERT_NE(it, chunks.end());
    EXPECT_TRUE(it->recursive);
    EXPECT_EQ(it->estimated_bytes, 0u);
    EXPECT_EQ(it->estimated_files, 0u);
    EXPECT_EQ(it->source_path, "/src/locked");
}
