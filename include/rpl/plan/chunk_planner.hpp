#pragma once

/**
 * @file chunk_planner.hpp
 * @brief Partitions a profiled tree into bounded copy chunks
 *
 * WHAT IT DOES:
 * Consumes DirectoryStats in post-order and decides, per directory, whether
 * its whole subtree becomes one recursive chunk or whether it is split into
 * its children's chunks plus a files-only chunk for its own files.
 *
 * RULES:
 * - Subtree fits both max_bytes and max_files: one recursive chunk
 * - Directory at max_depth (when set): one recursive chunk regardless,
 *   flagged oversized when over a threshold
 * - Otherwise: children's chunks, plus a files-only chunk when the directory
 *   has own files. Own files are never split, so a files-only chunk over a
 *   threshold is flagged oversized.
 *
 * The result is sorted largest-first (bytes desc, files desc, relative path
 * asc). Chunk ids hash relative path, mode and parameters, so a replanned
 * identical tree yields identical ids.
 *
 * MEMORY:
 * Only candidates for directories on the current walk path are buffered;
 * a directory's subtree candidates collapse into a single chunk as soon as
 * the directory itself fits.
 *
 * EXAMPLE:
 * ChunkPlanner planner(params, "/srv/projects", "/backup/projects", "projects");
 * auto chunks = planner.plan(profiler);
 */

#include "rpl/core/result.hpp"
#include "rpl/plan/profiler.hpp"
#include "rpl/plan/types.hpp"

#include <string>
#include <vector>

namespace rpl::plan {

class ChunkPlanner {
public:
    ChunkPlanner(PlanParameters params,
                 std::string source_root,
                 std::string destination_root,
                 std::string scope);

    /// Feed one directory; must be called in post-order
    void add(const DirectoryStats& stats);

    /// Sorted chunk list; the planner is reset afterwards
    std::vector<Chunk> finish();

    /// Drain a stats source and return the plan
    std::vector<Chunk> plan(StatsSource& source);

    [[nodiscard]] const PlanParameters& parameters() const noexcept { return params_; }

    /// Deterministic id for (relative path, mode, parameters)
    static ChunkId make_id(const std::string& relative_path, bool recursive, const PlanParameters& params);

private:
    Chunk make_chunk(const DirectoryStats& stats, bool recursive) const;
    bool fits(std::uint64_t bytes, std::uint64_t files) const noexcept;

    PlanParameters params_;
    std::string source_root_;
    std::string destination_root_;
    std::string scope_;

    // pending_[d] holds the candidates of already-finished directories at
    // depth d whose parent has not been emitted yet
    std::vector<std::vector<Chunk>> pending_;
};

/// Sum of estimated bytes and files over a plan
struct PlanTotals {
    std::uint64_t bytes = 0;
    std::uint64_t files = 0;
    std::size_t chunks = 0;
    std::size_t oversized = 0;
};

PlanTotals summarize(const std::vector<Chunk>& chunks);

/// Join a root with a '/' separated relative path; "" yields the root
std::string join_path(const std::string& root, const std::string& relative);

} // namespace rpl::plan
