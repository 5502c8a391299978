#include "rpl/plan/chunk_planner.hpp"
#include "rpl/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rpl::plan {

std::string join_path(const std::string& root, const std::string& relative) {
    if (relative.empty()) {
        return root;
    }
    if (root.empty()) {
        return relative;
    }
    const char last = root.back();
    if (last == '/' || last == '\\') {
        return root + relative;
    }
    return root + "/" + relative;
}

ChunkPlanner::ChunkPlanner(PlanParameters params,
                           std::string source_root,
                           std::string destination_root,
                           std::string scope)
    : params_(params),
      source_root_(std::move(source_root)),
      destination_root_(std::move(destination_root)),
      scope_(std::move(scope)) {}

ChunkId ChunkPlanner::make_id(const std::string& relative_path, bool recursive, const PlanParameters& params) {
    auto hash = core::fnv1a_64(relative_path);
    hash = core::fnv1a_64(std::string_view("\0", 1), hash);
    hash = core::fnv1a_64(recursive ? "R" : "F", hash);
    hash = core::fnv1a_64(std::to_string(params.max_bytes) + ":" +
                          std::to_string(params.max_files) + ":" +
                          std::to_string(params.max_depth), hash);
    return ChunkId::from_hash(hash);
}

bool ChunkPlanner::fits(std::uint64_t bytes, std::uint64_t files) const noexcept {
    return bytes <= params_.max_bytes && files <= params_.max_files;
}

Chunk ChunkPlanner::make_chunk(const DirectoryStats& stats, bool recursive) const {
    Chunk chunk;
    chunk.relative_path = stats.relative_path;
    chunk.recursive = recursive;
    chunk.id = make_id(stats.relative_path, recursive, params_);
    chunk.source_path = join_path(source_root_, stats.relative_path);
    chunk.destination_path = join_path(destination_root_, stats.relative_path);
    chunk.estimated_bytes = recursive ? stats.total_bytes : stats.own_bytes;
    chunk.estimated_files = recursive ? stats.total_files : stats.own_files;
    chunk.oversized = !fits(chunk.estimated_bytes, chunk.estimated_files);
    chunk.scope = scope_;
    return chunk;
}

void ChunkPlanner::add(const DirectoryStats& stats) {
    const std::size_t depth = stats.depth;
    if (pending_.size() < depth + 2) {
        pending_.resize(depth + 2);
    }

    // Everything buffered one level down belongs to this directory
    std::vector<Chunk> children = std::move(pending_[depth + 1]);
    pending_[depth + 1].clear();

    const bool at_depth_limit = params_.max_depth > 0 && stats.depth >= params_.max_depth;
    auto& out = pending_[depth];

    if (at_depth_limit || fits(stats.total_bytes, stats.total_files)) {
        auto chunk = make_chunk(stats, true);
        if (chunk.oversized) {
            spdlog::warn("[Planner] '{}' exceeds thresholds at depth limit ({} bytes, {} files)",
                         stats.relative_path, stats.total_bytes, stats.total_files);
        }
        out.push_back(std::move(chunk));
        return;
    }

    for (auto& child : children) {
        out.push_back(std::move(child));
    }
    if (stats.own_files > 0) {
        auto chunk = make_chunk(stats, false);
        if (chunk.oversized) {
            spdlog::warn("[Planner] Own files of '{}' cannot be split ({} bytes, {} files)",
                         stats.relative_path, stats.own_bytes, stats.own_files);
        }
        out.push_back(std::move(chunk));
    }
}

std::vector<Chunk> ChunkPlanner::finish() {
    std::vector<Chunk> chunks;
    for (auto& level : pending_) {
        for (auto& chunk : level) {
            chunks.push_back(std::move(chunk));
        }
    }
    pending_.clear();

    std::sort(chunks.begin(), chunks.end(), [](const Chunk& lhs, const Chunk& rhs) {
        if (lhs.estimated_bytes != rhs.estimated_bytes) {
            return lhs.estimated_bytes > rhs.estimated_bytes;
        }
        if (lhs.estimated_files != rhs.estimated_files) {
            return lhs.estimated_files > rhs.estimated_files;
        }
        if (lhs.relative_path != rhs.relative_path) {
            return lhs.relative_path < rhs.relative_path;
        }
        return lhs.recursive && !rhs.recursive;
    });
    return chunks;
}

std::vector<Chunk> ChunkPlanner::plan(StatsSource& source) {
    while (auto stats = source.next()) {
        add(*stats);
    }
    auto chunks = finish();
    const auto totals = summarize(chunks);
    spdlog::info("[Planner] {} chunks, {} bytes, {} files ({} oversized)",
                 totals.chunks, totals.bytes, totals.files, totals.oversized);
    return chunks;
}

PlanTotals summarize(const std::vector<Chunk>& chunks) {
    PlanTotals totals;
    for (const auto& chunk : chunks) {
        totals.bytes += chunk.estimated_bytes;
        totals.files += chunk.estimated_files;
        ++totals.chunks;
        if (chunk.oversized) {
            ++totals.oversized;
        }
    }
    return totals;
}

} // namespace rpl::plan
