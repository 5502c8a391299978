#pragma once

#include "rpl/core/identifiers.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace rpl::plan {

/**
 * @brief Statistics for one directory, produced by the profiler
 *
 * own_* counts the directory's direct files only; total_* covers the whole
 * subtree rooted here.
 */
struct DirectoryStats {
    std::string path;           ///< Absolute path as walked
    std::string relative_path;  ///< Relative to the profiled root, '/' separated, "" for the root
    std::uint64_t own_bytes = 0;
    std::uint64_t own_files = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t total_files = 0;
    std::uint32_t depth = 0;    ///< 0 for the root
    std::uint32_t child_count = 0;
    bool unreadable = false;    ///< Listed as zero-weight because it could not be read
};

struct PlanParameters {
    std::uint64_t max_bytes = 0;
    std::uint64_t max_files = 0;
    std::uint32_t max_depth = 0; ///< 0 = unlimited

    friend bool operator==(const PlanParameters& lhs, const PlanParameters& rhs) noexcept {
        return lhs.max_bytes == rhs.max_bytes &&
               lhs.max_files == rhs.max_files &&
               lhs.max_depth == rhs.max_depth;
    }
    friend bool operator!=(const PlanParameters& lhs, const PlanParameters& rhs) noexcept {
        return !(lhs == rhs);
    }
};

enum class ChunkStatus {
    Pending,
    Running,
    Succeeded,
    Failed,
    Skipped
};

const char* to_string(ChunkStatus status) noexcept;

inline bool is_terminal(ChunkStatus status) noexcept {
    return status == ChunkStatus::Succeeded ||
           status == ChunkStatus::Failed ||
           status == ChunkStatus::Skipped;
}

/**
 * @brief One unit of copy work
 *
 * A recursive chunk copies the whole subtree at relative_path. A files-only
 * chunk copies just that directory's own files; its subdirectories are
 * covered by other chunks.
 */
struct Chunk {
    ChunkId id;
    std::string relative_path;
    std::string source_path;
    std::string destination_path;
    bool recursive = true;
    bool oversized = false;
    std::uint64_t estimated_bytes = 0;
    std::uint64_t estimated_files = 0;
    std::string scope;

    ChunkStatus status = ChunkStatus::Pending;
    std::uint32_t attempts = 0;
    std::string last_error;
    std::chrono::steady_clock::time_point not_before{};
};

} // namespace rpl::plan
