#pragma once

/**
 * @file checkpoint_store.hpp
 * @brief Durable record of which chunks of a profile already completed
 *
 * One JSON file per profile: "<dir>/<profile>.checkpoint.json". Writes go
 * through write_file_atomic(), so a crash leaves either the previous or the
 * new checkpoint on disk. A malformed file loads as "no checkpoint".
 *
 * FILE FORMAT:
 * {
 *   "version": 1,
 *   "profile": "projects",
 *   "completed": ["3f2a...", "..."],
 *   "plan": { "max_bytes": 1073741824, "max_files": 5000, "max_depth": 0 },
 *   "phase": "Copying",
 *   "saved_at": 1760000000000
 * }
 */

#include "rpl/core/result.hpp"
#include "rpl/plan/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace rpl::checkpoint {

inline constexpr int kCheckpointVersion = 1;

struct Checkpoint {
    std::string profile;
    std::set<std::string> completed_chunk_ids;
    plan::PlanParameters parameters;
    std::string phase;
    std::chrono::system_clock::time_point saved_at{};
    int version = kCheckpointVersion;
};

class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path directory);

    Result<void> save(const Checkpoint& checkpoint);

    std::optional<Checkpoint> load(const std::string& profile) const;

    Result<void> remove(const std::string& profile);

    /// Profile name with characters outside [A-Za-z0-9._-] replaced by '_'
    [[nodiscard]] std::filesystem::path path_for(const std::string& profile) const;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
};

} // namespace rpl::checkpoint
