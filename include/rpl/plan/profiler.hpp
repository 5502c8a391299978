#pragma once

#include "rpl/core/result.hpp"
#include "rpl/plan/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rpl::plan {

/**
 * @brief Pull-based sequence of directory statistics
 */
class StatsSource {
public:
    virtual ~StatsSource() = default;

    /// Next directory in post-order, nullopt when the walk is finished
    virtual std::optional<DirectoryStats> next() = 0;
};

/**
 * @brief Lazily walks a tree and emits per-directory statistics
 *
 * WALK ORDER:
 * Depth-first post-order with children sorted by name, so a directory is
 * emitted after all of its descendants and its totals are final. Only the
 * frames on the current path are held in memory.
 *
 * ERRORS:
 * A subdirectory that cannot be listed is emitted with unreadable = true and
 * zero weight, and the walk continues. Symbolic links are never followed
 * and are not counted.
 *
 * EXAMPLE:
 * auto profiler = DirectoryProfiler::open("/srv/projects");
 * while (auto stats = profiler.value().next()) { ... }
 */
class DirectoryProfiler : public StatsSource {
public:
    /// Fails with Profiling when the root is missing or not a readable directory
    static Result<DirectoryProfiler> open(const std::filesystem::path& root);

    std::optional<DirectoryStats> next() override;

    [[nodiscard]] std::size_t unreadable_count() const noexcept { return unreadable_count_; }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    struct Frame {
        DirectoryStats stats;
        std::vector<std::filesystem::path> subdirectories; // sorted, consumed from the back
    };

    explicit DirectoryProfiler(std::filesystem::path root);

    Frame make_frame(const std::filesystem::path& path, std::string relative_path, std::uint32_t depth);

    std::filesystem::path root_;
    std::vector<Frame> stack_;
    std::size_t unreadable_count_ = 0;
};

} // namespace rpl::plan
