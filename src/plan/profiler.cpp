#include "rpl/plan/profiler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace rpl::plan {

namespace fs = std::filesystem;

const char* to_string(ChunkStatus status) noexcept {
    switch (status) {
        case ChunkStatus::Pending:   return "pending";
        case ChunkStatus::Running:   return "running";
        case ChunkStatus::Succeeded: return "succeeded";
        case ChunkStatus::Failed:    return "failed";
        case ChunkStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

DirectoryProfiler::DirectoryProfiler(fs::path root)
    : root_(std::move(root)) {}

Result<DirectoryProfiler> DirectoryProfiler::open(const fs::path& root) {
    std::error_code ec;
    const auto status = fs::symlink_status(root, ec);
    if (ec || !fs::exists(status)) {
        return Err<DirectoryProfiler>(ErrorKind::Profiling, "Source does not exist: " + root.string());
    }
    if (!fs::is_directory(status)) {
        return Err<DirectoryProfiler>(ErrorKind::Profiling, "Source is not a directory: " + root.string());
    }

    DirectoryProfiler profiler(root);
    auto frame = profiler.make_frame(root, "", 0);
    if (frame.stats.unreadable) {
        return Err<DirectoryProfiler>(ErrorKind::Profiling, "Source is not readable: " + root.string());
    }
    profiler.stack_.push_back(std::move(frame));
    return Ok(std::move(profiler));
}

DirectoryProfiler::Frame DirectoryProfiler::make_frame(const fs::path& path,
                                                       std::string relative_path,
                                                       std::uint32_t depth) {
    Frame frame;
    frame.stats.path = path.string();
    frame.stats.relative_path = std::move(relative_path);
    frame.stats.depth = depth;

    std::error_code ec;
    fs::directory_iterator it(path, fs::directory_options::none, ec);
    if (ec) {
        spdlog::warn("[Profiler] Cannot read {}: {}", frame.stats.path, ec.message());
        frame.stats.unreadable = true;
        ++unreadable_count_;
        return frame;
    }

    fs::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        const auto status = it->symlink_status(entry_ec);
        if (entry_ec || fs::is_symlink(status)) {
            continue;
        }
        if (fs::is_directory(status)) {
            frame.subdirectories.push_back(it->path());
        } else if (fs::is_regular_file(status)) {
            const auto size = it->file_size(entry_ec);
            frame.stats.own_bytes += entry_ec ? 0 : size;
            ++frame.stats.own_files;
        }
    }
    if (ec) {
        // Partial listing: keep what was counted, flag the directory
        spdlog::warn("[Profiler] Listing of {} ended early: {}", frame.stats.path, ec.message());
        frame.stats.unreadable = true;
        ++unreadable_count_;
    }

    // Reverse order so pop_back() yields ascending names
    std::sort(frame.subdirectories.begin(), frame.subdirectories.end(),
              [](const fs::path& lhs, const fs::path& rhs) {
                  return lhs.filename().string() > rhs.filename().string();
              });
    frame.stats.child_count = static_cast<std::uint32_t>(frame.subdirectories.size());
    return frame;
}

std::optional<DirectoryStats> DirectoryProfiler::next() {
    while (!stack_.empty()) {
        if (!stack_.back().subdirectories.empty()) {
            auto child = std::move(stack_.back().subdirectories.back());
            stack_.back().subdirectories.pop_back();

            const auto& parent = stack_.back().stats;
            auto name = child.filename().string();
            auto relative = parent.relative_path.empty() ? name : parent.relative_path + "/" + name;
            auto frame = make_frame(child, std::move(relative), parent.depth + 1);
            stack_.push_back(std::move(frame));
            continue;
        }

        DirectoryStats stats = std::move(stack_.back().stats);
        stack_.pop_back();
        stats.total_bytes += stats.own_bytes;
        stats.total_files += stats.own_files;

        if (!stack_.empty()) {
            auto& parent = stack_.back().stats;
            parent.total_bytes += stats.total_bytes;
            parent.total_files += stats.total_files;
        }
        return stats;
    }
    return std::nullopt;
}

} // namespace rpl::plan
