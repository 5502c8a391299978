#include "rpl/checkpoint/checkpoint_store.hpp"
#include "rpl/core/atomic_file.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <system_error>

namespace rpl::checkpoint {

namespace fs = std::filesystem;
using json = nlohmann::json;

CheckpointStore::CheckpointStore(fs::path directory)
    : directory_(std::move(directory)) {}

fs::path CheckpointStore::path_for(const std::string& profile) const {
    std::string safe;
    for (char c : profile) {
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
        safe.push_back(ok ? c : '_');
    }
    if (safe.empty() || safe == "." || safe == "..") {
        safe = "_" + safe;
    }
    return directory_ / (safe + ".checkpoint.json");
}

Result<void> CheckpointStore::save(const Checkpoint& checkpoint) {
    json document = {
        {"version", checkpoint.version},
        {"profile", checkpoint.profile},
        {"completed", checkpoint.completed_chunk_ids},
        {"plan", {
            {"max_bytes", checkpoint.parameters.max_bytes},
            {"max_files", checkpoint.parameters.max_files},
            {"max_depth", checkpoint.parameters.max_depth}
        }},
        {"phase", checkpoint.phase},
        {"saved_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                         checkpoint.saved_at.time_since_epoch()).count()}
    };
    return core::write_file_atomic(path_for(checkpoint.profile), document.dump(2));
}

std::optional<Checkpoint> CheckpointStore::load(const std::string& profile) const {
    const auto file = path_for(profile);
    auto contents = core::read_file(file);
    if (contents.is_error()) {
        spdlog::warn("[Checkpoint] {} unreadable, starting fresh: {}", file.string(), contents.error().message);
        return std::nullopt;
    }
    if (!contents.value()) {
        return std::nullopt;
    }

    auto document = json::parse(*contents.value(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        spdlog::warn("[Checkpoint] {} is malformed, starting fresh", file.string());
        return std::nullopt;
    }

    try {
        Checkpoint checkpoint;
        checkpoint.version = document.at("version").get<int>();
        if (checkpoint.version != kCheckpointVersion) {
            spdlog::warn("[Checkpoint] {} has unsupported version {}, starting fresh",
                         file.string(), checkpoint.version);
            return std::nullopt;
        }
        checkpoint.profile = document.at("profile").get<std::string>();
        checkpoint.completed_chunk_ids = document.at("completed").get<std::set<std::string>>();
        const auto& plan = document.at("plan");
        checkpoint.parameters.max_bytes = plan.at("max_bytes").get<std::uint64_t>();
        checkpoint.parameters.max_files = plan.at("max_files").get<std::uint64_t>();
        checkpoint.parameters.max_depth = plan.at("max_depth").get<std::uint32_t>();
        checkpoint.phase = document.value("phase", "");
        checkpoint.saved_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(document.value("saved_at", std::int64_t{0})));
        return checkpoint;
    } catch (const json::exception& e) {
        spdlog::warn("[Checkpoint] {} is malformed ({}), starting fresh", file.string(), e.what());
        return std::nullopt;
    }
}

Result<void> CheckpointStore::remove(const std::string& profile) {
    std::error_code ec;
    fs::remove(path_for(profile), ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Cannot remove checkpoint for '" + profile + "': " + ec.message());
    }
    return Ok();
}

} // namespace rpl::checkpoint
