#pragma once

#include "rpl/core/identifiers.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace rpl::snapshot {

/**
 * @brief One held point-in-time snapshot, as persisted in the snapshot ledger
 *
 * original_root/access_root drive path remapping: a path under
 * original_root is read through access_root while the snapshot is held.
 * Local: volume mount point -> snapshot directory.
 * Remote: \\server\share -> \\server\share\<junction name>.
 */
struct SnapshotRecord {
    ShadowId shadow_id;
    std::string source_volume;   ///< Volume path on the host that owns it
    std::string snapshot_path;   ///< Snapshot location on that host
    std::chrono::system_clock::time_point created_at{};
    bool is_remote = false;
    std::string server;          ///< Remote only
    std::optional<std::string> junction_path; ///< Remote only, host-side link path
    std::string original_root;
    std::string access_root;

    [[nodiscard]] std::string key() const { return shadow_id.str(); }

    nlohmann::json to_json() const;
    static SnapshotRecord from_json(const nlohmann::json& j);
};

} // namespace rpl::snapshot
