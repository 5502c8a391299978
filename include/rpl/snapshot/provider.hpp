#pragma once

#include "rpl/core/config.hpp"
#include "rpl/core/identifiers.hpp"
#include "rpl/core/result.hpp"
#include "rpl/process/command_runner.hpp"
#include "rpl/snapshot/record.hpp"

#include <string>

namespace rpl::snapshot {

struct SnapshotTarget {
    bool remote = false;
    std::string server;   ///< Remote only
    std::string volume;   ///< Volume path on the owning host
};

/**
 * @brief OS-level snapshot operations
 *
 * All deletions are idempotent: a snapshot or junction that no longer
 * exists is reported as success.
 */
class SnapshotProvider {
public:
    virtual ~SnapshotProvider() = default;

    /// Share root path on the file server backing a UNC share
    virtual Result<std::string> remote_volume(const UncPath& share) = 0;

    /// Create a snapshot of target.volume; returns the snapshot path
    virtual Result<std::string> create_snapshot(const SnapshotTarget& target, const ShadowId& id) = 0;

    virtual Result<void> delete_snapshot(const SnapshotRecord& record) = 0;

    /// Link inside the share pointing at the snapshot; returns the link path
    virtual Result<std::string> create_junction(const SnapshotRecord& record) = 0;

    virtual Result<void> delete_junction(const SnapshotRecord& record) = 0;
};

/**
 * @brief Provider driven by configured command templates
 *
 * Local commands run directly; remote commands are prefixed with
 * remote.exec_prefix (ssh by default). Placeholders: {volume},
 * {snapshot_path}, {junction_path}, {server}, {shadow_id}.
 */
class CommandSnapshotProvider : public SnapshotProvider {
public:
    CommandSnapshotProvider(core::SnapshotConfig config, process::CommandRunner& runner);

    Result<std::string> remote_volume(const UncPath& share) override;
    Result<std::string> create_snapshot(const SnapshotTarget& target, const ShadowId& id) override;
    Result<void> delete_snapshot(const SnapshotRecord& record) override;
    Result<std::string> create_junction(const SnapshotRecord& record) override;
    Result<void> delete_junction(const SnapshotRecord& record) override;

    /// ".rpl-snapshot-<first 8 hex digits>"
    static std::string junction_name(const ShadowId& id);

private:
    Result<process::CommandResult> execute(const core::CommandTemplate& tmpl,
                                           bool remote,
                                           std::map<std::string, std::string> vars);

    core::SnapshotConfig config_;
    process::CommandRunner& runner_;
};

} // namespace rpl::snapshot
