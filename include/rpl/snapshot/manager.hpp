#pragma once

/**
 * @file manager.hpp
 * @brief Snapshot lifecycle with crash-recoverable tracking
 *
 * WHAT IT DOES:
 * - acquire(): snapshot the volume (local) or share (remote) containing a
 *   source path, persist the record, and for remote shares expose the
 *   snapshot through a junction inside the share
 * - release(): junction first, then the snapshot, then the ledger entry
 * - reconcile_orphans(): release everything a previous process left behind
 *
 * LEDGER RULES:
 * A record is appended before acquire() returns. If that append fails the
 * fresh snapshot is destroyed again. The ledger entry is removed only after
 * the OS objects are gone, so a failed release stays tracked for the next
 * sweep.
 *
 * THREAD SAFETY:
 * Operations may be called from different threads; the ledger serializes
 * file access. Releasing the same record concurrently is not supported.
 *
 * EXAMPLE:
 * SnapshotManager snapshots(provider, ledger);
 * auto record = snapshots.acquire("//fs01/projects/engineering");
 * auto path = SnapshotManager::remap(record.value(), "//fs01/projects/engineering/a");
 * snapshots.release(record.value());
 */

#include "rpl/core/ledger.hpp"
#include "rpl/core/result.hpp"
#include "rpl/snapshot/provider.hpp"
#include "rpl/snapshot/record.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace rpl::snapshot {

using SnapshotLedger = core::Ledger<SnapshotRecord>;

class SnapshotManager {
public:
    SnapshotManager(SnapshotProvider& provider, SnapshotLedger& ledger);

    /// source_path may be a local path or a UNC path
    Result<SnapshotRecord> acquire(const std::string& source_path);

    /// Idempotent; unknown records are a no-op
    Result<void> release(const SnapshotRecord& record);

    /// Remove only the junction; returns the updated record
    Result<SnapshotRecord> release_junction(const SnapshotRecord& record);

    core::ReconcileReport reconcile_orphans();

    /// Translate a path under record.original_root into the snapshot
    static std::string remap(const SnapshotRecord& record, const std::string& path);

    [[nodiscard]] std::vector<SnapshotRecord> tracked() const { return ledger_.list(); }

private:
    Result<SnapshotRecord> acquire_local(const std::string& source_path);
    Result<SnapshotRecord> acquire_remote(const UncPath& source);
    void destroy_unrecorded(const SnapshotRecord& record);

    SnapshotProvider& provider_;
    SnapshotLedger& ledger_;
};

/**
 * @brief Mount point of the filesystem containing path
 *
 * Walks up the canonical path while the device id stays the same.
 */
Result<std::string> find_mount_point(const std::filesystem::path& path);

} // namespace rpl::snapshot
