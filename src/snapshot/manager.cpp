#include "rpl/snapshot/manager.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <sys/stat.h>

namespace rpl::snapshot {

namespace fs = std::filesystem;

namespace {

bool is_under(const std::string& path, const std::string& root) {
    if (path.size() < root.size() || path.compare(0, root.size(), root) != 0) {
        return false;
    }
    if (path.size() == root.size() || root.empty()) {
        return true;
    }
    const char next = path[root.size()];
    return next == '/' || root.back() == '/';
}

} // namespace

Result<std::string> find_mount_point(const fs::path& path) {
    std::error_code ec;
    auto current = fs::weakly_canonical(path, ec);
    if (ec) {
        return Err<std::string>(ErrorKind::ResourceAcquisition,
            "Cannot resolve " + path.string() + ": " + ec.message());
    }

    struct stat st {};
    if (::stat(current.c_str(), &st) != 0) {
        return Err<std::string>(ErrorKind::ResourceAcquisition,
            "Cannot stat " + current.string() + ": " + std::strerror(errno));
    }
    const auto device = st.st_dev;

    while (current.has_parent_path() && current.parent_path() != current) {
        struct stat parent {};
        if (::stat(current.parent_path().c_str(), &parent) != 0 || parent.st_dev != device) {
            break;
        }
        current = current.parent_path();
    }
    return Ok(current.string());
}

SnapshotManager::SnapshotManager(SnapshotProvider& provider, SnapshotLedger& ledger)
    : provider_(provider), ledger_(ledger) {}

Result<SnapshotRecord> SnapshotManager::acquire(const std::string& source_path) {
    if (UncPath::looks_like_unc(source_path)) {
        try {
            return acquire_remote(UncPath(source_path));
        } catch (const std::invalid_argument& e) {
            return Err<SnapshotRecord>(ErrorKind::InvalidArgument, e.what());
        }
    }
    return acquire_local(source_path);
}

Result<SnapshotRecord> SnapshotManager::acquire_local(const std::string& source_path) {
    auto volume = find_mount_point(source_path);
    if (volume.is_error()) {
        return Err<SnapshotRecord>(volume.error());
    }

    SnapshotRecord record{ShadowId::generate()};
    record.source_volume = volume.value();
    record.is_remote = false;

    auto created = provider_.create_snapshot({false, "", record.source_volume}, record.shadow_id);
    if (created.is_error()) {
        return Err<SnapshotRecord>(created.error());
    }
    record.snapshot_path = created.value();
    record.created_at = std::chrono::system_clock::now();
    record.original_root = record.source_volume;
    record.access_root = record.snapshot_path;

    auto stored = ledger_.append(record);
    if (stored.is_error()) {
        destroy_unrecorded(record);
        return Err<SnapshotRecord>(ErrorKind::ResourceAcquisition,
            "Snapshot ledger write failed: " + stored.error().message);
    }

    spdlog::info("[Snapshot] {} of {} at {}", record.shadow_id.str(), record.source_volume, record.snapshot_path);
    return Ok(std::move(record));
}

Result<SnapshotRecord> SnapshotManager::acquire_remote(const UncPath& source) {
    auto volume = provider_.remote_volume(source);
    if (volume.is_error()) {
        return Err<SnapshotRecord>(volume.error());
    }

    SnapshotRecord record{ShadowId::generate()};
    record.source_volume = volume.value();
    record.is_remote = true;
    record.server = source.server();

    auto created = provider_.create_snapshot({true, record.server, record.source_volume}, record.shadow_id);
    if (created.is_error()) {
        return Err<SnapshotRecord>(created.error());
    }
    record.snapshot_path = created.value();
    record.created_at = std::chrono::system_clock::now();
    record.original_root = source.root();
    record.access_root = source.root();

    auto stored = ledger_.append(record);
    if (stored.is_error()) {
        destroy_unrecorded(record);
        return Err<SnapshotRecord>(ErrorKind::ResourceAcquisition,
            "Snapshot ledger write failed: " + stored.error().message);
    }

    // The snapshot is tracked from here on; a junction failure releases it
    auto junction = provider_.create_junction(record);
    if (junction.is_error()) {
        auto released = release(record);
        if (released.is_error()) {
            spdlog::error("[Snapshot] Cleanup of {} failed: {}", record.shadow_id.str(), released.error().message);
        }
        return Err<SnapshotRecord>(junction.error());
    }
    record.junction_path = junction.value();
    record.access_root = source.root() + "\\" + fs::path(*record.junction_path).filename().string();

    auto updated = ledger_.append(record);
    if (updated.is_error()) {
        auto released = release(record);
        if (released.is_error()) {
            spdlog::error("[Snapshot] Cleanup of {} failed: {}", record.shadow_id.str(), released.error().message);
        }
        return Err<SnapshotRecord>(ErrorKind::ResourceAcquisition,
            "Snapshot ledger write failed: " + updated.error().message);
    }

    spdlog::info("[Snapshot] {} of {} on {} exposed at {}",
                 record.shadow_id.str(), record.source_volume, record.server, record.access_root);
    return Ok(std::move(record));
}

void SnapshotManager::destroy_unrecorded(const SnapshotRecord& record) {
    auto removed = provider_.delete_snapshot(record);
    if (removed.is_error()) {
        spdlog::error("[Snapshot] Untracked snapshot {} could not be removed: {}",
                      record.snapshot_path, removed.error().message);
    }
}

Result<void> SnapshotManager::release(const SnapshotRecord& record) {
    auto held = ledger_.find(record.key());
    if (!held) {
        return Ok();
    }

    if (held->junction_path) {
        auto junction = provider_.delete_junction(*held);
        if (junction.is_error()) {
            return Err<void>(junction.error());
        }
    }

    auto removed = provider_.delete_snapshot(*held);
    if (removed.is_error()) {
        return Err<void>(removed.error());
    }

    auto erased = ledger_.remove(held->key());
    if (erased.is_error()) {
        return Err<void>(erased.error());
    }
    spdlog::info("[Snapshot] Released {}", held->shadow_id.str());
    return Ok();
}

Result<SnapshotRecord> SnapshotManager::release_junction(const SnapshotRecord& record) {
    auto held = ledger_.find(record.key());
    if (!held || !held->junction_path) {
        SnapshotRecord updated = held ? *held : record;
        updated.junction_path.reset();
        return Ok(std::move(updated));
    }

    auto junction = provider_.delete_junction(*held);
    if (junction.is_error()) {
        return Err<SnapshotRecord>(junction.error());
    }

    SnapshotRecord updated = *held;
    updated.junction_path.reset();
    auto stored = ledger_.append(updated);
    if (stored.is_error()) {
        return Err<SnapshotRecord>(stored.error());
    }
    return Ok(std::move(updated));
}

core::ReconcileReport SnapshotManager::reconcile_orphans() {
    core::ReconcileReport report;
    for (const auto& record : ledger_.list()) {
        ++report.found;
        auto released = release(record);
        if (released.is_ok()) {
            ++report.released;
        } else {
            ++report.failed;
            spdlog::warn("[Snapshot] Orphan {} still held: {}", record.shadow_id.str(), released.error().message);
        }
    }
    if (report.found > 0) {
        spdlog::info("[Snapshot] Reconciled {} orphan(s): {} released, {} kept",
                     report.found, report.released, report.failed);
    }
    return report;
}

std::string SnapshotManager::remap(const SnapshotRecord& record, const std::string& path) {
    if (record.is_remote) {
        if (!UncPath::looks_like_unc(path)) {
            return path;
        }
        try {
            UncPath unc(path);
            if (!unc.same_root(UncPath(record.original_root))) {
                return path;
            }
            return unc.remainder().empty() ? record.access_root
                                           : record.access_root + "\\" + unc.remainder();
        } catch (const std::invalid_argument&) {
            return path;
        }
    }

    if (!is_under(path, record.original_root)) {
        return path;
    }
    auto rest = path.substr(record.original_root.size());
    if (!rest.empty() && rest.front() != '/') {
        rest.insert(rest.begin(), '/');
    }
    if (rest == "/") {
        rest.clear();
    }
    return record.access_root + rest;
}

} // namespace rpl::snapshot
