#include "rpl/network/resource_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace rpl::network {

NetworkResourceManager::NetworkResourceManager(NetworkMapper& mapper,
                                               MappingLedger& ledger,
                                               const core::NetworkConfig& config)
    : mapper_(mapper),
      ledger_(ledger),
      max_conflicts_(config.max_letter_attempts) {
    for (char c : config.letters) {
        letters_.emplace_back(c);
    }
}

Result<MappingRecord> NetworkResourceManager::mount(const std::string& unc_path,
                                                    const credentials::Credential* credential) {
    std::optional<UncPath> target;
    try {
        target.emplace(unc_path);
    } catch (const std::invalid_argument& e) {
        return Err<MappingRecord>(ErrorKind::InvalidArgument, e.what());
    }

    std::uint32_t conflicts = 0;
    for (const auto letter : letters_) {
        {
            std::lock_guard lock(mutex_);
            for (const auto& held : held_) {
                if (UncPath(held.remote_root).same_root(*target)) {
                    spdlog::debug("[Network] Reusing {}: for {}", held.letter.str(), held.remote_root);
                    return Ok(held);
                }
            }
            const bool taken = reserved_.count(letter) > 0 ||
                std::any_of(held_.begin(), held_.end(),
                            [letter](const MappingRecord& r) { return r.letter == letter; });
            if (taken) {
                continue;
            }
            reserved_.insert(letter);
        }

        auto unreserve = [this, letter]() {
            std::lock_guard lock(mutex_);
            reserved_.erase(letter);
        };

        if (mapper_.is_letter_in_use(letter)) {
            unreserve();
            continue;
        }

        auto mapped = mapper_.map(letter, *target, credential);
        if (mapped.is_error()) {
            unreserve();
            if (mapped.error().kind == ErrorKind::Conflict) {
                spdlog::warn("[Network] Letter {} taken concurrently: {}", letter.str(), mapped.error().message);
                if (++conflicts >= max_conflicts_) {
                    return Err<MappingRecord>(ErrorKind::ResourceAcquisition,
                        "Gave up mapping " + target->root() + " after " + std::to_string(conflicts) + " letter conflicts");
                }
                continue;
            }
            return Err<MappingRecord>(ErrorKind::ResourceAcquisition, mapped.error().message);
        }

        MappingRecord record{letter};
        record.remote_root = target->root();
        record.original_path = target->str();
        record.mapped_path = mapped.value();
        record.created_at = std::chrono::system_clock::now();

        auto stored = ledger_.append(record);
        if (stored.is_error()) {
            auto undone = mapper_.unmap(letter);
            if (undone.is_error()) {
                spdlog::error("[Network] Untracked mapping {}: could not be removed: {}",
                              letter.str(), undone.error().message);
            }
            unreserve();
            return Err<MappingRecord>(ErrorKind::ResourceAcquisition,
                "Mapping ledger write failed: " + stored.error().message);
        }

        {
            std::lock_guard lock(mutex_);
            reserved_.erase(letter);
            held_.push_back(record);
        }
        spdlog::info("[Network] Mapped {} to {}: ({})", record.remote_root, letter.str(), record.mapped_path);
        return Ok(std::move(record));
    }

    return Err<MappingRecord>(ErrorKind::ResourceAcquisition, "No free drive letter for " + target->root());
}

Result<void> NetworkResourceManager::unmount(const MappingRecord& record) {
    bool is_held = false;
    {
        std::lock_guard lock(mutex_);
        is_held = std::any_of(held_.begin(), held_.end(),
                              [&record](const MappingRecord& r) { return r.letter == record.letter; });
    }
    if (!is_held && !ledger_.find(record.key())) {
        return Ok();
    }

    auto undone = mapper_.unmap(record.letter);
    if (undone.is_error()) {
        return undone;
    }

    auto erased = ledger_.remove(record.key());
    if (erased.is_error()) {
        return Err<void>(erased.error());
    }

    {
        std::lock_guard lock(mutex_);
        held_.erase(std::remove_if(held_.begin(), held_.end(),
                                   [&record](const MappingRecord& r) { return r.letter == record.letter; }),
                    held_.end());
    }
    spdlog::info("[Network] Unmapped {}: ({})", record.letter.str(), record.remote_root);
    return Ok();
}

core::ReconcileReport NetworkResourceManager::reconcile_orphans() {
    core::ReconcileReport report;
    for (const auto& record : ledger_.list()) {
        ++report.found;
        auto undone = mapper_.unmap(record.letter);
        if (undone.is_ok()) {
            auto erased = ledger_.remove(record.key());
            if (erased.is_ok()) {
                ++report.released;
                continue;
            }
            undone = Err<void>(erased.error());
        }
        ++report.failed;
        spdlog::warn("[Network] Orphan mapping {}: still held: {}", record.letter.str(), undone.error().message);
    }
    if (report.found > 0) {
        spdlog::info("[Network] Reconciled {} orphan mapping(s): {} released, {} kept",
                     report.found, report.released, report.failed);
    }
    return report;
}

std::string NetworkResourceManager::remap(const MappingRecord& record, const std::string& path) {
    if (!UncPath::looks_like_unc(path)) {
        return path;
    }
    try {
        UncPath unc(path);
        if (!unc.same_root(UncPath(record.remote_root))) {
            return path;
        }
        const auto rest = unc.remainder_posix();
        return rest.empty() ? record.mapped_path : record.mapped_path + "/" + rest;
    } catch (const std::invalid_argument&) {
        return path;
    }
}

std::string NetworkResourceManager::remap(const std::string& path) const {
    std::lock_guard lock(mutex_);
    for (const auto& record : held_) {
        auto mapped = remap(record, path);
        if (mapped != path) {
            return mapped;
        }
    }
    return path;
}

std::vector<MappingRecord> NetworkResourceManager::active() const {
    std::lock_guard lock(mutex_);
    return held_;
}

} // namespace rpl::network
