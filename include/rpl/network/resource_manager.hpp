#pragma once

/**
 * @file resource_manager.hpp
 * @brief Drive-letter mappings with crash-recoverable tracking
 *
 * WHAT IT DOES:
 * - mount(): pick a free letter (Z down to D), map the share root, persist
 *   the record, return it. A share root already mapped by this manager is
 *   reused.
 * - unmount(): undo the mapping and drop the ledger entry. Idempotent.
 * - reconcile_orphans(): unmap everything a previous process left behind
 * - remap(): rewrite UNC paths onto the mapped local directory
 *
 * LETTER SELECTION:
 * Letters held by this manager or reported in use by the mapper are
 * skipped. A Conflict from the mapper (letter taken between the check and
 * the mapping) moves on to the next letter, up to max_letter_attempts
 * conflicts. The internal lock is never held across mapper calls; a letter
 * being tried is reserved so concurrent mounts pick different letters.
 *
 * EXAMPLE:
 * NetworkResourceManager network(mapper, ledger, config.network);
 * auto mapping = network.mount("//fs01/projects/engineering", &credential);
 * auto local = network.remap("//fs01/projects/engineering/a"); // /mnt/rpl/Z/engineering/a
 * network.unmount(mapping.value());
 */

#include "rpl/core/config.hpp"
#include "rpl/core/ledger.hpp"
#include "rpl/core/result.hpp"
#include "rpl/credentials/credential.hpp"
#include "rpl/network/mapper.hpp"
#include "rpl/network/record.hpp"

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace rpl::network {

using MappingLedger = core::Ledger<MappingRecord>;

class NetworkResourceManager {
public:
    NetworkResourceManager(NetworkMapper& mapper, MappingLedger& ledger, const core::NetworkConfig& config);

    Result<MappingRecord> mount(const std::string& unc_path, const credentials::Credential* credential);

    Result<void> unmount(const MappingRecord& record);

    core::ReconcileReport reconcile_orphans();

    /// Rewrite through whichever held mapping covers path; others unchanged
    std::string remap(const std::string& path) const;

    static std::string remap(const MappingRecord& record, const std::string& path);

    std::vector<MappingRecord> active() const;

private:
    NetworkMapper& mapper_;
    MappingLedger& ledger_;
    std::vector<DriveLetter> letters_;
    std::uint32_t max_conflicts_;

    mutable std::mutex mutex_;
    std::vector<MappingRecord> held_;
    std::set<DriveLetter> reserved_;
};

} // namespace rpl::network
