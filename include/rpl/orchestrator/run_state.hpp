#pragma once

#include "rpl/core/identifiers.hpp"
#include "rpl/credentials/credential.hpp"
#include "rpl/jobs/failure_policy.hpp"
#include "rpl/jobs/worker.hpp"
#include "rpl/network/record.hpp"
#include "rpl/orchestrator/run_phase.hpp"
#include "rpl/snapshot/record.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rpl::orchestrator {

/**
 * @brief Everything one run holds, owned by its Orchestrator
 *
 * THREAD SAFETY:
 * Every field is guarded by mutex. The job manager and the health monitor
 * copy handles out under the lock and work on the copies.
 */
struct RunState {
    mutable std::mutex mutex;

    RunPhase phase = RunPhase::Idle;
    std::unordered_map<ChunkId, std::shared_ptr<jobs::WorkerHandle>> active_jobs;
    std::optional<snapshot::SnapshotRecord> current_snapshot;
    std::vector<network::MappingRecord> current_mappings;
    std::optional<credentials::Credential> credential;
    std::map<std::string, jobs::CircuitCounter> breakers;
    std::string failure_reason;

    [[nodiscard]] std::size_t active_count() const {
        std::lock_guard lock(mutex);
        return active_jobs.size();
    }

    /// Snapshot of the active handles
    [[nodiscard]] std::vector<std::shared_ptr<jobs::WorkerHandle>> handles() const {
        std::lock_guard lock(mutex);
        std::vector<std::shared_ptr<jobs::WorkerHandle>> out;
        out.reserve(active_jobs.size());
        for (const auto& [id, handle] : active_jobs) {
            out.push_back(handle);
        }
        return out;
    }
};

} // namespace rpl::orchestrator
