#pragma once

/**
 * @file orchestrator.hpp
 * @brief Drives one profile through a complete replication run
 *
 * WHAT IT DOES:
 * Idle -> Profiling -> Chunking -> Acquiring -> Copying -> Completed
 *
 * - Profiling: walk the source (a UNC source is mapped first) and feed the
 *   planner
 * - Chunking: finish the plan; a dry run ends here
 * - Acquiring: map a UNC destination, then take the snapshot if the profile
 *   asks for one. Anything acquired is released before Failed
 * - Copying: hand the plan to the JobManager, resuming from a checkpoint
 *   taken with the same plan parameters
 *
 * STOP:
 * stop() may be called from any thread while the run is not terminal. The
 * coordinator then performs, in order and regardless of individual
 * failures: terminate workers, remove the snapshot junction, release the
 * snapshot, unmap the drives, clear the credential. A normal finish runs
 * the same sequence without the first step.
 *
 * EXAMPLE:
 * Orchestrator orchestrator(config, *config.find_profile("engineering"), deps);
 * std::thread runner([&] { summary = orchestrator.run({}); });
 * ...
 * orchestrator.stop();
 * runner.join();
 */

#include "rpl/checkpoint/checkpoint_store.hpp"
#include "rpl/core/config.hpp"
#include "rpl/credentials/credential.hpp"
#include "rpl/events/event_bus.hpp"
#include "rpl/jobs/job_manager.hpp"
#include "rpl/network/resource_manager.hpp"
#include "rpl/orchestrator/run_phase.hpp"
#include "rpl/orchestrator/run_state.hpp"
#include "rpl/plan/chunk_planner.hpp"
#include "rpl/snapshot/manager.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace rpl::orchestrator {

struct Dependencies {
    snapshot::SnapshotManager& snapshots;
    network::NetworkResourceManager& network;
    jobs::WorkerLauncher& launcher;
    checkpoint::CheckpointStore& checkpoints;
    events::EventBus& bus;
};

struct RunOptions {
    bool dry_run = false;
    std::optional<credentials::Credential> credential;
};

struct RunSummary {
    RunPhase phase = RunPhase::Idle;
    std::string failure_reason;
    std::size_t chunks_total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t resumed = 0;
    std::uint64_t bytes = 0;
    std::uint64_t files = 0;
    std::chrono::milliseconds duration{0};
    bool has_warnings = false;
};

class Orchestrator {
public:
    Orchestrator(const core::EngineConfig& config, core::ProfileConfig profile, Dependencies deps);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Runs once; later calls return the summary of the current phase
    RunSummary run(RunOptions options);

    /**
     * @brief Request an orderly stop
     *
     * RETURNS: false if the run is already terminal or stopping.
     * If run() has not started, the stop sequence runs on the caller.
     */
    bool stop();

    [[nodiscard]] RunPhase phase() const;
    [[nodiscard]] const core::ProfileConfig& profile() const noexcept { return profile_; }

    /// Live run state; tests and the runner inspect it
    [[nodiscard]] RunState& state() noexcept { return state_; }

    /// The plan, valid once Chunking has finished; coordinator thread only
    [[nodiscard]] const std::vector<plan::Chunk>& chunks() const noexcept { return chunks_; }

private:
    bool transition(RunPhase to);
    bool stopping() const noexcept { return stop_requested_.load(); }

    Result<void> profile_source();
    Result<void> acquire_resources();
    Result<void> track_mapping(const std::string& unc_path);
    std::string remap(const std::string& path) const;

    void release_resources();
    void stop_sequence();

    RunSummary fail(const Error& error);
    RunSummary finish_stopped();
    RunSummary summarize() const;

    core::ProfileConfig profile_;
    Dependencies deps_;
    plan::PlanParameters params_;

    jobs::JobManager jobs_;
    RunState state_;

    std::vector<plan::Chunk> chunks_;
    std::optional<plan::ChunkPlanner> planner_;
    jobs::CopyReport report_;
    std::size_t unreadable_ = 0;
    std::chrono::steady_clock::time_point started_at_{};

    std::atomic<bool> started_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace rpl::orchestrator
