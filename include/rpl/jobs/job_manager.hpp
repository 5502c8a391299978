#pragma once

/**
 * @file job_manager.hpp
 * @brief Bounded-concurrency dispatch of copy chunks to workers
 *
 * WHAT IT DOES:
 * - Runs at most `concurrency` workers; a freed slot goes to the next
 *   eligible Pending chunk in plan order
 * - Skips chunks already recorded in the checkpoint (counted as resumed)
 *   and saves the checkpoint after every success
 * - Hands every failure to the FailurePolicy: retry after a delay, give
 *   up, or open the scope circuit and skip the scope's Pending chunks
 * - Publishes a progress event for every chunk transition
 *
 * THREADS:
 * run() is the coordinator: it alone mutates chunks. A single io thread,
 * owned by the JobManager for its whole lifetime, reads worker output and
 * drives the health monitor; it reports outcomes through a queue the
 * coordinator drains.
 *
 * EXAMPLE:
 * JobManager jobs(settings, config.copy_tool, launcher, bus);
 * CopyOptions options;
 * options.remap = [&](const std::string& p) { return network.remap(p); };
 * auto report = jobs.run(chunks, options, state, stop_flag);
 */

#include "rpl/checkpoint/checkpoint_store.hpp"
#include "rpl/core/config.hpp"
#include "rpl/events/event_bus.hpp"
#include "rpl/events/event_queue.hpp"
#include "rpl/jobs/failure_policy.hpp"
#include "rpl/jobs/health_monitor.hpp"
#include "rpl/jobs/worker.hpp"
#include "rpl/orchestrator/run_state.hpp"
#include "rpl/plan/types.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rpl::jobs {

struct JobSettings {
    std::uint32_t concurrency = 4;
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds retry_delay{5000};
    std::uint32_t circuit_threshold = 5;
    std::chrono::milliseconds circuit_window{std::chrono::minutes(10)};
    HealthSettings health;
    std::chrono::milliseconds intake_poll{200};

    static JobSettings from_config(const core::EngineConfig& config);
};

struct CopyOptions {
    /// Rewrites chunk paths through the active snapshot and mappings
    std::function<std::string(const std::string&)> remap;
    checkpoint::CheckpointStore* checkpoints = nullptr;
    /// Base checkpoint; completed ids in it are not dispatched again
    std::optional<checkpoint::Checkpoint> checkpoint;
    std::vector<std::string> probe_paths;
};

struct CopyReport {
    bool cancelled = false;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t resumed = 0;
    std::uint64_t bytes = 0;
    std::uint64_t files = 0;
    bool warnings = false;
};

class JobManager {
public:
    JobManager(JobSettings settings,
               core::CopyToolConfig tool,
               WorkerLauncher& launcher,
               events::EventBus& bus);

    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    /**
     * @brief Copy every chunk to a terminal status, or until stop is set
     *
     * Chunks are updated in place. On stop, no new chunk is dispatched and
     * run() returns with cancelled = true; running workers are left for
     * terminate_all().
     */
    CopyReport run(std::vector<plan::Chunk>& chunks,
                   CopyOptions options,
                   orchestrator::RunState& state,
                   const std::atomic<bool>& stop);

    /**
     * @brief Terminate every active worker
     *
     * All workers share one grace and one kill deadline (see
     * stop_workers()). Always leaves state with zero active workers.
     * Returns an error when at least one termination failed; the rest are
     * still attempted.
     */
    Result<void> terminate_all(orchestrator::RunState& state);

    [[nodiscard]] const JobSettings& settings() const noexcept { return settings_; }

private:
    struct RunContext;

    void dispatch_ready(RunContext& ctx);
    void dispatch(RunContext& ctx, plan::Chunk& chunk);
    void handle_outcome(RunContext& ctx, const WorkerOutcome& outcome);
    void on_success(RunContext& ctx, plan::Chunk& chunk, int exit_code);
    void on_failure(RunContext& ctx, plan::Chunk& chunk, const std::string& reason, int exit_code);

    JobSettings settings_;
    core::CopyToolConfig tool_;
    WorkerLauncher& launcher_;
    events::EventBus& bus_;
    FailurePolicy policy_;

    events::ThreadSafeQueue<WorkerOutcome> intake_;

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread io_thread_;
};

} // namespace rpl::jobs
