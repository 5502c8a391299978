#include "rpl/jobs/job_manager.hpp"
#include "rpl/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace rpl::jobs {

namespace {

std::size_t count_remaining(const std::vector<plan::Chunk>& chunks) {
    return static_cast<std::size_t>(std::count_if(chunks.begin(), chunks.end(),
        [](const plan::Chunk& c) { return !plan::is_terminal(c.status); }));
}

orchestrator::RunPhase current_phase(orchestrator::RunState& state) {
    std::lock_guard lock(state.mutex);
    return state.phase;
}

} // namespace

JobSettings JobSettings::from_config(const core::EngineConfig& config) {
    JobSettings settings;
    settings.concurrency = config.concurrency;
    settings.max_attempts = config.retry.max_attempts;
    settings.retry_delay = config.retry.delay;
    settings.circuit_threshold = config.circuit_breaker.threshold;
    settings.circuit_window = config.circuit_breaker.window;
    settings.health.poll_interval = config.health.poll_interval;
    settings.health.stall_timeout = config.health.stall_timeout;
    settings.health.terminate_grace = config.health.terminate_grace;
    settings.health.kill_timeout = config.health.kill_timeout;
    settings.health.probe_every_ticks = config.health.probe_every_ticks;
    return settings;
}

struct JobManager::RunContext {
    std::vector<plan::Chunk>& chunks;
    CopyOptions& options;
    orchestrator::RunState& state;
    std::unordered_map<ChunkId, std::size_t> index;
    CopyReport report;
};

JobManager::JobManager(JobSettings settings,
                       core::CopyToolConfig tool,
                       WorkerLauncher& launcher,
                       events::EventBus& bus)
    : settings_(settings),
      tool_(std::move(tool)),
      launcher_(launcher),
      bus_(bus),
      policy_(settings.max_attempts, settings.circuit_threshold, settings.circuit_window),
      work_(boost::asio::make_work_guard(io_)) {
    io_thread_ = std::thread([this]() { io_.run(); });
}

JobManager::~JobManager() {
    work_.reset();
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

// ──────────────────────────────────────────────────────────
// Coordinator loop
// ──────────────────────────────────────────────────────────

CopyReport JobManager::run(std::vector<plan::Chunk>& chunks,
                           CopyOptions options,
                           orchestrator::RunState& state,
                           const std::atomic<bool>& stop) {
    // Leftovers from a previous run belong to handles that no longer exist
    intake_.drain();

    RunContext ctx{chunks, options, state, {}, {}};
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        ctx.index.emplace(chunks[i].id, i);
    }

    if (options.checkpoint) {
        for (auto& chunk : chunks) {
            if (chunk.status == plan::ChunkStatus::Pending &&
                options.checkpoint->completed_chunk_ids.count(chunk.id.str()) > 0) {
                chunk.status = plan::ChunkStatus::Succeeded;
                ++ctx.report.resumed;
            }
        }
        if (ctx.report.resumed > 0) {
            spdlog::info("[Jobs] Resuming: {} chunk(s) already copied", ctx.report.resumed);
        }
    }

    HealthMonitor monitor(io_, state, settings_.health,
        [this](WorkerOutcome outcome) { intake_.push(std::move(outcome)); },
        bus_);
    monitor.set_probe_paths(options.probe_paths);
    monitor.start();

    while (true) {
        if (stop.load()) {
            ctx.report.cancelled = true;
            break;
        }

        dispatch_ready(ctx);

        const bool all_terminal = std::all_of(chunks.begin(), chunks.end(),
            [](const plan::Chunk& c) { return plan::is_terminal(c.status); });
        if (all_terminal && state.active_count() == 0) {
            break;
        }

        auto outcome = intake_.pop_for(settings_.intake_poll);
        if (!outcome) {
            continue;
        }
        handle_outcome(ctx, *outcome);
        for (auto& more : intake_.drain()) {
            handle_outcome(ctx, more);
        }
    }

    monitor.stop();

    for (const auto& chunk : chunks) {
        switch (chunk.status) {
            case plan::ChunkStatus::Succeeded: ++ctx.report.succeeded; break;
            case plan::ChunkStatus::Failed:    ++ctx.report.failed; break;
            case plan::ChunkStatus::Skipped:   ++ctx.report.skipped; break;
            default: break;
        }
    }
    spdlog::info("[Jobs] Copy {}: {} succeeded ({} resumed), {} failed, {} skipped",
                 ctx.report.cancelled ? "cancelled" : "finished",
                 ctx.report.succeeded, ctx.report.resumed, ctx.report.failed, ctx.report.skipped);
    return ctx.report;
}

void JobManager::dispatch_ready(RunContext& ctx) {
    const auto now = std::chrono::steady_clock::now();
    for (auto& chunk : ctx.chunks) {
        if (ctx.state.active_count() >= settings_.concurrency) {
            return;
        }
        if (chunk.status != plan::ChunkStatus::Pending || chunk.not_before > now) {
            continue;
        }
        dispatch(ctx, chunk);
    }
}

void JobManager::dispatch(RunContext& ctx, plan::Chunk& chunk) {
    ++chunk.attempts;
    chunk.status = plan::ChunkStatus::Running;

    const auto source = ctx.options.remap ? ctx.options.remap(chunk.source_path) : chunk.source_path;
    const auto destination = ctx.options.remap ? ctx.options.remap(chunk.destination_path) : chunk.destination_path;
    const auto command = build_copy_command(tool_, chunk, source, destination);

    auto launched = launcher_.launch(command, io_);
    if (launched.is_error()) {
        spdlog::error("[Jobs] Cannot start worker for {}: {}", chunk.relative_path, launched.error().message);
        on_failure(ctx, chunk, launched.error().message, -1);
        return;
    }

    auto handle = std::make_shared<WorkerHandle>();
    handle->chunk_id = chunk.id;
    handle->worker = std::move(launched.value());
    handle->pid = handle->worker->pid();
    handle->started_at = std::chrono::steady_clock::now();
    handle->non_fatal_exit_codes = tool_.non_fatal_exit_codes;
    handle->touch();

    {
        std::lock_guard lock(ctx.state.mutex);
        ctx.state.active_jobs[chunk.id] = handle;
    }

    std::weak_ptr<WorkerHandle> weak = handle;
    WorkerCallbacks callbacks;
    callbacks.on_output = [weak](std::size_t) {
        if (auto h = weak.lock()) {
            h->touch();
        }
    };
    callbacks.on_eof = [this, weak]() {
        auto h = weak.lock();
        if (!h) {
            return;
        }
        if (auto outcome = reap_outcome(*h)) {
            intake_.push(std::move(*outcome));
        }
    };
    handle->worker->start(std::move(callbacks));

    spdlog::debug("[Jobs] Dispatched {} (attempt {}, pid {})", chunk.relative_path, chunk.attempts, handle->pid);
    bus_.post(events::ChunkDispatchedEvent{chunk.id.str(), chunk.relative_path, chunk.attempts, handle->pid,
                                           count_remaining(ctx.chunks), current_phase(ctx.state)});
}

// ──────────────────────────────────────────────────────────
// Outcomes
// ──────────────────────────────────────────────────────────

void JobManager::handle_outcome(RunContext& ctx, const WorkerOutcome& outcome) {
    std::shared_ptr<WorkerHandle> handle;
    {
        std::lock_guard lock(ctx.state.mutex);
        auto it = ctx.state.active_jobs.find(outcome.chunk_id);
        if (it != ctx.state.active_jobs.end()) {
            handle = std::move(it->second);
            ctx.state.active_jobs.erase(it);
        }
    }

    auto found = ctx.index.find(outcome.chunk_id);
    if (found == ctx.index.end()) {
        spdlog::warn("[Jobs] Outcome for unknown chunk {}", outcome.chunk_id.str());
        return;
    }
    auto& chunk = ctx.chunks[found->second];
    if (chunk.status != plan::ChunkStatus::Running) {
        return;
    }

    switch (outcome.kind) {
        case WorkerOutcome::Kind::Exited: {
            const auto& allowed = handle ? handle->non_fatal_exit_codes : tool_.non_fatal_exit_codes;
            if (std::find(allowed.begin(), allowed.end(), outcome.exit_code) != allowed.end()) {
                on_success(ctx, chunk, outcome.exit_code);
            } else {
                on_failure(ctx, chunk, "copy tool exited with code " + std::to_string(outcome.exit_code),
                           outcome.exit_code);
            }
            break;
        }
        case WorkerOutcome::Kind::Stalled:
        case WorkerOutcome::Kind::LaunchFailed:
            on_failure(ctx, chunk, outcome.reason, outcome.exit_code);
            break;
    }
}

void JobManager::on_success(RunContext& ctx, plan::Chunk& chunk, int exit_code) {
    chunk.status = plan::ChunkStatus::Succeeded;
    chunk.last_error.clear();
    ctx.report.bytes += chunk.estimated_bytes;
    ctx.report.files += chunk.estimated_files;
    if (exit_code != 0) {
        ctx.report.warnings = true;
        spdlog::warn("[Jobs] {} finished with non-fatal code {}", chunk.relative_path, exit_code);
    }

    if (ctx.options.checkpoints && ctx.options.checkpoint) {
        auto& checkpoint = *ctx.options.checkpoint;
        checkpoint.completed_chunk_ids.insert(chunk.id.str());
        checkpoint.saved_at = std::chrono::system_clock::now();
        auto saved = ctx.options.checkpoints->save(checkpoint);
        if (saved.is_error()) {
            spdlog::warn("[Jobs] Checkpoint not saved: {}", saved.error().message);
        }
    }

    bus_.post(events::ChunkCompletedEvent{chunk.id.str(), chunk.relative_path, true, exit_code,
                                          chunk.estimated_bytes, chunk.estimated_files, {},
                                          count_remaining(ctx.chunks), current_phase(ctx.state)});
}

void JobManager::on_failure(RunContext& ctx, plan::Chunk& chunk, const std::string& reason, int exit_code) {
    chunk.last_error = reason;

    FailureDecision decision;
    std::uint32_t in_window = 0;
    {
        std::lock_guard lock(ctx.state.mutex);
        auto& counter = ctx.state.breakers[chunk.scope];
        counter.record(std::chrono::steady_clock::now(), policy_.window());
        decision = policy_.decide(counter, chunk.attempts);
        if (decision == FailureDecision::OpenCircuit) {
            counter.open = true;
        }
        in_window = static_cast<std::uint32_t>(counter.failures.size());
    }

    spdlog::warn("[Jobs] {} failed (attempt {}): {} -> {}",
                 chunk.relative_path, chunk.attempts, reason, to_string(decision));

    switch (decision) {
        case FailureDecision::Retry:
            chunk.status = plan::ChunkStatus::Pending;
            chunk.not_before = std::chrono::steady_clock::now() + settings_.retry_delay;
            bus_.post(events::ChunkRetryScheduledEvent{chunk.id.str(), chunk.attempts, settings_.retry_delay, reason,
                                                       count_remaining(ctx.chunks), current_phase(ctx.state)});
            return;

        case FailureDecision::GiveUp:
            chunk.status = plan::ChunkStatus::Failed;
            break;

        case FailureDecision::OpenCircuit: {
            chunk.status = plan::ChunkStatus::Failed;
            const auto phase = current_phase(ctx.state);
            std::size_t skipped = 0;
            for (auto& other : ctx.chunks) {
                if (other.scope == chunk.scope && other.status == plan::ChunkStatus::Pending) {
                    other.status = plan::ChunkStatus::Skipped;
                    other.last_error = "circuit open for scope " + chunk.scope;
                    ++skipped;
                    bus_.post(events::ChunkSkippedEvent{other.id.str(), other.relative_path, chunk.scope,
                                                        other.last_error, count_remaining(ctx.chunks), phase});
                }
            }
            spdlog::error("[Jobs] Circuit opened for scope '{}' after {} failures; {} chunk(s) skipped",
                          chunk.scope, in_window, skipped);
            bus_.post(events::ScopeCircuitOpenedEvent{chunk.scope, in_window, skipped});
            break;
        }
    }

    bus_.post(events::ChunkCompletedEvent{chunk.id.str(), chunk.relative_path, false, exit_code, 0, 0, reason,
                                          count_remaining(ctx.chunks), current_phase(ctx.state)});
}

// ──────────────────────────────────────────────────────────
// Shutdown
// ──────────────────────────────────────────────────────────

Result<void> JobManager::terminate_all(orchestrator::RunState& state) {
    std::unordered_map<ChunkId, std::shared_ptr<WorkerHandle>> handles;
    {
        std::lock_guard lock(state.mutex);
        handles.swap(state.active_jobs);
    }

    std::vector<std::shared_ptr<WorkerHandle>> workers;
    workers.reserve(handles.size());
    for (auto& [id, handle] : handles) {
        if (!handle->claim()) {
            // Exit or stall already reported; still stopped and reaped below
            spdlog::debug("[Jobs] Worker for {} already claimed", id.str());
        }
        workers.push_back(handle);
    }

    const auto failures = stop_workers(workers, settings_.health.terminate_grace, settings_.health.kill_timeout);
    for (const auto& failure : failures) {
        spdlog::error("[Jobs] Cannot terminate worker pid {}: {}", failure.pid, failure.reason);
    }

    if (!failures.empty()) {
        return Err<void>(ErrorKind::WorkerFailure,
            std::to_string(failures.size()) + " worker(s) failed to terminate: " + failures.front().reason);
    }
    spdlog::info("[Jobs] Terminated {} worker(s)", workers.size());
    return Ok();
}

} // namespace rpl::jobs
