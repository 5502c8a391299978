#include "rpl/orchestrator/orchestrator.hpp"
#include "rpl/events/events.hpp"
#include "rpl/plan/profiler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <functional>

namespace rpl::orchestrator {

namespace {

/// One step of a release sequence: logged, never propagated
void run_step(const char* name, const std::function<Result<void>()>& step) {
    try {
        auto result = step();
        if (result.is_error()) {
            spdlog::error("[Orchestrator] {} failed: {}", name, describe(result.error()));
        }
    } catch (const std::exception& e) {
        spdlog::error("[Orchestrator] {} threw: {}", name, e.what());
    }
}

} // namespace

Orchestrator::Orchestrator(const core::EngineConfig& config, core::ProfileConfig profile, Dependencies deps)
    : profile_(std::move(profile)),
      deps_(deps),
      params_{config.chunking.max_bytes, config.chunking.max_files, config.chunking.max_depth},
      jobs_(jobs::JobSettings::from_config(config), config.copy_tool, deps.launcher, deps.bus) {}

RunPhase Orchestrator::phase() const {
    std::lock_guard lock(state_.mutex);
    return state_.phase;
}

bool Orchestrator::transition(RunPhase to) {
    RunPhase from;
    {
        std::lock_guard lock(state_.mutex);
        from = state_.phase;
        if (!can_transition(from, to)) {
            return false;
        }
        state_.phase = to;
    }
    spdlog::info("[Orchestrator] {}: {} -> {}", profile_.name, to_string(from), to_string(to));
    deps_.bus.post(events::PhaseChangedEvent{profile_.name, from, to});
    return true;
}

// ──────────────────────────────────────────────────────────
// Run
// ──────────────────────────────────────────────────────────

RunSummary Orchestrator::run(RunOptions options) {
    if (started_.exchange(true)) {
        spdlog::warn("[Orchestrator] {}: run() called twice", profile_.name);
        return summarize();
    }
    started_at_ = std::chrono::steady_clock::now();

    if (options.credential) {
        std::lock_guard lock(state_.mutex);
        state_.credential = std::move(*options.credential);
        options.credential.reset();
    }

    if (stopping() || !transition(RunPhase::Profiling)) {
        return finish_stopped();
    }
    auto profiled = profile_source();
    if (stopping()) {
        return finish_stopped();
    }
    if (profiled.is_error()) {
        return fail(profiled.error());
    }

    if (!transition(RunPhase::Chunking)) {
        return finish_stopped();
    }
    chunks_ = planner_->finish();
    const auto totals = plan::summarize(chunks_);
    spdlog::info("[Orchestrator] {}: {} chunk(s), {} bytes, {} files, {} oversized",
                 profile_.name, totals.chunks, totals.bytes, totals.files, totals.oversized);

    if (options.dry_run) {
        release_resources();
        if (!transition(RunPhase::Completed)) {
            return finish_stopped();
        }
        auto summary = summarize();
        deps_.bus.post(events::RunFinishedEvent{profile_.name, summary.phase, 0, 0, 0, 0, {}});
        return summary;
    }

    if (stopping() || !transition(RunPhase::Acquiring)) {
        return finish_stopped();
    }
    auto acquired = acquire_resources();
    if (stopping()) {
        return finish_stopped();
    }
    if (acquired.is_error()) {
        return fail(acquired.error());
    }

    if (!transition(RunPhase::Copying)) {
        return finish_stopped();
    }

    jobs::CopyOptions copy;
    copy.remap = [this](const std::string& path) { return remap(path); };
    copy.checkpoints = &deps_.checkpoints;
    copy.probe_paths = {remap(profile_.source), remap(profile_.destination)};

    auto saved = deps_.checkpoints.load(profile_.name);
    if (saved && saved->parameters != params_) {
        spdlog::info("[Orchestrator] {}: checkpoint ignored, plan parameters changed", profile_.name);
        saved.reset();
    }
    if (!saved) {
        saved.emplace();
        saved->profile = profile_.name;
        saved->parameters = params_;
    }
    saved->phase = to_string(RunPhase::Copying);
    copy.checkpoint = std::move(saved);

    report_ = jobs_.run(chunks_, std::move(copy), state_, stop_requested_);
    if (report_.cancelled || stopping()) {
        return finish_stopped();
    }

    release_resources();

    if (report_.failed == 0 && report_.skipped == 0) {
        auto removed = deps_.checkpoints.remove(profile_.name);
        if (removed.is_error()) {
            spdlog::warn("[Orchestrator] Checkpoint for {} not removed: {}", profile_.name, removed.error().message);
        }
    }

    if (!transition(RunPhase::Completed)) {
        return finish_stopped();
    }
    auto summary = summarize();
    deps_.bus.post(events::RunFinishedEvent{profile_.name, summary.phase, summary.succeeded,
                                            summary.failed, summary.skipped, summary.resumed, {}});
    return summary;
}

Result<void> Orchestrator::profile_source() {
    std::string root = profile_.source;
    if (UncPath::looks_like_unc(profile_.source)) {
        auto mapped = track_mapping(profile_.source);
        if (mapped.is_error()) {
            return mapped;
        }
        root = remap(profile_.source);
    }

    auto profiler = plan::DirectoryProfiler::open(root);
    if (profiler.is_error()) {
        return Err<void>(profiler.error());
    }

    planner_.emplace(params_, profile_.source, profile_.destination, profile_.name);
    auto& walk = profiler.value();
    while (auto stats = walk.next()) {
        if (stopping()) {
            return Err<void>(ErrorKind::Cancelled, "Stopped while profiling");
        }
        planner_->add(*stats);
    }
    unreadable_ = walk.unreadable_count();
    if (unreadable_ > 0) {
        spdlog::warn("[Orchestrator] {}: {} unreadable director(ies) planned with zero size",
                     profile_.name, unreadable_);
    }
    return Ok();
}

Result<void> Orchestrator::track_mapping(const std::string& unc_path) {
    // The credential is only cleared by this thread, so the pointer outlives the lock
    const credentials::Credential* credential = nullptr;
    {
        std::lock_guard lock(state_.mutex);
        if (state_.credential) {
            credential = &*state_.credential;
        }
    }
    auto mapped = deps_.network.mount(unc_path, credential);
    if (mapped.is_error()) {
        return Err<void>(mapped.error());
    }

    const auto& record = mapped.value();
    {
        std::lock_guard lock(state_.mutex);
        const bool known = std::any_of(state_.current_mappings.begin(), state_.current_mappings.end(),
            [&record](const network::MappingRecord& r) { return r.letter == record.letter; });
        if (known) {
            return Ok();
        }
        state_.current_mappings.push_back(record);
    }
    deps_.bus.post(events::ResourceAcquiredEvent{"mapping", record.letter.str(), record.remote_root});
    return Ok();
}

Result<void> Orchestrator::acquire_resources() {
    if (UncPath::looks_like_unc(profile_.destination)) {
        auto mapped = track_mapping(profile_.destination);
        if (mapped.is_error()) {
            return mapped;
        }
    }
    if (stopping()) {
        return Ok();
    }

    if (profile_.use_snapshot) {
        auto record = deps_.snapshots.acquire(profile_.source);
        if (record.is_error()) {
            return Err<void>(ErrorKind::ResourceAcquisition,
                             "Snapshot of " + profile_.source + " failed: " + record.error().message);
        }
        deps_.bus.post(events::ResourceAcquiredEvent{"snapshot", record.value().shadow_id.str(),
                                                     record.value().access_root});
        std::lock_guard lock(state_.mutex);
        state_.current_snapshot = std::move(record.value());
    }
    return Ok();
}

std::string Orchestrator::remap(const std::string& path) const {
    std::string out = path;
    {
        std::lock_guard lock(state_.mutex);
        if (state_.current_snapshot) {
            out = snapshot::SnapshotManager::remap(*state_.current_snapshot, out);
        }
    }
    return deps_.network.remap(out);
}

// ──────────────────────────────────────────────────────────
// Stop and release
// ──────────────────────────────────────────────────────────

bool Orchestrator::stop() {
    RunPhase from;
    {
        std::lock_guard lock(state_.mutex);
        from = state_.phase;
        if (!can_transition(from, RunPhase::Stopping)) {
            return false;
        }
        state_.phase = RunPhase::Stopping;
        stop_requested_ = true;
    }
    spdlog::warn("[Orchestrator] {}: stop requested during {}", profile_.name, to_string(from));
    deps_.bus.post(events::PhaseChangedEvent{profile_.name, from, RunPhase::Stopping});

    // Nobody is coordinating yet: stop on the caller
    if (from == RunPhase::Idle && !started_.exchange(true)) {
        finish_stopped();
    }
    return true;
}

void Orchestrator::release_resources() {
    std::optional<snapshot::SnapshotRecord> snapshot;
    {
        std::lock_guard lock(state_.mutex);
        snapshot = state_.current_snapshot;
    }

    run_step("Junction removal", [&]() -> Result<void> {
        if (!snapshot || !snapshot->junction_path) {
            return Ok();
        }
        auto updated = deps_.snapshots.release_junction(*snapshot);
        if (updated.is_error()) {
            return Err<void>(updated.error());
        }
        snapshot = updated.value();
        std::lock_guard lock(state_.mutex);
        state_.current_snapshot = snapshot;
        return Ok();
    });

    run_step("Snapshot release", [&]() -> Result<void> {
        if (!snapshot) {
            return Ok();
        }
        auto released = deps_.snapshots.release(*snapshot);
        deps_.bus.post(events::ResourceReleasedEvent{"snapshot", snapshot->shadow_id.str(), released.is_ok(),
                                                     released.is_ok() ? "" : released.error().message});
        if (released.is_error()) {
            return released;
        }
        std::lock_guard lock(state_.mutex);
        state_.current_snapshot.reset();
        return Ok();
    });

    std::vector<network::MappingRecord> mappings;
    {
        std::lock_guard lock(state_.mutex);
        mappings = state_.current_mappings;
    }
    for (const auto& mapping : mappings) {
        run_step("Unmap", [&]() -> Result<void> {
            auto undone = deps_.network.unmount(mapping);
            deps_.bus.post(events::ResourceReleasedEvent{"mapping", mapping.letter.str(), undone.is_ok(),
                                                         undone.is_ok() ? "" : undone.error().message});
            if (undone.is_error()) {
                return undone;
            }
            std::lock_guard lock(state_.mutex);
            auto& held = state_.current_mappings;
            held.erase(std::remove_if(held.begin(), held.end(),
                                      [&mapping](const network::MappingRecord& r) { return r.letter == mapping.letter; }),
                       held.end());
            return Ok();
        });
    }

    run_step("Credential clear", [&]() -> Result<void> {
        std::lock_guard lock(state_.mutex);
        if (state_.credential) {
            state_.credential->clear();
            state_.credential.reset();
        }
        return Ok();
    });
}

void Orchestrator::stop_sequence() {
    run_step("Worker termination", [&]() { return jobs_.terminate_all(state_); });
    release_resources();
}

RunSummary Orchestrator::finish_stopped() {
    stop_sequence();
    transition(RunPhase::Stopped);

    auto summary = summarize();
    spdlog::warn("[Orchestrator] {}: stopped ({} of {} chunk(s) copied)",
                 profile_.name, summary.succeeded, summary.chunks_total);
    deps_.bus.post(events::RunFinishedEvent{profile_.name, summary.phase, summary.succeeded,
                                            summary.failed, summary.skipped, summary.resumed, {}});
    return summary;
}

RunSummary Orchestrator::fail(const Error& error) {
    spdlog::error("[Orchestrator] {}: {}", profile_.name, describe(error));
    release_resources();
    {
        std::lock_guard lock(state_.mutex);
        state_.failure_reason = error.message;
    }
    if (!transition(RunPhase::Failed)) {
        return finish_stopped();
    }
    auto summary = summarize();
    deps_.bus.post(events::RunFinishedEvent{profile_.name, summary.phase, summary.succeeded,
                                            summary.failed, summary.skipped, summary.resumed,
                                            summary.failure_reason});
    return summary;
}

RunSummary Orchestrator::summarize() const {
    RunSummary summary;
    {
        std::lock_guard lock(state_.mutex);
        summary.phase = state_.phase;
        summary.failure_reason = state_.failure_reason;
    }
    summary.chunks_total = chunks_.size();
    summary.succeeded = report_.succeeded;
    summary.failed = report_.failed;
    summary.skipped = report_.skipped;
    summary.resumed = report_.resumed;
    summary.bytes = report_.bytes;
    summary.files = report_.files;
    summary.has_warnings = report_.warnings || report_.failed > 0 || report_.skipped > 0 || unreadable_ > 0;
    if (started_at_ != std::chrono::steady_clock::time_point{}) {
        summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_);
    }
    return summary;
}

} // namespace rpl::orchestrator
