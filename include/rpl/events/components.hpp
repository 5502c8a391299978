/**
 * @file components.hpp
 * @brief Observers that react to engine progress events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * ProgressTracker progress(bus);
 * // ... run ...
 * auto snapshot = progress.snapshot();
 */

#pragma once

#include "rpl/events/event_bus.hpp"
#include "rpl/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace rpl::events {

/**
 * @brief Logs every progress event through spdlog
 *
 * Unsubscribes on destruction, so it may be destroyed before the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        track<PhaseChangedEvent>([](const PhaseChangedEvent& e) {
            spdlog::info("[Phase] {}: {} -> {}", e.profile,
                         orchestrator::to_string(e.from), orchestrator::to_string(e.to));
        });
        track<ChunkDispatchedEvent>([](const ChunkDispatchedEvent& e) {
            spdlog::info("[Dispatched] chunk={} path='{}' attempt={} pid={} remaining={}",
                         e.chunk_id, e.relative_path, e.attempt, e.pid, e.remaining);
        });
        track<ChunkCompletedEvent>([](const ChunkCompletedEvent& e) {
            if (e.success) {
                spdlog::info("[Completed] chunk={} path='{}' exit={} bytes={} files={} remaining={}",
                             e.chunk_id, e.relative_path, e.exit_code, e.bytes, e.files, e.remaining);
            } else {
                spdlog::warn("[Failed] chunk={} path='{}' error={} remaining={}",
                             e.chunk_id, e.relative_path, e.error, e.remaining);
            }
        });
        track<ChunkSkippedEvent>([](const ChunkSkippedEvent& e) {
            spdlog::warn("[Skipped] chunk={} path='{}' scope={} remaining={}",
                         e.chunk_id, e.relative_path, e.scope, e.remaining);
        });
        track<ChunkRetryScheduledEvent>([](const ChunkRetryScheduledEvent& e) {
            spdlog::warn("[Retry] chunk={} attempt={} delay={}ms reason={}",
                         e.chunk_id, e.attempt, e.delay.count(), e.reason);
        });
        track<WorkerStalledEvent>([](const WorkerStalledEvent& e) {
            spdlog::warn("[Stalled] chunk={} pid={} silent={}ms", e.chunk_id, e.pid, e.silent_for.count());
        });
        track<ScopeCircuitOpenedEvent>([](const ScopeCircuitOpenedEvent& e) {
            spdlog::error("[CircuitOpen] scope={} failures={} skipped={}", e.scope, e.failures, e.skipped);
        });
        track<ResourceAcquiredEvent>([](const ResourceAcquiredEvent& e) {
            spdlog::info("[Acquired] {} {} {}", e.kind, e.id, e.detail);
        });
        track<ResourceReleasedEvent>([](const ResourceReleasedEvent& e) {
            if (e.success) {
                spdlog::info("[Released] {} {}", e.kind, e.id);
            } else {
                spdlog::error("[ReleaseFailed] {} {}: {}", e.kind, e.id, e.error);
            }
        });
        track<ResourceUnhealthyEvent>([](const ResourceUnhealthyEvent& e) {
            spdlog::warn("[Unhealthy] {}: {}", e.path, e.reason);
        });
        track<RunFinishedEvent>([](const RunFinishedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Run '{}' finished: {} (succeeded={} failed={} skipped={} resumed={})",
                         e.profile, orchestrator::to_string(e.phase),
                         e.succeeded, e.failed, e.skipped, e.resumed);
            if (!e.failure_reason.empty()) {
                spdlog::info("Reason: {}", e.failure_reason);
            }
            spdlog::info("════════════════════════════════════════════");
        });
    }

    ~LoggerComponent() {
        for (auto& undo : unsubscribers_) {
            undo();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType>
    void track(std::function<void(const EventType&)> handler) {
        auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Aggregates chunk counters for progress reporting
 *
 * remaining and phase are the values carried by the latest event, so
 * succeeded + failed + skipped + remaining adds up to the chunk count
 * once the bus has been flushed.
 *
 * THREAD SAFETY: counters are atomics; snapshot() may be read from any thread.
 */
class ProgressTracker {
public:
    struct Snapshot {
        std::uint64_t dispatched = 0;
        std::uint64_t succeeded = 0;
        std::uint64_t failed = 0;
        std::uint64_t skipped = 0;
        std::uint64_t remaining = 0;
        orchestrator::RunPhase phase = orchestrator::RunPhase::Idle;
        std::uint64_t retries = 0;
        std::uint64_t stalls = 0;
        std::uint64_t bytes = 0;
        std::uint64_t files = 0;
    };

    explicit ProgressTracker(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<ChunkDispatchedEvent>([this](const ChunkDispatchedEvent& e) {
            dispatched_++;
            position(e.remaining, e.phase);
        }));
        ids_.push_back(bus_.subscribe<ChunkCompletedEvent>([this](const ChunkCompletedEvent& e) {
            position(e.remaining, e.phase);
            if (e.success) {
                succeeded_++;
                bytes_ += e.bytes;
                files_ += e.files;
            } else {
                failed_++;
            }
        }));
        ids_.push_back(bus_.subscribe<ChunkRetryScheduledEvent>([this](const ChunkRetryScheduledEvent& e) {
            retries_++;
            position(e.remaining, e.phase);
        }));
        ids_.push_back(bus_.subscribe<WorkerStalledEvent>([this](const WorkerStalledEvent&) {
            stalls_++;
        }));
        ids_.push_back(bus_.subscribe<ChunkSkippedEvent>([this](const ChunkSkippedEvent& e) {
            skipped_++;
            position(e.remaining, e.phase);
        }));
        ids_.push_back(bus_.subscribe<PhaseChangedEvent>([this](const PhaseChangedEvent& e) {
            phase_ = e.to;
        }));
    }

    ~ProgressTracker() {
        bus_.unsubscribe<ChunkDispatchedEvent>(ids_[0]);
        bus_.unsubscribe<ChunkCompletedEvent>(ids_[1]);
        bus_.unsubscribe<ChunkRetryScheduledEvent>(ids_[2]);
        bus_.unsubscribe<WorkerStalledEvent>(ids_[3]);
        bus_.unsubscribe<ChunkSkippedEvent>(ids_[4]);
        bus_.unsubscribe<PhaseChangedEvent>(ids_[5]);
    }

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    Snapshot snapshot() const {
        Snapshot s;
        s.dispatched = dispatched_.load();
        s.succeeded = succeeded_.load();
        s.failed = failed_.load();
        s.skipped = skipped_.load();
        s.remaining = remaining_.load();
        s.phase = phase_.load();
        s.retries = retries_.load();
        s.stalls = stalls_.load();
        s.bytes = bytes_.load();
        s.files = files_.load();
        return s;
    }

private:
    void position(std::size_t remaining, orchestrator::RunPhase phase) {
        remaining_ = remaining;
        phase_ = phase;
    }

    EventBus& bus_;
    std::vector<size_t> ids_;

    std::atomic<std::uint64_t> dispatched_{0};
    std::atomic<std::uint64_t> succeeded_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> skipped_{0};
    std::atomic<std::uint64_t> remaining_{0};
    std::atomic<orchestrator::RunPhase> phase_{orchestrator::RunPhase::Idle};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> stalls_{0};
    std::atomic<std::uint64_t> bytes_{0};
    std::atomic<std::uint64_t> files_{0};
};

} // namespace rpl::events
