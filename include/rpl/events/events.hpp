/**
 * @file events.hpp
 * @brief Progress events published by the orchestration engine
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: ChunkCompletedEvent, ResourceReleasedEvent.
 *
 * All events carry plain values so they can be copied onto the dispatcher
 * thread and outlive the objects that produced them.
 */

#pragma once

#include "rpl/orchestrator/run_phase.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rpl::events {

// ════════════════════════════════════════════════════════
// Run Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted on every state machine transition
 *
 * WHO EMITS: Orchestrator
 * WHO SUBSCRIBES: LoggerComponent, ProgressTracker, CLI
 */
struct PhaseChangedEvent {
    std::string profile;
    orchestrator::RunPhase from;
    orchestrator::RunPhase to;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct RunFinishedEvent {
    std::string profile;
    orchestrator::RunPhase phase;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t resumed = 0;
    std::string failure_reason;
};

// ════════════════════════════════════════════════════════
// Chunk Events
// ════════════════════════════════════════════════════════
//
// Every chunk event carries the number of chunks not yet terminal after
// the transition and the run phase it happened in.

/**
 * @brief A worker was spawned for a chunk
 *
 * WHO EMITS: JobManager, after the worker is registered
 */
struct ChunkDispatchedEvent {
    std::string chunk_id;
    std::string relative_path;
    std::uint32_t attempt = 0;
    int pid = -1;
    std::size_t remaining = 0;
    orchestrator::RunPhase phase = orchestrator::RunPhase::Copying;
};

/**
 * @brief A chunk reached Succeeded or Failed
 */
struct ChunkCompletedEvent {
    std::string chunk_id;
    std::string relative_path;
    bool success = false;
    int exit_code = 0;
    std::uint64_t bytes = 0;
    std::uint64_t files = 0;
    std::string error;
    std::size_t remaining = 0;
    orchestrator::RunPhase phase = orchestrator::RunPhase::Copying;
};

struct ChunkRetryScheduledEvent {
    std::string chunk_id;
    std::uint32_t attempt = 0;
    std::chrono::milliseconds delay{0};
    std::string reason;
    std::size_t remaining = 0;
    orchestrator::RunPhase phase = orchestrator::RunPhase::Copying;
};

/**
 * @brief A Pending chunk was skipped because its scope circuit opened
 *
 * One per chunk, posted before the ScopeCircuitOpenedEvent that sums them.
 */
struct ChunkSkippedEvent {
    std::string chunk_id;
    std::string relative_path;
    std::string scope;
    std::string reason;
    std::size_t remaining = 0;
    orchestrator::RunPhase phase = orchestrator::RunPhase::Copying;
};

/**
 * @brief The health monitor killed a worker that stopped producing output
 *
 * WHO EMITS: HealthMonitor (io thread)
 */
struct WorkerStalledEvent {
    std::string chunk_id;
    int pid = -1;
    std::chrono::milliseconds silent_for{0};
};

/**
 * @brief A scope crossed its failure threshold; its pending chunks are skipped
 */
struct ScopeCircuitOpenedEvent {
    std::string scope;
    std::uint32_t failures = 0;
    std::size_t skipped = 0;
};

// ════════════════════════════════════════════════════════
// Resource Events
// ════════════════════════════════════════════════════════

/// kind is "snapshot", "junction" or "mapping"
struct ResourceAcquiredEvent {
    std::string kind;
    std::string id;
    std::string detail;
};

struct ResourceReleasedEvent {
    std::string kind;
    std::string id;
    bool success = true;
    std::string error;
};

/**
 * @brief A probed root became unreachable during copying
 *
 * Advisory only; no worker is killed because of it.
 */
struct ResourceUnhealthyEvent {
    std::string path;
    std::string reason;
};

} // namespace rpl::events
