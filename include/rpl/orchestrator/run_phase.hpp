#pragma once

namespace rpl::orchestrator {

/**
 * @brief Lifecycle of one orchestrated run
 *
 * Idle -> Profiling -> Chunking -> Acquiring -> Copying -> Completed
 * Any non-terminal phase -> Stopping -> Stopped
 * Profiling/Chunking/Acquiring/Copying -> Failed
 * Chunking -> Completed (dry run)
 */
enum class RunPhase {
    Idle,
    Profiling,
    Chunking,
    Acquiring,
    Copying,
    Completed,
    Failed,
    Stopping,
    Stopped
};

const char* to_string(RunPhase phase) noexcept;

inline bool is_terminal(RunPhase phase) noexcept {
    return phase == RunPhase::Completed ||
           phase == RunPhase::Failed ||
           phase == RunPhase::Stopped;
}

/// True when from -> to is an edge of the lifecycle above
bool can_transition(RunPhase from, RunPhase to) noexcept;

} // namespace rpl::orchestrator
