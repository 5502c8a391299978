#include "rpl/orchestrator/run_phase.hpp"

namespace rpl::orchestrator {

const char* to_string(RunPhase phase) noexcept {
    switch (phase) {
        case RunPhase::Idle:      return "Idle";
        case RunPhase::Profiling: return "Profiling";
        case RunPhase::Chunking:  return "Chunking";
        case RunPhase::Acquiring: return "Acquiring";
        case RunPhase::Copying:   return "Copying";
        case RunPhase::Completed: return "Completed";
        case RunPhase::Failed:    return "Failed";
        case RunPhase::Stopping:  return "Stopping";
        case RunPhase::Stopped:   return "Stopped";
    }
    return "Unknown";
}

bool can_transition(RunPhase from, RunPhase to) noexcept {
    if (is_terminal(from)) {
        return false;
    }
    if (to == RunPhase::Stopping) {
        return from != RunPhase::Stopping;
    }

    switch (from) {
        case RunPhase::Idle:
            return to == RunPhase::Profiling;
        case RunPhase::Profiling:
            return to == RunPhase::Chunking || to == RunPhase::Failed;
        case RunPhase::Chunking:
            return to == RunPhase::Acquiring || to == RunPhase::Completed || to == RunPhase::Failed;
        case RunPhase::Acquiring:
            return to == RunPhase::Copying || to == RunPhase::Failed;
        case RunPhase::Copying:
            return to == RunPhase::Completed || to == RunPhase::Failed;
        case RunPhase::Stopping:
            return to == RunPhase::Stopped;
        default:
            return false;
    }
}

} // namespace rpl::orchestrator
