#include "rpl/jobs/failure_policy.hpp"

namespace rpl::jobs {

const char* to_string(FailureDecision decision) noexcept {
    switch (decision) {
        case FailureDecision::Retry:       return "retry";
        case FailureDecision::GiveUp:      return "give-up";
        case FailureDecision::OpenCircuit: return "open-circuit";
    }
    return "unknown";
}

void CircuitCounter::record(std::chrono::steady_clock::time_point now, std::chrono::milliseconds window) {
    failures.push_back(now);
    ++total;
    while (!failures.empty() && now - failures.front() > window) {
        failures.pop_front();
    }
}

FailureDecision FailurePolicy::decide(const CircuitCounter& counter, std::uint32_t attempts) const noexcept {
    if (counter.open) {
        return FailureDecision::GiveUp;
    }
    if (counter.failures.size() >= threshold_) {
        return FailureDecision::OpenCircuit;
    }
    return attempts < max_attempts_ ? FailureDecision::Retry : FailureDecision::GiveUp;
}

} // namespace rpl::jobs
