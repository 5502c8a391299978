#pragma once

#include <chrono>
#include <cstdint>
#include <deque>

namespace rpl::jobs {

enum class FailureDecision {
    Retry,       ///< chunk back to Pending
    GiveUp,      ///< chunk Failed
    OpenCircuit  ///< chunk Failed, remaining Pending chunks of its scope Skipped
};

const char* to_string(FailureDecision decision) noexcept;

/**
 * @brief Sliding-window failure history of one scope
 */
struct CircuitCounter {
    std::deque<std::chrono::steady_clock::time_point> failures; ///< inside the window only
    std::uint32_t total = 0;
    bool open = false;

    /// Add a failure at now and drop entries older than now - window
    void record(std::chrono::steady_clock::time_point now, std::chrono::milliseconds window);
};

/**
 * @brief Decides what happens to a chunk after it fails
 *
 * Pure function of the scope's failure history and the chunk's attempt
 * count. Precedence: an open circuit gives up, reaching the threshold
 * inside the window opens the circuit, otherwise retry until max_attempts.
 */
class FailurePolicy {
public:
    FailurePolicy(std::uint32_t max_attempts, std::uint32_t threshold, std::chrono::milliseconds window)
        : max_attempts_(max_attempts), threshold_(threshold), window_(window) {}

    /// counter must already include the failure being decided
    [[nodiscard]] FailureDecision decide(const CircuitCounter& counter, std::uint32_t attempts) const noexcept;

    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }
    [[nodiscard]] std::uint32_t max_attempts() const noexcept { return max_attempts_; }
    [[nodiscard]] std::uint32_t threshold() const noexcept { return threshold_; }

private:
    std::uint32_t max_attempts_;
    std::uint32_t threshold_;
    std::chrono::milliseconds window_;
};

} // namespace rpl::jobs
