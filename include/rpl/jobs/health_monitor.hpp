#pragma once

/**
 * @file health_monitor.hpp
 * @brief Periodic liveness checks for running copy workers
 *
 * WHAT IT DOES (each tick, on the io thread):
 * 1. Reap workers that have exited and report them
 * 2. Send SIGTERM to workers silent for longer than stall_timeout
 * 3. Advance pending stops: SIGKILL once terminate_grace has passed, give
 *    up once kill_timeout has passed after that. The stall is reported
 *    when the worker is gone or given up on
 * 4. Every probe_every_ticks ticks, check that the probed roots are still
 *    reachable and publish ResourceUnhealthyEvent when not
 *
 * Exits are reaped before stalls are checked, and every report goes through
 * the handle's claim() latch, so a worker that already exited is never
 * reported as stalled. A tick never waits on a worker.
 *
 * THREAD SAFETY:
 * start()/stop() are called from the coordinator; ticks run on the io
 * thread. stop() returns once no further tick will touch the run state.
 */

#include "rpl/events/event_bus.hpp"
#include "rpl/jobs/worker.hpp"
#include "rpl/orchestrator/run_state.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rpl::jobs {

struct HealthSettings {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds stall_timeout{std::chrono::minutes(10)};
    std::chrono::milliseconds terminate_grace{10000};
    std::chrono::milliseconds kill_timeout{5000};
    std::uint32_t probe_every_ticks = 30;
};

using OutcomeSink = std::function<void(WorkerOutcome)>;

/// nullopt when path is a reachable directory, otherwise the reason
std::optional<std::string> probe_path(const std::string& path);

class HealthMonitor {
public:
    HealthMonitor(boost::asio::io_context& io,
                  orchestrator::RunState& state,
                  HealthSettings settings,
                  OutcomeSink sink,
                  events::EventBus& bus);

    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void set_probe_paths(std::vector<std::string> paths) { probe_paths_ = std::move(paths); }

    void start();
    void stop();

    /// One tick; public so tests can drive the monitor without a timer
    void poll_once();

private:
    struct PendingStop {
        std::shared_ptr<WorkerHandle> handle;
        std::chrono::milliseconds silent{0};
        std::string reason;
        std::chrono::steady_clock::time_point kill_at{};
        std::chrono::steady_clock::time_point give_up_at{};
        bool killed = false;
    };

    void schedule();
    void advance_stops(std::chrono::steady_clock::time_point now);
    void report_stall(PendingStop& pending);

    boost::asio::io_context& io_;
    boost::asio::steady_timer timer_;
    orchestrator::RunState& state_;
    HealthSettings settings_;
    OutcomeSink sink_;
    events::EventBus& bus_;
    std::vector<std::string> probe_paths_;
    std::vector<PendingStop> stopping_; // io thread
    std::uint64_t ticks_ = 0;
    std::shared_ptr<std::atomic<bool>> running_ = std::make_shared<std::atomic<bool>>(false);
    bool started_ = false; // coordinator only
};

} // namespace rpl::jobs
