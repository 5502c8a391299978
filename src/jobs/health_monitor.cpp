#include "rpl/jobs/health_monitor.hpp"
#include "rpl/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <future>
#include <mutex>
#include <system_error>

namespace rpl::jobs {

namespace fs = std::filesystem;

namespace {

// Runs a stop/kill request under the worker mutex; empty on success
std::string signal_worker(WorkerHandle& handle, bool kill) {
    try {
        std::lock_guard lock(handle.worker_mutex);
        auto sent = kill ? handle.worker->force_kill() : handle.worker->request_stop();
        if (sent.is_error()) {
            return sent.error().message;
        }
        return {};
    } catch (const std::exception& e) {
        return std::string(kill ? "SIGKILL" : "SIGTERM") + " threw: " + e.what();
    }
}

bool reaped(WorkerHandle& handle) {
    std::lock_guard lock(handle.worker_mutex);
    return handle.worker->try_reap().has_value();
}

} // namespace

std::optional<std::string> probe_path(const std::string& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec) {
        return ec.message();
    }
    if (!fs::is_directory(status)) {
        return std::string("not a directory");
    }
    return std::nullopt;
}

HealthMonitor::HealthMonitor(boost::asio::io_context& io,
                             orchestrator::RunState& state,
                             HealthSettings settings,
                             OutcomeSink sink,
                             events::EventBus& bus)
    : io_(io),
      timer_(io),
      state_(state),
      settings_(settings),
      sink_(std::move(sink)),
      bus_(bus) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    started_ = true;
    *running_ = true;
    boost::asio::post(io_, [this, running = running_]() {
        if (*running) {
            schedule();
        }
    });
}

void HealthMonitor::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    *running_ = false;
    if (io_.stopped()) {
        return;
    }
    std::promise<void> done;
    auto finished = done.get_future();
    boost::asio::post(io_, [this, &done]() {
        timer_.cancel();
        done.set_value();
    });
    finished.wait();
}

void HealthMonitor::schedule() {
    timer_.expires_after(settings_.poll_interval);
    // running is checked before touching this: a completion already queued
    // when stop() ran may execute after the monitor is gone
    timer_.async_wait([this, running = running_](const boost::system::error_code& ec) {
        if (ec || !*running) {
            return;
        }
        poll_once();
        schedule();
    });
}

void HealthMonitor::poll_once() {
    const auto handles = state_.handles();

    // Exits first: a worker that has exited is never reported as stalled
    for (const auto& handle : handles) {
        if (auto outcome = reap_outcome(*handle)) {
            sink_(std::move(*outcome));
        }
    }

    const auto now = std::chrono::steady_clock::now();
    for (const auto& handle : handles) {
        if (handle->claimed()) {
            continue;
        }
        const auto silent = std::chrono::duration_cast<std::chrono::milliseconds>(now - handle->last_output());
        if (silent <= settings_.stall_timeout || !handle->claim()) {
            continue;
        }

        spdlog::warn("[Health] Worker pid {} silent for {}ms, terminating", handle->pid, silent.count());
        PendingStop pending;
        pending.handle = handle;
        pending.silent = silent;
        pending.reason = "stalled: no output for " + std::to_string(silent.count()) + "ms";
        pending.kill_at = now + settings_.terminate_grace;

        const auto failed = signal_worker(*handle, false);
        if (!failed.empty()) {
            pending.reason += " (termination failed: " + failed + ")";
            report_stall(pending);
            continue;
        }
        stopping_.push_back(std::move(pending));
    }

    advance_stops(now);

    ++ticks_;
    if (settings_.probe_every_ticks > 0 && ticks_ % settings_.probe_every_ticks == 0) {
        for (const auto& path : probe_paths_) {
            if (auto problem = probe_path(path)) {
                bus_.post(events::ResourceUnhealthyEvent{path, *problem});
            }
        }
    }
}

void HealthMonitor::advance_stops(std::chrono::steady_clock::time_point now) {
    auto it = stopping_.begin();
    while (it != stopping_.end()) {
        auto& pending = *it;
        bool done = reaped(*pending.handle);

        if (!done && !pending.killed && now >= pending.kill_at) {
            spdlog::warn("[Health] Worker pid {} ignored SIGTERM, sending SIGKILL", pending.handle->pid);
            const auto failed = signal_worker(*pending.handle, true);
            if (!failed.empty()) {
                pending.reason += " (kill failed: " + failed + ")";
            }
            pending.killed = true;
            pending.give_up_at = now + settings_.kill_timeout;
            done = reaped(*pending.handle);
        } else if (!done && pending.killed && now >= pending.give_up_at) {
            spdlog::error("[Health] Worker pid {} did not exit after SIGKILL", pending.handle->pid);
            pending.reason += " (pid " + std::to_string(pending.handle->pid) + " did not exit after SIGKILL)";
            done = true;
        }

        if (!done) {
            ++it;
            continue;
        }
        report_stall(pending);
        it = stopping_.erase(it);
    }
}

void HealthMonitor::report_stall(PendingStop& pending) {
    bus_.post(events::WorkerStalledEvent{pending.handle->chunk_id.str(), pending.handle->pid, pending.silent});
    WorkerOutcome outcome;
    outcome.chunk_id = pending.handle->chunk_id;
    outcome.kind = WorkerOutcome::Kind::Stalled;
    outcome.reason = std::move(pending.reason);
    sink_(std::move(outcome));
}

} // namespace rpl::jobs
