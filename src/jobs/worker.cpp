#include "rpl/jobs/worker.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <thread>

namespace rpl::jobs {
namespace {

constexpr auto kStopPoll = std::chrono::milliseconds(20);

std::string with_trailing_slash(const std::string& path) {
    if (!path.empty() && path.back() == '/') {
        return path;
    }
    return path + "/";
}

} // namespace

CopyCommand build_copy_command(const core::CopyToolConfig& tool,
                               const plan::Chunk& chunk,
                               const std::string& source,
                               const std::string& destination) {
    CopyCommand command;
    command.argv.push_back(tool.program);
    command.argv.insert(command.argv.end(), tool.flags.begin(), tool.flags.end());
    const auto& mode = chunk.recursive ? tool.recursive_flags : tool.files_only_flags;
    command.argv.insert(command.argv.end(), mode.begin(), mode.end());
    command.argv.push_back(with_trailing_slash(source));
    command.argv.push_back(with_trailing_slash(destination));
    return command;
}

std::optional<WorkerOutcome> reap_outcome(WorkerHandle& handle) {
    if (handle.claimed()) {
        return std::nullopt;
    }

    std::optional<int> code;
    {
        std::lock_guard lock(handle.worker_mutex);
        if (handle.worker) {
            code = handle.worker->try_reap();
        }
    }
    if (!code || !handle.claim()) {
        return std::nullopt;
    }

    WorkerOutcome outcome;
    outcome.chunk_id = handle.chunk_id;
    outcome.kind = WorkerOutcome::Kind::Exited;
    outcome.exit_code = *code;
    return outcome;
}

// ──────────────────────────────────────────────────────────
// Stopping
// ──────────────────────────────────────────────────────────

namespace {

struct Stopping {
    std::shared_ptr<WorkerHandle> handle;
    bool exited = false;
    std::string error;
};

void note(Stopping& entry, const std::string& reason) {
    if (entry.error.empty()) {
        entry.error = reason;
    }
}

void send(Stopping& entry, bool kill) {
    try {
        std::lock_guard lock(entry.handle->worker_mutex);
        auto sent = kill ? entry.handle->worker->force_kill() : entry.handle->worker->request_stop();
        if (sent.is_error()) {
            note(entry, sent.error().message);
        }
    } catch (const std::exception& e) {
        note(entry, std::string(kill ? "SIGKILL" : "SIGTERM") + " threw: " + e.what());
    }
}

// Reaps whatever has exited; true when nothing is left running
bool reap_all(std::vector<Stopping>& entries) {
    bool done = true;
    for (auto& entry : entries) {
        if (entry.exited) {
            continue;
        }
        std::lock_guard lock(entry.handle->worker_mutex);
        entry.exited = entry.handle->worker->try_reap().has_value();
        done = done && entry.exited;
    }
    return done;
}

bool wait_all(std::vector<Stopping>& entries, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!reap_all(entries)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kStopPoll);
    }
    return true;
}

} // namespace

std::vector<StopFailure> stop_workers(const std::vector<std::shared_ptr<WorkerHandle>>& handles,
                                      std::chrono::milliseconds grace,
                                      std::chrono::milliseconds kill_timeout) {
    std::vector<Stopping> entries;
    entries.reserve(handles.size());
    for (const auto& handle : handles) {
        if (handle && handle->worker) {
            entries.push_back(Stopping{handle});
        }
    }

    if (!reap_all(entries)) {
        for (auto& entry : entries) {
            if (!entry.exited) {
                send(entry, false);
            }
        }
    }

    if (!wait_all(entries, grace)) {
        std::size_t survivors = 0;
        for (auto& entry : entries) {
            if (!entry.exited) {
                send(entry, true);
                ++survivors;
            }
        }
        spdlog::warn("[Worker] {} worker(s) ignored SIGTERM for {}ms, sent SIGKILL", survivors, grace.count());
        wait_all(entries, kill_timeout);
    }

    std::vector<StopFailure> failures;
    for (auto& entry : entries) {
        if (entry.exited) {
            continue;
        }
        note(entry, "pid " + std::to_string(entry.handle->pid) + " did not exit after SIGKILL");
        failures.push_back(StopFailure{entry.handle->pid, entry.error});
    }
    return failures;
}

} // namespace rpl::jobs
