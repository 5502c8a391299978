#pragma once

/**
 * @file worker.hpp
 * @brief Copy workers and the handles the job manager tracks them by
 *
 * WHAT IT DOES:
 * - Worker: one running copy-tool process bound to one chunk
 * - WorkerLauncher: spawns workers (real subprocesses, or fakes in tests)
 * - WorkerHandle: per-worker bookkeeping shared between the coordinator
 *   and the io thread
 * - reap_outcome(): the single place an exit is turned into an outcome
 * - stop_workers(): stops a set of workers against one shared deadline
 *
 * OUTCOME LATCH:
 * Each handle reports exactly one outcome. Whoever wins claim() (exit
 * reaping, stall detection, or terminate_all) is the only reporter.
 */

#include "rpl/core/config.hpp"
#include "rpl/core/identifiers.hpp"
#include "rpl/core/result.hpp"
#include "rpl/plan/types.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rpl::jobs {

struct CopyCommand {
    std::vector<std::string> argv;
};

/// program flags... (recursive_flags | files_only_flags) <source>/ <destination>/
CopyCommand build_copy_command(const core::CopyToolConfig& tool,
                               const plan::Chunk& chunk,
                               const std::string& source,
                               const std::string& destination);

struct WorkerCallbacks {
    std::function<void(std::size_t bytes)> on_output; ///< io thread
    std::function<void()> on_eof;                      ///< io thread
};

class Worker {
public:
    virtual ~Worker() = default;

    [[nodiscard]] virtual int pid() const noexcept = 0;

    /// Begin delivering output notifications
    virtual void start(WorkerCallbacks callbacks) = 0;

    /// Non-blocking; exit code once the process has exited
    virtual std::optional<int> try_reap() = 0;

    /// SIGTERM to the worker's process group; returns at once
    virtual Result<void> request_stop() = 0;

    /// SIGKILL to the worker's process group; returns at once
    virtual Result<void> force_kill() = 0;
};

class WorkerLauncher {
public:
    virtual ~WorkerLauncher() = default;
    virtual Result<std::unique_ptr<Worker>> launch(const CopyCommand& command,
                                                   boost::asio::io_context& io) = 0;
};

struct WorkerHandle {
    ChunkId chunk_id;
    std::unique_ptr<Worker> worker;
    int pid = -1;
    std::chrono::steady_clock::time_point started_at{};
    std::vector<int> non_fatal_exit_codes;

    /// Serializes try_reap()/request_stop()/force_kill() between threads
    std::mutex worker_mutex;

    /// true for the first caller only
    bool claim() noexcept { return !claimed_.exchange(true); }
    [[nodiscard]] bool claimed() const noexcept { return claimed_.load(); }

    void touch() noexcept {
        last_output_.store(std::chrono::steady_clock::now().time_since_epoch().count());
    }

    [[nodiscard]] std::chrono::steady_clock::time_point last_output() const noexcept {
        return std::chrono::steady_clock::time_point(
            std::chrono::steady_clock::duration(last_output_.load()));
    }

private:
    std::atomic<bool> claimed_{false};
    std::atomic<std::chrono::steady_clock::rep> last_output_{0};
};

struct WorkerOutcome {
    enum class Kind { Exited, Stalled, LaunchFailed };

    ChunkId chunk_id;
    Kind kind = Kind::Exited;
    int exit_code = -1;
    std::string reason;
};

/**
 * @brief Reap an exited worker and claim its outcome
 *
 * RETURNS: the Exited outcome if the worker has exited and this call won
 * the latch, nullopt otherwise.
 */
std::optional<WorkerOutcome> reap_outcome(WorkerHandle& handle);

struct StopFailure {
    int pid = -1;
    std::string reason;
};

/**
 * @brief Stop every worker together
 *
 * SIGTERM goes to all of them first, then they share one grace deadline;
 * the survivors get SIGKILL and share one kill_timeout deadline. Total
 * time is bounded by grace + kill_timeout whatever the number of workers.
 *
 * RETURNS: one entry per worker that could not be signalled or was still
 * alive at the end.
 */
std::vector<StopFailure> stop_workers(const std::vector<std::shared_ptr<WorkerHandle>>& handles,
                                      std::chrono::milliseconds grace,
                                      std::chrono::milliseconds kill_timeout);

} // namespace rpl::jobs
