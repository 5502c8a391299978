#pragma once

/**
 * @file child_process.hpp
 * @brief fork/exec wrapper owning one subprocess and its pipes
 *
 * WHAT IT DOES:
 * - Spawns argv[0] via PATH lookup in its own process group, so the whole
 *   group (rsync and its helpers) can be signalled at once
 * - Optionally captures stdout+stderr into one pipe and feeds stdin from
 *   another
 * - Reports exec failures as spawn errors instead of a child exit code
 * - terminate(): SIGTERM to the group, wait up to a grace period, then
 *   SIGKILL and wait again, never longer than kill_timeout
 *
 * Exit codes: normal exit yields the exit status, death by signal yields
 * 128 + signal number.
 *
 * THREAD SAFETY:
 * Not thread-safe. One owner drives waits and termination.
 *
 * EXAMPLE:
 * auto child = ChildProcess::spawn({{"rsync", "-a", "src/", "dst/"}});
 * if (child.is_ok()) {
 *     auto code = child.value().wait();
 * }
 */

#include "rpl/core/result.hpp"

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rpl::process {

using Environment = std::vector<std::pair<std::string, std::string>>;

struct LaunchOptions {
    std::vector<std::string> argv;
    Environment env;             ///< Added to (or overriding) the inherited environment
    bool capture_output = true;  ///< stdout into a pipe
    bool merge_stderr = true;    ///< stderr into the same pipe when capturing
    bool pipe_stdin = false;
};

class ChildProcess {
public:
    static Result<ChildProcess> spawn(const LaunchOptions& options);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Kills a child that is still running; one that does not die at once
    /// is reaped on a background thread
    ~ChildProcess();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }
    [[nodiscard]] int stdin_fd() const noexcept { return stdin_fd_; }

    /// Hand the output pipe to the caller, who must close it
    int release_stdout() noexcept;
    void close_stdin() noexcept;

    /// Non-blocking reap; exit code once the child has exited
    std::optional<int> try_wait();

    /// Blocking reap
    Result<int> wait();

    /// Polls try_wait() until the child exits or timeout passes
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// Send signal_number to the process group; no-op once exited
    Result<void> signal(int signal_number);

    /**
     * @brief SIGTERM the process group, SIGKILL after grace
     *
     * RETURNS: exit code of the reaped child. Fails when the child could
     * not be signalled (e.g. EPERM) or was still alive kill_timeout after
     * SIGKILL (uninterruptible sleep on a hung mount).
     */
    Result<int> terminate(std::chrono::milliseconds grace,
                          std::chrono::milliseconds kill_timeout = std::chrono::seconds(5));

    /// SIGKILL the process group without waiting
    void kill() noexcept;

    [[nodiscard]] bool exited() const noexcept { return exit_code_.has_value(); }

private:
    ChildProcess(pid_t pid, int stdout_fd, int stdin_fd);

    void close_fds() noexcept;
    void abandon() noexcept;

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stdin_fd_ = -1;
    std::optional<int> exit_code_;
};

/// WIFEXITED -> status, WIFSIGNALED -> 128 + signal
int decode_wait_status(int status) noexcept;

} // namespace rpl::process
