#include "rpl/process/child_process.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace rpl::process {
namespace {

constexpr auto kTerminatePoll = std::chrono::milliseconds(20);
// How long a killed child gets to disappear before it is left to the reaper
constexpr auto kReleaseWait = std::chrono::milliseconds(100);

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Build "KEY=value" strings: inherited environment with overrides applied
std::vector<std::string> merge_environment(const Environment& overrides) {
    std::vector<std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string item(*entry);
        const auto eq = item.find('=');
        const auto key = item.substr(0, eq);
        bool overridden = false;
        for (const auto& [name, value] : overrides) {
            if (name == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            merged.push_back(std::move(item));
        }
    }
    for (const auto& [name, value] : overrides) {
        merged.push_back(name + "=" + value);
    }
    return merged;
}

// A child stuck in uninterruptible sleep survives SIGKILL until the kernel
// lets go of it; a detached thread collects it whenever that happens
void reap_in_background(pid_t pid) noexcept {
    spdlog::warn("[Process] pid {} still running after SIGKILL, reaping in background", pid);
    try {
        std::thread([pid]() {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::error("[Process] Cannot start reaper for pid {}: {}; it stays a zombie", pid, e.what());
    }
}

} // namespace

int decode_wait_status(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stdin_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stdin_fd_(stdin_fd) {}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      stdout_fd_(std::exchange(other.stdout_fd_, -1)),
      stdin_fd_(std::exchange(other.stdin_fd_, -1)),
      exit_code_(std::exchange(other.exit_code_, std::nullopt)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        abandon();
        close_fds();
        pid_ = std::exchange(other.pid_, -1);
        stdout_fd_ = std::exchange(other.stdout_fd_, -1);
        stdin_fd_ = std::exchange(other.stdin_fd_, -1);
        exit_code_ = std::exchange(other.exit_code_, std::nullopt);
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    abandon();
    close_fds();
}

void ChildProcess::abandon() noexcept {
    if (pid_ <= 0 || exit_code_) {
        return;
    }
    kill();
    if (!wait_for(kReleaseWait)) {
        reap_in_background(pid_);
        exit_code_ = -1;
    }
}

void ChildProcess::close_fds() noexcept {
    close_fd(stdout_fd_);
    close_fd(stdin_fd_);
}

Result<ChildProcess> ChildProcess::spawn(const LaunchOptions& options) {
    if (options.argv.empty() || options.argv.front().empty()) {
        return Err<ChildProcess>(ErrorKind::InvalidArgument, "Cannot spawn an empty command");
    }

    // Everything the child needs is prepared before fork()
    std::vector<char*> args;
    args.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (!options.env.empty()) {
        env_strings = merge_environment(options.env);
        for (auto& item : env_strings) {
            envp.push_back(item.data());
        }
        envp.push_back(nullptr);
    }

    int out_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto cleanup = [&]() {
        for (int* fd : {&out_pipe[0], &out_pipe[1], &in_pipe[0], &in_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
    };

    if (options.capture_output && ::pipe2(out_pipe, O_CLOEXEC) != 0) {
        auto message = errno_message("pipe");
        cleanup();
        return Err<ChildProcess>(ErrorKind::Io, message);
    }
    if (options.pipe_stdin && ::pipe2(in_pipe, O_CLOEXEC) != 0) {
        auto message = errno_message("pipe");
        cleanup();
        return Err<ChildProcess>(ErrorKind::Io, message);
    }
    // Closed by a successful exec; carries errno back on failure
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        auto message = errno_message("pipe");
        cleanup();
        return Err<ChildProcess>(ErrorKind::Io, message);
    }

    const bool merge_stderr = options.merge_stderr;
    const pid_t pid = ::fork();
    if (pid < 0) {
        auto message = errno_message("fork");
        cleanup();
        return Err<ChildProcess>(ErrorKind::Io, message);
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (in_pipe[0] >= 0) {
            ::dup2(in_pipe[0], STDIN_FILENO);
        }
        if (out_pipe[1] >= 0) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
            if (merge_stderr) {
                ::dup2(out_pipe[1], STDERR_FILENO);
            }
        }
        if (envp.empty()) {
            ::execvp(args[0], args.data());
        } else {
            ::execvpe(args[0], args.data(), envp.data());
        }
        const int error = errno;
        ssize_t ignored = ::write(exec_pipe[1], &error, sizeof(error));
        (void)ignored;
        ::_exit(127);
    }

    // Parent: also set the group here so killpg() works even if the child
    // has not run setpgid() yet
    ::setpgid(pid, pid);

    close_fd(out_pipe[1]);
    close_fd(in_pipe[0]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        cleanup();
        return Err<ChildProcess>(ErrorKind::Io,
            "Cannot execute '" + options.argv.front() + "': " + std::strerror(child_errno));
    }

    spdlog::debug("[Process] Spawned {} (pid {})", options.argv.front(), pid);
    return Ok(ChildProcess(pid, out_pipe[0], in_pipe[1]));
}

int ChildProcess::release_stdout() noexcept {
    return std::exchange(stdout_fd_, -1);
}

void ChildProcess::close_stdin() noexcept {
    close_fd(stdin_fd_);
}

std::optional<int> ChildProcess::try_wait() {
    if (exit_code_ || pid_ <= 0) {
        return exit_code_;
    }
    int status = 0;
    const pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        exit_code_ = decode_wait_status(status);
    } else if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to wait for
        exit_code_ = -1;
    }
    return exit_code_;
}

Result<int> ChildProcess::wait() {
    if (exit_code_) {
        return Ok(*exit_code_);
    }
    if (pid_ <= 0) {
        return Err<int>(ErrorKind::InvalidArgument, "No child process");
    }
    int status = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);
    if (result < 0) {
        return Err<int>(ErrorKind::Io, errno_message("waitpid"));
    }
    exit_code_ = decode_wait_status(status);
    return Ok(*exit_code_);
}

std::optional<int> ChildProcess::wait_for(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto code = try_wait()) {
            return code;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kTerminatePoll, deadline - now));
    }
}

Result<void> ChildProcess::signal(int signal_number) {
    if (pid_ <= 0 || exit_code_) {
        return Ok();
    }
    if (::killpg(pid_, signal_number) != 0 && errno != ESRCH) {
        return Err<void>(ErrorKind::Io,
            "killpg(" + std::to_string(pid_) + ", " + std::to_string(signal_number) + "): " + std::strerror(errno));
    }
    return Ok();
}

Result<int> ChildProcess::terminate(std::chrono::milliseconds grace, std::chrono::milliseconds kill_timeout) {
    if (auto code = try_wait()) {
        return Ok(*code);
    }

    auto term = signal(SIGTERM);
    if (term.is_error()) {
        return Err<int>(term.error());
    }
    if (auto code = wait_for(grace)) {
        return Ok(*code);
    }

    spdlog::warn("[Process] pid {} ignored SIGTERM for {}ms, sending SIGKILL", pid_, grace.count());
    auto killed = signal(SIGKILL);
    if (killed.is_error()) {
        return Err<int>(killed.error());
    }
    if (auto code = wait_for(kill_timeout)) {
        return Ok(*code);
    }
    return Err<int>(ErrorKind::WorkerFailure,
        "pid " + std::to_string(pid_) + " did not exit after SIGKILL");
}

void ChildProcess::kill() noexcept {
    if (pid_ > 0 && !exit_code_) {
        ::killpg(pid_, SIGKILL);
    }
}

} // namespace rpl::process
