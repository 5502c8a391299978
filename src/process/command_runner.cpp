#include "rpl/process/command_runner.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace rpl::process {
namespace {

void set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

} // namespace

std::vector<std::string> expand_template(const core::CommandTemplate& tmpl,
                                         const std::map<std::string, std::string>& vars) {
    std::vector<std::string> argv;
    argv.reserve(tmpl.size());
    for (const auto& arg : tmpl) {
        std::string out;
        std::size_t pos = 0;
        while (pos < arg.size()) {
            const auto open = arg.find('{', pos);
            if (open == std::string::npos) {
                out.append(arg, pos, std::string::npos);
                break;
            }
            const auto close = arg.find('}', open + 1);
            if (close == std::string::npos) {
                out.append(arg, pos, std::string::npos);
                break;
            }
            out.append(arg, pos, open - pos);
            const auto name = arg.substr(open + 1, close - open - 1);
            auto it = vars.find(name);
            if (it != vars.end()) {
                out += it->second;
            } else {
                out.append(arg, open, close - open + 1);
            }
            pos = close + 1;
        }
        argv.push_back(std::move(out));
    }
    return argv;
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

std::string first_line(const std::string& output) {
    auto line = output.substr(0, output.find('\n'));
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

Result<CommandResult> SystemCommandRunner::run(const CommandLine& command) {
    LaunchOptions options;
    options.argv = command.argv;
    options.env = command.env;
    options.capture_output = true;
    options.merge_stderr = command.merge_stderr;
    options.pipe_stdin = command.input.has_value();

    auto spawned = ChildProcess::spawn(options);
    if (spawned.is_error()) {
        return Err<CommandResult>(spawned.error());
    }
    auto& child = spawned.value();

    CommandResult result;
    const std::string input = command.input.value_or("");
    std::size_t written = 0;

    int out_fd = child.stdout_fd();
    set_nonblocking(out_fd);
    if (child.stdin_fd() >= 0) {
        set_nonblocking(child.stdin_fd());
        if (input.empty()) {
            child.close_stdin();
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + command.timeout;
    bool output_open = true;
    char buffer[4096];

    while (output_open) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        fds[count++] = {out_fd, POLLIN, 0};
        const bool writing = child.stdin_fd() >= 0;
        if (writing) {
            fds[count++] = {child.stdin_fd(), POLLOUT, 0};
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int ready = ::poll(fds, count, static_cast<int>(remaining.count()) + 1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<CommandResult>(ErrorKind::Io, std::string("poll: ") + std::strerror(errno));
        }

        if (writing && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            const ssize_t n = ::write(child.stdin_fd(), input.data() + written, input.size() - written);
            if (n > 0) {
                written += static_cast<std::size_t>(n);
            }
            if (written >= input.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
                child.close_stdin();
            }
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            const ssize_t n = ::read(out_fd, buffer, sizeof(buffer));
            if (n > 0) {
                result.output.append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                output_open = false;
            }
        }
    }

    child.close_stdin();

    if (result.timed_out) {
        spdlog::warn("[Command] '{}' timed out after {}ms", command.argv.front(), command.timeout.count());
        auto terminated = child.terminate(terminate_grace_);
        if (terminated.is_error()) {
            return Err<CommandResult>(terminated.error());
        }
        result.exit_code = terminated.value();
        return Ok(std::move(result));
    }

    auto code = child.wait();
    if (code.is_error()) {
        return Err<CommandResult>(code.error());
    }
    result.exit_code = code.value();
    spdlog::debug("[Command] '{}' exited {}", command.argv.front(), result.exit_code);
    return Ok(std::move(result));
}

} // namespace rpl::process
