#pragma once

#include "rpl/core/config.hpp"
#include "rpl/core/result.hpp"
#include "rpl/process/child_process.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rpl::process {

struct CommandLine {
    std::vector<std::string> argv;
    Environment env;
    std::optional<std::string> input; ///< Written to stdin, then stdin is closed
    std::chrono::milliseconds timeout{60000};
    bool merge_stderr = true;
};

struct CommandResult {
    int exit_code = -1;
    std::string output; ///< stdout, with stderr interleaved when merged
    bool timed_out = false;

    [[nodiscard]] bool ok() const noexcept { return !timed_out && exit_code == 0; }
};

/**
 * @brief Runs short-lived helper commands (snapshot, mount, secret tools)
 *
 * An Err result means the command could not be run at all; a command that
 * ran and exited non-zero is an Ok result with that exit code.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual Result<CommandResult> run(const CommandLine& command) = 0;
};

class SystemCommandRunner : public CommandRunner {
public:
    explicit SystemCommandRunner(std::chrono::milliseconds terminate_grace = std::chrono::seconds(2))
        : terminate_grace_(terminate_grace) {}

    Result<CommandResult> run(const CommandLine& command) override;

private:
    std::chrono::milliseconds terminate_grace_;
};

/**
 * @brief Substitute {name} placeholders in each argument
 *
 * Unknown placeholders are left untouched.
 *
 * EXAMPLE:
 * expand_template({"umount", "{mount_point}"}, {{"mount_point", "/mnt/rpl/Z"}})
 *   -> {"umount", "/mnt/rpl/Z"}
 */
std::vector<std::string> expand_template(const core::CommandTemplate& tmpl,
                                         const std::map<std::string, std::string>& vars);

/// argv joined with spaces, for log lines
std::string format_command(const std::vector<std::string>& argv);

/// Trimmed first line of tool output, for error messages
std::string first_line(const std::string& output);

} // namespace rpl::process
