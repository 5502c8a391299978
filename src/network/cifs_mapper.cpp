#include "rpl/network/mapper.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace rpl::network {

namespace fs = std::filesystem;

namespace {

// /proc/self/mounts escapes space, tab, newline and backslash as \ooo
std::string unescape_mount_field(const std::string& field) {
    std::string out;
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            field[i + 1] >= '0' && field[i + 1] <= '7') {
            out.push_back(static_cast<char>(std::stoi(field.substr(i + 1, 3), nullptr, 8)));
            i += 3;
        } else {
            out.push_back(field[i]);
        }
    }
    return out;
}

} // namespace

bool is_mount_point(const std::string& path) {
    std::ifstream mounts("/proc/self/mounts");
    std::string line;
    while (std::getline(mounts, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string target;
        if (fields >> device >> target && unescape_mount_field(target) == path) {
            return true;
        }
    }
    return false;
}

CifsNetworkMapper::CifsNetworkMapper(core::NetworkConfig config, process::CommandRunner& runner)
    : config_(std::move(config)), runner_(runner) {}

std::string CifsNetworkMapper::mount_point(DriveLetter letter) const {
    return (fs::path(config_.mount_root) / letter.str()).string();
}

bool CifsNetworkMapper::is_letter_in_use(DriveLetter letter) {
    return is_mount_point(mount_point(letter));
}

Result<std::string> CifsNetworkMapper::map(DriveLetter letter,
                                           const UncPath& root,
                                           const credentials::Credential* credential) {
    const auto target = mount_point(letter);
    if (is_mount_point(target)) {
        return Err<std::string>(ErrorKind::Conflict, target + " is already mounted");
    }

    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        return Err<std::string>(ErrorKind::ResourceAcquisition,
            "Cannot create mount point " + target + ": " + ec.message());
    }

    process::CommandLine command;
    command.argv = process::expand_template(config_.mount, {
        {"remote", root.posix()},
        {"mount_point", target},
        {"letter", letter.str()}
    });
    command.timeout = config_.command_timeout;
    if (credential != nullptr && !credential->empty()) {
        command.env = {{"USER", credential->user()}, {"PASSWD", credential->secret()}};
    }

    auto result = runner_.run(command);
    for (auto& [name, value] : command.env) {
        credentials::secure_zero(value);
    }
    if (result.is_error()) {
        return Err<std::string>(ErrorKind::ResourceAcquisition,
            "Mount helper failed to start: " + result.error().message);
    }
    if (!result.value().ok()) {
        if (is_mount_point(target)) {
            return Err<std::string>(ErrorKind::Conflict, target + " was mounted concurrently");
        }
        return Err<std::string>(ErrorKind::ResourceAcquisition,
            "Mounting " + root.str() + " on " + target + " failed (exit " +
            std::to_string(result.value().exit_code) + "): " + process::first_line(result.value().output));
    }
    return Ok(target);
}

Result<void> CifsNetworkMapper::unmap(DriveLetter letter) {
    const auto target = mount_point(letter);
    if (!is_mount_point(target)) {
        return Ok();
    }

    process::CommandLine command;
    command.argv = process::expand_template(config_.unmount, {
        {"mount_point", target},
        {"letter", letter.str()}
    });
    command.timeout = config_.command_timeout;

    auto result = runner_.run(command);
    if (result.is_error()) {
        return Err<void>(result.error());
    }
    if (!result.value().ok()) {
        return Err<void>(ErrorKind::Io,
            "Unmounting " + target + " failed: " + process::first_line(result.value().output));
    }
    return Ok();
}

} // namespace rpl::network
