#include "rpl/snapshot/provider.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace rpl::snapshot {

namespace fs = std::filesystem;

CommandSnapshotProvider::CommandSnapshotProvider(core::SnapshotConfig config, process::CommandRunner& runner)
    : config_(std::move(config)), runner_(runner) {}

std::string CommandSnapshotProvider::junction_name(const ShadowId& id) {
    return ".rpl-snapshot-" + id.bare().substr(0, 8);
}

Result<process::CommandResult> CommandSnapshotProvider::execute(const core::CommandTemplate& tmpl,
                                                                bool remote,
                                                                std::map<std::string, std::string> vars) {
    process::CommandLine command;
    if (remote) {
        command.argv = process::expand_template(config_.remote.exec_prefix, vars);
    }
    for (auto& arg : process::expand_template(tmpl, vars)) {
        command.argv.push_back(std::move(arg));
    }
    command.timeout = config_.command_timeout;
    spdlog::debug("[Snapshot] {}", process::format_command(command.argv));
    return runner_.run(command);
}

Result<std::string> CommandSnapshotProvider::remote_volume(const UncPath& share) {
    const auto key = share.server() + "/" + share.share();
    for (const auto& [name, root] : config_.remote.share_roots) {
        // Server and share names compare case-insensitively
        try {
            if (UncPath("//" + name).same_root(share)) {
                return Ok(root);
            }
        } catch (const std::invalid_argument& e) {
            spdlog::warn("[Snapshot] Ignoring share_roots entry '{}': {}", name, e.what());
        }
    }
    return Err<std::string>(ErrorKind::ResourceAcquisition,
        "No snapshot.remote.share_roots entry for '" + key + "'");
}

Result<std::string> CommandSnapshotProvider::create_snapshot(const SnapshotTarget& target, const ShadowId& id) {
    const auto& root = target.remote ? config_.remote.snapshot_root : config_.local.snapshot_root;
    const auto snapshot_path = (fs::path(root) / id.bare()).string();
    const auto& tmpl = target.remote ? config_.remote.create : config_.local.create;

    if (!target.remote) {
        std::error_code ec;
        fs::create_directories(root, ec);
        if (ec) {
            return Err<std::string>(ErrorKind::ResourceAcquisition,
                "Cannot create snapshot root " + root + ": " + ec.message());
        }
    }

    auto result = execute(tmpl, target.remote, {
        {"volume", target.volume},
        {"snapshot_path", snapshot_path},
        {"server", target.server},
        {"shadow_id", id.str()}
    });
    if (result.is_error()) {
        return Err<std::string>(ErrorKind::ResourceAcquisition,
            "Snapshot command failed to start: " + result.error().message);
    }
    if (!result.value().ok()) {
        return Err<std::string>(ErrorKind::ResourceAcquisition,
            "Snapshot of " + target.volume + " failed (exit " + std::to_string(result.value().exit_code) +
            "): " + process::first_line(result.value().output));
    }
    return Ok(snapshot_path);
}

Result<void> CommandSnapshotProvider::delete_snapshot(const SnapshotRecord& record) {
    std::map<std::string, std::string> vars{
        {"volume", record.source_volume},
        {"snapshot_path", record.snapshot_path},
        {"server", record.server},
        {"shadow_id", record.shadow_id.str()}
    };

    if (record.is_remote) {
        auto exists = execute(config_.remote.exists, true, vars);
        if (exists.is_ok() && !exists.value().timed_out && exists.value().exit_code == 1) {
            spdlog::debug("[Snapshot] {} already gone on {}", record.snapshot_path, record.server);
            return Ok();
        }
    } else {
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(record.snapshot_path, ec))) {
            return Ok();
        }
    }

    const auto& tmpl = record.is_remote ? config_.remote.remove : config_.local.remove;
    auto result = execute(tmpl, record.is_remote, std::move(vars));
    if (result.is_error()) {
        return Err<void>(result.error());
    }
    if (!result.value().ok()) {
        return Err<void>(ErrorKind::Io,
            "Removing snapshot " + record.snapshot_path + " failed (exit " +
            std::to_string(result.value().exit_code) + "): " + process::first_line(result.value().output));
    }
    return Ok();
}

Result<std::string> CommandSnapshotProvider::create_junction(const SnapshotRecord& record) {
    const auto junction_path = record.source_volume + "/" + junction_name(record.shadow_id);
    auto result = execute(config_.remote.create_junction, true, {
        {"snapshot_path", record.snapshot_path},
        {"junction_path", junction_path},
        {"server", record.server},
        {"shadow_id", record.shadow_id.str()}
    });
    if (result.is_error()) {
        return Err<std::string>(ErrorKind::ResourceAcquisition,
            "Junction command failed to start: " + result.error().message);
    }
    if (!result.value().ok()) {
        return Err<std::string>(ErrorKind::ResourceAcquisition,
            "Creating junction " + junction_path + " failed: " + process::first_line(result.value().output));
    }
    return Ok(junction_path);
}

Result<void> CommandSnapshotProvider::delete_junction(const SnapshotRecord& record) {
    if (!record.junction_path) {
        return Ok();
    }
    auto result = execute(config_.remote.remove_junction, true, {
        {"junction_path", *record.junction_path},
        {"snapshot_path", record.snapshot_path},
        {"server", record.server},
        {"shadow_id", record.shadow_id.str()}
    });
    if (result.is_error()) {
        return Err<void>(result.error());
    }
    if (!result.value().ok()) {
        return Err<void>(ErrorKind::Io,
            "Removing junction " + *record.junction_path + " failed: " + process::first_line(result.value().output));
    }
    return Ok();
}

} // namespace rpl::snapshot
