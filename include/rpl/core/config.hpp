#pragma once

/**
 * @file config.hpp
 * @brief Engine configuration loaded from a JSON file
 *
 * The config is parsed and validated once, before any orchestrator is
 * constructed, and is then treated as immutable for the run.
 *
 * EXAMPLE FILE:
 * {
 *   "engine": { "concurrency": 4, "state_dir": "/var/lib/rpl",
 *               "chunking": { "max_bytes": 10737418240, "max_files": 50000 } },
 *   "profiles": [ { "name": "projects", "source": "//fs01/projects",
 *                   "destination": "/backup/projects", "use_snapshot": true,
 *                   "credential": "fs01" } ]
 * }
 */

#include "rpl/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rpl::core {

using CommandTemplate = std::vector<std::string>;

struct ChunkingConfig {
    std::uint64_t max_bytes = 10ULL * 1024 * 1024 * 1024;
    std::uint64_t max_files = 50000;
    std::uint32_t max_depth = 0; ///< 0 = unlimited
};

struct RetryConfig {
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds delay{5000};
};

struct CircuitBreakerConfig {
    std::uint32_t threshold = 5;
    std::chrono::milliseconds window{std::chrono::minutes(10)};
};

struct HealthConfig {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds stall_timeout{std::chrono::minutes(10)};
    std::chrono::milliseconds terminate_grace{10000};
    /// How long a worker may survive SIGKILL before it is given up on
    std::chrono::milliseconds kill_timeout{5000};
    std::uint32_t probe_every_ticks = 30;
};

struct CopyToolConfig {
    std::string program = "rsync";
    std::vector<std::string> flags{"-lptgoD", "--partial", "--mkpath", "--info=progress2"};
    std::vector<std::string> recursive_flags{"--recursive"};
    std::vector<std::string> files_only_flags{"--dirs", "--exclude=*/"};
    std::vector<int> non_fatal_exit_codes{0, 24};
};

struct LocalSnapshotConfig {
    std::string snapshot_root = "/var/lib/rpl/snapshots";
    CommandTemplate create{"btrfs", "subvolume", "snapshot", "-r", "{volume}", "{snapshot_path}"};
    CommandTemplate remove{"btrfs", "subvolume", "delete", "{snapshot_path}"};
};

struct RemoteSnapshotConfig {
    CommandTemplate exec_prefix{"ssh", "-o", "BatchMode=yes", "{server}"};
    std::string snapshot_root = "/var/lib/rpl/snapshots";
    /// "server/share" -> share root path on the server
    std::map<std::string, std::string> share_roots;
    CommandTemplate create{"btrfs", "subvolume", "snapshot", "-r", "{volume}", "{snapshot_path}"};
    CommandTemplate remove{"btrfs", "subvolume", "delete", "{snapshot_path}"};
    CommandTemplate exists{"test", "-e", "{snapshot_path}"};
    CommandTemplate create_junction{"ln", "-s", "{snapshot_path}", "{junction_path}"};
    CommandTemplate remove_junction{"rm", "-f", "{junction_path}"};
};

struct SnapshotConfig {
    LocalSnapshotConfig local;
    RemoteSnapshotConfig remote;
    std::chrono::milliseconds command_timeout{std::chrono::minutes(2)};
};

struct NetworkConfig {
    std::string mount_root = "/mnt/rpl";
    std::string letters = "ZYXWVUTSRQPONMLKJIHGFED";
    std::uint32_t max_letter_attempts = 5;
    CommandTemplate mount{"mount", "-t", "cifs", "{remote}", "{mount_point}"};
    CommandTemplate unmount{"umount", "{mount_point}"};
    std::chrono::milliseconds command_timeout{60000};
};

struct SecretsConfig {
    CommandTemplate encrypt{"systemd-creds", "encrypt", "--name={name}", "-", "-"};
    CommandTemplate decrypt{"systemd-creds", "decrypt", "--name={name}", "-", "-"};
    std::chrono::milliseconds command_timeout{30000};
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
    std::optional<std::string> file;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
};

struct ProfileConfig {
    std::string name;
    std::string source;
    std::string destination;
    bool use_snapshot = false;
    std::optional<std::string> credential;
};

struct EngineConfig {
    std::uint32_t concurrency = 4;
    std::filesystem::path state_dir = "/var/lib/rpl";
    ChunkingConfig chunking;
    RetryConfig retry;
    CircuitBreakerConfig circuit_breaker;
    HealthConfig health;
    CopyToolConfig copy_tool;
    SnapshotConfig snapshot;
    NetworkConfig network;
    SecretsConfig secrets;
    LoggingConfig logging;
    std::vector<ProfileConfig> profiles;

    [[nodiscard]] std::filesystem::path snapshot_ledger_path() const { return state_dir / "snapshots.json"; }
    [[nodiscard]] std::filesystem::path mapping_ledger_path() const { return state_dir / "mappings.json"; }
    [[nodiscard]] std::filesystem::path checkpoint_dir() const { return state_dir / "checkpoints"; }
    [[nodiscard]] std::filesystem::path credential_dir() const { return state_dir / "credentials"; }

    [[nodiscard]] const ProfileConfig* find_profile(const std::string& name) const;
};

/**
 * @brief Build a config from a parsed JSON document
 *
 * Missing keys keep their defaults. Type mismatches and failed validation
 * return InvalidConfig.
 */
Result<EngineConfig> parse_config(const nlohmann::json& document);

Result<EngineConfig> load_config(const std::filesystem::path& path);

Result<void> validate(const EngineConfig& config);

} // namespace rpl::core
