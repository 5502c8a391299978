#include "rpl/core/config.hpp"

#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace rpl::core {
namespace {

using json = nlohmann::json;

template<typename T>
void read_value(const json& object, const char* key, T& target) {
    if (object.contains(key) && !object.at(key).is_null()) {
        target = object.at(key).get<T>();
    }
}

void read_millis(const json& object, const char* key, std::chrono::milliseconds& target) {
    if (object.contains(key) && !object.at(key).is_null()) {
        target = std::chrono::milliseconds(object.at(key).get<std::int64_t>());
    }
}

const json& section(const json& document, const char* key) {
    static const json empty = json::object();
    if (document.contains(key) && document.at(key).is_object()) {
        return document.at(key);
    }
    return empty;
}

void parse_engine(const json& engine, EngineConfig& config) {
    read_value(engine, "concurrency", config.concurrency);

    std::string state_dir = config.state_dir.string();
    read_value(engine, "state_dir", state_dir);
    config.state_dir = state_dir;

    const auto& chunking = section(engine, "chunking");
    read_value(chunking, "max_bytes", config.chunking.max_bytes);
    read_value(chunking, "max_files", config.chunking.max_files);
    read_value(chunking, "max_depth", config.chunking.max_depth);

    const auto& retry = section(engine, "retry");
    read_value(retry, "max_attempts", config.retry.max_attempts);
    read_millis(retry, "delay_ms", config.retry.delay);

    const auto& breaker = section(engine, "circuit_breaker");
    read_value(breaker, "threshold", config.circuit_breaker.threshold);
    read_millis(breaker, "window_ms", config.circuit_breaker.window);

    const auto& health = section(engine, "health");
    read_millis(health, "poll_interval_ms", config.health.poll_interval);
    read_millis(health, "stall_timeout_ms", config.health.stall_timeout);
    read_millis(health, "terminate_grace_ms", config.health.terminate_grace);
    read_millis(health, "kill_timeout_ms", config.health.kill_timeout);
    read_value(health, "probe_every_ticks", config.health.probe_every_ticks);
}

void parse_copy_tool(const json& tool, CopyToolConfig& config) {
    read_value(tool, "program", config.program);
    read_value(tool, "flags", config.flags);
    read_value(tool, "recursive_flags", config.recursive_flags);
    read_value(tool, "files_only_flags", config.files_only_flags);
    read_value(tool, "non_fatal_exit_codes", config.non_fatal_exit_codes);
}

void parse_snapshot(const json& snapshot, SnapshotConfig& config) {
    read_millis(snapshot, "command_timeout_ms", config.command_timeout);

    const auto& local = section(snapshot, "local");
    read_value(local, "snapshot_root", config.local.snapshot_root);
    read_value(local, "create", config.local.create);
    read_value(local, "remove", config.local.remove);

    const auto& remote = section(snapshot, "remote");
    read_value(remote, "exec_prefix", config.remote.exec_prefix);
    read_value(remote, "snapshot_root", config.remote.snapshot_root);
    read_value(remote, "share_roots", config.remote.share_roots);
    read_value(remote, "create", config.remote.create);
    read_value(remote, "remove", config.remote.remove);
    read_value(remote, "exists", config.remote.exists);
    read_value(remote, "create_junction", config.remote.create_junction);
    read_value(remote, "remove_junction", config.remote.remove_junction);
}

void parse_network(const json& network, NetworkConfig& config) {
    read_value(network, "mount_root", config.mount_root);
    read_value(network, "letters", config.letters);
    read_value(network, "max_letter_attempts", config.max_letter_attempts);
    read_value(network, "mount", config.mount);
    read_value(network, "unmount", config.unmount);
    read_millis(network, "command_timeout_ms", config.command_timeout);
}

void parse_secrets(const json& secrets, SecretsConfig& config) {
    read_value(secrets, "encrypt", config.encrypt);
    read_value(secrets, "decrypt", config.decrypt);
    read_millis(secrets, "command_timeout_ms", config.command_timeout);
}

void parse_logging(const json& logging, LoggingConfig& config) {
    read_value(logging, "level", config.level);
    read_value(logging, "pattern", config.pattern);
    if (logging.contains("file") && logging.at("file").is_string()) {
        config.file = logging.at("file").get<std::string>();
    }
    read_value(logging, "max_file_size", config.max_file_size);
    read_value(logging, "max_files", config.max_files);
}

ProfileConfig parse_profile(const json& entry) {
    ProfileConfig profile;
    read_value(entry, "name", profile.name);
    read_value(entry, "source", profile.source);
    read_value(entry, "destination", profile.destination);
    read_value(entry, "use_snapshot", profile.use_snapshot);
    if (entry.contains("credential") && entry.at("credential").is_string()) {
        profile.credential = entry.at("credential").get<std::string>();
    }
    return profile;
}

Result<void> invalid(const std::string& message) {
    return Err<void>(ErrorKind::InvalidConfig, message);
}

} // namespace

const ProfileConfig* EngineConfig::find_profile(const std::string& name) const {
    for (const auto& profile : profiles) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

Result<EngineConfig> parse_config(const json& document) {
    if (!document.is_object()) {
        return Err<EngineConfig>(ErrorKind::InvalidConfig, "Config root must be a JSON object");
    }

    EngineConfig config;
    try {
        parse_engine(section(document, "engine"), config);
        parse_copy_tool(section(document, "copy_tool"), config.copy_tool);
        parse_snapshot(section(document, "snapshot"), config.snapshot);
        parse_network(section(document, "network"), config.network);
        parse_secrets(section(document, "secrets"), config.secrets);
        parse_logging(section(document, "logging"), config.logging);

        if (document.contains("profiles")) {
            const auto& profiles = document.at("profiles");
            if (!profiles.is_array()) {
                return Err<EngineConfig>(ErrorKind::InvalidConfig, "'profiles' must be an array");
            }
            for (const auto& entry : profiles) {
                config.profiles.push_back(parse_profile(entry));
            }
        }
    } catch (const json::exception& e) {
        return Err<EngineConfig>(ErrorKind::InvalidConfig, std::string("Config type error: ") + e.what());
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return Err<EngineConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<EngineConfig>(ErrorKind::InvalidConfig, "Cannot open config file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return Err<EngineConfig>(ErrorKind::InvalidConfig, "Config file is not valid JSON: " + path.string());
    }
    return parse_config(document);
}

Result<void> validate(const EngineConfig& config) {
    if (config.concurrency < 1 || config.concurrency > 256) {
        return invalid("engine.concurrency must be between 1 and 256");
    }
    if (config.state_dir.empty()) {
        return invalid("engine.state_dir must not be empty");
    }
    if (config.chunking.max_bytes == 0 || config.chunking.max_files == 0) {
        return invalid("chunking thresholds must be > 0");
    }
    if (config.retry.max_attempts < 1) {
        return invalid("retry.max_attempts must be >= 1");
    }
    if (config.retry.delay.count() < 0) {
        return invalid("retry.delay_ms must not be negative");
    }
    if (config.circuit_breaker.threshold < 1) {
        return invalid("circuit_breaker.threshold must be >= 1");
    }
    if (config.circuit_breaker.window.count() <= 0) {
        return invalid("circuit_breaker.window_ms must be > 0");
    }
    if (config.health.poll_interval.count() <= 0 ||
        config.health.stall_timeout.count() <= 0 ||
        config.health.terminate_grace.count() <= 0 ||
        config.health.kill_timeout.count() <= 0) {
        return invalid("health durations must be > 0");
    }
    if (config.copy_tool.program.empty()) {
        return invalid("copy_tool.program must not be empty");
    }
    if (config.copy_tool.non_fatal_exit_codes.empty()) {
        return invalid("copy_tool.non_fatal_exit_codes must list at least one code");
    }
    if (config.network.letters.empty()) {
        return invalid("network.letters must not be empty");
    }
    for (char letter : config.network.letters) {
        if (!std::isalpha(static_cast<unsigned char>(letter))) {
            return invalid(std::string("network.letters contains a non-letter: '") + letter + "'");
        }
    }
    if (config.network.max_letter_attempts < 1) {
        return invalid("network.max_letter_attempts must be >= 1");
    }

    std::set<std::string> names;
    for (const auto& profile : config.profiles) {
        if (profile.name.empty() || profile.source.empty() || profile.destination.empty()) {
            return invalid("every profile needs name, source and destination");
        }
        if (!names.insert(profile.name).second) {
            return invalid("duplicate profile name: " + profile.name);
        }
    }
    return Ok();
}

} // namespace rpl::core
