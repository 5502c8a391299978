/**
 * @file rpl_run.cpp
 * @brief Headless runner: replicates every configured profile in turn
 *
 * Run with:
 *   ./build/rpl_run --config /etc/rpl/rpl.json
 *   ./build/rpl_run --config rpl.json --profile engineering --dry-run
 *
 * Store a credential for unattended runs (password read from stdin):
 *   echo "$PASSWORD" | ./build/rpl_run --config rpl.json --store-credential fs01 --user svc-backup
 *
 * Exit codes: 0 all completed, 1 a profile failed, 2 configuration error,
 * 3 a profile was stopped.
 */

#include "rpl/checkpoint/checkpoint_store.hpp"
#include "rpl/core/config.hpp"
#include "rpl/core/logging.hpp"
#include "rpl/credentials/credential_store.hpp"
#include "rpl/events/components.hpp"
#include "rpl/events/event_bus.hpp"
#include "rpl/jobs/process_worker.hpp"
#include "rpl/network/mapper.hpp"
#include "rpl/network/resource_manager.hpp"
#include "rpl/orchestrator/orchestrator.hpp"
#include "rpl/process/command_runner.hpp"
#include "rpl/snapshot/manager.hpp"
#include "rpl/snapshot/provider.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace rpl;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitConfig = 2;
constexpr int kExitStopped = 3;

volatile std::sig_atomic_t g_signal = 0;

void signal_handler(int signal) {
    g_signal = signal;
}

struct Options {
    std::string config_path;
    std::optional<std::string> profile;
    std::optional<std::string> log_level;
    bool dry_run = false;
    std::optional<std::string> store_credential;
    std::optional<std::string> user;
};

void print_usage() {
    std::cerr << "Usage: rpl_run --config <file> [--profile <name>] [--dry-run] [--log-level <level>]\n"
              << "       rpl_run --config <file> --store-credential <name> --user <user>\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--dry-run") {
            options.dry_run = true;
            continue;
        }
        std::optional<std::string>* target = nullptr;
        if (arg == "--profile") {
            target = &options.profile;
        } else if (arg == "--log-level") {
            target = &options.log_level;
        } else if (arg == "--store-credential") {
            target = &options.store_credential;
        } else if (arg == "--user") {
            target = &options.user;
        } else if (arg == "--config") {
            auto v = value();
            if (!v) {
                return std::nullopt;
            }
            options.config_path = *v;
            continue;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }

        auto v = value();
        if (!v) {
            return std::nullopt;
        }
        *target = *v;
    }

    if (options.config_path.empty()) {
        std::cerr << "--config is required\n";
        return std::nullopt;
    }
    if (options.store_credential && !options.user) {
        std::cerr << "--store-credential needs --user\n";
        return std::nullopt;
    }
    return options;
}

int store_credential(credentials::CredentialStore& store, const std::string& name, const std::string& user) {
    std::string password;
    std::getline(std::cin, password);
    credentials::Credential credential(user, std::move(password));
    credentials::secure_zero(password);

    auto stored = store.store(name, credential);
    if (stored.is_error()) {
        spdlog::error("Cannot store credential '{}': {}", name, stored.error().message);
        return kExitFailed;
    }
    spdlog::info("Stored credential '{}' at {}", name, store.path_for(name).string());
    return kExitOk;
}

void print_summary(const std::string& profile, const orchestrator::RunSummary& summary) {
    std::cout << "Profile:   " << profile << "\n"
              << "Result:    " << orchestrator::to_string(summary.phase)
              << (summary.has_warnings ? " (with warnings)" : "") << "\n"
              << "Chunks:    " << summary.chunks_total << " total, "
              << summary.succeeded << " succeeded (" << summary.resumed << " resumed), "
              << summary.failed << " failed, " << summary.skipped << " skipped\n"
              << "Copied:    " << summary.bytes << " bytes, " << summary.files << " files\n"
              << "Duration:  " << summary.duration.count() << " ms\n";
    if (!summary.failure_reason.empty()) {
        std::cout << "Reason:    " << summary.failure_reason << "\n";
    }
}

void print_plan(const std::vector<plan::Chunk>& chunks) {
    for (const auto& chunk : chunks) {
        std::cout << "  " << chunk.id.str() << "  "
                  << (chunk.recursive ? "R " : "F ")
                  << (chunk.oversized ? "! " : "  ")
                  << chunk.estimated_bytes << " B  " << chunk.estimated_files << " files  "
                  << (chunk.relative_path.empty() ? "." : chunk.relative_path) << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return kExitConfig;
    }

    auto loaded = core::load_config(options->config_path);
    if (loaded.is_error()) {
        spdlog::error("Configuration error: {}", loaded.error().message);
        return kExitConfig;
    }
    auto config = std::move(loaded.value());
    if (options->log_level) {
        config.logging.level = *options->log_level;
    }
    auto logging = core::configure_logging(config.logging);
    if (logging.is_error()) {
        spdlog::error("Logging setup failed: {}", logging.error().message);
        return kExitConfig;
    }

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    process::SystemCommandRunner runner;
    credentials::CommandSecretProtector protector(config.secrets, runner);
    credentials::CredentialStore credential_store(config.credential_dir(), protector);

    if (options->store_credential) {
        return store_credential(credential_store, *options->store_credential, *options->user);
    }

    std::vector<const core::ProfileConfig*> selected;
    if (options->profile) {
        const auto* profile = config.find_profile(*options->profile);
        if (!profile) {
            spdlog::error("No profile named '{}'", *options->profile);
            return kExitConfig;
        }
        selected.push_back(profile);
    } else {
        for (const auto& profile : config.profiles) {
            selected.push_back(&profile);
        }
    }
    if (selected.empty()) {
        spdlog::error("No profiles configured");
        return kExitConfig;
    }

    snapshot::CommandSnapshotProvider snapshot_provider(config.snapshot, runner);
    snapshot::SnapshotLedger snapshot_ledger(config.snapshot_ledger_path());
    snapshot::SnapshotManager snapshots(snapshot_provider, snapshot_ledger);

    network::CifsNetworkMapper mapper(config.network, runner);
    network::MappingLedger mapping_ledger(config.mapping_ledger_path());
    network::NetworkResourceManager network(mapper, mapping_ledger, config.network);

    jobs::ProcessWorkerLauncher launcher;
    checkpoint::CheckpointStore checkpoints(config.checkpoint_dir());

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::ProgressTracker progress(bus);

    // Whatever a previous process left behind is released before new work
    snapshots.reconcile_orphans();
    network.reconcile_orphans();

    std::mutex current_mutex;
    orchestrator::Orchestrator* current = nullptr;
    std::atomic<bool> done{false};

    // Signal handlers only set a flag; this thread turns it into stop()
    std::thread watcher([&]() {
        while (!done.load()) {
            if (g_signal != 0) {
                std::lock_guard lock(current_mutex);
                if (current && current->stop()) {
                    spdlog::warn("Signal {} received, stopping {}", static_cast<int>(g_signal),
                                 current->profile().name);
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exit_code = kExitOk;
    for (const auto* profile : selected) {
        if (g_signal != 0) {
            exit_code = kExitStopped;
            break;
        }

        orchestrator::RunOptions run_options;
        run_options.dry_run = options->dry_run;
        if (profile->credential) {
            auto credential = credential_store.load(*profile->credential);
            if (credential.is_error()) {
                spdlog::error("Profile {}: credential '{}' unavailable: {}",
                              profile->name, *profile->credential, credential.error().message);
                exit_code = kExitFailed;
                continue;
            }
            run_options.credential = std::move(credential.value());
        }

        orchestrator::Orchestrator orchestrator(config, *profile,
            orchestrator::Dependencies{snapshots, network, launcher, checkpoints, bus});
        {
            std::lock_guard lock(current_mutex);
            current = &orchestrator;
        }
        auto summary = orchestrator.run(std::move(run_options));
        {
            std::lock_guard lock(current_mutex);
            current = nullptr;
        }
        bus.flush();

        if (options->dry_run) {
            print_plan(orchestrator.chunks());
        }
        print_summary(profile->name, summary);

        if (summary.phase == orchestrator::RunPhase::Stopped) {
            exit_code = kExitStopped;
            break;
        }
        if (summary.phase == orchestrator::RunPhase::Failed) {
            exit_code = kExitFailed;
        }
    }

    done = true;
    watcher.join();

    const auto totals = progress.snapshot();
    spdlog::info("Dispatched {} worker(s): {} succeeded, {} failed, {} skipped, {} retries, {} stalls",
                 totals.dispatched, totals.succeeded, totals.failed, totals.skipped, totals.retries, totals.stalls);
    return exit_code;
}
