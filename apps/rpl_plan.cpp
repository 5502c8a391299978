/**
 * @file rpl_plan.cpp
 * @brief Profiles a directory tree and prints the chunk plan
 *
 * Run with:
 *   ./build/rpl_plan /srv/projects
 *   ./build/rpl_plan /srv/projects --max-bytes 1073741824 --max-files 5000 --max-depth 6
 */

#include "rpl/plan/chunk_planner.hpp"
#include "rpl/plan/profiler.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>
#include <string>

using namespace rpl;

namespace {

void print_usage() {
    std::cerr << "Usage: rpl_plan <source> [--max-bytes N] [--max-files N] [--max-depth N]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    const std::string source = argv[1];
    plan::PlanParameters params{10ULL * 1024 * 1024 * 1024, 50000, 0};

    try {
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (i + 1 >= argc) {
                print_usage();
                return 2;
            }
            const std::string value = argv[++i];
            if (arg == "--max-bytes") {
                params.max_bytes = std::stoull(value);
            } else if (arg == "--max-files") {
                params.max_files = std::stoull(value);
            } else if (arg == "--max-depth") {
                params.max_depth = static_cast<std::uint32_t>(std::stoul(value));
            } else {
                print_usage();
                return 2;
            }
        }
    } catch (const std::logic_error& e) {
        spdlog::error("Bad number: {}", e.what());
        return 2;
    }
    if (params.max_bytes == 0 || params.max_files == 0) {
        spdlog::error("Thresholds must be positive");
        return 2;
    }

    auto profiler = plan::DirectoryProfiler::open(source);
    if (profiler.is_error()) {
        spdlog::error("{}", profiler.error().message);
        return 1;
    }

    plan::ChunkPlanner planner(params, source, "", "preview");
    const auto chunks = planner.plan(profiler.value());

    for (const auto& chunk : chunks) {
        std::cout << chunk.id.str() << "  "
                  << (chunk.recursive ? "R " : "F ")
                  << (chunk.oversized ? "! " : "  ")
                  << chunk.estimated_bytes << " B  "
                  << chunk.estimated_files << " files  "
                  << (chunk.relative_path.empty() ? "." : chunk.relative_path) << "\n";
    }

    const auto totals = plan::summarize(chunks);
    std::cout << "\n" << totals.chunks << " chunk(s), " << totals.bytes << " bytes, "
              << totals.files << " files, " << totals.oversized << " oversized";
    if (profiler.value().unreadable_count() > 0) {
        std::cout << ", " << profiler.value().unreadable_count() << " unreadable";
    }
    std::cout << "\n";
    return 0;
}
