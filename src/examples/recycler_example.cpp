/**
 * @file recycler_example.cpp
 * @brief Example demonstrating Recycler usage driven by a TOML file
 *
 * Builds one Recycler per [pools.<name>] table, drives it from four
 * threads and prints the resulting reuse statistics.
 *
 * Usage: recycler_example [config.toml]
 */

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/configuration.hpp"
#include "core/logging.hpp"
#include "core/recycler.hpp"

using namespace recycling::core;

namespace {

// Scratch state for a parser; reset() keeps the buffer's capacity
struct ParseScratch {
    std::vector<char> buffer;
    uint32_t tokens{0};

    void reset() noexcept {
        buffer.clear();
        tokens = 0;
    }
};

void print_separator() {
    std::cout << std::string(60, '-') << std::endl;
}

void print_stats(const std::string& name, const RecyclerStats& stats) {
    std::cout << "Pool [" << name << "]:" << std::endl;
    std::cout << "  Capacity:        "
              << (stats.capacity == RecyclerConfig::UNBOUNDED ? "Unbounded" : std::to_string(stats.capacity))
              << std::endl;
    std::cout << "  Idle:            " << stats.idle << std::endl;
    std::cout << "  Constructed:     " << stats.constructed << std::endl;
    std::cout << "  Reused:          " << stats.reused << std::endl;
    std::cout << "  Discarded:       " << stats.discarded << std::endl;
    std::cout << "  Reuse Ratio:     " << stats.reuse_ratio() << std::endl;
}

void run_workload(Recycler<ParseScratch>& pool, int threads, int iterations) {
    std::vector<std::thread> workers;
    workers.reserve(threads);

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&pool, iterations]() {
            for (int i = 0; i < iterations; ++i) {
                auto scratch = pool.allocate();
                scratch->buffer.assign(128, 'x');
                scratch->tokens = static_cast<uint32_t>(i);
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }
}

std::optional<std::filesystem::path> locate_config(int argc, char* argv[]) {
    if (argc > 1) {
        return std::filesystem::path(argv[1]);
    }
    for (const char* candidate : {"config/recycling.toml", "../config/recycling.toml", "../../config/recycling.toml"}) {
        if (std::filesystem::exists(candidate)) {
            return std::filesystem::path(candidate);
        }
    }
    return std::nullopt;
}

}  // namespace

int main(int argc, char* argv[]) {
    const auto config_file = locate_config(argc, argv);
    if (!config_file) {
        std::cerr << "No recycling.toml found; pass one as the first argument" << std::endl;
        return 1;
    }

    try {
        Configuration config;
        config.load_from_file(*config_file);
        configure_logging(config.get_system());

        for (const auto& name : config.get_pool_names()) {
            Recycler<ParseScratch> pool(config.get_pool(name).value_or(RecyclerConfig{}));
            run_workload(pool, 4, 10000);

            print_separator();
            print_stats(name, pool.stats());
        }
        print_separator();
    } catch (const std::exception& e) {
        spdlog::error("Recycler example failed: {}", e.what());
        return 1;
    }

    return 0;
}
