#include "config.hpp"
#include "admission_service.hpp"
#include "snapshot.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <chrono>

namespace {
    void print_usage(const char* program) {
        std::cerr << "Usage: " << program << " <snapshot.json> [config.json] [report.json]\n"
                  << "  Runs one admission cycle over the snapshot and prints or writes the report.\n";
    }
}

int main(int argc, char* argv[]) {
    // Set up logger
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("admission_service", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info); // Default, will be overridden by config
    spdlog::flush_on(spdlog::level::info);

    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }
    std::string snapshot_path = argv[1];
    std::string config_path = argc > 2 ? argv[2] : "";
    std::string report_path = argc > 3 ? argv[3] : "";

    // Load configuration
    Config config;
    try {
        if (!config_path.empty()) {
            config.load(config_path);
        }
        config.load_from_env();
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Configuration loaded (profile={}, capacity={}, max_new_per_cycle={})",
                     config.profile, config.capacity, config.max_new_positions_per_cycle);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    CycleSnapshot snapshot;
    try {
        snapshot = CycleSnapshot::load(snapshot_path, std::chrono::system_clock::now());
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load cycle snapshot: {}", e.what());
        return 1;
    }

    PortfolioState portfolio(config.capacity, snapshot.positions);
    if (portfolio.size() > static_cast<size_t>(portfolio.capacity())) {
        spdlog::warn("Snapshot holds {} open positions, above capacity {}", portfolio.size(), portfolio.capacity());
    }

    try {
        AdmissionService service(config);
        CycleResult result = service.run_cycle(snapshot.candidates, portfolio, snapshot.cooldowns, snapshot.now);

        auto report = build_cycle_report(result, portfolio, snapshot.cooldowns, snapshot.now);
        if (report_path.empty()) {
            std::cout << report.dump(2) << std::endl;
        } else {
            write_cycle_report(report_path, report);
            spdlog::info("Cycle report written to {}", report_path);
        }
    } catch (const std::exception& e) {
        spdlog::critical("Admission cycle failed: {}", e.what());
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
