/**
 * @file config_driven_demo.cpp
 * @brief Configuration-Driven Scheduler Demo
 *
 * Demonstrates the YAML path:
 * - io::ScheduleLoader::Load() reads nodes, dependencies, conditions and terminations
 * - ScheduleBuilder::FromConfig() compiles the condition expressions
 * - ScheduleIntrospection writes the resulting schedule to JSON
 *
 * Usage: ./config_driven_demo [config_path] [snapshot_path]
 *        Default: config/pipeline.yaml
 */

#include <chronos/chronos.hpp>

#include <filesystem>
#include <iostream>

using namespace chronos;
namespace fs = std::filesystem;

int main(int argc, char *argv[]) {
    std::string config_path = "config/pipeline.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    if (!fs::exists(config_path)) {
        std::cerr << "❌ Config not found: " << config_path << "\n";
        std::cerr << "   Run from the examples directory or specify path as argument.\n";
        return 1;
    }

    std::cout << "Loading: " << config_path << "\n";

    std::unique_ptr<Scheduler> sched;
    try {
        auto config = io::ScheduleLoader::Load(config_path);
        sched = ScheduleBuilder::FromConfig(config);
    } catch (const Error &e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        return 1;
    }

    auto report = sched->Validate();
    for (const auto &warning : report.GetWarnings()) {
        std::cout << "  warning: " << warning << "\n";
    }
    if (!report.IsValid()) {
        for (const auto &error : report.GetErrors()) {
            std::cerr << "❌ " << error << "\n";
        }
        return 1;
    }

    // =========================================================================
    // Run one trial
    // =========================================================================

    ExecutionHistory history;
    try {
        history = sched->RunToCompletion();
    } catch (const std::exception &e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n" << sched->Name() << ": " << history.size() << " time-steps, "
              << ToString(sched->Status()) << "\n";
    for (std::size_t i = 0; i < history.size(); ++i) {
        std::cout << "  " << i << ": " << FormatSet(history[i]) << "\n";
    }

    // =========================================================================
    // Snapshot
    // =========================================================================

    if (argc > 2) {
        try {
            io::ScheduleIntrospection::Capture(*sched).ToJSONFile(argv[2]);
            std::cout << "\nSnapshot written to " << argv[2] << "\n";
        } catch (const IOError &e) {
            std::cerr << "❌ Error: " << e.what() << "\n";
            return 1;
        }
    }

    return 0;
}
