/**
 * @file phase_switching_demo.cpp
 * @brief Phase Switching Demonstration
 *
 * Two nodes trade the lead: A runs on the first pass and after every second
 * run of B; B runs after each A and keeps running on its own credit. The
 * scheduler is built in code and driven one time-step at a time.
 *
 * Usage: ./phase_switching_demo [trials]
 *        Default: 2
 */

#include <chronos/chronos.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

using namespace chronos;
namespace c = chronos::conditions;

int main(int argc, char *argv[]) {
    std::size_t trials = 2;
    if (argc > 1) {
        trials = static_cast<std::size_t>(std::strtoul(argv[1], nullptr, 10));
    }

    std::cout << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║       Chronos Phase Switching Demo                         ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝\n\n";

    LogConfig log_config;
    log_config.console_level = LogLevel::Event;
    ConfigureLogService(GetLogService(), log_config);

    std::unique_ptr<Scheduler> sched;
    try {
        sched = ScheduleBuilder()
                    .Name("phasing")
                    .AddDependency("B", {"A"})
                    .AddCondition("A", c::Any({c::AtPass(0), c::EveryNCalls("B", 2)}))
                    .AddCondition("B", c::Any({c::EveryNCalls("A", 1), c::EveryNCalls("B", 1)}))
                    .SetTermination(TimeScale::Trial, c::AfterNCalls("B", 4))
                    .LogOrder()
                    .Build();
    } catch (const Error &e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Consideration queue: " << sched->Queue().ToString() << "\n";
    std::cout << "Conditions:\n";
    for (const auto &[node, condition] : sched->Conditions().Entries()) {
        std::cout << "  " << Console::PadRight(node, 4) << condition->ToString() << "\n";
    }
    std::cout << "\n";

    // =========================================================================
    // Run trials, one time-step at a time
    // =========================================================================

    for (std::size_t trial = 0; trial < trials; ++trial) {
        std::cout << "Trial " << trial << "\n";
        std::cout << std::setw(8) << "Tick" << std::setw(12) << "Executed" << "\n";
        std::cout << std::string(20, '-') << "\n";

        try {
            auto cursor = sched->Run();
            while (auto step = cursor.Next()) {
                std::cout << std::setw(8) << sched->CurrentTick().ToString() << std::setw(12)
                          << FormatSet(*step) << "\n";
            }
        } catch (const SchedulerError &e) {
            std::cerr << "❌ Error: " << e.what() << "\n";
            return 1;
        }

        std::cout << "Status: " << ToString(sched->Status()) << "\n\n";
    }

    sched->EndRun();

    std::cout << "Lifetime executions: A=" << sched->Counters().Total(TimeScale::Life, "A")
              << " B=" << sched->Counters().Total(TimeScale::Life, "B") << "\n";
    return 0;
}
