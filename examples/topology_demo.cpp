/**
 * @file topology_demo.cpp
 * @brief Consideration Queue Demo
 *
 * Demonstrates how node dependencies become a consideration queue.
 *
 * The nodes are declared in the WRONG order:
 *   Report -> Filter -> Merge -> Sensor_A -> Sensor_B
 *
 * But the dependencies define the layering:
 *   Sensor_A, Sensor_B -> Merge -> Filter -> Report
 *
 * Each layer holds nodes whose prerequisites all sit in earlier layers.
 * A cycle is reported with its path instead of a queue.
 *
 * Usage: ./topology_demo
 */

#include <chronos/chronos.hpp>

#include <iostream>

using namespace chronos;

int main() {
    std::cout << "======================================================\n";
    std::cout << "       Chronos Topology Demo\n";
    std::cout << "       Consideration Queue from Dependencies\n";
    std::cout << "======================================================\n\n";

    DependencyGraph graph;
    graph.AddDependencies("Report", {"Filter"});
    graph.AddDependencies("Filter", {"Merge"});
    graph.AddDependencies("Merge", {"Sensor_A", "Sensor_B"});

    std::cout << "Declared nodes: " << FormatList(graph.GetNodes()) << "\n";
    std::cout << "Edges: " << graph.EdgeCount() << "\n\n";

    // =========================================================================
    // Layering
    // =========================================================================

    auto queue = ConsiderationQueue::FromGraph(graph);
    std::cout << "Consideration queue:\n";
    for (std::size_t i = 0; i < queue.Size(); ++i) {
        std::cout << "  layer " << i << ": " << FormatSet(queue[i]) << "\n";
    }

    auto sorted = graph.TopologicalSort();
    std::cout << "\nTopological order: " << FormatList(sorted.order) << "\n";

    // =========================================================================
    // Default run: every node once, in layer order
    // =========================================================================

    Scheduler sched(graph, SchedulerOptions{"pipeline"});
    std::cout << "\nDefault run:\n";
    for (const auto &step : sched.RunToCompletion({{TimeScale::Trial, conditions::AllHaveRun()}})) {
        std::cout << "  " << FormatSet(step) << "\n";
    }

    // =========================================================================
    // Cycle detection
    // =========================================================================

    graph.AddDependencies("Sensor_A", {"Report"});
    std::cout << "\nAfter adding Report -> Sensor_A:\n";
    try {
        (void)ConsiderationQueue::FromGraph(graph);
    } catch (const CyclicGraphError &e) {
        for (const auto &cycle : e.cycles()) {
            std::cout << "  " << cycle.ToString() << "\n";
        }
    }

    return 0;
}
