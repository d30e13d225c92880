/**
 * @file test_dependency_graph.cpp
 * @brief Unit tests for DependencyGraph
 */

#include <gtest/gtest.h>

#include <chronos/graph/DependencyGraph.hpp>

namespace chronos {
namespace {

// =============================================================================
// Construction
// =============================================================================

TEST(DependencyGraphTest, EmptyGraphHasNoNodes) {
    DependencyGraph graph;
    EXPECT_TRUE(graph.Empty());
    EXPECT_EQ(graph.Size(), 0u);
    EXPECT_TRUE(graph.Layers().empty());
}

TEST(DependencyGraphTest, AddNodeIsIdempotent) {
    DependencyGraph graph;
    EXPECT_EQ(graph.AddNode("A"), 0u);
    EXPECT_EQ(graph.AddNode("B"), 1u);
    EXPECT_EQ(graph.AddNode("A"), 0u);
    EXPECT_EQ(graph.Size(), 2u);
}

TEST(DependencyGraphTest, AddEdgeCreatesBothNodes) {
    DependencyGraph graph;
    graph.AddEdge("Producer", "Consumer");

    EXPECT_EQ(graph.Size(), 2u);
    EXPECT_TRUE(graph.Contains("Producer"));
    EXPECT_TRUE(graph.Contains("Consumer"));
    EXPECT_EQ(graph.EdgeCount(), 1u);
}

TEST(DependencyGraphTest, DuplicateEdgesIgnored) {
    DependencyGraph graph;
    graph.AddEdge("A", "B");
    graph.AddEdge("A", "B");
    EXPECT_EQ(graph.EdgeCount(), 1u);
}

TEST(DependencyGraphTest, DependenciesAndDependents) {
    DependencyGraph graph;
    graph.AddDependencies("C", {"A", "B"});

    EXPECT_EQ(graph.GetDependencies("C"), (std::vector<NodeId>{"A", "B"}));
    EXPECT_EQ(graph.GetDependents("A"), (std::vector<NodeId>{"C"}));
    EXPECT_TRUE(graph.GetDependencies("A").empty());
}

TEST(DependencyGraphTest, UnknownNodeQueryThrows) {
    DependencyGraph graph;
    graph.AddNode("A");
    EXPECT_THROW((void)graph.GetDependencies("Z"), SchedulerError);
}

TEST(DependencyGraphTest, NodesKeepInsertionOrder) {
    DependencyGraph graph;
    graph.AddDependencies("B", {"A"});
    graph.AddNode("D");

    EXPECT_EQ(graph.GetNodes(), (std::vector<NodeId>{"B", "A", "D"}));
}

// =============================================================================
// Topological Sort
// =============================================================================

TEST(DependencyGraphTest, TopologicalSortChain) {
    DependencyGraph graph;
    graph.AddEdge("B", "C");
    graph.AddEdge("A", "B");

    auto result = graph.TopologicalSort();
    ASSERT_TRUE(result.IsValid());
    EXPECT_EQ(result.order, (std::vector<NodeId>{"A", "B", "C"}));
}

TEST(DependencyGraphTest, TopologicalSortReportsCycle) {
    DependencyGraph graph;
    graph.AddEdge("A", "B");
    graph.AddEdge("B", "A");
    graph.AddNode("C");

    auto result = graph.TopologicalSort();
    EXPECT_FALSE(result.IsValid());
    EXPECT_TRUE(result.has_cycles);
    ASSERT_FALSE(result.cycles.empty());
    EXPECT_EQ(result.cycles[0].nodes.size(), 2u);
}

// =============================================================================
// Layers
// =============================================================================

TEST(DependencyGraphTest, LayersGroupIndependentNodes) {
    DependencyGraph graph;
    graph.AddDependencies("C", {"A", "B"});
    graph.AddDependencies("D", {"C"});
    graph.AddNode("E");

    auto layers = graph.Layers();
    ASSERT_EQ(layers.size(), 3u);
    EXPECT_EQ(layers[0], (std::vector<NodeId>{"A", "B", "E"}));
    EXPECT_EQ(layers[1], (std::vector<NodeId>{"C"}));
    EXPECT_EQ(layers[2], (std::vector<NodeId>{"D"}));
}

TEST(DependencyGraphTest, DiamondLayers) {
    DependencyGraph graph;
    graph.AddDependencies("B", {"A"});
    graph.AddDependencies("C", {"A"});
    graph.AddDependencies("D", {"B", "C"});

    auto layers = graph.Layers();
    ASSERT_EQ(layers.size(), 3u);
    EXPECT_EQ(layers[1], (std::vector<NodeId>{"B", "C"}));
}

TEST(DependencyGraphTest, LayersThrowOnCycle) {
    DependencyGraph graph;
    graph.AddEdge("A", "B");
    graph.AddEdge("B", "C");
    graph.AddEdge("C", "A");

    try {
        (void)graph.Layers();
        FAIL() << "expected CyclicGraphError";
    } catch (const CyclicGraphError &e) {
        ASSERT_EQ(e.cycles().size(), 1u);
        EXPECT_EQ(e.cycles()[0].ToString(), "Cycle detected: A -> B -> C -> A");
    }
}

TEST(DependencyGraphTest, SelfLoopIsACycle) {
    DependencyGraph graph;
    graph.AddEdge("A", "A");
    EXPECT_THROW((void)graph.Layers(), CyclicGraphError);
}

} // namespace
} // namespace chronos
