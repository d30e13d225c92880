/**
 * @file test_consideration_queue.cpp
 * @brief Unit tests for ConsiderationQueue construction
 */

#include <gtest/gtest.h>

#include <chronos/graph/ConsiderationQueue.hpp>

namespace chronos {
namespace {

TEST(ConsiderationQueueTest, FromGraphLayersChain) {
    DependencyGraph graph;
    graph.AddDependencies("B", {"A"});
    graph.AddDependencies("C", {"B"});

    auto queue = ConsiderationQueue::FromGraph(graph);
    ASSERT_EQ(queue.Size(), 3u);
    EXPECT_EQ(queue[0], (ConsiderationSet{"A"}));
    EXPECT_EQ(queue[2], (ConsiderationSet{"C"}));
    EXPECT_EQ(queue.ToString(), "[{A}, {B}, {C}]");
}

TEST(ConsiderationQueueTest, PrerequisitesInEarlierLayers) {
    DependencyGraph graph;
    graph.AddDependencies("D", {"B", "C"});
    graph.AddDependencies("B", {"A"});
    graph.AddDependencies("C", {"A"});

    auto queue = ConsiderationQueue::FromGraph(graph);
    for (const auto &node : graph.GetNodes()) {
        auto layer = queue.LayerOf(node);
        ASSERT_TRUE(layer.has_value());
        for (const auto &prereq : graph.GetDependencies(node)) {
            EXPECT_LT(*queue.LayerOf(prereq), *layer) << prereq << " before " << node;
        }
    }
    EXPECT_EQ(queue.NodeCount(), 4u);
}

TEST(ConsiderationQueueTest, FromGraphRejectsCycle) {
    DependencyGraph graph;
    graph.AddEdge("A", "B");
    graph.AddEdge("B", "A");
    EXPECT_THROW((void)ConsiderationQueue::FromGraph(graph), CyclicGraphError);
}

TEST(ConsiderationQueueTest, FromLayersKeepsEmptyLayers) {
    auto queue = ConsiderationQueue::FromLayers({{"A"}, {}, {"B", "C"}}, {"A", "B", "C"});
    ASSERT_EQ(queue.Size(), 3u);
    EXPECT_TRUE(queue[1].empty());
    EXPECT_EQ(queue.LayerOf("C"), std::optional<std::size_t>(2));
}

TEST(ConsiderationQueueTest, FromLayersRejectsUnknownNode) {
    try {
        (void)ConsiderationQueue::FromLayers({{"A"}, {"Z"}}, {"A"});
        FAIL() << "expected SchedulerError";
    } catch (const SchedulerError &e) {
        EXPECT_EQ(e.kind(), SchedulerErrorKind::MalformedQueue);
        EXPECT_EQ(e.subject(), "Z");
    }
}

TEST(ConsiderationQueueTest, FromLayersRejectsDuplicates) {
    EXPECT_THROW((void)ConsiderationQueue::FromLayers({{"A"}, {"B", "A"}}, {"A", "B"}),
                 SchedulerError);
}

TEST(ConsiderationQueueTest, UnqueuedNodes) {
    auto queue = ConsiderationQueue::FromLayers({{"A"}}, {"A", "B", "C"});
    EXPECT_EQ(queue.Unqueued({"A", "B", "C"}), (std::vector<NodeId>{"B", "C"}));
    EXPECT_FALSE(queue.Contains("B"));
    EXPECT_FALSE(queue.LayerOf("B").has_value());
}

TEST(ConsiderationQueueTest, Iteration) {
    auto queue = ConsiderationQueue::FromLayers({{"A", "B"}, {"C"}}, {"A", "B", "C"});
    std::size_t nodes = 0;
    for (const auto &layer : queue) {
        nodes += layer.size();
    }
    EXPECT_EQ(nodes, 3u);
}

} // namespace
} // namespace chronos
