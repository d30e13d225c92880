#pragma once

/**
 * @file ConsiderationQueue.hpp
 * @brief Ordered dependency layers walked once per PASS
 */

#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>
#include <chronos/graph/DependencyGraph.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace chronos {

/// One layer: nodes with no ordering among themselves
using ConsiderationSet = std::set<NodeId>;

/**
 * @brief Ordered sequence of consideration sets
 *
 * Every node's prerequisites sit in strictly earlier layers. Immutable once
 * built.
 */
class ConsiderationQueue {
  public:
    using const_iterator = std::vector<ConsiderationSet>::const_iterator;

    ConsiderationQueue() = default;

    /**
     * @brief Topologically layer a dependency graph
     *
     * @throws CyclicGraphError if the graph has a cycle (no partial queue)
     */
    [[nodiscard]] static ConsiderationQueue FromGraph(const DependencyGraph &graph) {
        ConsiderationQueue queue;
        for (const auto &layer : graph.Layers()) {
            queue.Append(ConsiderationSet(layer.begin(), layer.end()));
        }
        return queue;
    }

    /**
     * @brief Adopt a precomputed layering over a known node set
     *
     * Empty layers are kept. Nodes of @p nodes that appear in no layer are
     * allowed; see Unqueued().
     *
     * @throws SchedulerError (MalformedQueue) on unknown or repeated nodes
     */
    [[nodiscard]] static ConsiderationQueue FromLayers(const std::vector<std::vector<NodeId>> &layers,
                                                       const std::vector<NodeId> &nodes) {
        std::set<NodeId> known(nodes.begin(), nodes.end());
        ConsiderationQueue queue;
        for (std::size_t i = 0; i < layers.size(); ++i) {
            ConsiderationSet layer;
            for (const auto &node : layers[i]) {
                if (known.count(node) == 0) {
                    throw SchedulerError::MalformedQueue(
                        node, "layer " + std::to_string(i) + " names a node outside the node set");
                }
                if (queue.Contains(node) || layer.count(node) > 0) {
                    throw SchedulerError::MalformedQueue(
                        node, "node appears more than once (again in layer " +
                                  std::to_string(i) + ")");
                }
                layer.insert(node);
            }
            queue.Append(std::move(layer));
        }
        return queue;
    }

    [[nodiscard]] std::size_t Size() const { return layers_.size(); }
    [[nodiscard]] bool Empty() const { return layers_.empty(); }

    [[nodiscard]] const ConsiderationSet &operator[](std::size_t index) const {
        return layers_[index];
    }

    [[nodiscard]] const std::vector<ConsiderationSet> &Layers() const { return layers_; }

    [[nodiscard]] const_iterator begin() const { return layers_.begin(); }
    [[nodiscard]] const_iterator end() const { return layers_.end(); }

    [[nodiscard]] bool Contains(const NodeId &node) const { return layer_of_.count(node) > 0; }

    /// Layer index of a node, if queued
    [[nodiscard]] std::optional<std::size_t> LayerOf(const NodeId &node) const {
        auto it = layer_of_.find(node);
        if (it == layer_of_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Total nodes across all layers
    [[nodiscard]] std::size_t NodeCount() const { return layer_of_.size(); }

    /// Nodes of @p nodes that no layer contains
    [[nodiscard]] std::vector<NodeId> Unqueued(const std::vector<NodeId> &nodes) const {
        std::vector<NodeId> missing;
        for (const auto &node : nodes) {
            if (!Contains(node)) {
                missing.push_back(node);
            }
        }
        return missing;
    }

    /// "[{A}, {B, C}, {D}]"
    [[nodiscard]] std::string ToString() const {
        std::string out = "[";
        for (std::size_t i = 0; i < layers_.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += FormatSet(layers_[i]);
        }
        return out + "]";
    }

  private:
    std::vector<ConsiderationSet> layers_;
    std::unordered_map<NodeId, std::size_t> layer_of_;

    void Append(ConsiderationSet layer) {
        for (const auto &node : layer) {
            layer_of_.emplace(node, layers_.size());
        }
        layers_.push_back(std::move(layer));
    }
};

} // namespace chronos
