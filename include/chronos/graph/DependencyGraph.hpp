#pragma once

/**
 * @file DependencyGraph.hpp
 * @brief Directed dependency graph between schedulable nodes
 *
 * Edges point from prerequisite to dependent: A -> B means A must be
 * considered before B. Nodes keep their insertion order so that every
 * traversal is deterministic.
 */

#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>

#include <algorithm>
#include <cstddef>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace chronos {

/**
 * @brief Result of topological analysis
 */
struct TopologyResult {
    std::vector<NodeId> order;     ///< Sorted node names
    std::vector<CycleInfo> cycles; ///< Detected cycles (if any)
    bool has_cycles = false;

    [[nodiscard]] bool IsValid() const { return !has_cycles; }
};

/**
 * @brief Dependency graph for node consideration ordering
 *
 * Supports topological sorting with cycle detection.
 */
class DependencyGraph {
  public:
    DependencyGraph() = default;

    /**
     * @brief Add a dependency edge: prerequisite must be considered before dependent
     *
     * Both nodes are registered if new. Duplicate edges are ignored.
     */
    void AddEdge(const NodeId &prerequisite, const NodeId &dependent) {
        std::size_t from = AddNode(prerequisite);
        std::size_t to = AddNode(dependent);

        auto &out = dependents_[from];
        if (std::find(out.begin(), out.end(), to) != out.end()) {
            return;
        }
        out.push_back(to);
        prerequisites_[to].push_back(from);
    }

    /// Register every prerequisite of a node
    void AddDependencies(const NodeId &node, const std::vector<NodeId> &prerequisites) {
        AddNode(node);
        for (const auto &prereq : prerequisites) {
            AddEdge(prereq, node);
        }
    }

    /**
     * @brief Add a node without any edges
     *
     * @return Index of the node (existing or new)
     */
    std::size_t AddNode(const NodeId &node) {
        auto it = index_.find(node);
        if (it != index_.end()) {
            return it->second;
        }
        std::size_t idx = nodes_.size();
        nodes_.push_back(node);
        index_.emplace(node, idx);
        dependents_.emplace_back();
        prerequisites_.emplace_back();
        return idx;
    }

    /// Nodes in insertion order
    [[nodiscard]] const std::vector<NodeId> &GetNodes() const { return nodes_; }

    [[nodiscard]] bool Contains(const NodeId &node) const { return index_.count(node) > 0; }

    [[nodiscard]] std::size_t Size() const { return nodes_.size(); }

    [[nodiscard]] bool Empty() const { return nodes_.empty(); }

    [[nodiscard]] std::size_t EdgeCount() const {
        std::size_t count = 0;
        for (const auto &out : dependents_) {
            count += out.size();
        }
        return count;
    }

    /// What must be considered before a node
    [[nodiscard]] std::vector<NodeId> GetDependencies(const NodeId &node) const {
        return Names(prerequisites_[Require(node)]);
    }

    /// What is considered after a node
    [[nodiscard]] std::vector<NodeId> GetDependents(const NodeId &node) const {
        return Names(dependents_[Require(node)]);
    }

    /**
     * @brief Perform topological sort using Kahn's algorithm
     *
     * Ties are broken by insertion order.
     */
    [[nodiscard]] TopologyResult TopologicalSort() const {
        TopologyResult result;

        std::vector<std::size_t> in_deg(nodes_.size());
        std::queue<std::size_t> ready;
        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            in_deg[i] = prerequisites_[i].size();
            if (in_deg[i] == 0) {
                ready.push(i);
            }
        }

        while (!ready.empty()) {
            std::size_t node = ready.front();
            ready.pop();
            result.order.push_back(nodes_[node]);

            for (std::size_t target : dependents_[node]) {
                if (--in_deg[target] == 0) {
                    ready.push(target);
                }
            }
        }

        if (result.order.size() != nodes_.size()) {
            result.has_cycles = true;
            result.cycles = DetectCycles();
        }

        return result;
    }

    /**
     * @brief Group nodes into dependency layers
     *
     * Each layer holds the remaining nodes whose prerequisites all sit in
     * earlier layers. Layer members keep insertion order.
     *
     * @throws CyclicGraphError if an iteration removes no node
     */
    [[nodiscard]] std::vector<std::vector<NodeId>> Layers() const {
        std::vector<std::vector<NodeId>> layers;
        std::vector<std::size_t> in_deg(nodes_.size());
        std::vector<bool> placed(nodes_.size(), false);
        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            in_deg[i] = prerequisites_[i].size();
        }

        std::size_t remaining = nodes_.size();
        while (remaining > 0) {
            std::vector<std::size_t> layer;
            for (std::size_t i = 0; i < nodes_.size(); ++i) {
                if (!placed[i] && in_deg[i] == 0) {
                    layer.push_back(i);
                }
            }

            if (layer.empty()) {
                throw CyclicGraphError(DetectCycles());
            }

            for (std::size_t i : layer) {
                placed[i] = true;
                for (std::size_t target : dependents_[i]) {
                    --in_deg[target];
                }
            }
            remaining -= layer.size();
            layers.push_back(Names(layer));
        }

        return layers;
    }

    /**
     * @brief Detect cycles using DFS
     */
    [[nodiscard]] std::vector<CycleInfo> DetectCycles() const {
        std::vector<CycleInfo> cycles;

        // 0=unvisited, 1=in-stack, 2=done
        std::vector<int> state(nodes_.size(), 0);
        std::vector<std::size_t> path;

        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            if (state[i] == 0) {
                DetectCyclesDFS(i, state, path, cycles);
            }
        }

        return cycles;
    }

  private:
    std::vector<NodeId> nodes_;
    std::unordered_map<NodeId, std::size_t> index_;
    std::vector<std::vector<std::size_t>> dependents_;
    std::vector<std::vector<std::size_t>> prerequisites_;

    [[nodiscard]] std::size_t Require(const NodeId &node) const {
        auto it = index_.find(node);
        if (it == index_.end()) {
            throw SchedulerError::UnknownNode(node, "not in dependency graph");
        }
        return it->second;
    }

    [[nodiscard]] std::vector<NodeId> Names(const std::vector<std::size_t> &indices) const {
        std::vector<NodeId> out;
        out.reserve(indices.size());
        for (std::size_t i : indices) {
            out.push_back(nodes_[i]);
        }
        return out;
    }

    void DetectCyclesDFS(std::size_t node, std::vector<int> &state, std::vector<std::size_t> &path,
                         std::vector<CycleInfo> &cycles) const {
        state[node] = 1;
        path.push_back(node);

        for (std::size_t target : dependents_[node]) {
            if (state[target] == 1) {
                CycleInfo cycle;
                auto start = std::find(path.begin(), path.end(), target);
                for (auto it = start; it != path.end(); ++it) {
                    cycle.nodes.push_back(nodes_[*it]);
                }
                cycles.push_back(std::move(cycle));
            } else if (state[target] == 0) {
                DetectCyclesDFS(target, state, path, cycles);
            }
        }

        state[node] = 2;
        path.pop_back();
    }
};

} // namespace chronos
