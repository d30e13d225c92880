#pragma once

/**
 * @file ConditionSet.hpp
 * @brief Node to condition bindings
 */

#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>
#include <chronos/sched/Condition.hpp>
#include <chronos/sched/SchedulerState.hpp>

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace chronos {

/// Termination condition per time scale; a null entry means "not given"
using TerminationConditions = std::map<TimeScale, ConditionPtr>;

/**
 * @brief Mapping node -> Condition
 *
 * Unbound nodes evaluate as Always. BindDefaults() makes that binding
 * explicit so it is reported once.
 */
class ConditionSet {
  public:
    /// Bind or replace the condition of a node
    void Add(const NodeId &node, ConditionPtr condition) {
        if (node.empty()) {
            throw ConditionError("cannot bind a condition to an empty node name");
        }
        if (!condition) {
            throw ConditionError("null condition bound to '" + node + "'");
        }
        conditions_[node] = std::move(condition);
    }

    void Add(const std::map<NodeId, ConditionPtr> &conditions) {
        for (const auto &[node, condition] : conditions) {
            Add(node, condition);
        }
    }

    [[nodiscard]] bool Contains(const NodeId &node) const { return conditions_.count(node) > 0; }

    /// Bound condition, or nullptr
    [[nodiscard]] ConditionPtr Get(const NodeId &node) const {
        auto it = conditions_.find(node);
        return it == conditions_.end() ? nullptr : it->second;
    }

    [[nodiscard]] const std::map<NodeId, ConditionPtr> &Entries() const { return conditions_; }

    [[nodiscard]] std::size_t Size() const { return conditions_.size(); }

    /**
     * @brief Bind Always to every unbound node
     *
     * @return Nodes that were defaulted, in the given order
     */
    std::vector<NodeId> BindDefaults(const std::vector<NodeId> &nodes) {
        std::vector<NodeId> defaulted;
        for (const auto &node : nodes) {
            if (!Contains(node)) {
                conditions_[node] = conditions::Always();
                defaulted.push_back(node);
            }
        }
        return defaulted;
    }

    /// Evaluate the condition bound to @p node (Always when unbound)
    [[nodiscard]] bool IsSatisfied(const NodeId &node, const SchedulerState &state) const {
        auto it = conditions_.find(node);
        if (it == conditions_.end()) {
            return true;
        }
        return it->second->IsSatisfied(state, node);
    }

  private:
    std::map<NodeId, ConditionPtr> conditions_;
};

} // namespace chronos
