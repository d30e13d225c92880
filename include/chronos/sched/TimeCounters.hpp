#pragma once

/**
 * @file TimeCounters.hpp
 * @brief Nested logical clocks and per-node execution counters
 */

#include <chronos/core/Types.hpp>

#include <array>
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace chronos {

/**
 * @brief Nested clocks plus the counters conditions query
 *
 * - `Times(outer, inner)`: inner ticks elapsed in the current outer tick
 * - `Total(scale, node)`: executions of node in the current tick of scale
 * - `Useable(producer, consumer)`: executions of producer not yet consumed
 *   by consumer
 *
 * Storage is dense; the node set is fixed at construction.
 */
class TimeCounters {
  public:
    TimeCounters() = default;
    explicit TimeCounters(std::vector<NodeId> nodes);

    // === Clocks ===

    /// Every clock's sub-count of @p scale advances by one
    void Increment(TimeScale scale);

    /// Zero all sub-counts of @p scale
    void Reset(TimeScale scale);

    [[nodiscard]] std::size_t Times(TimeScale outer, TimeScale inner) const {
        return times_[Index(outer)][Index(inner)];
    }

    /// {trials in RUN, passes in TRIAL, time-steps in PASS}
    [[nodiscard]] Tick CurrentTick() const {
        return Tick{Times(TimeScale::Run, TimeScale::Trial),
                    Times(TimeScale::Trial, TimeScale::Pass),
                    Times(TimeScale::Pass, TimeScale::TimeStep)};
    }

    // === Execution Counters ===

    /**
     * @brief Book one execution of @p node
     *
     * Increments the node's total at every scale, consumes all credit held
     * toward the node, then grants one unit of the node's credit to every
     * node (itself included).
     *
     * @throws SchedulerError (UnknownNode)
     */
    void RecordExecution(const NodeId &node);

    /// @throws SchedulerError (UnknownNode)
    [[nodiscard]] std::size_t Total(TimeScale scale, const NodeId &node) const {
        return totals_[Index(scale)][IndexOf(node)];
    }

    /// @throws SchedulerError (UnknownNode)
    [[nodiscard]] std::size_t Useable(const NodeId &producer, const NodeId &consumer) const {
        return useable_[Slot(IndexOf(producer), IndexOf(consumer))];
    }

    void ResetTotals(TimeScale scale);
    void ResetUseable();

    // === Node Set ===

    [[nodiscard]] const std::vector<NodeId> &Nodes() const { return nodes_; }
    [[nodiscard]] bool Contains(const NodeId &node) const { return index_.count(node) > 0; }

    /// @throws SchedulerError (UnknownNode)
    [[nodiscard]] std::size_t IndexOf(const NodeId &node) const;

  private:
    std::vector<NodeId> nodes_;
    std::unordered_map<NodeId, std::size_t> index_;

    std::array<std::array<std::size_t, kTimeScaleCount>, kTimeScaleCount> times_{};
    std::array<std::vector<std::size_t>, kTimeScaleCount> totals_;
    std::vector<std::size_t> useable_; ///< Row-major [producer][consumer]

    [[nodiscard]] std::size_t Slot(std::size_t producer, std::size_t consumer) const {
        return producer * nodes_.size() + consumer;
    }
};

} // namespace chronos
