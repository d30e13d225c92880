#pragma once

/**
 * @file SchedulerState.hpp
 * @brief Mutable scheduler state handed to condition evaluation
 */

#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>
#include <chronos/sched/TimeCounters.hpp>

#include <functional>
#include <utility>
#include <vector>

namespace chronos {

/// Caller-supplied query: has this node reached its finished state?
using FinishedProbe = std::function<bool(const NodeId &)>;

/**
 * @brief Counters, execution history and external probes of one scheduler
 *
 * Owned by the Scheduler; conditions only ever see it through a const
 * reference.
 */
class SchedulerState {
  public:
    SchedulerState() = default;
    explicit SchedulerState(const std::vector<NodeId> &nodes) : counters_(nodes) {}

    [[nodiscard]] const TimeCounters &Counters() const { return counters_; }
    [[nodiscard]] TimeCounters &Counters() { return counters_; }

    /// Every node the scheduler knows, in construction order
    [[nodiscard]] const std::vector<NodeId> &Nodes() const { return counters_.Nodes(); }

    [[nodiscard]] bool HasNode(const NodeId &node) const { return counters_.Contains(node); }

    // === History ===

    /// Every time-step emitted over the scheduler's lifetime
    [[nodiscard]] const ExecutionHistory &History() const { return history_; }

    void Append(const ExecutionSet &step) { history_.push_back(step); }

    /// Most recently emitted time-step, or nullptr before the first one
    [[nodiscard]] const ExecutionSet *LastStep() const {
        return history_.empty() ? nullptr : &history_.back();
    }

    // === Finished Probe ===

    void SetFinishedProbe(FinishedProbe probe) { finished_probe_ = std::move(probe); }

    [[nodiscard]] bool HasFinishedProbe() const { return static_cast<bool>(finished_probe_); }

    /// @throws SchedulerError (MissingProbe) when no probe is installed
    [[nodiscard]] bool IsFinished(const NodeId &node) const {
        if (!finished_probe_) {
            throw SchedulerError::MissingProbe("WhenFinished(" + node + ")");
        }
        return finished_probe_(node);
    }

  private:
    TimeCounters counters_;
    ExecutionHistory history_;
    FinishedProbe finished_probe_;
};

} // namespace chronos
