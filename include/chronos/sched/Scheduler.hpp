#pragma once

/**
 * @file Scheduler.hpp
 * @brief Condition-gated scheduler over a consideration queue
 *
 * Walks the consideration queue once per PASS, expands each layer to a
 * fixed point of satisfied conditions, and yields one execution set per
 * time-step until the TRIAL termination condition holds.
 */

#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>
#include <chronos/core/ValidationResult.hpp>
#include <chronos/graph/ConsiderationQueue.hpp>
#include <chronos/graph/DependencyGraph.hpp>
#include <chronos/io/LogService.hpp>
#include <chronos/sched/Condition.hpp>
#include <chronos/sched/ConditionSet.hpp>
#include <chronos/sched/SchedulerState.hpp>
#include <chronos/sched/TimeCounters.hpp>

#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chronos {

class Scheduler;

// =============================================================================
// Scheduler Status
// =============================================================================

enum class SchedulerStatus {
    Idle,           ///< Constructed, or last run exhausted
    Running,        ///< A run cursor is active
    TerminatedEarly ///< Last run ended mid-PASS on its TRIAL condition
};

[[nodiscard]] inline const char *ToString(SchedulerStatus status) {
    switch (status) {
    case SchedulerStatus::Idle:
        return "Idle";
    case SchedulerStatus::Running:
        return "Running";
    case SchedulerStatus::TerminatedEarly:
        return "TerminatedEarly";
    }
    return "Unknown";
}

/**
 * @brief Construction options
 */
struct SchedulerOptions {
    std::string name = "scheduler"; ///< Log context and introspection label
    bool log_order = false;         ///< Log the consideration queue at info level
    LogService *log = nullptr;      ///< Defaults to GetLogService()
};

// =============================================================================
// RunCursor
// =============================================================================

/**
 * @brief Lazy sequence of execution sets for one run
 *
 * Each Next() computes exactly one time-step. The caller executes the
 * returned nodes before asking for the next one. Dropping the cursor
 * abandons the run and returns the scheduler to Idle.
 *
 * @code
 * auto cursor = scheduler.Run({{TimeScale::Trial, conditions::AfterNCalls("B", 4)}});
 * while (auto step = cursor.Next()) {
 *     for (const auto &node : *step) {
 *         Execute(node);
 *     }
 * }
 * @endcode
 */
class RunCursor {
  public:
    ~RunCursor();

    RunCursor(const RunCursor &) = delete;
    RunCursor &operator=(const RunCursor &) = delete;
    RunCursor(RunCursor &&other) noexcept;
    RunCursor &operator=(RunCursor &&other) noexcept;

    /**
     * @brief Next time-step, or nullopt once the TRIAL termination condition holds
     *
     * An exception from a condition, predicate or finished probe ends the
     * run: counters recorded for the interrupted time-step are rolled back,
     * the cursor is done and the scheduler returns to Idle.
     */
    [[nodiscard]] std::optional<ExecutionSet> Next();

    /// True once Next() has reported the end of the run
    [[nodiscard]] bool IsDone() const { return phase_ == Phase::Finished; }

    /// Time-steps emitted by this cursor so far
    [[nodiscard]] const ExecutionHistory &History() const { return history_; }

    /**
     * @brief Drain up to @p max_steps time-steps
     *
     * @return The time-steps produced by this call
     */
    ExecutionHistory Collect(std::size_t max_steps = std::numeric_limits<std::size_t>::max());

  private:
    friend class Scheduler;

    enum class Phase {
        PassStart, ///< Check TRIAL termination, reset PASS scope
        Walk,      ///< Expanding layers of the current pass
        PassEnd,   ///< Stalled-pass marker, advance PASS
        Finished
    };

    RunCursor(Scheduler &scheduler, ConditionPtr trial_termination);

    std::optional<ExecutionSet> Advance();
    void Finish(bool early);
    void Abort();
    void Release();

    Scheduler *scheduler_ = nullptr;
    ConditionPtr trial_termination_;
    ExecutionHistory history_;
    Phase phase_ = Phase::PassStart;
    std::size_t layer_ = 0;
    bool pass_changed_ = false;
    bool stopped_mid_pass_ = false;
};

// =============================================================================
// Scheduler
// =============================================================================

/**
 * @brief Dependency-aware, condition-gated execution scheduler
 *
 * The node set and consideration queue are fixed at construction. Counters
 * persist across runs; conditions may change between runs.
 *
 * Not copyable or movable: run cursors refer back to their scheduler.
 */
class Scheduler {
  public:
    /**
     * @brief Layer a dependency graph into the consideration queue
     *
     * Nodes keep the graph's insertion order.
     *
     * @throws CyclicGraphError if the graph has a cycle
     * @throws SchedulerError (UnknownNode) on an empty node name
     */
    explicit Scheduler(const DependencyGraph &graph, SchedulerOptions options = {});

    /**
     * @brief Adopt a precomputed consideration queue
     *
     * @throws SchedulerError (MalformedQueue) on unknown or repeated nodes
     */
    Scheduler(std::vector<NodeId> nodes, const std::vector<std::vector<NodeId>> &layers,
              SchedulerOptions options = {});

    ~Scheduler() = default;

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;
    Scheduler(Scheduler &&) = delete;
    Scheduler &operator=(Scheduler &&) = delete;

    // =========================================================================
    // Conditions
    // =========================================================================

    /**
     * @brief Bind or replace the condition gating a node
     *
     * @throws SchedulerError (UnknownNode, RunInProgress)
     */
    void AddCondition(const NodeId &node, ConditionPtr condition);

    /// @throws SchedulerError (UnknownNode, RunInProgress)
    void AddConditionSet(const std::map<NodeId, ConditionPtr> &conditions);

    /**
     * @brief Termination conditions used by Run()
     *
     * Merged over the current ones; a null entry clears that scale.
     *
     * @throws SchedulerError (RunInProgress)
     */
    void SetTerminationConditions(const TerminationConditions &terminations);

    /// Probe backing WhenFinished / WhenFinishedAny / WhenFinishedAll
    void SetFinishedProbe(FinishedProbe probe) { state_.SetFinishedProbe(std::move(probe)); }

    void SetLogService(LogService &log) { log_ = &log; }

    // =========================================================================
    // Running
    // =========================================================================

    /**
     * @brief Start a run with the configured termination conditions
     *
     * Scales without a condition default to AllHaveRun(TRIAL).
     *
     * @throws SchedulerError on validation failure or if a run is active
     */
    [[nodiscard]] RunCursor Run();

    /**
     * @brief Start a run with explicit termination conditions
     *
     * TRIAL is required; other missing scales default to AllHaveRun(TRIAL).
     *
     * @throws SchedulerError (MissingTermination) without a TRIAL condition
     */
    [[nodiscard]] RunCursor Run(const TerminationConditions &terminations);

    /**
     * @brief Drain a run
     *
     * @return The accumulated execution history of every run so far; the
     *         steps of this run alone are the tail, or RunCursor::History()
     */
    ExecutionHistory RunToCompletion();
    ExecutionHistory RunToCompletion(const TerminationConditions &terminations);

    /**
     * @brief End the current RUN
     *
     * Advances the RUN clock and resets RUN-scope clocks and totals, so the
     * next run counts its trials from zero.
     *
     * @throws SchedulerError (RunInProgress)
     */
    void EndRun();

    /**
     * @brief Check conditions and terminations without running
     *
     * Unbound nodes are reported as warnings; nothing is bound.
     */
    [[nodiscard]] ValidationResult Validate() const;
    [[nodiscard]] ValidationResult Validate(const TerminationConditions &terminations) const;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const std::string &Name() const { return options_.name; }
    [[nodiscard]] const std::vector<NodeId> &Nodes() const { return nodes_; }
    [[nodiscard]] const ConsiderationQueue &Queue() const { return queue_; }
    [[nodiscard]] const ConditionSet &Conditions() const { return conditions_; }
    [[nodiscard]] const TerminationConditions &Terminations() const { return terminations_; }
    [[nodiscard]] SchedulerStatus Status() const { return status_; }
    [[nodiscard]] bool IsRunning() const { return active_; }

    /// True when the node has a bound condition
    [[nodiscard]] bool Contains(const NodeId &node) const { return conditions_.Contains(node); }

    [[nodiscard]] bool HasNode(const NodeId &node) const { return state_.HasNode(node); }

    [[nodiscard]] const TimeCounters &Counters() const { return state_.Counters(); }
    [[nodiscard]] const SchedulerState &State() const { return state_; }

    /// Every time-step emitted over the scheduler's lifetime
    [[nodiscard]] const ExecutionHistory &History() const { return state_.History(); }

    [[nodiscard]] Tick CurrentTick() const { return state_.Counters().CurrentTick(); }

  private:
    friend class RunCursor;

    SchedulerOptions options_;
    std::vector<NodeId> nodes_;
    ConsiderationQueue queue_;
    ConditionSet conditions_;
    TerminationConditions terminations_;
    bool trial_defaulted_ = true;
    SchedulerState state_;
    SchedulerStatus status_ = SchedulerStatus::Idle;
    bool active_ = false;
    LogService *log_ = nullptr;

    void Initialize();
    void RequireIdle(const std::string &operation) const;
    void Log(LogLevel level, const std::string &message) const;

    /// Resolve defaults, validate, and prime counters for a new run
    RunCursor Start(const TerminationConditions &terminations);

    void Check(const TerminationConditions &terminations, ValidationResult &result,
               bool raise) const;
    void CheckCondition(const Condition &condition, const std::string &subject,
                        bool is_termination, ValidationResult &result, bool raise) const;

    /// Fixed-point expansion of one layer into a time-step
    ExecutionSet ExpandLayer(const ConsiderationSet &layer);
    void Emit(const ExecutionSet &step, RunCursor &cursor);
    [[nodiscard]] bool TrialTerminated(const ConditionPtr &trial_termination) const;
};

} // namespace chronos
