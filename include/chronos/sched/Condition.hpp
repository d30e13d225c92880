#pragma once

/**
 * @file Condition.hpp
 * @brief Predicates gating node execution
 *
 * A condition is a pure function of scheduler state. The owning node is
 * supplied at evaluation time, so one condition object may be bound to
 * several nodes or used as a termination condition (owner empty).
 */

#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>
#include <chronos/sched/SchedulerState.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace chronos {

// =============================================================================
// Condition Interface
// =============================================================================

/**
 * @brief What a condition needs from the scheduler, collected for validation
 */
struct ConditionDependencies {
    std::set<NodeId> nodes;   ///< Nodes referenced by name
    bool needs_owner = false; ///< Relative to the owning node
    bool needs_probe = false; ///< Queries the finished probe
};

class Condition {
  public:
    virtual ~Condition() = default;

    /**
     * @brief Evaluate against current scheduler state
     *
     * @param owner Node the condition gates; empty for termination conditions
     */
    [[nodiscard]] virtual bool IsSatisfied(const SchedulerState &state,
                                           const NodeId &owner) const = 0;

    /// Canonical call syntax, parseable by ConditionParser
    [[nodiscard]] virtual std::string ToString() const = 0;

    virtual void Describe(ConditionDependencies & /*deps*/) const {}
};

using ConditionPtr = std::shared_ptr<const Condition>;

/// Collect dependencies of a condition tree
[[nodiscard]] inline ConditionDependencies DescribeCondition(const Condition &condition) {
    ConditionDependencies deps;
    condition.Describe(deps);
    return deps;
}

// =============================================================================
// Comparison
// =============================================================================

enum class Comparison {
    Less,    ///< value < n
    Equal,   ///< value == n
    Greater, ///< value > n
    AtLeast, ///< value >= n
    Multiple ///< value % n == 0
};

[[nodiscard]] inline bool Compare(Comparison cmp, std::size_t value, std::size_t n) {
    switch (cmp) {
    case Comparison::Less:
        return value < n;
    case Comparison::Equal:
        return value == n;
    case Comparison::Greater:
        return value > n;
    case Comparison::AtLeast:
        return value >= n;
    case Comparison::Multiple:
        return n != 0 && value % n == 0;
    }
    return false;
}

namespace detail {

[[nodiscard]] inline std::string JoinArgs(const std::vector<std::string> &args) {
    std::string out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += args[i];
    }
    return out;
}

inline void RequireNode(const NodeId &node, const std::string &condition) {
    if (node.empty()) {
        throw ConditionError(condition + " requires a node name");
    }
}

inline void RequireCondition(const ConditionPtr &condition, const std::string &combinator) {
    if (!condition) {
        throw ConditionError(combinator + " given a null condition");
    }
}

} // namespace detail

// =============================================================================
// Generic Conditions
// =============================================================================

/// Always or Never
class ConstantCondition : public Condition {
  public:
    explicit ConstantCondition(bool value) : value_(value) {}

    [[nodiscard]] bool IsSatisfied(const SchedulerState & /*state*/,
                                   const NodeId & /*owner*/) const override {
        return value_;
    }

    [[nodiscard]] std::string ToString() const override { return value_ ? "Always" : "Never"; }

  private:
    bool value_;
};

/// While / NWhile: defers to an external predicate
class PredicateCondition : public Condition {
  public:
    PredicateCondition(std::function<bool()> predicate, std::string label, bool negate)
        : predicate_(std::move(predicate)), label_(std::move(label)), negate_(negate) {
        if (!predicate_) {
            throw ConditionError(std::string(negate_ ? "NWhile" : "While") +
                                 " given an empty predicate");
        }
    }

    /// Exceptions thrown by the predicate propagate unmodified
    [[nodiscard]] bool IsSatisfied(const SchedulerState & /*state*/,
                                   const NodeId & /*owner*/) const override {
        return predicate_() != negate_;
    }

    [[nodiscard]] std::string ToString() const override {
        return std::string(negate_ ? "NWhile" : "While") + "(" + label_ + ")";
    }

    [[nodiscard]] const std::string &Label() const { return label_; }

  private:
    std::function<bool()> predicate_;
    std::string label_;
    bool negate_;
};

/// All / Any / AtLeastN
class CompositeCondition : public Condition {
  public:
    enum class Mode { All, Any, AtLeastN };

    CompositeCondition(Mode mode, std::vector<ConditionPtr> children, std::size_t n = 0)
        : mode_(mode), children_(std::move(children)), n_(n) {
        for (const auto &child : children_) {
            detail::RequireCondition(child, Name());
        }
    }

    [[nodiscard]] bool IsSatisfied(const SchedulerState &state,
                                   const NodeId &owner) const override {
        switch (mode_) {
        case Mode::All:
            for (const auto &child : children_) {
                if (!child->IsSatisfied(state, owner)) {
                    return false;
                }
            }
            return true;
        case Mode::Any:
            for (const auto &child : children_) {
                if (child->IsSatisfied(state, owner)) {
                    return true;
                }
            }
            return false;
        case Mode::AtLeastN: {
            std::size_t satisfied = 0;
            for (const auto &child : children_) {
                if (satisfied >= n_) {
                    break;
                }
                if (child->IsSatisfied(state, owner)) {
                    ++satisfied;
                }
            }
            return satisfied >= n_;
        }
        }
        return false;
    }

    [[nodiscard]] std::string ToString() const override {
        std::vector<std::string> args;
        if (mode_ == Mode::AtLeastN) {
            args.push_back(std::to_string(n_));
        }
        for (const auto &child : children_) {
            args.push_back(child->ToString());
        }
        return Name() + "(" + detail::JoinArgs(args) + ")";
    }

    void Describe(ConditionDependencies &deps) const override {
        for (const auto &child : children_) {
            child->Describe(deps);
        }
    }

    [[nodiscard]] const std::vector<ConditionPtr> &Children() const { return children_; }

  private:
    Mode mode_;
    std::vector<ConditionPtr> children_;
    std::size_t n_;

    [[nodiscard]] std::string Name() const {
        switch (mode_) {
        case Mode::All:
            return "All";
        case Mode::Any:
            return "Any";
        case Mode::AtLeastN:
            return "AtLeastN";
        }
        return "?";
    }
};

class NotCondition : public Condition {
  public:
    explicit NotCondition(ConditionPtr operand) : operand_(std::move(operand)) {
        detail::RequireCondition(operand_, "Not");
    }

    [[nodiscard]] bool IsSatisfied(const SchedulerState &state,
                                   const NodeId &owner) const override {
        return !operand_->IsSatisfied(state, owner);
    }

    [[nodiscard]] std::string ToString() const override {
        return "Not(" + operand_->ToString() + ")";
    }

    void Describe(ConditionDependencies &deps) const override { operand_->Describe(deps); }

  private:
    ConditionPtr operand_;
};

// =============================================================================
// Clock Conditions
// =============================================================================

/**
 * @brief Compares `times[scale][counted]` against n
 *
 * Backs the pass-relative (counted = PASS) and trial-relative
 * (counted = TRIAL) families.
 */
class ClockCondition : public Condition {
  public:
    ClockCondition(std::string name, TimeScale counted, Comparison cmp, std::size_t n,
                   TimeScale scale, TimeScale default_scale)
        : name_(std::move(name)), counted_(counted), cmp_(cmp), n_(n), scale_(scale),
          default_scale_(default_scale) {
        if (cmp_ == Comparison::Multiple && n_ == 0) {
            throw ConditionError(name_ + " requires n > 0");
        }
    }

    [[nodiscard]] bool IsSatisfied(const SchedulerState &state,
                                   const NodeId & /*owner*/) const override {
        return Compare(cmp_, state.Counters().Times(scale_, counted_), n_);
    }

    [[nodiscard]] std::string ToString() const override {
        std::string out = name_ + "(" + std::to_string(n_);
        if (scale_ != default_scale_) {
            out += ", " + std::string(chronos::ToString(scale_));
        }
        return out + ")";
    }

  private:
    std::string name_;
    TimeScale counted_;
    Comparison cmp_;
    std::size_t n_;
    TimeScale scale_;
    TimeScale default_scale_;
};

// =============================================================================
// Call Count Conditions
// =============================================================================

/**
 * @brief Compares `counts_total[scale][dep]` (summed over deps) against n
 */
class CallCountCondition : public Condition {
  public:
    CallCountCondition(std::string name, std::vector<NodeId> deps, Comparison cmp,
                       std::size_t n, TimeScale scale)
        : name_(std::move(name)), deps_(std::move(deps)), cmp_(cmp), n_(n), scale_(scale) {
        if (deps_.empty()) {
            throw ConditionError(name_ + " requires at least one node");
        }
        for (const auto &dep : deps_) {
            detail::RequireNode(dep, name_);
        }
    }

    [[nodiscard]] bool IsSatisfied(const SchedulerState &state,
                                   const NodeId & /*owner*/) const override {
        std::size_t total = 0;
        for (const auto &dep : deps_) {
            total += state.Counters().Total(scale_, dep);
        }
        return Compare(cmp_, total, n_);
    }

    [[nodiscard]] std::string ToString() const override {
        std::vector<std::string> args(deps_.begin(), deps_.end());
        args.push_back(std::to_string(n_));
        if (scale_ != TimeScale::Trial) {
            args.emplace_back(chronos::ToString(scale_));
        }
        return name_ + "(" + detail::JoinArgs(args) + ")";
    }

    void Describe(ConditionDependencies &deps) const override {
        deps.nodes.insert(deps_.begin(), deps_.end());
    }

  private:
    std::string name_;
    std::vector<NodeId> deps_;
    Comparison cmp_;
    std::size_t n_;
    TimeScale scale_;
};

/**
 * @brief Satisfied when the dependency has n unconsumed executions for the owner
 *
 * Consumption happens when the owner executes (TimeCounters::RecordExecution).
 */
class EveryNCallsCondition : public Condition {
  public:
    EveryNCallsCondition(NodeId dep, std::size_t n) : dep_(std::move(dep)), n_(n) {
        detail::RequireNode(dep_, "EveryNCalls");
        if (n_ == 0) {
            throw ConditionError("EveryNCalls(" + dep_ + ", 0): n must be > 0");
        }
    }

    /// @throws SchedulerError (MissingOwner) when evaluated without an owner
    [[nodiscard]] bool IsSatisfied(const SchedulerState &state,
                                   const NodeId &owner) const override {
        if (owner.empty()) {
            throw SchedulerError::MissingOwner(ToString());
        }
        return state.Counters().Useable(dep_, owner) >= n_;
    }

    [[nodiscard]] std::string ToString() const override {
        return "EveryNCalls(" + dep_ + ", " + std::to_string(n_) + ")";
    }

    void Describe(ConditionDependencies &deps) const override {
        deps.nodes.insert(dep_);
        deps.needs_owner = true;
    }

  private:
    NodeId dep_;
    std::size_t n_;
};

// =============================================================================
// History Conditions
// =============================================================================

/// Dependency is part of the most recently emitted time-step
class JustRanCondition : public Condition {
  public:
    explicit JustRanCondition(NodeId dep) : dep_(std::move(dep)) {
        detail::RequireNode(dep_, "JustRan");
    }

    [[nodiscard]] bool IsSatisfied(const SchedulerState &state,
                                   const NodeId & /*owner*/) const override {
        const ExecutionSet *last = state.LastStep();
        return last != nullptr && last->count(dep_) > 0;
    }

    [[nodiscard]] std::string ToString() const override { return "JustRan(" + dep_ + ")"; }

    void Describe(ConditionDependencies &deps) const override { deps.nodes.insert(dep_); }

  private:
    NodeId dep_;
};

/// Every listed node (all nodes when none are listed) ran at least once in scale
class AllHaveRunCondition : public Condition {
  public:
    AllHaveRunCondition(std::vector<NodeId> deps, TimeScale scale)
        : deps_(std::move(deps)), scale_(scale) {
        for (const auto &dep : deps_) {
            detail::RequireNode(dep, "AllHaveRun");
        }
    }

    [[nodiscard]] bool IsSatisfied(const SchedulerState &state,
                                   const NodeId & /*owner*/) const override {
        const auto &nodes = deps_.empty() ? state.Nodes() : deps_;
        for (const auto &node : nodes) {
            if (state.Counters().Total(scale_, node) < 1) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] std::string ToString() const override {
        std::vector<std::string> args(deps_.begin(), deps_.end());
        if (scale_ != TimeScale::Trial) {
            args.emplace_back(chronos::ToString(scale_));
        }
        return "AllHaveRun(" + detail::JoinArgs(args) + ")";
    }

    void Describe(ConditionDependencies &deps) const override {
        deps.nodes.insert(deps_.begin(), deps_.end());
    }

  private:
    std::vector<NodeId> deps_;
    TimeScale scale_;
};

// =============================================================================
// Finished-State Conditions
// =============================================================================

/// WhenFinished / WhenFinishedAny / WhenFinishedAll
class FinishedCondition : public Condition {
  public:
    enum class Mode { Single, Any, All };

    FinishedCondition(Mode mode, std::vector<NodeId> deps) : mode_(mode), deps_(std::move(deps)) {
        if (mode_ == Mode::Single && deps_.size() != 1) {
            throw ConditionError("WhenFinished requires exactly one node");
        }
        for (const auto &dep : deps_) {
            detail::RequireNode(dep, Name());
        }
    }

    /// Exceptions thrown by the probe propagate unmodified
    [[nodiscard]] bool IsSatisfied(const SchedulerState &state,
                                   const NodeId & /*owner*/) const override {
        const auto &nodes = deps_.empty() ? state.Nodes() : deps_;
        if (mode_ == Mode::Any) {
            for (const auto &node : nodes) {
                if (state.IsFinished(node)) {
                    return true;
                }
            }
            return false;
        }
        for (const auto &node : nodes) {
            if (!state.IsFinished(node)) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] std::string ToString() const override {
        return Name() + "(" +
               detail::JoinArgs(std::vector<std::string>(deps_.begin(), deps_.end())) + ")";
    }

    void Describe(ConditionDependencies &deps) const override {
        deps.nodes.insert(deps_.begin(), deps_.end());
        deps.needs_probe = true;
    }

  private:
    Mode mode_;
    std::vector<NodeId> deps_;

    [[nodiscard]] std::string Name() const {
        switch (mode_) {
        case Mode::Single:
            return "WhenFinished";
        case Mode::Any:
            return "WhenFinishedAny";
        case Mode::All:
            return "WhenFinishedAll";
        }
        return "?";
    }
};

// =============================================================================
// Factories
// =============================================================================

namespace conditions {

// --- Generic ---

[[nodiscard]] inline ConditionPtr Always() { return std::make_shared<ConstantCondition>(true); }

[[nodiscard]] inline ConditionPtr Never() { return std::make_shared<ConstantCondition>(false); }

/// Satisfied while @p predicate returns true
[[nodiscard]] inline ConditionPtr While(std::function<bool()> predicate,
                                        std::string label = "predicate") {
    return std::make_shared<PredicateCondition>(std::move(predicate), std::move(label), false);
}

/// Satisfied while @p predicate returns false
[[nodiscard]] inline ConditionPtr NWhile(std::function<bool()> predicate,
                                         std::string label = "predicate") {
    return std::make_shared<PredicateCondition>(std::move(predicate), std::move(label), true);
}

[[nodiscard]] inline ConditionPtr All(std::vector<ConditionPtr> children) {
    return std::make_shared<CompositeCondition>(CompositeCondition::Mode::All,
                                                std::move(children));
}

[[nodiscard]] inline ConditionPtr Any(std::vector<ConditionPtr> children) {
    return std::make_shared<CompositeCondition>(CompositeCondition::Mode::Any,
                                                std::move(children));
}

/// Satisfied when at least @p n children are
[[nodiscard]] inline ConditionPtr AtLeastN(std::size_t n, std::vector<ConditionPtr> children) {
    return std::make_shared<CompositeCondition>(CompositeCondition::Mode::AtLeastN,
                                                std::move(children), n);
}

[[nodiscard]] inline ConditionPtr Not(ConditionPtr operand) {
    return std::make_shared<NotCondition>(std::move(operand));
}

// --- Passes within scale (default TRIAL) ---

[[nodiscard]] inline ConditionPtr BeforePass(std::size_t n, TimeScale scale = TimeScale::Trial) {
    return std::make_shared<ClockCondition>("BeforePass", TimeScale::Pass, Comparison::Less, n,
                                            scale, TimeScale::Trial);
}

[[nodiscard]] inline ConditionPtr AtPass(std::size_t n, TimeScale scale = TimeScale::Trial) {
    return std::make_shared<ClockCondition>("AtPass", TimeScale::Pass, Comparison::Equal, n,
                                            scale, TimeScale::Trial);
}

[[nodiscard]] inline ConditionPtr AfterPass(std::size_t n, TimeScale scale = TimeScale::Trial) {
    return std::make_shared<ClockCondition>("AfterPass", TimeScale::Pass, Comparison::Greater, n,
                                            scale, TimeScale::Trial);
}

[[nodiscard]] inline ConditionPtr AfterNPasses(std::size_t n,
                                               TimeScale scale = TimeScale::Trial) {
    return std::make_shared<ClockCondition>("AfterNPasses", TimeScale::Pass, Comparison::AtLeast,
                                            n, scale, TimeScale::Trial);
}

/// @throws ConditionError when n == 0
[[nodiscard]] inline ConditionPtr EveryNPasses(std::size_t n,
                                               TimeScale scale = TimeScale::Trial) {
    return std::make_shared<ClockCondition>("EveryNPasses", TimeScale::Pass,
                                            Comparison::Multiple, n, scale, TimeScale::Trial);
}

// --- Trials within scale (default RUN) ---

[[nodiscard]] inline ConditionPtr BeforeTrial(std::size_t n, TimeScale scale = TimeScale::Run) {
    return std::make_shared<ClockCondition>("BeforeTrial", TimeScale::Trial, Comparison::Less, n,
                                            scale, TimeScale::Run);
}

[[nodiscard]] inline ConditionPtr AtTrial(std::size_t n, TimeScale scale = TimeScale::Run) {
    return std::make_shared<ClockCondition>("AtTrial", TimeScale::Trial, Comparison::Equal, n,
                                            scale, TimeScale::Run);
}

[[nodiscard]] inline ConditionPtr AfterTrial(std::size_t n, TimeScale scale = TimeScale::Run) {
    return std::make_shared<ClockCondition>("AfterTrial", TimeScale::Trial, Comparison::Greater,
                                            n, scale, TimeScale::Run);
}

[[nodiscard]] inline ConditionPtr AfterNTrials(std::size_t n, TimeScale scale = TimeScale::Run) {
    return std::make_shared<ClockCondition>("AfterNTrials", TimeScale::Trial,
                                            Comparison::AtLeast, n, scale, TimeScale::Run);
}

// --- Call counts within scale (default TRIAL) ---

[[nodiscard]] inline ConditionPtr BeforeNCalls(const NodeId &dep, std::size_t n,
                                               TimeScale scale = TimeScale::Trial) {
    return std::make_shared<CallCountCondition>("BeforeNCalls", std::vector<NodeId>{dep},
                                                Comparison::Less, n, scale);
}

[[nodiscard]] inline ConditionPtr AtNCalls(const NodeId &dep, std::size_t n,
                                           TimeScale scale = TimeScale::Trial) {
    return std::make_shared<CallCountCondition>("AtNCalls", std::vector<NodeId>{dep},
                                                Comparison::Equal, n, scale);
}

[[nodiscard]] inline ConditionPtr AfterCall(const NodeId &dep, std::size_t n,
                                            TimeScale scale = TimeScale::Trial) {
    return std::make_shared<CallCountCondition>("AfterCall", std::vector<NodeId>{dep},
                                                Comparison::Greater, n, scale);
}

[[nodiscard]] inline ConditionPtr AfterNCalls(const NodeId &dep, std::size_t n,
                                              TimeScale scale = TimeScale::Trial) {
    return std::make_shared<CallCountCondition>("AfterNCalls", std::vector<NodeId>{dep},
                                                Comparison::AtLeast, n, scale);
}

/// Sum of the dependencies' totals reaches n
[[nodiscard]] inline ConditionPtr AfterNCallsCombined(std::vector<NodeId> deps, std::size_t n,
                                                      TimeScale scale = TimeScale::Trial) {
    return std::make_shared<CallCountCondition>("AfterNCallsCombined", std::move(deps),
                                                Comparison::AtLeast, n, scale);
}

/// @throws ConditionError when n == 0
[[nodiscard]] inline ConditionPtr EveryNCalls(const NodeId &dep, std::size_t n) {
    return std::make_shared<EveryNCallsCondition>(dep, n);
}

// --- History ---

[[nodiscard]] inline ConditionPtr JustRan(const NodeId &dep) {
    return std::make_shared<JustRanCondition>(dep);
}

/// Every node has run at least once in the current tick of scale
[[nodiscard]] inline ConditionPtr AllHaveRun(TimeScale scale = TimeScale::Trial) {
    return std::make_shared<AllHaveRunCondition>(std::vector<NodeId>{}, scale);
}

[[nodiscard]] inline ConditionPtr AllHaveRun(std::vector<NodeId> deps,
                                             TimeScale scale = TimeScale::Trial) {
    return std::make_shared<AllHaveRunCondition>(std::move(deps), scale);
}

// --- Finished state (requires Scheduler::SetFinishedProbe) ---

[[nodiscard]] inline ConditionPtr WhenFinished(const NodeId &dep) {
    return std::make_shared<FinishedCondition>(FinishedCondition::Mode::Single,
                                               std::vector<NodeId>{dep});
}

[[nodiscard]] inline ConditionPtr WhenFinishedAny(std::vector<NodeId> deps = {}) {
    return std::make_shared<FinishedCondition>(FinishedCondition::Mode::Any, std::move(deps));
}

[[nodiscard]] inline ConditionPtr WhenFinishedAll(std::vector<NodeId> deps = {}) {
    return std::make_shared<FinishedCondition>(FinishedCondition::Mode::All, std::move(deps));
}

} // namespace conditions

} // namespace chronos
