/**
 * @file Scheduler.cpp
 * @brief Scheduler run loop, validation and run cursor
 */

#include <chronos/sched/Scheduler.hpp>

#include <set>
#include <utility>

namespace chronos {

namespace {

void CheckNodeNames(const std::vector<NodeId> &nodes) {
    std::set<NodeId> seen;
    for (const auto &node : nodes) {
        if (node.empty()) {
            throw SchedulerError::UnknownNode(node, "empty node name");
        }
        if (!seen.insert(node).second) {
            throw SchedulerError::MalformedQueue(node, "listed twice in the node set");
        }
    }
}

void Report(const SchedulerError &error, const std::string &subject, ValidationResult &result,
            bool raise) {
    if (raise) {
        throw error;
    }
    result.AddError(error.what(), subject);
}

} // namespace

// =============================================================================
// RunCursor
// =============================================================================

RunCursor::RunCursor(Scheduler &scheduler, ConditionPtr trial_termination)
    : scheduler_(&scheduler), trial_termination_(std::move(trial_termination)) {}

RunCursor::~RunCursor() { Release(); }

RunCursor::RunCursor(RunCursor &&other) noexcept
    : scheduler_(other.scheduler_), trial_termination_(std::move(other.trial_termination_)),
      history_(std::move(other.history_)), phase_(other.phase_), layer_(other.layer_),
      pass_changed_(other.pass_changed_), stopped_mid_pass_(other.stopped_mid_pass_) {
    other.scheduler_ = nullptr;
    other.phase_ = Phase::Finished;
}

RunCursor &RunCursor::operator=(RunCursor &&other) noexcept {
    if (this != &other) {
        Release();
        scheduler_ = other.scheduler_;
        trial_termination_ = std::move(other.trial_termination_);
        history_ = std::move(other.history_);
        phase_ = other.phase_;
        layer_ = other.layer_;
        pass_changed_ = other.pass_changed_;
        stopped_mid_pass_ = other.stopped_mid_pass_;
        other.scheduler_ = nullptr;
        other.phase_ = Phase::Finished;
    }
    return *this;
}

std::optional<ExecutionSet> RunCursor::Next() {
    if (scheduler_ == nullptr || phase_ == Phase::Finished) {
        return std::nullopt;
    }

    // A run that throws is over; the exception reaches the caller unchanged
    try {
        return Advance();
    } catch (...) {
        Abort();
        throw;
    }
}

std::optional<ExecutionSet> RunCursor::Advance() {
    Scheduler &sched = *scheduler_;
    TimeCounters &counters = sched.state_.Counters();
    LogContextManager::ScopedContext context(sched.Name());

    while (true) {
        switch (phase_) {
        case Phase::PassStart:
            if (sched.TrialTerminated(trial_termination_)) {
                Finish(stopped_mid_pass_);
                return std::nullopt;
            }
            stopped_mid_pass_ = false;
            counters.ResetTotals(TimeScale::Pass);
            counters.Reset(TimeScale::Pass);
            pass_changed_ = false;
            layer_ = 0;
            phase_ = Phase::Walk;
            break;

        case Phase::Walk: {
            if (layer_ >= sched.queue_.Size()) {
                phase_ = Phase::PassEnd;
                break;
            }
            if (sched.TrialTerminated(trial_termination_)) {
                stopped_mid_pass_ = true;
                phase_ = Phase::PassEnd;
                break;
            }
            // Nodes recorded before a throwing condition must not stay counted
            TimeCounters before = counters;
            ExecutionSet step;
            try {
                step = sched.ExpandLayer(sched.queue_[layer_]);
            } catch (...) {
                counters = std::move(before);
                throw;
            }
            ++layer_;
            if (!step.empty()) {
                pass_changed_ = true;
                sched.Emit(step, *this);
                return step;
            }
            break;
        }

        case Phase::PassEnd:
            phase_ = Phase::PassStart;
            if (!pass_changed_) {
                sched.Log(LogLevel::Event, "pass " +
                                               std::to_string(counters.Times(TimeScale::Trial,
                                                                             TimeScale::Pass)) +
                                               " stalled: no node was selected");
                ExecutionSet marker;
                sched.Emit(marker, *this);
                counters.Increment(TimeScale::Pass);
                return marker;
            }
            counters.Increment(TimeScale::Pass);
            break;

        case Phase::Finished:
            return std::nullopt;
        }
    }
}

ExecutionHistory RunCursor::Collect(std::size_t max_steps) {
    ExecutionHistory collected;
    while (collected.size() < max_steps) {
        auto step = Next();
        if (!step) {
            break;
        }
        collected.push_back(std::move(*step));
    }
    return collected;
}

void RunCursor::Finish(bool early) {
    Scheduler &sched = *scheduler_;
    TimeCounters &counters = sched.state_.Counters();

    phase_ = Phase::Finished;
    if (early) {
        sched.Log(LogLevel::Event, "TRIAL termination reached mid-pass before layer " +
                                       std::to_string(layer_));
    }
    sched.Log(LogLevel::Info,
              "trial complete: " + std::to_string(counters.Times(TimeScale::Trial, TimeScale::Pass)) +
                  " passes, " + std::to_string(history_.size()) + " time-steps");

    counters.Increment(TimeScale::Trial);
    sched.status_ = early ? SchedulerStatus::TerminatedEarly : SchedulerStatus::Idle;
    sched.active_ = false;
}

void RunCursor::Abort() {
    Scheduler &sched = *scheduler_;
    sched.Log(LogLevel::Error, "run aborted after " + std::to_string(history_.size()) +
                                   " time-steps: exception from a condition");
    phase_ = Phase::Finished;
    sched.status_ = SchedulerStatus::Idle;
    sched.active_ = false;
}

void RunCursor::Release() {
    if (scheduler_ != nullptr && phase_ != Phase::Finished) {
        scheduler_->Log(LogLevel::Debug, "run abandoned after " +
                                             std::to_string(history_.size()) + " time-steps");
        scheduler_->status_ = SchedulerStatus::Idle;
        scheduler_->active_ = false;
        phase_ = Phase::Finished;
    }
    scheduler_ = nullptr;
}

// =============================================================================
// Scheduler - Construction
// =============================================================================

Scheduler::Scheduler(const DependencyGraph &graph, SchedulerOptions options)
    : options_(std::move(options)), nodes_(graph.GetNodes()) {
    CheckNodeNames(nodes_);
    queue_ = ConsiderationQueue::FromGraph(graph);
    Initialize();
}

Scheduler::Scheduler(std::vector<NodeId> nodes, const std::vector<std::vector<NodeId>> &layers,
                     SchedulerOptions options)
    : options_(std::move(options)), nodes_(std::move(nodes)) {
    CheckNodeNames(nodes_);
    queue_ = ConsiderationQueue::FromLayers(layers, nodes_);
    Initialize();
}

void Scheduler::Initialize() {
    log_ = options_.log != nullptr ? options_.log : &GetLogService();
    state_ = SchedulerState(nodes_);
    for (auto scale : kAllTimeScales) {
        terminations_[scale] = conditions::AllHaveRun(TimeScale::Trial);
    }

    Log(options_.log_order ? LogLevel::Info : LogLevel::Debug,
        "consideration queue: " + queue_.ToString());

    auto unqueued = queue_.Unqueued(nodes_);
    if (!unqueued.empty()) {
        Log(LogLevel::Warning,
            "nodes in no consideration set are never considered: " + FormatList(unqueued));
    }
}

// =============================================================================
// Scheduler - Conditions
// =============================================================================

void Scheduler::AddCondition(const NodeId &node, ConditionPtr condition) {
    RequireIdle("AddCondition");
    if (!HasNode(node)) {
        throw SchedulerError::UnknownNode(node, "cannot bind a condition");
    }
    conditions_.Add(node, std::move(condition));
}

void Scheduler::AddConditionSet(const std::map<NodeId, ConditionPtr> &conditions) {
    RequireIdle("AddConditionSet");
    for (const auto &kv : conditions) {
        if (!HasNode(kv.first)) {
            throw SchedulerError::UnknownNode(kv.first, "cannot bind a condition");
        }
    }
    conditions_.Add(conditions);
}

void Scheduler::SetTerminationConditions(const TerminationConditions &terminations) {
    RequireIdle("SetTerminationConditions");
    for (const auto &[scale, condition] : terminations) {
        terminations_[scale] = condition;
    }
    if (terminations.count(TimeScale::Trial) > 0) {
        trial_defaulted_ = false;
    }
}

// =============================================================================
// Scheduler - Running
// =============================================================================

RunCursor Scheduler::Run() {
    if (trial_defaulted_) {
        Log(LogLevel::Warning, "no TRIAL termination condition given; defaulting to AllHaveRun()");
    }
    return Start(terminations_);
}

RunCursor Scheduler::Run(const TerminationConditions &terminations) {
    auto it = terminations.find(TimeScale::Trial);
    if (it == terminations.end() || !it->second) {
        RequireIdle("Run");
        throw SchedulerError::MissingTermination(ToString(TimeScale::Trial));
    }
    return Start(terminations);
}

ExecutionHistory Scheduler::RunToCompletion() {
    (void)Run().Collect();
    return History();
}

ExecutionHistory Scheduler::RunToCompletion(const TerminationConditions &terminations) {
    (void)Run(terminations).Collect();
    return History();
}

RunCursor Scheduler::Start(const TerminationConditions &terminations) {
    RequireIdle("Run");
    LogContextManager::ScopedContext context(Name());

    auto defaulted = conditions_.BindDefaults(nodes_);
    if (!defaulted.empty()) {
        Log(LogLevel::Warning,
            "no condition bound for " + FormatList(defaulted) + "; defaulting to Always");
    }

    ValidationResult result;
    Check(terminations, result, true);
    for (const auto &info : result.GetInfos()) {
        Log(LogLevel::Debug, info);
    }

    ConditionPtr trial = terminations.at(TimeScale::Trial);

    TimeCounters &counters = state_.Counters();
    counters.ResetUseable();
    counters.ResetTotals(TimeScale::Trial);
    counters.Reset(TimeScale::Trial);

    status_ = SchedulerStatus::Running;
    active_ = true;
    Log(LogLevel::Debug, "run started; TRIAL terminates on " + trial->ToString());

    return RunCursor(*this, std::move(trial));
}

void Scheduler::EndRun() {
    RequireIdle("EndRun");
    TimeCounters &counters = state_.Counters();
    Log(LogLevel::Info, "run complete: " +
                            std::to_string(counters.Times(TimeScale::Run, TimeScale::Trial)) +
                            " trials");
    counters.Increment(TimeScale::Run);
    counters.Reset(TimeScale::Run);
    counters.ResetTotals(TimeScale::Run);
}

ExecutionSet Scheduler::ExpandLayer(const ConsiderationSet &layer) {
    ExecutionSet step;
    TimeCounters &counters = state_.Counters();

    bool added = true;
    while (added) {
        added = false;
        for (const auto &node : layer) {
            if (step.count(node) > 0) {
                continue;
            }
            LogContextManager::ScopedContext context(Name(), node);
            if (conditions_.IsSatisfied(node, state_)) {
                step.insert(node);
                counters.RecordExecution(node);
                added = true;
            }
        }
    }

    return step;
}

void Scheduler::Emit(const ExecutionSet &step, RunCursor &cursor) {
    Log(LogLevel::Debug, "time-step " + FormatSet(step));
    state_.Append(step);
    cursor.history_.push_back(step);

    TimeCounters &counters = state_.Counters();
    counters.Increment(TimeScale::TimeStep);
    counters.ResetTotals(TimeScale::TimeStep);
}

bool Scheduler::TrialTerminated(const ConditionPtr &trial_termination) const {
    return trial_termination->IsSatisfied(state_, NodeId{});
}

// =============================================================================
// Scheduler - Validation
// =============================================================================

ValidationResult Scheduler::Validate() const { return Validate(terminations_); }

ValidationResult Scheduler::Validate(const TerminationConditions &terminations) const {
    ValidationResult result;
    for (const auto &node : nodes_) {
        if (!conditions_.Contains(node)) {
            result.AddWarning("no condition bound; defaults to Always", node);
        }
    }
    Check(terminations, result, false);
    return result;
}

void Scheduler::Check(const TerminationConditions &terminations, ValidationResult &result,
                      bool raise) const {
    for (const auto &[node, condition] : conditions_.Entries()) {
        CheckCondition(*condition, node, false, result, raise);
    }

    for (auto scale : kAllTimeScales) {
        const std::string subject = ToString(scale);
        auto it = terminations.find(scale);
        if (it != terminations.end() && it->second) {
            CheckCondition(*it->second, subject, true, result, raise);
        } else if (scale == TimeScale::Trial) {
            Report(SchedulerError::MissingTermination(subject), subject, result, raise);
        } else {
            result.AddInfo("no termination condition; defaults to AllHaveRun()", subject);
        }
    }
}

void Scheduler::CheckCondition(const Condition &condition, const std::string &subject,
                               bool is_termination, ValidationResult &result, bool raise) const {
    ConditionDependencies deps = DescribeCondition(condition);

    for (const auto &node : deps.nodes) {
        if (!HasNode(node)) {
            Report(SchedulerError::UnknownNode(node, "referenced by " + condition.ToString() +
                                                         " on " + subject),
                   subject, result, raise);
        }
    }
    if (deps.needs_probe && !state_.HasFinishedProbe()) {
        Report(SchedulerError::MissingProbe(condition.ToString()), subject, result, raise);
    }
    if (is_termination && deps.needs_owner) {
        Report(SchedulerError::MissingOwner(condition.ToString()), subject, result, raise);
    }
}

// =============================================================================
// Scheduler - Helpers
// =============================================================================

void Scheduler::RequireIdle(const std::string &operation) const {
    if (active_) {
        throw SchedulerError::RunInProgress(operation);
    }
}

void Scheduler::Log(LogLevel level, const std::string &message) const {
    log_->Log(level, CurrentTick(), message,
              LogContext{Name(), LogContextManager::GetContext().node});
}

} // namespace chronos
