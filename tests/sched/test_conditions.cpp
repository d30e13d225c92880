/**
 * @file test_conditions.cpp
 * @brief Unit tests for the condition library and ConditionSet
 */

#include <gtest/gtest.h>

#include <chronos/sched/Condition.hpp>
#include <chronos/sched/ConditionSet.hpp>
#include <chronos/sched/SchedulerState.hpp>

#include <stdexcept>

namespace chronos {
namespace {

namespace c = conditions;

class ConditionTest : public ::testing::Test {
  protected:
    SchedulerState state{std::vector<NodeId>{"A", "B", "C"}};

    TimeCounters &Counters() { return state.Counters(); }

    bool Eval(const ConditionPtr &cond, const NodeId &owner = "C") const {
        return cond->IsSatisfied(state, owner);
    }
};

// =============================================================================
// Generic
// =============================================================================

TEST_F(ConditionTest, Constants) {
    EXPECT_TRUE(Eval(c::Always()));
    EXPECT_FALSE(Eval(c::Never()));
    EXPECT_EQ(c::Always()->ToString(), "Always");
}

TEST_F(ConditionTest, WhileAndNWhile) {
    bool flag = true;
    auto w = c::While([&] { return flag; }, "flag");
    auto nw = c::NWhile([&] { return flag; }, "flag");

    EXPECT_TRUE(Eval(w));
    EXPECT_FALSE(Eval(nw));
    flag = false;
    EXPECT_FALSE(Eval(w));
    EXPECT_TRUE(Eval(nw));

    EXPECT_EQ(w->ToString(), "While(flag)");
    EXPECT_EQ(nw->ToString(), "NWhile(flag)");
}

TEST_F(ConditionTest, PredicateExceptionsPropagate) {
    auto w = c::While([]() -> bool { throw std::logic_error("sensor offline"); });
    EXPECT_THROW((void)Eval(w), std::logic_error);
}

TEST_F(ConditionTest, Composites) {
    auto all = c::All({c::Always(), c::Never()});
    auto any = c::Any({c::Never(), c::Always()});
    EXPECT_FALSE(Eval(all));
    EXPECT_TRUE(Eval(any));
    EXPECT_TRUE(Eval(c::All({})));
    EXPECT_FALSE(Eval(c::Any({})));
    EXPECT_TRUE(Eval(c::Not(c::Never())));
    EXPECT_EQ(any->ToString(), "Any(Never, Always)");
}

TEST_F(ConditionTest, AtLeastN) {
    auto two = c::AtLeastN(2, {c::Always(), c::Never(), c::Always()});
    auto three = c::AtLeastN(3, {c::Always(), c::Never(), c::Always()});
    EXPECT_TRUE(Eval(two));
    EXPECT_FALSE(Eval(three));
    EXPECT_EQ(two->ToString(), "AtLeastN(2, Always, Never, Always)");
}

TEST_F(ConditionTest, NullChildRejected) {
    EXPECT_THROW((void)c::Not(nullptr), ConditionError);
    EXPECT_THROW((void)c::All({c::Always(), nullptr}), ConditionError);
}

// =============================================================================
// Clocks
// =============================================================================

TEST_F(ConditionTest, PassConditions) {
    Counters().Increment(TimeScale::Pass);
    Counters().Increment(TimeScale::Pass);

    EXPECT_TRUE(Eval(c::AtPass(2)));
    EXPECT_FALSE(Eval(c::AtPass(1)));
    EXPECT_TRUE(Eval(c::BeforePass(3)));
    EXPECT_TRUE(Eval(c::AfterPass(1)));
    EXPECT_FALSE(Eval(c::AfterPass(2)));
    EXPECT_TRUE(Eval(c::AfterNPasses(2)));
    EXPECT_TRUE(Eval(c::EveryNPasses(2)));
    EXPECT_FALSE(Eval(c::EveryNPasses(3)));
}

TEST_F(ConditionTest, PassClockRelativeToScale) {
    Counters().Increment(TimeScale::Pass);
    Counters().Reset(TimeScale::Trial);

    EXPECT_TRUE(Eval(c::AtPass(0)));
    EXPECT_TRUE(Eval(c::AtPass(1, TimeScale::Run)));
    EXPECT_EQ(c::AtPass(1, TimeScale::Run)->ToString(), "AtPass(1, RUN)");
    EXPECT_EQ(c::AtPass(1)->ToString(), "AtPass(1)");
}

TEST_F(ConditionTest, EveryNPassesZeroRejected) {
    EXPECT_THROW((void)c::EveryNPasses(0), ConditionError);
}

TEST_F(ConditionTest, TrialConditions) {
    Counters().Increment(TimeScale::Trial);

    EXPECT_TRUE(Eval(c::AtTrial(1)));
    EXPECT_TRUE(Eval(c::BeforeTrial(2)));
    EXPECT_TRUE(Eval(c::AfterTrial(0)));
    EXPECT_TRUE(Eval(c::AfterNTrials(1)));
    EXPECT_FALSE(Eval(c::AfterNTrials(2)));
    EXPECT_EQ(c::AtTrial(1)->ToString(), "AtTrial(1)");
}

// =============================================================================
// Call Counts
// =============================================================================

TEST_F(ConditionTest, CallCounts) {
    Counters().RecordExecution("A");
    Counters().RecordExecution("A");
    Counters().RecordExecution("B");

    EXPECT_TRUE(Eval(c::AtNCalls("A", 2)));
    EXPECT_TRUE(Eval(c::BeforeNCalls("A", 3)));
    EXPECT_TRUE(Eval(c::AfterCall("A", 1)));
    EXPECT_FALSE(Eval(c::AfterCall("A", 2)));
    EXPECT_TRUE(Eval(c::AfterNCalls("A", 2)));
    EXPECT_FALSE(Eval(c::AfterNCalls("B", 2)));
    EXPECT_TRUE(Eval(c::AfterNCallsCombined({"A", "B"}, 3)));
    EXPECT_FALSE(Eval(c::AfterNCallsCombined({"A", "B"}, 4)));
}

TEST_F(ConditionTest, CallCountsRespectScale) {
    Counters().RecordExecution("A");
    Counters().ResetTotals(TimeScale::Pass);

    EXPECT_TRUE(Eval(c::AtNCalls("A", 0, TimeScale::Pass)));
    EXPECT_TRUE(Eval(c::AtNCalls("A", 1)));
    EXPECT_EQ(c::AtNCalls("A", 0, TimeScale::Pass)->ToString(), "AtNCalls(A, 0, PASS)");
    EXPECT_EQ(c::AfterNCallsCombined({"A", "B"}, 3)->ToString(), "AfterNCallsCombined(A, B, 3)");
}

TEST_F(ConditionTest, EveryNCallsUsesOwnerCredit) {
    auto cond = c::EveryNCalls("A", 2);
    Counters().RecordExecution("A");
    EXPECT_FALSE(Eval(cond, "B"));
    Counters().RecordExecution("A");
    EXPECT_TRUE(Eval(cond, "B"));
    EXPECT_TRUE(Eval(cond, "C"));

    Counters().RecordExecution("B");
    EXPECT_FALSE(Eval(cond, "B"));
    EXPECT_TRUE(Eval(cond, "C"));
    EXPECT_EQ(cond->ToString(), "EveryNCalls(A, 2)");
}

TEST_F(ConditionTest, EveryNCallsNeedsOwner) {
    auto cond = c::EveryNCalls("A", 1);
    try {
        (void)Eval(cond, "");
        FAIL() << "expected SchedulerError";
    } catch (const SchedulerError &e) {
        EXPECT_EQ(e.kind(), SchedulerErrorKind::MissingOwner);
    }
    EXPECT_TRUE(DescribeCondition(*cond).needs_owner);
    EXPECT_THROW((void)c::EveryNCalls("A", 0), ConditionError);
}

TEST_F(ConditionTest, EmptyNodeNameRejected) {
    EXPECT_THROW((void)c::AfterNCalls("", 1), ConditionError);
    EXPECT_THROW((void)c::JustRan(""), ConditionError);
}

// =============================================================================
// History
// =============================================================================

TEST_F(ConditionTest, JustRan) {
    auto cond = c::JustRan("A");
    EXPECT_FALSE(Eval(cond));
    state.Append({"A", "B"});
    EXPECT_TRUE(Eval(cond));
    state.Append({"B"});
    EXPECT_FALSE(Eval(cond));
}

TEST_F(ConditionTest, AllHaveRun) {
    auto all = c::AllHaveRun();
    auto some = c::AllHaveRun({"A", "B"});
    Counters().RecordExecution("A");
    Counters().RecordExecution("B");
    EXPECT_FALSE(Eval(all));
    EXPECT_TRUE(Eval(some));

    Counters().RecordExecution("C");
    EXPECT_TRUE(Eval(all));

    Counters().ResetTotals(TimeScale::Pass);
    EXPECT_FALSE(Eval(c::AllHaveRun(TimeScale::Pass)));
    EXPECT_EQ(all->ToString(), "AllHaveRun()");
    EXPECT_EQ(c::AllHaveRun({"A"}, TimeScale::Pass)->ToString(), "AllHaveRun(A, PASS)");
}

// =============================================================================
// Finished State
// =============================================================================

TEST_F(ConditionTest, FinishedConditionsQueryProbe) {
    state.SetFinishedProbe([](const NodeId &node) { return node == "A"; });

    EXPECT_TRUE(Eval(c::WhenFinished("A")));
    EXPECT_FALSE(Eval(c::WhenFinished("B")));
    EXPECT_TRUE(Eval(c::WhenFinishedAny({"A", "B"})));
    EXPECT_FALSE(Eval(c::WhenFinishedAll({"A", "B"})));
    EXPECT_FALSE(Eval(c::WhenFinishedAll()));
    EXPECT_TRUE(Eval(c::WhenFinishedAny()));
}

TEST_F(ConditionTest, FinishedWithoutProbeThrows) {
    auto cond = c::WhenFinished("A");
    EXPECT_TRUE(DescribeCondition(*cond).needs_probe);
    EXPECT_THROW((void)Eval(cond), SchedulerError);
}

TEST_F(ConditionTest, DescribeCollectsNodes) {
    auto cond = c::Any({c::AfterNCalls("A", 1), c::Not(c::JustRan("B")), c::AtPass(0)});
    auto deps = DescribeCondition(*cond);
    EXPECT_EQ(deps.nodes, (std::set<NodeId>{"A", "B"}));
    EXPECT_FALSE(deps.needs_owner);
    EXPECT_FALSE(deps.needs_probe);
}

// =============================================================================
// ConditionSet
// =============================================================================

TEST_F(ConditionTest, ConditionSetDefaultsToAlways) {
    ConditionSet set;
    set.Add("A", c::Never());

    EXPECT_FALSE(set.IsSatisfied("A", state));
    EXPECT_TRUE(set.IsSatisfied("B", state));
    EXPECT_FALSE(set.Contains("B"));
    EXPECT_EQ(set.Get("B"), nullptr);

    auto defaulted = set.BindDefaults({"A", "B", "C"});
    EXPECT_EQ(defaulted, (std::vector<NodeId>{"B", "C"}));
    EXPECT_EQ(set.Size(), 3u);
    EXPECT_EQ(set.Get("B")->ToString(), "Always");
    EXPECT_TRUE(set.BindDefaults({"A", "B", "C"}).empty());
}

TEST_F(ConditionTest, ConditionSetPassesOwner) {
    ConditionSet set;
    set.Add({{"B", c::EveryNCalls("A", 1)}, {"C", c::EveryNCalls("A", 1)}});
    Counters().RecordExecution("A");
    Counters().RecordExecution("B");

    EXPECT_FALSE(set.IsSatisfied("B", state));
    EXPECT_TRUE(set.IsSatisfied("C", state));
}

TEST_F(ConditionTest, ConditionSetRejectsNull) {
    ConditionSet set;
    EXPECT_THROW(set.Add("A", nullptr), ConditionError);
    EXPECT_THROW(set.Add("", c::Always()), ConditionError);
}

} // namespace
} // namespace chronos
