/**
 * @file test_types.cpp
 * @brief Unit tests for core identifiers, time scales and version info
 */

#include <gtest/gtest.h>

#include <chronos/core/Types.hpp>

#include <string>

namespace chronos {
namespace {

// =============================================================================
// Version Tests
// =============================================================================

TEST(Version, MatchesMacros) {
    EXPECT_EQ(VersionMajor(), CHRONOS_VERSION_MAJOR);
    EXPECT_EQ(VersionMinor(), CHRONOS_VERSION_MINOR);
    EXPECT_EQ(VersionPatch(), CHRONOS_VERSION_PATCH);
    EXPECT_STREQ(Version(), "0.2.0");
}

// =============================================================================
// TimeScale Tests
// =============================================================================

TEST(TimeScale, OrderedFinestToCoarsest) {
    EXPECT_EQ(Index(TimeScale::TimeStep), 0u);
    EXPECT_EQ(Index(TimeScale::Pass), 1u);
    EXPECT_EQ(Index(TimeScale::Trial), 2u);
    EXPECT_EQ(Index(TimeScale::Run), 3u);
    EXPECT_EQ(Index(TimeScale::Life), 4u);
    EXPECT_EQ(kAllTimeScales.size(), kTimeScaleCount);
}

TEST(TimeScale, CanonicalNames) {
    EXPECT_STREQ(ToString(TimeScale::TimeStep), "TIME_STEP");
    EXPECT_STREQ(ToString(TimeScale::Pass), "PASS");
    EXPECT_STREQ(ToString(TimeScale::Trial), "TRIAL");
    EXPECT_STREQ(ToString(TimeScale::Run), "RUN");
    EXPECT_STREQ(ToString(TimeScale::Life), "LIFE");
}

TEST(TimeScale, ParseAcceptsBothCases) {
    EXPECT_EQ(ParseTimeScale("TRIAL"), TimeScale::Trial);
    EXPECT_EQ(ParseTimeScale("trial"), TimeScale::Trial);
    EXPECT_EQ(ParseTimeScale("time_step"), TimeScale::TimeStep);
    EXPECT_EQ(ParseTimeScale("LIFE"), TimeScale::Life);
}

TEST(TimeScale, ParseRejectsUnknown) {
    EXPECT_THROW((void)ParseTimeScale("Trial"), ConfigError);
    EXPECT_THROW((void)ParseTimeScale("EPOCH"), ConfigError);
    EXPECT_THROW((void)ParseTimeScale(""), ConfigError);
}

TEST(TimeScale, RoundTripsEveryScale) {
    for (auto scale : kAllTimeScales) {
        EXPECT_EQ(ParseTimeScale(ToString(scale)), scale);
    }
}

// =============================================================================
// Tick and Formatting
// =============================================================================

TEST(Tick, Format) {
    Tick tick{2, 5, 1};
    EXPECT_EQ(tick.ToString(), "T2:P5:S1");
    EXPECT_EQ(Tick{}.ToString(), "T0:P0:S0");
}

TEST(Formatting, ExecutionSetIsSorted) {
    ExecutionSet step{"C", "A", "B"};
    EXPECT_EQ(FormatSet(step), "{A, B, C}");
    EXPECT_EQ(FormatSet({}), "{}");
}

TEST(Formatting, ListKeepsOrder) {
    EXPECT_EQ(FormatList({"C", "A"}), "[C, A]");
    EXPECT_EQ(FormatList({}), "[]");
}

} // namespace
} // namespace chronos
