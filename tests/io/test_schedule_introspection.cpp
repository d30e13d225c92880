#include <gtest/gtest.h>

#include <chronos/io/ScheduleIntrospection.hpp>
#include <chronos/sched/ScheduleBuilder.hpp>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace {

using chronos::io::ScheduleIntrospection;

std::unique_ptr<chronos::Scheduler> MakeTestScheduler(chronos::LogService &log) {
    return chronos::ScheduleBuilder()
        .Name("phasing")
        .AddDependency("B", {"A"})
        .AddDependency("C", {"B"})
        .AddCondition("B", "EveryNCalls(A, 2)")
        .AddCondition("C", "EveryNCalls(B, 3)")
        .SetTermination(chronos::TimeScale::Trial, "AfterNCalls(C, 1)")
        .SetLogService(log)
        .Build();
}

class ScheduleIntrospectionTest : public ::testing::Test {
  protected:
    chronos::LogService log;
};

TEST_F(ScheduleIntrospectionTest, CaptureBeforeRun) {
    auto sched = MakeTestScheduler(log);
    auto snap = ScheduleIntrospection::Capture(*sched);

    EXPECT_EQ(snap.name, "phasing");
    EXPECT_EQ(snap.status, "Idle");
    EXPECT_EQ(snap.nodes, (std::vector<std::string>{"A", "B", "C"}));
    ASSERT_EQ(snap.consideration_queue.size(), 3u);
    EXPECT_EQ(snap.consideration_queue[1], (std::vector<std::string>{"B"}));
    EXPECT_EQ(snap.conditions.size(), 2u);
    EXPECT_EQ(snap.termination.at("TRIAL"), "AfterNCalls(C, 1)");
    EXPECT_EQ(snap.termination.at("PASS"), "AllHaveRun()");
    EXPECT_TRUE(snap.history.empty());
}

TEST_F(ScheduleIntrospectionTest, CaptureAfterRun) {
    auto sched = MakeTestScheduler(log);
    (void)sched->RunToCompletion();

    auto snap = ScheduleIntrospection::Capture(*sched);
    EXPECT_EQ(snap.history.size(), 10u);
    EXPECT_EQ(snap.conditions.at("A"), "Always");
    EXPECT_EQ(snap.clock.trial, 1u);
}

TEST_F(ScheduleIntrospectionTest, ToJSON) {
    auto sched = MakeTestScheduler(log);
    (void)sched->RunToCompletion();
    auto j = ScheduleIntrospection::Capture(*sched).ToJSON();

    EXPECT_EQ(j["name"], "phasing");
    EXPECT_EQ(j["status"], "Idle");
    EXPECT_EQ(j["summary"]["nodes"], 3);
    EXPECT_EQ(j["summary"]["layers"], 3);
    EXPECT_EQ(j["summary"]["time_steps"], 10);
    EXPECT_EQ(j["conditions"]["B"], "EveryNCalls(A, 2)");
    EXPECT_EQ(j["history"].size(), 10u);
    EXPECT_EQ(j["history"][9][0], "C");
    EXPECT_TRUE(j.contains("clock"));
}

TEST_F(ScheduleIntrospectionTest, ToJSONFile) {
    auto sched = MakeTestScheduler(log);
    std::string path = "test_schedule_introspection.json";
    ScheduleIntrospection::Capture(*sched).ToJSONFile(path);

    std::ifstream f(path);
    ASSERT_TRUE(f.is_open());
    auto j = nlohmann::json::parse(f);
    EXPECT_EQ(j["consideration_queue"].size(), 3u);

    std::filesystem::remove(path);
}

TEST_F(ScheduleIntrospectionTest, ToYAMLFile) {
    auto sched = MakeTestScheduler(log);
    std::string path = "test_schedule_introspection.yaml";
    ScheduleIntrospection::Capture(*sched).ToYAMLFile(path);

    auto root = YAML::LoadFile(path);
    EXPECT_EQ(root["name"].as<std::string>(), "phasing");
    EXPECT_EQ(root["nodes"].size(), 3u);
    EXPECT_EQ(root["termination"]["TRIAL"].as<std::string>(), "AfterNCalls(C, 1)");

    std::filesystem::remove(path);
}

TEST_F(ScheduleIntrospectionTest, WriteErrors) {
    ScheduleIntrospection snap;
    EXPECT_THROW(snap.ToJSONFile("/nonexistent_directory/file.json"), chronos::IOError);
    EXPECT_THROW(snap.ToYAMLFile("/nonexistent_directory/file.yaml"), chronos::IOError);
}

} // namespace
