#pragma once

/**
 * @file ScheduleIntrospection.hpp
 * @brief Scheduler snapshot for external tooling
 *
 * Captures the node set, consideration queue, bound conditions, termination
 * conditions, execution history and clock of a Scheduler, and serializes
 * them to JSON or YAML.
 *
 * ## JSON Schema
 * ```json
 * {
 *   "name": "phasing",
 *   "status": "Idle",
 *   "summary": { "nodes": 3, "layers": 3, "time_steps": 10 },
 *   "nodes": ["A", "B", "C"],
 *   "consideration_queue": [["A"], ["B"], ["C"]],
 *   "conditions": { "B": "EveryNCalls(A, 2)" },
 *   "termination": { "TRIAL": "AfterNCalls(C, 1)" },
 *   "history": [["A"], ["A"], ["B"]],
 *   "clock": { "trial": 1, "pass": 0, "time_step": 0 }
 * }
 * ```
 */

#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>
#include <chronos/sched/Scheduler.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace chronos::io {

namespace detail {

/// Open @p path for writing and hand the stream to @p write
template <typename Writer> void WriteToFile(const std::string &path, Writer &&write) {
    std::ofstream file(path);
    if (!file) {
        throw chronos::IOError("write", path, "cannot open file");
    }
    write(file);
    if (!file) {
        throw chronos::IOError("write", path, "write failed");
    }
}

} // namespace detail

/**
 * @brief Snapshot of a scheduler's structure and progress
 */
struct ScheduleIntrospection {
    std::string name;
    std::string status;
    std::vector<NodeId> nodes;
    std::vector<std::vector<NodeId>> consideration_queue;
    std::map<NodeId, std::string> conditions;
    std::map<std::string, std::string> termination;
    ExecutionHistory history;
    Tick clock;

    [[nodiscard]] static ScheduleIntrospection Capture(const Scheduler &scheduler) {
        ScheduleIntrospection snap;
        snap.name = scheduler.Name();
        snap.status = ToString(scheduler.Status());
        snap.nodes = scheduler.Nodes();
        for (const auto &layer : scheduler.Queue()) {
            snap.consideration_queue.emplace_back(layer.begin(), layer.end());
        }
        for (const auto &[node, condition] : scheduler.Conditions().Entries()) {
            snap.conditions[node] = condition->ToString();
        }
        for (const auto &[scale, condition] : scheduler.Terminations()) {
            if (condition) {
                snap.termination[ToString(scale)] = condition->ToString();
            }
        }
        snap.history = scheduler.History();
        snap.clock = scheduler.CurrentTick();
        return snap;
    }

    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j;
        j["name"] = name;
        j["status"] = status;

        j["summary"]["nodes"] = nodes.size();
        j["summary"]["layers"] = consideration_queue.size();
        j["summary"]["time_steps"] = history.size();

        j["nodes"] = nodes;
        j["consideration_queue"] = nlohmann::json::array();
        for (const auto &layer : consideration_queue) {
            j["consideration_queue"].push_back(layer);
        }

        j["conditions"] = nlohmann::json::object();
        for (const auto &[node, expr] : conditions) {
            j["conditions"][node] = expr;
        }
        j["termination"] = nlohmann::json::object();
        for (const auto &[scale, expr] : termination) {
            j["termination"][scale] = expr;
        }

        j["history"] = nlohmann::json::array();
        for (const auto &step : history) {
            j["history"].push_back(std::vector<NodeId>(step.begin(), step.end()));
        }

        j["clock"]["trial"] = clock.trial;
        j["clock"]["pass"] = clock.pass;
        j["clock"]["time_step"] = clock.time_step;
        return j;
    }

    /// @throws IOError if the file cannot be written
    void ToJSONFile(const std::string &path) const {
        detail::WriteToFile(path, [&](std::ofstream &file) { file << ToJSON().dump(2); });
    }

    /// @throws IOError if the file cannot be written
    void ToYAMLFile(const std::string &path) const {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << name;
        out << YAML::Key << "status" << YAML::Value << status;

        out << YAML::Key << "nodes" << YAML::Value << YAML::Flow << nodes;

        out << YAML::Key << "consideration_queue" << YAML::Value << YAML::BeginSeq;
        for (const auto &layer : consideration_queue) {
            out << YAML::Flow << layer;
        }
        out << YAML::EndSeq;

        out << YAML::Key << "conditions" << YAML::Value << YAML::BeginMap;
        for (const auto &[node, expr] : conditions) {
            out << YAML::Key << node << YAML::Value << expr;
        }
        out << YAML::EndMap;

        out << YAML::Key << "termination" << YAML::Value << YAML::BeginMap;
        for (const auto &[scale, expr] : termination) {
            out << YAML::Key << scale << YAML::Value << expr;
        }
        out << YAML::EndMap;

        out << YAML::Key << "history" << YAML::Value << YAML::BeginSeq;
        for (const auto &step : history) {
            out << YAML::Flow << std::vector<NodeId>(step.begin(), step.end());
        }
        out << YAML::EndSeq;

        out << YAML::Key << "clock" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "trial" << YAML::Value << clock.trial;
        out << YAML::Key << "pass" << YAML::Value << clock.pass;
        out << YAML::Key << "time_step" << YAML::Value << clock.time_step;
        out << YAML::EndMap;

        out << YAML::EndMap;
        detail::WriteToFile(path, [&](std::ofstream &file) { file << out.c_str(); });
    }
};

} // namespace chronos::io
