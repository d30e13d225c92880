#pragma once

/**
 * @file ScheduleConfig.hpp
 * @brief Declarative schedule configuration
 *
 * Plain data loaded from YAML (see io::ScheduleLoader) or filled in code,
 * and turned into a Scheduler by ScheduleBuilder::FromConfig().
 */

#include <chronos/core/Types.hpp>
#include <chronos/io/LogConfig.hpp>
#include <chronos/sched/ConditionParser.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chronos {

/**
 * @brief Consideration queue options
 */
struct TopologyConfig {
    bool log_order = false; ///< Log the consideration queue at info level on build
};

/**
 * @brief Complete schedule description
 *
 * Exactly one of @c dependencies or @c consideration_queue provides the
 * queue; when both are given the explicit queue wins.
 */
struct ScheduleConfig {
    std::string name = "scheduler";
    std::string source_file; ///< File the config was loaded from, if any

    /// Node set in declaration order; nodes named only in dependencies are appended
    std::vector<NodeId> nodes;

    /// node -> prerequisites
    std::map<NodeId, std::vector<NodeId>> dependencies;

    /// Explicit layers, used instead of layering @c dependencies
    std::optional<std::vector<std::vector<NodeId>>> consideration_queue;

    /// node -> condition expression
    std::map<NodeId, std::string> conditions;

    /// time scale name -> condition expression
    std::map<std::string, std::string> termination;

    TopologyConfig topology;
    LogConfig logging;

    [[nodiscard]] bool HasQueueSource() const {
        return consideration_queue.has_value() || !dependencies.empty() || !nodes.empty();
    }

    /// Validate configuration
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;

        if (!HasQueueSource()) {
            errors.push_back("No nodes, dependencies or consideration_queue specified");
        }

        std::set<NodeId> known(nodes.begin(), nodes.end());
        if (known.size() != nodes.size()) {
            errors.push_back("Node list contains duplicates");
        }
        for (const auto &[node, prereqs] : dependencies) {
            known.insert(node);
            known.insert(prereqs.begin(), prereqs.end());
        }
        if (consideration_queue) {
            for (const auto &layer : *consideration_queue) {
                known.insert(layer.begin(), layer.end());
            }
        }

        for (const auto &node : known) {
            if (Tokenizer::KeywordType(node)) {
                errors.push_back("Node name '" + node +
                                 "' is a condition keyword and cannot appear in expressions");
            }
        }

        for (const auto &[node, expression] : conditions) {
            if (known.count(node) == 0) {
                errors.push_back("Condition bound to unknown node: " + node);
            }
            if (expression.empty()) {
                errors.push_back("Empty condition expression for node: " + node);
            }
        }

        for (const auto &[scale, expression] : termination) {
            try {
                (void)ParseTimeScale(scale);
            } catch (const ConfigError &e) {
                errors.push_back(e.what());
            }
            if (expression.empty()) {
                errors.push_back("Empty termination expression for scale: " + scale);
            }
        }

        if (logging.file_enabled && logging.file_path.empty()) {
            errors.push_back("File logging enabled but no file_path specified");
        }

        return errors;
    }
};

} // namespace chronos
