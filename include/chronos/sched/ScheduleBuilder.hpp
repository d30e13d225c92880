#pragma once

/**
 * @file ScheduleBuilder.hpp
 * @brief Fluent builder for Scheduler setup
 */

#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>
#include <chronos/graph/DependencyGraph.hpp>
#include <chronos/io/LogService.hpp>
#include <chronos/io/LogSink.hpp>
#include <chronos/sched/Condition.hpp>
#include <chronos/sched/ConditionParser.hpp>
#include <chronos/sched/ScheduleConfig.hpp>
#include <chronos/sched/Scheduler.hpp>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace chronos {

/**
 * @brief Fluent builder for Scheduler setup
 *
 * Usage:
 *   auto sched = ScheduleBuilder()
 *       .Name("phasing")
 *       .AddDependency("B", {"A"})
 *       .AddDependency("C", {"B"})
 *       .AddCondition("B", conditions::EveryNCalls("A", 2))
 *       .AddCondition("C", "EveryNCalls(B, 3)")
 *       .SetTermination(TimeScale::Trial, "AfterNCalls(C, 1)")
 *       .Build();
 *
 * Condition strings are compiled by ConditionParser at Build() time.
 */
class ScheduleBuilder {
  public:
    ScheduleBuilder() = default;

    // =========================================================================
    // Nodes and Ordering
    // =========================================================================

    ScheduleBuilder &Name(const std::string &name) {
        options_.name = name;
        return *this;
    }

    /// Register a node; order of first mention is the node order
    ScheduleBuilder &AddNode(const NodeId &node) {
        if (known_.insert(node).second) {
            nodes_.push_back(node);
        }
        return *this;
    }

    /**
     * @brief Declare the prerequisites of a node
     *
     * The consideration queue is derived by layering these dependencies
     * unless SetConsiderationQueue() is used.
     */
    ScheduleBuilder &AddDependency(const NodeId &node, const std::vector<NodeId> &prerequisites) {
        for (const auto &prereq : prerequisites) {
            AddNode(prereq);
        }
        AddNode(node);
        dependencies_.emplace_back(node, prerequisites);
        return *this;
    }

    /// Use precomputed layers instead of a dependency graph
    ScheduleBuilder &SetConsiderationQueue(const std::vector<std::vector<NodeId>> &layers) {
        layers_ = layers;
        return *this;
    }

    // =========================================================================
    // Conditions
    // =========================================================================

    ScheduleBuilder &AddCondition(const NodeId &node, ConditionPtr condition) {
        conditions_[node] = std::move(condition);
        expressions_.erase(node);
        return *this;
    }

    /// Bind a condition expression, compiled on Build()
    ScheduleBuilder &AddCondition(const NodeId &node, const std::string &expression) {
        expressions_[node] = expression;
        conditions_.erase(node);
        return *this;
    }

    ScheduleBuilder &SetTermination(TimeScale scale, ConditionPtr condition) {
        terminations_[scale] = std::move(condition);
        termination_expressions_.erase(scale);
        return *this;
    }

    ScheduleBuilder &SetTermination(TimeScale scale, const std::string &expression) {
        termination_expressions_[scale] = expression;
        terminations_.erase(scale);
        return *this;
    }

    /// Predicates available to While(...) / NWhile(...) expressions
    ScheduleBuilder &SetPredicates(PredicateRegistry predicates) {
        predicates_ = std::move(predicates);
        return *this;
    }

    ScheduleBuilder &SetFinishedProbe(FinishedProbe probe) {
        probe_ = std::move(probe);
        return *this;
    }

    // =========================================================================
    // Logging
    // =========================================================================

    ScheduleBuilder &SetLogService(LogService &log) {
        options_.log = &log;
        return *this;
    }

    /// Log the consideration queue at info level on construction
    ScheduleBuilder &LogOrder(bool enabled = true) {
        options_.log_order = enabled;
        return *this;
    }

    // =========================================================================
    // Build
    // =========================================================================

    /**
     * @brief Construct the configured Scheduler
     *
     * @throws SchedulerError (MissingSource) with neither dependencies nor a queue
     * @throws CyclicGraphError, ConditionError, SchedulerError from construction
     */
    [[nodiscard]] std::unique_ptr<Scheduler> Build() const {
        std::unique_ptr<Scheduler> scheduler;

        if (layers_) {
            std::vector<NodeId> nodes = nodes_;
            if (nodes.empty()) {
                std::set<NodeId> seen;
                for (const auto &layer : *layers_) {
                    for (const auto &node : layer) {
                        if (seen.insert(node).second) {
                            nodes.push_back(node);
                        }
                    }
                }
            }
            scheduler = std::make_unique<Scheduler>(std::move(nodes), *layers_, options_);
        } else if (!nodes_.empty()) {
            DependencyGraph graph;
            for (const auto &node : nodes_) {
                graph.AddNode(node);
            }
            for (const auto &[node, prereqs] : dependencies_) {
                graph.AddDependencies(node, prereqs);
            }
            scheduler = std::make_unique<Scheduler>(graph, options_);
        } else {
            throw SchedulerError::MissingSource();
        }

        ConditionParser parser(predicates_);
        for (const auto &[node, condition] : conditions_) {
            scheduler->AddCondition(node, condition);
        }
        for (const auto &[node, expression] : expressions_) {
            scheduler->AddCondition(node, parser.Parse(expression));
        }

        TerminationConditions terminations = terminations_;
        for (const auto &[scale, expression] : termination_expressions_) {
            terminations[scale] = parser.Parse(expression);
        }
        if (!terminations.empty()) {
            scheduler->SetTerminationConditions(terminations);
        }

        if (probe_) {
            scheduler->SetFinishedProbe(probe_);
        }
        return scheduler;
    }

    /**
     * @brief Build a Scheduler from a loaded configuration
     *
     * Also applies @c config.logging to @p log (the global service by default).
     *
     * @throws ConfigError if the configuration does not validate
     */
    [[nodiscard]] static std::unique_ptr<Scheduler>
    FromConfig(const ScheduleConfig &config, const PredicateRegistry &predicates = {},
               LogService *log = nullptr) {
        auto errors = config.Validate();
        if (!errors.empty()) {
            std::string message = "Invalid schedule '" + config.name + "':";
            for (const auto &error : errors) {
                message += "\n  - " + error;
            }
            throw ConfigError(message, config.source_file, -1);
        }

        LogService &service = log != nullptr ? *log : GetLogService();
        ConfigureLogService(service, config.logging);

        ScheduleBuilder builder;
        builder.Name(config.name).LogOrder(config.topology.log_order).SetLogService(service);
        builder.SetPredicates(predicates);

        for (const auto &node : config.nodes) {
            builder.AddNode(node);
        }
        for (const auto &[node, prereqs] : config.dependencies) {
            builder.AddDependency(node, prereqs);
        }
        if (config.consideration_queue) {
            builder.SetConsiderationQueue(*config.consideration_queue);
        }
        for (const auto &[node, expression] : config.conditions) {
            builder.AddCondition(node, expression);
        }
        for (const auto &[scale, expression] : config.termination) {
            builder.SetTermination(ParseTimeScale(scale), expression);
        }

        return builder.Build();
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    [[nodiscard]] const std::vector<NodeId> &GetNodes() const { return nodes_; }
    [[nodiscard]] bool HasConsiderationQueue() const { return layers_.has_value(); }

  private:
    SchedulerOptions options_;
    std::vector<NodeId> nodes_;
    std::set<NodeId> known_;
    std::vector<std::pair<NodeId, std::vector<NodeId>>> dependencies_;
    std::optional<std::vector<std::vector<NodeId>>> layers_;

    std::map<NodeId, ConditionPtr> conditions_;
    std::map<NodeId, std::string> expressions_;
    TerminationConditions terminations_;
    std::map<TimeScale, std::string> termination_expressions_;

    PredicateRegistry predicates_;
    FinishedProbe probe_;
};

} // namespace chronos
