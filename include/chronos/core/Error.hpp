#pragma once

/**
 * @file Error.hpp
 * @brief Consolidated error handling for Chronos
 *
 * Flattened exception hierarchy: a handful of categories, each carrying
 * contextual information rather than many subclasses.
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chronos {

// =============================================================================
// Error Severity
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning (recovered locally)
    ERROR,   ///< Error (operation aborted)
    FATAL    ///< Fatal (programming error)
};

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all Chronos exceptions
 *
 * All Chronos exceptions carry a severity level and a category string
 * for logging context.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[chronos] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

  protected:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// Scheduler Errors
// =============================================================================

/**
 * @brief Scheduler configuration error categories
 */
enum class SchedulerErrorKind {
    MissingSource,      ///< Neither a dependency graph nor a consideration queue
    MissingTermination, ///< Required termination condition absent
    UnknownNode,        ///< Reference to a node outside the scheduler's node set
    MalformedQueue,     ///< Consideration queue with unknown or duplicated nodes
    MissingOwner,       ///< Owner-relative condition evaluated without an owner
    MissingProbe,       ///< Finished-state condition without a finished probe
    RunInProgress       ///< Mutation or second run while a cursor is active
};

/**
 * @brief Scheduler configuration errors
 *
 * Raised at construction or validation time, before any execution set is
 * yielded. Never recovered automatically.
 */
class SchedulerError : public Error {
  public:
    explicit SchedulerError(const std::string &msg)
        : Error("Scheduler: " + msg, Severity::ERROR, "scheduler"),
          kind_(SchedulerErrorKind::MissingSource) {}

    SchedulerError(SchedulerErrorKind kind, const std::string &subject,
                   const std::string &detail = "")
        : Error(FormatMessage(kind, subject, detail), KindToSeverity(kind), "scheduler"),
          kind_(kind), subject_(subject) {}

    [[nodiscard]] SchedulerErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string &subject() const { return subject_; }

    // Convenience factory methods
    static SchedulerError MissingSource() {
        return {SchedulerErrorKind::MissingSource, "scheduler",
                "construct with a dependency graph, or a node list and a consideration queue"};
    }

    static SchedulerError MissingTermination(const std::string &scale) {
        return {SchedulerErrorKind::MissingTermination, scale,
                "a termination condition must be specified for this time scale"};
    }

    static SchedulerError UnknownNode(const std::string &node, const std::string &context = "") {
        return {SchedulerErrorKind::UnknownNode, node, context};
    }

    static SchedulerError MalformedQueue(const std::string &node, const std::string &reason) {
        return {SchedulerErrorKind::MalformedQueue, node, reason};
    }

    static SchedulerError MissingOwner(const std::string &condition) {
        return {SchedulerErrorKind::MissingOwner, condition,
                "condition is relative to its owner and cannot be evaluated without one"};
    }

    static SchedulerError MissingProbe(const std::string &condition) {
        return {SchedulerErrorKind::MissingProbe, condition,
                "no finished-state probe installed (Scheduler::SetFinishedProbe)"};
    }

    static SchedulerError RunInProgress(const std::string &operation) {
        return {SchedulerErrorKind::RunInProgress, operation,
                "not allowed while a run cursor is active"};
    }

  private:
    static Severity KindToSeverity(SchedulerErrorKind kind) {
        switch (kind) {
        case SchedulerErrorKind::MissingOwner:
        case SchedulerErrorKind::RunInProgress:
            return Severity::FATAL; // Programming error
        default:
            return Severity::ERROR;
        }
    }

    static std::string FormatMessage(SchedulerErrorKind kind, const std::string &subject,
                                     const std::string &detail) {
        std::string prefix;
        switch (kind) {
        case SchedulerErrorKind::MissingSource:
            prefix = "No scheduling source";
            break;
        case SchedulerErrorKind::MissingTermination:
            prefix = "Missing termination condition";
            break;
        case SchedulerErrorKind::UnknownNode:
            prefix = "Unknown node";
            break;
        case SchedulerErrorKind::MalformedQueue:
            prefix = "Malformed consideration queue";
            break;
        case SchedulerErrorKind::MissingOwner:
            prefix = "Missing condition owner";
            break;
        case SchedulerErrorKind::MissingProbe:
            prefix = "Missing finished probe";
            break;
        case SchedulerErrorKind::RunInProgress:
            prefix = "Run in progress";
            break;
        }
        std::string msg = "Scheduler: " + prefix + ": '" + subject + "'";
        if (!detail.empty()) {
            msg += " (" + detail + ")";
        }
        return msg;
    }

    SchedulerErrorKind kind_;
    std::string subject_;
};

// =============================================================================
// Graph Errors
// =============================================================================

/**
 * @brief Information about a detected cycle in the dependency graph
 */
struct CycleInfo {
    std::vector<std::string> nodes; ///< Nodes forming the cycle, in edge order

    [[nodiscard]] std::string ToString() const {
        std::string out = "Cycle detected: ";
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            out += nodes[i];
            if (i < nodes.size() - 1) {
                out += " -> ";
            }
        }
        if (!nodes.empty()) {
            out += " -> " + nodes[0]; // Close the cycle
        }
        return out;
    }
};

/**
 * @brief Dependency graph is not acyclic
 *
 * Raised while layering; no partial consideration queue is produced.
 */
class CyclicGraphError : public Error {
  public:
    explicit CyclicGraphError(std::vector<CycleInfo> cycles)
        : Error(FormatMessage(cycles), Severity::ERROR, "graph"), cycles_(std::move(cycles)) {}

    [[nodiscard]] const std::vector<CycleInfo> &cycles() const { return cycles_; }

  private:
    static std::string FormatMessage(const std::vector<CycleInfo> &cycles) {
        std::string msg = "Graph: cyclic dependencies detected";
        for (const auto &cycle : cycles) {
            msg += "\n  " + cycle.ToString();
        }
        return msg;
    }

    std::vector<CycleInfo> cycles_;
};

// =============================================================================
// Condition Errors
// =============================================================================

/**
 * @brief Invalid condition construction or expression
 */
class ConditionError : public Error {
  public:
    explicit ConditionError(const std::string &msg)
        : Error("Condition: " + msg, Severity::ERROR, "condition") {}
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Configuration/parsing errors with optional file context
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &section, const std::string &key)
        : Error("Config: " + section + " missing required key '" + key + "'", Severity::ERROR,
                "config") {}

    ConfigError(const std::string &message, const std::string &file, int line,
                const std::string &hint = "")
        : Error(FormatMessage(message, file, line, hint), Severity::ERROR, "config"), file_(file),
          line_(line), hint_(hint) {}

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

  private:
    static std::string FormatMessage(const std::string &msg, const std::string &file, int line,
                                     const std::string &hint) {
        std::string result = "Config: " + msg;
        if (!file.empty()) {
            result += "\n  at: " + file;
            if (line >= 0) {
                result += ":" + std::to_string(line);
            }
        }
        if (!hint.empty()) {
            result += "\n  hint: " + hint;
        }
        return result;
    }

    std::string file_;
    int line_ = -1;
    std::string hint_;
};

// =============================================================================
// I/O Errors
// =============================================================================

/**
 * @brief File and I/O operation errors
 */
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace chronos

// =============================================================================
// Error Throwing Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error (simple version, no logging)
 */
#define CHRONOS_THROW(error) throw(error)

// NOLINTEND(cppcoreguidelines-macro-usage)
