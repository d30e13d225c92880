#pragma once

/**
 * @file ValidationResult.hpp
 * @brief Structured result of scheduler and configuration validation
 */

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace chronos {

/**
 * @brief Severity level for validation issues
 */
enum class ValidationSeverity {
    Error,   ///< Run cannot start
    Warning, ///< Recovered locally (e.g. defaulted condition)
    Info     ///< Informational note
};

/**
 * @brief Single validation issue
 */
struct ValidationIssue {
    ValidationSeverity severity;
    std::string message;
    std::string subject; ///< Node or time scale the issue is about

    ValidationIssue(ValidationSeverity sev, std::string msg, std::string subj = "")
        : severity(sev), message(std::move(msg)), subject(std::move(subj)) {}

    [[nodiscard]] bool IsError() const { return severity == ValidationSeverity::Error; }
};

/**
 * @brief Collected errors, warnings and notes from a validation pass
 *
 * The scheduler validates before every run. Errors are raised as
 * SchedulerError before anything is yielded; warnings go to the log.
 *
 * Example:
 * @code
 * ValidationResult result = scheduler.Validate(terminations);
 * for (const auto &warning : result.GetWarnings()) {
 *     GetLogService().Log(LogLevel::Warning, tick, warning);
 * }
 * @endcode
 */
class ValidationResult {
  public:
    ValidationResult() = default;

    /// True when no error was recorded
    [[nodiscard]] bool IsValid() const { return ErrorCount() == 0; }

    [[nodiscard]] std::vector<std::string> GetErrors() const {
        return Collect(ValidationSeverity::Error);
    }

    [[nodiscard]] std::vector<std::string> GetWarnings() const {
        return Collect(ValidationSeverity::Warning);
    }

    [[nodiscard]] std::vector<std::string> GetInfos() const {
        return Collect(ValidationSeverity::Info);
    }

    [[nodiscard]] const std::vector<ValidationIssue> &GetIssues() const { return issues_; }

    void AddError(const std::string &message, const std::string &subject = "") {
        issues_.emplace_back(ValidationSeverity::Error, message, subject);
    }

    void AddWarning(const std::string &message, const std::string &subject = "") {
        issues_.emplace_back(ValidationSeverity::Warning, message, subject);
    }

    void AddInfo(const std::string &message, const std::string &subject = "") {
        issues_.emplace_back(ValidationSeverity::Info, message, subject);
    }

    /// Append all issues of another result
    void Merge(const ValidationResult &other) {
        issues_.insert(issues_.end(), other.issues_.begin(), other.issues_.end());
    }

    [[nodiscard]] bool HasIssues() const { return !issues_.empty(); }

    [[nodiscard]] std::size_t ErrorCount() const { return Count(ValidationSeverity::Error); }

    [[nodiscard]] std::size_t WarningCount() const { return Count(ValidationSeverity::Warning); }

  private:
    std::vector<ValidationIssue> issues_;

    [[nodiscard]] std::size_t Count(ValidationSeverity severity) const {
        std::size_t count = 0;
        for (const auto &issue : issues_) {
            if (issue.severity == severity) {
                ++count;
            }
        }
        return count;
    }

    [[nodiscard]] std::vector<std::string> Collect(ValidationSeverity severity) const {
        std::vector<std::string> out;
        for (const auto &issue : issues_) {
            if (issue.severity == severity) {
                out.push_back(FormatIssue(issue));
            }
        }
        return out;
    }

    [[nodiscard]] static std::string FormatIssue(const ValidationIssue &issue) {
        if (issue.subject.empty()) {
            return issue.message;
        }
        return issue.message + " [" + issue.subject + "]";
    }
};

} // namespace chronos
