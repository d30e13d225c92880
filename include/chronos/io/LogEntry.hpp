#pragma once

/**
 * @file LogEntry.hpp
 * @brief Log context and entry structures
 *
 * Each entry is stamped with the scheduler clock and the scheduler/node it
 * was emitted for.
 */

#include <chronos/core/Types.hpp>
#include <chronos/io/Console.hpp>

#include <chrono>
#include <sstream>
#include <string>
#include <string_view>

namespace chronos {

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Thread-local log context set by the scheduler while it works
 */
struct LogContext {
    std::string scheduler; ///< Scheduler name (e.g., "phasing")
    std::string node;      ///< Node under evaluation, if any

    /// "scheduler.node", "scheduler", or "node"
    [[nodiscard]] std::string FullPath() const {
        if (scheduler.empty()) {
            return node;
        }
        if (node.empty()) {
            return scheduler;
        }
        return scheduler + "." + node;
    }

    [[nodiscard]] bool IsSet() const { return !scheduler.empty() || !node.empty(); }
};

// =============================================================================
// LogEntry
// =============================================================================

/**
 * @brief A single log entry with full context
 */
struct LogEntry {
    LogLevel level = LogLevel::Info;
    Tick tick;           ///< Scheduler clock when logged
    std::string message; ///< Log message
    LogContext context;  ///< Scheduler/node context

    /// Wall clock time for ordering logs from concurrent schedulers
    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, const Tick &tick, std::string_view message,
                           const LogContext &ctx) {
        LogEntry entry;
        entry.level = level;
        entry.tick = tick;
        entry.message = std::string(message);
        entry.context = ctx;
        entry.wall_time = std::chrono::steady_clock::now();
        return entry;
    }

    /// Format for output: "[T0:P1:S2] [LVL] [scheduler.node] message"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << "[" << tick.ToString() << "] ";
        oss << "[" << LevelTag(level) << "] ";

        if (include_context && context.IsSet()) {
            oss << "[" << context.FullPath() << "] ";
        }

        oss << message;
        return oss.str();
    }

    /// Format with colors (for terminal)
    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::ostringstream oss;
        oss << console.Colorize("[" + tick.ToString() + "]", AnsiColor::Dim) << " ";
        oss << console.Colorize("[" + std::string(LevelTag(level)) + "]", LevelColor(level))
            << " ";
        if (context.IsSet()) {
            oss << console.Colorize("[" + context.FullPath() + "]", AnsiColor::Cyan) << " ";
        }
        oss << message;
        return oss.str();
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local log context manager
 *
 * The scheduler installs its name for the duration of a run step, and the
 * node name while evaluating that node's condition.
 */
class LogContextManager {
  public:
    static void SetContext(const LogContext &ctx) { current_context_ = ctx; }

    static void ClearContext() { current_context_ = LogContext{}; }

    [[nodiscard]] static const LogContext &GetContext() { return current_context_; }

    /**
     * @brief RAII guard for automatic context management
     */
    class ScopedContext {
      public:
        ScopedContext(const std::string &scheduler, const std::string &node = "")
            : previous_(current_context_) {
            current_context_.scheduler = scheduler;
            current_context_.node = node;
        }

        ~ScopedContext() { current_context_ = previous_; }

        // Non-copyable, non-movable
        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext previous_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_context_;
};

} // namespace chronos
