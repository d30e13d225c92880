#pragma once

/**
 * @file LogService.hpp
 * @brief Unified logging service for Chronos
 *
 * Provides both immediate and buffered logging modes.
 */

#include <chronos/core/Types.hpp>
#include <chronos/io/Console.hpp>
#include <chronos/io/LogEntry.hpp>

#include <algorithm>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chronos {

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Unified logging service
 *
 * ALL scheduler logging goes through this service. It operates in two modes:
 *
 * 1. **Immediate mode** (default): each entry goes to the sinks as soon as
 *    it is logged.
 * 2. **Buffered mode**: entries are collected and handed to the sinks in one
 *    batch on Flush(). Use BufferedScope around a burst of time-steps.
 */
class LogService {
  public:
    /// Sink callback type: receives batch of entries to output
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    LogService() = default;

    // === Mode Control ===

    void SetImmediateMode(bool immediate) { immediate_mode_ = immediate; }
    [[nodiscard]] bool IsImmediateMode() const { return immediate_mode_; }

    /**
     * @brief RAII guard for buffered mode
     *
     * Switches to buffered mode on construction, restores previous mode
     * and flushes on destruction.
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service)
            : service_(service), previous_mode_(service.immediate_mode_) {
            service_.SetImmediateMode(false);
        }

        ~BufferedScope() {
            service_.FlushAndClear();
            service_.SetImmediateMode(previous_mode_);
        }

        // Non-copyable, non-movable
        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool previous_mode_;
    };

    // === Configuration ===

    /// Set minimum level (below this = dropped)
    void SetMinLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetMinLevel() const { return min_level_; }

    void AddSink(Sink sink) { sinks_.emplace_back(std::move(sink), LogLevel::Trace); }

    /// Add a sink that only receives entries at or above a level
    void AddSink(Sink sink, LogLevel min_level) { sinks_.emplace_back(std::move(sink), min_level); }

    void ClearSinks() { sinks_.clear(); }

    [[nodiscard]] std::size_t SinkCount() const { return sinks_.size(); }

    // === Logging API ===

    /// Log a message (uses current thread-local context)
    void Log(LogLevel level, const Tick &tick, std::string_view message) {
        Log(level, tick, message, LogContextManager::GetContext());
    }

    /// Log with explicit context (bypasses thread-local)
    void Log(LogLevel level, const Tick &tick, std::string_view message, const LogContext &ctx) {
        if (level < min_level_) {
            return;
        }

        auto entry = LogEntry::Create(level, tick, message, ctx);

        std::lock_guard<std::mutex> lock(mutex_);

        if (level == LogLevel::Error) {
            ++error_count_;
        } else if (level == LogLevel::Fatal) {
            ++fatal_count_;
        }

        if (immediate_mode_) {
            Dispatch(entry);
        } else {
            entries_.push_back(std::move(entry));
        }
    }

    void Trace(const Tick &t, std::string_view msg) { Log(LogLevel::Trace, t, msg); }
    void Debug(const Tick &t, std::string_view msg) { Log(LogLevel::Debug, t, msg); }
    void Info(const Tick &t, std::string_view msg) { Log(LogLevel::Info, t, msg); }
    void Event(const Tick &t, std::string_view msg) { Log(LogLevel::Event, t, msg); }
    void Warning(const Tick &t, std::string_view msg) { Log(LogLevel::Warning, t, msg); }
    void Error(const Tick &t, std::string_view msg) { Log(LogLevel::Error, t, msg); }
    void Fatal(const Tick &t, std::string_view msg) { Log(LogLevel::Fatal, t, msg); }

    // === Flush Control ===

    /// Flush buffer to all sinks
    void Flush(bool sort_by_time = false) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (entries_.empty()) {
            return;
        }

        if (sort_by_time) {
            std::stable_sort(entries_.begin(), entries_.end(),
                             [](const LogEntry &a, const LogEntry &b) {
                                 return a.wall_time < b.wall_time;
                             });
        }

        for (const auto &[sink, min_level] : sinks_) {
            std::vector<LogEntry> filtered;
            filtered.reserve(entries_.size());
            for (const auto &entry : entries_) {
                if (entry.level >= min_level) {
                    filtered.push_back(entry);
                }
            }
            if (!filtered.empty()) {
                sink(filtered);
            }
        }
    }

    void FlushAndClear(bool sort_by_time = false) {
        Flush(sort_by_time);
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    /// Discard pending entries
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    // === Query API ===

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] std::vector<LogEntry> GetPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    [[nodiscard]] bool HasErrors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_ > 0;
    }

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }

    void ResetErrorCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
        fatal_count_ = 0;
    }

    /// Pending entries logged for one node
    [[nodiscard]] std::vector<LogEntry> GetEntriesForNode(std::string_view node) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogEntry> result;
        for (const auto &entry : entries_) {
            if (entry.context.node == node) {
                result.push_back(entry);
            }
        }
        return result;
    }

  private:
    std::vector<LogEntry> entries_;
    std::vector<std::pair<Sink, LogLevel>> sinks_; ///< sink + min level
    LogLevel min_level_ = LogLevel::Info;
    bool immediate_mode_ = true;

    std::size_t error_count_ = 0;
    std::size_t fatal_count_ = 0;

    mutable std::mutex mutex_;

    void Dispatch(const LogEntry &entry) {
        for (const auto &[sink, min_level] : sinks_) {
            if (entry.level >= min_level) {
                sink({entry});
            }
        }
    }
};

/**
 * @brief Global log service singleton
 */
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace chronos

// =============================================================================
// Logging Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define CHRONOS_LOG_TRACE(tick, msg) ::chronos::GetLogService().Trace(tick, msg)

#define CHRONOS_LOG_DEBUG(tick, msg) ::chronos::GetLogService().Debug(tick, msg)

#define CHRONOS_LOG_INFO(tick, msg) ::chronos::GetLogService().Info(tick, msg)

#define CHRONOS_LOG_EVENT(tick, msg) ::chronos::GetLogService().Event(tick, msg)

#define CHRONOS_LOG_WARN(tick, msg) ::chronos::GetLogService().Warning(tick, msg)

#define CHRONOS_LOG_ERROR(tick, msg) ::chronos::GetLogService().Error(tick, msg)

#define CHRONOS_LOG_FATAL(tick, msg) ::chronos::GetLogService().Fatal(tick, msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
