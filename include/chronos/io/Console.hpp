#pragma once

/**
 * @file Console.hpp
 * @brief Terminal output with ANSI color support
 *
 * Detects whether stdout is a terminal and prefixes log lines with a colored
 * level tag and the scheduler clock.
 */

#include <chronos/core/Types.hpp>

#include <cctype>
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define STDOUT_FILENO 1
#else
#include <unistd.h>
#endif

namespace chronos {

// =============================================================================
// LogLevel
// =============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    Trace,   ///< Condition evaluation detail
    Debug,   ///< Per time-step output
    Info,    ///< Trial boundaries, queue layout
    Event,   ///< Stalled passes, early termination
    Warning, ///< Defaulted conditions
    Error,   ///< Recoverable errors
    Fatal    ///< Unrecoverable errors
};

/// Three-letter tag used in console and file output
[[nodiscard]] inline const char *LevelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRC";
    case LogLevel::Debug:
        return "DBG";
    case LogLevel::Info:
        return "INF";
    case LogLevel::Event:
        return "EVT";
    case LogLevel::Warning:
        return "WRN";
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Fatal:
        return "FTL";
    }
    return "???";
}

/// Full upper-case level name
[[nodiscard]] inline const char *LevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Event:
        return "EVENT";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a level name ("trace", "Debug", "WARNING", ...)
 *
 * @throws ConfigError on unknown names
 */
[[nodiscard]] inline LogLevel ParseLogLevel(const std::string &name) {
    std::string upper = name;
    for (auto &c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "WARN") {
        return LogLevel::Warning;
    }
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Event,
                       LogLevel::Warning, LogLevel::Error, LogLevel::Fatal}) {
        if (upper == LevelName(level)) {
            return level;
        }
    }
    throw ConfigError("Unknown log level '" + name + "'");
}

// =============================================================================
// AnsiColor
// =============================================================================

struct AnsiColor {
    static constexpr const char *Reset = "\033[0m";
    static constexpr const char *Bold = "\033[1m";
    static constexpr const char *Dim = "\033[2m";

    static constexpr const char *Red = "\033[31m";
    static constexpr const char *Green = "\033[32m";
    static constexpr const char *Yellow = "\033[33m";
    static constexpr const char *Cyan = "\033[36m";
    static constexpr const char *White = "\033[37m";
    static constexpr const char *Gray = "\033[90m";

    static constexpr const char *BgRed = "\033[41m";
};

[[nodiscard]] inline const char *LevelColor(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return AnsiColor::Gray;
    case LogLevel::Debug:
        return AnsiColor::Cyan;
    case LogLevel::Info:
        return AnsiColor::White;
    case LogLevel::Event:
        return AnsiColor::Green;
    case LogLevel::Warning:
        return AnsiColor::Yellow;
    case LogLevel::Error:
        return AnsiColor::Red;
    case LogLevel::Fatal:
        return AnsiColor::BgRed;
    }
    return AnsiColor::White;
}

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Console output with color and formatting support
 */
class Console {
  public:
    Console() : is_tty_(isatty(STDOUT_FILENO) != 0), color_enabled_(is_tty_) {}

    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    /// Enable/disable color output (auto-detected by default)
    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    void SetLogLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetLogLevel() const { return min_level_; }

    /// Log with explicit level
    void Log(LogLevel level, std::string_view msg) const {
        if (level < min_level_) {
            return;
        }
        std::cout << LevelPrefix(level) << " " << msg << "\n";
    }

    /// Log with the scheduler clock as prefix: "[T0:P1:S2] [INF] msg"
    void LogTicked(LogLevel level, const Tick &tick, std::string_view msg) const {
        if (level < min_level_) {
            return;
        }
        std::cout << Colorize("[" + tick.ToString() + "]", AnsiColor::Dim) << " "
                  << LevelPrefix(level) << " " << msg << "\n";
    }

    // === Formatting Helpers ===

    /// Apply color if enabled
    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        if (!color_enabled_) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + AnsiColor::Reset;
    }

    [[nodiscard]] std::string HorizontalRule(int width = 80, char c = '-') const {
        return std::string(static_cast<std::size_t>(width), c);
    }

    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(text) + std::string(width - text.size(), ' ');
    }

    void WriteLine(std::string_view text = "") const { std::cout << text << "\n"; }

    void Flush() const { std::cout.flush(); }

  private:
    bool is_tty_ = false;
    bool color_enabled_ = false;
    LogLevel min_level_ = LogLevel::Info;

    [[nodiscard]] std::string LevelPrefix(LogLevel level) const {
        return Colorize("[" + std::string(LevelTag(level)) + "]", LevelColor(level));
    }
};

} // namespace chronos
