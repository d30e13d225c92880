#pragma once

/**
 * @file LogConfig.hpp
 * @brief Logging configuration structure
 */

#include <chronos/io/Console.hpp>

#include <string>

namespace chronos {

/**
 * @brief Logging configuration
 */
struct LogConfig {
    // Console output
    LogLevel console_level = LogLevel::Info;
    bool color = true; ///< Colors when stdout is a terminal

    // File output
    bool file_enabled = false;
    std::string file_path;
    LogLevel file_level = LogLevel::Debug;
    bool file_json = false; ///< JSON lines instead of plain text

    bool quiet_mode = false; ///< Suppress all but errors

    [[nodiscard]] static LogConfig Default() { return LogConfig{}; }

    /// Errors only
    [[nodiscard]] static LogConfig Quiet() {
        LogConfig config;
        config.console_level = LogLevel::Error;
        config.quiet_mode = true;
        return config;
    }

    /// Every time-step and condition decision
    [[nodiscard]] static LogConfig Verbose() {
        LogConfig config;
        config.console_level = LogLevel::Trace;
        config.file_level = LogLevel::Trace;
        return config;
    }
};

} // namespace chronos
