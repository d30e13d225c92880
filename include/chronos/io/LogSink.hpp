#pragma once

/**
 * @file LogSink.hpp
 * @brief Pre-built log sinks for common output destinations
 */

#include <chronos/core/Error.hpp>
#include <chronos/io/Console.hpp>
#include <chronos/io/LogConfig.hpp>
#include <chronos/io/LogEntry.hpp>
#include <chronos/io/LogService.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

namespace chronos {

/**
 * @brief Factory for common log sinks
 */
class LogSinks {
  public:
    /// Console sink with colors (respects TTY detection)
    static LogService::Sink Console(const class Console &console) {
        return [console](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                if (console.IsColorEnabled()) {
                    std::cout << entry.FormatColored(console) << "\n";
                } else {
                    std::cout << entry.Format() << "\n";
                }
            }
            std::cout.flush();
        };
    }

    /**
     * @brief File sink (plain text, no colors)
     *
     * @throws IOError if the file cannot be opened
     */
    static LogService::Sink File(const std::string &path) {
        auto file = OpenAppend(path);
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                *file << entry.Format() << "\n";
            }
            file->flush();
        };
    }

    /**
     * @brief JSON Lines sink (one object per entry)
     *
     * @throws IOError if the file cannot be opened
     */
    static LogService::Sink JsonLines(const std::string &path) {
        auto file = OpenAppend(path);
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                *file << ToJson(entry).dump() << "\n";
            }
            file->flush();
        };
    }

    /// Null sink (for testing/benchmarking)
    static LogService::Sink Null() {
        return [](const std::vector<LogEntry> & /*entries*/) {};
    }

    /// Callback sink (custom handling)
    static LogService::Sink Callback(std::function<void(const LogEntry &)> handler) {
        return [handler = std::move(handler)](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                handler(entry);
            }
        };
    }

    /// JSON object for one entry, as written by JsonLines
    [[nodiscard]] static nlohmann::json ToJson(const LogEntry &entry) {
        nlohmann::json j;
        j["trial"] = entry.tick.trial;
        j["pass"] = entry.tick.pass;
        j["time_step"] = entry.tick.time_step;
        j["level"] = LevelName(entry.level);
        j["scheduler"] = entry.context.scheduler;
        j["node"] = entry.context.node;
        j["message"] = entry.message;
        return j;
    }

  private:
    static std::shared_ptr<std::ofstream> OpenAppend(const std::string &path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) {
            throw IOError("open log file", path, "cannot open for writing");
        }
        return file;
    }
};

/**
 * @brief Apply a LogConfig to a service: level filter plus console/file sinks
 *
 * Replaces any sinks already installed.
 */
inline void ConfigureLogService(LogService &service, const LogConfig &config) {
    service.ClearSinks();

    Console console;
    console.SetColorEnabled(config.color && console.IsTerminal());

    LogLevel console_level = config.quiet_mode ? LogLevel::Error : config.console_level;
    service.AddSink(LogSinks::Console(console), console_level);

    LogLevel min_level = console_level;
    if (config.file_enabled && !config.file_path.empty()) {
        service.AddSink(config.file_json ? LogSinks::JsonLines(config.file_path)
                                         : LogSinks::File(config.file_path),
                        config.file_level);
        min_level = std::min(min_level, config.file_level);
    }
    service.SetMinLevel(min_level);
}

} // namespace chronos
