#pragma once

/**
 * @file ScheduleLoader.hpp
 * @brief Loads schedule configuration from YAML
 *
 * Uses Vulcan's YAML infrastructure for:
 * - !include directive resolution
 * - ${VAR} environment variable expansion
 * - Type-safe value extraction
 */

#include <chronos/core/Error.hpp>
#include <chronos/io/Console.hpp>
#include <chronos/sched/ScheduleConfig.hpp>

#include <vulcan/io/YamlEnv.hpp>
#include <vulcan/io/YamlNode.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace chronos::io {

/**
 * @brief Loads a ScheduleConfig from YAML
 *
 * Layout:
 * @code
 * schedule:
 *   name: phasing
 * nodes: [A, B, C]
 * dependencies:            # node -> prerequisites
 *   B: [A]
 *   C: [B]
 * consideration_queue:     # alternative to dependencies
 *   - [A]
 *   - [B, C]
 * conditions:
 *   B: "EveryNCalls(A, 2)"
 * termination:
 *   TRIAL: "AfterNCalls(C, 1)"
 * topology:
 *   log_order: true
 * logging:
 *   console_level: Debug
 * @endcode
 */
class ScheduleLoader {
  public:
    /**
     * @brief Load schedule config from file
     *
     * @throws ConfigError on parsing or validation errors
     */
    static ScheduleConfig Load(const std::string &path) {
        try {
            auto root = vulcan::io::YamlEnv::LoadWithIncludesAndEnv(path);
            return ParseRoot(root, path);
        } catch (const vulcan::io::EnvVarError &e) {
            // EnvVarError derives from YamlError, must catch first
            throw chronos::ConfigError("Undefined environment variable: " + e.var_name(), path, -1,
                                       "Set the variable or use ${" + e.var_name() + ":default}");
        } catch (const vulcan::io::YamlError &e) {
            throw chronos::ConfigError(e.what(), path, -1);
        }
    }

    /// Parse schedule config from a YAML string
    static ScheduleConfig Parse(const std::string &yaml_content) {
        try {
            auto root = vulcan::io::YamlNode::Parse(yaml_content);
            return ParseRoot(root, "<string>");
        } catch (const vulcan::io::YamlError &e) {
            throw chronos::ConfigError(e.what(), "<string>", -1);
        }
    }

  private:
    static ScheduleConfig ParseRoot(const vulcan::io::YamlNode &root,
                                    const std::string &source_path) {
        ScheduleConfig cfg;
        cfg.source_file = source_path;

        if (root.Has("schedule")) {
            cfg.name = root["schedule"].Get<std::string>("name", cfg.name);
        }

        bool has_nodes = root.Has("nodes");
        bool has_dependencies = root.Has("dependencies");
        bool has_queue = root.Has("consideration_queue");

        if (!has_dependencies && !has_queue) {
            throw chronos::ConfigError(
                "Config must have either 'dependencies' or 'consideration_queue' section",
                source_path, -1);
        }

        if (has_nodes) {
            cfg.nodes = root["nodes"].ToVector<std::string>();
        }
        if (has_dependencies) {
            ParseDependencies(cfg, root["dependencies"]);
        }
        if (has_queue) {
            ParseQueue(cfg, root["consideration_queue"]);
        }

        if (root.Has("conditions")) {
            root["conditions"].ForEachEntry(
                [&](const std::string &node, const vulcan::io::YamlNode &expr) {
                    cfg.conditions[node] = expr.As<std::string>();
                });
        }

        if (root.Has("termination")) {
            root["termination"].ForEachEntry(
                [&](const std::string &scale, const vulcan::io::YamlNode &expr) {
                    cfg.termination[scale] = expr.As<std::string>();
                });
        }

        if (root.Has("topology")) {
            cfg.topology.log_order =
                root["topology"].Get<bool>("log_order", cfg.topology.log_order);
        }

        if (root.Has("logging")) {
            ParseLogging(cfg.logging, root["logging"]);
        }

        auto errors = cfg.Validate();
        if (!errors.empty()) {
            std::string message = "Invalid schedule config:";
            for (const auto &error : errors) {
                message += "\n  - " + error;
            }
            throw chronos::ConfigError(message, source_path, -1);
        }

        return cfg;
    }

    // =========================================================================
    // Section Parsers
    // =========================================================================

    static void ParseDependencies(ScheduleConfig &cfg, const vulcan::io::YamlNode &node) {
        node.ForEachEntry([&](const std::string &name, const vulcan::io::YamlNode &prereqs) {
            cfg.dependencies[name] = prereqs.ToVector<std::string>();
        });
    }

    static void ParseQueue(ScheduleConfig &cfg, const vulcan::io::YamlNode &node) {
        std::vector<std::vector<NodeId>> layers;
        for (std::size_t i = 0; i < node.Size(); ++i) {
            layers.push_back(node[i].ToVector<std::string>());
        }
        cfg.consideration_queue = layers;
    }

    static void ParseLogging(LogConfig &logging, const vulcan::io::YamlNode &node) {
        if (node.Has("console_level")) {
            logging.console_level = ParseLogLevel(node.Require<std::string>("console_level"));
        }
        logging.color = node.Get<bool>("color", logging.color);
        logging.quiet_mode = node.Get<bool>("quiet", logging.quiet_mode);

        logging.file_enabled = node.Get<bool>("file_enabled", logging.file_enabled);
        logging.file_path = node.Get<std::string>("file_path", logging.file_path);
        logging.file_json = node.Get<bool>("file_json", logging.file_json);
        if (node.Has("file_level")) {
            logging.file_level = ParseLogLevel(node.Require<std::string>("file_level"));
        }
    }
};

} // namespace chronos::io
