#pragma once

/**
 * @file Types.hpp
 * @brief Core type definitions for the Chronos scheduler
 *
 * Node identifiers, execution sets, logical time scales and version info.
 * Time in Chronos is strictly logical: every clock counts ticks, never seconds.
 */

#include <chronos/core/Error.hpp>

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace chronos {

// =============================================================================
// Node Identifiers
// =============================================================================

/// Opaque identifier of an externally executed node
using NodeId = std::string;

/// Nodes selected for execution in a single time-step
using ExecutionSet = std::set<NodeId>;

/// Ordered sequence of emitted time-steps
using ExecutionHistory = std::vector<ExecutionSet>;

// =============================================================================
// Time Scales
// =============================================================================

/**
 * @brief Nested logical clocks, finest to coarsest
 */
enum class TimeScale : uint8_t {
    TimeStep, ///< One emitted execution set
    Pass,     ///< One full walk of the consideration queue
    Trial,    ///< Passes bounded by the TRIAL termination condition
    Run,      ///< Sequence of trials
    Life      ///< Lifetime of the scheduler
};

inline constexpr std::size_t kTimeScaleCount = 5;

inline constexpr std::array<TimeScale, kTimeScaleCount> kAllTimeScales = {
    TimeScale::TimeStep, TimeScale::Pass, TimeScale::Trial, TimeScale::Run, TimeScale::Life};

/// Array slot for a time scale
[[nodiscard]] constexpr std::size_t Index(TimeScale scale) {
    return static_cast<std::size_t>(scale);
}

[[nodiscard]] inline const char *ToString(TimeScale scale) {
    switch (scale) {
    case TimeScale::TimeStep:
        return "TIME_STEP";
    case TimeScale::Pass:
        return "PASS";
    case TimeScale::Trial:
        return "TRIAL";
    case TimeScale::Run:
        return "RUN";
    case TimeScale::Life:
        return "LIFE";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a time scale name
 *
 * Accepts the canonical upper-case names ("TIME_STEP", "PASS", ...) and
 * their lower-case spellings.
 *
 * @throws ConfigError on unknown names
 */
[[nodiscard]] inline TimeScale ParseTimeScale(const std::string &name) {
    for (auto scale : kAllTimeScales) {
        std::string canonical = ToString(scale);
        std::string lower = canonical;
        for (auto &c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (name == canonical || name == lower) {
            return scale;
        }
    }
    throw ConfigError("Unknown time scale '" + name +
                      "' (expected TIME_STEP, PASS, TRIAL, RUN or LIFE)");
}

// =============================================================================
// Tick
// =============================================================================

/**
 * @brief Snapshot of the scheduler clock, used to stamp log entries
 */
struct Tick {
    std::size_t trial = 0;     ///< Trials elapsed in the current run
    std::size_t pass = 0;      ///< Passes elapsed in the current trial
    std::size_t time_step = 0; ///< Time-steps elapsed in the current pass

    /// Format: "T<trial>:P<pass>:S<time_step>"
    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << "T" << trial << ":P" << pass << ":S" << time_step;
        return oss.str();
    }
};

// =============================================================================
// Formatting Helpers
// =============================================================================

/// "{A, B, C}"
[[nodiscard]] inline std::string FormatSet(const ExecutionSet &nodes) {
    std::string out = "{";
    bool first = true;
    for (const auto &node : nodes) {
        if (!first) {
            out += ", ";
        }
        out += node;
        first = false;
    }
    return out + "}";
}

/// "[A, B, C]"
[[nodiscard]] inline std::string FormatList(const std::vector<NodeId> &nodes) {
    std::string out = "[";
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += nodes[i];
    }
    return out + "]";
}

// =============================================================================
// Version Information
// =============================================================================

#define CHRONOS_VERSION_MAJOR 0
#define CHRONOS_VERSION_MINOR 2
#define CHRONOS_VERSION_PATCH 0

#define CHRONOS_STRINGIFY(x) #x
#define CHRONOS_VERSION_STR(major, minor, patch)                                                   \
    CHRONOS_STRINGIFY(major) "." CHRONOS_STRINGIFY(minor) "." CHRONOS_STRINGIFY(patch)

constexpr int VersionMajor() { return CHRONOS_VERSION_MAJOR; }
constexpr int VersionMinor() { return CHRONOS_VERSION_MINOR; }
constexpr int VersionPatch() { return CHRONOS_VERSION_PATCH; }

constexpr const char *Version() {
    return CHRONOS_VERSION_STR(CHRONOS_VERSION_MAJOR, CHRONOS_VERSION_MINOR,
                               CHRONOS_VERSION_PATCH);
}

} // namespace chronos
