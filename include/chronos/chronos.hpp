#pragma once

/**
 * @file chronos.hpp
 * @brief Umbrella header for the Chronos condition-gated scheduler
 *
 * Include this header to get access to all Chronos public APIs.
 */

// Core
#include <chronos/core/Error.hpp>
#include <chronos/core/Types.hpp>
#include <chronos/core/ValidationResult.hpp>

// Graph
#include <chronos/graph/ConsiderationQueue.hpp>
#include <chronos/graph/DependencyGraph.hpp>

// Scheduling
#include <chronos/sched/Condition.hpp>
#include <chronos/sched/ConditionParser.hpp>
#include <chronos/sched/ConditionSet.hpp>
#include <chronos/sched/ScheduleBuilder.hpp>
#include <chronos/sched/ScheduleConfig.hpp>
#include <chronos/sched/Scheduler.hpp>
#include <chronos/sched/SchedulerState.hpp>
#include <chronos/sched/TimeCounters.hpp>

// I/O
#include <chronos/io/Console.hpp>
#include <chronos/io/LogConfig.hpp>
#include <chronos/io/LogEntry.hpp>
#include <chronos/io/LogService.hpp>
#include <chronos/io/LogSink.hpp>
#include <chronos/io/ScheduleIntrospection.hpp>
#include <chronos/io/ScheduleLoader.hpp>

namespace chronos {
// Version functions are defined in core/Types.hpp
} // namespace chronos
