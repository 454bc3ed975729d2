/*
 * options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Tunables of the task scheduler

**************************************************/

#ifndef CADENCE_SCHEDULE_OPTIONS_HPP
#define CADENCE_SCHEDULE_OPTIONS_HPP

#include <chrono>
#include <cstddef>

#include "cadence/schedule/trigger.hpp"

namespace cadence::schedule {

struct SchedulerOptions {
    /// Longest sleep of the timing loop between two due-job checks.
    std::chrono::milliseconds tickInterval{1000};
    /// Threads running command callbacks.
    size_t workerThreads = 4;
    /// Concurrent invocations allowed per job; extra firings are skipped.
    int maxInstances = 1;
    /// Forward window of cron searches started by the scheduler.
    int cronSearchYears = DEFAULT_CRON_SEARCH_YEARS;
};

}  // namespace cadence::schedule

#endif  // CADENCE_SCHEDULE_OPTIONS_HPP
