/*
 * scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Task scheduler running text commands on triggers

**************************************************/

#ifndef CADENCE_SCHEDULE_SCHEDULER_HPP
#define CADENCE_SCHEDULE_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include "cadence/async/worker_pool.hpp"
#include "cadence/schedule/job.hpp"
#include "cadence/schedule/options.hpp"
#include "cadence/schedule/schedule_parser.hpp"
#include "cadence/schedule/trigger.hpp"

namespace cadence::schedule {

/**
 * @brief Executes a command text and returns its outcome.
 */
using CommandCallback = std::function<std::string(const std::string&)>;

/**
 * @brief Runs text commands at the times described by their triggers.
 *
 * A single timing thread watches the job set and hands due commands to a
 * worker pool, so a slow command never delays the detection of other due
 * jobs. All public members are thread-safe. Failures are reported through
 * return values and the log; no member throws to the caller except the
 * constructor.
 *
 * The job set lives only while the scheduler runs: stop() discards it.
 */
class TaskScheduler {
public:
    /**
     * @throws cadence::error::InvalidArgument If an option is out of range.
     */
    explicit TaskScheduler(SchedulerOptions options = {});

    /**
     * @brief Stops the timing loop and waits for running callbacks.
     */
    ~TaskScheduler() noexcept;

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;
    TaskScheduler(TaskScheduler&&) = delete;
    TaskScheduler& operator=(TaskScheduler&&) = delete;

    /**
     * @brief Starts the timing loop.
     * @return false (with a warning) if already running.
     */
    auto start() -> bool;

    /**
     * @brief Stops the timing loop and drops every job. Callbacks already
     * handed to workers finish on their own; nothing new is dispatched after
     * this returns.
     * @return false (with a warning) if not running.
     */
    auto stop() -> bool;

    [[nodiscard]] auto isRunning() const noexcept -> bool;

    /**
     * @brief Sets the function that executes job commands, replacing any
     * previous one. Due jobs are skipped while no callback is set.
     */
    void setCommandCallback(CommandCallback callback);

    /**
     * @brief Adds a job, or replaces the job with the same id in one step.
     * @return false if the scheduler is stopped, the id or command is empty,
     * or the trigger has no future run time.
     */
    auto addJob(const std::string& id, const std::string& command,
                const Trigger& trigger) -> bool;

    /**
     * @return false if the scheduler is stopped or the id is unknown.
     */
    auto removeJob(const std::string& id) -> bool;

    /**
     * @brief Snapshot of all jobs; empty while stopped.
     */
    [[nodiscard]] auto getJobs() const -> std::vector<JobInfo>;

    [[nodiscard]] auto getJob(const std::string& id) const
        -> std::optional<JobInfo>;

    [[nodiscard]] auto jobCount() const -> size_t;

    auto scheduleOnce(const std::string& id, const std::string& command,
                      TimePoint at) -> bool;

    auto scheduleInterval(const std::string& id, const std::string& command,
                          std::chrono::milliseconds period,
                          std::optional<TimePoint> start = std::nullopt)
        -> bool;

    auto scheduleCron(const std::string& id, const std::string& command,
                      const CronSpec& spec) -> bool;

    /**
     * @brief Every day at hour:minute local time.
     */
    auto scheduleDaily(const std::string& id, const std::string& command,
                       int hour, int minute) -> bool;

    /**
     * @brief Every week on dayOfWeek ("mon".."sun" or 0..6, Monday = 0) at
     * hour:minute local time.
     */
    auto scheduleWeekly(const std::string& id, const std::string& command,
                        std::string_view dayOfWeek, int hour, int minute)
        -> bool;

    /**
     * @brief Parses a phrase such as "every day at 7:00" or "in 30 minutes"
     * and adds the job.
     */
    auto scheduleFromText(const std::string& id, const std::string& command,
                          std::string_view text) -> bool;

    [[nodiscard]] auto options() const noexcept -> const SchedulerOptions& {
        return options_;
    }

private:
    void run(std::stop_token stopToken);

    /**
     * @brief Fires every due job. Caller holds mutex_.
     * @return The earliest pending run time afterwards.
     */
    auto dispatchDueJobs(TimePoint now) -> std::optional<TimePoint>;

    void dispatch(Job& job, TimePoint now);

    /**
     * @brief Counts a failed callback against the job, unless the job was
     * removed or replaced since the run was dispatched.
     */
    void recordFailure(const std::string& id, std::uint64_t generation);

    /**
     * @brief Builds a trigger and adds the job; build errors are logged.
     */
    auto addBuiltJob(const std::string& id, const std::string& command,
                     const std::function<Trigger()>& build) -> bool;

    /**
     * @throws cadence::error::ConfigurationError If not running. Caller
     * holds mutex_.
     */
    void ensureRunning(std::string_view operation) const;

    SchedulerOptions options_;
    ScheduleParser parser_;
    async::WorkerPool pool_;

    std::mutex lifecycleMutex_;
    mutable std::mutex mutex_;
    std::condition_variable_any cond_;
    std::unordered_map<std::string, Job> jobs_;
    CommandCallback callback_;
    std::atomic<bool> running_{false};
    bool jobsChanged_ = false;
    std::atomic<std::uint64_t> nextGeneration_{1};

    std::jthread thread_;
};

}  // namespace cadence::schedule

#endif  // CADENCE_SCHEDULE_SCHEDULER_HPP
