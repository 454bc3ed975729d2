/*
 * job.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Scheduled job record and its read-only snapshot

**************************************************/

#ifndef CADENCE_SCHEDULE_JOB_HPP
#define CADENCE_SCHEDULE_JOB_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "cadence/schedule/trigger.hpp"

namespace cadence::schedule {

/**
 * @brief Copy of a job's state, safe to hand out of the scheduler.
 */
struct JobInfo {
    std::string id;
    std::string command;
    std::optional<TimePoint> nextRunAt;
    std::string triggerSummary;
    json trigger;
    size_t runCount = 0;
    size_t failureCount = 0;
    size_t skippedCount = 0;
    std::optional<TimePoint> lastRunAt;

    /**
     * @brief Renders the snapshot with the keys used by the HTTP and CLI
     * layers: id, command, next_run_time, trigger, run_count,
     * failure_count, skipped_count, last_run_time. Absent times are null.
     */
    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief A command bound to a trigger, owned by the TaskScheduler.
 */
class Job {
public:
    /**
     * @brief Creates a job and computes its first run time after now.
     *
     * @param generation Serial number distinguishing this definition from
     * earlier ones registered under the same id.
     * @throws cadence::error::InvalidArgument If id or command is empty.
     * @throws cadence::error::TriggerExhaustedError If the trigger has no
     * run time after now.
     * @throws cadence::error::NoMatchError If a cron search fails.
     */
    Job(std::string id, std::string command, Trigger trigger, TimePoint now,
        std::uint64_t generation);

    [[nodiscard]] auto id() const -> const std::string& { return id_; }
    [[nodiscard]] auto command() const -> const std::string& {
        return command_;
    }
    [[nodiscard]] auto trigger() const -> const Trigger& { return trigger_; }
    [[nodiscard]] auto nextRunAt() const -> const std::optional<TimePoint>& {
        return nextRunAt_;
    }
    [[nodiscard]] auto generation() const noexcept -> std::uint64_t {
        return generation_;
    }
    [[nodiscard]] auto createdAt() const -> TimePoint { return createdAt_; }

    [[nodiscard]] auto isDue(TimePoint now) const -> bool;
    [[nodiscard]] auto isExhausted() const -> bool {
        return !nextRunAt_.has_value();
    }

    /**
     * @brief Recomputes the next run time using firedAt as reference.
     *
     * @return false if the trigger will not fire again.
     * @throws cadence::error::NoMatchError If a cron search fails.
     */
    auto advance(TimePoint firedAt) -> bool;

    /**
     * @brief Counter of callback invocations still running. Shared with
     * the dispatched tasks so it outlives the job.
     */
    [[nodiscard]] auto inFlight() const -> std::shared_ptr<std::atomic<int>> {
        return inFlight_;
    }

    void recordRun(TimePoint at);
    void recordFailure() { ++failureCount_; }
    void recordSkip() { ++skippedCount_; }

    [[nodiscard]] auto snapshot() const -> JobInfo;

private:
    std::string id_;
    std::string command_;
    Trigger trigger_;
    std::optional<TimePoint> nextRunAt_;
    std::uint64_t generation_;
    TimePoint createdAt_;
    std::optional<TimePoint> lastRunAt_;
    size_t runCount_ = 0;
    size_t failureCount_ = 0;
    size_t skippedCount_ = 0;
    std::shared_ptr<std::atomic<int>> inFlight_ =
        std::make_shared<std::atomic<int>>(0);
};

}  // namespace cadence::schedule

#endif  // CADENCE_SCHEDULE_JOB_HPP
