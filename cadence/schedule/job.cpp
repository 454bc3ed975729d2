/*
 * job.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Scheduled job record and its read-only snapshot

**************************************************/

#include "job.hpp"

#include <utility>

#include "cadence/error/exception.hpp"

namespace cadence::schedule {

namespace {
auto timeOrNull(const std::optional<TimePoint>& time) -> json {
    if (!time) {
        return nullptr;
    }
    return utils::formatTimePoint(*time);
}
}  // namespace

auto JobInfo::toJson() const -> json {
    return json{{"id", id},
                {"command", command},
                {"next_run_time", timeOrNull(nextRunAt)},
                {"trigger", trigger},
                {"run_count", runCount},
                {"failure_count", failureCount},
                {"skipped_count", skippedCount},
                {"last_run_time", timeOrNull(lastRunAt)}};
}

Job::Job(std::string id, std::string command, Trigger trigger, TimePoint now,
         std::uint64_t generation)
    : id_(std::move(id)),
      command_(std::move(command)),
      trigger_(std::move(trigger)),
      generation_(generation),
      createdAt_(now) {
    if (id_.empty()) {
        THROW_INVALID_ARGUMENT("Job id must not be empty");
    }
    if (command_.empty()) {
        THROW_INVALID_ARGUMENT("Job '", id_, "' has an empty command");
    }

    nextRunAt_ = nextFireTime(trigger_, now);
    if (!nextRunAt_) {
        THROW_TRIGGER_EXHAUSTED("Job '", id_, "' trigger ",
                                describe(trigger_),
                                " has no run time after now");
    }
}

auto Job::isDue(TimePoint now) const -> bool {
    return nextRunAt_ && *nextRunAt_ <= now;
}

auto Job::advance(TimePoint firedAt) -> bool {
    // Clear first so a failed cron search leaves the job exhausted.
    nextRunAt_.reset();
    nextRunAt_ = nextFireTime(trigger_, firedAt);
    return nextRunAt_.has_value();
}

void Job::recordRun(TimePoint at) {
    lastRunAt_ = at;
    ++runCount_;
}

auto Job::snapshot() const -> JobInfo {
    JobInfo info;
    info.id = id_;
    info.command = command_;
    info.nextRunAt = nextRunAt_;
    info.triggerSummary = describe(trigger_);
    info.trigger = toJson(trigger_);
    info.runCount = runCount_;
    info.failureCount = failureCount_;
    info.skippedCount = skippedCount_;
    info.lastRunAt = lastRunAt_;
    return info;
}

}  // namespace cadence::schedule
