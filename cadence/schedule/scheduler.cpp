/*
 * scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Task scheduler running text commands on triggers

**************************************************/

#include "scheduler.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "cadence/error/exception.hpp"

namespace cadence::schedule {

namespace {

auto validateOptions(SchedulerOptions options) -> SchedulerOptions {
    if (options.tickInterval <= std::chrono::milliseconds::zero()) {
        THROW_INVALID_ARGUMENT("Tick interval must be positive, got ",
                               options.tickInterval.count(), "ms");
    }
    if (options.workerThreads == 0) {
        THROW_INVALID_ARGUMENT("At least one worker thread is required");
    }
    if (options.maxInstances < 1) {
        THROW_INVALID_ARGUMENT("maxInstances must be at least 1, got ",
                               options.maxInstances);
    }
    if (options.cronSearchYears < 1) {
        THROW_INVALID_ARGUMENT("cronSearchYears must be at least 1, got ",
                               options.cronSearchYears);
    }
    return options;
}

// Any failure of the callback is reported as a CallbackFailure.
auto invokeCallback(const CommandCallback& callback, const std::string& id,
                    const std::string& command) -> std::string {
    try {
        return callback(command);
    } catch (const error::Exception& e) {
        THROW_CALLBACK_FAILURE("Job '", id, "' command '", command,
                               "' failed: ", e.getMessage());
    } catch (const std::exception& e) {
        THROW_CALLBACK_FAILURE("Job '", id, "' command '", command,
                               "' failed: ", e.what());
    } catch (...) {
        THROW_CALLBACK_FAILURE("Job '", id, "' command '", command,
                               "' failed with an unknown exception");
    }
}

}  // namespace

TaskScheduler::TaskScheduler(SchedulerOptions options)
    : options_(validateOptions(options)),
      parser_(options_.cronSearchYears),
      pool_(options_.workerThreads) {}

TaskScheduler::~TaskScheduler() noexcept {
    try {
        if (isRunning()) {
            stop();
        }
    } catch (const std::exception& e) {
        spdlog::error("Error while stopping TaskScheduler: {}", e.what());
    }
    // Workers report back into jobs_, so they must finish first.
    pool_.shutdown();
}

auto TaskScheduler::start() -> bool {
    std::scoped_lock lifecycle(lifecycleMutex_);
    {
        std::scoped_lock lock(mutex_);
        if (running_) {
            spdlog::warn("TaskScheduler is already running");
            return false;
        }
        jobs_.clear();
        jobsChanged_ = false;
        running_ = true;
    }

    try {
        thread_ = std::jthread(
            [this](std::stop_token stopToken) { run(stopToken); });
    } catch (const std::system_error& e) {
        {
            std::scoped_lock lock(mutex_);
            running_ = false;
        }
        spdlog::error("Failed to start scheduler thread: {}", e.what());
        return false;
    }

    spdlog::info("TaskScheduler started (tick {}ms, {} workers)",
                 options_.tickInterval.count(), options_.workerThreads);
    return true;
}

auto TaskScheduler::stop() -> bool {
    std::scoped_lock lifecycle(lifecycleMutex_);
    {
        std::scoped_lock lock(mutex_);
        if (!running_) {
            spdlog::warn("TaskScheduler is not running");
            return false;
        }
        running_ = false;
    }

    thread_.request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    size_t dropped = 0;
    {
        std::scoped_lock lock(mutex_);
        dropped = jobs_.size();
        jobs_.clear();
    }
    spdlog::info("TaskScheduler stopped, {} pending jobs discarded", dropped);
    return true;
}

auto TaskScheduler::isRunning() const noexcept -> bool { return running_; }

void TaskScheduler::setCommandCallback(CommandCallback callback) {
    const bool isSet = static_cast<bool>(callback);
    {
        std::scoped_lock lock(mutex_);
        callback_ = std::move(callback);
    }
    if (isSet) {
        spdlog::info("Command callback registered");
    } else {
        spdlog::warn("Command callback cleared, due jobs will be skipped");
    }
}

auto TaskScheduler::addJob(const std::string& id, const std::string& command,
                           const Trigger& trigger) -> bool {
    try {
        Job job(id, command, trigger, Clock::now(), nextGeneration_++);
        const auto summary = describe(job.trigger());
        const auto nextRun = utils::formatTimePoint(*job.nextRunAt());
        {
            std::scoped_lock lock(mutex_);
            ensureRunning("add job");
            auto [it, inserted] = jobs_.insert_or_assign(id, std::move(job));
            jobsChanged_ = true;
            spdlog::info("{} job '{}' with trigger {}, next run at {}",
                         inserted ? "Added" : "Replaced", id, summary,
                         nextRun);
        }
        cond_.notify_all();
        return true;
    } catch (const error::Exception& e) {
        spdlog::error("Failed to add job '{}': {}", id, e.getMessage());
    } catch (const std::exception& e) {
        spdlog::error("Failed to add job '{}': {}", id, e.what());
    }
    return false;
}

auto TaskScheduler::removeJob(const std::string& id) -> bool {
    try {
        std::scoped_lock lock(mutex_);
        ensureRunning("remove job");
        if (jobs_.erase(id) == 0) {
            spdlog::warn("Cannot remove job '{}': no such job", id);
            return false;
        }
        jobsChanged_ = true;
    } catch (const error::ConfigurationError& e) {
        spdlog::warn("{}", e.getMessage());
        return false;
    }
    cond_.notify_all();
    spdlog::info("Removed job '{}'", id);
    return true;
}

auto TaskScheduler::getJobs() const -> std::vector<JobInfo> {
    std::vector<JobInfo> jobs;
    try {
        std::scoped_lock lock(mutex_);
        ensureRunning("list jobs");
        jobs.reserve(jobs_.size());
        for (const auto& [id, job] : jobs_) {
            jobs.push_back(job.snapshot());
        }
    } catch (const error::Exception& e) {
        spdlog::warn("{}", e.getMessage());
        jobs.clear();
    }
    return jobs;
}

auto TaskScheduler::getJob(const std::string& id) const
    -> std::optional<JobInfo> {
    try {
        std::scoped_lock lock(mutex_);
        ensureRunning("get job");
        if (auto it = jobs_.find(id); it != jobs_.end()) {
            return it->second.snapshot();
        }
    } catch (const error::Exception& e) {
        spdlog::warn("{}", e.getMessage());
    }
    return std::nullopt;
}

auto TaskScheduler::jobCount() const -> size_t {
    std::scoped_lock lock(mutex_);
    return jobs_.size();
}

auto TaskScheduler::scheduleOnce(const std::string& id,
                                 const std::string& command, TimePoint at)
    -> bool {
    return addJob(id, command, makeOnce(at));
}

auto TaskScheduler::scheduleInterval(const std::string& id,
                                     const std::string& command,
                                     std::chrono::milliseconds period,
                                     std::optional<TimePoint> start) -> bool {
    return addBuiltJob(id, command,
                       [&] { return makeInterval(period, start); });
}

auto TaskScheduler::scheduleCron(const std::string& id,
                                 const std::string& command,
                                 const CronSpec& spec) -> bool {
    return addBuiltJob(id, command, [&] {
        return makeCron(spec, options_.cronSearchYears);
    });
}

auto TaskScheduler::scheduleDaily(const std::string& id,
                                  const std::string& command, int hour,
                                  int minute) -> bool {
    CronSpec spec;
    spec.hour = std::to_string(hour);
    spec.minute = std::to_string(minute);
    return scheduleCron(id, command, spec);
}

auto TaskScheduler::scheduleWeekly(const std::string& id,
                                   const std::string& command,
                                   std::string_view dayOfWeek, int hour,
                                   int minute) -> bool {
    CronSpec spec;
    spec.dayOfWeek = std::string(dayOfWeek);
    spec.hour = std::to_string(hour);
    spec.minute = std::to_string(minute);
    return scheduleCron(id, command, spec);
}

auto TaskScheduler::scheduleFromText(const std::string& id,
                                     const std::string& command,
                                     std::string_view text) -> bool {
    return addBuiltJob(id, command, [&] { return parser_.parse(text); });
}

auto TaskScheduler::addBuiltJob(const std::string& id,
                                const std::string& command,
                                const std::function<Trigger()>& build)
    -> bool {
    try {
        return addJob(id, command, build());
    } catch (const error::Exception& e) {
        spdlog::error("Invalid schedule for job '{}': {}", id, e.getMessage());
    }
    return false;
}

void TaskScheduler::run(std::stop_token stopToken) {
    spdlog::debug("Scheduler timing loop started");
    std::unique_lock lock(mutex_);
    while (!stopToken.stop_requested() && running_) {
        const auto now = Clock::now();
        TimePoint wakeAt = now + options_.tickInterval;
        if (auto earliest = dispatchDueJobs(now);
            earliest && *earliest < wakeAt) {
            wakeAt = *earliest;
        }

        jobsChanged_ = false;
        cond_.wait_until(lock, stopToken, wakeAt,
                         [this] { return jobsChanged_; });
    }
    spdlog::debug("Scheduler timing loop exited");
}

auto TaskScheduler::dispatchDueJobs(TimePoint now) -> std::optional<TimePoint> {
    std::optional<TimePoint> earliest;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        Job& job = it->second;
        if (job.isDue(now)) {
            dispatch(job, now);

            bool again = false;
            try {
                again = job.advance(now);
            } catch (const error::Exception& e) {
                spdlog::error("Job '{}' cannot be rescheduled: {}", job.id(),
                              e.getMessage());
            }
            if (!again) {
                spdlog::info("Job '{}' has no further runs, removing it",
                             job.id());
                it = jobs_.erase(it);
                continue;
            }
        }

        const auto& next = job.nextRunAt();
        if (next && (!earliest || *next < *earliest)) {
            earliest = next;
        }
        ++it;
    }
    return earliest;
}

void TaskScheduler::dispatch(Job& job, TimePoint now) {
    if (!callback_) {
        spdlog::warn("Job '{}' is due but no command callback is set, "
                     "skipping this run",
                     job.id());
        job.recordSkip();
        return;
    }

    auto inFlight = job.inFlight();
    if (inFlight->load() >= options_.maxInstances) {
        spdlog::warn("Job '{}' still has {} run(s) in progress, skipping "
                     "this run",
                     job.id(), inFlight->load());
        job.recordSkip();
        return;
    }

    job.recordRun(now);
    ++*inFlight;
    auto task = [this, callback = callback_, id = job.id(),
                 command = job.command(), generation = job.generation(),
                 inFlight] {
        bool failed = false;
        try {
            auto result = invokeCallback(callback, id, command);
            spdlog::info("Job '{}' ran '{}': {}", id, command, result);
        } catch (const error::CallbackFailure& e) {
            spdlog::error("{}", e.getMessage());
            failed = true;
        }
        --*inFlight;
        if (failed) {
            recordFailure(id, generation);
        }
    };

    if (!pool_.submit(std::move(task))) {
        --*inFlight;
        job.recordFailure();
        spdlog::error("Worker pool rejected run of job '{}'", job.id());
        return;
    }
    spdlog::debug("Dispatched job '{}'", job.id());
}

void TaskScheduler::recordFailure(const std::string& id,
                                  std::uint64_t generation) {
    std::scoped_lock lock(mutex_);
    if (auto it = jobs_.find(id);
        it != jobs_.end() && it->second.generation() == generation) {
        it->second.recordFailure();
    }
}

void TaskScheduler::ensureRunning(std::string_view operation) const {
    if (!running_) {
        THROW_CONFIGURATION_ERROR("Cannot ", operation,
                                  ": scheduler is not running");
    }
}

}  // namespace cadence::schedule
