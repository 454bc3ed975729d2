/*
 * worker_pool.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Fixed-size worker pool for job callback dispatch

**************************************************/

#include "worker_pool.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "cadence/error/exception.hpp"

namespace cadence::async {

WorkerPool::WorkerPool(size_t threadCount) {
    if (threadCount == 0) {
        THROW_INVALID_ARGUMENT("WorkerPool needs at least one thread");
    }

    workers_.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back(
            [this](std::stop_token stopToken) { workerLoop(stopToken); });
    }
    spdlog::debug("WorkerPool started with {} threads", threadCount);
}

WorkerPool::~WorkerPool() noexcept { shutdown(); }

auto WorkerPool::submit(Task task) -> bool {
    if (!task) {
        return false;
    }
    {
        std::scoped_lock lock(queueMutex_);
        if (!accepting_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    condition_.notify_one();
    return true;
}

auto WorkerPool::pendingTasks() const -> size_t {
    std::scoped_lock lock(queueMutex_);
    return tasks_.size();
}

auto WorkerPool::size() const noexcept -> size_t { return workers_.size(); }

void WorkerPool::shutdown() noexcept {
    {
        std::scoped_lock lock(queueMutex_);
        if (!accepting_ && workers_.empty()) {
            return;
        }
        accepting_ = false;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        worker.request_stop();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void WorkerPool::workerLoop(std::stop_token stopToken) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queueMutex_);
            condition_.wait(lock, stopToken, [this] {
                return !tasks_.empty() || !accepting_;
            });

            // Queued tasks are drained before a worker exits.
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const cadence::error::Exception& e) {
            spdlog::error("Worker task failed: {}", e.getMessage());
        } catch (const std::exception& e) {
            spdlog::error("Worker task failed: {}", e.what());
        } catch (...) {
            spdlog::error("Worker task failed with unknown exception");
        }
    }
}

}  // namespace cadence::async
