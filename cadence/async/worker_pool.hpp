/*
 * worker_pool.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Fixed-size worker pool for job callback dispatch

**************************************************/

#ifndef CADENCE_ASYNC_WORKER_POOL_HPP
#define CADENCE_ASYNC_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace cadence::async {

/**
 * @brief A fixed set of worker threads consuming a FIFO task queue.
 *
 * Tasks are plain `void()` functions. A task that throws is logged and the
 * worker keeps serving the queue.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    /**
     * @brief Starts the worker threads.
     *
     * @param threadCount Number of workers, must be at least 1.
     * @throws cadence::error::InvalidArgument If threadCount is 0.
     */
    explicit WorkerPool(size_t threadCount);

    /**
     * @brief Calls shutdown().
     */
    ~WorkerPool() noexcept;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * @brief Queues a task.
     *
     * @return false if the task is empty or the pool has been shut down.
     */
    [[nodiscard]] auto submit(Task task) -> bool;

    /**
     * @brief Number of queued tasks not yet picked up by a worker.
     */
    [[nodiscard]] auto pendingTasks() const -> size_t;

    [[nodiscard]] auto size() const noexcept -> size_t;

    /**
     * @brief Stops accepting tasks, lets workers drain the queue and joins
     * them. Safe to call more than once.
     */
    void shutdown() noexcept;

private:
    void workerLoop(std::stop_token stopToken);

    std::vector<std::jthread> workers_;
    std::deque<Task> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable_any condition_;
    bool accepting_ = true;
};

}  // namespace cadence::async

#endif  // CADENCE_ASYNC_WORKER_POOL_HPP
