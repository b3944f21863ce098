/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool used to drive concurrent generator load.
 *
 * @details
 * The `WorkerPool` keeps a cohort of long-lived threads fed from a FIFO task
 * queue. The benchmark harness and the concurrency tests submit batches of
 * generator calls to it and block on `wait_idle()` for the batch to finish.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace fastuuid::infra {

/**
 * @class WorkerPool
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Waiters:** `wait_idle()` sleeps on a second condition variable until the
 *   queue is empty and no task is executing.
 */
class WorkerPool {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Zero (e.g. when
     * `std::thread::hardware_concurrency()` cannot tell) is raised to one.
     * @throws std::system_error If a worker thread cannot be started. Workers
     * started before the failure are stopped and joined first.
     */
    explicit WorkerPool(std::size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains the queue, then joins every worker.
     *
     * @note Blocking: tasks already enqueued still run before destruction completes.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @param task The unit of work. Exceptions escaping it are caught by the
     * worker, logged at `ERROR` and counted in `failed_tasks()`.
     */
    void enqueue(std::function<void()> task);

    /// @brief Blocks until the queue is empty and no worker is running a task.
    void wait_idle();

    /// @brief Number of worker threads in the cohort.
    std::size_t size() const noexcept { return workers_.size(); }

    /// @brief Number of tasks that terminated with an exception.
    std::size_t failed_tasks() const noexcept { return failed_.load(); }

  private:
    void worker_loop();

    /// @brief Sets the stop flag, wakes every worker and joins it.
    void shutdown() noexcept;

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    /// @brief Protects `tasks_` and `active_`.
    std::mutex queue_mutex_;

    /// @brief Wakes workers on new work or shutdown.
    std::condition_variable condition_;

    /// @brief Wakes `wait_idle()` callers when the pool drains.
    std::condition_variable idle_;

    /// @brief Tasks currently executing outside the lock.
    std::size_t active_ = 0;

    std::atomic<std::size_t> failed_{0};
    std::atomic<bool> stop_{false};
};

} // namespace fastuuid::infra
