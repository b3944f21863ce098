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
 * @file worker_pool.cpp
 * @brief Implementation of the fixed-size worker pool.
 *
 * @details
 * Producer-consumer over a mutex-guarded FIFO. Workers exit only once the stop
 * flag is set AND the queue has been drained, so destruction never drops work.
 */

#include "fastuuid/infra/worker_pool.hpp"

#include "fastuuid/infra/logger.hpp"

#include <exception>
#include <string>

namespace fastuuid::infra {

WorkerPool::WorkerPool(std::size_t threads)
{
    if (threads == 0) {
        threads = 1;
    }

    workers_.reserve(threads);
    try {
        for (std::size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    } catch (const std::exception& e) {
        // Workers already running must be joined before the members go away.
        shutdown();
        Logger::log(LogLevel::ERROR, "Pool: Could not start worker " +
                                         std::to_string(workers_.size() + 1) + " of " +
                                         std::to_string(threads) + ": " + e.what());
        throw;
    }

    Logger::log(LogLevel::DEBUG, "Pool: Started " + std::to_string(threads) + " workers.");
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

void WorkerPool::shutdown() noexcept
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

void WorkerPool::wait_idle()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

/**
 * @brief Worker event loop.
 *
 * Task execution happens outside the mutex so other workers can dequeue while
 * this one is busy.
 */
void WorkerPool::worker_loop()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                failed_.fetch_add(1);
                Logger::log(LogLevel::ERROR, "Pool: Task failed: " + std::string(e.what()));
            }
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

} // namespace fastuuid::infra
