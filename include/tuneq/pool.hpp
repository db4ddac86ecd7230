/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tuneq {

using Task = std::function<void(int workerId)>;

class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start();
    // Joins every worker; tasks still queued are run to completion first.
    void stop() noexcept;
    [[nodiscard]] bool submit(Task task) noexcept;

    // Grows the pool to at least `workers` threads. Never shrinks.
    void ensureWorkers(int workers) noexcept;
    
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept;

private:
    void workerLoop(int workerId);
    [[nodiscard]] bool spawnWorkers(int count);
    
    int workers_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    
    mutable std::mutex queueMutex_;
    std::condition_variable taskAvailable_;
    std::queue<Task> taskQueue_;
    
    mutable std::mutex threadsMutex_;
    std::vector<std::thread> workerThreads_;
};

}
