/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/pool.hpp"
#include "tuneq/logger.hpp"
#include <string>

namespace tuneq {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    if (!spawnWorkers(workers_)) {
        running_.store(false);
        return false;
    }

    LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
    return true;
}

bool Pool::spawnWorkers(int count) {
    std::lock_guard<std::mutex> lock(threadsMutex_);
    if (shutdown_.load()) {
        return false;
    }
    try {
        int first = static_cast<int>(workerThreads_.size());
        workerThreads_.reserve(static_cast<std::size_t>(first + count));
        for (int i = first; i < first + count; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start worker threads: " + std::string(e.what()));
        return false;
    }
}

void Pool::ensureWorkers(int workers) noexcept {
    if (!running_.load() || shutdown_.load()) {
        if (workers > workers_) {
            workers_ = workers;
        }
        return;
    }

    int current = workerCount();
    if (workers <= current) {
        return;
    }

    if (spawnWorkers(workers - current)) {
        workers_ = workers;
        LOG_DEBUG("Pool grown to " + std::to_string(workers) + " workers");
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    
    shutdown_.store(true);
    running_.store(false);
    
    taskAvailable_.notify_all();
    
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        threads.swap(workerThreads_);
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    
    LOG_INFO("Pool stopped");
}

bool Pool::submit(Task task) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit task to stopped pool");
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            taskQueue_.push(std::move(task));
        }
        
        taskAvailable_.notify_one();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue task: " + std::string(e.what()));
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return taskQueue_.size();
    } catch (...) {
        return 0;
    }
}

int Pool::workerCount() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        return static_cast<int>(workerThreads_.size());
    } catch (...) {
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    ThreadNameScope threadName(getThreadName(workerId));
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " thread started");
    
    try {
        while (true) {
            Task task;
            
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                
                taskAvailable_.wait(lock, [this] { 
                    return !taskQueue_.empty() || shutdown_.load(); 
                });
                
                // Drain what was already accepted before honouring shutdown
                if (taskQueue_.empty()) {
                    break;
                }
                
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            
            if (task) {
                try {
                    task(workerId);
                } catch (const std::exception& e) {
                    LOG_ERROR("Worker " + std::to_string(workerId) + " task error: " + std::string(e.what()));
                } catch (...) {
                    LOG_ERROR("Worker " + std::to_string(workerId) + " unknown task error");
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Worker " + std::to_string(workerId) + " fatal error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Worker " + std::to_string(workerId) + " unknown fatal error");
    }
    
    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
