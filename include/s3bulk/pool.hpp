/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "s3bulk/job.hpp"
#include "s3bulk/object_store.hpp"

namespace s3bulk {

using JobProcessor = std::function<void(const Job& job, ObjectStore& store, int workerId)>;

// Fixed set of workers draining a bounded FIFO. Each worker owns the store
// it obtained from the factory for its whole lifetime.
class Pool {
public:
    Pool(int workers, std::size_t queueCapacity, StoreFactory factory);
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] static std::size_t capacityFor(int workers) noexcept {
        return workers > 0 ? 2 * static_cast<std::size_t>(workers) : 2;
    }

    // Spawns the workers and waits until each has its store. False if any
    // thread or store could not be created; nothing is left running then.
    [[nodiscard]] bool start(JobProcessor processor);
    // Drains the queue, waits for in-flight jobs and joins every worker.
    void shutdown() noexcept;
    // Blocks while the queue is full. False only when the pool is not running.
    [[nodiscard]] bool submit(Job job);
    
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t queueCapacity() const noexcept { return capacity_; }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }
    [[nodiscard]] std::size_t completedJobs() const noexcept { return completed_.load(); }

private:
    void workerLoop(int workerId);
    void stopAndJoin() noexcept;
    
    int workers_;
    std::size_t capacity_;
    StoreFactory factory_;
    JobProcessor processor_;
    
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> completed_{0};
    
    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::condition_variable spaceAvailable_;
    std::condition_variable workersReady_;
    std::deque<Job> jobQueue_;
    bool stopping_ = false;
    int readyWorkers_ = 0;
    int failedWorkers_ = 0;
    
    std::vector<std::thread> workerThreads_;
};

}
