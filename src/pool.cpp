/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/pool.hpp"
#include "s3bulk/logger.hpp"
#include <memory>
#include <optional>
#include <system_error>

namespace s3bulk {

Pool::Pool(int workers, std::size_t queueCapacity, StoreFactory factory)
    : workers_(workers > 0 ? workers : 1),
      capacity_(queueCapacity > 0 ? queueCapacity : 1),
      factory_(std::move(factory)) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers, queue capacity " +
              std::to_string(capacity_));
}

Pool::~Pool() {
    shutdown();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor || !factory_) {
        LOG_ERROR("Invalid job processor or store factory provided");
        return false;
    }

    processor_ = std::move(processor);
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = false;
        readyWorkers_ = 0;
        failedWorkers_ = 0;
    }

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()) + " (" +
                  std::to_string(workerThreads_.size()) + " of " + std::to_string(workers_) +
                  " workers created)");
        stopAndJoin();
        return false;
    }

    // Wait for every worker to report whether its store is usable
    int failed = 0;
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        workersReady_.wait(lock, [this] { return readyWorkers_ + failedWorkers_ == workers_; });
        failed = failedWorkers_;
    }

    if (failed > 0) {
        LOG_ERROR("Failed to start pool: " + std::to_string(failed) + " of " +
                  std::to_string(workers_) + " workers could not create a store client");
        stopAndJoin();
        return false;
    }

    running_.store(true);
    LOG_INFO("Pool started successfully with " + std::to_string(workers_) + " worker threads");
    return true;
}

void Pool::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping pool, " + std::to_string(queueSize()) + " jobs still queued...");
    stopAndJoin();
    LOG_INFO("Pool stopped after " + std::to_string(completed_.load()) + " jobs");
}

void Pool::stopAndJoin() noexcept {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = true;
    }

    // Workers keep draining until the queue is empty, then exit
    jobAvailable_.notify_all();
    spaceAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();
}

bool Pool::submit(Job job) {
    if (!running_.load()) {
        LOG_WARN("Cannot submit job to stopped pool: " + job.describe());
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        spaceAvailable_.wait(lock, [this] {
            return jobQueue_.size() < capacity_ || stopping_;
        });

        if (stopping_) {
            LOG_WARN("Pool is shutting down, job not queued: " + job.describe());
            return false;
        }

        LOG_TRACE("Job queued: " + job.describe());
        jobQueue_.push_back(std::move(job));
    }

    jobAvailable_.notify_one();
    return true;
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " thread started");

    // The store lives exactly as long as this worker
    std::unique_ptr<ObjectStore> store;
    try {
        store = factory_();
    } catch (const std::exception& e) {
        LOG_ERROR("Worker " + std::to_string(workerId) + " store creation failed: " + std::string(e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (store) {
            ++readyWorkers_;
        } else {
            ++failedWorkers_;
        }
    }
    workersReady_.notify_all();

    if (!store) {
        LOG_DEBUG("Worker " + std::to_string(workerId) + " exiting without a store");
        return;
    }

    while (true) {
        std::optional<Job> job;

        // Get next job
        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            // Wait for job or shutdown signal
            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || stopping_;
            });

            if (jobQueue_.empty()) {
                break; // stopping and fully drained
            }

            job.emplace(std::move(jobQueue_.front()));
            jobQueue_.pop_front();
        }
        spaceAvailable_.notify_one();

        // Process job outside of lock
        LOG_DEBUG("Worker-" + std::to_string(workerId) + " claimed job: " + job->describe());
        try {
            processor_(*job, *store, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " job processing error: " +
                      std::string(e.what()) + " (job: " + job->describe() + ")");
        }
        completed_.fetch_add(1);
    }

    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
