/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "s3bulk/backoff.hpp"
#include "s3bulk/object_store.hpp"
#include "s3bulk/types.hpp"

namespace s3bulk {

class Job;

struct JobReport {
    JobOutcome outcome = JobOutcome::Succeeded;
    int attempts = 0;
    std::string error;
};

// Runs one job to a terminal state: attempt, classify, back off, repeat.
// Stateless apart from its policy, so one instance serves every worker.
class Processor {
public:
    explicit Processor(BackoffPolicy backoff = BackoffPolicy(), Sleeper sleeper = sleepFor);

    [[nodiscard]] JobReport process(const Job& job, ObjectStore& store) const noexcept;

    [[nodiscard]] const BackoffPolicy& backoff() const noexcept { return backoff_; }

private:
    BackoffPolicy backoff_;
    Sleeper sleeper_;

    [[nodiscard]] JobReport runAttempts(const Job& job, ObjectStore& store) const;
    [[nodiscard]] StoreResult attemptOnce(const Job& job, ObjectStore& store) const noexcept;
    // created receives the topmost directory that did not exist before.
    [[nodiscard]] bool prepareDestination(const Job& job, std::filesystem::path& created,
                                          std::string& error) const noexcept;
    void removePartialDownload(const Job& job, const std::filesystem::path& createdDir) const noexcept;
};

}
