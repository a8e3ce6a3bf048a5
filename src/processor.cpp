/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/processor.hpp"
#include "s3bulk/job.hpp"
#include "s3bulk/logger.hpp"
#include <filesystem>
#include <system_error>

namespace s3bulk {

Processor::Processor(BackoffPolicy backoff, Sleeper sleeper)
    : backoff_(backoff), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = sleepFor;
    }
}

JobReport Processor::process(const Job& job, ObjectStore& store) const noexcept {
    try {
        return runAttempts(job, store);
    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing " + job.key() + ": " + std::string(e.what()));
        removePartialDownload(job, {});
        return {JobOutcome::TerminalFailed, 0, e.what()};
    }
}

JobReport Processor::runAttempts(const Job& job, ObjectStore& store) const {
    JobReport report;
    const int budget = job.retriesAllowed();
    LOG_DEBUG("Processing job: " + job.describe());

    std::filesystem::path createdDir;
    if (job.kind() == JobKind::Get) {
        std::string error;
        if (!prepareDestination(job, createdDir, error)) {
            LOG_ERROR("Cannot prepare " + job.localPath().string() + " for " + job.describe() + ": " + error);
            report.outcome = JobOutcome::TerminalFailed;
            report.error = error;
            return report;
        }
    }

    for (int attempt = 1; attempt <= budget; ++attempt) {
        report.attempts = attempt;
        StoreResult result = attemptOnce(job, store);

        switch (result.status) {
            case StoreStatus::Ok:
                LOG_INFO("Done: " + job.describe() +
                         (attempt > 1 ? " (attempt " + std::to_string(attempt) + ")" : ""));
                report.outcome = JobOutcome::Succeeded;
                return report;

            case StoreStatus::Rejected:
            case StoreStatus::LocalError:
                LOG_ERROR("Failed: " + job.describe() + " [" + toString(result.status) + "] " + result.message);
                removePartialDownload(job, createdDir);
                report.outcome = JobOutcome::TerminalFailed;
                report.error = result.message;
                return report;

            case StoreStatus::Transient:
                report.error = result.message;
                if (attempt == budget) {
                    break;
                }
                try {
                    auto delay = backoff_.delayFor(attempt);
                    LOG_WARN("Transient error on " + job.describe() + ": " + result.message +
                             "; retrying in " + std::to_string(delay.count()) + "ms (attempt " +
                             std::to_string(attempt) + "/" + std::to_string(budget) + ")");
                    sleeper_(delay);
                } catch (const std::exception& e) {
                    LOG_ERROR("Backoff interrupted for " + job.describe() + ": " + e.what());
                }
                break;
        }
    }

    LOG_ERROR("Giving up on " + job.describe() + " after " + std::to_string(report.attempts) +
              " attempts: " + report.error);
    removePartialDownload(job, createdDir);
    report.outcome = JobOutcome::RetriesExhausted;
    return report;
}

StoreResult Processor::attemptOnce(const Job& job, ObjectStore& store) const noexcept {
    try {
        switch (job.kind()) {
            case JobKind::Get:
                return store.download(job.key(), job.localPath());
            case JobKind::Put:
                return store.upload(job.localPath(), job.key(), job.accessPolicy());
        }
        return StoreResult::failure(StoreStatus::LocalError, "unknown job kind");
    } catch (const std::exception& e) {
        // Client-side exceptions are I/O trouble until proven otherwise
        return StoreResult::failure(StoreStatus::Transient, std::string("client exception: ") + e.what());
    }
}

bool Processor::prepareDestination(const Job& job, std::filesystem::path& created,
                                   std::string& error) const noexcept {
    try {
        auto parent = job.localPath().parent_path();
        if (parent.empty()) {
            return true;
        }

        // Topmost directory this job is about to create
        std::error_code ec;
        for (auto dir = parent; !dir.empty() && !std::filesystem::exists(dir, ec); dir = dir.parent_path()) {
            created = dir;
        }

        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = ec.message();
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

void Processor::removePartialDownload(const Job& job, const std::filesystem::path& createdDir) const noexcept {
    if (job.kind() != JobKind::Get) {
        return;
    }
    std::error_code ec;
    if (std::filesystem::remove(job.localPath(), ec)) {
        LOG_DEBUG("Removed partial download: " + job.localPath().string());
    } else if (ec) {
        LOG_WARN("Could not remove partial download " + job.localPath().string() + ": " + ec.message());
    }

    // Other workers may be writing into the same tree, so directories stay
    if (!createdDir.empty()) {
        LOG_INFO("Directory " + createdDir.string() + " created for failed " + job.describe() +
                 " was left in place");
    }
}

}
