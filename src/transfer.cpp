/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/transfer.hpp"
#include "s3bulk/input.hpp"
#include "s3bulk/job.hpp"
#include "s3bulk/logger.hpp"
#include "s3bulk/pool.hpp"
#include "s3bulk/stop_signal.hpp"
#include <filesystem>
#include <istream>
#include <ostream>

namespace s3bulk {

int TransferSummary::exitCode() const noexcept {
    if (startupFailed) return kExitFailures;
    if (cancelled) return kExitInterrupted;
    if (failed > 0 || exhausted > 0) return kExitFailures;
    return kExitOk;
}

Transfer::Transfer(const RunConfig& config, StoreFactory factory, const StopToken& stop,
                   Processor processor)
    : config_(config),
      factory_(std::move(factory)),
      stop_(stop),
      processor_(std::move(processor)),
      options_(config.jobOptions()) {
    LOG_DEBUG("Transfer created - bucket: " + config_.bucket + ", operation: " +
              toString(config_.operation) + ", workers: " + std::to_string(config_.threads));
}

TransferSummary Transfer::run(InputSource& input) {
    TransferSummary summary;

    Pool pool(config_.threads, Pool::capacityFor(config_.threads), factory_);
    if (!pool.start([this](const Job& job, ObjectStore& store, int) {
            record(processor_.process(job, store));
        })) {
        LOG_ERROR("Failed to start worker pool, no jobs were run");
        summary.startupFailed = true;
        return summary;
    }

    // Dispatch loop: the stop token is checked before every new item
    while (true) {
        if (stop_.stopRequested()) {
            LOG_WARN("Interrupt received, no further jobs will be submitted (" +
                     std::to_string(summary.submitted) + " already submitted)");
            summary.cancelled = true;
            break;
        }

        auto item = input.next();
        if (!item) {
            break;
        }

        auto job = makeJob(*item);
        if (!job) {
            ++summary.skipped;
            continue;
        }

        if (!pool.submit(std::move(*job))) {
            LOG_ERROR("Worker pool refused job for: " + *item);
            break;
        }
        ++summary.submitted;
    }

    LOG_DEBUG("Dispatch finished, waiting for " + std::to_string(summary.submitted) + " jobs");
    pool.shutdown();

    // A stop that arrived while the pool was draining still marks the run
    if (!summary.cancelled && stop_.stopRequested()) {
        LOG_WARN("Interrupt received while finishing submitted jobs");
        summary.cancelled = true;
    }

    summary.skipped += input.skipped();
    summary.succeeded = succeeded_.load();
    summary.failed = failed_.load();
    summary.exhausted = exhausted_.load();

    LOG_INFO("Transfer complete: " + std::to_string(summary.succeeded) + " succeeded, " +
             std::to_string(summary.failed) + " failed, " + std::to_string(summary.exhausted) +
             " gave up after retries, " + std::to_string(summary.skipped) + " inputs skipped");
    return summary;
}

std::optional<Job> Transfer::makeJob(const std::string& item) const {
    switch (config_.operation) {
        case Operation::Get:
            return Job::get(item, options_);
        case Operation::Put: {
            std::error_code ec;
            if (std::filesystem::is_directory(item, ec)) {
                LOG_ERROR("Skipping directory: " + item);
                return std::nullopt;
            }
            return Job::put(item, options_);
        }
        case Operation::List:
        case Operation::Delete:
            break;
    }
    LOG_ERROR(std::string("Operation '") + toString(config_.operation) + "' does not create jobs");
    return std::nullopt;
}

void Transfer::record(const JobReport& report) noexcept {
    switch (report.outcome) {
        case JobOutcome::Succeeded:
            succeeded_.fetch_add(1);
            break;
        case JobOutcome::TerminalFailed:
            failed_.fetch_add(1);
            break;
        case JobOutcome::RetriesExhausted:
            exhausted_.fetch_add(1);
            break;
    }
}

int listKeys(ObjectStore& store, const std::string& startKey, const StopToken& stop,
             std::ostream& out) {
    std::size_t count = 0;
    StoreResult result = store.list(startKey, [&](const std::string& key) {
        if (stop.stopRequested()) {
            return false;
        }
        out << key << '\n';
        ++count;
        return true;
    });
    out.flush();

    if (stop.stopRequested()) {
        LOG_WARN("Interrupt received, listing stopped after " + std::to_string(count) + " keys");
        return kExitInterrupted;
    }

    if (!result) {
        LOG_ERROR("Listing failed after " + std::to_string(count) + " keys [" +
                  toString(result.status) + "] " + result.message);
        return kExitFailures;
    }
    LOG_DEBUG("Listed " + std::to_string(count) + " keys");
    return kExitOk;
}

int runOperation(const RunConfig& config, const StoreFactory& factory,
                 const StopToken& stop, std::istream& in, std::ostream& out) {
    switch (config.operation) {
        case Operation::Get:
        case Operation::Put: {
            InputSource input = InputSource::resolve(config, in);
            Transfer transfer(config, factory, stop);
            return transfer.run(input).exitCode();
        }

        case Operation::List: {
            std::unique_ptr<ObjectStore> store;
            try {
                store = factory();
            } catch (const std::exception& e) {
                LOG_ERROR("Cannot create store client: " + std::string(e.what()));
            }
            if (!store) {
                return kExitFailures;
            }
            return listKeys(*store, config.startKey, stop, out);
        }

        case Operation::Delete:
            LOG_ERROR("Operation 'delete' is not supported");
            return kExitUsage;
    }
    return kExitUsage;
}

}
