/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

#include "s3bulk/config.hpp"
#include "s3bulk/job.hpp"
#include "s3bulk/object_store.hpp"
#include "s3bulk/processor.hpp"

namespace s3bulk {

class InputSource;
class StopToken;

// Process exit codes.
enum ExitCode : int {
    kExitOk = 0,
    kExitFailures = 1,
    kExitUsage = 2,
    kExitInterrupted = 130
};

struct TransferSummary {
    std::size_t submitted = 0;
    std::size_t skipped = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t exhausted = 0;
    bool cancelled = false;
    bool startupFailed = false;

    [[nodiscard]] int exitCode() const noexcept;
};

// Bulk get/put: feeds input items to a worker pool until the input runs dry
// or a stop is requested, then drains the pool.
class Transfer final {
public:
    Transfer(const RunConfig& config, StoreFactory factory, const StopToken& stop,
             Processor processor = Processor());

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;
    Transfer(Transfer&&) = delete;
    Transfer& operator=(Transfer&&) = delete;

    [[nodiscard]] TransferSummary run(InputSource& input);

private:
    [[nodiscard]] std::optional<Job> makeJob(const std::string& item) const;
    void record(const JobReport& report) noexcept;

    const RunConfig& config_;
    StoreFactory factory_;
    const StopToken& stop_;
    Processor processor_;
    JobOptions options_;

    std::atomic<std::size_t> succeeded_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> exhausted_{0};
};

// Prints every key after startKey, one per line, until stop is requested.
// Returns the exit code.
[[nodiscard]] int listKeys(ObjectStore& store, const std::string& startKey, const StopToken& stop,
                           std::ostream& out);

// Runs the configured operation end to end and returns the process exit code.
[[nodiscard]] int runOperation(const RunConfig& config, const StoreFactory& factory,
                               const StopToken& stop, std::istream& in, std::ostream& out);

}
