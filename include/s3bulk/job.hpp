/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "s3bulk/types.hpp"

namespace s3bulk {

constexpr int kDefaultRetries = 5;

// Per-run settings copied into every job.
struct JobOptions {
    int retriesAllowed = kDefaultRetries;
    AccessPolicy accessPolicy = AccessPolicy::Private;
};

// One transfer bound to one object key. Immutable after construction.
class Job final {
public:
    Job(JobKind kind, std::string key, std::filesystem::path localPath, const JobOptions& options);

    // Download of key into a path mirroring the key under the working directory.
    [[nodiscard]] static std::optional<Job> get(const std::string& key, const JobOptions& options);
    // Upload of a local file to the key derived from its path.
    [[nodiscard]] static std::optional<Job> put(const std::string& path, const JobOptions& options);

    [[nodiscard]] JobKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] const std::filesystem::path& localPath() const noexcept { return localPath_; }
    [[nodiscard]] int retriesAllowed() const noexcept { return retriesAllowed_; }
    [[nodiscard]] AccessPolicy accessPolicy() const noexcept { return accessPolicy_; }

    // "get photos/a.jpg" style label for log lines.
    [[nodiscard]] std::string describe() const;

private:
    JobKind kind_;
    std::string key_;
    std::filesystem::path localPath_;
    int retriesAllowed_;
    AccessPolicy accessPolicy_;
};

// Relative local path for a key; nullopt when the key is empty or escapes
// the working directory.
[[nodiscard]] std::optional<std::filesystem::path> localPathForKey(const std::string& key);

// Object key for a local path: generic separators, leading "./" and "/" removed.
[[nodiscard]] std::string keyForPath(const std::filesystem::path& path);

} // namespace s3bulk
