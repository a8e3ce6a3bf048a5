/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/job.hpp"
#include "s3bulk/logger.hpp"
#include <algorithm>

namespace s3bulk {

Job::Job(JobKind kind, std::string key, std::filesystem::path localPath, const JobOptions& options)
    : kind_(kind),
      key_(std::move(key)),
      localPath_(std::move(localPath)),
      retriesAllowed_(std::max(options.retriesAllowed, 1)),
      accessPolicy_(options.accessPolicy) {
}

std::optional<Job> Job::get(const std::string& key, const JobOptions& options) {
    auto path = localPathForKey(key);
    if (!path) {
        LOG_ERROR("Refusing key with no safe local path: '" + key + "'");
        return std::nullopt;
    }
    return Job(JobKind::Get, key, *path, options);
}

std::optional<Job> Job::put(const std::string& path, const JobOptions& options) {
    std::string key = keyForPath(path);
    if (key.empty()) {
        LOG_ERROR("Cannot derive an object key from path: '" + path + "'");
        return std::nullopt;
    }
    return Job(JobKind::Put, key, path, options);
}

std::string Job::describe() const {
    return std::string(toString(kind_)) + " " + key_;
}

std::optional<std::filesystem::path> localPathForKey(const std::string& key) {
    std::string trimmed = key;
    trimmed.erase(0, trimmed.find_first_not_of('/'));
    if (trimmed.empty()) {
        return std::nullopt;
    }

    std::filesystem::path path(trimmed);
    for (const auto& part : path) {
        if (part == "..") {
            return std::nullopt;
        }
    }
    if (!path.has_filename()) {
        // "dir/" names a prefix marker, not a file
        return std::nullopt;
    }
    return path.lexically_normal();
}

std::string keyForPath(const std::filesystem::path& path) {
    std::string key = path.lexically_normal().generic_string();

    bool changed = true;
    while (changed && !key.empty()) {
        changed = false;
        if (key.rfind("./", 0) == 0) {
            key.erase(0, 2);
            changed = true;
        } else if (key.front() == '/') {
            key.erase(0, 1);
            changed = true;
        }
    }
    if (key == ".") {
        return "";
    }
    return key;
}

} // namespace s3bulk
