/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>
#include <vector>

#include "s3bulk/job.hpp"
#include "s3bulk/types.hpp"

namespace s3bulk {

constexpr int kDefaultThreads = 10;

struct Credentials {
    std::string accessKey;
    std::string secretKey;
};

// Everything one run needs, resolved once from argv and the environment.
struct RunConfig {
    std::string bucket;
    Operation operation = Operation::Get;
    Credentials credentials;
    int threads = kDefaultThreads;
    int retries = kDefaultRetries;
    AccessPolicy acl = AccessPolicy::Private;
    std::string startKey;
    std::string manifest;          // empty: none, "-": stdin
    std::vector<std::string> files;
    std::string region;
    std::string endpoint;
    bool verbose = false;

    [[nodiscard]] JobOptions jobOptions() const noexcept { return {retries, acl}; }
};

enum class ParseStatus : std::uint8_t { Ok, Help, Version, Error };

struct ParseResult {
    ParseStatus status = ParseStatus::Error;
    RunConfig config;
    std::string message;
    explicit operator bool() const noexcept { return status == ParseStatus::Ok; }
};

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char* name)>;

// Parses "BUCKET OPERATION [OPTIONS] [FILE...]" (args excludes argv[0]).
// Credentials fall back to AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY and the
// region to AWS_REGION / AWS_DEFAULT_REGION.
[[nodiscard]] ParseResult parseArguments(const std::vector<std::string>& args,
                                         const EnvLookup& env);

}
