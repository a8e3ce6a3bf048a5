/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

/**
 * @file test_backoff_job.cpp
 * @brief Backoff sequence, job construction and key/path mapping
 */

#include "test_harness.hpp"

#include "s3bulk/backoff.hpp"
#include "s3bulk/job.hpp"
#include "s3bulk/types.hpp"

using namespace s3bulk;
using std::chrono::milliseconds;

// =============================================================================
// Backoff
// =============================================================================

TEST(backoff_default_sequence) {
    BackoffPolicy policy;
    ASSERT_EQ(policy.delayFor(1), milliseconds(100));
    ASSERT_EQ(policy.delayFor(2), milliseconds(200));
    ASSERT_EQ(policy.delayFor(3), milliseconds(400));
    ASSERT_EQ(policy.delayFor(4), milliseconds(800));
}

TEST(backoff_strictly_increases_until_cap) {
    BackoffPolicy policy(milliseconds(50), milliseconds(3000));
    auto previous = policy.delayFor(1);
    int attempt = 2;
    for (; policy.delayFor(attempt) < policy.cap(); ++attempt) {
        ASSERT_LT(previous, policy.delayFor(attempt));
        previous = policy.delayFor(attempt);
    }
    ASSERT_LT(previous, policy.delayFor(attempt));
    ASSERT_EQ(policy.delayFor(attempt), milliseconds(3000));
}

TEST(backoff_is_bounded_for_huge_attempts) {
    BackoffPolicy policy;
    ASSERT_EQ(policy.delayFor(64), policy.cap());
    ASSERT_EQ(policy.delayFor(100000), policy.cap());
    ASSERT_EQ(policy.cap(), milliseconds(10000));
}

TEST(backoff_clamps_bad_arguments) {
    BackoffPolicy policy(milliseconds(0), milliseconds(0));
    ASSERT_EQ(policy.base(), milliseconds(1));
    ASSERT_EQ(policy.cap(), milliseconds(1));
    ASSERT_EQ(policy.delayFor(0), milliseconds(1));
    ASSERT_EQ(policy.delayFor(-3), milliseconds(1));
}

// =============================================================================
// Jobs
// =============================================================================

TEST(get_job_mirrors_key_locally) {
    JobOptions options;
    auto job = Job::get("photos/2025/a.jpg", options);
    ASSERT(job.has_value());
    ASSERT(job->kind() == JobKind::Get);
    ASSERT_EQ(job->key(), std::string("photos/2025/a.jpg"));
    ASSERT_EQ(job->localPath(), std::filesystem::path("photos/2025/a.jpg"));
    ASSERT_EQ(job->retriesAllowed(), kDefaultRetries);
    ASSERT(job->accessPolicy() == AccessPolicy::Private);
}

TEST(get_job_strips_leading_slash) {
    auto job = Job::get("/abs/key.txt", JobOptions());
    ASSERT(job.has_value());
    ASSERT_EQ(job->key(), std::string("/abs/key.txt"));
    ASSERT_EQ(job->localPath(), std::filesystem::path("abs/key.txt"));
}

TEST(get_job_refuses_escaping_or_empty_keys) {
    ASSERT(!Job::get("../etc/passwd", JobOptions()).has_value());
    ASSERT(!Job::get("a/../../b", JobOptions()).has_value());
    ASSERT(!Job::get("///", JobOptions()).has_value());
    ASSERT(!Job::get("prefix/", JobOptions()).has_value());
}

TEST(put_job_derives_key_from_path) {
    JobOptions options{3, AccessPolicy::PublicRead};
    auto job = Job::put("./site/index.html", options);
    ASSERT(job.has_value());
    ASSERT(job->kind() == JobKind::Put);
    ASSERT_EQ(job->key(), std::string("site/index.html"));
    ASSERT_EQ(job->localPath(), std::filesystem::path("./site/index.html"));
    ASSERT_EQ(job->retriesAllowed(), 3);
    ASSERT(job->accessPolicy() == AccessPolicy::PublicRead);
}

TEST(key_for_path_variants) {
    ASSERT_EQ(keyForPath("a/b.txt"), std::string("a/b.txt"));
    ASSERT_EQ(keyForPath("/tmp/data/x.bin"), std::string("tmp/data/x.bin"));
    ASSERT_EQ(keyForPath("./././a"), std::string("a"));
    ASSERT_EQ(keyForPath("a//b/./c"), std::string("a/b/c"));
    ASSERT_EQ(keyForPath("."), std::string(""));
    ASSERT(!Job::put(".", JobOptions()).has_value());
}

TEST(job_budget_is_at_least_one) {
    JobOptions options;
    options.retriesAllowed = 0;
    auto job = Job::get("k", options);
    ASSERT(job.has_value());
    ASSERT_EQ(job->retriesAllowed(), 1);
}

TEST(describe_names_kind_and_key) {
    auto job = Job::get("logs/a.gz", JobOptions());
    ASSERT_EQ(job->describe(), std::string("get logs/a.gz"));
}

// =============================================================================
// Enum conversions
// =============================================================================

TEST(operation_names_round_trip) {
    for (auto op : {Operation::Get, Operation::Put, Operation::List, Operation::Delete}) {
        auto parsed = parseOperation(toString(op));
        ASSERT(parsed.has_value());
        ASSERT(*parsed == op);
    }
    ASSERT(!parseOperation("GET").has_value());
    ASSERT(!parseOperation("copy").has_value());
}

TEST(access_policy_names) {
    ASSERT(parseAccessPolicy("public-read") == AccessPolicy::PublicRead);
    ASSERT(parseAccessPolicy("private") == AccessPolicy::Private);
    ASSERT(!parseAccessPolicy("public-read-write").has_value());
    ASSERT_EQ(std::string(toString(AccessPolicy::PublicRead)), std::string("public-read"));
}

int main() {
    Logger::setLevel(LogLevel::ERROR);
    printf("Running backoff and job tests...\n");

    RUN_TEST(backoff_default_sequence);
    RUN_TEST(backoff_strictly_increases_until_cap);
    RUN_TEST(backoff_is_bounded_for_huge_attempts);
    RUN_TEST(backoff_clamps_bad_arguments);
    RUN_TEST(get_job_mirrors_key_locally);
    RUN_TEST(get_job_strips_leading_slash);
    RUN_TEST(get_job_refuses_escaping_or_empty_keys);
    RUN_TEST(put_job_derives_key_from_path);
    RUN_TEST(key_for_path_variants);
    RUN_TEST(job_budget_is_at_least_one);
    RUN_TEST(describe_names_kind_and_key);
    RUN_TEST(operation_names_round_trip);
    RUN_TEST(access_policy_names);

    TEST_SUMMARY();
    return tests_failed > 0 ? 1 : 0;
}
