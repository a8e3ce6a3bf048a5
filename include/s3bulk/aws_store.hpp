/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>

#include <aws/core/Aws.h>

#include "s3bulk/config.hpp"
#include "s3bulk/object_store.hpp"

namespace Aws { namespace S3 { class S3Client; } }

namespace s3bulk {

// Holds Aws::InitAPI for its lifetime. Exactly one per process, created
// before any client and destroyed after the last one.
class AwsApi final {
public:
    AwsApi();
    ~AwsApi();

    AwsApi(const AwsApi&) = delete;
    AwsApi& operator=(const AwsApi&) = delete;

private:
    Aws::SDKOptions options_;
};

struct AwsSettings {
    Credentials credentials;
    std::string region;
    std::string endpoint;
    // Keep the SDK's own retry strategy. Off for worker clients, whose
    // retries are driven by the job processor.
    bool clientRetries = false;

    [[nodiscard]] static AwsSettings fromConfig(const RunConfig& config);
};

class AwsObjectStore final : public ObjectStore {
public:
    AwsObjectStore(const AwsSettings& settings, std::string bucket);
    ~AwsObjectStore() override;

    AwsObjectStore(const AwsObjectStore&) = delete;
    AwsObjectStore& operator=(const AwsObjectStore&) = delete;

    [[nodiscard]] StoreResult download(const std::string& key,
                                       const std::filesystem::path& dest) override;
    [[nodiscard]] StoreResult upload(const std::filesystem::path& source,
                                     const std::string& key,
                                     AccessPolicy policy) override;
    [[nodiscard]] StoreResult list(const std::string& startKey,
                                   const KeyVisitor& visit) override;

private:
    std::unique_ptr<Aws::S3::S3Client> client_;
    std::string bucket_;
};

// Factory handing every caller its own client for the configured bucket.
[[nodiscard]] StoreFactory makeAwsStoreFactory(AwsSettings settings, std::string bucket);

}
