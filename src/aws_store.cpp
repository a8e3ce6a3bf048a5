/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/aws_store.hpp"
#include "s3bulk/logger.hpp"

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/AWSMemory.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/ObjectCannedACL.h>
#include <aws/s3/model/PutObjectRequest.h>

#include <cstdint>
#include <filesystem>
#include <system_error>

namespace s3bulk {

namespace {

constexpr const char* kAllocTag = "s3bulk";

Aws::String toAws(const std::string& value) {
    return Aws::String(value.c_str(), value.size());
}

Aws::S3::Model::ObjectCannedACL toCannedAcl(AccessPolicy policy) {
    switch (policy) {
        case AccessPolicy::PublicRead:
            return Aws::S3::Model::ObjectCannedACL::public_read;
        case AccessPolicy::Private:
            return Aws::S3::Model::ObjectCannedACL::private_;
    }
    return Aws::S3::Model::ObjectCannedACL::private_;
}

// Retryable per the SDK, or the request never reached the server
StoreResult classify(const Aws::Client::AWSError<Aws::S3::S3Errors>& error) {
    std::string message = std::string(error.GetExceptionName().c_str()) + ": " +
                          error.GetMessage().c_str() + " (HTTP " +
                          std::to_string(static_cast<int>(error.GetResponseCode())) + ")";
    if (error.ShouldRetry() ||
        error.GetResponseCode() == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE) {
        return StoreResult::failure(StoreStatus::Transient, message);
    }
    return StoreResult::failure(StoreStatus::Rejected, message);
}

}

AwsApi::AwsApi() {
    Aws::InitAPI(options_);
    LOG_DEBUG("AWS SDK initialized");
}

AwsApi::~AwsApi() {
    Aws::ShutdownAPI(options_);
}

AwsSettings AwsSettings::fromConfig(const RunConfig& config) {
    AwsSettings settings;
    settings.credentials = config.credentials;
    settings.region = config.region;
    settings.endpoint = config.endpoint;
    return settings;
}

AwsObjectStore::AwsObjectStore(const AwsSettings& settings, std::string bucket)
    : bucket_(std::move(bucket)) {
    Aws::Client::ClientConfiguration clientConfig;
    if (!settings.region.empty()) {
        clientConfig.region = toAws(settings.region);
    }
    if (!settings.endpoint.empty()) {
        clientConfig.endpointOverride = toAws(settings.endpoint);
    }
    if (!settings.clientRetries) {
        clientConfig.retryStrategy =
            Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAllocTag, 0L);
    }

    Aws::Auth::AWSCredentials credentials(toAws(settings.credentials.accessKey),
                                          toAws(settings.credentials.secretKey));

    // S3-compatible endpoints generally want path-style addressing
    const bool virtualAddressing = settings.endpoint.empty();
    client_ = std::make_unique<Aws::S3::S3Client>(
        credentials, clientConfig,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, virtualAddressing);
}

AwsObjectStore::~AwsObjectStore() = default;

StoreResult AwsObjectStore::download(const std::string& key, const std::filesystem::path& dest) {
    Aws::S3::Model::GetObjectRequest request;
    request.WithBucket(toAws(bucket_)).WithKey(toAws(key));

    // Stream the body straight into the destination file
    const std::string destPath = dest.string();
    request.SetResponseStreamFactory([destPath]() {
        return Aws::New<Aws::FStream>(kAllocTag, destPath.c_str(),
                                      std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    });

    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        return classify(outcome.GetError());
    }

    auto result = outcome.GetResultWithOwnership();
    auto& body = result.GetBody();
    body.flush();
    if (!body.good()) {
        return StoreResult::failure(StoreStatus::LocalError, "write failed: " + destPath);
    }

    std::error_code ec;
    auto written = std::filesystem::file_size(dest, ec);
    if (ec) {
        return StoreResult::failure(StoreStatus::LocalError, "cannot stat " + destPath + ": " + ec.message());
    }
    const auto expected = result.GetContentLength();
    if (expected >= 0 && written != static_cast<std::uintmax_t>(expected)) {
        return StoreResult::failure(StoreStatus::Transient,
                                    "truncated body: got " + std::to_string(written) + " of " +
                                    std::to_string(expected) + " bytes");
    }
    return StoreResult::ok();
}

StoreResult AwsObjectStore::upload(const std::filesystem::path& source, const std::string& key,
                                   AccessPolicy policy) {
    auto body = Aws::MakeShared<Aws::FStream>(kAllocTag, source.string().c_str(),
                                              std::ios_base::in | std::ios_base::binary);
    if (!body->good()) {
        return StoreResult::failure(StoreStatus::LocalError, "cannot read " + source.string());
    }

    Aws::S3::Model::PutObjectRequest request;
    request.WithBucket(toAws(bucket_)).WithKey(toAws(key)).WithACL(toCannedAcl(policy));
    request.SetBody(body);

    auto outcome = client_->PutObject(request);
    if (!outcome.IsSuccess()) {
        return classify(outcome.GetError());
    }
    return StoreResult::ok();
}

StoreResult AwsObjectStore::list(const std::string& startKey, const KeyVisitor& visit) {
    Aws::S3::Model::ListObjectsV2Request request;
    request.WithBucket(toAws(bucket_));
    if (!startKey.empty()) {
        request.SetStartAfter(toAws(startKey));
    }

    while (true) {
        auto outcome = client_->ListObjectsV2(request);
        if (!outcome.IsSuccess()) {
            return classify(outcome.GetError());
        }

        const auto& result = outcome.GetResult();
        for (const auto& object : result.GetContents()) {
            if (!visit(std::string(object.GetKey().c_str(), object.GetKey().size()))) {
                return StoreResult::ok();
            }
        }

        if (!result.GetIsTruncated() || result.GetNextContinuationToken().empty()) {
            return StoreResult::ok();
        }
        request.SetContinuationToken(result.GetNextContinuationToken());
    }
}

StoreFactory makeAwsStoreFactory(AwsSettings settings, std::string bucket) {
    return [settings = std::move(settings), bucket = std::move(bucket)]() -> std::unique_ptr<ObjectStore> {
        return std::make_unique<AwsObjectStore>(settings, bucket);
    };
}

}
