/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "s3bulk/types.hpp"

namespace s3bulk {

struct StoreResult {
    StoreStatus status = StoreStatus::Ok;
    std::string message;
    explicit operator bool() const noexcept { return status == StoreStatus::Ok; }

    static StoreResult ok() { return {}; }
    static StoreResult failure(StoreStatus status, std::string message) {
        return {status, std::move(message)};
    }
};

// Returns false to end the listing early.
using KeyVisitor = std::function<bool(const std::string& key)>;

// Single-object operations against one bucket. An instance is used by one
// thread at a time and is never shared between workers.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Writes the object body to dest. May leave a partial file behind on failure.
    [[nodiscard]] virtual StoreResult download(const std::string& key,
                                               const std::filesystem::path& dest) = 0;
    [[nodiscard]] virtual StoreResult upload(const std::filesystem::path& source,
                                             const std::string& key,
                                             AccessPolicy policy) = 0;
    // Visits keys in listing order, beginning after startKey when non-empty,
    // until the visitor returns false.
    [[nodiscard]] virtual StoreResult list(const std::string& startKey,
                                           const KeyVisitor& visit) = 0;
};

// Creates one store per worker. May throw or return null on failure.
using StoreFactory = std::function<std::unique_ptr<ObjectStore>()>;

} // namespace s3bulk
