/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/types.hpp"

namespace s3bulk {

const char* toString(Operation op) noexcept {
    switch (op) {
        case Operation::Get:    return "get";
        case Operation::Put:    return "put";
        case Operation::List:   return "list";
        case Operation::Delete: return "delete";
    }
    return "unknown";
}

const char* toString(JobKind kind) noexcept {
    switch (kind) {
        case JobKind::Get: return "get";
        case JobKind::Put: return "put";
    }
    return "unknown";
}

const char* toString(AccessPolicy policy) noexcept {
    switch (policy) {
        case AccessPolicy::Private:    return "private";
        case AccessPolicy::PublicRead: return "public-read";
    }
    return "private";
}

const char* toString(JobOutcome outcome) noexcept {
    switch (outcome) {
        case JobOutcome::Succeeded:        return "succeeded";
        case JobOutcome::TerminalFailed:   return "failed";
        case JobOutcome::RetriesExhausted: return "retries exhausted";
    }
    return "unknown";
}

const char* toString(StoreStatus status) noexcept {
    switch (status) {
        case StoreStatus::Ok:         return "ok";
        case StoreStatus::Transient:  return "transient";
        case StoreStatus::Rejected:   return "rejected";
        case StoreStatus::LocalError: return "local error";
    }
    return "unknown";
}

std::optional<Operation> parseOperation(const std::string& name) noexcept {
    if (name == "get") return Operation::Get;
    if (name == "put") return Operation::Put;
    if (name == "list") return Operation::List;
    if (name == "delete") return Operation::Delete;
    return std::nullopt;
}

std::optional<AccessPolicy> parseAccessPolicy(const std::string& name) noexcept {
    if (name == "private") return AccessPolicy::Private;
    if (name == "public-read") return AccessPolicy::PublicRead;
    return std::nullopt;
}

} // namespace s3bulk
