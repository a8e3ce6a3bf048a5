/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace s3bulk {

// Top-level command selected on the command line.
enum class Operation : std::uint8_t { Get, Put, List, Delete };

// Bulk job kinds. List and Delete never become jobs.
enum class JobKind : std::uint8_t { Get, Put };

// Canned ACL applied to uploaded objects.
enum class AccessPolicy : std::uint8_t { Private, PublicRead };

// Terminal states of the per-job retry loop.
enum class JobOutcome : std::uint8_t { Succeeded, TerminalFailed, RetriesExhausted };

// Classification of a single store call.
enum class StoreStatus : std::uint8_t {
    Ok,
    Transient,   // connection reset, truncated body, socket error
    Rejected,    // server refused the request
    LocalError   // local file could not be read or written
};

[[nodiscard]] const char* toString(Operation op) noexcept;
[[nodiscard]] const char* toString(JobKind kind) noexcept;
[[nodiscard]] const char* toString(AccessPolicy policy) noexcept;
[[nodiscard]] const char* toString(JobOutcome outcome) noexcept;
[[nodiscard]] const char* toString(StoreStatus status) noexcept;

[[nodiscard]] std::optional<Operation> parseOperation(const std::string& name) noexcept;
[[nodiscard]] std::optional<AccessPolicy> parseAccessPolicy(const std::string& name) noexcept;

} // namespace s3bulk
