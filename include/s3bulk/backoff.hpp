/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <functional>

namespace s3bulk {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Blocks the calling thread for the given duration.
void sleepFor(std::chrono::milliseconds delay);

// Exponential delay between attempts: base * 2^(attempt-1), clamped to cap.
class BackoffPolicy {
public:
    BackoffPolicy() noexcept = default;
    BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds cap) noexcept;

    // attempt is the 1-based index of the attempt that just failed.
    [[nodiscard]] std::chrono::milliseconds delayFor(int attempt) const noexcept;

    [[nodiscard]] std::chrono::milliseconds base() const noexcept { return base_; }
    [[nodiscard]] std::chrono::milliseconds cap() const noexcept { return cap_; }

private:
    std::chrono::milliseconds base_{100};
    std::chrono::milliseconds cap_{10'000};
};

} // namespace s3bulk
