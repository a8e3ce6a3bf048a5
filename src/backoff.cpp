/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/backoff.hpp"
#include <algorithm>
#include <thread>

namespace s3bulk {

void sleepFor(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds cap) noexcept
    : base_(std::max(base, std::chrono::milliseconds(1))), cap_(std::max(cap, base_)) {
}

std::chrono::milliseconds BackoffPolicy::delayFor(int attempt) const noexcept {
    if (attempt < 1) {
        attempt = 1;
    }

    // Stops doubling at the cap so large attempt numbers cannot overflow.
    auto delay = base_;
    for (int i = 1; i < attempt && delay < cap_; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap_);
}

} // namespace s3bulk
