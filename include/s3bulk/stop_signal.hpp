/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>

namespace s3bulk {

// Set-once cancellation flag shared between the interrupt handler and the
// dispatch loop. Safe to set from a signal handler.
class StopToken final {
public:
    StopToken() noexcept = default;

    StopToken(const StopToken&) = delete;
    StopToken& operator=(const StopToken&) = delete;

    // True only for the call that actually set the flag.
    bool requestStop() noexcept {
        bool expected = false;
        return flag_.compare_exchange_strong(expected, true);
    }

    [[nodiscard]] bool stopRequested() const noexcept { return flag_.load(); }

private:
    static_assert(std::atomic<bool>::is_always_lock_free,
                  "StopToken must be usable from a signal handler");
    std::atomic<bool> flag_{false};
};

// Routes SIGINT and SIGTERM to token.requestStop(). The handler is one-shot:
// after the first signal both revert to their default action, so a second
// interrupt terminates the process. The token must outlive the process or a
// later call to restoreDefaultHandlers().
void installInterruptHandler(StopToken& token) noexcept;
void restoreDefaultHandlers() noexcept;

}
