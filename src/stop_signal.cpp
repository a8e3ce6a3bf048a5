/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/stop_signal.hpp"
#include <csignal>

namespace s3bulk {

namespace {
// Async-signal-safe: the handler only flips a lock-free atomic
std::atomic<StopToken*> g_token{nullptr};

// First signal asks for a clean stop; the one after that gets the default action
void onInterrupt(int) {
    StopToken* token = g_token.load();
    if (token) {
        token->requestStop();
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}
}

void installInterruptHandler(StopToken& token) noexcept {
    g_token.store(&token);
    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);
}

void restoreDefaultHandlers() noexcept {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_token.store(nullptr);
}

}
