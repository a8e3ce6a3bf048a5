/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "s3bulk/logger.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) void test_##name()
#define RUN_TEST(name)                                                                             \
    do {                                                                                           \
        printf("  %-48s", #name);                                                                  \
        fflush(stdout);                                                                            \
        try {                                                                                      \
            test_##name();                                                                         \
            printf(" OK\n");                                                                       \
            tests_passed++;                                                                        \
        } catch (const std::exception &e) {                                                        \
            printf(" FAIL: %s\n", e.what());                                                       \
            tests_failed++;                                                                        \
        }                                                                                          \
    } while (0)

#define ASSERT(cond)                                                                               \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            throw std::runtime_error("Assertion failed: " #cond);                                  \
        }                                                                                          \
    } while (0)

#define ASSERT_EQ(a, b)                                                                            \
    do {                                                                                           \
        if ((a) != (b)) {                                                                          \
            throw std::runtime_error("Assertion failed: " #a " == " #b);                           \
        }                                                                                          \
    } while (0)

#define ASSERT_NE(a, b)                                                                            \
    do {                                                                                           \
        if ((a) == (b)) {                                                                          \
            throw std::runtime_error("Assertion failed: " #a " != " #b);                           \
        }                                                                                          \
    } while (0)

#define ASSERT_LE(a, b)                                                                            \
    do {                                                                                           \
        if (!((a) <= (b))) {                                                                       \
            throw std::runtime_error("Assertion failed: " #a " <= " #b);                           \
        }                                                                                          \
    } while (0)

#define ASSERT_LT(a, b)                                                                            \
    do {                                                                                           \
        if (!((a) < (b))) {                                                                        \
            throw std::runtime_error("Assertion failed: " #a " < " #b);                            \
        }                                                                                          \
    } while (0)

#define TEST_SUMMARY()                                                                             \
    do {                                                                                           \
        if (tests_failed > 0) {                                                                    \
            printf("\n%d tests passed, %d FAILED\n", tests_passed, tests_failed);                  \
        } else {                                                                                   \
            printf("\n%d tests passed\n", tests_passed);                                           \
        }                                                                                          \
    } while (0)

// =============================================================================
// Helper: scratch directory removed on scope exit
// =============================================================================

class TempDir {
  public:
    TempDir() {
        char tmpl[] = "/tmp/s3bulk_test_XXXXXX";
        if (!mkdtemp(tmpl)) {
            throw std::runtime_error("Failed to create temp dir");
        }
        path_ = tmpl;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    std::filesystem::path write(const std::string &relative, const std::string &content) const {
        auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        if (!out) {
            throw std::runtime_error("Failed to write " + file.string());
        }
        return file;
    }

  private:
    std::filesystem::path path_;
};

// Runs the scope with the working directory switched to dir.
class ScopedCwd {
  public:
    explicit ScopedCwd(const std::filesystem::path &dir) : previous_(std::filesystem::current_path()) {
        std::filesystem::current_path(dir);
    }
    ~ScopedCwd() {
        std::error_code ec;
        std::filesystem::current_path(previous_, ec);
    }

    ScopedCwd(const ScopedCwd &) = delete;
    ScopedCwd &operator=(const ScopedCwd &) = delete;

  private:
    std::filesystem::path previous_;
};

// Collects formatted log lines while alive.
class LogCapture {
  public:
    explicit LogCapture(s3bulk::LogLevel level = s3bulk::LogLevel::DEBUG) : previous_(s3bulk::Logger::level()) {
        s3bulk::Logger::setLevel(level);
        s3bulk::Logger::setHandler([this](s3bulk::LogLevel lvl, const std::string &line) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back({lvl, line});
        });
    }

    ~LogCapture() {
        s3bulk::Logger::setHandler(nullptr);
        s3bulk::Logger::setLevel(previous_);
    }

    LogCapture(const LogCapture &) = delete;
    LogCapture &operator=(const LogCapture &) = delete;

    std::size_t count(s3bulk::LogLevel level, const std::string &needle = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto &entry : lines_) {
            if (entry.level == level && entry.line.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

  private:
    struct Entry {
        s3bulk::LogLevel level;
        std::string line;
    };
    mutable std::mutex mutex_;
    std::vector<Entry> lines_;
    s3bulk::LogLevel previous_;
};

inline std::string readFile(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
