/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <deque>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace s3bulk {

struct RunConfig;

// Lazy, single-pass sequence of trimmed, non-empty input items.
class InputSource {
public:
    enum class Kind { Manifest, Arguments, Stream };

    // Newline-delimited file; "-" reads from in. An unreadable file is
    // logged and yields nothing.
    [[nodiscard]] static InputSource fromManifest(const std::string& path, std::istream& in);
    // Items taken from the argument list, glob-expanded one at a time when
    // expandGlobs is set. Patterns without matches are logged and skipped.
    [[nodiscard]] static InputSource fromArguments(std::vector<std::string> args, bool expandGlobs);
    // Newline-delimited entries read from in.
    [[nodiscard]] static InputSource fromStream(std::istream& in);

    // Manifest, then positional files, then standard input.
    [[nodiscard]] static InputSource resolve(const RunConfig& config, std::istream& in);

    InputSource(const InputSource&) = delete;
    InputSource& operator=(const InputSource&) = delete;
    InputSource(InputSource&&) = default;
    InputSource& operator=(InputSource&&) = default;

    [[nodiscard]] std::optional<std::string> next();

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }
    [[nodiscard]] std::size_t skipped() const noexcept { return skipped_; }

private:
    explicit InputSource(Kind kind) noexcept : kind_(kind) {}

    [[nodiscard]] std::optional<std::string> nextLine();
    [[nodiscard]] std::optional<std::string> nextArgument();
    void expandPattern(const std::string& pattern);

    Kind kind_;
    std::unique_ptr<std::istream> owned_;
    std::istream* stream_ = nullptr;
    std::deque<std::string> args_;
    std::deque<std::string> expanded_;
    bool expandGlobs_ = false;
    std::size_t consumed_ = 0;
    std::size_t skipped_ = 0;
};

// Strips leading and trailing whitespace.
[[nodiscard]] std::string trim(const std::string& value);

}
