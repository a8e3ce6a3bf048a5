/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

/**
 * @file test_input.cpp
 * @brief Manifest, argument glob and stdin enumeration
 */

#include "test_harness.hpp"

#include "s3bulk/config.hpp"
#include "s3bulk/input.hpp"

using namespace s3bulk;

namespace {

std::vector<std::string> drain(InputSource &source) {
    std::vector<std::string> items;
    while (auto item = source.next()) {
        items.push_back(*item);
    }
    return items;
}

} // namespace

TEST(trim_strips_surrounding_whitespace) {
    ASSERT_EQ(trim("  a b \t\r"), std::string("a b"));
    ASSERT_EQ(trim("\r\n"), std::string(""));
    ASSERT_EQ(trim("key"), std::string("key"));
}

TEST(manifest_trims_and_skips_blank_lines) {
    TempDir dir;
    auto manifest = dir.write("keys.txt", "alpha\n\n  beta  \r\n\t\ngamma");
    std::istringstream unusedStdin("should-not-be-read\n");

    auto source = InputSource::fromManifest(manifest.string(), unusedStdin);
    ASSERT(source.kind() == InputSource::Kind::Manifest);
    auto items = drain(source);
    ASSERT_EQ(items.size(), 3u);
    ASSERT_EQ(items[0], std::string("alpha"));
    ASSERT_EQ(items[1], std::string("beta"));
    ASSERT_EQ(items[2], std::string("gamma"));
    ASSERT_EQ(source.consumed(), 3u);
    ASSERT(!source.next().has_value());
}

TEST(manifest_dash_reads_stdin) {
    std::istringstream in("one\ntwo\n");
    auto source = InputSource::fromManifest("-", in);
    auto items = drain(source);
    ASSERT_EQ(items.size(), 2u);
    ASSERT_EQ(items[1], std::string("two"));
}

TEST(missing_manifest_logs_and_yields_nothing) {
    LogCapture logs;
    std::istringstream in("ignored\n");
    auto source = InputSource::fromManifest("/nonexistent/s3bulk/manifest.txt", in);
    ASSERT(!source.next().has_value());
    ASSERT_EQ(logs.count(LogLevel::ERROR, "Cannot open manifest"), 1u);
}

TEST(arguments_are_used_verbatim_without_globbing) {
    auto source = InputSource::fromArguments({"logs/*.gz", " key two ", ""}, false);
    auto items = drain(source);
    ASSERT_EQ(items.size(), 2u);
    ASSERT_EQ(items[0], std::string("logs/*.gz"));
    ASSERT_EQ(items[1], std::string("key two"));
}

TEST(put_arguments_are_glob_expanded_lazily) {
    TempDir dir;
    dir.write("b.txt", "b");
    dir.write("a.txt", "a");
    dir.write("c.log", "c");
    auto pattern = (dir.path() / "*.txt").string();
    auto plain = (dir.path() / "c.log").string();

    auto source = InputSource::fromArguments({pattern, plain}, true);
    auto first = source.next();
    ASSERT(first.has_value());
    ASSERT_EQ(*first, (dir.path() / "a.txt").string());

    // Files created after the first pattern expanded are not seen by it,
    // but later arguments are expanded only when reached
    dir.write("d.txt", "d");
    auto rest = drain(source);
    ASSERT_EQ(rest.size(), 2u);
    ASSERT_EQ(rest[0], (dir.path() / "b.txt").string());
    ASSERT_EQ(rest[1], plain);
}

TEST(non_matching_pattern_is_logged_and_skipped) {
    TempDir dir;
    dir.write("keep.bin", "x");
    LogCapture logs;

    auto source = InputSource::fromArguments(
        {(dir.path() / "*.nothing").string(), (dir.path() / "*.bin").string()}, true);
    auto items = drain(source);
    ASSERT_EQ(items.size(), 1u);
    ASSERT_EQ(items[0], (dir.path() / "keep.bin").string());
    ASSERT_EQ(source.skipped(), 1u);
    ASSERT_EQ(logs.count(LogLevel::ERROR, "No files match pattern"), 1u);
}

TEST(resolve_prefers_manifest_then_files_then_stdin) {
    TempDir dir;
    auto manifest = dir.write("m.txt", "from-manifest\n");
    std::istringstream in("from-stdin\n");

    RunConfig config;
    config.operation = Operation::Get;
    config.manifest = manifest.string();
    config.files = {"from-args"};
    auto viaManifest = InputSource::resolve(config, in);
    ASSERT(viaManifest.kind() == InputSource::Kind::Manifest);
    ASSERT_EQ(*viaManifest.next(), std::string("from-manifest"));

    config.manifest.clear();
    auto viaArgs = InputSource::resolve(config, in);
    ASSERT(viaArgs.kind() == InputSource::Kind::Arguments);
    ASSERT_EQ(*viaArgs.next(), std::string("from-args"));

    config.files.clear();
    auto viaStdin = InputSource::resolve(config, in);
    ASSERT(viaStdin.kind() == InputSource::Kind::Stream);
    ASSERT_EQ(*viaStdin.next(), std::string("from-stdin"));
}

TEST(resolve_globs_only_for_put) {
    RunConfig config;
    config.operation = Operation::Get;
    config.files = {"no/such/dir/*"};
    std::istringstream in;

    auto getSource = InputSource::resolve(config, in);
    ASSERT_EQ(*getSource.next(), std::string("no/such/dir/*"));

    config.operation = Operation::Put;
    LogCapture logs;
    auto putSource = InputSource::resolve(config, in);
    ASSERT(!putSource.next().has_value());
    ASSERT_EQ(putSource.skipped(), 1u);
}

TEST(source_is_movable_mid_stream) {
    std::istringstream in("1\n2\n3\n");
    auto source = InputSource::fromStream(in);
    ASSERT_EQ(*source.next(), std::string("1"));
    InputSource moved = std::move(source);
    auto rest = drain(moved);
    ASSERT_EQ(rest.size(), 2u);
    ASSERT_EQ(moved.consumed(), 3u);
}

int main() {
    Logger::setLevel(LogLevel::ERROR);
    printf("Running input tests...\n");

    RUN_TEST(trim_strips_surrounding_whitespace);
    RUN_TEST(manifest_trims_and_skips_blank_lines);
    RUN_TEST(manifest_dash_reads_stdin);
    RUN_TEST(missing_manifest_logs_and_yields_nothing);
    RUN_TEST(arguments_are_used_verbatim_without_globbing);
    RUN_TEST(put_arguments_are_glob_expanded_lazily);
    RUN_TEST(non_matching_pattern_is_logged_and_skipped);
    RUN_TEST(resolve_prefers_manifest_then_files_then_stdin);
    RUN_TEST(resolve_globs_only_for_put);
    RUN_TEST(source_is_movable_mid_stream);

    TEST_SUMMARY();
    return tests_failed > 0 ? 1 : 0;
}
