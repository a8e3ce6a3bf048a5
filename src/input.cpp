/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/input.hpp"
#include "s3bulk/config.hpp"
#include "s3bulk/logger.hpp"
#include <fstream>
#include <glob.h>

namespace s3bulk {

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n\f\v";
    auto begin = value.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(ws);
    return value.substr(begin, end - begin + 1);
}

InputSource InputSource::fromManifest(const std::string& path, std::istream& in) {
    InputSource source(Kind::Manifest);
    if (path == "-") {
        source.stream_ = &in;
        LOG_DEBUG("Reading manifest from standard input");
        return source;
    }

    auto file = std::make_unique<std::ifstream>(path);
    if (!file->is_open()) {
        LOG_ERROR("Cannot open manifest file: " + path);
        return source;
    }
    LOG_DEBUG("Reading manifest: " + path);
    source.stream_ = file.get();
    source.owned_ = std::move(file);
    return source;
}

InputSource InputSource::fromArguments(std::vector<std::string> args, bool expandGlobs) {
    InputSource source(Kind::Arguments);
    source.args_.assign(std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));
    source.expandGlobs_ = expandGlobs;
    return source;
}

InputSource InputSource::fromStream(std::istream& in) {
    InputSource source(Kind::Stream);
    source.stream_ = &in;
    return source;
}

InputSource InputSource::resolve(const RunConfig& config, std::istream& in) {
    if (!config.manifest.empty()) {
        return fromManifest(config.manifest, in);
    }
    if (!config.files.empty()) {
        return fromArguments(config.files, config.operation == Operation::Put);
    }
    LOG_DEBUG("No manifest or files given, reading items from standard input");
    return fromStream(in);
}

std::optional<std::string> InputSource::next() {
    auto item = kind_ == Kind::Arguments ? nextArgument() : nextLine();
    if (item) {
        ++consumed_;
    }
    return item;
}

std::optional<std::string> InputSource::nextLine() {
    if (!stream_) {
        return std::nullopt;
    }

    std::string line;
    while (std::getline(*stream_, line)) {
        std::string item = trim(line);
        if (!item.empty()) {
            return item;
        }
    }

    if (stream_->bad()) {
        LOG_ERROR("Read error while enumerating input");
    }
    stream_ = nullptr;
    owned_.reset();
    return std::nullopt;
}

std::optional<std::string> InputSource::nextArgument() {
    while (true) {
        if (!expanded_.empty()) {
            std::string item = std::move(expanded_.front());
            expanded_.pop_front();
            return item;
        }
        if (args_.empty()) {
            return std::nullopt;
        }

        std::string arg = trim(args_.front());
        args_.pop_front();
        if (arg.empty()) {
            continue;
        }
        if (!expandGlobs_) {
            return arg;
        }
        expandPattern(arg);
    }
}

void InputSource::expandPattern(const std::string& pattern) {
    glob_t matches{};
    int rc = ::glob(pattern.c_str(), GLOB_TILDE, nullptr, &matches);

    if (rc == 0) {
        for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
            expanded_.emplace_back(matches.gl_pathv[i]);
        }
        LOG_DEBUG("Pattern '" + pattern + "' matched " + std::to_string(matches.gl_pathc) + " paths");
    } else if (rc == GLOB_NOMATCH) {
        LOG_ERROR("No files match pattern: " + pattern);
        ++skipped_;
    } else {
        LOG_ERROR("Failed to expand pattern '" + pattern + "' (glob error " + std::to_string(rc) + ")");
        ++skipped_;
    }
    globfree(&matches);
}

}
