/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/config.hpp"
#include "s3bulk/logger.hpp"
#include <stdexcept>

namespace s3bulk {

namespace {

ParseResult fail(std::string message) {
    ParseResult result;
    result.status = ParseStatus::Error;
    result.message = std::move(message);
    return result;
}

bool parsePositive(const std::string& text, int& out) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value < 1) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string envOr(const EnvLookup& env, const char* name) {
    const char* value = env ? env(name) : nullptr;
    return value ? std::string(value) : std::string();
}

}

ParseResult parseArguments(const std::vector<std::string>& args, const EnvLookup& env) {
    ParseResult result;
    RunConfig& config = result.config;
    std::vector<std::string> positional;
    std::string aclName;
    bool startKeyGiven = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            result.status = ParseStatus::Help;
            return result;
        }
        if (arg == "--version") {
            result.status = ParseStatus::Version;
            return result;
        }
        if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
            continue;
        }
        if (arg == "--") {
            positional.insert(positional.end(), args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }

        // Everything below takes a value
        if (i + 1 >= args.size()) {
            return fail("Option " + arg + " requires a value");
        }
        const std::string& value = args[++i];

        if (arg == "-a" || arg == "--aws_key") {
            config.credentials.accessKey = value;
        } else if (arg == "-s" || arg == "--aws_secret_key") {
            config.credentials.secretKey = value;
        } else if (arg == "-t" || arg == "--threads") {
            if (!parsePositive(value, config.threads)) {
                return fail("Invalid thread count: " + value + " (must be an integer >= 1)");
            }
        } else if (arg == "-r" || arg == "--retries") {
            if (!parsePositive(value, config.retries)) {
                return fail("Invalid retry count: " + value + " (must be an integer >= 1)");
            }
        } else if (arg == "--start_key") {
            config.startKey = value;
            startKeyGiven = true;
        } else if (arg == "--acl") {
            aclName = value;
        } else if (arg == "-i" || arg == "--input") {
            config.manifest = value;
        } else if (arg == "--region") {
            config.region = value;
        } else if (arg == "--endpoint") {
            config.endpoint = value;
        } else {
            return fail("Unknown option: " + arg);
        }
    }

    if (positional.size() < 2) {
        return fail("BUCKET and OPERATION are required");
    }

    config.bucket = positional[0];
    if (config.bucket.empty()) {
        return fail("BUCKET must not be empty");
    }

    auto operation = parseOperation(positional[1]);
    if (!operation) {
        return fail("Unknown operation: " + positional[1] + " (expected get, put, list or delete)");
    }
    config.operation = *operation;
    config.files.assign(positional.begin() + 2, positional.end());

    if (!aclName.empty()) {
        if (auto policy = parseAccessPolicy(aclName)) {
            config.acl = *policy;
        } else {
            LOG_WARN("Unrecognized ACL '" + aclName + "', using private");
        }
        if (config.operation != Operation::Put) {
            LOG_WARN("--acl only applies to put, ignored");
        }
    }
    if (startKeyGiven && config.operation != Operation::List) {
        LOG_WARN("--start_key only applies to list, ignored");
    }

    if (config.credentials.accessKey.empty()) {
        config.credentials.accessKey = envOr(env, "AWS_ACCESS_KEY_ID");
    }
    if (config.credentials.secretKey.empty()) {
        config.credentials.secretKey = envOr(env, "AWS_SECRET_ACCESS_KEY");
    }
    if (config.credentials.accessKey.empty() || config.credentials.secretKey.empty()) {
        return fail("Missing credentials: pass --aws_key/--aws_secret_key or set "
                    "AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY");
    }

    if (config.region.empty()) {
        config.region = envOr(env, "AWS_REGION");
    }
    if (config.region.empty()) {
        config.region = envOr(env, "AWS_DEFAULT_REGION");
    }

    result.status = ParseStatus::Ok;
    return result;
}

}
