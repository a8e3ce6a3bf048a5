/*
 * s3bulk - Concurrent Object Store Transfer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "s3bulk/aws_store.hpp"
#include "s3bulk/config.hpp"
#include "s3bulk/logger.hpp"
#include "s3bulk/stop_signal.hpp"
#include "s3bulk/transfer.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace s3bulk;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName, std::ostream& os) {
    os << "s3bulk Bulk Object Transfer v" << VERSION << "\n\n";
    os << "Usage: " << progName << " BUCKET OPERATION [OPTIONS] [FILE...]\n";
    os << "       " << progName << " --help | --version\n\n";
    os << "Operations:\n";
    os << "  get       Download keys into local files named after the keys\n";
    os << "  put       Upload local files (FILE arguments are glob patterns)\n";
    os << "  list      Print the keys in BUCKET\n";
    os << "  delete    Not supported\n\n";
    os << "Items come from --input, else from FILE arguments, else from stdin.\n\n";
    os << "Options:\n";
    os << "  -a, --aws_key KEY            Access key id (default: $AWS_ACCESS_KEY_ID)\n";
    os << "  -s, --aws_secret_key SECRET  Secret key (default: $AWS_SECRET_ACCESS_KEY)\n";
    os << "  -t, --threads N              Worker threads, N >= 1 (default " << kDefaultThreads << ")\n";
    os << "  -r, --retries N              Attempts per object, N >= 1 (default " << kDefaultRetries << ")\n";
    os << "  -i, --input FILE             Manifest, one item per line ('-' for stdin)\n";
    os << "      --acl POLICY             put: public-read or private (default private)\n";
    os << "      --start_key KEY          list: start after KEY\n";
    os << "      --region REGION          Region (default: $AWS_REGION)\n";
    os << "      --endpoint URL           S3-compatible endpoint override\n";
    os << "  -v, --verbose                Debug logging\n";
    os << "  -h, --help                   Show this help message\n";
    os << "      --version                Show version\n\n";
    os << "Environment Variables:\n";
    os << "  S3BULK_LOG_LEVEL   Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    os << "Examples:\n";
    os << "  " << progName << " my-bucket get -i keys.txt -t 16\n";
    os << "  " << progName << " my-bucket put --acl public-read 'site/*.html'\n";
    os << "  " << progName << " my-bucket list --start_key logs/2025-01\n";
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();
    setThreadName("Main");

    std::vector<std::string> args(argv + 1, argv + argc);
    ParseResult parsed = parseArguments(args, [](const char* name) { return std::getenv(name); });

    switch (parsed.status) {
        case ParseStatus::Help:
            printUsage(argv[0], std::cout);
            return kExitOk;
        case ParseStatus::Version:
            std::cout << VERSION << "\n";
            return kExitOk;
        case ParseStatus::Error:
            std::cerr << "Error: " << parsed.message << "\n\n";
            printUsage(argv[0], std::cerr);
            return kExitUsage;
        case ParseStatus::Ok:
            break;
    }

    const RunConfig& config = parsed.config;
    if (config.verbose) {
        Logger::setLevel(LogLevel::DEBUG);
    }

    StopToken stop;
    installInterruptHandler(stop);

    int code = kExitOk;
    try {
        AwsApi api;

        AwsSettings workerSettings = AwsSettings::fromConfig(config);
        AwsSettings listSettings = workerSettings;
        listSettings.clientRetries = true;
        StoreFactory factory = makeAwsStoreFactory(
            config.operation == Operation::List ? listSettings : workerSettings, config.bucket);

        code = runOperation(config, factory, stop, std::cin, std::cout);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        code = kExitFailures;
    }

    restoreDefaultHandlers();
    LOG_DEBUG("s3bulk exiting with code " + std::to_string(code));
    return code;
}
