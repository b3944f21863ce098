/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Entry point of the `fastuuid` command-line tool.
 *
 * @details
 * Startup sequence:
 * 1. Configuration (defaults, `FASTUUID_LOG_LEVEL`, arguments).
 * 2. Generator construction (single entropy read).
 * 3. Either print identifiers or run the benchmark suite.
 *
 * Exit status: 0 on success, 1 on runtime failure, 2 on usage errors.
 */

#include "fastuuid/bench/harness.hpp"
#include "fastuuid/cli/options.hpp"
#include "fastuuid/cli/report.hpp"
#include "fastuuid/core/generator.hpp"
#include "fastuuid/format/hex128.hpp"
#include "fastuuid/infra/logger.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using fastuuid::infra::Logger;
using fastuuid::infra::LogLevel;

/**
 * @brief Prints `count` identifiers, one per line or as one JSON document.
 *
 * Plain output renders through a single reused scratch buffer; JSON output
 * collects owned strings first.
 */
void print_ids(const fastuuid::core::Generator& generator, const fastuuid::cli::Options& opts)
{
    using fastuuid::cli::OutputFormat;

    if (!opts.json) {
        fastuuid::core::Hex128Buffer scratch;
        for (std::uint64_t i = 0; i < opts.count; ++i) {
            if (opts.format == OutputFormat::RAW192) {
                std::cout << fastuuid::format::to_hex(generator.next()) << '\n';
            } else {
                std::cout << generator.hex128_as_str(scratch) << '\n';
            }
        }
        std::cout.flush();
        return;
    }

    std::vector<std::string> ids;
    ids.reserve(static_cast<std::size_t>(opts.count));
    for (std::uint64_t i = 0; i < opts.count; ++i) {
        if (opts.format == OutputFormat::RAW192) {
            ids.push_back(fastuuid::format::to_hex(generator.next()));
        } else {
            ids.push_back(generator.hex128_as_string());
        }
    }
    std::cout << fastuuid::cli::ids_to_json(opts.format, ids) << std::endl;
}

void run_bench(const fastuuid::core::Generator& generator, const fastuuid::cli::Options& opts)
{
    fastuuid::bench::Config config;
    config.iterations = opts.bench_iterations;
    config.threads = opts.threads;

    const auto results = fastuuid::bench::run_suite(generator, config);

    if (opts.json) {
        std::cout << fastuuid::cli::bench_to_json(config, results) << std::endl;
    } else {
        std::cout << fastuuid::cli::bench_to_text(results);
        std::cout.flush();
    }
}

} // namespace

int main(int argc, char* argv[])
{
    fastuuid::cli::Options opts;
    try {
        opts = fastuuid::cli::parse_options(argc, argv, std::getenv(fastuuid::cli::kLogLevelEnv));
    } catch (const fastuuid::cli::UsageError& e) {
        std::cerr << e.what() << "\n" << fastuuid::cli::usage(argv[0]);
        return 2;
    }

    if (opts.help) {
        std::cout << fastuuid::cli::usage(argv[0]);
        return 0;
    }

    Logger::set_level(opts.log_level);
    Logger::log(LogLevel::DEBUG, std::string("Config: format=") +
                                     fastuuid::cli::format_name(opts.format) +
                                     " count=" + std::to_string(opts.count) +
                                     " log_level=" + Logger::level_name(opts.log_level));

    try {
        fastuuid::core::Generator generator;

        if (opts.bench_iterations > 0) {
            run_bench(generator, opts);
        } else {
            print_ids(generator, opts);
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
