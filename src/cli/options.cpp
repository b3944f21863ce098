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
 * @file options.cpp
 * @brief Argument parsing for the `fastuuid` tool.
 */

#include "fastuuid/cli/options.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>

namespace fastuuid::cli {

namespace {

std::uint64_t parse_positive(const std::string& flag, const std::string& value)
{
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        throw UsageError("Option " + flag + " expects a positive integer, got '" + value + "'");
    }

    std::uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw UsageError("Option " + flag + " is out of range: '" + value + "'");
    }

    if (parsed == 0) {
        throw UsageError("Option " + flag + " must be greater than zero");
    }
    return parsed;
}

infra::LogLevel parse_level_or_throw(const std::string& origin, const std::string& value)
{
    infra::LogLevel level = infra::LogLevel::WARN;
    if (!infra::Logger::parse_level(value, level)) {
        throw UsageError("Unknown log level '" + value + "' in " + origin);
    }
    return level;
}

} // namespace

Options parse_options(int argc, const char* const* argv, const char* env_log_level)
{
    Options opts;

    if (env_log_level != nullptr && *env_log_level != '\0') {
        opts.log_level = parse_level_or_throw(kLogLevelEnv, env_log_level);
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        // Flags without a value.
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
            continue;
        }
        if (arg == "--json") {
            opts.json = true;
            continue;
        }

        if (arg != "--count" && arg != "--format" && arg != "--bench" && arg != "--threads" &&
            arg != "--log-level") {
            throw UsageError("Unknown option '" + arg + "'");
        }
        if (i + 1 >= argc) {
            throw UsageError("Option " + arg + " requires a value");
        }
        const std::string value = argv[++i];

        if (arg == "--count") {
            opts.count = parse_positive(arg, value);
        } else if (arg == "--bench") {
            opts.bench_iterations = parse_positive(arg, value);
        } else if (arg == "--threads") {
            const std::uint64_t threads = parse_positive(arg, value);
            if (threads > kMaxThreads) {
                throw UsageError("Option --threads must not exceed " +
                                 std::to_string(kMaxThreads));
            }
            opts.threads = static_cast<std::size_t>(threads);
        } else if (arg == "--log-level") {
            opts.log_level = parse_level_or_throw(arg, value);
        } else if (value == "hex128") {
            opts.format = OutputFormat::HEX128;
        } else if (value == "raw192") {
            opts.format = OutputFormat::RAW192;
        } else {
            throw UsageError("Unknown format '" + value + "' (expected hex128 or raw192)");
        }
    }

    return opts;
}

std::string usage(const std::string& binary_name)
{
    std::ostringstream out;
    out << "Usage: " << binary_name << " [OPTIONS]\n"
        << "Options:\n"
        << "  --count N         Number of identifiers to print (Default: 1)\n"
        << "  --format F        hex128 or raw192 (Default: hex128)\n"
        << "  --json            Emit a JSON document instead of one id per line\n"
        << "  --bench N         Benchmark every operation with N iterations\n"
        << "  --threads T       Workers for the concurrent benchmark, 1-" << kMaxThreads
        << " (Default: 1)\n"
        << "  --log-level L     trace|debug|info|warn|error|fatal (Default: warn)\n"
        << "  --help            Show this help message\n"
        << "Environment:\n"
        << "  " << kLogLevelEnv << "  Log level, overridden by --log-level\n";
    return out.str();
}

const char* format_name(OutputFormat format) noexcept
{
    return format == OutputFormat::RAW192 ? "raw192" : "hex128";
}

} // namespace fastuuid::cli
