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
 * @file options.hpp
 * @brief Command-line configuration of the `fastuuid` tool.
 *
 * @details
 * Configuration is layered: compiled-in defaults, then the
 * `FASTUUID_LOG_LEVEL` environment variable, then command-line arguments.
 */

#pragma once

#include "fastuuid/infra/logger.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fastuuid::cli {

/// @brief Name of the environment variable consulted for the log level.
inline constexpr const char* kLogLevelEnv = "FASTUUID_LOG_LEVEL";

/// @brief Largest accepted `--threads` value.
inline constexpr std::size_t kMaxThreads = 1024;

/**
 * @enum OutputFormat
 * @brief Rendering of each printed identifier.
 */
enum class OutputFormat {
    HEX128, ///< Canonical 36-character RFC 4122 text.
    RAW192  ///< 48 lower-case hex digits of the full `next()` value.
};

/**
 * @struct Options
 * @brief Fully resolved tool configuration.
 */
struct Options {
    std::uint64_t count = 1;
    OutputFormat format = OutputFormat::HEX128;
    bool json = false;
    std::uint64_t bench_iterations = 0; ///< Non-zero selects benchmark mode.
    std::size_t threads = 1;
    infra::LogLevel log_level = infra::LogLevel::WARN;
    bool help = false;
};

/**
 * @class UsageError
 * @brief Raised for malformed command lines. The tool exits with status 2.
 */
class UsageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Resolves the tool configuration.
 *
 * Recognized arguments: `--count N`, `--format hex128|raw192`, `--json`,
 * `--bench N`, `--threads T`, `--log-level L`, `--help`.
 *
 * @param argc Argument count as passed to `main`.
 * @param argv Argument vector as passed to `main`.
 * @param env_log_level Value of `FASTUUID_LOG_LEVEL`, or `nullptr` if unset.
 * @return Options The merged configuration.
 *
 * @throws UsageError On unknown arguments, missing or non-numeric values, zero
 * counts, `--threads` above `kMaxThreads`, or unknown level/format names.
 */
Options parse_options(int argc, const char* const* argv, const char* env_log_level);

/// @brief Returns the `--help` text.
std::string usage(const std::string& binary_name);

/// @brief Returns `hex128` or `raw192`.
const char* format_name(OutputFormat format) noexcept;

} // namespace fastuuid::cli
