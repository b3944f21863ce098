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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for FastUUID.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface of
 * the library and its command-line tool. Output is serialized across threads
 * and filtered against a process-wide minimum severity. Identifier hot paths
 * never log.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace fastuuid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Used to categorize the criticality of log entries, select the output stream
 * (Standard Output vs. Standard Error) and filter against the active threshold.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events (e.g., startup, benchmark progress).
    WARN,  ///< Non-blocking anomalies or potential misconfigurations.
    ERROR, ///< Recoverable runtime errors that do not halt the system.
    FATAL  ///< Critical failures requiring process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the active level (default `INFO`) are dropped before any
 * formatting or locking takes place. Accepted messages are written under an
 * internal mutex so entries from concurrent threads never interleave.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * fastuuid::infra::Logger::log(LogLevel::INFO, "Bench: 5 cases completed.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that will be written.
    static void set_level(LogLevel level) noexcept;

    /// @brief Returns the active minimum severity.
    static LogLevel level() noexcept;

    /// @brief Returns true if a message of `level` would currently be written.
    static bool should_log(LogLevel level) noexcept;

    /**
     * @brief Parses a severity name.
     *
     * Accepts `trace`, `debug`, `info`, `warn`, `error` and `fatal` in any
     * letter case (`warning` is accepted as an alias of `warn`).
     *
     * @param name The textual level, e.g. from `FASTUUID_LOG_LEVEL`.
     * @param out Receives the parsed level on success; untouched otherwise.
     * @return true If `name` was recognized.
     */
    static bool parse_level(const std::string& name, LogLevel& out);

    /// @brief Returns the lower-case name of `level` (inverse of `parse_level`).
    static const char* level_name(LogLevel level) noexcept;

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved entries.
    static std::mutex mutex_;

    /// @brief Active threshold, stored as the underlying enum value.
    static std::atomic<int> level_;
};

} // namespace fastuuid::infra
