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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Handles threshold filtering, timestamp formatting, severity tagging and
 * ANSI color-coded output.
 */

#include "fastuuid/infra/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace fastuuid::infra {

std::mutex Logger::mutex_;
std::atomic<int> Logger::level_{static_cast<int>(LogLevel::INFO)};

void Logger::set_level(LogLevel level) noexcept
{
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() noexcept
{
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

bool Logger::should_log(LogLevel level) noexcept
{
    return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
}

bool Logger::parse_level(const std::string& name, LogLevel& out)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") {
        out = LogLevel::TRACE;
    } else if (lowered == "debug") {
        out = LogLevel::DEBUG;
    } else if (lowered == "info") {
        out = LogLevel::INFO;
    } else if (lowered == "warn" || lowered == "warning") {
        out = LogLevel::WARN;
    } else if (lowered == "error") {
        out = LogLevel::ERROR;
    } else if (lowered == "fatal") {
        out = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

const char* Logger::level_name(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::TRACE:
        return "trace";
    case LogLevel::DEBUG:
        return "debug";
    case LogLevel::INFO:
        return "info";
    case LogLevel::WARN:
        return "warn";
    case LogLevel::ERROR:
        return "error";
    case LogLevel::FATAL:
        return "fatal";
    }
    return "unknown";
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops the entry if it is below the active threshold.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stream Segregation**: Routes messages to `stdout` or `stderr` based on severity.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!should_log(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Note: Mutex protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

} // namespace fastuuid::infra
