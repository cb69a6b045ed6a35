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
 * Formats entries with an ISO 8601-like timestamp, a severity tag and ANSI colors,
 * and applies the runtime severity threshold.
 */

#include "stableid/infra/logger.hpp"

#include "stableid/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace stableid::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::min_level_{LogLevel::STABLEID_DEFAULT_LOG_LEVEL};

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops entries below the configured threshold.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stream Segregation**: Routes messages to `stdout` or `stderr` based on severity.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex protects std::localtime's internal static buffer.
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

void Logger::set_min_level(LogLevel level)
{
    min_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::min_level()
{
    return min_level_.load(std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level)
{
    return level >= min_level();
}

bool Logger::parse_level(const std::string& text, LogLevel& out)
{
    std::string name(text);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") {
        out = LogLevel::TRACE;
    } else if (name == "debug") {
        out = LogLevel::DEBUG;
    } else if (name == "info") {
        out = LogLevel::INFO;
    } else if (name == "warn" || name == "warning") {
        out = LogLevel::WARN;
    } else if (name == "error") {
        out = LogLevel::ERROR;
    } else if (name == "fatal") {
        out = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

} // namespace stableid::infra
