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
 * @brief Thread-safe diagnostic logging facility for stableid.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used by the
 * library (registry collisions, precondition violations, decode failures) and by the
 * `stableid-gen` tool. Output is serialized across threads so entries never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace stableid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Used to categorize the criticality of log entries, to select the output stream
 * (Standard Output vs. Standard Error) and to filter entries below the threshold.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information (decode failures, registrations).
    INFO,  ///< Nominal operational events.
    WARN,  ///< Non-blocking anomalies (e.g. two types claiming one stable id).
    ERROR, ///< Violated preconditions and failed operations.
    FATAL  ///< Failures that end the process (tool entry point only).
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * The Logger writes through an internal mutex. Entries below `min_level()` are
 * dropped before the lock is taken.
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
     * stableid::infra::Logger::log(LogLevel::WARN, "Registry: duplicate stable id 'saw'");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be written.
     *
     * @param level Entries strictly below this level are discarded.
     */
    static void set_min_level(LogLevel level);

    /// @brief Current minimum severity.
    static LogLevel min_level();

    /// @brief Whether an entry of `level` would currently be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Parses a case-insensitive level name ("trace", "debug", "info", "warn",
     * "error", "fatal").
     *
     * @param text The level name.
     * @param out Receives the parsed level on success; untouched otherwise.
     * @return true If `text` named a level.
     */
    static bool parse_level(const std::string& text, LogLevel& out);

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Filtering threshold, readable without the lock.
    static std::atomic<LogLevel> min_level_;
};

} // namespace stableid::infra
