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
 * @brief Thread-safe diagnostic logging facility for emojid.
 *
 * @details
 * Declares the `Logger` class, the single reporting channel of the library.
 * Output is serialized across threads so that entries emitted by concurrent
 * generators never interleave. A process-wide severity threshold keeps the
 * hot generation paths silent unless tracing is explicitly requested.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

namespace emojid::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 *
 * The ordering is significant: the threshold comparison in `Logger::enabled`
 * relies on the declaration order.
 */
enum class LogLevel {
    TRACE, ///< Per-draw details (rejections inside the sampler).
    DEBUG, ///< Diagnostic information (alphabet sizes, parse failures).
    INFO,  ///< Nominal events (configuration loaded).
    WARN,  ///< Suspicious but accepted input (duplicate alphabet entries).
    ERROR, ///< Recoverable failures (entropy source unavailable).
    FATAL  ///< Failures that terminate the process (must-variants).
};

/**
 * @class Logger
 * @brief Static, thread-safe console logger.
 *
 * **Stream Routing Logic:**
 * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
 * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
 *
 * Messages below the configured threshold are discarded before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a timestamped, severity-tagged message.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * emojid::infra::Logger::log(LogLevel::INFO, "Config: Loaded 152-entry alphabet.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// Sets the minimum severity that will be written. Defaults to `INFO`.
    static void set_level(LogLevel level);

    /// Returns the current minimum severity.
    static LogLevel level();

    /// Reports whether a message of the given severity would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Maps a case-insensitive level name to a `LogLevel`.
     *
     * Accepted names: `trace`, `debug`, `info`, `warn`/`warning`, `error`, `fatal`.
     *
     * @throws std::invalid_argument if the name is unknown.
     */
    static LogLevel parse_level(std::string_view name);

  private:
    /// Guards `std::cout`/`std::cerr` and `std::localtime`'s static buffer.
    static std::mutex mutex_;

    /// Minimum severity written. Read without the mutex on every call.
    static std::atomic<LogLevel> threshold_;
};

} // namespace emojid::infra
