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
 * @brief Thread-safe diagnostic logging facility for the kitty registry.
 *
 * @details
 * Declares the `Logger` class, the single reporting channel used by the
 * registry, the runtime environment and the `kittyd` front-end. Entries are
 * written atomically to the diagnostic streams and filtered against a
 * process-wide minimum severity configured at startup. Standard output is
 * left to the request/response protocol of `kittyd`.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace kitties::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-call execution details (key writes, digest inputs).
    DEBUG, ///< State transitions useful while developing.
    INFO,  ///< Nominal operational events (mint committed, block sealed).
    WARN,  ///< Rejected calls and recoverable anomalies.
    ERROR, ///< Failures of the environment (I/O, corrupt frames).
    FATAL  ///< Failures that terminate the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Output is serialized by an internal mutex so entries from different threads
 * never interleave. Messages below the configured threshold are discarded
 * before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::clog` (buffered).
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr` (unbuffered).
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * kitties::infra::Logger::log(LogLevel::INFO, "Registry: Minted 3f9a... for alice");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a configuration token into a `LogLevel`.
     *
     * Accepted tokens (case-sensitive): `trace`, `debug`, `info`, `warn`,
     * `error`, `fatal`.
     *
     * @param token The textual level.
     * @param out Receives the parsed level on success.
     * @return true If the token named a known level.
     */
    static bool parse_level(const std::string& token, LogLevel& out);

  private:
    /// @brief Guards `std::clog` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Minimum severity that is emitted.
    static std::atomic<LogLevel> threshold_;
};

} // namespace kitties::infra
