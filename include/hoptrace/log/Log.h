// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Log.h
 * @brief Small thread-safe leveled logger used by the tracer, CLI and daemon.
 *
 * Usage:
 *   hoptrace::LoggerConfig lc;
 *   lc.level = hoptrace::LogLevel::DEBUG;
 *   hoptrace::Logger::init(lc);
 *
 *   HTLOG_INFO("tracing %s (%s)", host, addr);
 *
 * Levels: TRACE < DEBUG < INFO < WARN < ERROR
 * Modes : Console (stderr), File (append), Silent
 *
 * Hop lines meant for the operator are printed on stdout by the CLI; every
 * diagnostic goes through this logger so the two never interleave.
 */

#include <algorithm>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#include <unistd.h>

namespace hoptrace {

/**
 * @brief Logging severity levels in increasing order.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4
};

/**
 * @brief Output backends supported by the logger.
 */
enum class LogMode {
    Console,  ///< Log to stderr with a colored level tag.
    File,     ///< Append to the configured file.
    Silent    ///< Discard everything.
};

struct LoggerConfig {
    LogLevel level = LogLevel::INFO;      ///< Minimum severity to emit.
    LogMode  mode  = LogMode::Console;    ///< Output backend.
    std::string file_path{};              ///< Used when mode == File.
};

/// Parse "trace" .. "error" (case-insensitive). Unknown text yields nullopt.
std::optional<LogLevel> parse_log_level(const std::string& text);

/// Parse "console" | "file" | "silent" (case-insensitive).
std::optional<LogMode> parse_log_mode(const std::string& text);

/**
 * @brief Process-wide logger with printf-style helpers.
 *
 * The level lives in an atomic so disabled levels cost one relaxed load;
 * emission is serialised by a mutex so lines from concurrent traces never
 * interleave.
 */
class Logger {
public:
    /**
     * @brief Configure backend and minimum level.
     *
     * Calling init() again reconfigures; a previously opened log file is
     * closed. If the file cannot be opened the logger falls back to Console.
     */
    static void init(const LoggerConfig& cfg);

    static void set_level(LogLevel lvl);
    static LogLevel level();

    /**
     * @brief Emit one formatted line (a trailing newline is added if missing).
     */
    static void log(LogLevel lvl, const char* fmt, ...)
        __attribute__((format(printf, 2, 3)));

private:
    static void vlog(LogLevel lvl, const char* fmt, va_list ap);
    static const char* level_str(LogLevel lvl);

    static std::mutex mtx_;            ///< Serialises writes to the backend.
    static std::atomic<int> level_;    ///< Current minimum level as an int.
    static LogMode mode_;              ///< Current output mode.
    static FILE* file_;                ///< Owned FILE* when mode == File.
};

// -----------------------------------------------------------------------------
// Convenience macros
// -----------------------------------------------------------------------------

#define HTLOG_ENABLED(lvl) \
    (static_cast<int>(hoptrace::Logger::level()) <= static_cast<int>(hoptrace::LogLevel::lvl))

#define HTLOG_TRACE(fmt, ...) \
    do { \
        if (HTLOG_ENABLED(TRACE)) { \
            hoptrace::Logger::log(hoptrace::LogLevel::TRACE, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

/**
 * @brief DEBUG logging with an inlined, timestamped fast path.
 *
 * Used from the per-packet receive loop, so it skips Logger::log() and its
 * mutex and writes a single line straight to stderr with write(2).
 */
#define HTLOG_DEBUG(fmt, ...) \
    do { \
        if (HTLOG_ENABLED(DEBUG)) { \
            struct timespec _ht_ts; \
            clock_gettime(CLOCK_REALTIME, &_ht_ts); \
            std::tm _ht_tm; \
            localtime_r(&_ht_ts.tv_sec, &_ht_tm); \
            char _ht_time[16]; \
            int _ht_ms = static_cast<int>(_ht_ts.tv_nsec / 1000000L); \
            if (_ht_ms < 0) _ht_ms = 0; \
            else if (_ht_ms > 999) _ht_ms = _ht_ms % 1000; \
            std::snprintf(_ht_time, sizeof(_ht_time), "%02d:%02d:%02d.%03d", \
                          _ht_tm.tm_hour, _ht_tm.tm_min, _ht_tm.tm_sec, _ht_ms); \
            char _htdbg_buf[576]; \
            int _htdbg_len = std::snprintf(_htdbg_buf, sizeof(_htdbg_buf), \
                                           "[DEBUG %s] " fmt "\n", _ht_time, ##__VA_ARGS__); \
            if (_htdbg_len > 0) { \
                std::size_t _htdbg_size = static_cast<std::size_t>( \
                    std::min<int>(_htdbg_len, static_cast<int>(sizeof(_htdbg_buf) - 1))); \
                ssize_t _htdbg_rc = ::write(STDERR_FILENO, _htdbg_buf, _htdbg_size); \
                (void)_htdbg_rc; \
            } \
        } \
    } while (0)

#define HTLOG_INFO(fmt, ...) \
    do { \
        if (HTLOG_ENABLED(INFO)) { \
            hoptrace::Logger::log(hoptrace::LogLevel::INFO, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define HTLOG_WARN(fmt, ...) \
    do { \
        if (HTLOG_ENABLED(WARN)) { \
            hoptrace::Logger::log(hoptrace::LogLevel::WARN, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define HTLOG_ERROR(fmt, ...) \
    do { \
        if (HTLOG_ENABLED(ERROR)) { \
            hoptrace::Logger::log(hoptrace::LogLevel::ERROR, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

} // namespace hoptrace
