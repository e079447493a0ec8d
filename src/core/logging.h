#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SLUICE_CORE_LOGGING_H
#define SLUICE_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE    = 0,
    MEMPOOL = 1u << 0,
    MINING  = 1u << 1,
    LOCK    = 1u << 2,
    BENCH   = 1u << 3,
    CONFIG  = 1u << 4,
    ALL     = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr LogCategory& operator|=(LogCategory& a,
                                          LogCategory b) noexcept {
    a = a | b;
    return a;
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Short name for a log level ("INFO", "WARN", ...).
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Name of the lowest set bit, "ALL" for the full mask, "NONE" for zero.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses "trace".."fatal" / "off" (case-insensitive).
[[nodiscard]] std::optional<LogLevel> log_level_from_string(
    std::string_view name);

/// Parses a single category name such as "mempool" or "all".
[[nodiscard]] std::optional<LogCategory> log_category_from_string(
    std::string_view name);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Receives every formatted line, in addition to the console and file.
    using CaptureFn = std::function<void(std::string_view line)>;

    static Logger& instance();

    void set_level(LogLevel level);
    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);
    /// Replaces the whole category mask.
    void set_categories(LogCategory mask);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Lockless check: would a message at this level and category be
    /// written to at least one sink?
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Opens (or replaces) the append-mode log file. An empty path closes
    /// the current file. Returns false if the file could not be opened.
    bool set_log_file(const std::string& path);

    /// Installs (or, with an empty function, removes) the capture sink.
    void set_capture(CaptureFn fn);

    void flush();

    /// Formats and writes one line. Callers go through the LOG_* macros,
    /// which check will_log() first.
    void write(LogLevel level, LogCategory cat, std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123" (UTC)
    static std::string format_timestamp();

    // Must be called with write_mutex_ held.
    void flush_file_locked();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};
    std::atomic<bool>     has_capture_{false};

    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::string           buffer_;
    CaptureFn             capture_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// The message is only formatted when will_log() passes.
//
//   LOG_DEBUG(core::LogCategory::MEMPOOL, "added " + hash.to_hex());
// ---------------------------------------------------------------------------

#define SLUICE_LOG(lvl, cat, msg)                                         \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) SLUICE_LOG(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) SLUICE_LOG(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  SLUICE_LOG(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  SLUICE_LOG(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) SLUICE_LOG(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) SLUICE_LOG(core::LogLevel::FATAL, cat, msg)

#endif // SLUICE_CORE_LOGGING_H
