#pragma once
// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DYNFEE_CORE_LOGGING_H
#define DYNFEE_CORE_LOGGING_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

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
    ORACLE  = 1u << 0,
    FEE     = 1u << 1,
    POLICY  = 1u << 2,
    HOOK    = 1u << 3,
    AUTH    = 1u << 4,
    CONFIG  = 1u << 5,
    SIM     = 1u << 6,
    LOCK    = 1u << 7,
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

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Parses a level name ("trace" .. "fatal", "off"; case-insensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Returns the name of the lowest set category bit, "NONE" for zero.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses a comma-separated list of category names into a bitmask.
/// Unknown names are ignored. "all" and "none" are recognised.
[[nodiscard]] uint32_t parse_log_categories(std::string_view list);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
// Three sinks: stderr, an append-mode file (buffered), and an in-memory
// capture ring that keeps the most recent lines for inspection.
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    // -- configuration (all thread-safe) ------------------------------------

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const noexcept;

    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);
    void set_categories(uint32_t mask);
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Fast lockless check: returns true if a message at the given
    /// level and category would reach at least one sink.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);

    /// Opens (or replaces) the output log file in append mode and enables
    /// the file sink. An empty path closes the current file.
    /// Returns false if the file cannot be opened.
    bool set_log_file(const std::filesystem::path& path);

    /// Keep up to @p max_lines recent lines in memory. Zero disables.
    void set_capture_limit(std::size_t max_lines);

    /// Copy of the captured lines, oldest first.
    [[nodiscard]] std::vector<std::string> captured() const;

    /// Number of captured lines containing @p needle.
    [[nodiscard]] std::size_t count_captured(std::string_view needle) const;

    void clear_captured();

    void flush();

    // -- logging entry point ------------------------------------------------

    /// Writes one formatted log line. Callers check will_log() first.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);
    void flush_file_locked();

    std::atomic<int>         level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t>    enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>        print_to_console_{true};
    std::atomic<bool>        print_to_file_{false};
    std::atomic<std::size_t> capture_limit_{0};

    mutable std::mutex      write_mutex_;
    std::ofstream           file_stream_;
    std::string             buffer_;
    std::deque<std::string> capture_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// Each macro performs a lockless will_log() check before doing any string
// formatting, so disabled paths have near-zero overhead.
//
// Usage:
//   LOG_INFO(core::LogCategory::ORACLE, "enabled pool " + pool.to_hex());
//   LOG_WARN(core::LogCategory::FEE, "cap event started");
// ---------------------------------------------------------------------------

#define DYNFEE_LOG_AT(lvl, cat, msg)                                      \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) DYNFEE_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) DYNFEE_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  DYNFEE_LOG_AT(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  DYNFEE_LOG_AT(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) DYNFEE_LOG_AT(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) DYNFEE_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // DYNFEE_CORE_LOGGING_H
