// Copyright (c) 2024-2026 The DynFee Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace core {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

LogCategory parse_single_category(std::string_view name) {
    if (iequals(name, "oracle")) return LogCategory::ORACLE;
    if (iequals(name, "fee"))    return LogCategory::FEE;
    if (iequals(name, "policy")) return LogCategory::POLICY;
    if (iequals(name, "hook"))   return LogCategory::HOOK;
    if (iequals(name, "auth"))   return LogCategory::AUTH;
    if (iequals(name, "config")) return LogCategory::CONFIG;
    if (iequals(name, "sim"))    return LogCategory::SIM;
    if (iequals(name, "lock"))   return LogCategory::LOCK;
    if (iequals(name, "all"))    return LogCategory::ALL;
    return LogCategory::NONE;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------
std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    name = trim(name);
    if (iequals(name, "trace")) return LogLevel::TRACE;
    if (iequals(name, "debug")) return LogLevel::DEBUG;
    if (iequals(name, "info"))  return LogLevel::INFO;
    if (iequals(name, "warn") || iequals(name, "warning")) {
        return LogLevel::WARN;
    }
    if (iequals(name, "error")) return LogLevel::ERR;
    if (iequals(name, "fatal")) return LogLevel::FATAL;
    if (iequals(name, "off"))   return LogLevel::OFF;
    return std::nullopt;
}

std::string_view log_category_string(LogCategory cat) noexcept {
    uint32_t bits = static_cast<uint32_t>(cat);
    if (bits == 0) return "NONE";
    if (bits == static_cast<uint32_t>(LogCategory::ALL)) return "ALL";

    // Isolate lowest set bit.
    uint32_t lowest = bits & (~bits + 1u);

    switch (static_cast<LogCategory>(lowest)) {
        case LogCategory::ORACLE: return "ORACLE";
        case LogCategory::FEE:    return "FEE";
        case LogCategory::POLICY: return "POLICY";
        case LogCategory::HOOK:   return "HOOK";
        case LogCategory::AUTH:   return "AUTH";
        case LogCategory::CONFIG: return "CONFIG";
        case LogCategory::SIM:    return "SIM";
        case LogCategory::LOCK:   return "LOCK";
        default:                  break;
    }
    return "UNKNOWN";
}

uint32_t parse_log_categories(std::string_view list) {
    uint32_t mask = 0;
    while (!list.empty()) {
        auto comma = list.find(',');
        std::string_view item = trim(list.substr(0, comma));
        if (iequals(item, "none")) {
            mask = 0;
        } else {
            mask |= static_cast<uint32_t>(parse_single_category(item));
        }
        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return mask;
}

// ---------------------------------------------------------------------------
// Logger -- singleton access, construction
// ---------------------------------------------------------------------------
Logger& Logger::instance() {
    static Logger the_logger;
    return the_logger;
}

Logger::Logger() {
    buffer_.reserve(BUFFER_FLUSH_THRESHOLD * 2);
}

Logger::~Logger() {
    flush();
}

// ---------------------------------------------------------------------------
// Logger -- configuration
// ---------------------------------------------------------------------------
void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_release);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(level_.load(std::memory_order_acquire));
}

void Logger::enable_category(LogCategory cat) {
    enabled_categories_.fetch_or(static_cast<uint32_t>(cat),
                                 std::memory_order_release);
}

void Logger::disable_category(LogCategory cat) {
    enabled_categories_.fetch_and(~static_cast<uint32_t>(cat),
                                  std::memory_order_release);
}

void Logger::set_categories(uint32_t mask) {
    enabled_categories_.store(mask, std::memory_order_release);
}

LogCategory Logger::enabled_categories() const noexcept {
    return static_cast<LogCategory>(
        enabled_categories_.load(std::memory_order_acquire));
}

bool Logger::will_log(LogLevel lvl, LogCategory cat) const noexcept {
    if (static_cast<int>(lvl) < level_.load(std::memory_order_acquire)) {
        return false;
    }
    // NONE category (0) always passes the category filter.
    uint32_t cat_bits = static_cast<uint32_t>(cat);
    if (cat_bits != 0) {
        uint32_t mask = enabled_categories_.load(std::memory_order_acquire);
        if ((mask & cat_bits) == 0) {
            return false;
        }
    }
    return print_to_console_.load(std::memory_order_acquire) ||
           print_to_file_.load(std::memory_order_acquire) ||
           capture_limit_.load(std::memory_order_acquire) > 0;
}

void Logger::set_print_to_console(bool enable) {
    print_to_console_.store(enable, std::memory_order_release);
}

bool Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (file_stream_.is_open()) {
        flush_file_locked();
        file_stream_.close();
    }
    buffer_.clear();
    print_to_file_.store(false, std::memory_order_release);

    if (path.empty()) return true;

    file_stream_.open(path, std::ios::out | std::ios::app);
    if (!file_stream_.is_open()) {
        std::cerr << "Logger: failed to open log file: " << path << "\n";
        return false;
    }
    print_to_file_.store(true, std::memory_order_release);
    return true;
}

void Logger::set_capture_limit(std::size_t max_lines) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    capture_limit_.store(max_lines, std::memory_order_release);
    while (capture_.size() > max_lines) capture_.pop_front();
}

std::vector<std::string> Logger::captured() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return {capture_.begin(), capture_.end()};
}

std::size_t Logger::count_captured(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::size_t n = 0;
    for (const auto& line : capture_) {
        if (line.find(needle) != std::string::npos) ++n;
    }
    return n;
}

void Logger::clear_captured() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    capture_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    flush_file_locked();
    std::cerr.flush();
}

// ---------------------------------------------------------------------------
// Logger -- writing
// ---------------------------------------------------------------------------
void Logger::write(LogLevel lvl, LogCategory cat,
                   std::string_view message) {
    //   [2026-02-03 12:00:00.123] [INFO] [FEE] message here\n
    std::string line;
    line.reserve(64 + message.size());

    line += '[';
    line += format_timestamp();
    line += "] [";
    line += log_level_string(lvl);
    line += "] [";
    line += log_category_string(cat);
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    write_line_locked(line);

    if (static_cast<int>(lvl) >= static_cast<int>(LogLevel::WARN)) {
        flush_file_locked();
        std::cerr.flush();
    }
}

void Logger::write_line_locked(std::string_view line) {
    if (print_to_console_.load(std::memory_order_relaxed)) {
        std::cerr.write(line.data(),
                        static_cast<std::streamsize>(line.size()));
    }

    if (print_to_file_.load(std::memory_order_relaxed) &&
        file_stream_.is_open()) {
        buffer_ += line;
        if (buffer_.size() >= BUFFER_FLUSH_THRESHOLD) {
            flush_file_locked();
        }
    }

    const std::size_t limit = capture_limit_.load(std::memory_order_relaxed);
    if (limit > 0) {
        capture_.emplace_back(line.substr(0, line.size() - 1));
        while (capture_.size() > limit) capture_.pop_front();
    }
}

void Logger::flush_file_locked() {
    if (!file_stream_.is_open()) {
        buffer_.clear();
        return;
    }
    if (!buffer_.empty()) {
        file_stream_.write(buffer_.data(),
                           static_cast<std::streamsize>(buffer_.size()));
        buffer_.clear();
    }
    file_stream_.flush();
}

std::string Logger::format_timestamp() {
    using Clock = std::chrono::system_clock;

    auto now = Clock::now();
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    int millis = static_cast<int>(epoch_ms % 1000);

    std::time_t time_val = Clock::to_time_t(now);
    std::tm tm_buf{};

#if defined(_WIN32) || defined(_WIN64)
    gmtime_s(&tm_buf, &time_val);
#else
    gmtime_r(&time_val, &tm_buf);
#endif

    char buf[32];
    int n = std::snprintf(
        buf, sizeof(buf),
        "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, millis);

    return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace core
