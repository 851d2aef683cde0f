#include "mcphub/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mcphub {

namespace {

constexpr std::string_view RESET   = "\033[0m";
constexpr std::string_view GRAY    = "\033[90m";
constexpr std::string_view CYAN    = "\033[36m";
constexpr std::string_view GREEN   = "\033[32m";
constexpr std::string_view YELLOW  = "\033[33m";
constexpr std::string_view RED     = "\033[31m";
constexpr std::string_view MAGENTA = "\033[35m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return GRAY;
        case LogLevel::Debug: return CYAN;
        case LogLevel::Info:  return GREEN;
        case LogLevel::Warn:  return YELLOW;
        case LogLevel::Error: return RED;
        case LogLevel::Fatal: return MAGENTA;
        case LogLevel::Off:   return RESET;
    }
    return RESET;
}

[[nodiscard]] std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

[[nodiscard]] std::string_view extract_filename(const char* path) noexcept {
    std::string_view sv(path);
    const auto last_slash = sv.find_last_of('/');
    if (last_slash != std::string_view::npos) {
        return sv.substr(last_slash + 1);
    }
    return sv;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    std::string lowered(name.size(), '\0');
    std::transform(name.begin(), name.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal" || lowered == "critical") return LogLevel::Fatal;
    if (lowered == "off" || lowered == "none") return LogLevel::Off;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    static std::mutex output_mutex;

    std::ostringstream oss;
    const bool use_colors = colors_enabled_;
    if (use_colors) {
        oss << GRAY << format_timestamp(record.timestamp) << RESET
            << ' ' << level_color(record.level);
    } else {
        oss << format_timestamp(record.timestamp) << ' ';
    }
    oss << std::setw(5) << std::left << to_string(record.level);
    if (use_colors) {
        oss << RESET << ' ' << GRAY;
    } else {
        oss << ' ';
    }
    oss << extract_filename(record.location.file_name()) << ':' << record.location.line();
    if (use_colors) {
        oss << RESET;
    }
    oss << ' ' << record.message << '\n';

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << oss.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger != nullptr) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace mcphub
