#pragma once

#include "mcphub/log/logger.hpp"

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// ILogger backend on spdlog. Console output goes to stderr so that stdout
// stays free for command results; the file sink is optional.

class SpdlogLogger final : public ILogger {
public:
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Console (stderr) plus file. An empty filename yields a console-only logger.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace mcphub
