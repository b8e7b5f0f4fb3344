#pragma once

#include "umcp/log/logger.hpp"

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace umcp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog sinks
// ─────────────────────────────────────────────────────────────────────────────

class SpdlogLogger final : public ILogger {
public:
    /// Wrap an existing spdlog logger. Throws std::invalid_argument on null.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Build a logger over the given sinks.
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;
    SpdlogLogger(SpdlogLogger&&) = delete;
    SpdlogLogger& operator=(SpdlogLogger&&) = delete;

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

/// Colored stderr logger.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_console_logger(LogLevel min_level = LogLevel::Info);

/// Size-rotated file logger (max_file_size bytes per file, max_files kept).
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_rotating_file_logger(
    const std::string& filename,
    std::size_t max_file_size,
    std::size_t max_files,
    LogLevel min_level = LogLevel::Info
);

/// Both of the above sharing one level.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_console_rotating_file_logger(
    const std::string& filename,
    std::size_t max_file_size,
    std::size_t max_files,
    LogLevel min_level = LogLevel::Info
);

}  // namespace umcp
