#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace umcp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as found in config files and MCP_LOG_LEVEL.
/// Case-insensitive; "warning" is accepted as an alias of "warn".
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    /// Cheap level check, used by the macros to skip formatting.
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string msg, std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::move(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, std::string(msg), loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, std::string(msg), loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, std::string(msg), loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, std::string(msg), loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, std::string(msg), loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, std::string(msg), loc);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default until the server installs a real backend
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

/// Replace the process-wide logger. Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Formatting macros. Arguments are only evaluated when the level is enabled.
#define UMCP_LOG_AT(level, ...) \
    do { if (::umcp::get_logger().should_log(level)) \
         ::umcp::get_logger().write(level, std::format(__VA_ARGS__)); } while(false)

#define UMCP_LOG_TRACE(...) UMCP_LOG_AT(::umcp::LogLevel::Trace, __VA_ARGS__)
#define UMCP_LOG_DEBUG(...) UMCP_LOG_AT(::umcp::LogLevel::Debug, __VA_ARGS__)
#define UMCP_LOG_INFO(...)  UMCP_LOG_AT(::umcp::LogLevel::Info, __VA_ARGS__)
#define UMCP_LOG_WARN(...)  UMCP_LOG_AT(::umcp::LogLevel::Warn, __VA_ARGS__)
#define UMCP_LOG_ERROR(...) UMCP_LOG_AT(::umcp::LogLevel::Error, __VA_ARGS__)
#define UMCP_LOG_FATAL(...) UMCP_LOG_AT(::umcp::LogLevel::Fatal, __VA_ARGS__)

}  // namespace umcp
