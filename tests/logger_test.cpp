#include <catch2/catch_test_macros.hpp>

#include "umcp/log/logger.hpp"

#include <vector>

using namespace umcp;

// ─────────────────────────────────────────────────────────────────────────────
// Test Logger - Captures log messages for verification
// ─────────────────────────────────────────────────────────────────────────────

class TestLogger final : public ILogger {
public:
    explicit TestLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept {
        return records_;
    }

private:
    LogLevel min_level_;
    std::vector<LogRecord> records_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Fatal) == "FATAL");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts config spellings", "[log]") {
    REQUIRE(parse_log_level("info") == LogLevel::Info);
    REQUIRE(parse_log_level("DEBUG") == LogLevel::Debug);
    REQUIRE(parse_log_level("Warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("warn") == LogLevel::Warn);
    REQUIRE(parse_log_level("off") == LogLevel::Off);
    REQUIRE(parse_log_level("verbose").has_value() == false);
    REQUIRE(parse_log_level("").has_value() == false);
}

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == false);

    logger.info("test");
    logger.fatal("test");
}

TEST_CASE("LogRecord captures source location", "[log]") {
    TestLogger logger;
    logger.info("test message");

    REQUIRE(logger.records().size() == 1);
    std::string_view filename(logger.records()[0].location.file_name());
    const bool has_test_filename = (filename.find("logger_test") != std::string_view::npos);
    REQUIRE(has_test_filename);
}

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);
    REQUIRE(get_logger().should_log(LogLevel::Fatal) == false);
}

TEST_CASE("UMCP_LOG macros format and filter", "[log]") {
    auto test_logger = std::make_unique<TestLogger>(LogLevel::Debug);
    auto* raw_ptr = test_logger.get();
    set_logger(std::move(test_logger));

    UMCP_LOG_TRACE("trace {}", 1);  // Filtered
    UMCP_LOG_DEBUG("client {} sent {} bytes", "client_ab", 42);
    UMCP_LOG_INFO("plain");
    UMCP_LOG_WARN("warn");
    UMCP_LOG_ERROR("error");
    UMCP_LOG_FATAL("fatal");

    REQUIRE(raw_ptr->records().size() == 5);
    REQUIRE(raw_ptr->records()[0].level == LogLevel::Debug);
    REQUIRE(raw_ptr->records()[0].message == "client client_ab sent 42 bytes");
    REQUIRE(raw_ptr->records()[1].message == "plain");
    REQUIRE(raw_ptr->records()[4].level == LogLevel::Fatal);

    set_logger(nullptr);
}
