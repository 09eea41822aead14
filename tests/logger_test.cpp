#include <catch2/catch_test_macros.hpp>

#include "wirelink/log/logger.hpp"

#include <memory>
#include <vector>

using namespace wirelink;

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
// Levels and records
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

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == false);

    logger.trace("test");
    logger.warn("test");
    logger.fatal("test");
}

TEST_CASE("TestLogger captures messages at or above min level", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.debug("debug message");
    logger.info("info message");
    logger.warn("warn message");
    logger.error("error message");

    REQUIRE(logger.records().size() == 2);
    REQUIRE(logger.records()[0].level == LogLevel::Warn);
    REQUIRE(logger.records()[0].message == "warn message");
    REQUIRE(logger.records()[1].level == LogLevel::Error);
}

TEST_CASE("LogRecord captures source location and timestamp", "[log]") {
    TestLogger logger;

    auto before = std::chrono::system_clock::now();
    logger.info("test message");
    auto after = std::chrono::system_clock::now();

    REQUIRE(logger.records().size() == 1);
    const auto& record = logger.records()[0];

    std::string_view filename(record.location.file_name());
    REQUIRE(filename.find("logger_test") != std::string_view::npos);
    REQUIRE(record.location.line() > 0);
    REQUIRE(record.timestamp >= before);
    REQUIRE(record.timestamp <= after);
}

TEST_CASE("Formatted helpers build the message", "[log]") {
    TestLogger logger(LogLevel::Info);

    logger.debug_fmt("skipped {}", 1);
    logger.info_fmt("Listening on port {} ({})", 7000, "tcp");

    REQUIRE(logger.records().size() == 1);
    REQUIRE(logger.records()[0].message == "Listening on port 7000 (tcp)");
}

TEST_CASE("ConsoleLogger level can be changed", "[log]") {
    ConsoleLogger logger(LogLevel::Error);

    REQUIRE(logger.level() == LogLevel::Error);
    REQUIRE(logger.should_log(LogLevel::Warn) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == true);

    logger.set_level(LogLevel::Warn);

    REQUIRE(logger.level() == LogLevel::Warn);
    REQUIRE(logger.should_log(LogLevel::Warn) == true);
}

// ─────────────────────────────────────────────────────────────────────────────
// TaggedLogger
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("TaggedLogger prefixes its tag", "[log]") {
    auto target = std::make_shared<TestLogger>(LogLevel::Info);
    TaggedLogger logger("Connection_127.0.0.1:5000", target);

    logger.debug("hidden");
    logger.warn("read failed");

    REQUIRE(target->records().size() == 1);
    REQUIRE(target->records()[0].message == "Connection_127.0.0.1:5000: read failed");
    REQUIRE(target->records()[0].level == LogLevel::Warn);

    logger.set_tag("EchoService_tcp_7000");
    logger.info("Closing");
    REQUIRE(target->records()[1].message == "EchoService_tcp_7000: Closing");
}

TEST_CASE("TaggedLogger without a target follows the global logger", "[log]") {
    TaggedLogger logger("Connection_x", nullptr);

    auto global = std::make_unique<TestLogger>(LogLevel::Debug);
    auto* raw_ptr = global.get();
    set_logger(std::move(global));

    logger.debug("started");
    REQUIRE(raw_ptr->records().size() == 1);
    REQUIRE(raw_ptr->records()[0].message == "Connection_x: started");

    set_logger(nullptr);
}

// ─────────────────────────────────────────────────────────────────────────────
// Global logger
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Global logger defaults to console at Warn", "[log]") {
    set_logger(nullptr);

    REQUIRE(get_logger().should_log(LogLevel::Warn) == true);
    REQUIRE(get_logger().should_log(LogLevel::Info) == false);
}

TEST_CASE("Global logger can be swapped", "[log]") {
    auto test_logger = std::make_unique<TestLogger>();
    auto* raw_ptr = test_logger.get();

    set_logger(std::move(test_logger));
    get_logger().info("test message");

    REQUIRE(raw_ptr->records().size() == 1);
    REQUIRE(raw_ptr->records()[0].message == "test message");

    set_logger(nullptr);
}

TEST_CASE("WIRELINK_LOG macros work correctly", "[log]") {
    auto test_logger = std::make_unique<TestLogger>(LogLevel::Debug);
    auto* raw_ptr = test_logger.get();

    set_logger(std::move(test_logger));

    WIRELINK_LOG_TRACE("trace");  // Should be filtered
    WIRELINK_LOG_DEBUG("debug");
    WIRELINK_LOG_INFO("info");
    WIRELINK_LOG_WARN("warn");
    WIRELINK_LOG_ERROR("error");

    REQUIRE(raw_ptr->records().size() == 4);
    REQUIRE(raw_ptr->records()[0].level == LogLevel::Debug);
    REQUIRE(raw_ptr->records()[1].level == LogLevel::Info);
    REQUIRE(raw_ptr->records()[2].level == LogLevel::Warn);
    REQUIRE(raw_ptr->records()[3].level == LogLevel::Error);

    set_logger(nullptr);
}
