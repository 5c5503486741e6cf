/**
 * @file ilogger_test.cpp
 * @brief Unit tests for ILogger interface and implementations
 */

#include <loadgen/di/ilogger.hpp>
#include <loadgen/driver/load_driver.hpp>

#include "mocks/fake_protocol_client.hpp"
#include "mocks/mock_thread_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace loadgen;
using namespace loadgen::di;
using loadgen::integration::log_level;

// =============================================================================
// Mock Logger for Testing
// =============================================================================

namespace {

/**
 * @brief Mock logger that records all log calls for verification
 */
class MockLogger final : public ILogger {
public:
    MockLogger() = default;
    ~MockLogger() override = default;

    void trace(std::string_view message) override { record(log_level::trace, message); }
    void debug(std::string_view message) override { record(log_level::debug, message); }
    void info(std::string_view message) override { record(log_level::info, message); }
    void warn(std::string_view message) override { record(log_level::warn, message); }
    void error(std::string_view message) override { record(log_level::error, message); }

    [[nodiscard]] bool is_enabled(log_level level) const noexcept override {
        return level >= enabled_level_.load();
    }

    // Test accessors
    [[nodiscard]] auto count(log_level level) const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& entry : entries_) {
            if (entry.first == level) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] auto total_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] auto last_message() const -> std::string {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.empty() ? std::string{} : entries_.back().second;
    }

    [[nodiscard]] auto contains(log_level level, const std::string& text) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [lvl, message] : entries_) {
            if (lvl == level && message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    void set_enabled_level(log_level level) noexcept { enabled_level_ = level; }

private:
    void record(log_level level, std::string_view message) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace_back(level, std::string(message));
    }

    mutable std::mutex mutex_;
    std::vector<std::pair<log_level, std::string>> entries_;
    std::atomic<log_level> enabled_level_{log_level::trace};
};

auto make_config() -> core::load_config {
    core::load_config config;
    config.target.host = "127.0.0.1";
    config.target.port = 11112;
    config.target.called_ae = "PACS";
    config.target_rate = 200.0;
    config.concurrency = 2;
    config.total_count = 10;
    config.max_error_rate = 0.0;
    config.max_p95_latency_ms = 1000.0;
    config.progress_interval = std::chrono::seconds{0};
    return config;
}

auto make_payloads() -> std::vector<catalog::payload_descriptor> {
    catalog::payload_descriptor d;
    d.path = "ct.dcm";
    d.modality = "CT";
    return {d};
}

}  // namespace

// =============================================================================
// Null Logger Tests
// =============================================================================

TEST_CASE("NullLogger discards everything", "[di][logger]") {
    auto logger = null_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(logger == null_logger());

    for (auto level : {log_level::trace, log_level::debug, log_level::info, log_level::warn,
                       log_level::error}) {
        REQUIRE_FALSE(logger->is_enabled(level));
    }

    logger->info("message");
    logger->error_fmt("code {}", 42);
}

// =============================================================================
// Formatted Logging Tests
// =============================================================================

TEST_CASE("ILogger formatted helpers", "[di][logger][fmt]") {
    MockLogger logger;

    SECTION("Arguments are formatted") {
        logger.info_fmt("Run {} sent {} of {}", "run-1", 5, 10);
        REQUIRE(logger.count(log_level::info) == 1);
        REQUIRE(logger.last_message() == "Run run-1 sent 5 of 10");
    }

    SECTION("Each level routes to its method") {
        logger.trace_fmt("t{}", 1);
        logger.debug_fmt("d{}", 2);
        logger.info_fmt("i{}", 3);
        logger.warn_fmt("w{}", 4);
        logger.error_fmt("e{}", 5);

        REQUIRE(logger.count(log_level::trace) == 1);
        REQUIRE(logger.count(log_level::debug) == 1);
        REQUIRE(logger.count(log_level::info) == 1);
        REQUIRE(logger.count(log_level::warn) == 1);
        REQUIRE(logger.count(log_level::error) == 1);
    }

    SECTION("Disabled levels are skipped") {
        logger.set_enabled_level(log_level::warn);
        logger.debug_fmt("hidden {}", 1);
        logger.info_fmt("hidden {}", 2);
        logger.warn_fmt("shown {}", 3);

        REQUIRE(logger.total_count() == 1);
        REQUIRE(logger.last_message() == "shown 3");
    }
}

// =============================================================================
// LoggerService Tests
// =============================================================================

TEST_CASE("LoggerService forwards to logger_adapter", "[di][logger][service]") {
    LoggerService service("[loadgen] ");

    integration::logger_adapter::set_min_level(log_level::warn);
    REQUIRE_FALSE(service.is_enabled(log_level::info));
    REQUIRE(service.is_enabled(log_level::error));

    // Uninitialized adapter drops messages without failing
    service.error("not written");
    service.warn_fmt("not written {}", 1);

    integration::logger_adapter::set_min_level(log_level::info);
}

// =============================================================================
// Injection Tests
// =============================================================================

TEST_CASE("load_driver logs through an injected ILogger", "[di][logger][driver]") {
    auto logger = std::make_shared<MockLogger>();
    auto client = std::make_shared<client::testing::fake_protocol_client>();
    auto pool = std::make_shared<integration::testing::mock_thread_pool>();
    pool->set_mode(integration::testing::mock_thread_pool::execution_mode::threaded);

    SECTION("Run lifecycle") {
        driver::load_driver driver(client, pool, logger);
        auto result = driver.execute(make_config(), make_payloads());
        REQUIRE(result.is_ok());

        REQUIRE(logger->contains(log_level::info, "started"));
        REQUIRE(logger->contains(log_level::info, "passed"));
        REQUIRE(logger->count(log_level::error) == 0);
    }

    SECTION("Threshold violations are warnings") {
        client->set_script(client::testing::fake_protocol_client::always(
            metrics::outcome_kind::protocol_rejected));
        driver::load_driver driver(client, pool, logger);

        auto result = driver.execute(make_config(), make_payloads());
        REQUIRE(result.is_ok());
        REQUIRE(logger->contains(log_level::warn, "errorRate"));
    }

    SECTION("Unreachable target is an error") {
        client->set_echo_result(false);
        driver::load_driver driver(client, pool, logger);

        auto result = driver.execute(make_config(), make_payloads());
        REQUIRE(result.is_err());
        REQUIRE(logger->contains(log_level::error, "C-ECHO"));
    }
}
