/**
 * @file ilogger_test.cpp
 * @brief Unit tests for ILogger interface and implementations
 */

#include <rbac/di/ilogger.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <string>

using namespace rbac::di;
using rbac::integration::log_level;

// =============================================================================
// Mock Logger for Testing
// =============================================================================

namespace {

/**
 * @brief Counts log calls at or above a threshold level
 */
class MockLogger final : public ILogger {
public:
    void write(log_level level, std::string_view message) override {
        count_.fetch_add(1, std::memory_order_relaxed);
        last_level_ = level;
        last_message_ = std::string(message);
    }

    [[nodiscard]] bool is_enabled(log_level level) const noexcept override {
        return level >= enabled_level_;
    }

    [[nodiscard]] size_t count() const noexcept {
        return count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const std::string& last_message() const noexcept {
        return last_message_;
    }

    [[nodiscard]] log_level last_level() const noexcept { return last_level_; }

    void set_enabled_level(log_level level) noexcept { enabled_level_ = level; }

private:
    std::atomic<size_t> count_{0};
    std::string last_message_;
    log_level last_level_ = log_level::off;
    log_level enabled_level_ = log_level::trace;
};

}  // namespace

// =============================================================================
// NullLogger Tests
// =============================================================================

TEST_CASE("NullLogger is a no-op implementation", "[di][logger][null]") {
    NullLogger logger;

    SECTION("is_enabled always returns false") {
        CHECK_FALSE(logger.is_enabled(log_level::trace));
        CHECK_FALSE(logger.is_enabled(log_level::error));
    }

    SECTION("formatted logging methods are safe") {
        logger.debug_fmt("value: {}", 42);
        logger.warn_fmt("values: {} {}", 1, 2);
        logger.error_fmt("error: {}", "failure");
    }
}

TEST_CASE("null_logger() returns a shared instance", "[di][logger][null]") {
    auto first = null_logger();
    auto second = null_logger();
    REQUIRE(first != nullptr);
    CHECK(first.get() == second.get());
    CHECK_FALSE(first->is_enabled(log_level::info));
}

// =============================================================================
// Formatted Logging Tests
// =============================================================================

TEST_CASE("ILogger formats only enabled levels", "[di][logger][format]") {
    MockLogger logger;

    SECTION("enabled level formats the message") {
        logger.info_fmt("Role {} created with {} members", "role:default/dev", 3);
        CHECK(logger.count() == 1);
        CHECK(logger.last_message() == "Role role:default/dev created with 3 members");
        CHECK(logger.last_level() == log_level::info);
    }

    SECTION("disabled level is skipped") {
        logger.set_enabled_level(log_level::warn);
        logger.debug_fmt("Adding {} policies", 2);
        logger.info_fmt("Role {} removed", "role:default/dev");
        CHECK(logger.count() == 0);

        logger.warn_fmt("{} failed", "add_policy");
        CHECK(logger.count() == 1);
        CHECK(logger.last_message() == "add_policy failed");
        CHECK(logger.last_level() == log_level::warn);
    }
}

// =============================================================================
// LoggerService Tests
// =============================================================================

TEST_CASE("LoggerService forwards to logger_adapter", "[di][logger][service]") {
    auto temp_dir = std::filesystem::temp_directory_path() / "rbac_ilogger_test";

    rbac::integration::logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.min_level = log_level::info;
    rbac::integration::logger_adapter::initialize(config);

    LoggerService service;
    CHECK(service.is_enabled(log_level::warn));
    CHECK_FALSE(service.is_enabled(log_level::debug));
    service.info_fmt("Loaded {} rules", 5);

    rbac::integration::logger_adapter::shutdown();
    CHECK_FALSE(service.is_enabled(log_level::error));

    std::filesystem::remove_all(temp_dir);
}
