/**
 * @file ilogger_test.cpp
 * @brief Unit tests for ILogger interface and implementations
 */

#include <app_access/di/ilogger.hpp>
#include <app_access/security/access_manager.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <string>

using namespace app_access;
using namespace app_access::di;

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

    void trace(std::string_view message) override {
        trace_count_.fetch_add(1, std::memory_order_relaxed);
        last_message_ = std::string(message);
    }

    void debug(std::string_view message) override {
        debug_count_.fetch_add(1, std::memory_order_relaxed);
        last_message_ = std::string(message);
    }

    void info(std::string_view message) override {
        info_count_.fetch_add(1, std::memory_order_relaxed);
        last_message_ = std::string(message);
    }

    void warn(std::string_view message) override {
        warn_count_.fetch_add(1, std::memory_order_relaxed);
        last_message_ = std::string(message);
    }

    void error(std::string_view message) override {
        error_count_.fetch_add(1, std::memory_order_relaxed);
        last_message_ = std::string(message);
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return level >= enabled_level_;
    }

    [[nodiscard]] size_t debug_count() const noexcept {
        return debug_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] size_t info_count() const noexcept {
        return info_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] size_t warn_count() const noexcept {
        return warn_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t total_count() const noexcept {
        return trace_count_.load(std::memory_order_relaxed) + debug_count() + info_count() +
               warn_count() + error_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const std::string& last_message() const noexcept { return last_message_; }

    void set_enabled_level(integration::log_level level) noexcept { enabled_level_ = level; }

private:
    std::atomic<size_t> trace_count_{0};
    std::atomic<size_t> debug_count_{0};
    std::atomic<size_t> info_count_{0};
    std::atomic<size_t> warn_count_{0};
    std::atomic<size_t> error_count_{0};
    std::string last_message_;
    integration::log_level enabled_level_{integration::log_level::trace};
};

enum class screen { order_summary, settings };
enum class access_level { view, modify };

using manager = security::access_manager<std::string, std::string, screen, access_level>;

}  // namespace

// =============================================================================
// Implementations
// =============================================================================

TEST_CASE("NullLogger discards everything", "[di][ilogger]") {
    NullLogger logger;

    REQUIRE_FALSE(logger.is_enabled(integration::log_level::trace));
    REQUIRE_FALSE(logger.is_enabled(integration::log_level::error));

    logger.info("ignored");
    logger.info_fmt("ignored {}", 1);
}

TEST_CASE("null_logger returns a shared instance", "[di][ilogger]") {
    auto first = null_logger();
    auto second = null_logger();

    REQUIRE(first != nullptr);
    REQUIRE(first == second);
}

TEST_CASE("formatted helpers respect is_enabled", "[di][ilogger]") {
    MockLogger logger;

    SECTION("enabled level formats and forwards") {
        logger.info_fmt("Removed {} ({} dependent references)", "group 'Sales'", 4);

        REQUIRE(logger.info_count() == 1);
        REQUIRE(logger.last_message() == "Removed group 'Sales' (4 dependent references)");
    }

    SECTION("disabled level is skipped") {
        logger.set_enabled_level(integration::log_level::warn);
        logger.debug_fmt("Added {}", "user 'Mae'");

        REQUIRE(logger.total_count() == 0);
    }
}

TEST_CASE("LoggerService follows logger_adapter levels", "[di][ilogger]") {
    LoggerService service;

    integration::logger_adapter::set_min_level(integration::log_level::warn);
    REQUIRE_FALSE(service.is_enabled(integration::log_level::info));
    REQUIRE(service.is_enabled(integration::log_level::error));

    integration::logger_adapter::set_min_level(integration::log_level::info);
    REQUIRE(service.is_enabled(integration::log_level::info));
}

// =============================================================================
// Engine Integration
// =============================================================================

TEST_CASE("access_manager logs through the injected logger", "[di][ilogger][security]") {
    auto logger = std::make_shared<MockLogger>();
    access_manager_config config;
    config.name = "billing_acl";
    manager acl(config, logger);

    SECTION("additions are logged at debug") {
        REQUIRE(acl.add_user("Mae").is_ok());

        REQUIRE(logger->debug_count() == 1);
        REQUIRE(logger->last_message() == "[billing_acl] Added user 'Mae'");
    }

    SECTION("removals are logged at info") {
        REQUIRE(acl.add_group("Sales").is_ok());
        REQUIRE(acl.add_group_to_component_mapping("Sales", screen::settings, access_level::view)
                    .is_ok());
        REQUIRE(acl.remove_group("Sales").is_ok());

        REQUIRE(logger->info_count() == 1);
        REQUIRE(logger->last_message() ==
                "[billing_acl] Removed group 'Sales' (1 dependent references)");
    }

    SECTION("failed mutations are not logged as changes") {
        REQUIRE(acl.remove_user("Nobody").is_err());

        REQUIRE(logger->total_count() == 0);
    }

    SECTION("rejected cycles are logged at warn") {
        REQUIRE(acl.add_group("A").is_ok());
        REQUIRE(acl.add_group("B").is_ok());
        REQUIRE(acl.add_group_to_group_mapping("A", "B").is_ok());
        REQUIRE(acl.add_group_to_group_mapping("B", "A").is_err());

        REQUIRE(logger->warn_count() == 1);
    }

    SECTION("failed queries are logged at debug") {
        auto before = logger->debug_count();
        REQUIRE(acl.has_access_to_component("Nobody", screen::settings, access_level::view)
                    .is_err());

        REQUIRE(logger->debug_count() == before + 1);
    }
}
