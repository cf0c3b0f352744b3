/**
 * @file logger_adapter.hpp
 * @brief Adapter for access engine logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the authorization engine. It supports standard logging and an audit
 * trail of authorization decisions and model changes.
 */

#pragma once

#include <app_access/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace app_access::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @enum model_change_type
 * @brief Kinds of changes to the authorization model recorded in the audit trail
 */
enum class model_change_type {
    element_added,
    element_removed,
    mapping_added,
    mapping_removed
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the JSON lines audit trail (audit.json)
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Provides:
 * - Standard application logging (trace through fatal)
 * - An audit trail of access decisions and authorization model changes
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/myapp";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Loaded {} groups", count);
 * logger_adapter::log_access_decision("has_access_to_component",
 *                                     "alice", "Orders/View", true);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail. A second call
     * while initialized is ignored.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(app_access::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, app_access::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(app_access::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, app_access::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(app_access::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, app_access::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(app_access::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, app_access::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(app_access::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, app_access::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(app_access::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, app_access::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record the outcome of an authorization query
     *
     * Denials are logged at warn level, grants at debug level.
     *
     * @param query Name of the query operation
     * @param subject The user or group the query was made for
     * @param target The component/level or entity that was checked
     * @param granted Whether access was granted
     */
    static void log_access_decision(const std::string& query,
                                    const std::string& subject,
                                    const std::string& target,
                                    bool granted);

    /**
     * @brief Record a change to the authorization model
     * @param type Kind of change
     * @param description Human-readable description
     * @param cascaded Number of dependent edges/mappings removed with it
     */
    static void log_model_change(model_change_type type,
                                 const std::string& description,
                                 std::size_t cascaded = 0);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    [[nodiscard]] static auto model_change_to_string(model_change_type type) -> std::string;

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace app_access::integration
