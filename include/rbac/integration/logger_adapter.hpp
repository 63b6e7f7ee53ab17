/**
 * @file logger_adapter.hpp
 * @brief Adapter for policy engine logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the policy engine. It supports standard logging and an append-only
 * audit trail of policy and role changes.
 */

#pragma once

#include <rbac/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace rbac::integration {

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
 * @brief Parse a level name ("trace" .. "off"); unknown names map to info
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> log_level;

/**
 * @enum policy_event_type
 * @brief Policy changes recorded in the audit trail
 */
enum class policy_event_type {
    policy_added,
    policy_removed,
    grouping_added,
    grouping_removed,
    role_created,
    role_removed,
    transaction_rolled_back
};

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
    bool enable_file{false};

    /// Enable the policy audit trail (audit.json)
    bool enable_audit_log{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/rbac";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Loaded {} rules", count);
 * logger_adapter::log_policy_event(policy_event_type::role_created,
 *                                  "role:default/dev");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Later calls are ignored until shutdown().
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release resources
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, rbac::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, rbac::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, rbac::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, rbac::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, rbac::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, rbac::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Policy Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a policy change
     *
     * Written to the log at info level and, when enabled, appended to the
     * audit trail as one JSON object per line.
     *
     * @param type Kind of change
     * @param subject Rule or role the change applies to
     * @param fields Additional key/value context
     */
    static void log_policy_event(policy_event_type type,
                                 const std::string& subject,
                                 const std::map<std::string, std::string>& fields = {});

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    [[nodiscard]] static auto policy_event_to_string(policy_event_type type)
        -> std::string;

    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace rbac::integration
