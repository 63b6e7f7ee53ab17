/**
 * @file engine_config.hpp
 * @brief Policy engine configuration loaded from JSON and the environment
 *
 * Example file:
 * @code
 * {
 *   "database": { "path": "/var/lib/rbac/policy.db", "wal_mode": true },
 *   "rbac": { "admin_role": "role:default/rbac_admin", "max_hierarchy_depth": 10 },
 *   "logging": { "directory": "/var/log/rbac", "level": "info", "file": true }
 * }
 * @endcode
 *
 * Environment variables (prefix RBAC_ by default) override file values:
 * DATABASE_PATH, ADMIN_ROLE, MAX_HIERARCHY_DEPTH, LOG_LEVEL, LOG_DIRECTORY.
 */

#pragma once

#include <rbac/core/result.hpp>
#include <rbac/integration/logger_adapter.hpp>
#include <rbac/storage/policy_database.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace rbac::config {

/**
 * @brief Settings for policy_engine::open()
 */
struct engine_config {
    /// SQLite file, or ":memory:"
    std::string database_path{"rbac.db"};

    storage::database_config database;

    /// Role whose metadata is never deleted
    std::string admin_role{"role:default/rbac_admin"};

    /// Maximum role inheritance depth resolved by the role graph
    std::size_t max_hierarchy_depth{10};

    integration::logger_config logging;

    /**
     * @brief Parse a JSON document; missing keys keep their defaults
     */
    [[nodiscard]] static auto from_json(std::string_view text)
        -> Result<engine_config>;

    [[nodiscard]] static auto load_from_file(const std::filesystem::path& path)
        -> Result<engine_config>;

    /**
     * @brief Override fields from <prefix>* environment variables
     */
    [[nodiscard]] auto apply_environment(std::string_view prefix = "RBAC_")
        -> VoidResult;

    [[nodiscard]] auto validate() const -> VoidResult;
};

}  // namespace rbac::config
