/**
 * @file migration_runner.hpp
 * @brief Database schema migration runner for the policy store
 *
 * Tracks the schema version of the policy database and applies versioned
 * migrations in order, each inside its own transaction.
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace rbac::storage {

/// Result type alias for void operations
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Function type for migration implementations
 *
 * @param db The SQLite database handle
 * @return VoidResult Success or error information
 */
using migration_function = std::function<VoidResult(sqlite3* db)>;

/// One row of the schema_version table
struct schema_revision {
    int version{0};
    std::string description;
    std::string applied_at;  ///< SQLite datetime('now') at apply time
};

/**
 * @brief Manages policy database schema migrations
 *
 * Schema history:
 * - v1: casbin_rule table holding "p" and "g" rules
 * - v2: role_metadata table
 *
 * Thread Safety: This class is NOT thread-safe. External synchronization
 * is required for concurrent access to the same database.
 *
 * @example
 * @code
 * migration_runner runner;
 * if (runner.needs_migration(db)) {
 *     auto result = runner.run_migrations(db);
 * }
 * @endcode
 */
class migration_runner {
public:
    migration_runner();
    ~migration_runner() = default;

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;
    migration_runner(migration_runner&&) = delete;
    auto operator=(migration_runner&&) -> migration_runner& = delete;

    /**
     * @brief Run all pending migrations
     *
     * @note If any migration fails, the database is rolled back to its
     *       state before that migration started.
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Run migrations up to a specific version
     */
    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version)
        -> VoidResult;

    /**
     * @brief Get the current schema version (0 if none applied)
     */
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    /**
     * @brief Applied migrations in version order
     */
    [[nodiscard]] auto get_history(sqlite3* db) const
        -> std::vector<schema_revision>;

private:
    [[nodiscard]] auto ensure_schema_version_table(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto apply_migration(sqlite3* db, int version) -> VoidResult;
    [[nodiscard]] auto record_migration(sqlite3* db, int version,
                                        std::string_view description)
        -> VoidResult;
    [[nodiscard]] auto execute_sql(sqlite3* db, std::string_view sql)
        -> VoidResult;

    [[nodiscard]] auto migrate_v1(sqlite3* db) -> VoidResult;
    [[nodiscard]] auto migrate_v2(sqlite3* db) -> VoidResult;

    /// Latest schema version (increment when adding migrations)
    static constexpr int LATEST_VERSION = 2;

    struct migration_entry {
        int version;
        std::string description;
        migration_function apply;
    };

    std::vector<migration_entry> migrations_;
};

}  // namespace rbac::storage
