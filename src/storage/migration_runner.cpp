/**
 * @file migration_runner.cpp
 * @brief Implementation of the policy database migration runner
 */

#include <rbac/storage/migration_runner.hpp>

#include <rbac/compat/format.hpp>
#include <rbac/core/result.hpp>

#include <sqlite3.h>
#include <variant> // for std::monostate

namespace rbac::storage {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {
constexpr const char* kModule = "migration_runner";
}  // namespace

// ============================================================================
// Construction
// ============================================================================

migration_runner::migration_runner() {
    migrations_.push_back({1, "Create casbin_rule table",
                           [this](sqlite3* db) { return migrate_v1(db); }});
    migrations_.push_back({2, "Create role_metadata table",
                           [this](sqlite3* db) { return migrate_v2(db); }});
}

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_runner::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, LATEST_VERSION);
}

auto migration_runner::run_migrations_to(sqlite3* db, int target_version)
    -> VoidResult {
    if (target_version > LATEST_VERSION) {
        return make_error<std::monostate>(
            error_codes::database_migration_error,
            compat::format("Target version {} exceeds latest version {}",
                           target_version, LATEST_VERSION),
            kModule);
    }

    auto ensure_result = ensure_schema_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto current_version = get_current_version(db);

    while (current_version < target_version) {
        auto next_version = current_version + 1;

        auto begin_result = execute_sql(db, "BEGIN TRANSACTION;");
        if (begin_result.is_err()) {
            return begin_result;
        }

        auto migration_result = apply_migration(db, next_version);
        if (migration_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return migration_result;
        }

        auto commit_result = execute_sql(db, "COMMIT;");
        if (commit_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return commit_result;
        }

        current_version = next_version;
    }

    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto migration_runner::get_current_version(sqlite3* db) const -> int {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return 0;
    }

    const char* version_sql = "SELECT MAX(version) FROM schema_version;";
    rc = sqlite3_prepare_v2(db, version_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        // sqlite3_column_int returns 0 for NULL
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return version;
}

auto migration_runner::get_latest_version() const noexcept -> int {
    return LATEST_VERSION;
}

auto migration_runner::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < LATEST_VERSION;
}

auto migration_runner::get_history(sqlite3* db) const
    -> std::vector<schema_revision> {
    std::vector<schema_revision> history;

    const char* sql =
        "SELECT version, description, applied_at FROM schema_version ORDER BY version;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return history;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        schema_revision record;
        record.version = sqlite3_column_int(stmt, 0);

        const auto* desc = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.description = desc ? desc : "";

        const auto* applied = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        record.applied_at = applied ? applied : "";

        history.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_runner::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )";

    return execute_sql(db, sql);
}

auto migration_runner::apply_migration(sqlite3* db, int version) -> VoidResult {
    for (const auto& entry : migrations_) {
        if (entry.version != version) {
            continue;
        }
        auto result = entry.apply(db);
        if (result.is_err()) {
            return result;
        }
        return record_migration(db, version, entry.description);
    }

    return make_error<std::monostate>(
        error_codes::database_migration_error,
        compat::format("Migration for version {} not found", version),
        kModule);
}

auto migration_runner::record_migration(sqlite3* db, int version,
                                        std::string_view description)
    -> VoidResult {
    const char* sql =
        "INSERT INTO schema_version (version, description) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return make_error<std::monostate>(
            error_codes::database_migration_error,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)),
            kModule);
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::monostate>(
            error_codes::database_migration_error,
            compat::format("Failed to record migration: {}", sqlite3_errmsg(db)),
            kModule);
    }

    return ok();
}

auto migration_runner::execute_sql(sqlite3* db, std::string_view sql)
    -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db, std::string(sql).c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);

        return make_error<std::monostate>(
            error_codes::database_migration_error,
            compat::format("SQL execution failed: {}", error_str), kModule);
    }

    return ok();
}

// ============================================================================
// Migration Implementations
// ============================================================================

auto migration_runner::migrate_v1(sqlite3* db) -> VoidResult {
    // Unused trailing fields are stored as '' so the unique index covers
    // the full rule
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS casbin_rule (
            id      INTEGER PRIMARY KEY AUTOINCREMENT,
            ptype   TEXT NOT NULL,
            v0      TEXT NOT NULL DEFAULT '',
            v1      TEXT NOT NULL DEFAULT '',
            v2      TEXT NOT NULL DEFAULT '',
            v3      TEXT NOT NULL DEFAULT '',
            v4      TEXT NOT NULL DEFAULT '',
            v5      TEXT NOT NULL DEFAULT ''
        );

        CREATE UNIQUE INDEX IF NOT EXISTS idx_casbin_rule_unique
            ON casbin_rule(ptype, v0, v1, v2, v3, v4, v5);
        CREATE INDEX IF NOT EXISTS idx_casbin_rule_v1
            ON casbin_rule(ptype, v1, v2);
    )";

    return execute_sql(db, sql);
}

auto migration_runner::migrate_v2(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS role_metadata (
            id              INTEGER PRIMARY KEY AUTOINCREMENT,
            role_entity_ref TEXT NOT NULL UNIQUE,
            source          TEXT NOT NULL,
            modified_by     TEXT NOT NULL DEFAULT '',
            author          TEXT,
            description     TEXT,
            owner           TEXT,
            created_at      TEXT,
            last_modified   TEXT
        );
    )";

    return execute_sql(db, sql);
}

}  // namespace rbac::storage
