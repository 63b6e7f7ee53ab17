/**
 * @file policy_database.hpp
 * @brief SQLite connection shared by the rule store and the metadata store
 *
 * One connection backs both stores so that a single SQL transaction spans
 * rule and metadata writes. Access is serialized with a recursive mutex; a
 * transaction keeps the mutex for its whole lifetime.
 */

#pragma once

#include "migration_runner.hpp"

#include <rbac/core/result.hpp>
#include <rbac/security/transaction.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// Forward declaration of SQLite handle
struct sqlite3;

namespace rbac::storage {

/**
 * @brief Connection options
 */
struct database_config {
    /// Enable WAL mode (ignored for ":memory:")
    bool wal_mode = true;

    /// Milliseconds to wait on a locked database before failing
    int busy_timeout_ms = 5000;
};

/**
 * @brief Owner of the SQLite connection and its transactions
 *
 * @code
 * auto db = policy_database::open(":memory:");
 * if (db.is_ok()) {
 *     auto tx = db.value()->begin();
 * }
 * @endcode
 */
class policy_database : public security::transaction_provider {
public:
    using lock_type = std::unique_lock<std::recursive_mutex>;

    /**
     * @brief Open or create a database and bring its schema up to date
     *
     * @param db_path File path, or ":memory:" for an in-memory database
     * @param config Connection options
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const database_config& config = {})
        -> Result<std::shared_ptr<policy_database>>;

    ~policy_database() override;

    /**
     * @brief Begin an immediate write transaction
     *
     * The returned transaction rolls back when destroyed while active.
     */
    [[nodiscard]] auto begin()
        -> Result<std::unique_ptr<security::policy_transaction>> override;

    /**
     * @brief Lock the connection for a sequence of statements
     */
    [[nodiscard]] auto lock() const -> lock_type;

    /**
     * @brief Execute one or more statements without result rows
     */
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

    [[nodiscard]] auto native_handle() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto path() const noexcept -> const std::string& {
        return path_;
    }

    [[nodiscard]] auto schema_version() const -> int;

    /**
     * @brief True while a transaction from begin() is open
     */
    [[nodiscard]] auto in_transaction() const noexcept -> bool;

private:
    class sqlite_transaction;

    policy_database(sqlite3* db, std::string path);

    sqlite3* db_{nullptr};
    std::string path_;
    migration_runner migration_runner_;
    mutable std::recursive_mutex mutex_;
};

}  // namespace rbac::storage
