/**
 * @file policy_database.cpp
 * @brief Implementation of the shared policy database connection
 */

#include <rbac/storage/policy_database.hpp>

#include <rbac/compat/format.hpp>

#include <sqlite3.h>
#include <variant> // for std::monostate

namespace rbac::storage {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {
constexpr const char* kModule = "storage";
}  // namespace

// ============================================================================
// Transaction
// ============================================================================

class policy_database::sqlite_transaction final
    : public security::policy_transaction {
public:
    sqlite_transaction(policy_database& db, lock_type lock)
        : db_(db), lock_(std::move(lock)) {}

    ~sqlite_transaction() override {
        if (active_) {
            (void)rollback();
        }
    }

    [[nodiscard]] bool is_active() const noexcept override { return active_; }

protected:
    auto do_commit() -> VoidResult override {
        if (!active_) {
            return make_error<std::monostate>(
                error_codes::transaction_not_active,
                "Transaction already finished", kModule);
        }
        auto result = db_.execute("COMMIT;");
        if (result.is_err()) {
            return make_error<std::monostate>(
                error_codes::database_transaction_error,
                compat::format("Commit failed: {}", result.error().message),
                kModule);
        }
        finish();
        return ok();
    }

    auto do_rollback() -> VoidResult override {
        if (!active_) {
            return make_error<std::monostate>(
                error_codes::transaction_not_active,
                "Transaction already finished", kModule);
        }
        auto result = db_.execute("ROLLBACK;");
        finish();
        if (result.is_err()) {
            return make_error<std::monostate>(
                error_codes::database_transaction_error,
                compat::format("Rollback failed: {}", result.error().message),
                kModule);
        }
        return ok();
    }

private:
    void finish() {
        active_ = false;
        if (lock_.owns_lock()) {
            lock_.unlock();
        }
    }

    policy_database& db_;
    lock_type lock_;
    bool active_{true};
};

// ============================================================================
// Construction / Destruction
// ============================================================================

auto policy_database::open(std::string_view db_path,
                           const database_config& config)
    -> Result<std::shared_ptr<policy_database>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return make_error<std::shared_ptr<policy_database>>(
            error_codes::database_open_error,
            compat::format("Failed to open database: {}", error_msg), kModule);
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    // Configure WAL mode for better concurrency (except for in-memory DB)
    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::shared_ptr<policy_database>>(
                error_codes::database_open_error, "Failed to enable WAL mode",
                kModule);
        }
    }

    rc = sqlite3_exec(db, "PRAGMA synchronous = NORMAL;", nullptr, nullptr,
                      nullptr);
    if (rc != SQLITE_OK) {
        // Not critical, continue
    }

    auto instance = std::shared_ptr<policy_database>(
        new policy_database(db, std::string(db_path)));

    auto migration_result = instance->migration_runner_.run_migrations(db);
    if (migration_result.is_err()) {
        return make_error<std::shared_ptr<policy_database>>(
            migration_result.error().code,
            compat::format("Migration failed: {}",
                           migration_result.error().message),
            kModule);
    }

    return instance;
}

policy_database::policy_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

policy_database::~policy_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Operations
// ============================================================================

auto policy_database::begin()
    -> Result<std::unique_ptr<security::policy_transaction>> {
    auto guard = lock();

    auto result = execute("BEGIN IMMEDIATE;");
    if (result.is_err()) {
        return make_error<std::unique_ptr<security::policy_transaction>>(
            error_codes::database_transaction_error,
            compat::format("Failed to begin transaction: {}",
                           result.error().message),
            kModule);
    }

    return std::unique_ptr<security::policy_transaction>(
        new sqlite_transaction(*this, std::move(guard)));
}

auto policy_database::lock() const -> lock_type {
    return lock_type(mutex_);
}

auto policy_database::execute(std::string_view sql) -> VoidResult {
    auto guard = lock();

    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, std::string(sql).c_str(), nullptr, nullptr,
                           &errmsg);
    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);
        return make_error<std::monostate>(
            error_codes::database_query_error,
            compat::format("SQL execution failed: {}", error_str), kModule);
    }
    return ok();
}

auto policy_database::schema_version() const -> int {
    auto guard = lock();
    return migration_runner_.get_current_version(db_);
}

auto policy_database::in_transaction() const noexcept -> bool {
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

}  // namespace rbac::storage
