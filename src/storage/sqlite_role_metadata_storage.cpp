/**
 * @file sqlite_role_metadata_storage.cpp
 * @brief Implementation of SQLite role metadata storage
 *
 * @copyright Copyright (c) 2025
 */

#include <rbac/storage/sqlite_role_metadata_storage.hpp>

#include <rbac/compat/format.hpp>
#include <rbac/security/entity_ref.hpp>

#include <sqlite3.h>
#include <variant> // for std::monostate

namespace rbac::storage {

using namespace security;
using kcenon::common::make_error;
using kcenon::common::ok;

namespace {
constexpr const char *kModule = "sqlite_role_metadata_storage";

constexpr const char *kSelectColumns =
    "SELECT role_entity_ref, source, modified_by, author, description, "
    "owner, created_at, last_modified FROM role_metadata";

auto get_text(sqlite3_stmt *stmt, int col) -> std::string {
  const auto *text =
      reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
  return text ? std::string(text) : std::string{};
}

auto get_optional_text(sqlite3_stmt *stmt, int col)
    -> std::optional<std::string> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return get_text(stmt, col);
}

void bind_optional_text(sqlite3_stmt *stmt, int idx,
                        const std::optional<std::string> &value) {
  if (value) {
    sqlite3_bind_text(stmt, idx, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

auto parse_row(sqlite3_stmt *stmt) -> role_metadata {
  role_metadata record;
  record.role_entity_ref = get_text(stmt, 0);
  record.source = parse_role_source(get_text(stmt, 1)).value_or(role_source::legacy);
  record.modified_by = get_text(stmt, 2);
  record.author = get_optional_text(stmt, 3);
  record.description = get_optional_text(stmt, 4);
  record.owner = get_optional_text(stmt, 5);
  record.created_at = get_optional_text(stmt, 6);
  record.last_modified = get_optional_text(stmt, 7);
  return record;
}

/**
 * @brief Bind every column after role_entity_ref starting at idx
 */
void bind_record_fields(sqlite3_stmt *stmt, int idx,
                        const role_metadata &record) {
  auto source = std::string(to_string(record.source));
  sqlite3_bind_text(stmt, idx++, source.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, idx++, record.modified_by.c_str(), -1,
                    SQLITE_TRANSIENT);
  bind_optional_text(stmt, idx++, record.author);
  bind_optional_text(stmt, idx++, record.description);
  bind_optional_text(stmt, idx++, record.owner);
  bind_optional_text(stmt, idx++, record.created_at);
  bind_optional_text(stmt, idx++, record.last_modified);
}

auto require_active(const policy_transaction &tx) -> VoidResult {
  if (!tx.is_active()) {
    return make_error<std::monostate>(error_codes::transaction_not_active,
                                      "Transaction is no longer active",
                                      kModule);
  }
  return ok();
}

auto query_error(sqlite3 *db, std::string_view what) -> VoidResult {
  return make_error<std::monostate>(
      error_codes::database_query_error,
      compat::format("{}: {}", what, sqlite3_errmsg(db)), kModule);
}
} // namespace

sqlite_role_metadata_storage::sqlite_role_metadata_storage(
    std::shared_ptr<policy_database> db)
    : db_(std::move(db)) {}

auto sqlite_role_metadata_storage::find_role_metadata(std::string_view role_ref,
                                                      policy_transaction &tx)
    -> Result<std::optional<role_metadata>> {
  auto active = require_active(tx);
  if (active.is_err()) {
    return Result<std::optional<role_metadata>>(active.error());
  }
  return find_locked(role_ref);
}

auto sqlite_role_metadata_storage::create_role_metadata(
    const role_metadata &record, policy_transaction &tx) -> VoidResult {
  auto active = require_active(tx);
  if (active.is_err()) {
    return active;
  }
  if (!parse_entity_ref(record.role_entity_ref)) {
    return make_error<std::monostate>(
        error_codes::invalid_entity_ref,
        compat::format("'{}' is not a valid entity reference",
                       record.role_entity_ref),
        kModule);
  }

  auto guard = db_->lock();
  auto *db = db_->native_handle();

  const char *sql = R"(
        INSERT INTO role_metadata (
            role_entity_ref, source, modified_by, author, description,
            owner, created_at, last_modified
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )";

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return query_error(db, "Failed to prepare statement");
  }

  sqlite3_bind_text(stmt, 1, record.role_entity_ref.c_str(), -1,
                    SQLITE_TRANSIENT);
  bind_record_fields(stmt, 2, record);

  auto rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  if (rc == SQLITE_CONSTRAINT) {
    return make_error<std::monostate>(
        error_codes::role_metadata_exists,
        compat::format("Role metadata {} already exists",
                       record.role_entity_ref),
        kModule);
  }
  if (rc != SQLITE_DONE) {
    return query_error(db, "Failed to insert role metadata");
  }
  return ok();
}

auto sqlite_role_metadata_storage::update_role_metadata(
    const role_metadata &record, std::string_view role_ref,
    policy_transaction &tx) -> VoidResult {
  auto active = require_active(tx);
  if (active.is_err()) {
    return active;
  }

  auto guard = db_->lock();
  auto *db = db_->native_handle();

  const char *sql = R"(
        UPDATE role_metadata SET
            role_entity_ref = ?,
            source = ?,
            modified_by = ?,
            author = ?,
            description = ?,
            owner = ?,
            created_at = ?,
            last_modified = ?
        WHERE role_entity_ref = ?;
    )";

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return query_error(db, "Failed to prepare statement");
  }

  sqlite3_bind_text(stmt, 1, record.role_entity_ref.c_str(), -1,
                    SQLITE_TRANSIENT);
  bind_record_fields(stmt, 2, record);
  sqlite3_bind_text(stmt, 9, role_ref.data(), static_cast<int>(role_ref.size()),
                    SQLITE_TRANSIENT);

  auto rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  if (rc == SQLITE_CONSTRAINT) {
    return make_error<std::monostate>(
        error_codes::role_metadata_exists,
        compat::format("Role metadata {} already exists",
                       record.role_entity_ref),
        kModule);
  }
  if (rc != SQLITE_DONE) {
    return query_error(db, "Failed to update role metadata");
  }
  if (sqlite3_changes(db) == 0) {
    return make_error<std::monostate>(
        error_codes::role_metadata_not_found,
        compat::format("Role metadata {} was not found", role_ref), kModule);
  }
  return ok();
}

auto sqlite_role_metadata_storage::remove_role_metadata(
    std::string_view role_ref, policy_transaction &tx) -> VoidResult {
  auto active = require_active(tx);
  if (active.is_err()) {
    return active;
  }

  auto guard = db_->lock();
  auto *db = db_->native_handle();

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db,
                         "DELETE FROM role_metadata WHERE role_entity_ref = ?;",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return query_error(db, "Failed to prepare statement");
  }
  sqlite3_bind_text(stmt, 1, role_ref.data(), static_cast<int>(role_ref.size()),
                    SQLITE_TRANSIENT);

  auto rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  if (rc != SQLITE_DONE) {
    return query_error(db, "Failed to delete role metadata");
  }
  return ok();
}

auto sqlite_role_metadata_storage::list_role_metadata()
    -> Result<std::vector<role_metadata>> {
  auto guard = db_->lock();
  auto *db = db_->native_handle();

  auto sql = compat::format("{} ORDER BY role_entity_ref;", kSelectColumns);

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return Result<std::vector<role_metadata>>(
        query_error(db, "Failed to prepare statement").error());
  }

  std::vector<role_metadata> records;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    records.push_back(parse_row(stmt));
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_DONE) {
    return Result<std::vector<role_metadata>>(
        query_error(db, "Failed to list role metadata").error());
  }
  return records;
}

auto sqlite_role_metadata_storage::find_locked(std::string_view role_ref)
    -> Result<std::optional<role_metadata>> {
  auto guard = db_->lock();
  auto *db = db_->native_handle();

  auto sql = compat::format("{} WHERE role_entity_ref = ?;", kSelectColumns);

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return Result<std::optional<role_metadata>>(
        query_error(db, "Failed to prepare statement").error());
  }
  sqlite3_bind_text(stmt, 1, role_ref.data(), static_cast<int>(role_ref.size()),
                    SQLITE_TRANSIENT);

  std::optional<role_metadata> found;
  auto rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    found = parse_row(stmt);
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return Result<std::optional<role_metadata>>(
        query_error(db, "Failed to read role metadata").error());
  }
  return found;
}

} // namespace rbac::storage
