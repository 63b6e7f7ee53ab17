/**
 * @file sqlite_policy_adapter.cpp
 * @brief Implementation of the SQLite policy adapter
 *
 * @copyright Copyright (c) 2025
 */

#include <rbac/storage/sqlite_policy_adapter.hpp>

#include <rbac/compat/format.hpp>

#include <sqlite3.h>
#include <variant> // for std::monostate

namespace rbac::storage {

using namespace security;
using kcenon::common::make_error;
using kcenon::common::ok;

namespace {
constexpr const char *kModule = "sqlite_policy_adapter";

constexpr const char *kSelectColumns =
    "SELECT ptype, v0, v1, v2, v3, v4, v5 FROM casbin_rule";

auto get_text(sqlite3_stmt *stmt, int col) -> std::string {
  const auto *text =
      reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
  return text ? std::string(text) : std::string{};
}

/**
 * @brief Rule types starting with 'g' are grouping rules
 */
auto section_of(std::string_view ptype) -> policy_section {
  return !ptype.empty() && ptype.front() == 'g' ? policy_section::grouping
                                                : policy_section::policy;
}

auto query_error(sqlite3 *db, std::string_view what) -> VoidResult {
  return make_error<std::monostate>(
      error_codes::database_query_error,
      compat::format("{}: {}", what, sqlite3_errmsg(db)), kModule);
}
} // namespace

sqlite_policy_adapter::sqlite_policy_adapter(
    std::shared_ptr<policy_database> db)
    : db_(std::move(db)) {}

auto sqlite_policy_adapter::load_policy(policy_model &model) -> VoidResult {
  auto result =
      load_rows(model, std::string(kSelectColumns) + " ORDER BY id;", {});
  if (result.is_ok()) {
    filtered_ = false;
  }
  return result;
}

auto sqlite_policy_adapter::load_filtered_policy(
    policy_model &model, const std::vector<policy_filter> &filters)
    -> VoidResult {
  auto valid = validate_filters(filters);
  if (valid.is_err()) {
    return valid;
  }

  filtered_ = true;
  if (filters.empty()) {
    return ok();
  }

  // (ptype = ? AND v1 = ? ...) OR (...)
  std::string where;
  std::vector<std::string> params;
  for (const auto &filter : filters) {
    if (!where.empty()) {
      where += " OR ";
    }
    where += "(ptype = ?";
    params.push_back(filter.ptype);
    for (const auto &[index, value] : filter.fields) {
      where += compat::format(" AND v{} = ?", index);
      params.push_back(value);
    }
    where += ")";
  }

  return load_rows(model,
                   compat::format("{} WHERE {} ORDER BY id;", kSelectColumns,
                                  where),
                   params);
}

auto sqlite_policy_adapter::add_policy(policy_section section,
                                       std::string_view ptype,
                                       const policy_tuple &rule) -> VoidResult {
  (void)section;
  return execute_rule_statement(
      "INSERT OR IGNORE INTO casbin_rule (ptype, v0, v1, v2, v3, v4, v5) "
      "VALUES (?, ?, ?, ?, ?, ?, ?);",
      ptype, rule);
}

auto sqlite_policy_adapter::remove_policy(policy_section section,
                                          std::string_view ptype,
                                          const policy_tuple &rule)
    -> VoidResult {
  (void)section;
  return execute_rule_statement(
      "DELETE FROM casbin_rule WHERE ptype = ? AND v0 = ? AND v1 = ? AND "
      "v2 = ? AND v3 = ? AND v4 = ? AND v5 = ?;",
      ptype, rule);
}

auto sqlite_policy_adapter::count(std::string_view ptype) const
    -> Result<std::size_t> {
  auto guard = db_->lock();
  auto *db = db_->native_handle();

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM casbin_rule WHERE ptype = ?;",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return make_error<std::size_t>(
        error_codes::database_query_error,
        compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db)),
        kModule);
  }
  sqlite3_bind_text(stmt, 1, ptype.data(), static_cast<int>(ptype.size()),
                    SQLITE_TRANSIENT);

  std::size_t rows = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    rows = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return rows;
}

auto sqlite_policy_adapter::load_rows(policy_model &model,
                                      const std::string &sql,
                                      const std::vector<std::string> &params)
    const -> VoidResult {
  auto guard = db_->lock();
  auto *db = db_->native_handle();

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return query_error(db, "Failed to prepare statement");
  }

  int idx = 1;
  for (const auto &param : params) {
    sqlite3_bind_text(stmt, idx++, param.c_str(), -1, SQLITE_TRANSIENT);
  }

  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    auto ptype = get_text(stmt, 0);

    policy_tuple rule;
    rule.reserve(max_policy_fields);
    for (int col = 1; col <= static_cast<int>(max_policy_fields); ++col) {
      rule.push_back(get_text(stmt, col));
    }
    while (!rule.empty() && rule.back().empty()) {
      rule.pop_back();
    }

    model.add_policy(section_of(ptype), ptype, std::move(rule));
  }

  if (rc != SQLITE_DONE) {
    auto error = query_error(db, "Failed to read rules");
    sqlite3_finalize(stmt);
    return error;
  }

  sqlite3_finalize(stmt);
  return ok();
}

auto sqlite_policy_adapter::execute_rule_statement(const char *sql,
                                                   std::string_view ptype,
                                                   const policy_tuple &rule)
    -> VoidResult {
  if (rule.empty() || rule.size() > max_policy_fields) {
    return make_error<std::monostate>(
        error_codes::invalid_policy_tuple,
        compat::format("Rule [{}] must have 1 to {} fields", to_string(rule),
                       max_policy_fields),
        kModule);
  }

  auto guard = db_->lock();
  auto *db = db_->native_handle();

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return query_error(db, "Failed to prepare statement");
  }

  int idx = 1;
  sqlite3_bind_text(stmt, idx++, ptype.data(), static_cast<int>(ptype.size()),
                    SQLITE_TRANSIENT);
  for (std::size_t i = 0; i < max_policy_fields; ++i) {
    const auto &value = i < rule.size() ? rule[i] : std::string{};
    sqlite3_bind_text(stmt, idx++, value.c_str(), -1, SQLITE_TRANSIENT);
  }

  auto rc = sqlite3_step(stmt);
  if (rc != SQLITE_DONE) {
    auto error = query_error(db, "Failed to write rule");
    sqlite3_finalize(stmt);
    return error;
  }

  sqlite3_finalize(stmt);
  return ok();
}

} // namespace rbac::storage
