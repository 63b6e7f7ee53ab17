/**
 * @file sqlite_policy_adapter.hpp
 * @brief SQLite implementation of the policy adapter
 *
 * Rules are stored one per row in casbin_rule as (ptype, v0..v5). Unused
 * trailing fields hold '' and are stripped again on load.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "policy_database.hpp"

#include <rbac/security/policy_adapter.hpp>

#include <memory>
#include <string>
#include <vector>

namespace rbac::storage {

/**
 * @brief Policy adapter backed by the shared policy database
 *
 * Writes issued while a transaction from the same database is open become
 * part of that transaction.
 */
class sqlite_policy_adapter : public security::policy_adapter {
public:
  explicit sqlite_policy_adapter(std::shared_ptr<policy_database> db);
  ~sqlite_policy_adapter() override = default;

  [[nodiscard]] auto load_policy(security::policy_model &model)
      -> VoidResult override;

  [[nodiscard]] auto
  load_filtered_policy(security::policy_model &model,
                       const std::vector<security::policy_filter> &filters)
      -> VoidResult override;

  [[nodiscard]] auto add_policy(security::policy_section section,
                                std::string_view ptype,
                                const security::policy_tuple &rule)
      -> VoidResult override;

  [[nodiscard]] auto remove_policy(security::policy_section section,
                                   std::string_view ptype,
                                   const security::policy_tuple &rule)
      -> VoidResult override;

  [[nodiscard]] bool is_filtered() const noexcept override { return filtered_; }

  /**
   * @brief Number of stored rows of a rule type
   */
  [[nodiscard]] auto count(std::string_view ptype) const -> Result<std::size_t>;

private:
  [[nodiscard]] auto load_rows(security::policy_model &model,
                               const std::string &sql,
                               const std::vector<std::string> &params) const
      -> VoidResult;

  [[nodiscard]] auto execute_rule_statement(const char *sql,
                                            std::string_view ptype,
                                            const security::policy_tuple &rule)
      -> VoidResult;

  std::shared_ptr<policy_database> db_;
  bool filtered_{false};
};

} // namespace rbac::storage
