/**
 * @file sqlite_role_metadata_storage.hpp
 * @brief SQLite implementation of role metadata storage
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "policy_database.hpp"

#include <rbac/security/role_metadata_storage.hpp>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace rbac::storage {

/**
 * @brief Role metadata table on the shared policy database
 *
 * Mutations require an active transaction from the same database.
 */
class sqlite_role_metadata_storage : public security::role_metadata_storage {
public:
  explicit sqlite_role_metadata_storage(std::shared_ptr<policy_database> db);
  ~sqlite_role_metadata_storage() override = default;

  [[nodiscard]] auto find_role_metadata(std::string_view role_ref,
                                        security::policy_transaction &tx)
      -> Result<std::optional<security::role_metadata>> override;

  [[nodiscard]] auto create_role_metadata(const security::role_metadata &record,
                                          security::policy_transaction &tx)
      -> VoidResult override;

  [[nodiscard]] auto update_role_metadata(const security::role_metadata &record,
                                          std::string_view role_ref,
                                          security::policy_transaction &tx)
      -> VoidResult override;

  [[nodiscard]] auto remove_role_metadata(std::string_view role_ref,
                                          security::policy_transaction &tx)
      -> VoidResult override;

  [[nodiscard]] auto list_role_metadata()
      -> Result<std::vector<security::role_metadata>> override;

private:
  [[nodiscard]] auto find_locked(std::string_view role_ref)
      -> Result<std::optional<security::role_metadata>>;

  std::shared_ptr<policy_database> db_;
};

} // namespace rbac::storage
