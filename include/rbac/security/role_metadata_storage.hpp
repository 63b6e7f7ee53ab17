/**
 * @file role_metadata_storage.hpp
 * @brief Transactional storage interface for role metadata records
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "role_metadata.hpp"
#include "transaction.hpp"

#include <rbac/core/result.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace rbac::security {

/**
 * @brief Abstract interface for persisting role metadata
 *
 * Every mutating call runs inside the supplied transaction and fails with
 * transaction_not_active if it has already finished.
 */
class role_metadata_storage {
public:
  template <typename T> using Result = rbac::Result<T>;
  using VoidResult = rbac::VoidResult;

  virtual ~role_metadata_storage() = default;

  [[nodiscard]] virtual auto find_role_metadata(std::string_view role_ref,
                                                policy_transaction &tx)
      -> Result<std::optional<role_metadata>> = 0;

  /**
   * @brief Insert a record; fails with role_metadata_exists on conflict
   */
  [[nodiscard]] virtual auto create_role_metadata(const role_metadata &record,
                                                  policy_transaction &tx)
      -> VoidResult = 0;

  /**
   * @brief Replace the record stored under role_ref
   *
   * role_ref may differ from record.role_entity_ref, which renames the
   * role. Fails with role_metadata_not_found if nothing is stored.
   */
  [[nodiscard]] virtual auto update_role_metadata(const role_metadata &record,
                                                  std::string_view role_ref,
                                                  policy_transaction &tx)
      -> VoidResult = 0;

  [[nodiscard]] virtual auto remove_role_metadata(std::string_view role_ref,
                                                  policy_transaction &tx)
      -> VoidResult = 0;

  /**
   * @brief All stored records ordered by role reference
   */
  [[nodiscard]] virtual auto list_role_metadata()
      -> Result<std::vector<role_metadata>> = 0;

protected:
  role_metadata_storage() = default;
  role_metadata_storage(const role_metadata_storage &) = delete;
  role_metadata_storage &operator=(const role_metadata_storage &) = delete;
};

} // namespace rbac::security
