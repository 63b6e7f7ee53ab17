/**
 * @file policy_adapter.hpp
 * @brief Persistence interface for policy and grouping rules
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "policy_model.hpp"
#include "policy_types.hpp"

#include <rbac/core/result.hpp>

#include <string_view>
#include <vector>

namespace rbac::security {

/**
 * @brief Abstract interface for loading and persisting rules
 *
 * Filtered loads are evaluated by the backend so that point checks never
 * pull the full rule set into memory. Adds must be idempotent.
 */
class policy_adapter {
public:
  virtual ~policy_adapter() = default;

  /**
   * @brief Load every stored rule into model
   */
  [[nodiscard]] virtual auto load_policy(policy_model &model) -> VoidResult = 0;

  /**
   * @brief Load the rules matching any of filters into model
   *
   * Filters are validated before any I/O. An empty list loads nothing.
   */
  [[nodiscard]] virtual auto
  load_filtered_policy(policy_model &model,
                       const std::vector<policy_filter> &filters)
      -> VoidResult = 0;

  /**
   * @brief Persist a rule; storing an existing rule is a no-op
   */
  [[nodiscard]] virtual auto add_policy(policy_section section,
                                        std::string_view ptype,
                                        const policy_tuple &rule)
      -> VoidResult = 0;

  /**
   * @brief Delete a rule; deleting a missing rule is a no-op
   */
  [[nodiscard]] virtual auto remove_policy(policy_section section,
                                           std::string_view ptype,
                                           const policy_tuple &rule)
      -> VoidResult = 0;

  /**
   * @brief True if the last load was filtered
   */
  [[nodiscard]] virtual bool is_filtered() const noexcept = 0;

protected:
  policy_adapter() = default;
  policy_adapter(const policy_adapter &) = delete;
  policy_adapter &operator=(const policy_adapter &) = delete;
};

} // namespace rbac::security
