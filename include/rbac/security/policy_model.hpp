/**
 * @file policy_model.hpp
 * @brief In-memory rule model populated by (filtered) policy loads
 *
 * A policy_model holds the rules of each rule type in load order and
 * rejects duplicates, so a rule loaded through several overlapping filters
 * appears once. Models are cheap and built per call; they are never shared
 * between threads.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "policy_types.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rbac::security {

/**
 * @brief Rule storage for the "p" and "g" sections of the permission model
 */
class policy_model {
public:
  policy_model() = default;

  /**
   * @brief Add a rule
   * @return false if the identical rule is already present
   */
  bool add_policy(policy_section section, std::string_view ptype,
                  policy_tuple rule);

  /**
   * @brief Add several rules, skipping duplicates
   * @return Number of rules actually added
   */
  std::size_t add_policies(policy_section section, std::string_view ptype,
                           const std::vector<policy_tuple> &rules);

  /**
   * @brief Remove a rule
   * @return false if the rule was not present
   */
  bool remove_policy(policy_section section, std::string_view ptype,
                     const policy_tuple &rule);

  [[nodiscard]] bool has_policy(policy_section section, std::string_view ptype,
                                const policy_tuple &rule) const;

  /**
   * @brief All rules of a rule type in load order
   */
  [[nodiscard]] std::vector<policy_tuple>
  get_policy(policy_section section, std::string_view ptype) const;

  /**
   * @brief Rules of the filter's type that match it
   */
  [[nodiscard]] std::vector<policy_tuple>
  get_filtered_policy(policy_section section,
                      const policy_filter &filter) const;

  [[nodiscard]] std::size_t size(policy_section section,
                                 std::string_view ptype) const;

  [[nodiscard]] bool empty() const noexcept { return assertions_.empty(); }

  void clear();

private:
  struct assertion {
    std::vector<policy_tuple> rules;
    std::set<policy_tuple> index;
  };

  using assertion_key = std::pair<policy_section, std::string>;

  [[nodiscard]] const assertion *find(policy_section section,
                                      std::string_view ptype) const;

  std::map<assertion_key, assertion> assertions_;
};

} // namespace rbac::security
