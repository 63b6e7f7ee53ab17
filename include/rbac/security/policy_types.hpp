/**
 * @file policy_types.hpp
 * @brief Policy tuples, grouping tuples and filter descriptors
 *
 * A policy tuple ("p") is an ordered rule [subject, resource_type, action,
 * effect?]. A grouping tuple ("g") is a pair [member, role]. Filter
 * descriptors select a subset of either kind by field position and are
 * evaluated server side by the policy adapter.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <rbac/core/result.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rbac::security {

/**
 * @brief Ordered rule fields; identity is full tuple equality
 */
using policy_tuple = std::vector<std::string>;

/**
 * @brief Maximum number of fields a stored rule may have (v0..v5)
 */
inline constexpr std::size_t max_policy_fields = 6;

/**
 * @brief Minimum number of fields of a permission rule
 */
inline constexpr std::size_t min_permission_fields = 3;

/**
 * @brief Rule sections of the permission model
 */
enum class policy_section {
  policy,  ///< "p" permission rules
  grouping ///< "g" membership / inheritance rules
};

/**
 * @brief Convert a section to its model key ("p" or "g")
 */
constexpr std::string_view to_string(policy_section section) {
  switch (section) {
  case policy_section::policy:
    return "p";
  case policy_section::grouping:
    return "g";
  }
  return "p";
}

/**
 * @brief Parse a section key
 */
inline std::optional<policy_section> parse_policy_section(std::string_view str) {
  if (str == "p")
    return policy_section::policy;
  if (str == "g")
    return policy_section::grouping;
  return std::nullopt;
}

/**
 * @brief Rule effects stored in field 3 of a permission rule
 */
namespace effect {
inline constexpr std::string_view allow = "allow";
inline constexpr std::string_view deny = "deny";
} // namespace effect

/**
 * @brief Partial tuple match used for filtered loads
 *
 * Maps field positions to required values; positions that are not present
 * are wildcards. Positions must be below max_policy_fields and form one
 * contiguous run.
 */
struct policy_filter {
  std::string ptype{"p"};
  std::map<std::size_t, std::string> fields;

  /**
   * @brief Filter matching every rule of a rule type
   */
  static policy_filter all(std::string_view ptype);

  /**
   * @brief Build a filter from consecutive values starting at field_index
   *
   * @param ptype Rule type ("p" or "g")
   * @param field_index Position of the first value
   * @param values Values for positions field_index, field_index + 1, ...
   * @return The filter, or invalid_filter / filter_field_out_of_range
   */
  [[nodiscard]] static auto from_values(std::string_view ptype,
                                        std::size_t field_index,
                                        const std::vector<std::string> &values)
      -> Result<policy_filter>;

  /**
   * @brief Check field range and contiguity
   */
  [[nodiscard]] auto validate() const -> VoidResult;

  /**
   * @brief Test a rule of the same type against this filter
   */
  [[nodiscard]] bool matches(const policy_tuple &rule) const;

  bool operator==(const policy_filter &other) const = default;
};

/**
 * @brief Validate a whole list of filters before any I/O is issued
 */
[[nodiscard]] auto validate_filters(const std::vector<policy_filter> &filters)
    -> VoidResult;

/**
 * @brief Validate a permission rule (3..6 non-empty fields)
 */
[[nodiscard]] auto validate_policy_tuple(const policy_tuple &rule)
    -> VoidResult;

/**
 * @brief Validate a grouping rule (exactly 2 non-empty fields)
 */
[[nodiscard]] auto validate_grouping_tuple(const policy_tuple &rule)
    -> VoidResult;

/**
 * @brief Render a rule as "a, b, c" for log and error messages
 */
[[nodiscard]] std::string to_string(const policy_tuple &rule);

} // namespace rbac::security
