/**
 * @file policy_types.cpp
 * @brief Validation and matching for policy tuples and filter descriptors
 *
 * @copyright Copyright (c) 2025
 */

#include <rbac/security/policy_types.hpp>

#include <rbac/compat/format.hpp>

namespace rbac::security {

namespace {
constexpr const char *kModule = "policy_types";
} // namespace

policy_filter policy_filter::all(std::string_view ptype) {
  policy_filter filter;
  filter.ptype = std::string(ptype);
  return filter;
}

auto policy_filter::from_values(std::string_view ptype,
                                std::size_t field_index,
                                const std::vector<std::string> &values)
    -> Result<policy_filter> {
  if (field_index >= max_policy_fields ||
      values.size() > max_policy_fields - field_index) {
    return rbac_error<policy_filter>(
        error_codes::filter_field_out_of_range,
        compat::format("Filter fields {}..{} exceed the {} stored fields",
                       field_index, field_index + values.size(),
                       max_policy_fields),
        kModule);
  }

  auto filter = all(ptype);
  for (std::size_t i = 0; i < values.size(); ++i) {
    filter.fields.emplace(field_index + i, values[i]);
  }
  return filter;
}

auto policy_filter::validate() const -> VoidResult {
  if (!parse_policy_section(ptype)) {
    return rbac_void_error(error_codes::invalid_filter,
                           compat::format("Unknown rule type '{}'", ptype),
                           kModule);
  }
  if (fields.empty()) {
    return ok();
  }

  // std::map keeps positions ordered
  auto first = fields.begin()->first;
  auto last = fields.rbegin()->first;
  if (last >= max_policy_fields) {
    return rbac_void_error(
        error_codes::filter_field_out_of_range,
        compat::format("Filter field v{} is out of range (max v{})", last,
                       max_policy_fields - 1),
        kModule);
  }
  if (last - first + 1 != fields.size()) {
    return rbac_void_error(
        error_codes::filter_not_contiguous,
        compat::format("Filter fields v{}..v{} are not contiguous", first,
                       last),
        kModule);
  }
  return ok();
}

bool policy_filter::matches(const policy_tuple &rule) const {
  for (const auto &[index, value] : fields) {
    if (index >= rule.size() || rule[index] != value) {
      return false;
    }
  }
  return true;
}

auto validate_filters(const std::vector<policy_filter> &filters)
    -> VoidResult {
  for (const auto &filter : filters) {
    auto result = filter.validate();
    if (result.is_err()) {
      return result;
    }
  }
  return ok();
}

auto validate_policy_tuple(const policy_tuple &rule) -> VoidResult {
  if (rule.size() < min_permission_fields || rule.size() > max_policy_fields) {
    return rbac_void_error(
        error_codes::invalid_policy_tuple,
        compat::format("Permission rule must have {} to {} fields, got {}",
                       min_permission_fields, max_policy_fields, rule.size()),
        kModule);
  }
  for (const auto &field : rule) {
    if (field.empty()) {
      return rbac_void_error(
          error_codes::invalid_policy_tuple,
          compat::format("Permission rule [{}] has an empty field",
                         to_string(rule)),
          kModule);
    }
  }
  return ok();
}

auto validate_grouping_tuple(const policy_tuple &rule) -> VoidResult {
  if (rule.size() != 2 || rule[0].empty() || rule[1].empty()) {
    return rbac_void_error(
        error_codes::invalid_grouping_tuple,
        compat::format("Grouping rule [{}] must be a non-empty member/role pair",
                       to_string(rule)),
        kModule);
  }
  return ok();
}

std::string to_string(const policy_tuple &rule) {
  std::string out;
  for (const auto &field : rule) {
    if (!out.empty()) {
      out += ", ";
    }
    out += field;
  }
  return out;
}

} // namespace rbac::security
