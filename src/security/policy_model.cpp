/**
 * @file policy_model.cpp
 * @brief Implementation of the in-memory rule model
 *
 * @copyright Copyright (c) 2025
 */

#include <rbac/security/policy_model.hpp>

#include <algorithm>
#include <iterator>

namespace rbac::security {

bool policy_model::add_policy(policy_section section, std::string_view ptype,
                              policy_tuple rule) {
  auto &slot = assertions_[{section, std::string(ptype)}];
  if (!slot.index.insert(rule).second) {
    return false;
  }
  slot.rules.push_back(std::move(rule));
  return true;
}

std::size_t policy_model::add_policies(policy_section section,
                                       std::string_view ptype,
                                       const std::vector<policy_tuple> &rules) {
  std::size_t added = 0;
  for (const auto &rule : rules) {
    if (add_policy(section, ptype, rule)) {
      ++added;
    }
  }
  return added;
}

bool policy_model::remove_policy(policy_section section, std::string_view ptype,
                                 const policy_tuple &rule) {
  auto it = assertions_.find({section, std::string(ptype)});
  if (it == assertions_.end() || it->second.index.erase(rule) == 0) {
    return false;
  }
  auto &rules = it->second.rules;
  rules.erase(std::find(rules.begin(), rules.end(), rule));
  return true;
}

bool policy_model::has_policy(policy_section section, std::string_view ptype,
                              const policy_tuple &rule) const {
  const auto *slot = find(section, ptype);
  return slot && slot->index.contains(rule);
}

std::vector<policy_tuple> policy_model::get_policy(policy_section section,
                                                   std::string_view ptype) const {
  const auto *slot = find(section, ptype);
  if (!slot) {
    return {};
  }
  return slot->rules;
}

std::vector<policy_tuple>
policy_model::get_filtered_policy(policy_section section,
                                  const policy_filter &filter) const {
  std::vector<policy_tuple> result;
  const auto *slot = find(section, filter.ptype);
  if (!slot) {
    return result;
  }
  std::copy_if(slot->rules.begin(), slot->rules.end(),
               std::back_inserter(result),
               [&](const policy_tuple &rule) { return filter.matches(rule); });
  return result;
}

std::size_t policy_model::size(policy_section section,
                               std::string_view ptype) const {
  const auto *slot = find(section, ptype);
  return slot ? slot->rules.size() : 0;
}

void policy_model::clear() { assertions_.clear(); }

const policy_model::assertion *policy_model::find(policy_section section,
                                                  std::string_view ptype) const {
  auto it = assertions_.find({section, std::string(ptype)});
  return it == assertions_.end() ? nullptr : &it->second;
}

} // namespace rbac::security
