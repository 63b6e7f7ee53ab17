/**
 * @file evaluation_context.cpp
 * @brief Implementation of the per-call evaluation context
 *
 * @copyright Copyright (c) 2025
 */

#include <rbac/security/evaluation_context.hpp>

#include <deque>

namespace rbac::security {

evaluation_context::evaluation_context(policy_model model, role_graph &graph)
    : model_(std::move(model)), graph_(graph) {}

void evaluation_context::build_role_links() {
  graph_.rebuild();

  local_links_.clear();
  for (const auto &rule : model_.get_policy(policy_section::grouping, "g")) {
    if (rule.size() >= 2) {
      local_links_[rule[0]].insert(rule[1]);
    }
  }
  links_built_ = true;
}

auto evaluation_context::enforce(std::string_view sub, std::string_view obj,
                                 std::string_view act) -> Result<bool> {
  if (auto_build_ && !links_built_) {
    build_role_links();
  }

  auto closure = subject_closure(sub);
  if (closure.is_err()) {
    return Result<bool>(closure.error());
  }
  const auto &subjects = closure.value();

  bool allowed = false;
  for (const auto &rule : model_.get_policy(policy_section::policy, "p")) {
    if (rule.size() < 3 || rule[1] != obj || rule[2] != act) {
      continue;
    }
    if (subjects.find(rule[0]) == subjects.end()) {
      continue;
    }

    std::string_view eft = rule.size() > 3 ? std::string_view(rule[3])
                                           : effect::allow;
    if (eft == effect::deny) {
      return false;
    }
    if (eft == effect::allow) {
      allowed = true;
    }
  }
  return allowed;
}

auto evaluation_context::subject_closure(std::string_view sub) const
    -> Result<std::set<std::string, std::less<>>> {
  std::set<std::string, std::less<>> visited{std::string(sub)};
  std::deque<std::string> pending{std::string(sub)};

  while (!pending.empty()) {
    auto current = std::move(pending.front());
    pending.pop_front();

    std::set<std::string> next;
    if (auto it = local_links_.find(current); it != local_links_.end()) {
      next.insert(it->second.begin(), it->second.end());
    }

    auto roles = graph_.get_roles(current);
    if (roles.is_err()) {
      return Result<std::set<std::string, std::less<>>>(roles.error());
    }
    next.insert(roles.value().begin(), roles.value().end());

    for (auto &role : next) {
      if (visited.insert(role).second) {
        pending.push_back(role);
      }
    }
  }
  return visited;
}

} // namespace rbac::security
