/**
 * @file in_memory_role_graph.cpp
 * @brief Implementation of the default role graph
 *
 * @copyright Copyright (c) 2025
 */

#include <rbac/security/in_memory_role_graph.hpp>

#include <rbac/compat/format.hpp>

#include <algorithm>
#include <deque>

namespace rbac::security {

namespace {
constexpr const char *kModule = "role_graph";

auto validate_link(std::string_view member, std::string_view role)
    -> VoidResult {
  if (member.empty() || role.empty()) {
    return rbac_void_error(
        error_codes::role_graph_error,
        compat::format("Invalid link '{}' -> '{}'", member, role), kModule);
  }
  return ok();
}
} // namespace

in_memory_role_graph::in_memory_role_graph(std::size_t max_depth,
                                           std::size_t cache_limit)
    : max_depth_(max_depth), cache_limit_(cache_limit) {}

auto in_memory_role_graph::add_link(std::string_view member,
                                    std::string_view role) -> VoidResult {
  auto valid = validate_link(member, role);
  if (valid.is_err()) {
    return valid;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  parents_[std::string(member)].insert(std::string(role));
  members_[std::string(role)].insert(std::string(member));
  invalidate_locked();
  return ok();
}

auto in_memory_role_graph::delete_link(std::string_view member,
                                       std::string_view role) -> VoidResult {
  auto valid = validate_link(member, role);
  if (valid.is_err()) {
    return valid;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = parents_.find(member); it != parents_.end()) {
    it->second.erase(std::string(role));
    if (it->second.empty()) {
      parents_.erase(it);
    }
  }
  if (auto it = members_.find(role); it != members_.end()) {
    it->second.erase(std::string(member));
    if (it->second.empty()) {
      members_.erase(it);
    }
  }
  invalidate_locked();
  return ok();
}

bool in_memory_role_graph::has_edge(std::string_view member,
                                    std::string_view role) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = parents_.find(member);
  return it != parents_.end() && it->second.contains(std::string(role));
}

auto in_memory_role_graph::has_link(std::string_view member,
                                    std::string_view role) const
    -> Result<bool> {
  if (member == role) {
    return true;
  }

  auto roles = resolve(std::string(member));
  if (roles.is_err()) {
    return Result<bool>(roles.error());
  }
  const auto &resolved = roles.value();
  return std::find(resolved.begin(), resolved.end(), role) != resolved.end();
}

auto in_memory_role_graph::get_roles(std::string_view principal) const
    -> Result<std::vector<std::string>> {
  return resolve(std::string(principal));
}

auto in_memory_role_graph::get_users(std::string_view role) const
    -> Result<std::vector<std::string>> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = members_.find(role);
  if (it == members_.end()) {
    return std::vector<std::string>{};
  }
  return std::vector<std::string>(it->second.begin(), it->second.end());
}

void in_memory_role_graph::rebuild() {
  std::lock_guard<std::mutex> lock(mutex_);
  invalidate_locked();
}

void in_memory_role_graph::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  parents_.clear();
  members_.clear();
  invalidate_locked();
}

void in_memory_role_graph::set_membership_resolver(
    membership_resolver resolver) {
  std::lock_guard<std::mutex> lock(mutex_);
  resolver_ = std::move(resolver);
  invalidate_locked();
}

std::size_t in_memory_role_graph::edge_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &[member, roles] : parents_) {
    count += roles.size();
  }
  return count;
}

std::size_t in_memory_role_graph::cached_principals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

void in_memory_role_graph::invalidate_locked() {
  cache_.clear();
  ++generation_;
}

auto in_memory_role_graph::direct_parents(const std::string &node) const
    -> std::vector<std::string> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = parents_.find(node);
  if (it == parents_.end()) {
    return {};
  }
  return std::vector<std::string>(it->second.begin(), it->second.end());
}

auto in_memory_role_graph::resolve(const std::string &principal) const
    -> Result<std::vector<std::string>> {
  membership_resolver resolver;
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto cached = cache_.find(principal); cached != cache_.end()) {
      return cached->second;
    }
    resolver = resolver_;
    generation = generation_;
  }

  // Walk without the lock so the resolver may query the graph.
  // Breadth-first so nearer roles come first.
  std::vector<std::string> resolved;
  std::set<std::string> visited{principal};
  std::deque<std::pair<std::string, std::size_t>> queue{{principal, 0}};

  while (!queue.empty()) {
    auto [node, depth] = queue.front();
    queue.pop_front();
    if (depth >= max_depth_) {
      continue;
    }

    auto next = direct_parents(node);
    if (resolver) {
      auto derived = resolver(node);
      if (derived.is_err()) {
        return derived;
      }
      const auto &extra = derived.value();
      next.insert(next.end(), extra.begin(), extra.end());
    }

    for (auto &parent : next) {
      if (visited.insert(parent).second) {
        resolved.push_back(parent);
        queue.emplace_back(std::move(parent), depth + 1);
      }
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // A concurrent edge change may have raced the walk; do not cache it
  if (generation == generation_ && cache_limit_ > 0) {
    if (cache_.size() >= cache_limit_) {
      cache_.clear();
    }
    cache_.insert_or_assign(principal, resolved);
  }
  return resolved;
}

} // namespace rbac::security
